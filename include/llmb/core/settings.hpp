#pragma once

#include "llmb/core/build_cache.hpp"
#include "llmb/core/configs.hpp"
#include "llmb/log.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace llmb::core
{
struct Settings
{
    struct Cache
    {
        bool enabled = false;
        std::filesystem::path root = BuildCacheConfig::defaultRoot();
        std::size_t max_records = 10;
        double max_storage_gb = 256.0;
    } cache;

    struct Build
    {
        std::optional<std::int64_t> max_num_tokens;
        std::optional<std::int64_t> max_batch_size;
        std::optional<std::int64_t> max_beam_width;
    } build;

    std::optional<log::Level> log_level;

    BuildCacheConfig cacheConfig() const;
    // Copies the [build] values that are set onto config.
    void applyTo(BuildConfig &config) const;
};

class SettingsLoader
{
public:
    static std::filesystem::path default_config_path();
    static Settings load_from_file(const std::filesystem::path &path);
    static Settings load_or_default();
    static bool save(const Settings &settings, const std::filesystem::path &path);
    static bool save(const Settings &settings);
    // LLMB_BUILD_CACHE, LLMB_BUILD_CACHE_ROOT and LLMB_LOG_LEVEL win over the file.
    static void apply_environment(Settings &settings);
};
} // namespace llmb::core
