#pragma once

#include "llmb/core/configs.hpp"
#include "llmb/core/model_info.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace llmb::core {

// Bumped whenever the slot layout or the key document changes shape.
inline constexpr const char *kCacheFormatVersion = "llmb-engine-cache/1";

std::string sha256Hex(const std::string &data);

// Lowercase hex SHA-256 naming one cache slot.
class Fingerprint {
public:
  // Throws InvalidArgumentError unless given 64 lowercase hex digits.
  explicit Fingerprint(std::string hex);

  static bool isValid(const std::string &hex) noexcept;

  const std::string &str() const noexcept { return hex_; }

  bool operator==(const Fingerprint &other) const noexcept {
    return hex_ == other.hex_;
  }
  bool operator!=(const Fingerprint &other) const noexcept {
    return hex_ != other.hex_;
  }
  bool operator<(const Fingerprint &other) const noexcept {
    return hex_ < other.hex_;
  }

private:
  std::string hex_;
};

// Relative path, size and modification time of every regular file below dir,
// sorted by path.
nlohmann::json directoryListing(const std::filesystem::path &dir);

// Collects every input that changes the built engine into one JSON document
// with sorted keys and hashes it.
class CacheKeyBuilder {
public:
  CacheKeyBuilder();

  // The plugin section is left out; it goes in through pluginConfig().
  CacheKeyBuilder &buildConfig(const BuildConfig &config);
  CacheKeyBuilder &pluginConfig(const PluginConfig &config);
  CacheKeyBuilder &parallelConfig(const ParallelConfig &config);
  CacheKeyBuilder &quantConfig(const QuantConfig &config);
  CacheKeyBuilder &pretrained(const PretrainedDescriptor &descriptor);
  CacheKeyBuilder &hubModel(const std::string &modelId,
                            const std::string &revision);
  // Keyed by the canonical location of modelDir plus its file listing, so a
  // model rewritten in place or a different model of the same shape misses.
  CacheKeyBuilder &localModel(const std::filesystem::path &modelDir);
  CacheKeyBuilder &formatVersion(const std::string &version);

  const nlohmann::json &document() const noexcept { return document_; }
  Fingerprint fingerprint() const;

private:
  nlohmann::json document_;
};

} // namespace llmb::core
