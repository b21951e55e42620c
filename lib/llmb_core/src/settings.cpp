#include "llmb/core/settings.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string_view>

namespace llmb::core
{
namespace
{
std::string trim(std::string_view view)
{
    std::size_t start = 0;
    std::size_t end = view.size();
    while (start < end && std::isspace(static_cast<unsigned char>(view[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(view[end - 1])))
        --end;
    return std::string(view.substr(start, end - start));
}

void parse_assignment(std::string_view line, std::string &key, std::string &value)
{
    auto equal = line.find('=');
    if (equal == std::string_view::npos)
        return;
    key = trim(line.substr(0, equal));
    value = trim(line.substr(equal + 1));
}

bool is_section_header(std::string_view line, std::string &section)
{
    if (line.size() < 3 || line.front() != '[' || line.back() != ']')
        return false;
    section = trim(line.substr(1, line.size() - 2));
    return true;
}

std::string parse_string(std::string value)
{
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        return value.substr(1, value.size() - 2);
    return value;
}

std::optional<long long> parse_integer(const std::string &value)
{
    long long result = 0;
    auto begin = value.data();
    auto end = value.data() + value.size();
    auto rc = std::from_chars(begin, end, result);
    if (rc.ec == std::errc() && rc.ptr == end)
        return result;
    return std::nullopt;
}

std::optional<double> parse_number(const std::string &value)
{
    if (value.empty())
        return std::nullopt;
    char *end = nullptr;
    double result = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size())
        return std::nullopt;
    return result;
}

std::optional<bool> parse_bool(const std::string &value)
{
    if (value == "true" || value == "1")
        return true;
    if (value == "false" || value == "0")
        return false;
    return std::nullopt;
}

// Comments start at a '#' outside of a quoted string.
std::string strip_comment(const std::string &line)
{
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (line[i] == '"')
            quoted = !quoted;
        else if (line[i] == '#' && !quoted)
            return line.substr(0, i);
    }
    return line;
}
} // namespace

BuildCacheConfig Settings::cacheConfig() const
{
    BuildCacheConfig config;
    config.root = cache.root;
    config.maxRecords = cache.max_records;
    config.maxStorageGb = cache.max_storage_gb;
    return config;
}

void Settings::applyTo(BuildConfig &config) const
{
    if (build.max_num_tokens)
        config.max_num_tokens = *build.max_num_tokens;
    if (build.max_batch_size)
        config.max_batch_size = *build.max_batch_size;
    if (build.max_beam_width)
        config.max_beam_width = *build.max_beam_width;
}

std::filesystem::path SettingsLoader::default_config_path()
{
    std::filesystem::path config_home;
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        config_home = xdg;
    else if (const char *home = std::getenv("HOME"); home && *home)
        config_home = std::filesystem::path(home) / ".config";
    else
        config_home = std::filesystem::current_path();

    return config_home / "llmbuild" / "llmbuild.toml";
}

Settings SettingsLoader::load_from_file(const std::filesystem::path &path)
{
    Settings settings;

    std::ifstream stream(path);
    if (!stream)
        return settings;

    std::string line;
    std::string section;
    while (std::getline(stream, line))
    {
        line = trim(strip_comment(line));
        if (line.empty())
            continue;

        std::string maybe_section;
        if (is_section_header(line, maybe_section))
        {
            section = maybe_section;
            continue;
        }

        std::string key;
        std::string value;
        parse_assignment(line, key, value);
        if (key.empty())
            continue;

        if (section == "cache")
        {
            if (key == "enabled")
            {
                if (auto parsed = parse_bool(value))
                    settings.cache.enabled = *parsed;
            }
            else if (key == "root")
            {
                auto root = parse_string(value);
                if (!root.empty())
                    settings.cache.root = root;
            }
            else if (key == "max_records")
            {
                if (auto parsed = parse_integer(value); parsed && *parsed >= 0)
                    settings.cache.max_records = static_cast<std::size_t>(*parsed);
            }
            else if (key == "max_storage_gb")
            {
                if (auto parsed = parse_number(value); parsed && *parsed >= 0.0)
                    settings.cache.max_storage_gb = *parsed;
            }
        }
        else if (section == "build")
        {
            if (key == "max_num_tokens")
            {
                if (auto parsed = parse_integer(value))
                    settings.build.max_num_tokens = *parsed;
            }
            else if (key == "max_batch_size")
            {
                if (auto parsed = parse_integer(value))
                    settings.build.max_batch_size = *parsed;
            }
            else if (key == "max_beam_width")
            {
                if (auto parsed = parse_integer(value))
                    settings.build.max_beam_width = *parsed;
            }
        }
        else if (section == "log")
        {
            if (key == "level")
                settings.log_level = log::parseLevel(parse_string(value));
        }
    }

    return settings;
}

Settings SettingsLoader::load_or_default()
{
    auto settings = load_from_file(default_config_path());
    apply_environment(settings);
    return settings;
}

void SettingsLoader::apply_environment(Settings &settings)
{
    auto env = buildCacheConfigFromEnv(settings.cacheConfig());
    if (env.enabled)
        settings.cache.enabled = true;
    settings.cache.root = env.config.root;

    if (const char *level = std::getenv("LLMB_LOG_LEVEL"); level && *level)
    {
        if (auto parsed = log::parseLevel(level))
            settings.log_level = parsed;
    }
}

bool SettingsLoader::save(const Settings &settings, const std::filesystem::path &path)
{
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream out(path);
    if (!out.is_open())
        return false;

    out << "[cache]\n";
    out << "enabled = " << (settings.cache.enabled ? "true" : "false") << "\n";
    out << "root = \"" << settings.cache.root.string() << "\"\n";
    out << "max_records = " << settings.cache.max_records << "\n";
    out << "max_storage_gb = " << settings.cache.max_storage_gb << "\n";

    if (settings.build.max_num_tokens || settings.build.max_batch_size ||
        settings.build.max_beam_width)
    {
        out << "\n[build]\n";
        if (settings.build.max_num_tokens)
            out << "max_num_tokens = " << *settings.build.max_num_tokens << "\n";
        if (settings.build.max_batch_size)
            out << "max_batch_size = " << *settings.build.max_batch_size << "\n";
        if (settings.build.max_beam_width)
            out << "max_beam_width = " << *settings.build.max_beam_width << "\n";
    }

    if (settings.log_level)
    {
        out << "\n[log]\n";
        out << "level = \"" << log::levelName(*settings.log_level) << "\"\n";
    }
    return static_cast<bool>(out);
}

bool SettingsLoader::save(const Settings &settings)
{
    return save(settings, default_config_path());
}

} // namespace llmb::core
