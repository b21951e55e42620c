#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace llmb::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    Double,
    String,
    StringList,
    IntegerList
};

enum class OptionValueType
{
    None,
    Boolean,
    Integer,
    Double,
    String,
    StringList,
    IntegerList
};

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(int value);
    OptionValue(std::int64_t value);
    OptionValue(double value);
    OptionValue(const char *value);
    OptionValue(std::string value);
    OptionValue(std::vector<std::string> value);
    OptionValue(std::vector<std::int64_t> value);

    OptionValueType type() const noexcept;

    bool isNull() const noexcept;
    bool toBool(bool fallback = false) const noexcept;
    std::int64_t toInteger(std::int64_t fallback = 0) const noexcept;
    double toDouble(double fallback = 0.0) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;
    std::vector<std::string> toStringList() const;
    std::vector<std::int64_t> toIntegerList() const;

    // Human readable rendering used in diagnostics ("true", "42", "[1, 2]", "None").
    std::string describe() const;

    bool operator==(const OptionValue &other) const noexcept;
    bool operator!=(const OptionValue &other) const noexcept { return !(*this == other); }

private:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, std::vector<std::string>,
                                 std::vector<std::int64_t>>;
    static OptionValueType storageType(const Storage &storage) noexcept;
    Storage value;
};

using OptionMap = std::map<std::string, OptionValue>;

const char *kindName(OptionKind kind) noexcept;
const char *valueTypeName(OptionValueType type) noexcept;

// True when a value of the given type may be stored in an option of the given kind.
// Integers are accepted for Double options; None is accepted only for nullable options.
bool isCompatible(OptionKind kind, OptionValueType type, bool nullable) noexcept;

nlohmann::json toJson(const OptionValue &value);
OptionValue fromJson(const nlohmann::json &jsonValue);
OptionValue fromJson(OptionKind kind, const nlohmann::json &jsonValue);

nlohmann::json toJson(const OptionMap &options);

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string description;
    bool nullable = false;
};

// Layer an entry was written by. Later layers never silently replace earlier ones;
// the arbitrator decides what may be written.
enum class OptionLayer
{
    Baseline,
    Functional,
    Performance
};

const char *layerName(OptionLayer layer) noexcept;

struct OptionEntry
{
    OptionValue value;
    std::string source;
    OptionLayer layer = OptionLayer::Baseline;

    bool operator==(const OptionEntry &other) const noexcept
    {
        return value == other.value && source == other.source && layer == other.layer;
    }
};

using OptionGroup = std::map<std::string, OptionEntry>;

// Key-value registry partitioned by config group ("plugin_config", "kv_cache_config", ...).
// Every entry remembers who set it, which is what conflict messages report.
class OptionStore
{
public:
    OptionStore() = default;

    bool contains(const std::string &group, const std::string &key) const noexcept;
    const OptionEntry *find(const std::string &group, const std::string &key) const noexcept;
    std::optional<OptionValue> value(const std::string &group, const std::string &key) const;
    std::string source(const std::string &group, const std::string &key) const;

    void set(const std::string &group, const std::string &key, const OptionValue &value, const std::string &source,
             OptionLayer layer);
    bool erase(const std::string &group, const std::string &key);
    void clear() noexcept;

    bool empty() const noexcept;
    std::vector<std::string> groupNames() const;
    const OptionGroup *group(const std::string &name) const noexcept;
    OptionMap values(const std::string &group) const;
    const std::map<std::string, OptionGroup> &groups() const noexcept { return entries; }

    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;

    bool operator==(const OptionStore &other) const noexcept { return entries == other.entries; }
    bool operator!=(const OptionStore &other) const noexcept { return !(*this == other); }

private:
    std::map<std::string, OptionGroup> entries;
};

} // namespace llmb::config
