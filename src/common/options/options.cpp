#include "llmb/options.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace llmb::config
{
namespace
{
bool parseBool(const std::string &value, bool fallback)
{
    std::string lower;
    lower.reserve(value.size());
    for (char ch : value)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return fallback;
}

std::optional<std::int64_t> parseInteger(const std::string &value)
{
    try
    {
        size_t idx = 0;
        std::int64_t parsed = std::stoll(value, &idx, 0);
        if (idx == value.size())
            return parsed;
    }
    catch (const std::logic_error &)
    {
    }
    return std::nullopt;
}

std::optional<double> parseDouble(const std::string &value)
{
    try
    {
        size_t idx = 0;
        double parsed = std::stod(value, &idx);
        if (idx == value.size())
            return parsed;
    }
    catch (const std::logic_error &)
    {
    }
    return std::nullopt;
}

std::string formatDouble(double value)
{
    std::ostringstream out;
    out << std::setprecision(17) << value;
    return out.str();
}

} // namespace

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(int value)
    : value(static_cast<std::int64_t>(value))
{
}

OptionValue::OptionValue(std::int64_t value)
    : value(value)
{
}

OptionValue::OptionValue(double value)
    : value(value)
{
}

OptionValue::OptionValue(const char *value)
    : value(std::string(value ? value : ""))
{
}

OptionValue::OptionValue(std::string value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(std::vector<std::string> value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(std::vector<std::int64_t> value)
    : value(std::move(value))
{
}

OptionValueType OptionValue::type() const noexcept
{
    return storageType(value);
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *ptr = std::get_if<bool>(&value))
        return *ptr;
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr != 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseBool(*sptr, fallback);
    return fallback;
}

std::int64_t OptionValue::toInteger(std::int64_t fallback) const noexcept
{
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? 1 : 0;
    if (auto *dptr = std::get_if<double>(&value))
        return static_cast<std::int64_t>(*dptr);
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseInteger(*sptr).value_or(fallback);
    return fallback;
}

double OptionValue::toDouble(double fallback) const noexcept
{
    if (auto *dptr = std::get_if<double>(&value))
        return *dptr;
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return static_cast<double>(*iptr);
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseDouble(*sptr).value_or(fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (auto *sptr = std::get_if<std::string>(&value))
        return *sptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? "true" : "false";
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return std::to_string(*iptr);
    if (auto *dptr = std::get_if<double>(&value))
        return formatDouble(*dptr);
    return fallback;
}

std::vector<std::string> OptionValue::toStringList() const
{
    if (auto *lptr = std::get_if<std::vector<std::string>>(&value))
        return *lptr;
    if (auto *sptr = std::get_if<std::string>(&value))
        return {*sptr};
    return {};
}

std::vector<std::int64_t> OptionValue::toIntegerList() const
{
    if (auto *lptr = std::get_if<std::vector<std::int64_t>>(&value))
        return *lptr;
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return {*iptr};
    return {};
}

std::string OptionValue::describe() const
{
    switch (type())
    {
    case OptionValueType::None:
        return "None";
    case OptionValueType::StringList:
    {
        std::ostringstream out;
        out << "[";
        const auto &list = std::get<std::vector<std::string>>(value);
        for (std::size_t i = 0; i < list.size(); ++i)
            out << (i > 0 ? ", " : "") << list[i];
        out << "]";
        return out.str();
    }
    case OptionValueType::IntegerList:
    {
        std::ostringstream out;
        out << "[";
        const auto &list = std::get<std::vector<std::int64_t>>(value);
        for (std::size_t i = 0; i < list.size(); ++i)
            out << (i > 0 ? ", " : "") << list[i];
        out << "]";
        return out.str();
    }
    default:
        return toString();
    }
}

bool OptionValue::operator==(const OptionValue &other) const noexcept
{
    return value == other.value;
}

OptionValueType OptionValue::storageType(const OptionValue::Storage &storage) noexcept
{
    switch (storage.index())
    {
    case 1:
        return OptionValueType::Boolean;
    case 2:
        return OptionValueType::Integer;
    case 3:
        return OptionValueType::Double;
    case 4:
        return OptionValueType::String;
    case 5:
        return OptionValueType::StringList;
    case 6:
        return OptionValueType::IntegerList;
    default:
        return OptionValueType::None;
    }
}

const char *kindName(OptionKind kind) noexcept
{
    switch (kind)
    {
    case OptionKind::Boolean:
        return "boolean";
    case OptionKind::Integer:
        return "integer";
    case OptionKind::Double:
        return "double";
    case OptionKind::String:
        return "string";
    case OptionKind::StringList:
        return "string list";
    case OptionKind::IntegerList:
        return "integer list";
    }
    return "unknown";
}

const char *valueTypeName(OptionValueType type) noexcept
{
    switch (type)
    {
    case OptionValueType::None:
        return "none";
    case OptionValueType::Boolean:
        return "boolean";
    case OptionValueType::Integer:
        return "integer";
    case OptionValueType::Double:
        return "double";
    case OptionValueType::String:
        return "string";
    case OptionValueType::StringList:
        return "string list";
    case OptionValueType::IntegerList:
        return "integer list";
    }
    return "unknown";
}

bool isCompatible(OptionKind kind, OptionValueType type, bool nullable) noexcept
{
    switch (type)
    {
    case OptionValueType::None:
        return nullable;
    case OptionValueType::Boolean:
        return kind == OptionKind::Boolean;
    case OptionValueType::Integer:
        return kind == OptionKind::Integer || kind == OptionKind::Double;
    case OptionValueType::Double:
        return kind == OptionKind::Double;
    case OptionValueType::String:
        return kind == OptionKind::String;
    case OptionValueType::StringList:
        return kind == OptionKind::StringList;
    case OptionValueType::IntegerList:
        return kind == OptionKind::IntegerList;
    }
    return false;
}

nlohmann::json toJson(const OptionValue &value)
{
    switch (value.type())
    {
    case OptionValueType::Boolean:
        return value.toBool();
    case OptionValueType::Integer:
        return value.toInteger();
    case OptionValueType::Double:
        return value.toDouble();
    case OptionValueType::String:
        return value.toString();
    case OptionValueType::StringList:
        return value.toStringList();
    case OptionValueType::IntegerList:
        return value.toIntegerList();
    case OptionValueType::None:
    default:
        return nlohmann::json();
    }
}

OptionValue fromJson(const nlohmann::json &jsonValue)
{
    if (jsonValue.is_boolean())
        return OptionValue(jsonValue.get<bool>());
    if (jsonValue.is_number_integer())
        return OptionValue(jsonValue.get<std::int64_t>());
    if (jsonValue.is_number_float())
        return OptionValue(jsonValue.get<double>());
    if (jsonValue.is_string())
        return OptionValue(jsonValue.get<std::string>());
    if (jsonValue.is_array())
    {
        if (!jsonValue.empty() && jsonValue.front().is_number_integer())
        {
            std::vector<std::int64_t> result;
            for (const auto &item : jsonValue)
            {
                if (item.is_number_integer())
                    result.push_back(item.get<std::int64_t>());
            }
            return OptionValue(result);
        }
        std::vector<std::string> result;
        for (const auto &item : jsonValue)
        {
            if (item.is_string())
                result.push_back(item.get<std::string>());
        }
        return OptionValue(result);
    }
    return OptionValue();
}

OptionValue fromJson(OptionKind kind, const nlohmann::json &jsonValue)
{
    if (jsonValue.is_null())
        return OptionValue();

    switch (kind)
    {
    case OptionKind::Boolean:
        if (jsonValue.is_boolean())
            return OptionValue(jsonValue.get<bool>());
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>() != 0);
        if (jsonValue.is_string())
            return OptionValue(parseBool(jsonValue.get<std::string>(), false));
        break;
    case OptionKind::Integer:
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>());
        if (jsonValue.is_boolean())
            return OptionValue(jsonValue.get<bool>() ? std::int64_t{1} : std::int64_t{0});
        if (jsonValue.is_string())
        {
            if (auto parsed = parseInteger(jsonValue.get<std::string>()))
                return OptionValue(*parsed);
        }
        break;
    case OptionKind::Double:
        if (jsonValue.is_number())
            return OptionValue(jsonValue.get<double>());
        if (jsonValue.is_string())
        {
            if (auto parsed = parseDouble(jsonValue.get<std::string>()))
                return OptionValue(*parsed);
        }
        break;
    case OptionKind::String:
        if (jsonValue.is_string())
            return OptionValue(jsonValue.get<std::string>());
        if (jsonValue.is_boolean())
            return OptionValue(jsonValue.get<bool>() ? std::string("true") : std::string("false"));
        if (jsonValue.is_number_integer())
            return OptionValue(std::to_string(jsonValue.get<std::int64_t>()));
        break;
    case OptionKind::StringList:
        if (jsonValue.is_array())
        {
            std::vector<std::string> result;
            for (const auto &item : jsonValue)
            {
                if (item.is_string())
                    result.push_back(item.get<std::string>());
            }
            return OptionValue(result);
        }
        if (jsonValue.is_string())
            return OptionValue(std::vector<std::string>{jsonValue.get<std::string>()});
        break;
    case OptionKind::IntegerList:
        if (jsonValue.is_array())
        {
            std::vector<std::int64_t> result;
            for (const auto &item : jsonValue)
            {
                if (item.is_number_integer())
                    result.push_back(item.get<std::int64_t>());
            }
            return OptionValue(result);
        }
        if (jsonValue.is_number_integer())
            return OptionValue(std::vector<std::int64_t>{jsonValue.get<std::int64_t>()});
        break;
    }
    return OptionValue();
}

nlohmann::json toJson(const OptionMap &options)
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, value] : options)
        data[key] = toJson(value);
    return data;
}

const char *layerName(OptionLayer layer) noexcept
{
    switch (layer)
    {
    case OptionLayer::Baseline:
        return "baseline";
    case OptionLayer::Functional:
        return "functional";
    case OptionLayer::Performance:
        return "performance";
    }
    return "unknown";
}

bool OptionStore::contains(const std::string &group, const std::string &key) const noexcept
{
    return find(group, key) != nullptr;
}

const OptionEntry *OptionStore::find(const std::string &group, const std::string &key) const noexcept
{
    auto groupIt = entries.find(group);
    if (groupIt == entries.end())
        return nullptr;
    auto it = groupIt->second.find(key);
    if (it == groupIt->second.end())
        return nullptr;
    return &it->second;
}

std::optional<OptionValue> OptionStore::value(const std::string &group, const std::string &key) const
{
    if (const OptionEntry *entry = find(group, key))
        return entry->value;
    return std::nullopt;
}

std::string OptionStore::source(const std::string &group, const std::string &key) const
{
    if (const OptionEntry *entry = find(group, key))
        return entry->source;
    return std::string();
}

void OptionStore::set(const std::string &group, const std::string &key, const OptionValue &value,
                      const std::string &source, OptionLayer layer)
{
    entries[group][key] = OptionEntry{value, source, layer};
}

bool OptionStore::erase(const std::string &group, const std::string &key)
{
    auto groupIt = entries.find(group);
    if (groupIt == entries.end())
        return false;
    bool removed = groupIt->second.erase(key) > 0;
    if (groupIt->second.empty())
        entries.erase(groupIt);
    return removed;
}

void OptionStore::clear() noexcept
{
    entries.clear();
}

bool OptionStore::empty() const noexcept
{
    return entries.empty();
}

std::vector<std::string> OptionStore::groupNames() const
{
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto &[name, group] : entries)
    {
        (void)group;
        names.push_back(name);
    }
    return names;
}

const OptionGroup *OptionStore::group(const std::string &name) const noexcept
{
    auto it = entries.find(name);
    if (it == entries.end())
        return nullptr;
    return &it->second;
}

OptionMap OptionStore::values(const std::string &group) const
{
    OptionMap result;
    if (const OptionGroup *entriesForGroup = this->group(group))
    {
        for (const auto &[key, entry] : *entriesForGroup)
            result[key] = entry.value;
    }
    return result;
}

bool OptionStore::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::exception &)
    {
        return false;
    }

    if (!data.is_object())
        return false;

    std::map<std::string, OptionGroup> loaded;
    for (auto groupIt = data.begin(); groupIt != data.end(); ++groupIt)
    {
        if (!groupIt->is_object())
            return false;
        OptionGroup &target = loaded[groupIt.key()];
        for (auto it = groupIt->begin(); it != groupIt->end(); ++it)
        {
            const nlohmann::json &entry = it.value();
            if (!entry.is_object() || !entry.contains("value"))
                return false;
            OptionEntry parsed;
            parsed.value = fromJson(entry["value"]);
            parsed.source = entry.value("source", std::string());
            const std::string layer = entry.value("layer", std::string("baseline"));
            if (layer == "functional")
                parsed.layer = OptionLayer::Functional;
            else if (layer == "performance")
                parsed.layer = OptionLayer::Performance;
            else
                parsed.layer = OptionLayer::Baseline;
            target[it.key()] = parsed;
        }
    }

    entries = std::move(loaded);
    return true;
}

bool OptionStore::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[groupName, groupEntries] : entries)
    {
        nlohmann::json groupJson = nlohmann::json::object();
        for (const auto &[key, entry] : groupEntries)
        {
            groupJson[key] = {{"value", toJson(entry.value)},
                              {"source", entry.source},
                              {"layer", layerName(entry.layer)}};
        }
        data[groupName] = groupJson;
    }

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
        return false;
    out << data.dump(2) << std::endl;
    return static_cast<bool>(out);
}

} // namespace llmb::config
