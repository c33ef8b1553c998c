#include "sv/options.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

namespace sv::config
{
namespace
{
std::optional<bool> parseBool(const std::string &value)
{
    std::string lower;
    lower.reserve(value.size());
    for (char ch : value)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

std::optional<std::int64_t> parseInteger(const std::string &value)
{
    std::int64_t parsed = 0;
    const char *begin = value.data();
    const char *end = value.data() + value.size();
    auto rc = std::from_chars(begin, end, parsed);
    if (rc.ec == std::errc() && rc.ptr == end)
        return parsed;
    return std::nullopt;
}

nlohmann::json toJson(const OptionValue &value)
{
    switch (value.kind().value_or(OptionKind::String))
    {
    case OptionKind::Boolean:
        return value.toBool();
    case OptionKind::Integer:
        return value.toInteger();
    case OptionKind::String:
        break;
    }
    if (value.isNull())
        return nullptr;
    return value.toString();
}

OptionValue fromJson(const OptionDefinition &definition, const nlohmann::json &jsonValue)
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        if (jsonValue.is_boolean())
            return OptionValue(jsonValue.get<bool>());
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>() != 0);
        if (jsonValue.is_string())
            return OptionValue(jsonValue.get<std::string>());
        break;
    case OptionKind::Integer:
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>());
        if (jsonValue.is_number_float())
        {
            // 2^63 is exact as a double; anything at or past it does not fit.
            const double number = jsonValue.get<double>();
            constexpr double kUpper = 9223372036854775808.0;
            if (std::isfinite(number) &&
                number >= static_cast<double>(std::numeric_limits<std::int64_t>::min()) &&
                number < kUpper)
                return OptionValue(static_cast<std::int64_t>(number));
            break;
        }
        if (jsonValue.is_string())
            return OptionValue(jsonValue.get<std::string>());
        break;
    case OptionKind::String:
        if (jsonValue.is_string())
            return OptionValue(jsonValue.get<std::string>());
        break;
    }
    return definition.defaultValue;
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "sv-utilities";
    if (const char *home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "sv-utilities";
    return std::filesystem::path(".config") / "sv-utilities";
}

} // namespace

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(std::int64_t value)
    : value(value)
{
}

OptionValue::OptionValue(std::string value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(const char *value)
    : value(std::string(value ? value : ""))
{
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

std::optional<OptionKind> OptionValue::kind() const noexcept
{
    if (std::holds_alternative<bool>(value))
        return OptionKind::Boolean;
    if (std::holds_alternative<std::int64_t>(value))
        return OptionKind::Integer;
    if (std::holds_alternative<std::string>(value))
        return OptionKind::String;
    return std::nullopt;
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *ptr = std::get_if<bool>(&value))
        return *ptr;
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr != 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseBool(*sptr).value_or(fallback);
    return fallback;
}

std::int64_t OptionValue::toInteger(std::int64_t fallback) const noexcept
{
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? 1 : 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseInteger(*sptr).value_or(fallback);
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
    return fallback;
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
    auto it = overrides.find(definition.key);
    if (it != overrides.end())
        it->second = normalizeValue(definition, it->second);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

const OptionDefinition *OptionRegistry::definition(const std::string &key) const
{
    auto it = definitions.find(key);
    if (it == definitions.end())
        return nullptr;
    return &it->second;
}

std::vector<OptionDefinition> OptionRegistry::listRegisteredOptions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(definitions.size());
    for (const auto &[key, def] : definitions)
        result.push_back(def);
    std::sort(result.begin(), result.end(), [](const OptionDefinition &a, const OptionDefinition &b) {
        return a.key < b.key;
    });
    return result;
}

void OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    const OptionDefinition *def = definition(key);
    if (!def)
        return;
    overrides[key] = normalizeValue(*def, value);
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    auto overrideIt = overrides.find(key);
    if (overrideIt != overrides.end())
        return overrideIt->second;
    if (const OptionDefinition *def = definition(key))
        return def->defaultValue;
    return OptionValue();
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::int64_t OptionRegistry::getInteger(const std::string &key, std::int64_t fallback) const
{
    return get(key).toInteger(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::exception &error)
    {
        log("[OPTIONS] ignoring " + filePath.string() + ": " + error.what());
        return false;
    }

    if (!data.is_object())
    {
        log("[OPTIONS] ignoring " + filePath.string() + ": not a JSON object");
        return false;
    }

    for (auto it = data.begin(); it != data.end(); ++it)
    {
        const OptionDefinition *def = definition(it.key());
        if (!def)
            continue;
        overrides[it.key()] = normalizeValue(*def, fromJson(*def, it.value()));
    }
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, def] : definitions)
        data[key] = toJson(get(key));

    std::error_code ec;
    std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
        return false;
    out << data.dump(2) << std::endl;
    return static_cast<bool>(out);
}

bool OptionRegistry::loadDefaults()
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path);
}

bool OptionRegistry::saveDefaults() const
{
    return saveToFile(defaultOptionsPath());
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / "defaults.json";
}

std::filesystem::path OptionRegistry::configRoot()
{
    static std::filesystem::path root = detectConfigRoot();
    return root;
}

OptionValue OptionRegistry::normalizeValue(const OptionDefinition &def, const OptionValue &value) const
{
    switch (def.kind)
    {
    case OptionKind::Boolean:
        return OptionValue(value.toBool(def.defaultValue.toBool()));
    case OptionKind::Integer:
        return OptionValue(std::clamp(value.toInteger(def.defaultValue.toInteger()),
                                      def.minValue, def.maxValue));
    case OptionKind::String:
    {
        std::string text = value.toString(def.defaultValue.toString());
        if (!def.choices.empty() &&
            std::find(def.choices.begin(), def.choices.end(), text) == def.choices.end())
            return def.defaultValue;
        return OptionValue(std::move(text));
    }
    }
    return value;
}

void OptionRegistry::log(const std::string &entry) const
{
    if (logSink)
        logSink(entry);
}

} // namespace sv::config
