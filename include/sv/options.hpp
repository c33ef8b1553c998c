#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace sv::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    String,
};

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(std::int64_t value);
    OptionValue(std::string value);
    OptionValue(const char *value);

    bool isNull() const noexcept;
    std::optional<OptionKind> kind() const noexcept;

    bool toBool(bool fallback = false) const noexcept;
    std::int64_t toInteger(std::int64_t fallback = 0) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;

    bool operator==(const OptionValue &other) const noexcept { return value == other.value; }
    bool operator!=(const OptionValue &other) const noexcept { return !(*this == other); }

private:
    std::variant<std::monostate, bool, std::int64_t, std::string> value;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string displayName;
    std::string description;
    // Integer options are clamped into [minValue, maxValue].
    std::int64_t minValue = INT64_MIN;
    std::int64_t maxValue = INT64_MAX;
    // String options restricted to these values when non-empty.
    std::vector<std::string> choices;
};

// Typed per-application settings persisted as a flat JSON object at
// <configRoot>/<appId>/defaults.json. Unknown keys in a file are ignored and
// malformed values fall back to the definition's default.
class OptionRegistry
{
public:
    using LogSink = std::function<void(const std::string &)>;

    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;
    const OptionDefinition *definition(const std::string &key) const;
    std::vector<OptionDefinition> listRegisteredOptions() const;

    void set(const std::string &key, const OptionValue &value);
    void reset(const std::string &key);

    OptionValue get(const std::string &key) const;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::int64_t getInteger(const std::string &key, std::int64_t fallback = 0) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;

    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;
    bool loadDefaults();
    bool saveDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    void setLogSink(LogSink sink) { logSink = std::move(sink); }

    static std::filesystem::path configRoot();

private:
    OptionValue normalizeValue(const OptionDefinition &definition, const OptionValue &value) const;
    void log(const std::string &entry) const;

    std::string id;
    std::unordered_map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, OptionValue> overrides;
    LogSink logSink;
};

} // namespace sv::config
