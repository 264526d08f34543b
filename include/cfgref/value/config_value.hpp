#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cfgref {

// ---------------------------------------------------------------------------
// ConfigValue: tagged variant for every node of a configuration document.
//
// Maps keep insertion order (the order keys appeared in the source), but
// compare equal regardless of key order. Integer and Float are distinct
// kinds so that an integer referenced verbatim stays an integer.
// ---------------------------------------------------------------------------
class ConfigValue {
public:
    enum class Kind {
        Null,
        Boolean,
        Integer,
        Float,
        String,
        List,
        Map,
    };

    using List = std::vector<ConfigValue>;
    using Entry = std::pair<std::string, ConfigValue>;
    using Map = std::vector<Entry>;

    ConfigValue() = default;
    ConfigValue(std::nullptr_t) {}
    ConfigValue(bool value) : storage_(value) {}
    ConfigValue(int value) : storage_(static_cast<std::int64_t>(value)) {}
    ConfigValue(std::int64_t value) : storage_(value) {}
    ConfigValue(double value) : storage_(value) {}
    ConfigValue(const char* value) : storage_(std::string(value)) {}
    ConfigValue(std::string value) : storage_(std::move(value)) {}
    ConfigValue(List value) : storage_(std::move(value)) {}
    ConfigValue(Map value) : storage_(std::move(value)) {}

    static ConfigValue MakeList() { return ConfigValue(List{}); }
    static ConfigValue MakeMap() { return ConfigValue(Map{}); }

    [[nodiscard]] Kind GetKind() const noexcept {
        return static_cast<Kind>(storage_.index());
    }

    [[nodiscard]] bool IsNull() const noexcept { return GetKind() == Kind::Null; }
    [[nodiscard]] bool IsBoolean() const noexcept { return GetKind() == Kind::Boolean; }
    [[nodiscard]] bool IsInteger() const noexcept { return GetKind() == Kind::Integer; }
    [[nodiscard]] bool IsFloat() const noexcept { return GetKind() == Kind::Float; }
    [[nodiscard]] bool IsNumber() const noexcept { return IsInteger() || IsFloat(); }
    [[nodiscard]] bool IsString() const noexcept { return GetKind() == Kind::String; }
    [[nodiscard]] bool IsList() const noexcept { return GetKind() == Kind::List; }
    [[nodiscard]] bool IsMap() const noexcept { return GetKind() == Kind::Map; }
    [[nodiscard]] bool IsScalar() const noexcept { return !IsList() && !IsMap(); }

    // Typed access. Calling the wrong accessor throws std::bad_variant_access.
    [[nodiscard]] bool AsBoolean() const { return std::get<bool>(storage_); }
    [[nodiscard]] std::int64_t AsInteger() const { return std::get<std::int64_t>(storage_); }
    [[nodiscard]] double AsFloat() const { return std::get<double>(storage_); }
    [[nodiscard]] const std::string& AsString() const { return std::get<std::string>(storage_); }
    [[nodiscard]] const List& AsList() const { return std::get<List>(storage_); }
    [[nodiscard]] List& AsList() { return std::get<List>(storage_); }
    [[nodiscard]] const Map& AsMap() const { return std::get<Map>(storage_); }
    [[nodiscard]] Map& AsMap() { return std::get<Map>(storage_); }

    // Map helpers. Find returns nullptr when the key is absent or this is
    // not a map.
    [[nodiscard]] const ConfigValue* Find(std::string_view key) const;
    [[nodiscard]] ConfigValue* Find(std::string_view key);

    // Insert or overwrite. Turns a Null value into an empty map first.
    void Set(std::string key, ConfigValue value);

    // List helper. Turns a Null value into an empty list first.
    void Append(ConfigValue value);

    // Number of children for List/Map, 0 for scalars.
    [[nodiscard]] size_t Size() const noexcept;

    bool operator==(const ConfigValue& other) const;
    bool operator!=(const ConfigValue& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string, List, Map>
        storage_;
};

/// "null", "boolean", "integer", "float", "string", "list", "map".
const char* KindName(ConfigValue::Kind kind);

/// Canonical text form used when a value is interpolated into a string:
/// integers and floats as decimal text, booleans as true/false, null as
/// null. Returns false for lists and maps, which have no text form.
bool Stringify(const ConfigValue& value, std::string& out);

/// Shortest decimal text that reads back as the same double, always with
/// a fractional part or exponent ("1.0", "0.1", "1e+20", "inf", "nan").
std::string FormatFloat(double value);

} // namespace cfgref
