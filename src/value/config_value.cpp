#include <cfgref/value/config_value.hpp>

#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace cfgref {

const ConfigValue* ConfigValue::Find(std::string_view key) const {
    if (!IsMap()) {
        return nullptr;
    }
    for (const auto& entry : AsMap()) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

ConfigValue* ConfigValue::Find(std::string_view key) {
    if (!IsMap()) {
        return nullptr;
    }
    for (auto& entry : AsMap()) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

void ConfigValue::Set(std::string key, ConfigValue value) {
    if (IsNull()) {
        storage_ = Map{};
    }
    if (auto* existing = Find(key)) {
        *existing = std::move(value);
        return;
    }
    AsMap().emplace_back(std::move(key), std::move(value));
}

void ConfigValue::Append(ConfigValue value) {
    if (IsNull()) {
        storage_ = List{};
    }
    AsList().push_back(std::move(value));
}

size_t ConfigValue::Size() const noexcept {
    if (const auto* list = std::get_if<List>(&storage_)) {
        return list->size();
    }
    if (const auto* map = std::get_if<Map>(&storage_)) {
        return map->size();
    }
    return 0;
}

bool ConfigValue::operator==(const ConfigValue& other) const {
    if (GetKind() != other.GetKind()) {
        return false;
    }
    if (IsMap()) {
        const auto& lhs = AsMap();
        if (lhs.size() != other.AsMap().size()) {
            return false;
        }
        for (const auto& entry : lhs) {
            const auto* match = other.Find(entry.first);
            if (match == nullptr || *match != entry.second) {
                return false;
            }
        }
        return true;
    }
    if (IsFloat()) {
        // NaN compares equal to NaN so that a document equals its own copy.
        const double a = AsFloat();
        const double b = other.AsFloat();
        return a == b || (std::isnan(a) && std::isnan(b));
    }
    return storage_ == other.storage_;
}

const char* KindName(ConfigValue::Kind kind) {
    switch (kind) {
        case ConfigValue::Kind::Null:    return "null";
        case ConfigValue::Kind::Boolean: return "boolean";
        case ConfigValue::Kind::Integer: return "integer";
        case ConfigValue::Kind::Float:   return "float";
        case ConfigValue::Kind::String:  return "string";
        case ConfigValue::Kind::List:    return "list";
        case ConfigValue::Kind::Map:     return "map";
    }
    return "unknown";
}

std::string FormatFloat(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    std::string text;
    for (int precision = 15; precision <= 17; ++precision) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::setprecision(precision) << value;
        text = oss.str();

        std::istringstream back(text);
        back.imbue(std::locale::classic());
        double parsed = 0.0;
        back >> parsed;
        if (parsed == value) {
            break;
        }
    }

    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

bool Stringify(const ConfigValue& value, std::string& out) {
    switch (value.GetKind()) {
        case ConfigValue::Kind::Null:
            out = "null";
            return true;
        case ConfigValue::Kind::Boolean:
            out = value.AsBoolean() ? "true" : "false";
            return true;
        case ConfigValue::Kind::Integer:
            out = std::to_string(value.AsInteger());
            return true;
        case ConfigValue::Kind::Float:
            out = FormatFloat(value.AsFloat());
            return true;
        case ConfigValue::Kind::String:
            out = value.AsString();
            return true;
        case ConfigValue::Kind::List:
        case ConfigValue::Kind::Map:
            return false;
    }
    return false;
}

} // namespace cfgref
