#include <cfgref/document/document_writer.hpp>

#include <cfgref/document/document_loader.hpp>

#include <yaml-cpp/yaml.h>

#include <cmath>

namespace cfgref {

namespace {

void EmitYaml(YAML::Emitter& out, const ConfigValue& value) {
    switch (value.GetKind()) {
        case ConfigValue::Kind::Null:
            out << YAML::Null;
            break;
        case ConfigValue::Kind::Boolean:
            out << value.AsBoolean();
            break;
        case ConfigValue::Kind::Integer:
            out << static_cast<long long>(value.AsInteger());
            break;
        case ConfigValue::Kind::Float: {
            const double number = value.AsFloat();
            if (std::isnan(number)) {
                out << ".nan";
            } else if (std::isinf(number)) {
                out << (number < 0 ? "-.inf" : ".inf");
            } else {
                out << FormatFloat(number);
            }
            break;
        }
        case ConfigValue::Kind::String: {
            const auto& text = value.AsString();
            if (!ParsePlainScalar(text).IsString()) {
                out << YAML::DoubleQuoted << text;
            } else {
                out << text;
            }
            break;
        }
        case ConfigValue::Kind::List:
            if (value.Size() == 0) {
                out << YAML::Flow;
            }
            out << YAML::BeginSeq;
            for (const auto& item : value.AsList()) {
                EmitYaml(out, item);
            }
            out << YAML::EndSeq;
            break;
        case ConfigValue::Kind::Map:
            if (value.Size() == 0) {
                out << YAML::Flow;
            }
            out << YAML::BeginMap;
            for (const auto& entry : value.AsMap()) {
                out << YAML::Key;
                if (!ParsePlainScalar(entry.first).IsString()) {
                    out << YAML::DoubleQuoted;
                }
                out << entry.first << YAML::Value;
                EmitYaml(out, entry.second);
            }
            out << YAML::EndMap;
            break;
    }
}

} // anonymous namespace

nlohmann::ordered_json ToJson(const ConfigValue& value) {
    switch (value.GetKind()) {
        case ConfigValue::Kind::Null:
            return nullptr;
        case ConfigValue::Kind::Boolean:
            return value.AsBoolean();
        case ConfigValue::Kind::Integer:
            return value.AsInteger();
        case ConfigValue::Kind::Float:
            if (!std::isfinite(value.AsFloat())) {
                return nullptr;
            }
            return value.AsFloat();
        case ConfigValue::Kind::String:
            return value.AsString();
        case ConfigValue::Kind::List: {
            auto array = nlohmann::ordered_json::array();
            for (const auto& item : value.AsList()) {
                array.push_back(ToJson(item));
            }
            return array;
        }
        case ConfigValue::Kind::Map: {
            auto object = nlohmann::ordered_json::object();
            for (const auto& entry : value.AsMap()) {
                object[entry.first] = ToJson(entry.second);
            }
            return object;
        }
    }
    return nullptr;
}

std::string ToJsonText(const ConfigValue& value, int indent) {
    return ToJson(value).dump(indent, ' ', false,
                              nlohmann::ordered_json::error_handler_t::replace);
}

std::string ToYamlText(const ConfigValue& value) {
    YAML::Emitter out;
    EmitYaml(out, value);
    return std::string(out.c_str()) + "\n";
}

} // namespace cfgref
