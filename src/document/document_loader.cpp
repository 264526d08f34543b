#include <cfgref/document/document_loader.hpp>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <locale>
#include <optional>
#include <sstream>

namespace cfgref {

namespace {

namespace fs = std::filesystem;

constexpr const char* kComponent = "DocumentLoader";

Error MakeLoadError(std::string_view source, const std::string& message) {
    Error error;
    error.operation = kComponent;
    error.path = std::string(source);
    error.message = message;
    error.category = ErrorCategory::DocumentLoad;
    return error;
}

std::string Lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// -- Core schema scalar recognisers ------------------------------------------

bool IsDigits(std::string_view text, bool (*accept)(char)) {
    return !text.empty() && std::all_of(text.begin(), text.end(), accept);
}

bool IsDecimalDigit(char c) { return c >= '0' && c <= '9'; }
bool IsOctalDigit(char c) { return c >= '0' && c <= '7'; }
bool IsHexDigit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

std::optional<std::int64_t> ParseInteger(std::string_view digits, int base, bool negative) {
    std::uint64_t magnitude = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(),
                                     magnitude, base);
    if (ec != std::errc() || end != digits.data() + digits.size()) {
        return std::nullopt;
    }
    constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (negative) {
        if (magnitude > kMax + 1) {
            return std::nullopt;
        }
        return magnitude == kMax + 1 ? std::numeric_limits<std::int64_t>::min()
                                     : -static_cast<std::int64_t>(magnitude);
    }
    if (magnitude > kMax) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(magnitude);
}

// [-+]? ( \.[0-9]+ | [0-9]+ ( \.[0-9]* )? ) ( [eE] [-+]? [0-9]+ )?
bool IsCoreFloat(std::string_view text) {
    size_t i = 0;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        ++i;
    }
    size_t int_digits = 0;
    while (i < text.size() && IsDecimalDigit(text[i])) {
        ++i;
        ++int_digits;
    }
    size_t frac_digits = 0;
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && IsDecimalDigit(text[i])) {
            ++i;
            ++frac_digits;
        }
    }
    if (int_digits == 0 && frac_digits == 0) {
        return false;
    }
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
            ++i;
        }
        size_t exp_digits = 0;
        while (i < text.size() && IsDecimalDigit(text[i])) {
            ++i;
            ++exp_digits;
        }
        if (exp_digits == 0) {
            return false;
        }
    }
    return i == text.size();
}

double ParseDouble(const std::string& text) {
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    double value = 0.0;
    in >> value;
    if (in.fail()) {
        // Out of range: keep the sign, saturate to infinity.
        return text[0] == '-' ? -std::numeric_limits<double>::infinity()
                              : std::numeric_limits<double>::infinity();
    }
    return value;
}

// -- YAML --------------------------------------------------------------------

constexpr const char* kStrTag = "tag:yaml.org,2002:str";

Result<ConfigValue, Error> FromYaml(const YAML::Node& node, std::string_view source) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Result<ConfigValue, Error>::Ok(ConfigValue());
        case YAML::NodeType::Scalar: {
            // Quoted scalars carry the non-specific tag "!" and stay strings.
            if (node.Tag() == "!" || node.Tag() == kStrTag) {
                return Result<ConfigValue, Error>::Ok(ConfigValue(node.Scalar()));
            }
            return Result<ConfigValue, Error>::Ok(ParsePlainScalar(node.Scalar()));
        }
        case YAML::NodeType::Sequence: {
            ConfigValue list = ConfigValue::MakeList();
            for (const auto& item : node) {
                auto converted = FromYaml(item, source);
                if (converted.IsErr()) {
                    return converted;
                }
                list.Append(std::move(converted).Value());
            }
            return Result<ConfigValue, Error>::Ok(std::move(list));
        }
        case YAML::NodeType::Map: {
            ConfigValue map = ConfigValue::MakeMap();
            for (const auto& entry : node) {
                if (!entry.first.IsScalar()) {
                    return Result<ConfigValue, Error>::Err(MakeLoadError(
                        source, "mapping keys must be scalars (line " +
                                    std::to_string(entry.first.Mark().line + 1) + ")"));
                }
                auto converted = FromYaml(entry.second, source);
                if (converted.IsErr()) {
                    return converted;
                }
                map.Set(entry.first.Scalar(), std::move(converted).Value());
            }
            return Result<ConfigValue, Error>::Ok(std::move(map));
        }
    }
    return Result<ConfigValue, Error>::Ok(ConfigValue());
}

Result<ConfigValue, Error> ParseYaml(std::string_view text, std::string_view source) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return Result<ConfigValue, Error>::Err(
            MakeLoadError(source, "failed to parse YAML: " + std::string(e.what())));
    }
    if (!root.IsDefined() || root.IsNull()) {
        return Result<ConfigValue, Error>::Ok(ConfigValue::MakeMap());
    }
    return FromYaml(root, source);
}

// -- JSON --------------------------------------------------------------------

ConfigValue FromJson(const nlohmann::ordered_json& json) {
    switch (json.type()) {
        case nlohmann::ordered_json::value_t::boolean:
            return ConfigValue(json.get<bool>());
        case nlohmann::ordered_json::value_t::number_integer:
            return ConfigValue(json.get<std::int64_t>());
        case nlohmann::ordered_json::value_t::number_unsigned: {
            const auto value = json.get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return ConfigValue(static_cast<double>(value));
            }
            return ConfigValue(static_cast<std::int64_t>(value));
        }
        case nlohmann::ordered_json::value_t::number_float:
            return ConfigValue(json.get<double>());
        case nlohmann::ordered_json::value_t::string:
            return ConfigValue(json.get<std::string>());
        case nlohmann::ordered_json::value_t::array: {
            ConfigValue list = ConfigValue::MakeList();
            for (const auto& item : json) {
                list.Append(FromJson(item));
            }
            return list;
        }
        case nlohmann::ordered_json::value_t::object: {
            ConfigValue map = ConfigValue::MakeMap();
            for (const auto& item : json.items()) {
                map.Set(item.key(), FromJson(item.value()));
            }
            return map;
        }
        default:
            return ConfigValue();
    }
}

Result<ConfigValue, Error> ParseJson(std::string_view text, std::string_view source) {
    try {
        auto json = nlohmann::ordered_json::parse(text.begin(), text.end());
        return Result<ConfigValue, Error>::Ok(FromJson(json));
    } catch (const nlohmann::json::exception& e) {
        return Result<ConfigValue, Error>::Err(
            MakeLoadError(source, "failed to parse JSON: " + std::string(e.what())));
    }
}

} // anonymous namespace

ConfigValue ParsePlainScalar(const std::string& text) {
    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return ConfigValue();
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        return ConfigValue(true);
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return ConfigValue(false);
    }

    std::string_view body(text);
    const bool negative = body.front() == '-';
    if (body.front() == '-' || body.front() == '+') {
        body.remove_prefix(1);
    }

    if (text.size() > 2 && text.compare(0, 2, "0x") == 0 && IsDigits(body.substr(2), IsHexDigit)) {
        if (auto value = ParseInteger(body.substr(2), 16, false)) {
            return ConfigValue(*value);
        }
    }
    if (text.size() > 2 && text.compare(0, 2, "0o") == 0 && IsDigits(body.substr(2), IsOctalDigit)) {
        if (auto value = ParseInteger(body.substr(2), 8, false)) {
            return ConfigValue(*value);
        }
    }
    if (IsDigits(body, IsDecimalDigit)) {
        if (auto value = ParseInteger(body, 10, negative)) {
            return ConfigValue(*value);
        }
        return ConfigValue(ParseDouble(text));
    }

    if (body == ".inf" || body == ".Inf" || body == ".INF") {
        const double inf = std::numeric_limits<double>::infinity();
        return ConfigValue(negative ? -inf : inf);
    }
    if (text == ".nan" || text == ".NaN" || text == ".NAN") {
        return ConfigValue(std::numeric_limits<double>::quiet_NaN());
    }
    if (IsCoreFloat(text)) {
        return ConfigValue(ParseDouble(text));
    }
    return ConfigValue(text);
}

DocumentFormat FormatFromPath(std::string_view path) {
    const auto extension = Lowercase(fs::path(std::string(path)).extension().string());
    if (extension == ".yml" || extension == ".yaml") {
        return DocumentFormat::Yaml;
    }
    if (extension == ".json") {
        return DocumentFormat::Json;
    }
    return DocumentFormat::Auto;
}

Result<ConfigValue, Error> ParseDocument(std::string_view text,
                                         DocumentFormat format,
                                         std::string_view source_name) {
    switch (format) {
        case DocumentFormat::Yaml:
            return ParseYaml(text, source_name);
        case DocumentFormat::Json:
            return ParseJson(text, source_name);
        case DocumentFormat::Auto:
            break;
    }

    auto yaml = ParseYaml(text, source_name);
    if (yaml.IsOk()) {
        return yaml;
    }
    auto json = ParseJson(text, source_name);
    if (json.IsOk()) {
        return json;
    }
    return Result<ConfigValue, Error>::Err(MakeLoadError(
        source_name, "document is neither valid YAML nor valid JSON"));
}

Result<ConfigValue, Error> LoadDocument(std::string_view path) {
    const fs::path file(std::string{path});
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return Result<ConfigValue, Error>::Err(
            MakeLoadError(path, "file not found"));
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Result<ConfigValue, Error>::Err(
            MakeLoadError(path, "file could not be opened"));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    return ParseDocument(buffer.str(), FormatFromPath(path), path);
}

const std::vector<std::string>& ConfigFileCandidates() {
    static const std::vector<std::string> kCandidates = {
        "config.yml",
        "config.yaml",
        "template-config.yml",
        "template-config.yaml",
        "customizer-config.yml",
        "customizer-config.yaml",
        "config.json",
        "template-config.json",
        "customizer-config.json",
    };
    return kCandidates;
}

Result<std::string, Error> FindConfigFile(std::string_view project_dir) {
    const fs::path dir(std::string{project_dir});
    std::error_code ec;
    for (const auto& name : ConfigFileCandidates()) {
        const auto candidate = dir / name;
        if (fs::is_regular_file(candidate, ec)) {
            return Result<std::string, Error>::Ok(candidate.string());
        }
    }
    return Result<std::string, Error>::Err(
        MakeLoadError(project_dir, "no configuration document found (looked for config.yml, "
                                   "template-config.yml, customizer-config.yml and their "
                                   ".yaml/.json variants)"));
}

} // namespace cfgref
