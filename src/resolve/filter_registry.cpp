#include <cfgref/resolve/filter_registry.hpp>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>

namespace cfgref {

namespace {

using FilterResult = Result<ConfigValue, std::string>;
using Args = std::vector<ConfigValue>;

FilterResult Reject(const std::string& filter, const std::string& reason) {
    return FilterResult::Err("filter '" + filter + "' " + reason);
}

bool CheckArity(const Args& args, size_t min, size_t max) {
    return args.size() >= min && args.size() <= max;
}

std::string ArityText(size_t min, size_t max) {
    if (min == max) {
        return "takes " + std::to_string(min) + " argument(s)";
    }
    return "takes " + std::to_string(min) + " to " + std::to_string(max) +
           " arguments";
}

// Text of a scalar input, or an error naming the filter for lists/maps.
Result<std::string, std::string> ScalarText(const std::string& filter,
                                            const ConfigValue& input) {
    std::string text;
    if (!Stringify(input, text)) {
        return Result<std::string, std::string>::Err(
            "filter '" + filter + "' expects a scalar, got " +
            KindName(input.GetKind()));
    }
    return Result<std::string, std::string>::Ok(std::move(text));
}

bool IsTruthy(const ConfigValue& value) {
    switch (value.GetKind()) {
        case ConfigValue::Kind::Null:    return false;
        case ConfigValue::Kind::Boolean: return value.AsBoolean();
        case ConfigValue::Kind::Integer: return value.AsInteger() != 0;
        case ConfigValue::Kind::Float:   return value.AsFloat() != 0.0;
        case ConfigValue::Kind::String:  return !value.AsString().empty();
        case ConfigValue::Kind::List:
        case ConfigValue::Kind::Map:     return value.Size() > 0;
    }
    return false;
}

// Number of UTF-8 code points (continuation bytes are not counted).
std::int64_t Utf8Length(const std::string& text) {
    std::int64_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

// Byte length of the UTF-8 sequence starting at text[pos].
size_t Utf8SequenceLength(const std::string& text, size_t pos) {
    size_t end = pos + 1;
    while (end < text.size() &&
           (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        ++end;
    }
    return end - pos;
}

char ToLower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

char ToUpper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

// Wrap a one-string-in, one-string-out transform as a no-argument filter.
FilterFunction TextFilter(std::string name,
                          std::function<std::string(std::string)> transform) {
    return [name, transform](const ConfigValue& input, const Args& args) -> FilterResult {
        if (!args.empty()) {
            return Reject(name, "takes no arguments");
        }
        auto text = ScalarText(name, input);
        if (text.IsErr()) {
            return FilterResult::Err(std::move(text).Error());
        }
        return FilterResult::Ok(ConfigValue(transform(std::move(text).Value())));
    };
}

FilterResult Trim(const ConfigValue& input, const Args& args) {
    if (!CheckArity(args, 0, 1)) {
        return Reject("trim", ArityText(0, 1));
    }
    std::string chars = " \t\n\r\f\v";
    if (!args.empty()) {
        if (!args[0].IsString()) {
            return Reject("trim", "expects a string of characters to strip");
        }
        chars = args[0].AsString();
    }
    auto text = ScalarText("trim", input);
    if (text.IsErr()) {
        return FilterResult::Err(std::move(text).Error());
    }
    auto value = std::move(text).Value();
    const auto first = value.find_first_not_of(chars);
    if (first == std::string::npos) {
        return FilterResult::Ok(ConfigValue(std::string()));
    }
    const auto last = value.find_last_not_of(chars);
    return FilterResult::Ok(ConfigValue(value.substr(first, last - first + 1)));
}

FilterResult Replace(const ConfigValue& input, const Args& args) {
    if (!CheckArity(args, 2, 3)) {
        return Reject("replace", ArityText(2, 3));
    }
    if (!args[0].IsString() || !args[1].IsString()) {
        return Reject("replace", "expects string arguments (old, new)");
    }
    std::int64_t count = -1;
    if (args.size() == 3) {
        if (!args[2].IsInteger()) {
            return Reject("replace", "expects an integer count");
        }
        count = args[2].AsInteger();
    }
    auto text = ScalarText("replace", input);
    if (text.IsErr()) {
        return FilterResult::Err(std::move(text).Error());
    }

    const auto source = std::move(text).Value();
    const auto& from = args[0].AsString();
    const auto& to = args[1].AsString();
    if (from.empty()) {
        // Matches Python: an empty pattern inserts between every character.
        std::string out;
        std::int64_t done = 0;
        for (size_t i = 0; i <= source.size(); ++i) {
            if (count < 0 || done < count) {
                out += to;
                ++done;
            }
            if (i < source.size()) {
                out.push_back(source[i]);
            }
        }
        return FilterResult::Ok(ConfigValue(std::move(out)));
    }

    std::string out;
    size_t pos = 0;
    std::int64_t done = 0;
    while (count < 0 || done < count) {
        const auto hit = source.find(from, pos);
        if (hit == std::string::npos) {
            break;
        }
        out.append(source, pos, hit - pos);
        out += to;
        pos = hit + from.size();
        ++done;
    }
    out.append(source, pos, std::string::npos);
    return FilterResult::Ok(ConfigValue(std::move(out)));
}

FilterResult Default(const ConfigValue& input, const Args& args) {
    if (!CheckArity(args, 1, 2)) {
        return Reject("default", ArityText(1, 2));
    }
    bool falsy_too = false;
    if (args.size() == 2) {
        if (!args[1].IsBoolean()) {
            return Reject("default", "expects a boolean second argument");
        }
        falsy_too = args[1].AsBoolean();
    }
    if (input.IsNull() || (falsy_too && !IsTruthy(input))) {
        return FilterResult::Ok(args[0]);
    }
    return FilterResult::Ok(input);
}

FilterResult ToStringFilter(const ConfigValue& input, const Args& args) {
    if (!args.empty()) {
        return Reject("string", "takes no arguments");
    }
    auto text = ScalarText("string", input);
    if (text.IsErr()) {
        return FilterResult::Err(std::move(text).Error());
    }
    return FilterResult::Ok(ConfigValue(std::move(text).Value()));
}

// Decimal notation only: strtod alone would also take hex and "inf".
bool IsDecimalNumber(const std::string& text) {
    bool digit = false;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digit = true;
        } else if (c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E') {
            return false;
        }
    }
    return digit;
}

// Truncates toward zero; nullopt when the value does not fit an int64.
std::optional<std::int64_t> TruncateToInt64(double value) {
    // -2^63 is exact as a double; 2^63 is the first value past the range.
    constexpr double kLow = -9223372036854775808.0;
    constexpr double kHigh = 9223372036854775808.0;
    if (!std::isfinite(value) || value < kLow || value >= kHigh) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

// int/float fall back to a default (0 unless given) when the input does not
// convert, the way the template engine this syntax comes from behaves.
FilterResult ToInt(const ConfigValue& input, const Args& args) {
    if (!CheckArity(args, 0, 1)) {
        return Reject("int", ArityText(0, 1));
    }
    ConfigValue fallback(0);
    if (!args.empty()) {
        if (!args[0].IsInteger()) {
            return Reject("int", "expects an integer default");
        }
        fallback = args[0];
    }
    switch (input.GetKind()) {
        case ConfigValue::Kind::Integer:
            return FilterResult::Ok(input);
        case ConfigValue::Kind::Boolean:
            return FilterResult::Ok(ConfigValue(input.AsBoolean() ? 1 : 0));
        case ConfigValue::Kind::Float: {
            const auto truncated = TruncateToInt64(input.AsFloat());
            return FilterResult::Ok(truncated ? ConfigValue(*truncated) : fallback);
        }
        case ConfigValue::Kind::String: {
            const auto& text = input.AsString();
            char* end = nullptr;
            errno = 0;
            const long long parsed = std::strtoll(text.c_str(), &end, 10);
            if (!text.empty() && end == text.c_str() + text.size() && errno != ERANGE) {
                return FilterResult::Ok(ConfigValue(static_cast<std::int64_t>(parsed)));
            }
            if (!IsDecimalNumber(text)) {
                return FilterResult::Ok(fallback);
            }
            errno = 0;
            const double as_float = std::strtod(text.c_str(), &end);
            if (end != text.c_str() + text.size() || errno == ERANGE) {
                return FilterResult::Ok(fallback);
            }
            const auto truncated = TruncateToInt64(as_float);
            return FilterResult::Ok(truncated ? ConfigValue(*truncated) : fallback);
        }
        case ConfigValue::Kind::Null:
        case ConfigValue::Kind::List:
        case ConfigValue::Kind::Map:
            return FilterResult::Ok(fallback);
    }
    return FilterResult::Ok(fallback);
}

FilterResult ToFloat(const ConfigValue& input, const Args& args) {
    if (!CheckArity(args, 0, 1)) {
        return Reject("float", ArityText(0, 1));
    }
    ConfigValue fallback(0.0);
    if (!args.empty()) {
        if (!args[0].IsNumber()) {
            return Reject("float", "expects a numeric default");
        }
        fallback = args[0].IsFloat() ? args[0]
                                     : ConfigValue(static_cast<double>(args[0].AsInteger()));
    }
    switch (input.GetKind()) {
        case ConfigValue::Kind::Float:
            return FilterResult::Ok(input);
        case ConfigValue::Kind::Integer:
            return FilterResult::Ok(ConfigValue(static_cast<double>(input.AsInteger())));
        case ConfigValue::Kind::Boolean:
            return FilterResult::Ok(ConfigValue(input.AsBoolean() ? 1.0 : 0.0));
        case ConfigValue::Kind::String: {
            const auto& text = input.AsString();
            if (!IsDecimalNumber(text)) {
                return FilterResult::Ok(fallback);
            }
            char* end = nullptr;
            errno = 0;
            const double parsed = std::strtod(text.c_str(), &end);
            if (end == text.c_str() + text.size() && errno != ERANGE) {
                return FilterResult::Ok(ConfigValue(parsed));
            }
            return FilterResult::Ok(fallback);
        }
        case ConfigValue::Kind::Null:
        case ConfigValue::Kind::List:
        case ConfigValue::Kind::Map:
            return FilterResult::Ok(fallback);
    }
    return FilterResult::Ok(fallback);
}

FilterResult Length(const ConfigValue& input, const Args& args) {
    if (!args.empty()) {
        return Reject("length", "takes no arguments");
    }
    if (input.IsString()) {
        return FilterResult::Ok(ConfigValue(Utf8Length(input.AsString())));
    }
    if (input.IsList() || input.IsMap()) {
        return FilterResult::Ok(ConfigValue(static_cast<std::int64_t>(input.Size())));
    }
    return Reject("length", std::string("has no length for ") + KindName(input.GetKind()));
}

FilterResult Join(const ConfigValue& input, const Args& args) {
    if (!CheckArity(args, 0, 1)) {
        return Reject("join", ArityText(0, 1));
    }
    std::string separator;
    if (!args.empty()) {
        if (!args[0].IsString()) {
            return Reject("join", "expects a string separator");
        }
        separator = args[0].AsString();
    }
    if (!input.IsList()) {
        return Reject("join", std::string("expects a list, got ") + KindName(input.GetKind()));
    }
    std::string out;
    const auto& items = input.AsList();
    for (size_t i = 0; i < items.size(); ++i) {
        std::string text;
        if (!Stringify(items[i], text)) {
            return Reject("join", "cannot join nested " +
                                  std::string(KindName(items[i].GetKind())) + " items");
        }
        if (i > 0) {
            out += separator;
        }
        out += text;
    }
    return FilterResult::Ok(ConfigValue(std::move(out)));
}

FilterResult Edge(const std::string& name, bool first,
                  const ConfigValue& input, const Args& args) {
    if (!args.empty()) {
        return Reject(name, "takes no arguments");
    }
    if (input.IsList()) {
        const auto& items = input.AsList();
        if (items.empty()) {
            return Reject(name, "applied to an empty list");
        }
        return FilterResult::Ok(first ? items.front() : items.back());
    }
    if (input.IsString()) {
        const auto& text = input.AsString();
        if (text.empty()) {
            return Reject(name, "applied to an empty string");
        }
        if (first) {
            return FilterResult::Ok(ConfigValue(text.substr(0, Utf8SequenceLength(text, 0))));
        }
        size_t start = text.size() - 1;
        while (start > 0 && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
            --start;
        }
        return FilterResult::Ok(ConfigValue(text.substr(start)));
    }
    return Reject(name, std::string("expects a list or string, got ") +
                        KindName(input.GetKind()));
}

FilterResult Quote(const ConfigValue& input, const Args& args) {
    if (!args.empty()) {
        return Reject("quote", "takes no arguments");
    }
    if (input.IsString()) {
        return FilterResult::Ok(ConfigValue("\"" + input.AsString() + "\""));
    }
    auto text = ScalarText("quote", input);
    if (text.IsErr()) {
        return FilterResult::Err(std::move(text).Error());
    }
    return FilterResult::Ok(ConfigValue(std::move(text).Value()));
}

} // anonymous namespace

FilterRegistry FilterRegistry::WithBuiltins() {
    FilterRegistry registry;

    registry.Register("lower", TextFilter("lower", [](std::string s) {
        for (auto& c : s) c = ToLower(c);
        return s;
    }));
    registry.Register("upper", TextFilter("upper", [](std::string s) {
        for (auto& c : s) c = ToUpper(c);
        return s;
    }));
    // Every letter that follows a non-letter starts a word: "my-app" -> "My-App".
    registry.Register("title", TextFilter("title", [](std::string s) {
        bool in_word = false;
        for (auto& c : s) {
            const bool alpha = std::isalpha(static_cast<unsigned char>(c)) != 0;
            c = alpha && !in_word ? ToUpper(c) : ToLower(c);
            in_word = alpha;
        }
        return s;
    }));
    registry.Register("capitalize", TextFilter("capitalize", [](std::string s) {
        for (size_t i = 0; i < s.size(); ++i) {
            s[i] = i == 0 ? ToUpper(s[i]) : ToLower(s[i]);
        }
        return s;
    }));
    registry.Register("trim", Trim);
    registry.Register("replace", Replace);
    registry.Register("default", Default);
    registry.Register("string", ToStringFilter);
    registry.Register("int", ToInt);
    registry.Register("float", ToFloat);
    registry.Register("length", Length);
    registry.Register("join", Join);
    registry.Register("first", [](const ConfigValue& input, const Args& args) {
        return Edge("first", true, input, args);
    });
    registry.Register("last", [](const ConfigValue& input, const Args& args) {
        return Edge("last", false, input, args);
    });
    registry.Register("quote", Quote);

    return registry;
}

void FilterRegistry::Register(std::string name, FilterFunction filter) {
    filters_[std::move(name)] = std::move(filter);
}

bool FilterRegistry::Contains(std::string_view name) const {
    return filters_.find(name) != filters_.end();
}

const FilterFunction* FilterRegistry::Find(std::string_view name) const {
    auto it = filters_.find(name);
    if (it == filters_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> FilterRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(filters_.size());
    for (const auto& entry : filters_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace cfgref
