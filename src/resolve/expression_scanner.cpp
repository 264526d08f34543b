#include <cfgref/resolve/expression_scanner.hpp>

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace cfgref {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool IsIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool IsPathChar(char c) {
    return IsIdentChar(c) || c == '-';
}

bool IsBlank(std::string_view text) {
    for (char c : text) {
        if (!IsSpace(c)) {
            return false;
        }
    }
    return true;
}

Error ScanError(std::string message, std::optional<std::string> expression) {
    return Error::TemplateSyntax("ExpressionScanner", "", std::move(expression),
                                 std::move(message));
}

// ---------------------------------------------------------------------------
// BodyParser: recursive-descent over the text between the delimiters.
//
//   body     := 'values' '.' path ( '|' filter )*
//   path     := segment ( '.' segment )*
//   filter   := ident ( '(' [ literal ( ',' literal )* ] ')' )?
//   literal  := string | number | true | false | null | none
// ---------------------------------------------------------------------------
class BodyParser {
public:
    explicit BodyParser(std::string_view text) : text_(text) {}

    Result<void, std::string> Parse(ReferenceExpression& expression) {
        SkipSpace();
        auto scope = ReadIdentifier();
        if (scope != kValuesScope) {
            return Fail(scope.empty()
                ? "expected 'values.<path>'"
                : "unknown scope '" + scope + "', only 'values' is available");
        }
        if (!Consume('.')) {
            return Fail("expected '.' after 'values'");
        }

        auto path = ReadPath();
        if (path.IsErr()) {
            return Result<void, std::string>::Err(std::move(path).Error());
        }
        expression.path = std::move(path).Value();

        SkipSpace();
        while (Consume('|')) {
            SkipSpace();
            auto filter = ReadFilter();
            if (filter.IsErr()) {
                return Result<void, std::string>::Err(std::move(filter).Error());
            }
            expression.filters.push_back(std::move(filter).Value());
            SkipSpace();
        }

        if (pos_ < text_.size()) {
            return Fail("unexpected '" + std::string(text_.substr(pos_)) + "'");
        }
        return Result<void, std::string>::Ok();
    }

private:
    Result<void, std::string> Fail(std::string message) const {
        return Result<void, std::string>::Err(std::move(message));
    }

    void SkipSpace() {
        while (pos_ < text_.size() && IsSpace(text_[pos_])) {
            ++pos_;
        }
    }

    bool Consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::string ReadIdentifier() {
        const auto start = pos_;
        if (pos_ < text_.size() && IsIdentStart(text_[pos_])) {
            ++pos_;
            while (pos_ < text_.size() && IsIdentChar(text_[pos_])) {
                ++pos_;
            }
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    Result<std::string, std::string> ReadPath() {
        std::string path;
        while (true) {
            const auto start = pos_;
            while (pos_ < text_.size() && IsPathChar(text_[pos_])) {
                ++pos_;
            }
            if (pos_ == start) {
                return Result<std::string, std::string>::Err(
                    path.empty() ? "missing path after 'values.'"
                                 : "empty path segment after '" + path + "'");
            }
            if (text_[start] == '-') {
                return Result<std::string, std::string>::Err(
                    "path segment must not start with '-'");
            }
            if (!path.empty()) {
                path.push_back('.');
            }
            path.append(text_.substr(start, pos_ - start));
            if (!Consume('.')) {
                return Result<std::string, std::string>::Ok(std::move(path));
            }
        }
    }

    Result<FilterCall, std::string> ReadFilter() {
        FilterCall call;
        call.name = ReadIdentifier();
        if (call.name.empty()) {
            return Result<FilterCall, std::string>::Err("expected filter name after '|'");
        }
        SkipSpace();
        if (!Consume('(')) {
            return Result<FilterCall, std::string>::Ok(std::move(call));
        }
        SkipSpace();
        if (Consume(')')) {
            return Result<FilterCall, std::string>::Ok(std::move(call));
        }
        while (true) {
            SkipSpace();
            auto literal = ReadLiteral();
            if (literal.IsErr()) {
                return Result<FilterCall, std::string>::Err(
                    "bad argument to filter '" + call.name + "': " +
                    std::move(literal).Error());
            }
            call.args.push_back(std::move(literal).Value());
            SkipSpace();
            if (Consume(')')) {
                return Result<FilterCall, std::string>::Ok(std::move(call));
            }
            if (!Consume(',')) {
                return Result<FilterCall, std::string>::Err(
                    "expected ',' or ')' in arguments of filter '" + call.name + "'");
            }
        }
    }

    Result<ConfigValue, std::string> ReadLiteral() {
        if (pos_ >= text_.size()) {
            return Result<ConfigValue, std::string>::Err("unexpected end of expression");
        }
        const char c = text_[pos_];
        if (c == '\'' || c == '"') {
            return ReadString(c);
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.') {
            return ReadNumber();
        }
        const auto word = ReadIdentifier();
        if (word == "true" || word == "True") {
            return Result<ConfigValue, std::string>::Ok(ConfigValue(true));
        }
        if (word == "false" || word == "False") {
            return Result<ConfigValue, std::string>::Ok(ConfigValue(false));
        }
        if (word == "null" || word == "none" || word == "None") {
            return Result<ConfigValue, std::string>::Ok(ConfigValue());
        }
        if (word.empty()) {
            return Result<ConfigValue, std::string>::Err(
                "unexpected '" + std::string(1, c) + "'");
        }
        return Result<ConfigValue, std::string>::Err(
            "'" + word + "' is not a literal");
    }

    Result<ConfigValue, std::string> ReadString(char quote) {
        ++pos_;
        std::string value;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == quote) {
                return Result<ConfigValue, std::string>::Ok(ConfigValue(std::move(value)));
            }
            if (c == '\\' && pos_ < text_.size()) {
                char escaped = text_[pos_++];
                switch (escaped) {
                    case 'n': value.push_back('\n'); break;
                    case 't': value.push_back('\t'); break;
                    case 'r': value.push_back('\r'); break;
                    default:  value.push_back(escaped); break;
                }
                continue;
            }
            value.push_back(c);
        }
        return Result<ConfigValue, std::string>::Err("unterminated string literal");
    }

    Result<ConfigValue, std::string> ReadNumber() {
        const auto start = pos_;
        bool is_float = false;
        if (text_[pos_] == '-' || text_[pos_] == '+') {
            ++pos_;
        }
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E') {
                is_float = true;
                ++pos_;
                if ((c == 'e' || c == 'E') && pos_ < text_.size() &&
                    (text_[pos_] == '-' || text_[pos_] == '+')) {
                    ++pos_;
                }
            } else {
                break;
            }
        }

        const std::string token(text_.substr(start, pos_ - start));
        char* end = nullptr;
        errno = 0;
        if (is_float) {
            const double value = std::strtod(token.c_str(), &end);
            if (end != token.c_str() + token.size() || errno == ERANGE) {
                return Result<ConfigValue, std::string>::Err("malformed number '" + token + "'");
            }
            return Result<ConfigValue, std::string>::Ok(ConfigValue(value));
        }
        const long long value = std::strtoll(token.c_str(), &end, 10);
        if (token.empty() || end != token.c_str() + token.size() || errno == ERANGE) {
            return Result<ConfigValue, std::string>::Err("malformed number '" + token + "'");
        }
        return Result<ConfigValue, std::string>::Ok(
            ConfigValue(static_cast<std::int64_t>(value)));
    }

    std::string_view text_;
    size_t pos_ = 0;
};

} // anonymous namespace

Result<void, std::string> ParseExpressionBody(std::string_view body,
                                              ReferenceExpression& expression) {
    BodyParser parser(body);
    return parser.Parse(expression);
}

Result<std::vector<ReferenceExpression>, Error> ScanExpressions(
    std::string_view text, const Delimiters& delimiters) {
    using ScanResult = Result<std::vector<ReferenceExpression>, Error>;

    const std::string_view open = delimiters.open;
    const std::string_view close = delimiters.close;
    std::vector<ReferenceExpression> expressions;
    if (open.empty() || close.empty()) {
        return ScanResult::Err(ScanError("delimiters must not be empty", std::nullopt));
    }

    size_t pos = 0;
    while (pos < text.size()) {
        const auto open_pos = text.find(open, pos);
        const auto stray_close = text.find(close, pos);
        if (stray_close != std::string_view::npos &&
            (open_pos == std::string_view::npos || stray_close < open_pos)) {
            return ScanResult::Err(ScanError(
                "unmatched '" + std::string(close) + "' at offset " +
                    std::to_string(stray_close),
                std::string(text)));
        }
        if (open_pos == std::string_view::npos) {
            break;
        }

        const auto body_start = open_pos + open.size();
        const auto close_pos = text.find(close, body_start);
        if (close_pos == std::string_view::npos) {
            return ScanResult::Err(ScanError(
                "unterminated expression starting at offset " +
                    std::to_string(open_pos),
                std::string(text.substr(open_pos))));
        }

        ReferenceExpression expression;
        expression.start_offset = open_pos;
        expression.end_offset = close_pos + close.size();
        expression.raw_text = std::string(
            text.substr(open_pos, expression.end_offset - open_pos));

        const auto body = text.substr(body_start, close_pos - body_start);
        if (body.find(open) != std::string_view::npos) {
            return ScanResult::Err(ScanError(
                "nested '" + std::string(open) + "' inside expression",
                expression.raw_text));
        }

        auto parsed = ParseExpressionBody(body, expression);
        if (parsed.IsErr()) {
            return ScanResult::Err(ScanError(parsed.Error(), expression.raw_text));
        }

        expressions.push_back(std::move(expression));
        pos = close_pos + close.size();
    }

    if (expressions.size() == 1) {
        auto& only = expressions.front();
        only.is_pure = IsBlank(text.substr(0, only.start_offset)) &&
                       IsBlank(text.substr(only.end_offset));
    }
    return ScanResult::Ok(std::move(expressions));
}

} // namespace cfgref
