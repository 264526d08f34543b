#pragma once

#include <cfgref/core/result.hpp>
#include <cfgref/resolve/resolver_options.hpp>
#include <cfgref/value/config_value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cfgref {

// The namespace every reference must start with.
constexpr const char* kValuesScope = "values";

// One "| name(args...)" segment of a filter pipeline. Arguments are
// literals: strings, numbers, booleans, null.
struct FilterCall {
    std::string name;
    std::vector<ConfigValue> args;
};

// ---------------------------------------------------------------------------
// ReferenceExpression: one delimited expression found in a string leaf.
// ---------------------------------------------------------------------------
struct ReferenceExpression {
    std::string raw_text;           // as written, delimiters included
    std::string path;               // referenced LeafPath, without "values."
    std::vector<FilterCall> filters;
    size_t start_offset = 0;        // offset of the open delimiter
    size_t end_offset = 0;          // one past the close delimiter
    bool is_pure = false;           // the whole (trimmed) leaf is this expression
};

/// Find every expression in a string leaf, left to right. Purely lexical:
/// nothing is looked up or evaluated. An unterminated expression, a stray
/// close delimiter, a nested open delimiter or a malformed body is a
/// TemplateSyntax error (with an empty path; callers fill it in).
Result<std::vector<ReferenceExpression>, Error> ScanExpressions(
    std::string_view text, const Delimiters& delimiters = {});

/// Parse the text between the delimiters: "values.a.b | lower | replace('-', '_')".
/// On success fills path and filters of the expression.
Result<void, std::string> ParseExpressionBody(std::string_view body,
                                              ReferenceExpression& expression);

} // namespace cfgref
