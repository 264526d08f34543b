#pragma once

#include <string>

namespace cfgref {

constexpr int kDefaultMaxDepth = 10;
constexpr const char* kDefaultOpenDelimiter = "{{";
constexpr const char* kDefaultCloseDelimiter = "}}";

// Open/close markers around a reference expression.
struct Delimiters {
    std::string open = kDefaultOpenDelimiter;
    std::string close = kDefaultCloseDelimiter;
};

// Knobs the caller controls for one resolution run.
struct ResolverOptions {
    // When false the resolver is an identity transform (documents written
    // before references existed pass through untouched).
    bool enabled = true;
    // Longest allowed dependency chain, counted in reference hops.
    int max_depth = kDefaultMaxDepth;
    Delimiters delimiters;
};

} // namespace cfgref
