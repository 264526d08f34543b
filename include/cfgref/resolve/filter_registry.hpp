#pragma once

#include <cfgref/core/result.hpp>
#include <cfgref/value/config_value.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cfgref {

// A filter is a pure function of the piped value and its literal
// arguments. It returns the new value or a message describing why the
// input or arguments were rejected.
using FilterFunction = std::function<Result<ConfigValue, std::string>(
    const ConfigValue& input, const std::vector<ConfigValue>& args)>;

// ---------------------------------------------------------------------------
// FilterRegistry: fixed mapping from filter name to implementation.
//
// Expressions are checked against the registry when the dependency graph is
// built, so an unknown filter fails before anything is rendered.
// ---------------------------------------------------------------------------
class FilterRegistry {
public:
    FilterRegistry() = default;

    // A registry holding lower, upper, title, capitalize, trim, replace,
    // default, string, int, float, length, join, first, last and quote.
    static FilterRegistry WithBuiltins();

    // Register or replace a filter.
    void Register(std::string name, FilterFunction filter);

    [[nodiscard]] bool Contains(std::string_view name) const;

    // nullptr when no filter has that name.
    [[nodiscard]] const FilterFunction* Find(std::string_view name) const;

    // Registered names, sorted.
    [[nodiscard]] std::vector<std::string> Names() const;

private:
    std::map<std::string, FilterFunction, std::less<>> filters_;
};

} // namespace cfgref
