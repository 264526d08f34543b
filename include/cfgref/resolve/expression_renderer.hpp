#pragma once

#include <cfgref/core/result.hpp>
#include <cfgref/resolve/filter_registry.hpp>
#include <cfgref/resolve/reference_graph.hpp>
#include <cfgref/resolve/resolution_context.hpp>

#include <string>

namespace cfgref {

// ---------------------------------------------------------------------------
// ExpressionRenderer: computes the resolved value of one node.
//
// A pure expression (the leaf is exactly one expression) yields the
// referenced value with its filters applied and keeps its type. Anything
// else is rendered as a string: literal text verbatim, each expression
// replaced by the canonical string form of its value.
// ---------------------------------------------------------------------------
class ExpressionRenderer {
public:
    explicit ExpressionRenderer(const FilterRegistry& registry);

    [[nodiscard]] Result<ConfigValue, Error> Render(const DependencyNode& node,
                                                    const ResolutionContext& context) const;

    // Look up the referenced value and run the filter pipeline over it.
    // node_path is only used to label errors.
    [[nodiscard]] Result<ConfigValue, Error> Evaluate(const ReferenceExpression& expression,
                                                      const std::string& node_path,
                                                      const ResolutionContext& context) const;

private:
    const FilterRegistry& registry_;
};

} // namespace cfgref
