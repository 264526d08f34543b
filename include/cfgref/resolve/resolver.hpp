#pragma once

#include <cfgref/core/result.hpp>
#include <cfgref/resolve/filter_registry.hpp>
#include <cfgref/resolve/resolver_options.hpp>
#include <cfgref/value/config_value.hpp>

#include <string>
#include <vector>

namespace cfgref {

// One row of the resolution report, in discovery order.
struct NodeReport {
    std::string path;
    std::vector<std::string> references;   // as written in the leaf
    std::vector<std::string> dependencies; // node paths it waited for
    int depth = 0;                         // longest chain, in reference hops
    size_t position = 0;                   // index in the resolution order
};

// ---------------------------------------------------------------------------
// ResolutionReport: what a run found and did, for diagnostics.
// ---------------------------------------------------------------------------
struct ResolutionReport {
    bool skipped = false;           // resolution was disabled
    std::vector<NodeReport> nodes;  // discovery order
    std::vector<std::string> order; // resolution order
    size_t edge_count = 0;
    int passes = 0;                 // 1 when anything was rendered
    int max_depth_seen = 0;
};

struct ResolvedTree {
    ConfigValue tree;
    ResolutionReport report;
};

// ---------------------------------------------------------------------------
// Resolver: replaces every reference expression in a document with the
// value it points at.
//
// Runs graph build, cycle check, depth check, topological sort and rendering
// in that order. Any error aborts the run; the input tree is never modified
// and no partially resolved tree is returned.
// ---------------------------------------------------------------------------
class Resolver {
public:
    explicit Resolver(ResolverOptions options = {},
                      FilterRegistry registry = FilterRegistry::WithBuiltins());

    [[nodiscard]] Result<ResolvedTree, Error> Resolve(const ConfigValue& tree) const;

    [[nodiscard]] const ResolverOptions& Options() const noexcept { return options_; }
    [[nodiscard]] const FilterRegistry& Filters() const noexcept { return registry_; }

private:
    ResolverOptions options_;
    FilterRegistry registry_;
};

/// Resolve with the built-in filters. Returns only the resolved tree.
Result<ConfigValue, Error> Resolve(const ConfigValue& tree,
                                   const ResolverOptions& options = {});

} // namespace cfgref
