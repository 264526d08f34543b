#pragma once

#include <cfgref/core/result.hpp>
#include <cfgref/resolve/expression_scanner.hpp>
#include <cfgref/resolve/filter_registry.hpp>
#include <cfgref/resolve/resolver_options.hpp>
#include <cfgref/value/config_value.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cfgref {

// ---------------------------------------------------------------------------
// DependencyNode: a string leaf that contains at least one expression.
// ---------------------------------------------------------------------------
struct DependencyNode {
    std::string path;
    std::string raw;                              // the leaf as written
    std::vector<ReferenceExpression> expressions; // in order of appearance
    std::vector<std::string> references;          // referenced paths, first-seen order, no repeats
    // Indices of the nodes this one waits for: every node located at or
    // beneath one of its references, or above it (a reference into the
    // value another node resolves to). Sorted, no repeats.
    std::vector<size_t> dependencies;
    bool resolved = false;
    ConfigValue value;                            // valid once resolved
};

// ---------------------------------------------------------------------------
// ReferenceGraph: LeafPath -> DependencyNode plus adjacency by node index.
//
// Nodes are stored in tree-walk discovery order; that order is the
// tie-breaker everywhere a deterministic order is needed.
// ---------------------------------------------------------------------------
class ReferenceGraph {
public:
    [[nodiscard]] size_t Size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return nodes_.empty(); }

    [[nodiscard]] const std::vector<DependencyNode>& Nodes() const noexcept { return nodes_; }

    [[nodiscard]] const DependencyNode& Node(size_t index) const { return nodes_.at(index); }
    [[nodiscard]] DependencyNode& Node(size_t index) { return nodes_.at(index); }

    [[nodiscard]] std::optional<size_t> IndexOf(std::string_view path) const;

    // Append a node. Returns false (and leaves the graph unchanged) if a
    // node with the same path already exists.
    bool AddNode(DependencyNode node);

    // Fill every node's dependencies from its references. References that
    // match no node (plain values, or paths that do not exist) add nothing.
    void LinkDependencies();

    // Edge count over node dependencies.
    [[nodiscard]] size_t EdgeCount() const;

private:
    std::vector<DependencyNode> nodes_;
    std::unordered_map<std::string, size_t> index_;
};

/// Walk the tree, scan every string leaf and register one node per leaf
/// holding expressions. References are recorded without checking that the
/// target exists. When a registry is given, every filter name used is
/// checked against it. A leaf with expressions whose path runs through a
/// map key containing '.' is a template syntax error.
Result<ReferenceGraph, Error> BuildReferenceGraph(const ConfigValue& tree,
                                                  const Delimiters& delimiters,
                                                  const FilterRegistry* registry);

} // namespace cfgref
