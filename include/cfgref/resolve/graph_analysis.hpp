#pragma once

#include <cfgref/core/result.hpp>
#include <cfgref/resolve/reference_graph.hpp>

#include <vector>

namespace cfgref {

/// Depth-first search from every unvisited node in discovery order.
/// Returns a CircularDependency error carrying the cycle as an ordered list
/// of paths whose first and last entries are the repeated node
/// ("a", "b", "a"). Cycles unreachable from the first node are found too.
Result<void, Error> DetectCycle(const ReferenceGraph& graph);

/// Longest dependency chain per node, in reference hops: a node whose
/// references all point at plain values has length 1, otherwise
/// 1 + the longest chain among the nodes it waits for. Indexed like
/// graph.Nodes(). Only meaningful on an acyclic graph.
std::vector<int> ComputeChainDepths(const ReferenceGraph& graph);

/// MaxDepthExceeded error for the node with the longest chain when that
/// chain is longer than max_depth. Ties go to the node discovered first.
Result<void, Error> CheckChainDepth(const ReferenceGraph& graph,
                                    const std::vector<int>& depths,
                                    int max_depth);
Result<void, Error> CheckChainDepth(const ReferenceGraph& graph, int max_depth);

/// Kahn's algorithm. Every node comes after all the nodes it waits for;
/// among nodes that are ready at the same time the one discovered first in
/// the tree walk goes first, so the order is reproducible.
Result<std::vector<size_t>, Error> TopologicalOrder(const ReferenceGraph& graph);

} // namespace cfgref
