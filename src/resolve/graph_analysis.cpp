#include <cfgref/resolve/graph_analysis.hpp>

#include <algorithm>
#include <set>

namespace cfgref {

namespace {

enum class Mark {
    Unvisited,
    OnStack,
    Done,
};

struct Frame {
    size_t node;
    size_t next_dependency;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// DetectCycle: iterative DFS with an explicit recursion stack.
// ---------------------------------------------------------------------------
Result<void, Error> DetectCycle(const ReferenceGraph& graph) {
    std::vector<Mark> marks(graph.Size(), Mark::Unvisited);
    std::vector<Frame> stack;

    for (size_t root = 0; root < graph.Size(); ++root) {
        if (marks[root] != Mark::Unvisited) {
            continue;
        }
        marks[root] = Mark::OnStack;
        stack.push_back({root, 0});

        while (!stack.empty()) {
            auto& frame = stack.back();
            const auto& dependencies = graph.Node(frame.node).dependencies;
            if (frame.next_dependency == dependencies.size()) {
                marks[frame.node] = Mark::Done;
                stack.pop_back();
                continue;
            }

            const size_t next = dependencies[frame.next_dependency++];
            if (marks[next] == Mark::OnStack) {
                auto start = std::find_if(stack.begin(), stack.end(),
                                          [next](const Frame& f) { return f.node == next; });
                std::vector<std::string> cycle;
                for (auto it = start; it != stack.end(); ++it) {
                    cycle.push_back(graph.Node(it->node).path);
                }
                cycle.push_back(graph.Node(next).path);
                return Result<void, Error>::Err(Error::CircularDependency(std::move(cycle)));
            }
            if (marks[next] == Mark::Unvisited) {
                marks[next] = Mark::OnStack;
                stack.push_back({next, 0});
            }
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ComputeChainDepths: memoized longest path, filled in DFS post-order.
// ---------------------------------------------------------------------------
std::vector<int> ComputeChainDepths(const ReferenceGraph& graph) {
    std::vector<int> depths(graph.Size(), 0);
    std::vector<Mark> marks(graph.Size(), Mark::Unvisited);
    std::vector<Frame> stack;

    for (size_t root = 0; root < graph.Size(); ++root) {
        if (marks[root] != Mark::Unvisited) {
            continue;
        }
        marks[root] = Mark::OnStack;
        stack.push_back({root, 0});

        while (!stack.empty()) {
            auto& frame = stack.back();
            const auto& dependencies = graph.Node(frame.node).dependencies;
            if (frame.next_dependency < dependencies.size()) {
                const size_t next = dependencies[frame.next_dependency++];
                if (marks[next] == Mark::Unvisited) {
                    marks[next] = Mark::OnStack;
                    stack.push_back({next, 0});
                }
                continue;
            }

            int longest = 0;
            for (size_t dependency : dependencies) {
                longest = std::max(longest, depths[dependency]);
            }
            depths[frame.node] = longest + 1;
            marks[frame.node] = Mark::Done;
            stack.pop_back();
        }
    }
    return depths;
}

Result<void, Error> CheckChainDepth(const ReferenceGraph& graph,
                                    const std::vector<int>& depths,
                                    int max_depth) {
    size_t deepest = 0;
    for (size_t i = 1; i < depths.size(); ++i) {
        if (depths[i] > depths[deepest]) {
            deepest = i;
        }
    }
    if (!depths.empty() && depths[deepest] > max_depth) {
        return Result<void, Error>::Err(Error::MaxDepthExceeded(
            graph.Node(deepest).path, depths[deepest], max_depth));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> CheckChainDepth(const ReferenceGraph& graph, int max_depth) {
    return CheckChainDepth(graph, ComputeChainDepths(graph), max_depth);
}

// ---------------------------------------------------------------------------
// TopologicalOrder: Kahn's algorithm, ready set ordered by discovery index.
// ---------------------------------------------------------------------------
Result<std::vector<size_t>, Error> TopologicalOrder(const ReferenceGraph& graph) {
    const size_t count = graph.Size();
    std::vector<size_t> waiting_on(count, 0);
    std::vector<std::vector<size_t>> dependents(count);

    for (size_t i = 0; i < count; ++i) {
        const auto& dependencies = graph.Node(i).dependencies;
        waiting_on[i] = dependencies.size();
        for (size_t dependency : dependencies) {
            dependents[dependency].push_back(i);
        }
    }

    std::set<size_t> ready;
    for (size_t i = 0; i < count; ++i) {
        if (waiting_on[i] == 0) {
            ready.insert(i);
        }
    }

    std::vector<size_t> order;
    order.reserve(count);
    while (!ready.empty()) {
        const size_t next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(next);
        for (size_t dependent : dependents[next]) {
            if (--waiting_on[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }

    if (order.size() != count) {
        // Only reachable when called on a graph that was not checked first.
        auto cycle = DetectCycle(graph);
        if (cycle.IsErr()) {
            return Result<std::vector<size_t>, Error>::Err(std::move(cycle).Error());
        }
        Error error;
        error.operation = "TopologicalSorter";
        error.message = "dependency graph could not be ordered";
        return Result<std::vector<size_t>, Error>::Err(std::move(error));
    }
    return Result<std::vector<size_t>, Error>::Ok(std::move(order));
}

} // namespace cfgref
