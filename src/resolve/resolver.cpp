#include <cfgref/resolve/resolver.hpp>

#include <cfgref/core/log.hpp>
#include <cfgref/resolve/expression_renderer.hpp>
#include <cfgref/resolve/graph_analysis.hpp>
#include <cfgref/resolve/reference_graph.hpp>
#include <cfgref/resolve/resolution_context.hpp>

#include <algorithm>
#include <sstream>

namespace cfgref {

namespace {

constexpr const char* kComponent = "resolver";

std::string JoinList(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += items[i];
    }
    return out;
}

ResolutionReport BuildReport(const ReferenceGraph& graph,
                             const std::vector<int>& depths,
                             const std::vector<size_t>& order) {
    ResolutionReport report;
    report.edge_count = graph.EdgeCount();
    report.passes = graph.Empty() ? 0 : 1;

    std::vector<size_t> position(graph.Size(), 0);
    for (size_t i = 0; i < order.size(); ++i) {
        position[order[i]] = i;
        report.order.push_back(graph.Node(order[i]).path);
    }

    for (size_t i = 0; i < graph.Size(); ++i) {
        const auto& node = graph.Node(i);
        NodeReport row;
        row.path = node.path;
        row.references = node.references;
        for (size_t dependency : node.dependencies) {
            row.dependencies.push_back(graph.Node(dependency).path);
        }
        row.depth = depths[i];
        row.position = position[i];
        report.max_depth_seen = std::max(report.max_depth_seen, row.depth);
        report.nodes.push_back(std::move(row));
    }
    return report;
}

void LogGraph(const ReferenceGraph& graph) {
    if (!GlobalLogger().Enabled(LogLevel::Debug)) {
        return;
    }
    for (const auto& node : graph.Nodes()) {
        std::vector<std::string> targets;
        for (size_t dependency : node.dependencies) {
            targets.push_back(graph.Node(dependency).path);
        }
        LogDebug(kComponent, node.path + " -> [" + JoinList(targets) + "]");
    }
}

} // anonymous namespace

Resolver::Resolver(ResolverOptions options, FilterRegistry registry)
    : options_(std::move(options)), registry_(std::move(registry)) {}

Result<ResolvedTree, Error> Resolver::Resolve(const ConfigValue& tree) const {
    if (!options_.enabled) {
        LogDebug(kComponent, "reference resolution disabled, passing document through");
        ResolvedTree passthrough{tree, {}};
        passthrough.report.skipped = true;
        return Result<ResolvedTree, Error>::Ok(std::move(passthrough));
    }

    auto built = BuildReferenceGraph(tree, options_.delimiters, &registry_);
    if (built.IsErr()) {
        return Result<ResolvedTree, Error>::Err(std::move(built).Error());
    }
    auto graph = std::move(built).Value();
    LogDebug(kComponent, "found " + std::to_string(graph.Size()) + " nodes with " +
                             std::to_string(graph.EdgeCount()) + " dependencies");
    LogGraph(graph);

    auto acyclic = DetectCycle(graph);
    if (acyclic.IsErr()) {
        return Result<ResolvedTree, Error>::Err(std::move(acyclic).Error());
    }

    const auto depths = ComputeChainDepths(graph);
    auto bounded = CheckChainDepth(graph, depths, options_.max_depth);
    if (bounded.IsErr()) {
        return Result<ResolvedTree, Error>::Err(std::move(bounded).Error());
    }

    auto sorted = TopologicalOrder(graph);
    if (sorted.IsErr()) {
        return Result<ResolvedTree, Error>::Err(std::move(sorted).Error());
    }
    const auto order = std::move(sorted).Value();

    ResolutionContext context(tree);
    ExpressionRenderer renderer(registry_);
    for (size_t index : order) {
        auto& node = graph.Node(index);
        auto rendered = renderer.Render(node, context);
        if (rendered.IsErr()) {
            return Result<ResolvedTree, Error>::Err(std::move(rendered).Error());
        }
        node.value = std::move(rendered).Value();
        node.resolved = true;
        auto committed = context.Commit(node.path, node.value);
        if (committed.IsErr()) {
            return Result<ResolvedTree, Error>::Err(std::move(committed).Error());
        }
    }

    ResolvedTree result;
    result.report = BuildReport(graph, depths, order);
    result.tree = std::move(context).Release();

    LogDebug(kComponent, "resolution order: " + JoinList(result.report.order));
    if (!graph.Empty()) {
        std::ostringstream summary;
        summary << "resolved " << graph.Size() << " references in "
                << result.report.passes << " pass (longest chain "
                << result.report.max_depth_seen << ")";
        LogInfo(kComponent, summary.str());
    }
    return Result<ResolvedTree, Error>::Ok(std::move(result));
}

Result<ConfigValue, Error> Resolve(const ConfigValue& tree, const ResolverOptions& options) {
    return Resolver(options).Resolve(tree).Map(
        [](ResolvedTree&& resolved) { return std::move(resolved.tree); });
}

} // namespace cfgref
