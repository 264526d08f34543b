#include <cfgref/resolve/reference_graph.hpp>

#include <cfgref/value/leaf_path.hpp>

#include <algorithm>
#include <set>

namespace cfgref {

std::optional<size_t> ReferenceGraph::IndexOf(std::string_view path) const {
    auto it = index_.find(std::string(path));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ReferenceGraph::AddNode(DependencyNode node) {
    if (index_.count(node.path) > 0) {
        return false;
    }
    index_.emplace(node.path, nodes_.size());
    nodes_.push_back(std::move(node));
    return true;
}

void ReferenceGraph::LinkDependencies() {
    for (auto& node : nodes_) {
        std::set<size_t> targets;
        for (const auto& reference : node.references) {
            for (size_t i = 0; i < nodes_.size(); ++i) {
                // The target itself, a node beneath it, or a node whose
                // resolved value the reference reaches into.
                if (IsSameOrDescendant(nodes_[i].path, reference) ||
                    IsSameOrDescendant(reference, nodes_[i].path)) {
                    targets.insert(i);
                }
            }
        }
        node.dependencies.assign(targets.begin(), targets.end());
    }
}

size_t ReferenceGraph::EdgeCount() const {
    size_t count = 0;
    for (const auto& node : nodes_) {
        count += node.dependencies.size();
    }
    return count;
}

Result<ReferenceGraph, Error> BuildReferenceGraph(const ConfigValue& tree,
                                                  const Delimiters& delimiters,
                                                  const FilterRegistry* registry) {
    ReferenceGraph graph;
    std::optional<Error> failure;

    WalkTree(tree, [&](const std::string& path, const ConfigValue& value) {
        if (failure.has_value() || !value.IsString()) {
            return;
        }

        auto scanned = ScanExpressions(value.AsString(), delimiters);
        if (scanned.IsErr()) {
            auto error = std::move(scanned).Error();
            error.path = path;
            failure = std::move(error);
            return;
        }
        auto expressions = std::move(scanned).Value();
        if (expressions.empty()) {
            return;
        }

        // A map key holding '.' makes the joined path point somewhere else
        // (or nowhere), so the leaf could never be written back.
        if (LookupPath(tree, path) != &value) {
            failure = Error::TemplateSyntax(
                "GraphBuilder", path, std::nullopt,
                "the path of this value contains a map key with '.', "
                "so it cannot be addressed");
            return;
        }

        DependencyNode node;
        node.path = path;
        node.raw = value.AsString();
        for (const auto& expression : expressions) {
            if (registry != nullptr) {
                for (const auto& filter : expression.filters) {
                    if (!registry->Contains(filter.name)) {
                        failure = Error::TemplateSyntax(
                            "GraphBuilder", path, expression.raw_text,
                            "unknown filter '" + filter.name + "'");
                        return;
                    }
                }
            }
            if (std::find(node.references.begin(), node.references.end(),
                          expression.path) == node.references.end()) {
                node.references.push_back(expression.path);
            }
        }
        node.expressions = std::move(expressions);

        if (!graph.AddNode(std::move(node))) {
            failure = Error::TemplateSyntax(
                "GraphBuilder", path, std::nullopt,
                "two locations in the document share this path");
        }
    });

    if (failure.has_value()) {
        return Result<ReferenceGraph, Error>::Err(std::move(*failure));
    }

    graph.LinkDependencies();
    return Result<ReferenceGraph, Error>::Ok(std::move(graph));
}

} // namespace cfgref
