#include <cartograph/analysis/dependency_resolver.h>
#include <cartograph/graph/report_writer.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace cartograph::analysis {

using graph::NodeRef;
using graph::WriteBatch;
using model::NodeLabel;
using model::Relation;
using nlohmann::json;

namespace {

std::string joinKeys(const std::vector<std::string>& keys, std::string_view sep) {
    std::string out;
    for (const auto& k : keys) {
        if (!out.empty())
            out += sep;
        out += k;
    }
    return out;
}

} // namespace

Result<DependencyGraph> loadFileGraph(graph::GraphStore& store, const std::string& projectId,
                                      std::vector<graph::GraphEdge>* edges) {
    auto filesR = store.findNodes(projectId, NodeLabel::File);
    if (!filesR)
        return filesR.error();

    DependencyGraph graph;
    for (const auto& node : filesR.value())
        graph.addNode(node.key);

    for (auto relation : {Relation::Imports, Relation::References}) {
        graph::EdgeFilter filter;
        filter.relation = relation;
        auto edgesR = store.findEdges(projectId, filter);
        if (!edgesR)
            return edgesR.error();
        for (const auto& edge : edgesR.value()) {
            if (edge.from.label != NodeLabel::File || edge.to.label != NodeLabel::File)
                continue;
            graph.addEdge(edge.from.key, edge.to.key);
            if (edges)
                edges->push_back(edge);
        }
    }
    return graph;
}

ResolutionResult analyzeDependencies(DependencyGraph graph, int closureDepth) {
    ResolutionResult result;
    result.graph = std::move(graph);

    for (auto& members : result.graph.cycles())
        result.cycles.push_back(CycleInfo{std::move(members), {}});

    std::vector<DependencyGraph::Edge> removed;
    result.acyclic = result.graph.withoutCycles(&removed);
    for (const auto& edge : removed) {
        for (auto& cycle : result.cycles) {
            if (std::binary_search(cycle.members.begin(), cycle.members.end(), edge.first)) {
                cycle.brokenEdges.push_back(edge);
                break;
            }
        }
    }

    for (const auto& key : result.graph.nodes()) {
        result.boundedClosure[key] = result.graph.closure(key, closureDepth);
        result.fullClosure[key] = result.acyclic.closure(key);
    }
    return result;
}

DependencyResolver::DependencyResolver(graph::GraphStore& store, ResolverOptions options)
    : store_(store), options_(options) {
    if (options_.closureDepth < 1)
        options_.closureDepth = 1;
}

Result<ResolutionResult> DependencyResolver::resolve(const std::string& projectId) {
    std::vector<graph::GraphEdge> edges;
    auto graphR = loadFileGraph(store_, projectId, &edges);
    if (!graphR)
        return graphR.error();

    auto result = analyzeDependencies(std::move(graphR).value(), options_.closureDepth);

    WriteBatch batch;
    for (const auto& key : result.graph.nodes()) {
        const auto& bounded = result.boundedClosure[key];
        batch.upsertNode(NodeLabel::File, key,
                         {{"closure", std::vector<std::string>(bounded.begin(), bounded.end())},
                          {"closure_depth", options_.closureDepth},
                          {"transitive_dependencies", result.fullClosure[key].size()}});
    }

    for (const auto& cycle : result.cycles) {
        json broken = json::array();
        for (const auto& [from, to] : cycle.brokenEdges)
            broken.push_back({{"from", from}, {"to", to}});
        spdlog::warn("Dependency cycle in {}: {}", projectId, joinKeys(cycle.members, " -> "));
        graph::addReport(batch, projectId,
                         graph::makeReport("cycle",
                                           fmt::format("Dependency cycle between {} files",
                                                       cycle.members.size()),
                                           joinKeys(cycle.members, ","),
                                           {{"members", cycle.members},
                                            {"broken_edges", std::move(broken)},
                                            {"kept_first", cycle.members.front()}}));
    }

    // Flag the dropped edges, keeping their other properties
    for (const auto& edge : edges) {
        if (result.acyclic.hasEdge(edge.from.key, edge.to.key))
            continue;
        json props = edge.properties.is_object() ? edge.properties : json::object();
        props["cycle_broken"] = true;
        batch.upsertEdge(edge.relation, edge.from, edge.to, std::move(props));
    }

    graph::addReport(batch, projectId,
                     graph::makeReport("dependency_analysis",
                                       fmt::format("{} files, {} dependency edges, {} cycles",
                                                   result.graph.nodes().size(),
                                                   result.graph.edgeCount(), result.cycles.size()),
                                       projectId,
                                       {{"files", result.graph.nodes().size()},
                                        {"edges", result.graph.edgeCount()},
                                        {"cycles", result.cycles.size()},
                                        {"closure_depth", options_.closureDepth}}));

    auto applyR = store_.apply(projectId, batch);
    if (!applyR)
        return applyR.error();

    spdlog::info("Dependency analysis of {}: {} files, {} edges, {} cycles", projectId,
                 result.graph.nodes().size(), result.graph.edgeCount(), result.cycles.size());
    return result;
}

} // namespace cartograph::analysis
