#include <cartograph/analysis/dependency_resolver.h>
#include <cartograph/graph/report_writer.h>
#include <cartograph/planner/strategy_scheduler.h>

#include <spdlog/spdlog.h>

#include <set>
#include <unordered_map>

namespace cartograph::planner {

using graph::WriteBatch;
using model::NodeLabel;
using model::Relation;
using nlohmann::json;

json Schedule::toJson() const {
    json items = json::array();
    for (const auto& item : order) {
        items.push_back({{"component", item.componentKey},
                         {"path", item.filePath},
                         {"priority", item.priority}});
    }
    return {{"order", std::move(items)}, {"broken_edges", brokenEdges}};
}

Result<std::vector<ScheduledComponent>>
orderComponents(const analysis::DependencyGraph& acyclic,
                const std::vector<std::pair<std::string, std::string>>& components) {
    // Component graph in discovery order; edges follow the files
    analysis::DependencyGraph componentGraph;
    std::unordered_map<std::string, std::string> byFile;
    for (const auto& [path, key] : components) {
        componentGraph.addNode(key);
        byFile[path] = key;
    }
    for (const auto& [from, to] : acyclic.edges()) {
        auto f = byFile.find(from);
        auto t = byFile.find(to);
        if (f == byFile.end() || t == byFile.end() || f->second == t->second)
            continue;
        componentGraph.addEdge(f->second, t->second);
    }

    auto orderR = componentGraph.dependencyOrder();
    if (!orderR)
        return orderR.error();

    std::unordered_map<std::string, std::string> fileOf;
    for (const auto& [path, key] : components)
        fileOf[key] = path;

    std::vector<ScheduledComponent> scheduled;
    int64_t rank = 0;
    for (const auto& key : orderR.value()) {
        ScheduledComponent item;
        item.componentKey = key;
        item.filePath = fileOf[key];
        item.priority = rank++;
        item.dependsOn = componentGraph.successors(key);
        scheduled.push_back(std::move(item));
    }
    return scheduled;
}

StrategyScheduler::StrategyScheduler(graph::GraphStore& store) : store_(store) {}

Result<Schedule> StrategyScheduler::schedule(const std::string& projectId) {
    auto graphR = analysis::loadFileGraph(store_, projectId);
    if (!graphR)
        return graphR.error();
    std::vector<analysis::DependencyGraph::Edge> removed;
    auto acyclic = graphR.value().withoutCycles(&removed);

    auto componentsR = store_.findNodes(projectId, NodeLabel::Component);
    if (!componentsR)
        return componentsR.error();

    // Discovery order: file order of the dependency graph, then any stragglers
    std::unordered_map<std::string, std::string> componentOfFile;
    for (const auto& node : componentsR.value())
        componentOfFile[model::ComponentRecord::fromProperties(node.properties).filePath] =
            node.key;
    std::vector<std::pair<std::string, std::string>> components;
    std::set<std::string> seen;
    for (const auto& path : acyclic.nodes()) {
        if (auto it = componentOfFile.find(path); it != componentOfFile.end()) {
            components.emplace_back(path, it->second);
            seen.insert(it->second);
        }
    }
    for (const auto& node : componentsR.value()) {
        if (!seen.count(node.key))
            components.emplace_back(model::ComponentRecord::fromProperties(node.properties).filePath,
                                    node.key);
    }

    auto orderR = orderComponents(acyclic, components);
    if (!orderR)
        return orderR.error();

    auto mappingsR = store_.findNodes(projectId, NodeLabel::Mapping);
    if (!mappingsR)
        return mappingsR.error();
    std::unordered_map<std::string, model::MappingRecord> mappingOf;
    for (const auto& node : mappingsR.value()) {
        auto m = model::MappingRecord::fromProperties(node.properties);
        mappingOf[m.sourceKey] = std::move(m);
    }

    Schedule plan;
    plan.brokenEdges = removed.size();
    plan.order = std::move(orderR).value();

    WriteBatch batch;
    for (auto& item : plan.order) {
        auto mapping = mappingOf.find(item.componentKey);
        if (mapping != mappingOf.end() && mapping->second.bestEffort)
            item.actions.push_back("resolve feedback");
        item.actions.push_back("migrate " + item.filePath);
        if (mapping != mappingOf.end()) {
            if (!mapping->second.targetKey.empty())
                item.actions.push_back("generate " + mapping->second.targetKey);
            if (!mapping->second.dataTypeMapping.empty())
                item.actions.push_back("map types");
        }
        item.actions.push_back("verify");

        model::StrategyRecord strategy;
        strategy.componentKey = item.componentKey;
        strategy.priority = item.priority;
        strategy.actions = item.actions;
        auto props = strategy.toProperties();
        props["path"] = item.filePath;
        props["depends_on"] = item.dependsOn;

        const auto strategyKey = model::keys::strategy(item.componentKey);
        batch.upsertNode(NodeLabel::Strategy, strategyKey, std::move(props));
        batch.upsertEdge(Relation::PlannedIn, {NodeLabel::Component, item.componentKey},
                         {NodeLabel::Strategy, strategyKey});
    }

    graph::addReport(batch, projectId,
                     graph::makeReport("strategy",
                                       fmt::format("Scheduled {} components", plan.order.size()),
                                       projectId, plan.toJson()));
    auto applyR = store_.apply(projectId, batch);
    if (!applyR)
        return applyR.error();

    spdlog::info("Strategy for {}: {} components scheduled, {} cycle edges ignored", projectId,
                 plan.order.size(), plan.brokenEdges);
    return plan;
}

} // namespace cartograph::planner
