#pragma once

#include <cartograph/analysis/dependency_graph.h>
#include <cartograph/core/types.h>
#include <cartograph/graph/graph_store.h>
#include <cartograph/model/entities.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cartograph::planner {

struct ScheduledComponent {
    std::string componentKey;
    std::string filePath;
    int64_t priority = 0;
    std::vector<std::string> dependsOn; // component keys scheduled earlier
    std::vector<std::string> actions;
};

struct Schedule {
    std::vector<ScheduledComponent> order;
    std::size_t brokenEdges = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Orders components for migration from an acyclic file graph.
 *
 * `components` maps file path to component key in discovery order. A component comes
 * after every component its file depends on; independent components keep discovery
 * order. Priority is the rank in the resulting order, starting at 0.
 */
Result<std::vector<ScheduledComponent>>
orderComponents(const analysis::DependencyGraph& acyclic,
                const std::vector<std::pair<std::string, std::string>>& components);

/**
 * @brief Migration plan writer.
 *
 * Rebuilds the file dependency graph, breaks cycles the same way the resolver does,
 * and writes one Strategy (`strategy:<component key>`) per Component with PLANNED_IN
 * from the Component. Best-effort mappings put `resolve feedback` first in the
 * action list.
 */
class StrategyScheduler {
public:
    explicit StrategyScheduler(graph::GraphStore& store);

    Result<Schedule> schedule(const std::string& projectId);

private:
    graph::GraphStore& store_;
};

} // namespace cartograph::planner
