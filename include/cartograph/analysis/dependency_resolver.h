#pragma once

#include <cartograph/analysis/dependency_graph.h>
#include <cartograph/core/types.h>
#include <cartograph/graph/graph_store.h>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace cartograph::analysis {

struct ResolverOptions {
    int closureDepth = 3;
};

struct CycleInfo {
    std::vector<std::string> members; // sorted
    std::vector<DependencyGraph::Edge> brokenEdges;
};

struct ResolutionResult {
    DependencyGraph graph;
    DependencyGraph acyclic;
    std::map<std::string, std::set<std::string>> boundedClosure;
    // Computed over `acyclic`
    std::map<std::string, std::set<std::string>> fullClosure;
    std::vector<CycleInfo> cycles;
};

/**
 * @brief File dependency graph of a project from its IMPORTS and REFERENCES edges.
 *
 * Every File node is present, in store insertion order, even without edges. When
 * `edges` is given it receives the File-to-File edges that were read.
 */
Result<DependencyGraph> loadFileGraph(graph::GraphStore& store, const std::string& projectId,
                                      std::vector<graph::GraphEdge>* edges = nullptr);

/// Closures and cycles of `graph`; pure computation.
ResolutionResult analyzeDependencies(DependencyGraph graph, int closureDepth);

/**
 * @brief Closure and cycle pass over a completed extraction.
 *
 * Writes the bounded closure (`closure`, `closure_depth`) and the full closure size
 * (`transitive_dependencies`) onto each File node, one `cycle` Report per detected
 * cycle keyed by its members, and `cycle_broken: true` on the edges dropped to break
 * them. All writes land in one batch.
 */
class DependencyResolver {
public:
    explicit DependencyResolver(graph::GraphStore& store, ResolverOptions options = {});

    Result<ResolutionResult> resolve(const std::string& projectId);

private:
    graph::GraphStore& store_;
    ResolverOptions options_;
};

} // namespace cartograph::analysis
