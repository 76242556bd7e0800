#pragma once

#include <cartograph/core/types.h>
#include <cartograph/graph/graph_store.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cartograph::graph {

/// Restricts an export to some node labels and relation kinds; empty means all.
struct ExportFilter {
    std::vector<NodeLabel> labels;
    std::vector<Relation> relations;
};

/**
 * @brief Dump a project subgraph as
 * `{project, nodes:[{label,key,properties}], edges:[{relation,from,to,properties}]}`.
 *
 * Edges are included only when both endpoints pass the label filter. Property bags
 * are emitted verbatim so unknown properties survive a re-import.
 */
Result<nlohmann::json> exportJson(GraphStore& store, const std::string& projectId,
                                  const ExportFilter& filter = {});

/// Write `nodes.csv` and `edges.csv` into `dir`; the property column holds JSON.
Result<void> exportCsv(GraphStore& store, const std::string& projectId,
                       const std::filesystem::path& dir, const ExportFilter& filter = {});

/**
 * @brief Restore a document produced by exportJson.
 *
 * The target project id defaults to the document's `project` field. A missing
 * project is created from the document's Project node. Returns the project id.
 */
Result<std::string> importJson(GraphStore& store, const nlohmann::json& doc,
                               const std::optional<std::string>& projectId = std::nullopt);

} // namespace cartograph::graph
