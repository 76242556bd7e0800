#pragma once

#include <cartograph/core/types.h>
#include <cartograph/graph/graph_store.h>
#include <cartograph/model/entities.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace cartograph::graph {

/**
 * @brief Build a Report/Feedback record.
 *
 * With a `subject` the id is the deterministic `report:<type>:<subject>` key, so
 * re-running the stage that raised it updates the record in place. Without one a
 * fresh UUID is used.
 */
model::ReportRecord makeReport(std::string type, std::string issue,
                               std::optional<std::string_view> subject = std::nullopt,
                               nlohmann::json details = nlohmann::json::object(),
                               std::optional<ErrorCode> error = std::nullopt);

/// Queue a Report node plus its REPORTED_IN edge from the project.
void addReport(WriteBatch& batch, const std::string& projectId, const model::ReportRecord& report);

/// Queue a Feedback node plus its FEEDBACK_FOR edge from the project.
void addFeedback(WriteBatch& batch, const std::string& projectId,
                 const model::ReportRecord& feedback);

/// Write a single Report immediately.
Result<void> writeReport(GraphStore& store, const std::string& projectId,
                         const model::ReportRecord& report);

} // namespace cartograph::graph
