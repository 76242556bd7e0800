#include <cartograph/core/uuid.h>
#include <cartograph/graph/report_writer.h>

namespace cartograph::graph {

model::ReportRecord makeReport(std::string type, std::string issue,
                               std::optional<std::string_view> subject, nlohmann::json details,
                               std::optional<ErrorCode> error) {
    model::ReportRecord r;
    r.id = subject ? model::keys::report(type, *subject) : core::generateUUID();
    r.type = std::move(type);
    r.issue = std::move(issue);
    r.details = std::move(details);
    if (error)
        r.errorKind = errorKindName(*error);
    r.createdAt = core::isoNow();
    r.lastSeen = r.createdAt;
    return r;
}

void addReport(WriteBatch& batch, const std::string& projectId, const model::ReportRecord& report) {
    batch.upsertNode(NodeLabel::Report, report.id, report.toProperties());
    batch.upsertEdge(Relation::ReportedIn, {NodeLabel::Project, projectId},
                     {NodeLabel::Report, report.id});
}

void addFeedback(WriteBatch& batch, const std::string& projectId,
                 const model::ReportRecord& feedback) {
    batch.upsertNode(NodeLabel::Feedback, feedback.id, feedback.toProperties());
    batch.upsertEdge(Relation::FeedbackFor, {NodeLabel::Project, projectId},
                     {NodeLabel::Feedback, feedback.id});
}

Result<void> writeReport(GraphStore& store, const std::string& projectId,
                         const model::ReportRecord& report) {
    WriteBatch batch;
    addReport(batch, projectId, report);
    return store.apply(projectId, batch);
}

} // namespace cartograph::graph
