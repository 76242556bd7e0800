#pragma once

#include <cartograph/analysis/dependency_resolver.h>
#include <cartograph/config/config.h>
#include <cartograph/core/types.h>
#include <cartograph/extraction/extraction_engine.h>
#include <cartograph/extraction/inference_client.h>
#include <cartograph/extraction/syntax_parser.h>
#include <cartograph/graph/graph_store.h>
#include <cartograph/model/entities.h>

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cartograph::pipeline {

using model::ProjectStatus;

/// Exponential backoff for retryable stage failures.
struct RetryPolicy {
    int maxAttempts = 4;
    std::chrono::milliseconds initialBackoff{200};
    std::chrono::milliseconds maxBackoff{5000};

    /// Delay before attempt `attempt + 1` (attempt counts from 1).
    std::chrono::milliseconds delayAfter(int attempt) const;
};

struct OrchestratorOptions {
    RetryPolicy retry;
    extraction::ExtractionOptions extraction;
    analysis::ResolverOptions resolver;
    std::chrono::milliseconds inferenceTimeout{60000};
    // Projects driven concurrently by submit()
    std::size_t projectWorkers = 2;

    static OrchestratorOptions fromConfig(const config::Config& cfg);
};

struct StateChange {
    std::string projectId;
    ProjectStatus from;
    ProjectStatus to;
    double progress = 0.0;
    std::string step;
};

/// Stage that leaves `status`, or nullopt for terminal and feedback states.
std::optional<ProjectStatus> nextStatus(ProjectStatus status);

/// Progress percentage recorded once `status` is committed.
double progressOf(ProjectStatus status);

/// Name of the stage that produces `status` (e.g. `content_analysis`).
const char* stepName(ProjectStatus status);

/**
 * @brief Per-project pipeline state machine.
 *
 * uploaded -> structure_analyzed -> content_analyzed -> classified -> mapped ->
 * strategized -> done. Each advance() runs one stage and commits the new status to the
 * Project node only after the stage's writes succeeded, so re-running an interrupted
 * stage is safe.
 *
 * Retryable errors (store unavailable, inference timeout) are retried with
 * exponential backoff; after the last attempt, or on any other error, the project
 * moves to failed with an `error` Report. Mapping that leaves unmappable constructs
 * moves the project to needs_feedback; advance() keeps working from there with the
 * best-effort plan and stops before done until acknowledgeFeedback().
 *
 * Different projects may be driven concurrently; one project runs at most one stage
 * at a time.
 */
class Orchestrator {
public:
    using StateCallback = std::function<void(const StateChange&)>;

    Orchestrator(graph::GraphStore& store, extraction::SyntaxParser& parser,
                 extraction::InferenceClient* inference, OrchestratorOptions options = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Register a project rooted at an existing directory.
     * @param customMappings stored as `custom_mappings`, see planner::CustomMappings
     */
    Result<model::ProjectRecord>
    createProject(const std::filesystem::path& root, std::optional<std::string> projectId = {},
                  nlohmann::json customMappings = nlohmann::json::object());

    Result<model::ProjectRecord> getState(const std::string& projectId);

    /// Run exactly one stage. A project in done or failed is returned unchanged.
    Result<model::ProjectRecord> advance(const std::string& projectId);

    /// Advance until done, failed, or needs_feedback with nothing left to run.
    Result<model::ProjectRecord> run(const std::string& projectId);

    /// run() on the shared project pool.
    std::future<Result<model::ProjectRecord>> submit(const std::string& projectId);

    /// Request cancellation; takes effect at the next stage boundary.
    Result<void> cancel(const std::string& projectId);

    /**
     * @brief Leave needs_feedback for the state the project branched from.
     *
     * Records a Feedback node carrying `message` when given.
     */
    Result<model::ProjectRecord> acknowledgeFeedback(const std::string& projectId,
                                                     std::optional<std::string> message = {});

    /// Move a failed project back to its last committed state so it can be re-run.
    Result<model::ProjectRecord> resume(const std::string& projectId);

    void onStateChange(StateCallback callback);

private:
    struct StageOutcome {
        bool needsFeedback = false;
    };

    Result<StageOutcome> runStage(const model::ProjectRecord& project, ProjectStatus target);
    Result<StageOutcome> runWithRetry(const model::ProjectRecord& project, ProjectStatus target,
                                      int& attempts);
    Result<model::ProjectRecord> commit(model::ProjectRecord project, ProjectStatus to);
    Result<model::ProjectRecord> fail(model::ProjectRecord project, const Error& error,
                                      const std::string& step, int attempts);
    void notify(const StateChange& change);

    bool cancellationRequested(const std::string& projectId);
    bool takeCancellation(const std::string& projectId);
    bool beginRun(const std::string& projectId);
    void endRun(const std::string& projectId);

    graph::GraphStore& store_;
    extraction::SyntaxParser& parser_;
    extraction::InferenceClient* inference_;
    OrchestratorOptions options_;

    std::mutex stateMutex_;
    std::set<std::string> cancelled_;
    std::set<std::string> running_;

    std::mutex callbackMutex_;
    std::vector<StateCallback> callbacks_;

    boost::asio::thread_pool pool_;
};

} // namespace cartograph::pipeline
