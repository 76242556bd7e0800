#include <cartograph/analysis/classifier.h>
#include <cartograph/core/uuid.h>
#include <cartograph/graph/report_writer.h>
#include <cartograph/pipeline/orchestrator.h>
#include <cartograph/planner/mapping_generator.h>
#include <cartograph/planner/strategy_scheduler.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <memory>
#include <thread>
#include <utility>

namespace cartograph::pipeline {

using model::ProjectRecord;
using nlohmann::json;

namespace {

struct StageInfo {
    ProjectStatus status;
    double progress;
    const char* step;
};

constexpr std::array<StageInfo, 7> kStages{{
    {ProjectStatus::Uploaded, 0.0, "upload"},
    {ProjectStatus::StructureAnalyzed, 20.0, "structure_analysis"},
    {ProjectStatus::ContentAnalyzed, 40.0, "content_analysis"},
    {ProjectStatus::Classified, 60.0, "classification"},
    {ProjectStatus::Mapped, 80.0, "mapping"},
    {ProjectStatus::Strategized, 90.0, "strategy"},
    {ProjectStatus::Done, 100.0, "complete"},
}};

const StageInfo* stageInfo(ProjectStatus status) {
    for (const auto& info : kStages) {
        if (info.status == status)
            return &info;
    }
    return nullptr;
}

} // namespace

std::chrono::milliseconds RetryPolicy::delayAfter(int attempt) const {
    auto delay = initialBackoff;
    for (int i = 1; i < attempt && delay < maxBackoff; ++i)
        delay *= 2;
    return std::min(delay, maxBackoff);
}

OrchestratorOptions OrchestratorOptions::fromConfig(const config::Config& cfg) {
    OrchestratorOptions options;
    options.retry.maxAttempts = std::max(1, cfg.pipeline.maxAttempts);
    options.retry.initialBackoff = cfg.pipeline.backoffInitial;
    options.retry.maxBackoff = cfg.pipeline.backoffMax;
    options.extraction.workers = cfg.effectiveWorkers();
    options.extraction.maxFileSize = cfg.extraction.maxFileSize;
    options.extraction.skipHidden = cfg.extraction.skipHidden;
    options.extraction.inferenceTimeout = cfg.inference.timeout;
    options.resolver.closureDepth = cfg.resolver.closureDepth;
    options.inferenceTimeout = cfg.inference.timeout;
    return options;
}

std::optional<ProjectStatus> nextStatus(ProjectStatus status) {
    for (std::size_t i = 0; i + 1 < kStages.size(); ++i) {
        if (kStages[i].status == status)
            return kStages[i + 1].status;
    }
    return std::nullopt;
}

double progressOf(ProjectStatus status) {
    const auto* info = stageInfo(status);
    return info ? info->progress : 0.0;
}

const char* stepName(ProjectStatus status) {
    if (const auto* info = stageInfo(status))
        return info->step;
    return status == ProjectStatus::Failed ? "failed" : "awaiting_feedback";
}

Orchestrator::Orchestrator(graph::GraphStore& store, extraction::SyntaxParser& parser,
                           extraction::InferenceClient* inference, OrchestratorOptions options)
    : store_(store), parser_(parser), inference_(inference), options_(std::move(options)),
      pool_(std::max<std::size_t>(1, options_.projectWorkers)) {
    if (options_.retry.maxAttempts < 1)
        options_.retry.maxAttempts = 1;
}

Orchestrator::~Orchestrator() {
    pool_.join();
}

Result<ProjectRecord> Orchestrator::createProject(const std::filesystem::path& root,
                                                  std::optional<std::string> projectId,
                                                  json customMappings) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec))
        return Error{ErrorCode::FileNotFound, "Project root is not a directory: " + root.string()};

    ProjectRecord project;
    project.id = projectId.value_or(core::generateProjectId());
    project.rootPath = std::filesystem::weakly_canonical(root, ec).string();
    if (ec)
        project.rootPath = std::filesystem::absolute(root).string();
    project.storagePath = project.rootPath;
    project.status = ProjectStatus::Uploaded;
    project.currentStep = stepName(ProjectStatus::Uploaded);
    if (customMappings.is_object() && !customMappings.empty())
        project.extra["custom_mappings"] = std::move(customMappings);

    auto createR = store_.createProject(project);
    if (!createR)
        return createR.error();
    spdlog::info("Registered project {} at {}", project.id, project.rootPath);
    return createR;
}

Result<ProjectRecord> Orchestrator::getState(const std::string& projectId) {
    return store_.getProject(projectId);
}

Result<ProjectRecord> Orchestrator::advance(const std::string& projectId) {
    if (!beginRun(projectId))
        return Error{ErrorCode::InvalidState,
                     fmt::format("Project {} is already running a stage", projectId)};
    struct RunGuard {
        Orchestrator* self;
        const std::string& id;
        ~RunGuard() { self->endRun(id); }
    } guard{this, projectId};

    auto projectR = store_.getProject(projectId);
    if (!projectR)
        return projectR.error();
    ProjectRecord project = std::move(projectR).value();

    if (project.status == ProjectStatus::Done || project.status == ProjectStatus::Failed)
        return project;

    if (takeCancellation(projectId)) {
        spdlog::info("Project {} cancelled at {}", projectId, model::toString(project.status));
        const std::string step = project.currentStep;
        return fail(std::move(project), Error{ErrorCode::OperationCancelled, "Cancelled by request"},
                    step, 0);
    }

    const bool awaitingFeedback = project.status == ProjectStatus::NeedsFeedback;
    const ProjectStatus from =
        awaitingFeedback ? project.resumeStatus.value_or(ProjectStatus::Mapped) : project.status;
    auto target = nextStatus(from);
    if (!target)
        return Error{ErrorCode::InvalidState,
                     fmt::format("No stage follows {}", model::toString(from))};
    if (awaitingFeedback && *target == ProjectStatus::Done)
        return Error{ErrorCode::InvalidState,
                     fmt::format("Project {} is awaiting feedback", projectId)};

    spdlog::info("Project {}: running {}", projectId, stepName(*target));
    int attempts = 0;
    auto outcomeR = runWithRetry(project, *target, attempts);
    if (!outcomeR)
        return fail(std::move(project), outcomeR.error(), stepName(*target), attempts);

    if (awaitingFeedback || outcomeR.value().needsFeedback) {
        project.resumeStatus = *target;
        return commit(std::move(project), ProjectStatus::NeedsFeedback);
    }
    return commit(std::move(project), *target);
}

Result<ProjectRecord> Orchestrator::run(const std::string& projectId) {
    while (true) {
        auto stateR = store_.getProject(projectId);
        if (!stateR)
            return stateR.error();
        const auto& state = stateR.value();
        if (state.status == ProjectStatus::Done || state.status == ProjectStatus::Failed)
            return stateR;
        if (state.status == ProjectStatus::NeedsFeedback) {
            auto next = nextStatus(state.resumeStatus.value_or(ProjectStatus::Mapped));
            if (!next || *next == ProjectStatus::Done) {
                spdlog::info("Project {} waits for feedback", projectId);
                return stateR;
            }
        }

        auto advanceR = advance(projectId);
        if (!advanceR)
            return advanceR.error();
    }
}

std::future<Result<ProjectRecord>> Orchestrator::submit(const std::string& projectId) {
    auto promise = std::make_shared<std::promise<Result<ProjectRecord>>>();
    auto future = promise->get_future();
    boost::asio::post(pool_, [this, projectId, promise] {
        try {
            promise->set_value(run(projectId));
        } catch (const std::exception& e) {
            spdlog::error("Pipeline for {} threw: {}", projectId, e.what());
            promise->set_value(Error{ErrorCode::InternalError, e.what()});
        }
    });
    return future;
}

Result<void> Orchestrator::cancel(const std::string& projectId) {
    auto projectR = store_.getProject(projectId);
    if (!projectR)
        return projectR.error();
    const auto status = projectR.value().status;
    if (status == ProjectStatus::Done || status == ProjectStatus::Failed)
        return Error{ErrorCode::InvalidState,
                     fmt::format("Project {} already finished as {}", projectId,
                                 model::toString(status))};
    std::lock_guard lock{stateMutex_};
    cancelled_.insert(projectId);
    spdlog::info("Cancellation requested for {}", projectId);
    return {};
}

Result<ProjectRecord> Orchestrator::acknowledgeFeedback(const std::string& projectId,
                                                        std::optional<std::string> message) {
    auto projectR = store_.getProject(projectId);
    if (!projectR)
        return projectR.error();
    ProjectRecord project = std::move(projectR).value();
    if (project.status != ProjectStatus::NeedsFeedback)
        return Error{ErrorCode::InvalidState,
                     fmt::format("Project {} is {}, not awaiting feedback", projectId,
                                 model::toString(project.status))};

    if (message) {
        graph::WriteBatch batch;
        graph::addFeedback(batch, projectId,
                           graph::makeReport("user_feedback", *message, std::nullopt,
                                             {{"resume_status",
                                               model::toString(project.resumeStatus.value_or(
                                                   ProjectStatus::Mapped))}}));
        auto applyR = store_.apply(projectId, batch);
        if (!applyR)
            return applyR.error();
    }

    const ProjectStatus to = project.resumeStatus.value_or(ProjectStatus::Mapped);
    return commit(std::move(project), to);
}

Result<ProjectRecord> Orchestrator::resume(const std::string& projectId) {
    auto projectR = store_.getProject(projectId);
    if (!projectR)
        return projectR.error();
    ProjectRecord project = std::move(projectR).value();
    if (project.status != ProjectStatus::Failed)
        return Error{ErrorCode::InvalidState,
                     fmt::format("Project {} is {}, not failed", projectId,
                                 model::toString(project.status))};

    auto failedFrom = model::property<std::string>(project.extra, "failed_from", "");
    auto to = model::parseProjectStatus(failedFrom).value_or(ProjectStatus::Uploaded);
    project.extra.erase("failed_from");
    {
        std::lock_guard lock{stateMutex_};
        cancelled_.erase(projectId);
    }
    return commit(std::move(project), to);
}

void Orchestrator::onStateChange(StateCallback callback) {
    std::lock_guard lock{callbackMutex_};
    callbacks_.push_back(std::move(callback));
}

Result<Orchestrator::StageOutcome> Orchestrator::runStage(const ProjectRecord& project,
                                                          ProjectStatus target) {
    const std::string& pid = project.id;
    switch (target) {
        case ProjectStatus::StructureAnalyzed: {
            extraction::ExtractionEngine engine{store_, parser_, inference_, options_.extraction};
            auto r = engine.scanStructure(pid, project.rootPath);
            if (!r)
                return r.error();
            return StageOutcome{};
        }
        case ProjectStatus::ContentAnalyzed: {
            extraction::ExtractionEngine engine{store_, parser_, inference_, options_.extraction};
            auto r = engine.extractContent(pid);
            if (!r)
                return r.error();
            return StageOutcome{};
        }
        case ProjectStatus::Classified: {
            analysis::DependencyResolver resolver{store_, options_.resolver};
            auto resolveR = resolver.resolve(pid);
            if (!resolveR)
                return resolveR.error();
            analysis::Classifier classifier{store_, inference_, options_.inferenceTimeout};
            auto classifyR = classifier.classify(pid);
            if (!classifyR)
                return classifyR.error();
            return StageOutcome{};
        }
        case ProjectStatus::Mapped: {
            planner::MappingGenerator generator{store_, inference_, options_.inferenceTimeout};
            auto r = generator.generate(pid);
            if (!r)
                return r.error();
            return StageOutcome{r.value().unmapped > 0};
        }
        case ProjectStatus::Strategized: {
            planner::StrategyScheduler scheduler{store_};
            auto r = scheduler.schedule(pid);
            if (!r)
                return r.error();
            return StageOutcome{};
        }
        case ProjectStatus::Done: {
            auto r = graph::writeReport(
                store_, pid,
                graph::makeReport("pipeline_complete", "Migration plan complete", pid,
                                  {{"root_path", project.rootPath}}));
            if (!r)
                return r.error();
            return StageOutcome{};
        }
        default:
            return Error{ErrorCode::InvalidState,
                         fmt::format("No stage produces {}", model::toString(target))};
    }
}

Result<Orchestrator::StageOutcome> Orchestrator::runWithRetry(const ProjectRecord& project,
                                                              ProjectStatus target, int& attempts) {
    for (attempts = 1;; ++attempts) {
        auto r = runStage(project, target);
        if (r)
            return r;
        const Error& error = r.error();
        if (!isRetryable(error.code) || attempts >= options_.retry.maxAttempts) {
            if (isRetryable(error.code))
                spdlog::error("Project {}: {} failed after {} attempts: {}", project.id,
                              stepName(target), attempts, error.message);
            return error;
        }

        auto delay = options_.retry.delayAfter(attempts);
        spdlog::warn("Project {}: {} attempt {} failed ({}); retrying in {}ms", project.id,
                     stepName(target), attempts, error.message, delay.count());
        std::this_thread::sleep_for(delay);
        if (cancellationRequested(project.id))
            return Error{ErrorCode::OperationCancelled, "Cancelled while retrying"};
    }
}

Result<ProjectRecord> Orchestrator::commit(ProjectRecord project, ProjectStatus to) {
    const ProjectStatus from = project.status;
    project.status = to;
    if (to != ProjectStatus::NeedsFeedback && to != ProjectStatus::Failed)
        project.resumeStatus.reset();
    const ProjectStatus reached =
        to == ProjectStatus::NeedsFeedback ? project.resumeStatus.value_or(from) : to;
    if (to != ProjectStatus::Failed) {
        project.progress = progressOf(reached);
        project.currentStep = to == ProjectStatus::NeedsFeedback ? stepName(to) : stepName(reached);
    }
    project.updatedAt = core::isoNow();

    for (int attempt = 1;; ++attempt) {
        auto updateR = store_.updateProject(project);
        if (updateR)
            break;
        if (!isRetryable(updateR.error().code) || attempt >= options_.retry.maxAttempts) {
            spdlog::error("Project {}: could not commit {}: {}", project.id,
                          model::toString(to), updateR.error().message);
            return updateR.error();
        }
        std::this_thread::sleep_for(options_.retry.delayAfter(attempt));
    }

    spdlog::info("Project {}: {} -> {} ({}%)", project.id, model::toString(from),
                 model::toString(to), project.progress);
    notify(StateChange{project.id, from, to, project.progress, project.currentStep});
    return project;
}

Result<ProjectRecord> Orchestrator::fail(ProjectRecord project, const Error& error,
                                         const std::string& step, int attempts) {
    const bool cancelled = error.code == ErrorCode::OperationCancelled;
    auto report = graph::makeReport(cancelled ? "cancelled" : "error", error.message, std::nullopt,
                                    {{"stage", step},
                                     {"attempts", attempts},
                                     {"error_code", errorToString(error.code)},
                                     {"status", model::toString(project.status)}},
                                    error.code);
    if (auto reportR = graph::writeReport(store_, project.id, report); !reportR) {
        spdlog::error("Project {}: failure report not stored: {}", project.id,
                      reportR.error().message);
    }

    if (!cancelled)
        spdlog::error("Project {} failed in {}: {} ({})", project.id, step, error.message,
                      errorKindName(error.code));
    project.extra["failed_from"] = model::toString(project.status);
    project.currentStep = step;
    return commit(std::move(project), ProjectStatus::Failed);
}

void Orchestrator::notify(const StateChange& change) {
    std::vector<StateCallback> callbacks;
    {
        std::lock_guard lock{callbackMutex_};
        callbacks = callbacks_;
    }
    for (const auto& cb : callbacks) {
        try {
            cb(change);
        } catch (const std::exception& e) {
            spdlog::warn("State change callback threw: {}", e.what());
        }
    }
}

bool Orchestrator::cancellationRequested(const std::string& projectId) {
    std::lock_guard lock{stateMutex_};
    return cancelled_.count(projectId) != 0;
}

bool Orchestrator::takeCancellation(const std::string& projectId) {
    std::lock_guard lock{stateMutex_};
    return cancelled_.erase(projectId) != 0;
}

bool Orchestrator::beginRun(const std::string& projectId) {
    std::lock_guard lock{stateMutex_};
    return running_.insert(projectId).second;
}

void Orchestrator::endRun(const std::string& projectId) {
    std::lock_guard lock{stateMutex_};
    running_.erase(projectId);
}

} // namespace cartograph::pipeline
