#include <cartograph/pipeline/orchestrator.h>

#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

#include <mutex>

using namespace cartograph;
using namespace cartograph::pipeline;
using cartograph::tests::make_function;
using cartograph::tests::make_import;
using cartograph::tests::make_temp_dir;
using cartograph::tests::write_file;
using model::NodeLabel;

TEST(PipelineStatesTest, StageTable) {
    EXPECT_EQ(nextStatus(ProjectStatus::Uploaded), ProjectStatus::StructureAnalyzed);
    EXPECT_EQ(nextStatus(ProjectStatus::Strategized), ProjectStatus::Done);
    EXPECT_FALSE(nextStatus(ProjectStatus::Done));
    EXPECT_FALSE(nextStatus(ProjectStatus::NeedsFeedback));
    EXPECT_FALSE(nextStatus(ProjectStatus::Failed));

    EXPECT_DOUBLE_EQ(progressOf(ProjectStatus::ContentAnalyzed), 40.0);
    EXPECT_DOUBLE_EQ(progressOf(ProjectStatus::Done), 100.0);
    EXPECT_STREQ(stepName(ProjectStatus::Classified), "classification");
    EXPECT_STREQ(stepName(ProjectStatus::Failed), "failed");
}

TEST(RetryPolicyTest, ExponentialBackoffIsCapped) {
    RetryPolicy policy;
    EXPECT_EQ(policy.delayAfter(1).count(), 200);
    EXPECT_EQ(policy.delayAfter(2).count(), 400);
    EXPECT_EQ(policy.delayAfter(3).count(), 800);
    EXPECT_EQ(policy.delayAfter(10).count(), 5000);
}

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store_.ok());
        root_ = make_temp_dir("cartograph_pipeline_");
        write_file(root_ / "app" / "main.py", "MAIN");
        write_file(root_ / "app" / "helpers.py", "HELPERS");
        write_file(root_ / "settings.json", "{}");

        extraction::Skeleton main;
        main.functions.push_back(make_function("main", "None"));
        main.imports.push_back(make_import("", 1, {"helpers"}));
        parser_.add("MAIN", main);
        extraction::Skeleton helpers;
        helpers.functions.push_back(make_function("helper", "str"));
        parser_.add("HELPERS", helpers);

        options_.retry.maxAttempts = 3;
        options_.retry.initialBackoff = std::chrono::milliseconds{1};
        options_.retry.maxBackoff = std::chrono::milliseconds{2};
    }
    void TearDown() override { std::filesystem::remove_all(root_); }

    std::size_t countReports(graph::GraphStore& store, const std::string& pid,
                             const std::string& type, NodeLabel label = NodeLabel::Report) {
        auto r = store.findNodes(pid, label, {{"type", type}});
        return r ? r.value().size() : 0;
    }

    tests::TempStore store_;
    tests::FakeParser parser_;
    OrchestratorOptions options_;
    std::filesystem::path root_;
};

TEST_F(OrchestratorTest, CreateProjectValidatesRoot) {
    Orchestrator orch(*store_, parser_, nullptr, options_);
    auto missing = orch.createProject(root_ / "missing");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);

    auto created = orch.createProject(root_, "legacy", {{"types", {{"str", "text"}}}});
    ASSERT_TRUE(created) << created.error().message;
    EXPECT_EQ(created.value().status, ProjectStatus::Uploaded);
    EXPECT_EQ(created.value().extra["custom_mappings"]["types"]["str"], "text");

    auto duplicate = orch.createProject(root_, "legacy");
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, ErrorCode::ConstraintViolation);

    auto generated = orch.createProject(root_);
    ASSERT_TRUE(generated);
    EXPECT_FALSE(generated.value().id.empty());
    EXPECT_NE(generated.value().id, "legacy");
}

TEST_F(OrchestratorTest, RunsAllStagesToDone) {
    Orchestrator orch(*store_, parser_, nullptr, options_);
    std::vector<StateChange> changes;
    std::mutex mutex;
    orch.onStateChange([&](const StateChange& c) {
        std::lock_guard lock{mutex};
        changes.push_back(c);
    });

    ASSERT_TRUE(orch.createProject(root_, "p1"));
    auto done = orch.run("p1");
    ASSERT_TRUE(done) << done.error().message;
    EXPECT_EQ(done.value().status, ProjectStatus::Done);
    EXPECT_DOUBLE_EQ(done.value().progress, 100.0);

    ASSERT_EQ(changes.size(), 6u);
    EXPECT_EQ(changes.front().from, ProjectStatus::Uploaded);
    EXPECT_EQ(changes.front().to, ProjectStatus::StructureAnalyzed);
    EXPECT_EQ(changes[2].step, "classification");
    EXPECT_EQ(changes.back().to, ProjectStatus::Done);

    EXPECT_EQ(store_->countNodes("p1", NodeLabel::File).value(), 3);
    EXPECT_EQ(store_->countNodes("p1", NodeLabel::Component).value(), 3);
    EXPECT_EQ(store_->countNodes("p1", NodeLabel::Mapping).value(), 3);
    EXPECT_EQ(store_->countNodes("p1", NodeLabel::Strategy).value(), 3);
    EXPECT_EQ(store_->countEdges("p1", model::Relation::Imports).value(), 1);
    EXPECT_EQ(countReports(*store_, "p1", "pipeline_complete"), 1u);

    // Finished projects are left alone
    auto again = orch.advance("p1");
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value().status, ProjectStatus::Done);
}

TEST_F(OrchestratorTest, MistypedInferenceOutputKeepsParserData) {
    ::testing::NiceMock<tests::MockInferenceClient> inference;
    EXPECT_CALL(inference, infer(::testing::_, ::testing::_))
        .Times(::testing::AtLeast(2))
        .WillRepeatedly([](const extraction::InferenceRequest& request,
                           std::chrono::milliseconds) {
            if (request.path == "app/main.py")
                return Result<nlohmann::json>(
                    nlohmann::json{{"functions", {{{"name", "main"}, {"arguments", {"x"}}}}}});
            return Result<nlohmann::json>(nlohmann::json{{"classes", {{{"name", 5}}}}});
        });
    Orchestrator orch(*store_, parser_, &inference, options_);
    ASSERT_TRUE(orch.createProject(root_, "p1"));

    ASSERT_TRUE(orch.advance("p1"));
    auto content = orch.advance("p1");
    ASSERT_TRUE(content) << content.error().message;
    EXPECT_EQ(content.value().status, ProjectStatus::ContentAnalyzed);

    auto main = store_->getNode("p1", NodeLabel::Function,
                                model::keys::function("app/main.py", "main"));
    ASSERT_TRUE(main);
    ASSERT_TRUE(main.value().has_value());
    const auto& props = main.value()->properties;
    EXPECT_EQ(props.at("return_type"), "None");
    EXPECT_TRUE(props.value("arguments", nlohmann::json::array()).empty());
    EXPECT_EQ(store_->countNodes("p1", NodeLabel::Class).value(), 0);

    auto done = orch.run("p1");
    ASSERT_TRUE(done) << done.error().message;
    EXPECT_EQ(done.value().status, ProjectStatus::Done);
}

TEST_F(OrchestratorTest, AdvanceRunsOneStage) {
    Orchestrator orch(*store_, parser_, nullptr, options_);
    ASSERT_TRUE(orch.createProject(root_, "p1"));

    auto first = orch.advance("p1");
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value().status, ProjectStatus::StructureAnalyzed);
    EXPECT_EQ(first.value().currentStep, "structure_analysis");
    EXPECT_EQ(parser_.calls.load(), 0);

    auto second = orch.advance("p1");
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().status, ProjectStatus::ContentAnalyzed);
    EXPECT_EQ(orch.getState("p1").value().status, ProjectStatus::ContentAnalyzed);
}

TEST_F(OrchestratorTest, RetriesTransientStoreErrors) {
    tests::FlakyStore flaky(*store_);
    Orchestrator orch(flaky, parser_, nullptr, options_);
    ASSERT_TRUE(orch.createProject(root_, "p1"));

    flaky.failApplies = 2;
    auto r = orch.advance("p1");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().status, ProjectStatus::StructureAnalyzed);
    EXPECT_EQ(flaky.applyCalls.load(), 3);
}

TEST_F(OrchestratorTest, FailsAfterMaxAttemptsAndResumes) {
    tests::FlakyStore flaky(*store_);
    options_.retry.maxAttempts = 2;
    Orchestrator orch(flaky, parser_, nullptr, options_);
    ASSERT_TRUE(orch.createProject(root_, "p1"));

    flaky.failApplies = 2;
    auto failed = orch.advance("p1");
    ASSERT_TRUE(failed);
    EXPECT_EQ(failed.value().status, ProjectStatus::Failed);
    EXPECT_EQ(failed.value().extra["failed_from"], "uploaded");
    EXPECT_EQ(failed.value().currentStep, "structure_analysis");

    auto reports = store_->findNodes("p1", NodeLabel::Report, {{"type", "error"}});
    ASSERT_TRUE(reports);
    ASSERT_EQ(reports.value().size(), 1u);
    EXPECT_EQ(reports.value()[0].properties["error_kind"], "TransientStoreError");
    EXPECT_EQ(reports.value()[0].properties["details"]["attempts"], 2);

    // run() does not leave failed on its own
    EXPECT_EQ(orch.run("p1").value().status, ProjectStatus::Failed);

    auto resumed = orch.resume("p1");
    ASSERT_TRUE(resumed);
    EXPECT_EQ(resumed.value().status, ProjectStatus::Uploaded);
    EXPECT_FALSE(resumed.value().extra.contains("failed_from"));

    auto done = orch.run("p1");
    ASSERT_TRUE(done);
    EXPECT_EQ(done.value().status, ProjectStatus::Done);
}

TEST_F(OrchestratorTest, NonRetryableErrorFailsImmediately) {
    Orchestrator orch(*store_, parser_, nullptr, options_);
    ASSERT_TRUE(orch.createProject(root_, "p1"));
    std::filesystem::remove_all(root_);

    auto failed = orch.advance("p1");
    ASSERT_TRUE(failed);
    EXPECT_EQ(failed.value().status, ProjectStatus::Failed);
    EXPECT_EQ(countReports(*store_, "p1", "error"), 1u);
}

TEST_F(OrchestratorTest, UnmappableConstructsWaitForFeedback) {
    write_file(root_ / "NOTES", "free text\n");
    Orchestrator orch(*store_, parser_, nullptr, options_);
    ASSERT_TRUE(orch.createProject(root_, "p1"));

    auto waiting = orch.run("p1");
    ASSERT_TRUE(waiting) << waiting.error().message;
    EXPECT_EQ(waiting.value().status, ProjectStatus::NeedsFeedback);
    // The best-effort plan is still produced
    EXPECT_EQ(waiting.value().resumeStatus, ProjectStatus::Strategized);
    EXPECT_EQ(store_->countNodes("p1", NodeLabel::Strategy).value(), 4);
    EXPECT_EQ(countReports(*store_, "p1", "unmappable_construct", NodeLabel::Feedback), 1u);

    auto blocked = orch.advance("p1");
    ASSERT_FALSE(blocked);
    EXPECT_EQ(blocked.error().code, ErrorCode::InvalidState);

    auto acked = orch.acknowledgeFeedback("p1", "use a plain module for NOTES");
    ASSERT_TRUE(acked);
    EXPECT_EQ(acked.value().status, ProjectStatus::Strategized);
    EXPECT_EQ(countReports(*store_, "p1", "user_feedback", NodeLabel::Feedback), 1u);

    auto done = orch.run("p1");
    ASSERT_TRUE(done);
    EXPECT_EQ(done.value().status, ProjectStatus::Done);

    auto notWaiting = orch.acknowledgeFeedback("p1");
    ASSERT_FALSE(notWaiting);
    EXPECT_EQ(notWaiting.error().code, ErrorCode::InvalidState);
}

TEST_F(OrchestratorTest, CancelTakesEffectAtNextStage) {
    Orchestrator orch(*store_, parser_, nullptr, options_);
    ASSERT_TRUE(orch.createProject(root_, "p1"));
    ASSERT_TRUE(orch.advance("p1"));

    ASSERT_TRUE(orch.cancel("p1"));
    auto cancelled = orch.advance("p1");
    ASSERT_TRUE(cancelled);
    EXPECT_EQ(cancelled.value().status, ProjectStatus::Failed);
    EXPECT_EQ(cancelled.value().extra["failed_from"], "structure_analyzed");
    EXPECT_EQ(countReports(*store_, "p1", "cancelled"), 1u);

    auto finished = orch.cancel("p1");
    ASSERT_FALSE(finished);
    EXPECT_EQ(finished.error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(orch.resume("p1"));
    auto done = orch.run("p1");
    ASSERT_TRUE(done);
    EXPECT_EQ(done.value().status, ProjectStatus::Done);
}

TEST_F(OrchestratorTest, SubmitDrivesProjectsConcurrently) {
    auto other = make_temp_dir("cartograph_pipeline_other_");
    write_file(other / "tool.py", "TOOL");

    Orchestrator orch(*store_, parser_, nullptr, options_);
    ASSERT_TRUE(orch.createProject(root_, "p1"));
    ASSERT_TRUE(orch.createProject(other, "p2"));

    auto f1 = orch.submit("p1");
    auto f2 = orch.submit("p2");
    auto r1 = f1.get();
    auto r2 = f2.get();
    ASSERT_TRUE(r1) << r1.error().message;
    ASSERT_TRUE(r2) << r2.error().message;
    EXPECT_EQ(r1.value().status, ProjectStatus::Done);
    EXPECT_EQ(r2.value().status, ProjectStatus::Done);
    EXPECT_EQ(store_->countNodes("p2", NodeLabel::File).value(), 1);

    std::filesystem::remove_all(other);
}

TEST_F(OrchestratorTest, UnknownProjectIsNotFound) {
    Orchestrator orch(*store_, parser_, nullptr, options_);
    auto r = orch.advance("nope");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}
