#include <cartograph/analysis/classifier.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cartograph;
using namespace cartograph::analysis;
using cartograph::tests::add_file;
using cartograph::tests::make_project;
using model::ComponentType;
using model::NodeLabel;
using model::Relation;
using ::testing::_;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

model::FileRecord file(const std::string& path, const std::string& language) {
    model::FileRecord f;
    f.path = path;
    f.language = language;
    return f;
}

bool hasSignal(const Classification& c, const std::string& signal) {
    return std::find(c.signals.begin(), c.signals.end(), signal) != c.signals.end();
}

} // namespace

TEST(ClassifyByRulesTest, LanguageGivesBaseType) {
    EXPECT_EQ(classifyByRules(file("index.html", "html"), {}).type, ComponentType::Ui);
    EXPECT_EQ(classifyByRules(file("app.yaml", "yaml"), {}).type, ComponentType::Config);
    EXPECT_EQ(classifyByRules(file("schema.sql", "sql"), {}).type, ComponentType::Data);
    EXPECT_EQ(classifyByRules(file("main.py", "python"), {}).type, ComponentType::Logic);

    auto unknown = classifyByRules(file("LICENSE", "unknown"), {});
    EXPECT_EQ(unknown.type, ComponentType::Unknown);
    EXPECT_TRUE(unknown.ambiguous);
}

TEST(ClassifyByRulesTest, PathOverridesLanguage) {
    auto c = classifyByRules(file("app/views/home.py", "python"), {});
    EXPECT_EQ(c.type, ComponentType::Ui);
    EXPECT_TRUE(hasSignal(c, "path:/view"));

    EXPECT_EQ(classifyByRules(file("Models/user.py", "python"), {}).type, ComponentType::Data);
    EXPECT_EQ(classifyByRules(file("config/loader.py", "python"), {}).type,
              ComponentType::Config);
}

TEST(ClassifyByRulesTest, DataHoldersBecomeData) {
    FileFacts facts;
    facts.classes = 2;
    facts.dataClasses = 2;
    auto c = classifyByRules(file("types.py", "python"), facts);
    EXPECT_EQ(c.type, ComponentType::Data);
    EXPECT_TRUE(hasSignal(c, "structure:data_holders"));

    facts.functions = 1;
    EXPECT_EQ(classifyByRules(file("types.py", "python"), facts).type, ComponentType::Logic);
}

TEST(ClassifyByRulesTest, ImportsNudgeLogicFiles) {
    FileFacts ui;
    ui.functions = 3;
    ui.dependencies = {"tkinter", "os"};
    auto c = classifyByRules(file("app.py", "python"), ui);
    EXPECT_EQ(c.type, ComponentType::Ui);
    EXPECT_TRUE(hasSignal(c, "import:tkinter"));

    FileFacts mixed;
    mixed.dependencies = {"PyQt5", "sqlite3"};
    auto m = classifyByRules(file("app.py", "python"), mixed);
    EXPECT_EQ(m.type, ComponentType::Logic);
    EXPECT_TRUE(m.ambiguous);

    FileFacts store;
    store.dependencies = {"sqlalchemy"};
    EXPECT_EQ(classifyByRules(file("repo.py", "python"), store).type, ComponentType::Data);
    store.functions = 2;
    EXPECT_EQ(classifyByRules(file("repo.py", "python"), store).type, ComponentType::Logic);
}

class ClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store_.ok());
        ASSERT_TRUE(store_->createProject(make_project("p1")));

        graph::WriteBatch batch;
        add_file(batch, "p1", "main.py");
        add_file(batch, "p1", "settings.json", "json");
        add_file(batch, "p1", "gui.py");
        add_file(batch, "p1", "NOTES", "unknown");
        batch.upsertNode(NodeLabel::Dependency, "dep:tkinter", {{"name", "tkinter"}});
        batch.upsertEdge(Relation::DependsOn, {NodeLabel::File, "gui.py"},
                         {NodeLabel::Dependency, "dep:tkinter"});
        ASSERT_TRUE(store_->apply("p1", batch));
    }

    model::ComponentRecord component(const std::string& path) {
        auto r = store_->getNode("p1", NodeLabel::Component, model::keys::component(path));
        if (!r || !r.value())
            return {};
        return model::ComponentRecord::fromProperties(r.value()->properties);
    }

    tests::TempStore store_;
};

TEST_F(ClassifierTest, EveryFileGetsOneComponent) {
    Classifier classifier(*store_, nullptr);
    auto stats = classifier.classify("p1");
    ASSERT_TRUE(stats) << stats.error().message;
    EXPECT_EQ(stats.value().files, 4u);
    EXPECT_EQ(stats.value().ui, 1u);
    EXPECT_EQ(stats.value().logic, 1u);
    EXPECT_EQ(stats.value().config, 1u);
    EXPECT_EQ(stats.value().unknown, 1u);

    EXPECT_EQ(component("gui.py").type, ComponentType::Ui);
    EXPECT_EQ(component("settings.json").type, ComponentType::Config);

    auto edges = store_->findEdges("p1", {.relation = Relation::ClassifiesAs});
    ASSERT_TRUE(edges);
    EXPECT_EQ(edges.value().size(), 4u);

    // Reclassification replaces rather than adds
    ASSERT_TRUE(classifier.classify("p1"));
    EXPECT_EQ(store_->countEdges("p1", Relation::ClassifiesAs).value(), 4);
    EXPECT_EQ(store_->countNodes("p1", NodeLabel::Component).value(), 4);
}

TEST_F(ClassifierTest, AmbiguousFilesConsultInference) {
    NiceMock<tests::MockInferenceClient> inference;
    EXPECT_CALL(inference, infer(Field(&extraction::InferenceRequest::path, "NOTES"), _))
        .WillOnce(Return(Result<nlohmann::json>(nlohmann::json{{"component_type", "data"}})));

    Classifier classifier(*store_, &inference);
    auto stats = classifier.classify("p1");
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().inferred, 1u);

    auto notes = component("NOTES");
    EXPECT_EQ(notes.type, ComponentType::Data);
    EXPECT_EQ(notes.provenance, model::Provenance::Inferred);
}

TEST_F(ClassifierTest, InferenceFailureKeepsRuleResult) {
    NiceMock<tests::MockInferenceClient> inference;
    Classifier classifier(*store_, &inference);
    auto stats = classifier.classify("p1");
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().inferenceFailures, 1u);
    EXPECT_EQ(component("NOTES").type, ComponentType::Unknown);

    auto feedback =
        store_->getNode("p1", NodeLabel::Feedback, model::keys::report("inference_failed",
                                                                       "classify:NOTES"));
    ASSERT_TRUE(feedback && feedback.value());
}
