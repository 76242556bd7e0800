#include <cartograph/planner/mapping_generator.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cartograph;
using namespace cartograph::planner;
using cartograph::tests::add_file;
using cartograph::tests::make_project;
using model::ComponentType;
using model::NodeLabel;
using model::Relation;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

TEST(MapDataTypeTest, BuiltinsAndGenerics) {
    EXPECT_EQ(mapDataType("str"), "string");
    EXPECT_EQ(mapDataType(" None "), "void");
    EXPECT_EQ(mapDataType("List[int]"), "array");
    EXPECT_EQ(mapDataType("typing.Dict[str, int]"), "map");
    EXPECT_EQ(mapDataType("Optional[str]"), "string");
    EXPECT_EQ(mapDataType("Union[int, str]"), "object");
    EXPECT_EQ(mapDataType(""), "object");
    EXPECT_EQ(mapDataType("UserModel"), "UserModel");
}

TEST(TargetRulesTest, RulesByTypeAndLanguage) {
    EXPECT_EQ(ruleTarget(ComponentType::Logic, "python")->key(), "target:service@1.0");
    EXPECT_EQ(ruleTarget(ComponentType::Logic, "shell")->key(), "target:script@1.0");
    EXPECT_EQ(ruleTarget(ComponentType::Ui, "html")->name, "view");
    EXPECT_FALSE(ruleTarget(ComponentType::Unknown, "python"));

    EXPECT_EQ(legacyClassTarget("singleton")->name, "provider");
    EXPECT_EQ(legacyClassTarget("interface")->name, "interface");
    EXPECT_FALSE(legacyClassTarget("regular"));
}

TEST(CustomMappingsTest, IgnoresMalformedSections) {
    auto m = CustomMappings::fromJson(
        {{"components", {{"ui", "page@2"}, {"bad", 3}}}, {"types", "nope"}});
    EXPECT_EQ(m.components.size(), 1u);
    EXPECT_TRUE(m.types.empty());
    EXPECT_TRUE(CustomMappings::fromJson(nullptr).empty());
}

class MappingGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store_.ok());
        auto project = make_project("p1");
        project.extra["custom_mappings"] = {{"components", {{"ui/page.html", "react-page@18"}}},
                                            {"types", {{"str", "text"}}}};
        ASSERT_TRUE(store_->createProject(project));

        graph::WriteBatch batch;
        addComponent(batch, "services/core.py", "python", ComponentType::Logic);
        addComponent(batch, "ui/page.html", "html", ComponentType::Ui);
        addComponent(batch, "NOTES", "unknown", ComponentType::Unknown);

        auto run = tests::make_function("run", "List[int]");
        run.arguments = {{"name", "str"}};
        batch.upsertNode(NodeLabel::Function, "services/core.py#run", run.toProperties());
        batch.upsertEdge(Relation::HasFunction, {NodeLabel::File, "services/core.py"},
                         {NodeLabel::Function, "services/core.py#run"});

        model::ClassRecord registry;
        registry.name = "Registry";
        registry.kind = "singleton";
        registry.provenance.set("type", model::Provenance::Syntactic);
        batch.upsertNode(NodeLabel::Class, "services/core.py#Registry", registry.toProperties());
        batch.upsertEdge(Relation::HasClass, {NodeLabel::File, "services/core.py"},
                         {NodeLabel::Class, "services/core.py#Registry"});
        ASSERT_TRUE(store_->apply("p1", batch));
    }

    static void addComponent(graph::WriteBatch& batch, const std::string& path,
                             const std::string& language, ComponentType type) {
        add_file(batch, "p1", path, language);
        model::ComponentRecord c;
        c.filePath = path;
        c.type = type;
        batch.upsertNode(NodeLabel::Component, model::keys::component(path), c.toProperties());
        batch.upsertEdge(Relation::ClassifiesAs, {NodeLabel::File, path},
                         {NodeLabel::Component, model::keys::component(path)});
    }

    model::MappingRecord mapping(const std::string& sourceKey) {
        auto r = store_->getNode("p1", NodeLabel::Mapping, model::keys::mapping(sourceKey));
        if (!r || !r.value())
            return {};
        return model::MappingRecord::fromProperties(r.value()->properties);
    }

    tests::TempStore store_;
};

TEST_F(MappingGeneratorTest, RuleCustomAndFallbackMappings) {
    MappingGenerator generator(*store_, nullptr);
    auto stats = generator.generate("p1");
    ASSERT_TRUE(stats) << stats.error().message;
    EXPECT_EQ(stats.value().components, 3u);
    EXPECT_EQ(stats.value().ruleBased, 1u);
    EXPECT_EQ(stats.value().custom, 1u);
    EXPECT_EQ(stats.value().unmapped, 1u);
    EXPECT_EQ(stats.value().classes, 1u);

    auto core = mapping("component:services/core.py");
    EXPECT_EQ(core.targetKey, "target:service@1.0");
    EXPECT_EQ(core.dataTypeMapping["List[int]"], "array");
    EXPECT_EQ(core.dataTypeMapping["str"], "text");
    EXPECT_TRUE(core.isCustom);
    EXPECT_FALSE(core.bestEffort);

    auto page = mapping("component:ui/page.html");
    EXPECT_EQ(page.targetKey, "target:react-page@18");

    auto notes = mapping("component:NOTES");
    EXPECT_EQ(notes.targetKey, "target:module@1.0");
    EXPECT_TRUE(notes.bestEffort);
    auto feedback = store_->getNode("p1", NodeLabel::Feedback,
                                    model::keys::report("unmappable_construct",
                                                        "map:component:NOTES"));
    ASSERT_TRUE(feedback && feedback.value());
    EXPECT_EQ(feedback.value()->properties["error_kind"], "UnmappableConstructError");

    EXPECT_EQ(mapping("services/core.py#Registry").targetKey, "target:provider@1.0");
}

TEST_F(MappingGeneratorTest, EveryMappingTargetsExactlyOneComponent) {
    MappingGenerator generator(*store_, nullptr);
    ASSERT_TRUE(generator.generate("p1"));
    ASSERT_TRUE(generator.generate("p1"));

    auto mappings = store_->findNodes("p1", NodeLabel::Mapping);
    ASSERT_TRUE(mappings);
    EXPECT_EQ(mappings.value().size(), 4u);
    for (const auto& m : mappings.value()) {
        auto targets =
            store_->findEdges("p1", {.relation = Relation::Targets, .from = m.ref()});
        ASSERT_TRUE(targets);
        EXPECT_EQ(targets.value().size(), 1u) << m.key;
        auto sources = store_->findEdges("p1", {.relation = Relation::MapsTo, .to = m.ref()});
        ASSERT_TRUE(sources);
        EXPECT_EQ(sources.value().size(), 1u) << m.key;
    }
}

TEST_F(MappingGeneratorTest, InferenceSuppliesMissingTarget) {
    NiceMock<tests::MockInferenceClient> inference;
    EXPECT_CALL(inference, infer(_, _))
        .WillOnce(Return(Result<nlohmann::json>(
            nlohmann::json{{"target", "handler@2.0"}, {"type", "handler"}})));

    MappingGenerator generator(*store_, &inference);
    auto stats = generator.generate("p1");
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().inferred, 1u);
    EXPECT_EQ(stats.value().unmapped, 0u);

    auto notes = mapping("component:NOTES");
    EXPECT_EQ(notes.targetKey, "target:handler@2.0");
    EXPECT_EQ(notes.provenance, model::Provenance::Inferred);
    EXPECT_FALSE(notes.bestEffort);

    auto target = store_->getNode("p1", NodeLabel::TargetComponent, "target:handler@2.0");
    ASSERT_TRUE(target && target.value());
    EXPECT_EQ(target.value()->properties["type"], "handler");
}

TEST_F(MappingGeneratorTest, InferenceErrorFallsBackWithFeedback) {
    NiceMock<tests::MockInferenceClient> inference;
    MappingGenerator generator(*store_, &inference);
    auto stats = generator.generate("p1");
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().unmapped, 1u);

    auto feedback = store_->getNode("p1", NodeLabel::Feedback,
                                    model::keys::report("unmappable_construct",
                                                        "map:component:NOTES"));
    ASSERT_TRUE(feedback && feedback.value());
    EXPECT_EQ(feedback.value()->properties["details"]["inference_error"], "offline");
}
