#include <cartograph/extraction/extraction_engine.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cartograph;
using namespace cartograph::extraction;
using cartograph::tests::make_function;
using cartograph::tests::make_import;
using cartograph::tests::make_project;
using cartograph::tests::make_temp_dir;
using cartograph::tests::write_file;
using model::NodeLabel;
using model::Relation;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

TEST(ImportCandidatesTest, AbsoluteModule) {
    EXPECT_EQ(importCandidates("app/main.py", make_import("a.b")),
              (std::vector<std::string>{"a/b.py", "a/b/__init__.py"}));
    EXPECT_EQ(moduleCandidates("pkg.io"),
              (std::vector<std::string>{"pkg/io.py", "pkg/io/__init__.py"}));
    EXPECT_TRUE(moduleCandidates("").empty());
}

TEST(ImportCandidatesTest, RelativeImportClimbsFromFileDirectory) {
    EXPECT_EQ(importCandidates("pkg/sub/mod.py", make_import("util", 2, {"x"}), "x"),
              (std::vector<std::string>{"pkg/util/x.py", "pkg/util/x/__init__.py", "pkg/util.py",
                                        "pkg/util/__init__.py"}));
    EXPECT_EQ(importCandidates("app/main.py", make_import("", 1, {"helpers"}), "helpers"),
              (std::vector<std::string>{"app/helpers.py", "app/helpers/__init__.py",
                                        "app/__init__.py"}));
}

TEST(ImportCandidatesTest, RelativeImportAboveRootHasNoCandidates) {
    EXPECT_TRUE(importCandidates("top.py", make_import("a", 2)).empty());
}

class ExtractionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store_.ok());
        root_ = make_temp_dir("cartograph_extract_");
        write_file(root_ / "app" / "main.py", "MAIN");
        write_file(root_ / "app" / "helpers.py", "HELPERS");
        write_file(root_ / "app" / "broken.py", "BROKEN");
        write_file(root_ / "README.md", "# readme\n");

        Skeleton main;
        main.functions.push_back(make_function("main"));
        main.imports.push_back(make_import("", 1, {"helpers"}));
        main.imports.push_back(make_import("requests"));
        main.references.push_back({"helpers", 3});
        parser_.add("MAIN", main);

        Skeleton helpers;
        helpers.functions.push_back(make_function("helper", "str"));
        parser_.add("HELPERS", helpers);

        parser_.addMalformed("BROKEN");

        ASSERT_TRUE(store_->createProject(make_project("p1", root_.string())));
    }
    void TearDown() override { std::filesystem::remove_all(root_); }

    Result<ExtractionStats> runAll(ExtractionEngine& engine) {
        auto scan = engine.scanStructure("p1", root_);
        if (!scan)
            return scan.error();
        return engine.extractContent("p1");
    }

    std::optional<graph::GraphNode> node(NodeLabel label, const std::string& key) {
        auto r = store_->getNode("p1", label, key);
        return r ? r.value() : std::nullopt;
    }

    tests::TempStore store_;
    tests::FakeParser parser_;
    std::filesystem::path root_;
};

TEST_F(ExtractionEngineTest, ScanRecordsFilesUnderProject) {
    ExtractionEngine engine(*store_, parser_, nullptr);
    auto stats = engine.scanStructure("p1", root_);
    ASSERT_TRUE(stats) << stats.error().message;
    EXPECT_EQ(stats.value().files, 4u);

    auto contains = store_->findEdges("p1", {.relation = Relation::Contains});
    ASSERT_TRUE(contains);
    EXPECT_EQ(contains.value().size(), 4u);

    auto readme = node(NodeLabel::File, "README.md");
    ASSERT_TRUE(readme);
    EXPECT_EQ(readme->properties["file_type"], "markdown");
    EXPECT_TRUE(node(NodeLabel::Report, model::keys::report("structure_analysis", "p1")));
}

TEST_F(ExtractionEngineTest, ExtractsEntitiesAndResolvesCrossFileEdges) {
    ExtractionEngine engine(*store_, parser_, nullptr, {.workers = 3});
    auto stats = runAll(engine);
    ASSERT_TRUE(stats) << stats.error().message;
    EXPECT_EQ(stats.value().parsed, 2u);
    EXPECT_EQ(stats.value().parseFailures, 1u);
    EXPECT_EQ(stats.value().imports, 1u);
    EXPECT_EQ(stats.value().references, 1u);
    EXPECT_EQ(stats.value().dependencies, 1u);

    EXPECT_TRUE(node(NodeLabel::Function, "app/main.py#main"));
    EXPECT_TRUE(node(NodeLabel::Function, "app/helpers.py#helper"));

    auto imports = store_->findEdges("p1", {.relation = Relation::Imports});
    ASSERT_TRUE(imports);
    ASSERT_EQ(imports.value().size(), 1u);
    EXPECT_EQ(imports.value()[0].from.key, "app/main.py");
    EXPECT_EQ(imports.value()[0].to.key, "app/helpers.py");

    auto refs = store_->findEdges("p1", {.relation = Relation::References});
    ASSERT_TRUE(refs);
    ASSERT_EQ(refs.value().size(), 1u);
    EXPECT_EQ(refs.value()[0].properties["name"], "helpers");

    auto dep = node(NodeLabel::Dependency, "dep:requests");
    ASSERT_TRUE(dep);
    EXPECT_EQ(dep->properties["type"], "external");
    auto dependsOn = store_->findEdges("p1", {.relation = Relation::DependsOn});
    ASSERT_TRUE(dependsOn);
    ASSERT_EQ(dependsOn.value().size(), 1u);
    EXPECT_EQ(dependsOn.value()[0].from.key, "app/main.py");

    auto pending = store_->pendingEdges("p1");
    ASSERT_TRUE(pending);
    EXPECT_TRUE(pending.value().empty());
    EXPECT_TRUE(node(NodeLabel::Report, model::keys::report("content_analysis", "p1")));
}

TEST_F(ExtractionEngineTest, MalformedFileIsReportedAndHasNoEntities) {
    ExtractionEngine engine(*store_, parser_, nullptr);
    ASSERT_TRUE(runAll(engine));

    auto broken = node(NodeLabel::File, "app/broken.py");
    ASSERT_TRUE(broken);
    EXPECT_EQ(broken->properties["parse_failed"], true);

    auto owned = store_->findEdges("p1", {.from = graph::NodeRef{NodeLabel::File, "app/broken.py"}});
    ASSERT_TRUE(owned);
    EXPECT_TRUE(owned.value().empty());

    auto report = node(NodeLabel::Report, "report:parse_error:app/broken.py");
    ASSERT_TRUE(report);
    EXPECT_EQ(report->properties["error_kind"], "MalformedInputError");
}

TEST_F(ExtractionEngineTest, RerunDoesNotDuplicate) {
    ExtractionEngine engine(*store_, parser_, nullptr);
    ASSERT_TRUE(runAll(engine));
    auto nodes = store_->countNodes("p1");
    auto edges = store_->countEdges("p1");
    ASSERT_TRUE(nodes && edges);

    ASSERT_TRUE(runAll(engine));
    EXPECT_EQ(store_->countNodes("p1").value(), nodes.value());
    EXPECT_EQ(store_->countEdges("p1").value(), edges.value());
}

TEST_F(ExtractionEngineTest, OversizedFilesAreSkippedWithReport) {
    ExtractionEngine engine(*store_, parser_, nullptr, {.maxFileSize = 5});
    auto stats = runAll(engine);
    ASSERT_TRUE(stats);
    // HELPERS, BROKEN and the readme exceed five bytes
    EXPECT_EQ(stats.value().oversized, 3u);
    EXPECT_EQ(stats.value().parseFailures, 0u);

    EXPECT_TRUE(node(NodeLabel::Function, "app/main.py#main"));
    EXPECT_FALSE(node(NodeLabel::Function, "app/helpers.py#helper"));
    EXPECT_TRUE(node(NodeLabel::Report, "report:file_too_large:app/helpers.py"));

    // The file still exists, so the import resolves
    auto imports = store_->findEdges("p1", {.relation = Relation::Imports});
    ASSERT_TRUE(imports);
    EXPECT_EQ(imports.value().size(), 1u);
}

TEST_F(ExtractionEngineTest, InferenceFailureBecomesFeedback) {
    NiceMock<tests::MockInferenceClient> inference;
    EXPECT_CALL(inference, infer(_, _)).Times(2);

    ExtractionEngine engine(*store_, parser_, &inference);
    auto stats = runAll(engine);
    ASSERT_TRUE(stats) << stats.error().message;
    EXPECT_EQ(stats.value().inferenceCalls, 2u);
    EXPECT_EQ(stats.value().inferenceFailures, 2u);

    // Syntactic results survive
    EXPECT_TRUE(node(NodeLabel::Function, "app/main.py#main"));
    auto feedback = node(NodeLabel::Feedback, "report:inference_failed:app/main.py");
    ASSERT_TRUE(feedback);
    EXPECT_EQ(feedback->properties["error_kind"], "TransientInferenceError");
}

TEST_F(ExtractionEngineTest, InferredFieldsAreMergedAndTagged) {
    NiceMock<tests::MockInferenceClient> inference;
    ON_CALL(inference, infer(_, _))
        .WillByDefault(Return(Result<nlohmann::json>(nlohmann::json{
            {"functions", {{{"name", "main"}, {"return_type", "int"}}}},
            {"references", {"app/helpers.py"}}})));

    ExtractionEngine engine(*store_, parser_, &inference);
    ASSERT_TRUE(runAll(engine));

    auto main = node(NodeLabel::Function, "app/main.py#main");
    ASSERT_TRUE(main);
    EXPECT_EQ(main->properties["return_type"], "int");
    EXPECT_EQ(main->properties["_provenance"]["return_type"], "inferred");
    EXPECT_EQ(main->properties["_provenance"]["name"], "syntactic");

    // Fields outside the response keep their syntactic values
    auto helper = node(NodeLabel::Function, "app/helpers.py#helper");
    ASSERT_TRUE(helper);
    EXPECT_EQ(helper->properties["return_type"], "str");
}

class ExtractionScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store_.ok());
        root_ = make_temp_dir("cartograph_scenario_");
        ASSERT_TRUE(store_->createProject(make_project("p1", root_.string())));
    }
    void TearDown() override { std::filesystem::remove_all(root_); }

    Result<ExtractionStats> runAll() {
        ExtractionEngine engine(*store_, parser_, nullptr, {.workers = 2});
        auto scan = engine.scanStructure("p1", root_);
        if (!scan)
            return scan.error();
        return engine.extractContent("p1");
    }

    tests::TempStore store_;
    tests::FakeParser parser_;
    std::filesystem::path root_;
};

TEST_F(ExtractionScenarioTest, StaticFunctionAndSingletonClass) {
    write_file(root_ / "main.py", "SCENARIO_MAIN");
    write_file(root_ / "utils.py", "SCENARIO_UTILS");

    Skeleton main;
    auto fn = make_function("main");
    fn.arguments = {{"args", "list"}};
    fn.decorators = {"@staticmethod"};
    fn.isStatic = true;
    fn.provenance.set("arguments", model::Provenance::Syntactic);
    fn.provenance.set("is_static", model::Provenance::Syntactic);
    main.functions.push_back(fn);

    model::ClassRecord cls;
    cls.name = "DataProcessor";
    cls.kind = "singleton";
    cls.provenance.set("name", model::Provenance::Syntactic);
    cls.provenance.set("type", model::Provenance::Syntactic);
    auto process = make_function("process", "dict");
    process.className = "DataProcessor";
    cls.methods = {"process"};
    cls.methodDetails = {process};
    main.classes.push_back(cls);
    main.imports.push_back(make_import("utils"));
    parser_.add("SCENARIO_MAIN", main);

    auto stats = runAll();
    ASSERT_TRUE(stats) << stats.error().message;

    EXPECT_EQ(store_->countNodes("p1", NodeLabel::File).value(), 2);
    auto functions = store_->findNodes("p1", NodeLabel::Function);
    ASSERT_TRUE(functions);
    ASSERT_EQ(functions.value().size(), 1u);
    const auto& fnProps = functions.value()[0].properties;
    EXPECT_EQ(fnProps.at("name"), "main");
    EXPECT_EQ(fnProps.at("is_static"), true);
    EXPECT_EQ(fnProps.at("is_async"), false);
    EXPECT_EQ(fnProps.at("arguments")[0]["type"], "list");

    auto classes = store_->findNodes("p1", NodeLabel::Class);
    ASSERT_TRUE(classes);
    ASSERT_EQ(classes.value().size(), 1u);
    EXPECT_EQ(classes.value()[0].properties.at("name"), "DataProcessor");
    EXPECT_EQ(classes.value()[0].properties.at("type"), "singleton");
    EXPECT_EQ(classes.value()[0].properties.at("method_details")[0]["return_type"], "dict");

    auto imports = store_->findEdges("p1", {.relation = Relation::Imports});
    ASSERT_TRUE(imports);
    ASSERT_EQ(imports.value().size(), 1u);
    EXPECT_EQ(imports.value()[0].from.key, "main.py");
    EXPECT_EQ(imports.value()[0].to.key, "utils.py");
}

TEST_F(ExtractionScenarioTest, EveryEntityHasOneOwningFileInProject) {
    write_file(root_ / "shapes.py", "SHAPES");
    write_file(root_ / "pkg" / "colors.py", "COLORS");

    for (const auto& [contents, prefix] :
         std::vector<std::pair<std::string, std::string>>{{"SHAPES", "Shape"},
                                                          {"COLORS", "Color"}}) {
        Skeleton s;
        s.functions.push_back(make_function("make" + prefix, "str"));
        s.functions.push_back(make_function("make" + prefix, "str"));
        model::ClassRecord cls;
        cls.name = prefix;
        cls.kind = "abstract";
        s.classes.push_back(cls);
        model::EnumRecord en;
        en.name = prefix + "Kind";
        en.values = {"A", "B"};
        s.enums.push_back(en);
        model::ExtensionRecord ext;
        ext.name = prefix + "Ext";
        ext.baseType = prefix;
        ext.methods = {"describe"};
        s.extensions.push_back(ext);
        parser_.add(contents, s);
    }
    ASSERT_TRUE(runAll());
    // Extraction twice must not add owners
    ASSERT_TRUE(runAll());

    const std::vector<std::pair<NodeLabel, Relation>> owned = {
        {NodeLabel::Function, Relation::HasFunction},
        {NodeLabel::Class, Relation::HasClass},
        {NodeLabel::Enum, Relation::HasEnum},
        {NodeLabel::Extension, Relation::HasExtension},
    };
    for (const auto& [label, relation] : owned) {
        auto nodes = store_->findNodes("p1", label);
        ASSERT_TRUE(nodes);
        // Duplicate function names in one file get their own node
        EXPECT_EQ(nodes.value().size(), label == NodeLabel::Function ? 4u : 2u);
        for (const auto& n : nodes.value()) {
            EXPECT_EQ(n.projectId, "p1");
            auto owners = store_->findEdges("p1", {.to = graph::NodeRef{label, n.key}});
            ASSERT_TRUE(owners);
            ASSERT_EQ(owners.value().size(), 1u) << n.key;
            const auto& edge = owners.value()[0];
            EXPECT_EQ(edge.relation, relation) << n.key;
            ASSERT_EQ(edge.from.label, NodeLabel::File) << n.key;

            auto file = store_->getNode("p1", NodeLabel::File, edge.from.key);
            ASSERT_TRUE(file);
            ASSERT_TRUE(file.value().has_value()) << edge.from.key;
            EXPECT_EQ(file.value()->projectId, "p1");
            EXPECT_EQ(n.key.rfind(edge.from.key + "#", 0), 0u) << n.key;
        }
    }
}
