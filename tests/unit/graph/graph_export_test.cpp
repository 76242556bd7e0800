#include <cartograph/graph/graph_export.h>
#include <cartograph/graph/graph_store.h>

#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

#include <fstream>
#include <sstream>
#include <vector>

using namespace cartograph;
using namespace cartograph::graph;
using cartograph::tests::make_project;
using cartograph::tests::make_temp_dir;
using cartograph::tests::TempStore;
using nlohmann::json;

class GraphExportTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(source_.ok());
        ASSERT_TRUE(target_.ok());
        ASSERT_TRUE(source_->createProject(make_project("legacy")));

        WriteBatch batch;
        const NodeRef project{NodeLabel::Project, "legacy"};
        for (const char* path : {"app/main.py", "app/util.py"}) {
            batch.upsertNode(NodeLabel::File, path, {{"path", path}, {"file_type", "python"}});
            batch.upsertEdge(Relation::Contains, project, {NodeLabel::File, path});
        }
        batch.upsertNode(NodeLabel::Function, "app/util.py#helper",
                         {{"name", "helper"}, {"x_custom", {{"nested", true}}}});
        batch.upsertEdge(Relation::HasFunction, {NodeLabel::File, "app/util.py"},
                         {NodeLabel::Function, "app/util.py#helper"});
        batch.upsertEdge(Relation::Imports, {NodeLabel::File, "app/main.py"},
                         {NodeLabel::File, "app/util.py"}, {{"lineno", 2}});
        ASSERT_TRUE(source_->apply("legacy", batch));
    }

    TempStore source_;
    TempStore target_;
};

TEST_F(GraphExportTest, JsonDocumentListsNodesAndEdges) {
    auto doc = exportJson(*source_, "legacy");
    ASSERT_TRUE(doc) << doc.error().message;
    EXPECT_EQ(doc.value()["project"], "legacy");
    // Project node, two files, one function
    EXPECT_EQ(doc.value()["nodes"].size(), 4u);
    EXPECT_EQ(doc.value()["edges"].size(), 4u);
}

TEST_F(GraphExportTest, FilterRestrictsLabelsAndRelations) {
    ExportFilter filter;
    filter.labels = {NodeLabel::File};
    auto doc = exportJson(*source_, "legacy", filter);
    ASSERT_TRUE(doc);
    EXPECT_EQ(doc.value()["nodes"].size(), 2u);
    ASSERT_EQ(doc.value()["edges"].size(), 1u);
    EXPECT_EQ(doc.value()["edges"][0]["relation"], "IMPORTS");

    filter.labels.clear();
    filter.relations = {Relation::HasFunction};
    doc = exportJson(*source_, "legacy", filter);
    ASSERT_TRUE(doc);
    EXPECT_EQ(doc.value()["edges"].size(), 1u);
}

TEST_F(GraphExportTest, ImportRestoresSubgraphWithUnknownProperties) {
    auto doc = exportJson(*source_, "legacy");
    ASSERT_TRUE(doc);

    auto imported = importJson(*target_, doc.value());
    ASSERT_TRUE(imported) << imported.error().message;
    EXPECT_EQ(imported.value(), "legacy");

    EXPECT_EQ(target_->countNodes("legacy", NodeLabel::File).value(), 2);
    EXPECT_EQ(target_->countEdges("legacy").value(), 4);
    auto fn = target_->getNode("legacy", NodeLabel::Function, "app/util.py#helper");
    ASSERT_TRUE(fn);
    ASSERT_TRUE(fn.value().has_value());
    EXPECT_EQ(fn.value()->properties["x_custom"]["nested"], true);

    auto again = exportJson(*target_, "legacy");
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value()["nodes"].size(), doc.value()["nodes"].size());
    EXPECT_EQ(again.value()["edges"].size(), doc.value()["edges"].size());
}

TEST_F(GraphExportTest, ImportUnderAnotherProjectId) {
    auto doc = exportJson(*source_, "legacy");
    ASSERT_TRUE(doc);
    auto imported = importJson(*source_, doc.value(), std::string("copy"));
    ASSERT_TRUE(imported) << imported.error().message;

    EXPECT_EQ(source_->countNodes("copy", NodeLabel::File).value(), 2);
    auto contains = source_->findEdges("copy", EdgeFilter{.relation = Relation::Contains});
    ASSERT_TRUE(contains);
    ASSERT_EQ(contains.value().size(), 2u);
    EXPECT_EQ(contains.value()[0].from.key, "copy");
    // Original untouched
    EXPECT_EQ(source_->countNodes("legacy", NodeLabel::File).value(), 2);
}

TEST_F(GraphExportTest, ImportRejectsMalformedDocuments) {
    auto r = importJson(*target_, json{{"project", "x"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);

    json doc = {{"project", "x"},
                {"nodes", json::array({{{"label", "Widget"}, {"key", "w"}}})}};
    r = importJson(*target_, doc);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);

    const std::vector<json> malformed = {
        {{"project", "p1"}, {"nodes", json::array({"not-an-object"})}},
        {{"project", "p1"}, {"nodes", json::array({{{"label", 7}, {"key", "a.py"}}})}},
        {{"project", "p1"}, {"nodes", json::array({{{"label", "File"}, {"key", 3}}})}},
        {{"project", "p1"},
         {"nodes", json::array({{{"label", "File"}, {"key", "a.py"}, {"properties", "x"}}})}},
        {{"project", "p1"},
         {"nodes", json::array({{{"label", "File"}, {"key", "a.py"}}})},
         {"edges", json::array({42})}},
        {{"project", "p1"},
         {"nodes", json::array({{{"label", "File"}, {"key", "a.py"}}})},
         {"edges", json::array({{{"relation", "IMPORTS"},
                                 {"from", "a.py"},
                                 {"to", {{"label", "File"}, {"key", "a.py"}}}}})}},
        {{"project", 5}, {"nodes", json::array()}},
    };
    for (const auto& bad : malformed) {
        r = importJson(*target_, bad);
        ASSERT_FALSE(r) << bad.dump();
        EXPECT_EQ(r.error().code, ErrorCode::InvalidData) << bad.dump();
    }

    // Nothing was created by the rejected imports
    auto project = target_->getProject("p1");
    ASSERT_FALSE(project);
    EXPECT_EQ(project.error().code, ErrorCode::NotFound);
    auto projects = target_->listProjects();
    ASSERT_TRUE(projects);
    EXPECT_TRUE(projects.value().empty());
}

TEST_F(GraphExportTest, CsvWritesNodeAndEdgeFiles) {
    auto dir = make_temp_dir("cartograph_csv_");
    auto r = exportCsv(*source_, "legacy", dir);
    ASSERT_TRUE(r) << r.error().message;

    std::ifstream nodes(dir / "nodes.csv");
    std::stringstream ss;
    ss << nodes.rdbuf();
    auto text = ss.str();
    EXPECT_EQ(text.rfind("label,key,properties\n", 0), 0u);
    EXPECT_NE(text.find("\"app/util.py#helper\""), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(dir / "edges.csv"));
    std::filesystem::remove_all(dir);
}
