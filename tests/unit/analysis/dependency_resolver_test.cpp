#include <cartograph/analysis/dependency_resolver.h>

#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cartograph;
using namespace cartograph::analysis;
using cartograph::tests::add_file;
using cartograph::tests::make_project;
using graph::NodeRef;
using model::NodeLabel;
using model::Relation;

class DependencyResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store_.ok());
        ASSERT_TRUE(store_->createProject(make_project("p1")));

        // a <-> b cycle through imports, b -> c -> d through references
        graph::WriteBatch batch;
        for (const char* path : {"a.py", "b.py", "c.py", "d.py"})
            add_file(batch, "p1", path);
        batch.upsertEdge(Relation::Imports, file("a.py"), file("b.py"), {{"module", "b"}});
        batch.upsertEdge(Relation::Imports, file("b.py"), file("a.py"));
        batch.upsertEdge(Relation::References, file("b.py"), file("c.py"));
        batch.upsertEdge(Relation::References, file("c.py"), file("d.py"));
        ASSERT_TRUE(store_->apply("p1", batch));
    }

    static NodeRef file(const std::string& path) { return {NodeLabel::File, path}; }

    nlohmann::json props(const std::string& path) {
        auto r = store_->getNode("p1", NodeLabel::File, path);
        return r && r.value() ? r.value()->properties : nlohmann::json::object();
    }

    tests::TempStore store_;
};

TEST_F(DependencyResolverTest, LoadFileGraphReadsImportsAndReferences) {
    std::vector<graph::GraphEdge> edges;
    auto g = loadFileGraph(*store_, "p1", &edges);
    ASSERT_TRUE(g) << g.error().message;
    EXPECT_EQ(g.value().nodes(), (std::vector<std::string>{"a.py", "b.py", "c.py", "d.py"}));
    EXPECT_EQ(g.value().edgeCount(), 4u);
    EXPECT_EQ(edges.size(), 4u);
}

TEST_F(DependencyResolverTest, WritesClosuresAndCycleReport) {
    DependencyResolver resolver(*store_, {.closureDepth = 1});
    auto result = resolver.resolve("p1");
    ASSERT_TRUE(result) << result.error().message;

    ASSERT_EQ(result.value().cycles.size(), 1u);
    const auto& cycle = result.value().cycles[0];
    EXPECT_EQ(cycle.members, (std::vector<std::string>{"a.py", "b.py"}));
    EXPECT_EQ(cycle.brokenEdges, (std::vector<DependencyGraph::Edge>{{"a.py", "b.py"}}));

    auto a = props("a.py");
    EXPECT_EQ(a["closure"], nlohmann::json({"b.py"}));
    EXPECT_EQ(a["closure_depth"], 1);
    // The acyclic graph no longer lets a.py reach anything
    EXPECT_EQ(a["transitive_dependencies"], 0);
    EXPECT_EQ(props("b.py")["transitive_dependencies"], 3);
    // Extraction properties survive the merge
    EXPECT_EQ(a["file_type"], "python");

    auto report = store_->getNode("p1", NodeLabel::Report, "report:cycle:a.py,b.py");
    ASSERT_TRUE(report && report.value());
    EXPECT_EQ(report.value()->properties["details"]["kept_first"], "a.py");
}

TEST_F(DependencyResolverTest, BrokenEdgeIsFlaggedNotRemoved) {
    DependencyResolver resolver(*store_);
    ASSERT_TRUE(resolver.resolve("p1"));

    auto edges = store_->findEdges("p1", {.relation = Relation::Imports, .from = file("a.py")});
    ASSERT_TRUE(edges);
    ASSERT_EQ(edges.value().size(), 1u);
    EXPECT_EQ(edges.value()[0].properties["cycle_broken"], true);
    EXPECT_EQ(edges.value()[0].properties["module"], "b");

    auto kept = store_->findEdges("p1", {.relation = Relation::Imports, .from = file("b.py")});
    ASSERT_TRUE(kept);
    ASSERT_EQ(kept.value().size(), 1u);
    EXPECT_FALSE(kept.value()[0].properties.contains("cycle_broken"));
}

TEST_F(DependencyResolverTest, RerunIsStable) {
    DependencyResolver resolver(*store_);
    ASSERT_TRUE(resolver.resolve("p1"));
    auto nodes = store_->countNodes("p1");
    auto edges = store_->countEdges("p1");
    ASSERT_TRUE(nodes && edges);

    auto again = resolver.resolve("p1");
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value().cycles.size(), 1u);
    EXPECT_EQ(store_->countNodes("p1").value(), nodes.value());
    EXPECT_EQ(store_->countEdges("p1").value(), edges.value());
}

TEST(AnalyzeDependenciesTest, ClosuresOfAcyclicGraph) {
    DependencyGraph g;
    g.addEdge("main", "service");
    g.addEdge("service", "db");
    g.addNode("orphan");

    auto r = analyzeDependencies(g, 1);
    EXPECT_TRUE(r.cycles.empty());
    EXPECT_EQ(r.boundedClosure["main"], (std::set<std::string>{"service"}));
    EXPECT_EQ(r.fullClosure["main"], (std::set<std::string>{"service", "db"}));
    EXPECT_TRUE(r.fullClosure["orphan"].empty());
    EXPECT_EQ(r.acyclic.edgeCount(), 2u);
}
