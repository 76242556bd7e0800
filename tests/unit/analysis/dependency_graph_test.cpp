#include <cartograph/analysis/dependency_graph.h>

#include <gtest/gtest.h>

using namespace cartograph;
using cartograph::analysis::DependencyGraph;

namespace {

// a -> b -> c -> a, c -> d
DependencyGraph triangleWithTail() {
    DependencyGraph g;
    g.addEdge("a", "b");
    g.addEdge("b", "c");
    g.addEdge("c", "a");
    g.addEdge("c", "d");
    return g;
}

} // namespace

TEST(DependencyGraphTest, NodesKeepInsertionOrderAndEdgesCollapse) {
    DependencyGraph g;
    EXPECT_TRUE(g.addNode("z"));
    EXPECT_FALSE(g.addNode("z"));
    g.addEdge("a", "z");
    g.addEdge("a", "z");
    EXPECT_EQ(g.nodes(), (std::vector<std::string>{"z", "a"}));
    EXPECT_EQ(g.edgeCount(), 1u);
    EXPECT_TRUE(g.hasEdge("a", "z"));
    EXPECT_FALSE(g.hasEdge("z", "a"));

    g.removeEdge("a", "z");
    g.removeEdge("a", "missing");
    EXPECT_EQ(g.edgeCount(), 0u);
    EXPECT_TRUE(g.contains("a"));
}

TEST(DependencyGraphTest, ClosureRespectsDepth) {
    auto g = triangleWithTail();
    EXPECT_EQ(g.closure("a", 1), (std::set<std::string>{"b"}));
    EXPECT_EQ(g.closure("a", 2), (std::set<std::string>{"b", "c"}));
    // Unbounded closure reaches back to the start through the cycle
    EXPECT_EQ(g.closure("a"), (std::set<std::string>{"a", "b", "c", "d"}));
    EXPECT_TRUE(g.closure("a", 0).empty());
    EXPECT_TRUE(g.closure("d").empty());
    EXPECT_TRUE(g.closure("unknown").empty());
}

TEST(DependencyGraphTest, CyclesAreSortedComponents) {
    auto g = triangleWithTail();
    g.addEdge("y", "x");
    g.addEdge("x", "y");
    g.addEdge("s", "s");

    auto cycles = g.cycles();
    ASSERT_EQ(cycles.size(), 3u);
    EXPECT_EQ(cycles[0], (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(cycles[1], (std::vector<std::string>{"s"}));
    EXPECT_EQ(cycles[2], (std::vector<std::string>{"x", "y"}));
}

TEST(DependencyGraphTest, AcyclicGraphHasNoCycles) {
    DependencyGraph g;
    g.addEdge("a", "b");
    g.addEdge("a", "c");
    g.addEdge("b", "c");
    EXPECT_TRUE(g.cycles().empty());
}

TEST(DependencyGraphTest, LowestMemberLosesItsCycleEdges) {
    auto g = triangleWithTail();
    std::vector<DependencyGraph::Edge> removed;
    auto acyclic = g.withoutCycles(&removed);

    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], (DependencyGraph::Edge{"a", "b"}));
    EXPECT_TRUE(acyclic.cycles().empty());
    EXPECT_EQ(acyclic.edgeCount(), 3u);
    // The original is untouched
    EXPECT_TRUE(g.hasEdge("a", "b"));
}

TEST(DependencyGraphTest, SelfLoopIsRemoved) {
    DependencyGraph g;
    g.addEdge("s", "s");
    std::vector<DependencyGraph::Edge> removed;
    auto acyclic = g.withoutCycles(&removed);
    EXPECT_EQ(removed, (std::vector<DependencyGraph::Edge>{{"s", "s"}}));
    EXPECT_EQ(acyclic.edgeCount(), 0u);
}

TEST(DependencyGraphTest, DependencyOrderPutsDependenciesFirst) {
    auto acyclic = triangleWithTail().withoutCycles();
    auto order = acyclic.dependencyOrder();
    ASSERT_TRUE(order) << order.error().message;
    EXPECT_EQ(order.value(), (std::vector<std::string>{"a", "d", "c", "b"}));
}

TEST(DependencyGraphTest, IndependentNodesKeepInsertionOrder) {
    DependencyGraph g;
    for (const char* k : {"m", "b", "x"})
        g.addNode(k);
    auto order = g.dependencyOrder();
    ASSERT_TRUE(order);
    EXPECT_EQ(order.value(), (std::vector<std::string>{"m", "b", "x"}));
}

TEST(DependencyGraphTest, DependencyOrderRejectsCycles) {
    auto order = triangleWithTail().dependencyOrder();
    ASSERT_FALSE(order);
    EXPECT_EQ(order.error().code, ErrorCode::InvalidState);
}
