#include <cartograph/planner/strategy_scheduler.h>

#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cartograph;
using namespace cartograph::planner;
using cartograph::tests::add_file;
using cartograph::tests::make_project;
using model::NodeLabel;
using model::Relation;

TEST(OrderComponentsTest, DependenciesComeFirst) {
    analysis::DependencyGraph g;
    g.addEdge("a.py", "b.py");
    g.addEdge("b.py", "c.py");
    g.addNode("d.py");

    auto order = orderComponents(g, {{"a.py", "component:a.py"},
                                     {"b.py", "component:b.py"},
                                     {"c.py", "component:c.py"},
                                     {"d.py", "component:d.py"}});
    ASSERT_TRUE(order) << order.error().message;
    ASSERT_EQ(order.value().size(), 4u);
    EXPECT_EQ(order.value()[0].componentKey, "component:c.py");
    EXPECT_EQ(order.value()[1].componentKey, "component:b.py");
    EXPECT_EQ(order.value()[2].componentKey, "component:d.py");
    EXPECT_EQ(order.value()[3].componentKey, "component:a.py");
    EXPECT_EQ(order.value()[3].priority, 3);
    EXPECT_EQ(order.value()[1].dependsOn, std::vector<std::string>{"component:c.py"});
    EXPECT_EQ(order.value()[1].filePath, "b.py");
}

TEST(OrderComponentsTest, CyclicInputIsRejected) {
    analysis::DependencyGraph g;
    g.addEdge("a.py", "b.py");
    g.addEdge("b.py", "a.py");
    auto order = orderComponents(g, {{"a.py", "component:a.py"}, {"b.py", "component:b.py"}});
    ASSERT_FALSE(order);
    EXPECT_EQ(order.error().code, ErrorCode::InvalidState);
}

class StrategySchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store_.ok());
        ASSERT_TRUE(store_->createProject(make_project("p1")));

        graph::WriteBatch batch;
        for (const char* path : {"a.py", "b.py", "c.py"}) {
            add_file(batch, "p1", path);
            model::ComponentRecord c;
            c.filePath = path;
            c.type = model::ComponentType::Logic;
            batch.upsertNode(NodeLabel::Component, model::keys::component(path),
                             c.toProperties());
        }
        // a -> b -> c -> a
        batch.upsertEdge(Relation::Imports, file("a.py"), file("b.py"));
        batch.upsertEdge(Relation::Imports, file("b.py"), file("c.py"));
        batch.upsertEdge(Relation::References, file("c.py"), file("a.py"));

        model::MappingRecord best;
        best.sourceKey = model::keys::component("c.py");
        best.targetKey = "target:module@1.0";
        best.bestEffort = true;
        batch.upsertNode(NodeLabel::Mapping, model::keys::mapping(best.sourceKey),
                         best.toProperties());

        model::MappingRecord service;
        service.sourceKey = model::keys::component("b.py");
        service.targetKey = "target:service@1.0";
        service.dataTypeMapping["str"] = "string";
        batch.upsertNode(NodeLabel::Mapping, model::keys::mapping(service.sourceKey),
                         service.toProperties());
        ASSERT_TRUE(store_->apply("p1", batch));
    }

    static graph::NodeRef file(const std::string& path) { return {NodeLabel::File, path}; }

    tests::TempStore store_;
};

TEST_F(StrategySchedulerTest, SchedulesAroundBrokenCycle) {
    StrategyScheduler scheduler(*store_);
    auto plan = scheduler.schedule("p1");
    ASSERT_TRUE(plan) << plan.error().message;
    EXPECT_EQ(plan.value().brokenEdges, 1u);

    // a.py loses a -> b, leaving b -> c -> a
    ASSERT_EQ(plan.value().order.size(), 3u);
    EXPECT_EQ(plan.value().order[0].filePath, "a.py");
    EXPECT_EQ(plan.value().order[1].filePath, "c.py");
    EXPECT_EQ(plan.value().order[2].filePath, "b.py");

    const auto& c = plan.value().order[1];
    ASSERT_FALSE(c.actions.empty());
    EXPECT_EQ(c.actions.front(), "resolve feedback");

    const auto& b = plan.value().order[2];
    EXPECT_EQ(b.actions, (std::vector<std::string>{"migrate b.py", "generate target:service@1.0",
                                                   "map types", "verify"}));
}

TEST_F(StrategySchedulerTest, WritesOneStrategyPerComponent) {
    StrategyScheduler scheduler(*store_);
    ASSERT_TRUE(scheduler.schedule("p1"));
    ASSERT_TRUE(scheduler.schedule("p1"));

    EXPECT_EQ(store_->countNodes("p1", NodeLabel::Strategy).value(), 3);
    EXPECT_EQ(store_->countEdges("p1", Relation::PlannedIn).value(), 3);

    auto strategy = store_->getNode("p1", NodeLabel::Strategy,
                                    model::keys::strategy(model::keys::component("b.py")));
    ASSERT_TRUE(strategy && strategy.value());
    auto record = model::StrategyRecord::fromProperties(strategy.value()->properties);
    EXPECT_EQ(record.priority, 2);
    EXPECT_EQ(strategy.value()->properties["depends_on"],
              nlohmann::json({model::keys::component("c.py")}));
}
