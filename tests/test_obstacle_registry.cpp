#include <gtest/gtest.h>

#include "obstacle_registry.hpp"

#include <limits>
#include <stdexcept>

using namespace wireroute;

namespace {

RoutingObstacle makeObstacle(const std::string& id, double x, double y)
{
    return RoutingObstacle{id, Rect{x, y, 20.0, 10.0}, ObstacleType::Component, 1};
}

} // namespace

TEST(ObstacleRegistryTests, AddAndFind)
{
    ObstacleRegistry registry;
    EXPECT_TRUE(registry.empty());

    registry.add(makeObstacle("r1", 0.0, 0.0));
    registry.add(makeObstacle("r2", 50.0, 0.0));

    ASSERT_EQ(registry.size(), 2u);
    const RoutingObstacle* found = registry.find("r2");
    ASSERT_NE(found, nullptr);
    EXPECT_DOUBLE_EQ(found->bounds.x, 50.0);
    EXPECT_EQ(registry.find("missing"), nullptr);
}

TEST(ObstacleRegistryTests, AddWithExistingIdReplaces)
{
    ObstacleRegistry registry;
    registry.add(makeObstacle("r1", 0.0, 0.0));
    registry.add(makeObstacle("r1", 30.0, 40.0));

    ASSERT_EQ(registry.size(), 1u);
    EXPECT_DOUBLE_EQ(registry.find("r1")->bounds.y, 40.0);
}

TEST(ObstacleRegistryTests, EveryMutationBumpsGeneration)
{
    ObstacleRegistry registry;
    const auto g0 = registry.generation();

    registry.add(makeObstacle("r1", 0.0, 0.0));
    const auto g1 = registry.generation();
    EXPECT_GT(g1, g0);

    ObstacleUpdate update;
    update.priority = 7;
    EXPECT_TRUE(registry.update("r1", update));
    const auto g2 = registry.generation();
    EXPECT_GT(g2, g1);

    EXPECT_TRUE(registry.remove("r1"));
    const auto g3 = registry.generation();
    EXPECT_GT(g3, g2);

    registry.clear();
    EXPECT_GT(registry.generation(), g3);
}

TEST(ObstacleRegistryTests, UnknownIdsAreIgnored)
{
    ObstacleRegistry registry;
    registry.add(makeObstacle("r1", 0.0, 0.0));
    const auto generation = registry.generation();

    ObstacleUpdate update;
    update.bounds = Rect{1.0, 1.0, 1.0, 1.0};
    EXPECT_FALSE(registry.update("ghost", update));
    EXPECT_FALSE(registry.remove("ghost"));

    EXPECT_EQ(registry.generation(), generation);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ObstacleRegistryTests, PartialUpdateKeepsUnsetFields)
{
    ObstacleRegistry registry;
    registry.add(makeObstacle("r1", 0.0, 0.0));

    ObstacleUpdate update;
    update.type = ObstacleType::Keepout;
    ASSERT_TRUE(registry.update("r1", update));

    const RoutingObstacle* o = registry.find("r1");
    ASSERT_NE(o, nullptr);
    EXPECT_EQ(o->type, ObstacleType::Keepout);
    EXPECT_EQ(o->priority, 1);
    EXPECT_EQ(o->bounds, (Rect{0.0, 0.0, 20.0, 10.0}));
}

TEST(ObstacleRegistryTests, RemoveKeepsInsertionOrder)
{
    ObstacleRegistry registry;
    registry.add(makeObstacle("a", 0.0, 0.0));
    registry.add(makeObstacle("b", 10.0, 0.0));
    registry.add(makeObstacle("c", 20.0, 0.0));

    ASSERT_TRUE(registry.remove("a"));

    ASSERT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.obstacles()[0].id, "b");
    EXPECT_EQ(registry.obstacles()[1].id, "c");

    // Index stays consistent after the shift
    ASSERT_NE(registry.find("c"), nullptr);
    EXPECT_DOUBLE_EQ(registry.find("c")->bounds.x, 20.0);
    ASSERT_TRUE(registry.remove("c"));
    EXPECT_EQ(registry.obstacles().back().id, "b");
}

TEST(ObstacleRegistryTests, ClearRemovesEverything)
{
    ObstacleRegistry registry;
    registry.add(makeObstacle("a", 0.0, 0.0));
    registry.add(makeObstacle("b", 10.0, 0.0));

    registry.clear();
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(registry.find("a"), nullptr);
}

TEST(ObstacleRegistryTests, RejectsInvalidObstacles)
{
    ObstacleRegistry registry;

    EXPECT_THROW(registry.add(makeObstacle("", 0.0, 0.0)), std::invalid_argument);

    RoutingObstacle negative = makeObstacle("neg", 0.0, 0.0);
    negative.bounds.width = -1.0;
    EXPECT_THROW(registry.add(negative), std::invalid_argument);

    RoutingObstacle nan = makeObstacle("nan", 0.0, 0.0);
    nan.bounds.x = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(registry.add(nan), std::invalid_argument);

    EXPECT_TRUE(registry.empty());
}

TEST(ObstacleRegistryTests, RejectedUpdateLeavesObstacleUntouched)
{
    ObstacleRegistry registry;
    registry.add(makeObstacle("r1", 0.0, 0.0));
    const auto generation = registry.generation();

    ObstacleUpdate update;
    update.bounds = Rect{0.0, 0.0, 5.0, -5.0};
    update.priority = 9;
    EXPECT_THROW(registry.update("r1", update), std::invalid_argument);

    EXPECT_EQ(registry.find("r1")->priority, 1);
    EXPECT_EQ(registry.generation(), generation);
}
