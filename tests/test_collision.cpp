#include <gtest/gtest.h>

#include "collision.hpp"
#include "segments.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wireroute;

namespace {

RoutedWire makeWire(const std::string& id, const Point& start, const Point& end)
{
    return RoutedWire{id, start, end, route_orthogonal(start, end)};
}

} // namespace

TEST(CollisionTests, DefaultParameters)
{
    CollisionDetector detector;
    EXPECT_DOUBLE_EQ(detector.wire_buffer(), 5.0);
    EXPECT_DOUBLE_EQ(detector.obstacle_buffer(), 10.0);
    EXPECT_DOUBLE_EQ(detector.junction_threshold(), 5.0);
}

TEST(CollisionTests, SegmentThroughObstacle)
{
    CollisionDetector detector;
    auto wire = makeWire("w1", Point{0.0, 0.0}, Point{100.0, 0.0});
    std::vector<RoutingObstacle> obstacles{
        RoutingObstacle{"u1", Rect{40.0, -10.0, 20.0, 20.0}, ObstacleType::Component, 0}};

    auto hits = detector.detect_obstacle_collisions(wire, obstacles);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].wire_id, "w1");
    EXPECT_EQ(hits[0].obstacle_id, "u1");
    EXPECT_EQ(hits[0].segment_index, 0u);
    ASSERT_EQ(hits[0].points.size(), 2u);
    EXPECT_EQ(hits[0].points[0], (Point{30.0, 0.0}));
    EXPECT_EQ(hits[0].points[1], (Point{70.0, 0.0}));
}

TEST(CollisionTests, TerminalObstacleIsIgnored)
{
    CollisionDetector detector;
    auto wire = makeWire("w1", Point{0.0, 0.0}, Point{100.0, 0.0});
    std::vector<RoutingObstacle> obstacles{
        RoutingObstacle{"pin", Rect{90.0, -5.0, 20.0, 10.0}, ObstacleType::Component, 0}};

    EXPECT_TRUE(detector.detect_obstacle_collisions(wire, obstacles).empty());
}

TEST(CollisionTests, ClearWireHasNoHits)
{
    CollisionDetector detector;
    auto wire = makeWire("w1", Point{0.0, 0.0}, Point{100.0, 0.0});
    std::vector<RoutingObstacle> obstacles{
        RoutingObstacle{"u1", Rect{40.0, 30.0, 20.0, 20.0}, ObstacleType::Component, 0}};

    EXPECT_TRUE(detector.detect_obstacle_collisions(wire, obstacles).empty());
}

TEST(CollisionTests, PerpendicularCrossing)
{
    CollisionDetector detector;
    std::vector<RoutedWire> wires{
        makeWire("h", Point{0.0, 0.0}, Point{100.0, 0.0}),
        makeWire("v", Point{50.0, -50.0}, Point{50.0, 50.0}),
    };

    auto hits = detector.detect_wire_intersections(wires);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].type, IntersectionType::Crossing);
    EXPECT_EQ(hits[0].point, (Point{50.0, 0.0}));
    EXPECT_EQ(hits[0].wire_a, "h");
    EXPECT_EQ(hits[0].wire_b, "v");
    EXPECT_DOUBLE_EQ(hits[0].severity, 0.8);
}

TEST(CollisionTests, CloseParallelRunsOverlap)
{
    CollisionDetector detector;
    std::vector<RoutedWire> wires{
        makeWire("a", Point{0.0, 0.0}, Point{100.0, 0.0}),
        makeWire("b", Point{20.0, 2.0}, Point{60.0, 2.0}),
    };

    auto hits = detector.detect_wire_intersections(wires);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].type, IntersectionType::Overlap);
    EXPECT_EQ(hits[0].point, (Point{40.0, 0.0}));
    EXPECT_DOUBLE_EQ(hits[0].severity, 1.0);
}

TEST(CollisionTests, ParallelAtBufferDistanceIsClear)
{
    CollisionDetector detector;
    std::vector<RoutedWire> wires{
        makeWire("a", Point{0.0, 0.0}, Point{100.0, 0.0}),
        makeWire("b", Point{20.0, 5.0}, Point{80.0, 5.0}),
    };

    EXPECT_TRUE(detector.detect_wire_intersections(wires).empty());
}

TEST(CollisionTests, SharedEndpointIsJunction)
{
    CollisionDetector detector;
    std::vector<RoutedWire> wires{
        makeWire("a", Point{0.0, 0.0}, Point{100.0, 0.0}),
        makeWire("b", Point{100.0, 0.0}, Point{100.0, 50.0}),
    };

    auto hits = detector.detect_wire_intersections(wires);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].type, IntersectionType::Junction);
    EXPECT_EQ(hits[0].point, (Point{100.0, 0.0}));
    EXPECT_DOUBLE_EQ(hits[0].severity, 0.1);
}

TEST(CollisionTests, DetectAllReportsEverything)
{
    CollisionDetector detector;
    std::vector<RoutedWire> wires{
        makeWire("h", Point{0.0, 0.0}, Point{100.0, 0.0}),
        makeWire("v", Point{50.0, -50.0}, Point{50.0, 50.0}),
    };
    std::vector<RoutingObstacle> obstacles{
        RoutingObstacle{"u1", Rect{40.0, -10.0, 20.0, 20.0}, ObstacleType::Component, 0}};

    auto reports = detector.detect_all(wires, obstacles);
    ASSERT_EQ(reports.size(), 3u);

    EXPECT_EQ(reports[0].wires, std::vector<std::string>{"h"});
    EXPECT_EQ(reports[0].severity, CollisionSeverity::High);
    EXPECT_EQ(reports[0].description, "wire h intersects obstacles u1");

    ASSERT_EQ(reports[1].points.size(), 2u);
    EXPECT_EQ(reports[1].points[0], (Point{50.0, -20.0}));

    EXPECT_EQ(reports[2].wires.size(), 2u);
    EXPECT_EQ(reports[2].severity, CollisionSeverity::High);
    EXPECT_EQ(reports[2].description, "wires h and v meet at a crossing");

    auto stats = detector.stats(wires, obstacles);
    EXPECT_EQ(stats.total, 3);
    EXPECT_EQ(stats.wire_obstacle, 2);
    EXPECT_EQ(stats.wire_wire, 1);
    EXPECT_EQ(stats.critical, 3);
    EXPECT_DOUBLE_EQ(stats.average_severity, 1.0);
}

TEST(CollisionTests, JunctionStatsAreLowSeverity)
{
    CollisionDetector detector;
    std::vector<RoutedWire> wires{
        makeWire("a", Point{0.0, 0.0}, Point{100.0, 0.0}),
        makeWire("b", Point{100.0, 0.0}, Point{100.0, 50.0}),
    };

    auto stats = detector.stats(wires, {});
    EXPECT_EQ(stats.total, 1);
    EXPECT_EQ(stats.critical, 0);
    EXPECT_DOUBLE_EQ(stats.average_severity, 0.2);

    auto empty = detector.stats({}, {});
    EXPECT_EQ(empty.total, 0);
    EXPECT_DOUBLE_EQ(empty.average_severity, 0.0);
}

TEST(CollisionTests, InvalidParametersThrow)
{
    CollisionDetector detector;
    EXPECT_THROW(detector.set_parameters(-1.0, 10.0), std::invalid_argument);
    EXPECT_THROW(detector.set_parameters(5.0, std::numeric_limits<double>::infinity()),
                 std::invalid_argument);
    EXPECT_DOUBLE_EQ(detector.wire_buffer(), 5.0);

    detector.set_parameters(2.0, 0.0);
    EXPECT_DOUBLE_EQ(detector.wire_buffer(), 2.0);
    EXPECT_DOUBLE_EQ(detector.obstacle_buffer(), 0.0);

    EXPECT_THROW(CollisionDetector(1.0, -3.0), std::invalid_argument);
}
