/*
 * Wire Router Core - Collision Analysis
 * Part of the schematic wire routing engine
 *
 * Checks routed wires against obstacles and against each other. Detection
 * only: wires are never moved here.
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace wireroute {

struct RoutedWire {
    std::string id;
    Point start;
    Point end;
    std::vector<WireSegment> segments;
};

// Portion of one segment running through a buffered obstacle
struct ObstacleCollision {
    std::string wire_id;
    std::string obstacle_id;
    size_t segment_index = 0;
    std::vector<Point> points;  // Entry and exit, one point if they coincide
};

enum class IntersectionType : uint8_t {
    Crossing,
    Overlap,
    Junction,
};

struct WireIntersection {
    std::string wire_a;
    std::string wire_b;
    Point point;
    IntersectionType type = IntersectionType::Crossing;
    double severity = 0.0;  // 0-1
};

enum class CollisionSeverity : uint8_t {
    Low,
    Medium,
    High,
};

struct CollisionReport {
    std::vector<std::string> wires;
    std::vector<Point> points;
    CollisionSeverity severity = CollisionSeverity::Low;
    std::string description;
};

struct CollisionStats {
    int total = 0;
    int wire_wire = 0;
    int wire_obstacle = 0;
    int critical = 0;
    double average_severity = 0.0;
};

class CollisionDetector {
public:
    CollisionDetector() = default;
    CollisionDetector(double wire_buffer, double obstacle_buffer);

    // Obstacles whose bounds hold one of the wire's endpoints are its
    // terminals and are skipped.
    std::vector<ObstacleCollision> detect_obstacle_collisions(
        const RoutedWire& wire, const std::vector<RoutingObstacle>& obstacles) const;

    // Pairs sharing an endpoint report a single junction; other pairs report
    // every crossing and parallel overlap between their segments.
    std::vector<WireIntersection> detect_wire_intersections(
        const std::vector<RoutedWire>& wires) const;

    std::vector<CollisionReport> detect_all(
        const std::vector<RoutedWire>& wires,
        const std::vector<RoutingObstacle>& obstacles) const;

    CollisionStats stats(const std::vector<RoutedWire>& wires,
                         const std::vector<RoutingObstacle>& obstacles) const;

    void set_parameters(double wire_buffer, double obstacle_buffer);

    double wire_buffer() const { return wire_buffer_; }
    double obstacle_buffer() const { return obstacle_buffer_; }
    double junction_threshold() const { return junction_threshold_; }

private:
    std::optional<Point> shared_endpoint(const RoutedWire& a, const RoutedWire& b) const;
    std::optional<WireIntersection> intersect(const WireSegment& a,
                                              const WireSegment& b) const;

    double wire_buffer_ = 5.0;
    double obstacle_buffer_ = 10.0;
    double junction_threshold_ = 5.0;
};

const char* to_string(IntersectionType type);
const char* to_string(CollisionSeverity severity);

}  // namespace wireroute
