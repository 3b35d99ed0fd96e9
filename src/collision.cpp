/*
 * Wire Router Core - Collision Analysis Implementation
 * Part of the schematic wire routing engine
 */

#include "collision.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace wireroute {

namespace {

constexpr double kJunctionSeverity = 0.1;
constexpr double kCrossingSeverity = 0.8;
constexpr double kOverlapSeverity = 1.0;

double distance(const Point& a, const Point& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

// Coordinate along the segment's axis, and the fixed coordinate across it
double axis_min(const WireSegment& s) {
    return s.orientation == SegmentOrientation::Horizontal
        ? std::min(s.start.x, s.end.x) : std::min(s.start.y, s.end.y);
}

double axis_max(const WireSegment& s) {
    return s.orientation == SegmentOrientation::Horizontal
        ? std::max(s.start.x, s.end.x) : std::max(s.start.y, s.end.y);
}

double cross_coord(const WireSegment& s) {
    return s.orientation == SegmentOrientation::Horizontal ? s.start.y : s.start.x;
}

CollisionSeverity classify(double severity) {
    if (severity > 0.7) return CollisionSeverity::High;
    if (severity > 0.3) return CollisionSeverity::Medium;
    return CollisionSeverity::Low;
}

double severity_weight(CollisionSeverity severity) {
    switch (severity) {
        case CollisionSeverity::High: return 1.0;
        case CollisionSeverity::Medium: return 0.5;
        case CollisionSeverity::Low: return 0.2;
    }
    return 0.0;
}

}  // namespace

CollisionDetector::CollisionDetector(double wire_buffer, double obstacle_buffer) {
    set_parameters(wire_buffer, obstacle_buffer);
}

void CollisionDetector::set_parameters(double wire_buffer, double obstacle_buffer) {
    if (!std::isfinite(wire_buffer) || !std::isfinite(obstacle_buffer) ||
        wire_buffer < 0 || obstacle_buffer < 0) {
        throw std::invalid_argument("collision buffers must be finite and non-negative");
    }
    wire_buffer_ = wire_buffer;
    obstacle_buffer_ = obstacle_buffer;
}

std::vector<ObstacleCollision> CollisionDetector::detect_obstacle_collisions(
    const RoutedWire& wire, const std::vector<RoutingObstacle>& obstacles) const {

    std::vector<ObstacleCollision> collisions;

    for (const auto& obstacle : obstacles) {
        if (obstacle.bounds.contains(wire.start) || obstacle.bounds.contains(wire.end)) {
            continue;
        }
        Rect zone = obstacle.bounds.inflated(obstacle_buffer_);

        for (size_t i = 0; i < wire.segments.size(); ++i) {
            const auto& segment = wire.segments[i];
            bool horizontal = segment.orientation == SegmentOrientation::Horizontal;

            double fixed = cross_coord(segment);
            double lo = axis_min(segment);
            double hi = axis_max(segment);
            double zone_fixed_lo = horizontal ? zone.top() : zone.left();
            double zone_fixed_hi = horizontal ? zone.bottom() : zone.right();
            double zone_lo = horizontal ? zone.left() : zone.top();
            double zone_hi = horizontal ? zone.right() : zone.bottom();

            if (fixed < zone_fixed_lo || fixed > zone_fixed_hi) continue;
            if (hi < zone_lo || lo > zone_hi) continue;

            double enter = std::max(lo, zone_lo);
            double leave = std::min(hi, zone_hi);
            auto at = [&](double along) {
                return horizontal ? Point{along, fixed} : Point{fixed, along};
            };

            ObstacleCollision collision{wire.id, obstacle.id, i, {at(enter)}};
            if (leave != enter) {
                collision.points.push_back(at(leave));
            }
            collisions.push_back(std::move(collision));
        }
    }

    return collisions;
}

std::optional<Point> CollisionDetector::shared_endpoint(const RoutedWire& a,
                                                        const RoutedWire& b) const {
    if (distance(a.start, b.start) < junction_threshold_) return a.start;
    if (distance(a.start, b.end) < junction_threshold_) return a.start;
    if (distance(a.end, b.start) < junction_threshold_) return a.end;
    if (distance(a.end, b.end) < junction_threshold_) return a.end;
    return std::nullopt;
}

std::optional<WireIntersection> CollisionDetector::intersect(const WireSegment& a,
                                                             const WireSegment& b) const {
    if (a.orientation == b.orientation) {
        // Parallel runs closer than the wire buffer with a shared extent
        if (std::abs(cross_coord(a) - cross_coord(b)) >= wire_buffer_) {
            return std::nullopt;
        }
        double lo = std::max(axis_min(a), axis_min(b));
        double hi = std::min(axis_max(a), axis_max(b));
        if (lo >= hi) {
            return std::nullopt;
        }
        double mid = (lo + hi) / 2;
        Point point = a.orientation == SegmentOrientation::Horizontal
            ? Point{mid, cross_coord(a)} : Point{cross_coord(a), mid};
        return WireIntersection{{}, {}, point, IntersectionType::Overlap, kOverlapSeverity};
    }

    const WireSegment& h = a.orientation == SegmentOrientation::Horizontal ? a : b;
    const WireSegment& v = a.orientation == SegmentOrientation::Horizontal ? b : a;
    double x = cross_coord(v);
    double y = cross_coord(h);
    if (x < axis_min(h) || x > axis_max(h) || y < axis_min(v) || y > axis_max(v)) {
        return std::nullopt;
    }
    return WireIntersection{{}, {}, Point{x, y}, IntersectionType::Crossing, kCrossingSeverity};
}

std::vector<WireIntersection> CollisionDetector::detect_wire_intersections(
    const std::vector<RoutedWire>& wires) const {

    std::vector<WireIntersection> intersections;

    for (size_t i = 0; i < wires.size(); ++i) {
        for (size_t j = i + 1; j < wires.size(); ++j) {
            const auto& wire_a = wires[i];
            const auto& wire_b = wires[j];

            if (auto shared = shared_endpoint(wire_a, wire_b)) {
                intersections.push_back({wire_a.id, wire_b.id, *shared,
                                         IntersectionType::Junction, kJunctionSeverity});
                continue;
            }

            for (const auto& seg_a : wire_a.segments) {
                for (const auto& seg_b : wire_b.segments) {
                    if (auto hit = intersect(seg_a, seg_b)) {
                        hit->wire_a = wire_a.id;
                        hit->wire_b = wire_b.id;
                        intersections.push_back(std::move(*hit));
                    }
                }
            }
        }
    }

    return intersections;
}

std::vector<CollisionReport> CollisionDetector::detect_all(
    const std::vector<RoutedWire>& wires,
    const std::vector<RoutingObstacle>& obstacles) const {

    std::vector<CollisionReport> reports;

    for (const auto& wire : wires) {
        auto hits = detect_obstacle_collisions(wire, obstacles);
        if (hits.empty()) {
            continue;
        }

        CollisionReport report;
        report.wires = {wire.id};
        report.severity = CollisionSeverity::High;
        std::vector<std::string> ids;
        std::string id_list;
        for (const auto& hit : hits) {
            report.points.insert(report.points.end(), hit.points.begin(), hit.points.end());
            if (std::find(ids.begin(), ids.end(), hit.obstacle_id) == ids.end()) {
                id_list += ids.empty() ? hit.obstacle_id : ", " + hit.obstacle_id;
                ids.push_back(hit.obstacle_id);
            }
        }
        report.description = fmt::format("wire {} intersects obstacles {}", wire.id, id_list);
        reports.push_back(std::move(report));
    }

    for (const auto& hit : detect_wire_intersections(wires)) {
        CollisionReport report;
        report.wires = {hit.wire_a, hit.wire_b};
        report.points = {hit.point};
        report.severity = classify(hit.severity);
        report.description = fmt::format("wires {} and {} meet at a {}",
                                         hit.wire_a, hit.wire_b, to_string(hit.type));
        reports.push_back(std::move(report));
    }

    log::get()->debug("collision check: {} wires, {} obstacles, {} reports",
                      wires.size(), obstacles.size(), reports.size());
    return reports;
}

CollisionStats CollisionDetector::stats(const std::vector<RoutedWire>& wires,
                                        const std::vector<RoutingObstacle>& obstacles) const {
    CollisionStats stats;
    double total_weight = 0.0;

    for (const auto& report : detect_all(wires, obstacles)) {
        stats.total++;
        if (report.wires.size() > 1) {
            stats.wire_wire++;
        } else {
            stats.wire_obstacle++;
        }
        if (report.severity == CollisionSeverity::High) {
            stats.critical++;
        }
        total_weight += severity_weight(report.severity);
    }

    stats.average_severity = stats.total > 0 ? total_weight / stats.total : 0.0;
    return stats;
}

const char* to_string(IntersectionType type) {
    switch (type) {
        case IntersectionType::Crossing: return "crossing";
        case IntersectionType::Overlap: return "overlap";
        case IntersectionType::Junction: return "junction";
    }
    return "unknown";
}

const char* to_string(CollisionSeverity severity) {
    switch (severity) {
        case CollisionSeverity::Low: return "low";
        case CollisionSeverity::Medium: return "medium";
        case CollisionSeverity::High: return "high";
    }
    return "unknown";
}

}  // namespace wireroute
