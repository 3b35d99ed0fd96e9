/*
 * Wire Router Core - Route Evaluation Implementation
 * Part of the schematic wire routing engine
 */

#include "evaluator.hpp"
#include <algorithm>
#include <utility>

namespace wireroute {

namespace {

constexpr int kFreeBends = 2;
constexpr double kBendPenalty = 0.1;
constexpr double kDetourRatio = 1.5;
constexpr double kDetourPenalty = 0.2;

}  // namespace

double route_quality(double total_length, int bend_count, double direct_distance) {
    double quality = 1.0;

    if (bend_count > kFreeBends) {
        quality -= kBendPenalty * (bend_count - kFreeBends);
    }

    if (total_length > direct_distance * kDetourRatio) {
        quality -= kDetourPenalty;
    }

    return std::clamp(quality, 0.0, 1.0);
}

RoutingResult evaluate_route(std::vector<WireSegment> segments,
                             const Point& start, const Point& end,
                             std::vector<RoutingObstacle> obstacles,
                             RouteMethod method) {
    RoutingResult result;
    result.segments = std::move(segments);
    result.obstacles = std::move(obstacles);
    result.method = method;

    for (const auto& segment : result.segments) {
        result.total_length += segment.length;
    }
    result.bend_count = std::max(0, static_cast<int>(result.segments.size()) - 1);
    result.quality = route_quality(result.total_length, result.bend_count,
                                   manhattan_distance(start, end));
    return result;
}

}  // namespace wireroute
