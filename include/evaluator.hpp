/*
 * Wire Router Core - Route Evaluation
 * Part of the schematic wire routing engine
 */

#pragma once

#include "types.hpp"
#include <vector>

namespace wireroute {

// Quality in [0, 1]: starts at 1, loses 0.1 per bend beyond the second and a
// flat 0.2 when total_length exceeds 1.5x the Manhattan distance.
double route_quality(double total_length, int bend_count, double direct_distance);

// Aggregate length, bends and quality for a final segment list
RoutingResult evaluate_route(std::vector<WireSegment> segments,
                             const Point& start, const Point& end,
                             std::vector<RoutingObstacle> obstacles,
                             RouteMethod method);

}  // namespace wireroute
