/*
 * Wire Router Core - Segment Synthesis
 * Part of the schematic wire routing engine
 *
 * Turns endpoints or grid paths into axis-aligned wire segments and merges
 * collinear runs.
 */

#pragma once

#include "types.hpp"
#include <vector>

namespace wireroute {

// Axis-aligned segment between a and b; a.x == b.x gives a vertical segment
WireSegment make_segment(const Point& a, const Point& b);

// L-route: along the dominant axis first (horizontal when |dx| >= |dy|),
// then the other. Axes with no displacement are omitted.
std::vector<WireSegment> route_orthogonal(const Point& start, const Point& end);

// One segment per consecutive pair of points. Repeated points are skipped;
// a pair differing on both axes is split with a horizontal-first corner.
std::vector<WireSegment> path_to_segments(const std::vector<Point>& path);

// Attach the exact start and end to a grid path whose ends sit on cell
// corners, adding at most one dog-leg per end and keeping the first and last
// grid moves straight.
std::vector<Point> anchor_path(const std::vector<Point>& path,
                               const Point& start, const Point& end);

// Merge consecutive same-orientation segments and drop zero-length ones.
// The output alternates orientation, so a second pass leaves it unchanged.
std::vector<WireSegment> optimize_segments(const std::vector<WireSegment>& segments);

}  // namespace wireroute
