/*
 * Wire Router Core - Segment Synthesis Implementation
 * Part of the schematic wire routing engine
 */

#include "segments.hpp"
#include <cmath>

namespace wireroute {

namespace {

WireSegment oriented_segment(const Point& a, const Point& b, SegmentOrientation orientation) {
    double length = orientation == SegmentOrientation::Horizontal
        ? std::abs(b.x - a.x) : std::abs(b.y - a.y);
    return WireSegment{a, b, orientation, length};
}

}  // namespace

WireSegment make_segment(const Point& a, const Point& b) {
    auto orientation = a.x == b.x ? SegmentOrientation::Vertical
                                  : SegmentOrientation::Horizontal;
    return oriented_segment(a, b, orientation);
}

std::vector<WireSegment> route_orthogonal(const Point& start, const Point& end) {
    std::vector<WireSegment> segments;
    double dx = end.x - start.x;
    double dy = end.y - start.y;

    if (std::abs(dx) >= std::abs(dy)) {
        // Horizontal first, then vertical
        Point corner{end.x, start.y};
        if (dx != 0) {
            segments.push_back(oriented_segment(start, corner, SegmentOrientation::Horizontal));
        }
        if (dy != 0) {
            segments.push_back(oriented_segment(corner, end, SegmentOrientation::Vertical));
        }
    } else {
        // Vertical first, then horizontal
        Point corner{start.x, end.y};
        if (dy != 0) {
            segments.push_back(oriented_segment(start, corner, SegmentOrientation::Vertical));
        }
        if (dx != 0) {
            segments.push_back(oriented_segment(corner, end, SegmentOrientation::Horizontal));
        }
    }

    return segments;
}

std::vector<WireSegment> path_to_segments(const std::vector<Point>& path) {
    std::vector<WireSegment> segments;
    if (path.size() < 2) {
        return segments;
    }
    segments.reserve(path.size() - 1);

    for (size_t i = 0; i + 1 < path.size(); ++i) {
        const Point& a = path[i];
        const Point& b = path[i + 1];
        if (a == b) {
            continue;
        }
        if (a.x != b.x && a.y != b.y) {
            Point corner{b.x, a.y};
            segments.push_back(oriented_segment(a, corner, SegmentOrientation::Horizontal));
            segments.push_back(oriented_segment(corner, b, SegmentOrientation::Vertical));
            continue;
        }
        segments.push_back(make_segment(a, b));
    }

    return segments;
}

std::vector<Point> anchor_path(const std::vector<Point>& path,
                               const Point& start, const Point& end) {
    if (path.empty()) {
        return {start, end};
    }

    std::vector<Point> anchored;
    anchored.reserve(path.size() + 4);

    const Point& first = path.front();
    anchored.push_back(start);
    if (start.x != first.x && start.y != first.y) {
        // Arrive at the first cell along the axis of the first grid move
        bool first_move_horizontal = path.size() > 1 && path[1].y == first.y;
        anchored.push_back(first_move_horizontal ? Point{start.x, first.y}
                                                 : Point{first.x, start.y});
    }
    anchored.insert(anchored.end(), path.begin(), path.end());

    const Point& last = path.back();
    if (end.x != last.x && end.y != last.y) {
        // Leave the last cell along the axis of the last grid move
        bool last_move_horizontal = path.size() > 1 && path[path.size() - 2].y == last.y;
        anchored.push_back(last_move_horizontal ? Point{end.x, last.y}
                                                : Point{last.x, end.y});
    }
    anchored.push_back(end);

    return anchored;
}

std::vector<WireSegment> optimize_segments(const std::vector<WireSegment>& segments) {
    std::vector<WireSegment> optimized;
    optimized.reserve(segments.size());

    for (const auto& segment : segments) {
        if (segment.start == segment.end) {
            continue;
        }

        if (optimized.empty() || optimized.back().orientation != segment.orientation) {
            optimized.push_back(segment);
            continue;
        }

        // Collinear with the previous run: extend it. A run that folds back
        // onto its own start vanishes, letting its neighbours merge next.
        WireSegment merged = oriented_segment(optimized.back().start, segment.end,
                                              segment.orientation);
        optimized.pop_back();
        if (merged.start != merged.end) {
            optimized.push_back(merged);
        }
    }

    return optimized;
}

}  // namespace wireroute
