/*
 * Wire Router Core - Common Types
 * Part of the schematic wire routing engine
 */

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace wireroute {

// Grid resolution and search horizon in world units. Query independent.
constexpr double kGridCellSize = 10.0;
constexpr double kGridSearchMargin = 100.0;

// Upper bound on cells rasterized for a single query
constexpr std::size_t kMaxGridCells = 4'000'000;

struct Point {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

// Axis-aligned box, origin at (x, y), non-negative extent
struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    double left() const { return x; }
    double top() const { return y; }
    double right() const { return x + width; }
    double bottom() const { return y + height; }

    Rect inflated(double margin) const {
        return {x - margin, y - margin, width + margin * 2, height + margin * 2};
    }

    // Closed-interval containment (edges count as inside)
    bool contains(const Point& p) const {
        return p.x >= left() && p.x <= right() && p.y >= top() && p.y <= bottom();
    }

    bool contains(const Rect& other) const {
        return other.left() >= left() && other.right() <= right() &&
               other.top() >= top() && other.bottom() <= bottom();
    }

    bool intersects(const Rect& other) const {
        return other.left() <= right() && other.right() >= left() &&
               other.top() <= bottom() && other.bottom() >= top();
    }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
};

enum class ObstacleType : uint8_t {
    Component,
    Wire,
    Keepout,
};

struct RoutingObstacle {
    std::string id;
    Rect bounds;
    ObstacleType type = ObstacleType::Component;
    int priority = 0;
};

// Partial update for an existing obstacle; unset fields are left untouched
struct ObstacleUpdate {
    std::optional<Rect> bounds;
    std::optional<ObstacleType> type;
    std::optional<int> priority;
};

enum class SegmentOrientation : uint8_t {
    Horizontal,
    Vertical,
};

struct WireSegment {
    Point start;
    Point end;
    SegmentOrientation orientation = SegmentOrientation::Horizontal;
    double length = 0.0;

    bool operator==(const WireSegment& other) const {
        return start == other.start && end == other.end &&
               orientation == other.orientation && length == other.length;
    }
};

// Only avoidance_margin drives routing; the rest are stored policy values
struct RoutingConstraints {
    double min_wire_spacing = 10.0;
    double preferred_wire_spacing = 20.0;
    int max_bend_count = 6;
    double preferred_bend_radius = 5.0;
    double avoidance_margin = 5.0;
};

struct ConstraintsUpdate {
    std::optional<double> min_wire_spacing;
    std::optional<double> preferred_wire_spacing;
    std::optional<int> max_bend_count;
    std::optional<double> preferred_bend_radius;
    std::optional<double> avoidance_margin;
};

// Diagonal is accepted but routed orthogonally
enum class RoutingStyle : uint8_t {
    Orthogonal,
    Diagonal,
    Manhattan,
};

struct RoutingOptions {
    RoutingStyle style = RoutingStyle::Orthogonal;
    bool avoid_obstacles = true;
    bool optimize = true;
};

// Which strategy produced the segments of a result
enum class RouteMethod : uint8_t {
    Direct,
    GridSearch,
    Fallback,
};

struct RoutingResult {
    std::vector<WireSegment> segments;
    double total_length = 0.0;
    int bend_count = 0;
    double quality = 1.0;  // 0-1 score
    std::vector<RoutingObstacle> obstacles;
    RouteMethod method = RouteMethod::Direct;
};

// Grid cell coordinates
struct GridPos {
    int x = 0;
    int y = 0;

    bool operator==(const GridPos& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const GridPos& other) const { return !(*this == other); }
};

// A* node for priority queue
struct AStarNode {
    int f_score;
    int g_score;
    int h_score;
    int bends;       // Direction changes along the path so far
    int x;
    int y;
    int parent_idx;  // Index in closed list, -1 if no parent
    int dx;          // Direction from parent
    int dy;

    // Min-heap ordering: lower f first, then fewer bends, then closer to goal
    bool operator>(const AStarNode& other) const {
        if (f_score != other.f_score) return f_score > other.f_score;
        if (bends != other.bends) return bends > other.bends;
        return h_score > other.h_score;
    }
};

// Hash for grid coordinates in unordered containers
struct GridPosHash {
    size_t operator()(const GridPos& pos) const {
        return std::hash<int>()(pos.x) ^ (std::hash<int>()(pos.y) << 16);
    }
};

inline double manhattan_distance(const Point& a, const Point& b) {
    return std::abs(b.x - a.x) + std::abs(b.y - a.y);
}

inline bool is_finite(const Point& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

const char* to_string(ObstacleType type);
const char* to_string(SegmentOrientation orientation);
const char* to_string(RouteMethod method);

}  // namespace wireroute
