/*
 * Wire Router Core - Routing Engine Implementation
 * Part of the schematic wire routing engine
 */

#include "routing_engine.hpp"
#include "evaluator.hpp"
#include "logging.hpp"
#include "pathfinder.hpp"
#include "segments.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace wireroute {

WireRoutingEngine::WireRoutingEngine(const RoutingConstraints& constraints)
    : constraints_(constraints) {
    validate_constraints(constraints_);
}

void WireRoutingEngine::validate_constraints(const RoutingConstraints& c) {
    auto bad = [](double v) { return !std::isfinite(v) || v < 0; };
    if (bad(c.min_wire_spacing) || bad(c.preferred_wire_spacing) ||
        bad(c.preferred_bend_radius) || bad(c.avoidance_margin) ||
        c.max_bend_count < 0) {
        log::get()->warn("rejecting routing constraints: margin={} spacing={}/{} "
                         "bends={} radius={}",
                         c.avoidance_margin, c.min_wire_spacing, c.preferred_wire_spacing,
                         c.max_bend_count, c.preferred_bend_radius);
        throw std::invalid_argument("routing constraints must be finite and non-negative");
    }
}

void WireRoutingEngine::add_obstacle(const RoutingObstacle& obstacle) {
    registry_.add(obstacle);
    invalidate_grid();
}

bool WireRoutingEngine::update_obstacle(const std::string& id, const ObstacleUpdate& update) {
    if (!registry_.update(id, update)) {
        return false;
    }
    invalidate_grid();
    return true;
}

bool WireRoutingEngine::remove_obstacle(const std::string& id) {
    if (!registry_.remove(id)) {
        return false;
    }
    invalidate_grid();
    return true;
}

void WireRoutingEngine::clear_obstacles() {
    registry_.clear();
    invalidate_grid();
}

void WireRoutingEngine::set_constraints(const ConstraintsUpdate& update) {
    RoutingConstraints merged = constraints_;
    if (update.min_wire_spacing) merged.min_wire_spacing = *update.min_wire_spacing;
    if (update.preferred_wire_spacing) merged.preferred_wire_spacing = *update.preferred_wire_spacing;
    if (update.max_bend_count) merged.max_bend_count = *update.max_bend_count;
    if (update.preferred_bend_radius) merged.preferred_bend_radius = *update.preferred_bend_radius;
    if (update.avoidance_margin) merged.avoidance_margin = *update.avoidance_margin;

    validate_constraints(merged);
    constraints_ = merged;
    invalidate_grid();
}

bool WireRoutingEngine::has_valid_grid() const {
    return grid_.has_value() && grid_generation_ == registry_.generation();
}

void WireRoutingEngine::invalidate_grid() {
    grid_.reset();
}

RoutingResult WireRoutingEngine::route_wire(const Point& start, const Point& end,
                                            const RoutingOptions& options) {
    if (!is_finite(start) || !is_finite(end)) {
        log::get()->warn("rejecting route request ({}, {}) -> ({}, {})",
                         start.x, start.y, end.x, end.y);
        throw std::invalid_argument("route endpoints must be finite");
    }

    stats_.routes++;

    // Every routing style resolves to orthogonal segments
    RouteMethod method = RouteMethod::Direct;
    std::vector<WireSegment> segments;
    if (start != end && options.avoid_obstacles && !registry_.empty()) {
        segments = route_with_pathfinding(start, end, method);
    } else {
        segments = route_orthogonal(start, end);
    }

    if (options.optimize) {
        segments = optimize_segments(segments);
    }

    return evaluate_route(std::move(segments), start, end,
                          registry_.obstacles(), method);
}

std::vector<WireSegment> WireRoutingEngine::route_with_pathfinding(
    const Point& start, const Point& end, RouteMethod& method) {

    const OccupancyGrid* grid = ensure_grid(start, end);
    if (!grid) {
        return fall_back(start, end, method, "grid too large");
    }

    Pathfinder pathfinder(*grid);
    auto path = pathfinder.find_path(start, end);

    stats_.searches++;
    stats_.last_iterations = pathfinder.get_iterations();
    stats_.last_nodes_explored = pathfinder.get_nodes_explored();
    log::get()->debug("search ({}, {}) -> ({}, {}): {} iterations, {} nodes explored",
                      start.x, start.y, end.x, end.y,
                      stats_.last_iterations, stats_.last_nodes_explored);

    if (!path) {
        return fall_back(start, end, method, "no path");
    }
    if (path->size() < 2) {
        return fall_back(start, end, method, "degenerate path");
    }

    method = RouteMethod::GridSearch;
    return path_to_segments(anchor_path(*path, start, end));
}

std::vector<WireSegment> WireRoutingEngine::fall_back(const Point& start, const Point& end,
                                                      RouteMethod& method, const char* reason) {
    stats_.fallbacks++;
    method = RouteMethod::Fallback;
    log::get()->info("falling back to direct route ({}, {}) -> ({}, {}): {}",
                     start.x, start.y, end.x, end.y, reason);
    return route_orthogonal(start, end);
}

const OccupancyGrid* WireRoutingEngine::ensure_grid(const Point& start, const Point& end) {
    Rect region = OccupancyGrid::query_region(start, end);
    if (has_valid_grid() && grid_->region() == region) {
        stats_.grid_reuses++;
        return &*grid_;
    }

    grid_ = OccupancyGrid::build(start, end, registry_.obstacles(),
                                 constraints_.avoidance_margin);
    grid_generation_ = registry_.generation();
    if (!grid_) {
        return nullptr;
    }
    stats_.grid_builds++;
    return &*grid_;
}

}  // namespace wireroute
