/*
 * Wire Router Core - Routing Engine
 * Part of the schematic wire routing engine
 *
 * Entry point for the diagram editor. Holds the obstacle registry, the
 * current constraints and a lazily built occupancy grid. Each route_wire
 * call is synchronous and independent of other wires.
 *
 * With obstacles present and avoidance requested, a wire is routed by A*
 * over a grid covering the endpoints' bounding box plus kGridSearchMargin.
 * When that search fails the engine falls back to the unobstructed L-route;
 * routing never fails for geometric reasons.
 */

#pragma once

#include "types.hpp"
#include "grid.hpp"
#include "obstacle_registry.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wireroute {

struct RoutingStats {
    uint64_t routes = 0;
    uint64_t grid_builds = 0;
    uint64_t grid_reuses = 0;
    uint64_t searches = 0;
    uint64_t fallbacks = 0;
    int last_iterations = 0;
    int last_nodes_explored = 0;
};

class WireRoutingEngine {
public:
    WireRoutingEngine() = default;

    // Throws std::invalid_argument for negative or non-finite values
    explicit WireRoutingEngine(const RoutingConstraints& constraints);

    // Obstacle lifecycle. Every effective mutation invalidates the grid.
    void add_obstacle(const RoutingObstacle& obstacle);
    bool update_obstacle(const std::string& id, const ObstacleUpdate& update);
    bool remove_obstacle(const std::string& id);
    void clear_obstacles();

    const ObstacleRegistry& obstacles() const { return registry_; }

    // Throws std::invalid_argument for non-finite coordinates
    RoutingResult route_wire(const Point& start, const Point& end,
                             const RoutingOptions& options = {});

    // Merge set fields and invalidate the grid. Throws std::invalid_argument
    // for negative or non-finite values.
    void set_constraints(const ConstraintsUpdate& update);
    RoutingConstraints get_constraints() const { return constraints_; }

    const RoutingStats& stats() const { return stats_; }
    void reset_stats() { stats_ = RoutingStats{}; }

    bool has_valid_grid() const;

private:
    std::vector<WireSegment> route_with_pathfinding(const Point& start, const Point& end,
                                                    RouteMethod& method);
    std::vector<WireSegment> fall_back(const Point& start, const Point& end,
                                       RouteMethod& method, const char* reason);

    // Cached grid when it was built for this exact query region and the
    // obstacle set has not changed since, otherwise a fresh build.
    const OccupancyGrid* ensure_grid(const Point& start, const Point& end);
    void invalidate_grid();

    static void validate_constraints(const RoutingConstraints& constraints);

    ObstacleRegistry registry_;
    RoutingConstraints constraints_;

    std::optional<OccupancyGrid> grid_;
    uint64_t grid_generation_ = 0;

    RoutingStats stats_;
};

}  // namespace wireroute
