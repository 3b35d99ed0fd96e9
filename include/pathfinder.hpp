/*
 * Wire Router Core - A* Pathfinder
 * Part of the schematic wire routing engine
 *
 * A* over a 4-connected occupancy grid:
 * - Orthogonal moves only, uniform step cost of 1 per cell
 * - Manhattan heuristic (admissible and consistent for this cost model)
 * - Binary-heap open set; closed cells are never reopened
 * - Ties on f prefer fewer direction changes
 */

#pragma once

#include "types.hpp"
#include "grid.hpp"
#include <optional>
#include <unordered_set>
#include <unordered_map>
#include <vector>

namespace wireroute {

class Pathfinder {
public:
    explicit Pathfinder(const OccupancyGrid& grid);

    // Cell path from the cell containing start to the cell containing end,
    // as world-space cell corners. std::nullopt when the goal is unreachable.
    std::optional<std::vector<Point>> find_path(const Point& start, const Point& end);

    // Same search in grid coordinates
    std::optional<std::vector<GridPos>> find_cell_path(const GridPos& start,
                                                       const GridPos& goal);

    // Statistics from last search
    int get_iterations() const { return last_iterations_; }
    int get_nodes_explored() const { return last_nodes_explored_; }

private:
    struct Step {
        int dx;
        int dy;
    };

    // Manhattan distance in cells
    int heuristic(int x, int y, const GridPos& goal) const;

    std::vector<GridPos> reconstruct_path(const std::vector<AStarNode>& closed_list,
                                          int end_idx) const;

    const OccupancyGrid& grid_;
    std::vector<Step> neighbors_;

    int last_iterations_ = 0;
    int last_nodes_explored_ = 0;
};

}  // namespace wireroute
