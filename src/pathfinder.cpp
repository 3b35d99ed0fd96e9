/*
 * Wire Router Core - A* Pathfinder Implementation
 * Part of the schematic wire routing engine
 */

#include "pathfinder.hpp"
#include <queue>
#include <cstdlib>
#include <algorithm>
#include <utility>

namespace wireroute {

Pathfinder::Pathfinder(const OccupancyGrid& grid)
    : grid_(grid) {

    neighbors_ = {
        {-1, 0},  // Left
        {1, 0},   // Right
        {0, -1},  // Up
        {0, 1},   // Down
    };
}

int Pathfinder::heuristic(int x, int y, const GridPos& goal) const {
    return std::abs(x - goal.x) + std::abs(y - goal.y);
}

std::optional<std::vector<Point>> Pathfinder::find_path(const Point& start,
                                                        const Point& end) {
    auto cells = find_cell_path(grid_.world_to_grid(start), grid_.world_to_grid(end));
    if (!cells) {
        return std::nullopt;
    }

    std::vector<Point> path;
    path.reserve(cells->size());
    for (const auto& cell : *cells) {
        path.push_back(grid_.grid_to_world(cell));
    }
    return path;
}

std::optional<std::vector<GridPos>> Pathfinder::find_cell_path(const GridPos& start,
                                                               const GridPos& goal) {
    last_iterations_ = 0;
    last_nodes_explored_ = 0;

    if (!grid_.is_valid(start.x, start.y) || !grid_.is_valid(goal.x, goal.y)) {
        return std::nullopt;
    }

    // A* data structures
    using PQ = std::priority_queue<AStarNode, std::vector<AStarNode>, std::greater<AStarNode>>;
    PQ open_set;
    std::unordered_set<GridPos, GridPosHash> closed_set;
    std::unordered_map<GridPos, std::pair<int, int>, GridPosHash> best;  // g, bends
    std::vector<AStarNode> closed_list;  // For path reconstruction

    int h0 = heuristic(start.x, start.y, goal);
    open_set.push(AStarNode{h0, 0, h0, 0, start.x, start.y, -1, 0, 0});
    best[start] = {0, 0};

    int max_iterations = grid_.cols() * grid_.rows() * 4;

    while (!open_set.empty() && last_iterations_ < max_iterations) {
        last_iterations_++;

        AStarNode current = open_set.top();
        open_set.pop();

        GridPos current_pos{current.x, current.y};
        if (closed_set.count(current_pos)) {
            continue;  // Stale entry
        }
        closed_set.insert(current_pos);

        int current_idx = static_cast<int>(closed_list.size());
        closed_list.push_back(current);
        last_nodes_explored_++;

        if (current_pos == goal) {
            return reconstruct_path(closed_list, current_idx);
        }

        for (const auto& [dx, dy] : neighbors_) {
            int nx = current.x + dx;
            int ny = current.y + dy;

            if (!grid_.is_valid(nx, ny)) {
                continue;
            }

            // The goal may sit inside an inflated obstacle (a pin on a
            // component edge); it stays enterable.
            GridPos neighbor_pos{nx, ny};
            if (grid_.at(nx, ny).blocked && neighbor_pos != goal) {
                continue;
            }

            if (closed_set.count(neighbor_pos)) {
                continue;
            }

            bool turned = (current.dx != 0 || current.dy != 0) &&
                          (current.dx != dx || current.dy != dy);
            int new_g = current.g_score + 1;
            int new_bends = current.bends + (turned ? 1 : 0);

            auto it = best.find(neighbor_pos);
            if (it == best.end() || new_g < it->second.first ||
                (new_g == it->second.first && new_bends < it->second.second)) {
                best[neighbor_pos] = {new_g, new_bends};
                int h = heuristic(nx, ny, goal);
                open_set.push(AStarNode{new_g + h, new_g, h, new_bends,
                                        nx, ny, current_idx, dx, dy});
            }
        }
    }

    // No path found
    return std::nullopt;
}

std::vector<GridPos> Pathfinder::reconstruct_path(const std::vector<AStarNode>& closed_list,
                                                  int end_idx) const {
    std::vector<GridPos> path;
    int idx = end_idx;
    while (idx >= 0 && idx < static_cast<int>(closed_list.size())) {
        const auto& node = closed_list[idx];
        path.push_back({node.x, node.y});
        idx = node.parent_idx;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

}  // namespace wireroute
