/*
 * Wire Router Core - Occupancy Grid Implementation
 * Part of the schematic wire routing engine
 */

#include "grid.hpp"
#include "logging.hpp"
#include <cmath>
#include <algorithm>

namespace wireroute {

OccupancyGrid::OccupancyGrid(int cols, int rows, double resolution, const Rect& region)
    : cols_(cols), rows_(rows), resolution_(resolution), region_(region) {

    // Allocate contiguous cell storage
    cells_.resize(static_cast<size_t>(cols) * rows);
}

Rect OccupancyGrid::query_region(const Point& start, const Point& end) {
    double min_x = std::min(start.x, end.x) - kGridSearchMargin;
    double max_x = std::max(start.x, end.x) + kGridSearchMargin;
    double min_y = std::min(start.y, end.y) - kGridSearchMargin;
    double max_y = std::max(start.y, end.y) + kGridSearchMargin;
    return {min_x, min_y, max_x - min_x, max_y - min_y};
}

std::optional<OccupancyGrid> OccupancyGrid::build(
    const Point& start, const Point& end,
    const std::vector<RoutingObstacle>& obstacles,
    double avoidance_margin,
    size_t max_cells
) {
    Rect region = query_region(start, end);

    double cols = std::ceil(region.width / kGridCellSize);
    double rows = std::ceil(region.height / kGridCellSize);
    if (cols * rows > static_cast<double>(max_cells)) {
        log::get()->warn("grid of {}x{} cells exceeds limit of {}, skipping search",
                         cols, rows, max_cells);
        return std::nullopt;
    }

    OccupancyGrid grid(static_cast<int>(cols), static_cast<int>(rows),
                       kGridCellSize, region);

    auto is_terminal = [&](const RoutingObstacle& obstacle) {
        return obstacle.bounds.contains(start) || obstacle.bounds.contains(end);
    };

    // Endpoints' own components go first so the cells around each pin can be
    // reopened before the remaining obstacles are drawn over them.
    int rasterized = 0;
    for (const auto& obstacle : obstacles) {
        if (is_terminal(obstacle) &&
            grid.mark_world_rect(obstacle.bounds.inflated(avoidance_margin)) > 0) {
            ++rasterized;
        }
    }
    grid.clear_world_rect(Rect{start.x, start.y, 0.0, 0.0}.inflated(avoidance_margin));
    grid.clear_world_rect(Rect{end.x, end.y, 0.0, 0.0}.inflated(avoidance_margin));

    for (const auto& obstacle : obstacles) {
        if (!is_terminal(obstacle) &&
            grid.mark_world_rect(obstacle.bounds.inflated(avoidance_margin)) > 0) {
            ++rasterized;
        }
    }

    log::get()->debug("built {}x{} grid at ({}, {}): {} of {} obstacles, {} cells blocked, "
                      "{:.2f} MB",
                      grid.cols(), grid.rows(), region.x, region.y,
                      rasterized, obstacles.size(), grid.count_blocked(), grid.memory_mb());
    return grid;
}

void OccupancyGrid::mark_blocked(int x, int y) {
    if (!is_valid(x, y)) return;
    at(x, y).blocked = true;
}

void OccupancyGrid::mark_rect_blocked(int x1, int y1, int x2, int y2) {
    x1 = std::clamp(x1, 0, cols_ - 1);
    y1 = std::clamp(y1, 0, rows_ - 1);
    x2 = std::clamp(x2, 0, cols_ - 1);
    y2 = std::clamp(y2, 0, rows_ - 1);

    for (int y = y1; y <= y2; ++y) {
        for (int x = x1; x <= x2; ++x) {
            mark_blocked(x, y);
        }
    }
}

bool OccupancyGrid::cell_range(const Rect& bounds, int& x1, int& y1, int& x2, int& y2) const {
    // Work in floating point until the range is known to overlap the grid
    double fx1 = std::floor((bounds.left() - region_.x) / resolution_);
    double fx2 = std::floor((bounds.right() - region_.x) / resolution_);
    double fy1 = std::floor((bounds.top() - region_.y) / resolution_);
    double fy2 = std::floor((bounds.bottom() - region_.y) / resolution_);

    if (fx2 < 0 || fy2 < 0 || fx1 > cols_ - 1 || fy1 > rows_ - 1) {
        return false;
    }

    x1 = static_cast<int>(std::max(fx1, 0.0));
    y1 = static_cast<int>(std::max(fy1, 0.0));
    x2 = static_cast<int>(std::min(fx2, static_cast<double>(cols_ - 1)));
    y2 = static_cast<int>(std::min(fy2, static_cast<double>(rows_ - 1)));
    return true;
}

int OccupancyGrid::mark_world_rect(const Rect& bounds) {
    int x1, y1, x2, y2;
    if (!cell_range(bounds, x1, y1, x2, y2)) {
        return 0;
    }
    mark_rect_blocked(x1, y1, x2, y2);
    return (x2 - x1 + 1) * (y2 - y1 + 1);
}

void OccupancyGrid::clear_world_rect(const Rect& bounds) {
    int x1, y1, x2, y2;
    if (!cell_range(bounds, x1, y1, x2, y2)) {
        return;
    }
    for (int y = y1; y <= y2; ++y) {
        for (int x = x1; x <= x2; ++x) {
            at(x, y).blocked = false;
        }
    }
}

int OccupancyGrid::count_blocked() const {
    int count = 0;
    for (const auto& cell : cells_) {
        if (cell.blocked) count++;
    }
    return count;
}

float OccupancyGrid::memory_mb() const {
    size_t bytes = cells_.size() * sizeof(GridCell);
    return static_cast<float>(bytes) / (1024 * 1024);
}

}  // namespace wireroute
