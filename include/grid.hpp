/*
 * Wire Router Core - Occupancy Grid
 * Part of the schematic wire routing engine
 *
 * Query-scoped 2D raster of free/blocked cells covering the bounding box of a
 * start/end pair plus a fixed search margin. Contiguous row-major storage.
 */

#pragma once

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

namespace wireroute {

struct GridCell {
    bool blocked = false;
};

class OccupancyGrid {
public:
    OccupancyGrid(int cols, int rows, double resolution, const Rect& region);

    // World region searched for a start/end pair: their bounding box grown by
    // kGridSearchMargin on every side.
    static Rect query_region(const Point& start, const Point& end);

    // Rasterize obstacles (inflated by avoidance_margin) over the query region.
    // Cells within avoidance_margin of an endpoint stay free unless an obstacle
    // other than that endpoint's own component covers them.
    // Returns std::nullopt when the grid would exceed max_cells.
    static std::optional<OccupancyGrid> build(
        const Point& start, const Point& end,
        const std::vector<RoutingObstacle>& obstacles,
        double avoidance_margin,
        size_t max_cells = kMaxGridCells);

    // Cell access - inline for performance
    inline GridCell& at(int x, int y) {
        return cells_[index(x, y)];
    }

    inline const GridCell& at(int x, int y) const {
        return cells_[index(x, y)];
    }

    inline bool is_valid(int x, int y) const {
        return x >= 0 && x < cols_ && y >= 0 && y < rows_;
    }

    inline bool is_free(int x, int y) const {
        return is_valid(x, y) && !at(x, y).blocked;
    }

    // Coordinate conversion. A cell maps to its lower (top-left) corner.
    inline GridPos world_to_grid(const Point& p) const {
        double gx = std::floor((p.x - region_.x) / resolution_);
        double gy = std::floor((p.y - region_.y) / resolution_);
        return {static_cast<int>(std::clamp(gx, 0.0, static_cast<double>(cols_ - 1))),
                static_cast<int>(std::clamp(gy, 0.0, static_cast<double>(rows_ - 1)))};
    }

    inline Point grid_to_world(const GridPos& pos) const {
        return {region_.x + pos.x * resolution_, region_.y + pos.y * resolution_};
    }

    void mark_blocked(int x, int y);
    void mark_rect_blocked(int x1, int y1, int x2, int y2);

    // Block every cell whose footprint intersects bounds. Returns the number
    // of cells touched, 0 when bounds lie outside the grid.
    int mark_world_rect(const Rect& bounds);

    // Free every cell whose footprint intersects bounds
    void clear_world_rect(const Rect& bounds);

    // Accessors
    int cols() const { return cols_; }
    int rows() const { return rows_; }
    double resolution() const { return resolution_; }
    const Rect& region() const { return region_; }
    size_t total_cells() const { return cells_.size(); }

    // Statistics
    int count_blocked() const;
    float memory_mb() const;

private:
    // Clamped cell range covered by a world rectangle, false if disjoint
    bool cell_range(const Rect& bounds, int& x1, int& y1, int& x2, int& y2) const;

    inline size_t index(int x, int y) const {
        return static_cast<size_t>(y) * cols_ + static_cast<size_t>(x);
    }

    std::vector<GridCell> cells_;  // Flat array for cache efficiency
    int cols_, rows_;
    double resolution_;
    Rect region_;
};

}  // namespace wireroute
