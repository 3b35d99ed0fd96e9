/*
 * Wire Router Core - Obstacle Registry
 * Part of the schematic wire routing engine
 *
 * Owns the obstacles known to one routing engine, keyed by caller-assigned id.
 * Every mutation bumps a generation counter so derived state (the occupancy
 * grid) can tell when it is stale. Not thread-safe.
 */

#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace wireroute {

class ObstacleRegistry {
public:
    // Insert or replace by id. Throws std::invalid_argument on an empty id
    // or bounds with negative or non-finite values.
    void add(const RoutingObstacle& obstacle);

    // Merge set fields into an existing obstacle. Unknown id is a no-op.
    bool update(const std::string& id, const ObstacleUpdate& update);

    // Unknown id is a no-op
    bool remove(const std::string& id);

    void clear();

    const RoutingObstacle* find(const std::string& id) const;

    // Obstacles in insertion order
    const std::vector<RoutingObstacle>& obstacles() const { return obstacles_; }

    size_t size() const { return obstacles_.size(); }
    bool empty() const { return obstacles_.empty(); }

    uint64_t generation() const { return generation_; }

private:
    static void validate_bounds(const Rect& bounds, const std::string& id);
    void reindex_from(size_t pos);

    std::vector<RoutingObstacle> obstacles_;
    std::unordered_map<std::string, size_t> index_;
    uint64_t generation_ = 0;
};

}  // namespace wireroute
