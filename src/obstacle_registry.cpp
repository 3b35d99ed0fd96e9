/*
 * Wire Router Core - Obstacle Registry Implementation
 * Part of the schematic wire routing engine
 */

#include "obstacle_registry.hpp"
#include "logging.hpp"
#include <cmath>
#include <stdexcept>

namespace wireroute {

void ObstacleRegistry::validate_bounds(const Rect& bounds, const std::string& id) {
    bool finite = std::isfinite(bounds.x) && std::isfinite(bounds.y) &&
                  std::isfinite(bounds.width) && std::isfinite(bounds.height);
    if (!finite || bounds.width < 0 || bounds.height < 0) {
        log::get()->warn("rejecting bounds for obstacle '{}': ({}, {}, {}x{})",
                         id, bounds.x, bounds.y, bounds.width, bounds.height);
        throw std::invalid_argument("obstacle '" + id +
                                    "' has negative or non-finite bounds");
    }
}

void ObstacleRegistry::add(const RoutingObstacle& obstacle) {
    if (obstacle.id.empty()) {
        log::get()->warn("rejecting obstacle with empty id");
        throw std::invalid_argument("obstacle id must not be empty");
    }
    validate_bounds(obstacle.bounds, obstacle.id);

    auto it = index_.find(obstacle.id);
    if (it != index_.end()) {
        obstacles_[it->second] = obstacle;
    } else {
        index_.emplace(obstacle.id, obstacles_.size());
        obstacles_.push_back(obstacle);
    }
    ++generation_;
}

bool ObstacleRegistry::update(const std::string& id, const ObstacleUpdate& update) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        log::get()->debug("update of unknown obstacle '{}' ignored", id);
        return false;
    }
    if (update.bounds) {
        validate_bounds(*update.bounds, id);
    }

    auto& obstacle = obstacles_[it->second];
    if (update.bounds) obstacle.bounds = *update.bounds;
    if (update.type) obstacle.type = *update.type;
    if (update.priority) obstacle.priority = *update.priority;
    ++generation_;
    return true;
}

bool ObstacleRegistry::remove(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        log::get()->debug("removal of unknown obstacle '{}' ignored", id);
        return false;
    }
    size_t pos = it->second;
    index_.erase(it);
    obstacles_.erase(obstacles_.begin() + static_cast<std::ptrdiff_t>(pos));
    reindex_from(pos);
    ++generation_;
    return true;
}

void ObstacleRegistry::clear() {
    obstacles_.clear();
    index_.clear();
    ++generation_;
}

const RoutingObstacle* ObstacleRegistry::find(const std::string& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &obstacles_[it->second];
}

void ObstacleRegistry::reindex_from(size_t pos) {
    for (size_t i = pos; i < obstacles_.size(); ++i) {
        index_[obstacles_[i].id] = i;
    }
}

}  // namespace wireroute
