/*
 * Wire Router Core - Common Types
 * Part of the schematic wire routing engine
 */

#include "types.hpp"

namespace wireroute {

const char* to_string(ObstacleType type) {
    switch (type) {
        case ObstacleType::Component: return "component";
        case ObstacleType::Wire: return "wire";
        case ObstacleType::Keepout: return "keepout";
    }
    return "unknown";
}

const char* to_string(SegmentOrientation orientation) {
    switch (orientation) {
        case SegmentOrientation::Horizontal: return "horizontal";
        case SegmentOrientation::Vertical: return "vertical";
    }
    return "unknown";
}

const char* to_string(RouteMethod method) {
    switch (method) {
        case RouteMethod::Direct: return "direct";
        case RouteMethod::GridSearch: return "grid_search";
        case RouteMethod::Fallback: return "fallback";
    }
    return "unknown";
}

}  // namespace wireroute
