/*
 * Wire Router Core - nanobind Python bindings
 * Part of the schematic wire routing engine
 */

#include "collision.hpp"
#include "logging.hpp"
#include "routing_engine.hpp"
#include "types.hpp"
#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>
#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;
using namespace wireroute;

NB_MODULE(wireroute_cpp, m) {
    m.doc() = "Orthogonal wire routing engine for schematic diagrams";

    // Enums
    nb::enum_<ObstacleType>(m, "ObstacleType")
        .value("COMPONENT", ObstacleType::Component)
        .value("WIRE", ObstacleType::Wire)
        .value("KEEPOUT", ObstacleType::Keepout);

    nb::enum_<SegmentOrientation>(m, "SegmentOrientation")
        .value("HORIZONTAL", SegmentOrientation::Horizontal)
        .value("VERTICAL", SegmentOrientation::Vertical);

    nb::enum_<RoutingStyle>(m, "RoutingStyle")
        .value("ORTHOGONAL", RoutingStyle::Orthogonal)
        .value("DIAGONAL", RoutingStyle::Diagonal)
        .value("MANHATTAN", RoutingStyle::Manhattan);

    nb::enum_<RouteMethod>(m, "RouteMethod")
        .value("DIRECT", RouteMethod::Direct)
        .value("GRID_SEARCH", RouteMethod::GridSearch)
        .value("FALLBACK", RouteMethod::Fallback);

    nb::enum_<IntersectionType>(m, "IntersectionType")
        .value("CROSSING", IntersectionType::Crossing)
        .value("OVERLAP", IntersectionType::Overlap)
        .value("JUNCTION", IntersectionType::Junction);

    nb::enum_<CollisionSeverity>(m, "CollisionSeverity")
        .value("LOW", CollisionSeverity::Low)
        .value("MEDIUM", CollisionSeverity::Medium)
        .value("HIGH", CollisionSeverity::High);

    // Geometry
    nb::class_<Point>(m, "Point")
        .def(nb::init<>())
        .def("__init__", [](Point* p, double x, double y) { new (p) Point{x, y}; },
             "x"_a, "y"_a)
        .def_rw("x", &Point::x)
        .def_rw("y", &Point::y)
        .def("__eq__", [](const Point& a, const Point& b) { return a == b; });

    nb::class_<Rect>(m, "Rect")
        .def(nb::init<>())
        .def("__init__", [](Rect* r, double x, double y, double w, double h) {
                 new (r) Rect{x, y, w, h};
             }, "x"_a, "y"_a, "width"_a, "height"_a)
        .def_rw("x", &Rect::x)
        .def_rw("y", &Rect::y)
        .def_rw("width", &Rect::width)
        .def_rw("height", &Rect::height);

    // RoutingObstacle struct
    nb::class_<RoutingObstacle>(m, "RoutingObstacle")
        .def(nb::init<>())
        .def("__init__", [](RoutingObstacle* o, std::string id, const Rect& bounds,
                            ObstacleType type, int priority) {
                 new (o) RoutingObstacle{std::move(id), bounds, type, priority};
             }, "id"_a, "bounds"_a, "type"_a = ObstacleType::Component, "priority"_a = 0)
        .def_rw("id", &RoutingObstacle::id)
        .def_rw("bounds", &RoutingObstacle::bounds)
        .def_rw("type", &RoutingObstacle::type)
        .def_rw("priority", &RoutingObstacle::priority);

    nb::class_<ObstacleUpdate>(m, "ObstacleUpdate")
        .def(nb::init<>())
        .def_rw("bounds", &ObstacleUpdate::bounds)
        .def_rw("type", &ObstacleUpdate::type)
        .def_rw("priority", &ObstacleUpdate::priority);

    // WireSegment struct
    nb::class_<WireSegment>(m, "WireSegment")
        .def(nb::init<>())
        .def_ro("start", &WireSegment::start)
        .def_ro("end", &WireSegment::end)
        .def_ro("orientation", &WireSegment::orientation)
        .def_ro("length", &WireSegment::length);

    // Constraints and options
    nb::class_<RoutingConstraints>(m, "RoutingConstraints")
        .def(nb::init<>())
        .def_rw("min_wire_spacing", &RoutingConstraints::min_wire_spacing)
        .def_rw("preferred_wire_spacing", &RoutingConstraints::preferred_wire_spacing)
        .def_rw("max_bend_count", &RoutingConstraints::max_bend_count)
        .def_rw("preferred_bend_radius", &RoutingConstraints::preferred_bend_radius)
        .def_rw("avoidance_margin", &RoutingConstraints::avoidance_margin);

    nb::class_<ConstraintsUpdate>(m, "ConstraintsUpdate")
        .def(nb::init<>())
        .def_rw("min_wire_spacing", &ConstraintsUpdate::min_wire_spacing)
        .def_rw("preferred_wire_spacing", &ConstraintsUpdate::preferred_wire_spacing)
        .def_rw("max_bend_count", &ConstraintsUpdate::max_bend_count)
        .def_rw("preferred_bend_radius", &ConstraintsUpdate::preferred_bend_radius)
        .def_rw("avoidance_margin", &ConstraintsUpdate::avoidance_margin);

    nb::class_<RoutingOptions>(m, "RoutingOptions")
        .def(nb::init<>())
        .def_rw("style", &RoutingOptions::style)
        .def_rw("avoid_obstacles", &RoutingOptions::avoid_obstacles)
        .def_rw("optimize", &RoutingOptions::optimize);

    // RoutingResult struct
    nb::class_<RoutingResult>(m, "RoutingResult")
        .def(nb::init<>())
        .def_ro("segments", &RoutingResult::segments)
        .def_ro("total_length", &RoutingResult::total_length)
        .def_ro("bend_count", &RoutingResult::bend_count)
        .def_ro("quality", &RoutingResult::quality)
        .def_ro("obstacles", &RoutingResult::obstacles)
        .def_ro("method", &RoutingResult::method);

    nb::class_<RoutingStats>(m, "RoutingStats")
        .def_ro("routes", &RoutingStats::routes)
        .def_ro("grid_builds", &RoutingStats::grid_builds)
        .def_ro("grid_reuses", &RoutingStats::grid_reuses)
        .def_ro("searches", &RoutingStats::searches)
        .def_ro("fallbacks", &RoutingStats::fallbacks)
        .def_ro("last_iterations", &RoutingStats::last_iterations)
        .def_ro("last_nodes_explored", &RoutingStats::last_nodes_explored);

    // WireRoutingEngine class
    nb::class_<WireRoutingEngine>(m, "WireRoutingEngine")
        .def(nb::init<>())
        .def(nb::init<const RoutingConstraints&>(), "constraints"_a)
        .def("add_obstacle", &WireRoutingEngine::add_obstacle, "obstacle"_a)
        .def("update_obstacle", &WireRoutingEngine::update_obstacle, "id"_a, "update"_a)
        .def("remove_obstacle", &WireRoutingEngine::remove_obstacle, "id"_a)
        .def("clear_obstacles", &WireRoutingEngine::clear_obstacles)
        .def("route_wire", &WireRoutingEngine::route_wire,
             "start"_a, "end"_a, "options"_a = RoutingOptions{})
        .def("set_constraints", &WireRoutingEngine::set_constraints, "update"_a)
        .def("get_constraints", &WireRoutingEngine::get_constraints)
        .def("reset_stats", &WireRoutingEngine::reset_stats)
        .def_prop_ro("stats", [](const WireRoutingEngine& e) { return e.stats(); })
        .def_prop_ro("obstacle_count",
                     [](const WireRoutingEngine& e) { return e.obstacles().size(); })
        .def_prop_ro("has_valid_grid", &WireRoutingEngine::has_valid_grid);

    // Collision analysis
    nb::class_<RoutedWire>(m, "RoutedWire")
        .def(nb::init<>())
        .def_rw("id", &RoutedWire::id)
        .def_rw("start", &RoutedWire::start)
        .def_rw("end", &RoutedWire::end)
        .def_rw("segments", &RoutedWire::segments);

    nb::class_<ObstacleCollision>(m, "ObstacleCollision")
        .def_ro("wire_id", &ObstacleCollision::wire_id)
        .def_ro("obstacle_id", &ObstacleCollision::obstacle_id)
        .def_ro("segment_index", &ObstacleCollision::segment_index)
        .def_ro("points", &ObstacleCollision::points);

    nb::class_<WireIntersection>(m, "WireIntersection")
        .def_ro("wire_a", &WireIntersection::wire_a)
        .def_ro("wire_b", &WireIntersection::wire_b)
        .def_ro("point", &WireIntersection::point)
        .def_ro("type", &WireIntersection::type)
        .def_ro("severity", &WireIntersection::severity);

    nb::class_<CollisionReport>(m, "CollisionReport")
        .def_ro("wires", &CollisionReport::wires)
        .def_ro("points", &CollisionReport::points)
        .def_ro("severity", &CollisionReport::severity)
        .def_ro("description", &CollisionReport::description);

    nb::class_<CollisionStats>(m, "CollisionStats")
        .def_ro("total", &CollisionStats::total)
        .def_ro("wire_wire", &CollisionStats::wire_wire)
        .def_ro("wire_obstacle", &CollisionStats::wire_obstacle)
        .def_ro("critical", &CollisionStats::critical)
        .def_ro("average_severity", &CollisionStats::average_severity);

    nb::class_<CollisionDetector>(m, "CollisionDetector")
        .def(nb::init<>())
        .def(nb::init<double, double>(), "wire_buffer"_a, "obstacle_buffer"_a)
        .def("detect_obstacle_collisions", &CollisionDetector::detect_obstacle_collisions,
             "wire"_a, "obstacles"_a)
        .def("detect_wire_intersections", &CollisionDetector::detect_wire_intersections,
             "wires"_a)
        .def("detect_all", &CollisionDetector::detect_all, "wires"_a, "obstacles"_a)
        .def("stats", &CollisionDetector::stats, "wires"_a, "obstacles"_a)
        .def("set_parameters", &CollisionDetector::set_parameters,
             "wire_buffer"_a, "obstacle_buffer"_a)
        .def_prop_ro("wire_buffer", &CollisionDetector::wire_buffer)
        .def_prop_ro("obstacle_buffer", &CollisionDetector::obstacle_buffer);

    // Logging
    m.def("set_log_level", [](const std::string& level) {
        auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off") {
            throw std::invalid_argument("unknown log level: " + level);
        }
        wireroute::log::set_level(parsed);
    }, "level"_a);

    // Version info
    m.def("version", []() { return "1.0.0"; });
    m.def("is_available", []() { return true; });
}
