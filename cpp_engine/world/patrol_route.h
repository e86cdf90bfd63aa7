#pragma once

// world/patrol_route.h
//
// Closed patrol loop used by the patrolling hazard.
//
// The loop is a polyline through 3D waypoints, traversed at constant speed and
// parameterized by arc length s in [0, perimeter). Position is a pure function
// of s, so the patrol position is always on the route.
//
// Default loop (built from the graph configuration), restricted to two levels:
//   lower level rectangle  c0 -> c1 -> c2 -> c3
//   -> stairway centre (lower) -> stairway centre (upper)
//   upper level rectangle  c0 -> c1 -> c2 -> c3
//   -> stairway centre (upper) -> stairway centre (lower) -> back to c0 (lower)
//
// Rectangle corners sit at corner_frac / (1 - corner_frac) of the grid extent.

#include <vector>

#include "spatial_graph.h"
#include "world_types.h"

namespace rescue {
namespace world {

struct PatrolRouteConfig {
    int lower_level = 2;
    int upper_level = 3;

    // Rectangle inset as a fraction of the grid extent (0.25 -> cells 5 and 15 on a 20 grid).
    double corner_frac = 0.25;

    // If non-empty, used verbatim instead of the default loop. Every waypoint
    // must lie on lower_level or upper_level (by z).
    std::vector<Vec3d> waypoints_m;
};

struct PatrolRouteGeometry {
    std::vector<Vec3d> waypoints_m;

    // seg_len_m[k] is the length from waypoint k to waypoint (k+1) % n.
    std::vector<double> seg_len_m;

    double perimeter_m = 0.0;
};

class PatrolRoute {
public:
    PatrolRoute() = default;
    explicit PatrolRoute(const PatrolRouteConfig& cfg) : cfg_(cfg) {}

    void setConfig(const PatrolRouteConfig& cfg) { cfg_ = cfg; }
    const PatrolRouteConfig& config() const { return cfg_; }

    // Recompute the loop for a graph layout. Leaves the route invalid if the
    // levels are outside the graph, fewer than two distinct waypoints remain,
    // or a custom waypoint is off the two patrol levels.
    void recompute(const GraphConfig& graph);

    bool isValid() const { return valid_; }
    const PatrolRouteGeometry& geometry() const { return geo_; }

    // Wrap s into [0, perimeter). If the route is invalid, returns 0.
    double wrapS(double s_m) const;

    // Position at arc length s. If invalid, returns {0,0,0}.
    Vec3d evalPosition(double s_m) const;

private:
    PatrolRouteConfig cfg_{};
    PatrolRouteGeometry geo_{};
    bool valid_ = false;
};

} // namespace world
} // namespace rescue
