// world/patrol_route.cpp
//
// Implementation notes:
//   - Arc-length parameterization over an arbitrary closed polyline.
//   - Exact waypoint values of s map to the earlier segment.
//   - Zero-length segments are kept (they simply never hold the position).

#include "patrol_route.h"

#include <algorithm>
#include <cmath>

namespace rescue {
namespace world {

static constexpr double kEpsilon = 1e-12;
static constexpr double kMinPerimeter = 1e-9;

static inline double clampd(double v, double lo, double hi) {
    return (v < lo) ? lo : (v > hi) ? hi : v;
}

static inline Vec3d make_v3(double x, double y, double z) {
    Vec3d out;
    out.x = x;
    out.y = y;
    out.z = z;
    return out;
}

void PatrolRoute::recompute(const GraphConfig& graph) {
    valid_ = false;
    geo_ = PatrolRouteGeometry{};

    if (graph.levels <= 0 || !(graph.level_height_m > 0.0) || !(graph.cell_size_m > 0.0)) {
        return;
    }
    if (cfg_.lower_level < 0 || cfg_.upper_level < 0 ||
        cfg_.lower_level >= graph.levels || cfg_.upper_level >= graph.levels) {
        return;
    }

    const double z_lo = cfg_.lower_level * graph.level_height_m;
    const double z_hi = cfg_.upper_level * graph.level_height_m;

    if (!cfg_.waypoints_m.empty()) {
        // Stair climbs between the two levels are allowed; anything above or below is not.
        const double z_min = std::min(z_lo, z_hi) - 1e-6;
        const double z_max = std::max(z_lo, z_hi) + 1e-6;
        for (const Vec3d& w : cfg_.waypoints_m) {
            if (!(w.z >= z_min && w.z <= z_max)) {
                return;
            }
        }
        geo_.waypoints_m = cfg_.waypoints_m;
    } else {
        const double f = clampd(cfg_.corner_frac, 0.0, 0.5);
        const double x0 = std::floor(f * graph.grid_w) * graph.cell_size_m;
        const double x1 = std::floor((1.0 - f) * graph.grid_w) * graph.cell_size_m;
        const double y0 = std::floor(f * graph.grid_h) * graph.cell_size_m;
        const double y1 = std::floor((1.0 - f) * graph.grid_h) * graph.cell_size_m;

        // Keep the rectangle inside the grid.
        const double max_x = (graph.grid_w - 1) * graph.cell_size_m;
        const double max_y = (graph.grid_h - 1) * graph.cell_size_m;
        const double cx0 = clampd(x0, 0.0, max_x);
        const double cx1 = clampd(x1, 0.0, max_x);
        const double cy0 = clampd(y0, 0.0, max_y);
        const double cy1 = clampd(y1, 0.0, max_y);

        const double sx = 0.5 * (graph.stairway.i0 + graph.stairway.i1) * graph.cell_size_m;
        const double sy = 0.5 * (graph.stairway.j0 + graph.stairway.j1) * graph.cell_size_m;

        auto& w = geo_.waypoints_m;
        w.push_back(make_v3(cx0, cy0, z_lo));
        w.push_back(make_v3(cx1, cy0, z_lo));
        w.push_back(make_v3(cx1, cy1, z_lo));
        w.push_back(make_v3(cx0, cy1, z_lo));
        w.push_back(make_v3(sx, sy, z_lo));
        w.push_back(make_v3(sx, sy, z_hi));
        w.push_back(make_v3(cx0, cy0, z_hi));
        w.push_back(make_v3(cx1, cy0, z_hi));
        w.push_back(make_v3(cx1, cy1, z_hi));
        w.push_back(make_v3(cx0, cy1, z_hi));
        w.push_back(make_v3(sx, sy, z_hi));
        w.push_back(make_v3(sx, sy, z_lo));
    }

    const std::size_t n = geo_.waypoints_m.size();
    if (n < 2) {
        return;
    }

    geo_.seg_len_m.resize(n, 0.0);
    for (std::size_t k = 0; k < n; ++k) {
        const Vec3d& a = geo_.waypoints_m[k];
        const Vec3d& b = geo_.waypoints_m[(k + 1) % n];
        geo_.seg_len_m[k] = distance(a, b);
        geo_.perimeter_m += geo_.seg_len_m[k];
    }

    valid_ = std::isfinite(geo_.perimeter_m) && (geo_.perimeter_m > kMinPerimeter);
}

double PatrolRoute::wrapS(double s_m) const {
    if (!valid_ || geo_.perimeter_m <= 0.0 || !std::isfinite(s_m)) {
        return 0.0;
    }
    const double p = geo_.perimeter_m;
    double w = std::fmod(s_m, p);
    if (w < 0.0) w += p;
    // Guard against fmod returning p due to numeric edge cases.
    if (w >= p - kEpsilon) w = 0.0;
    return w;
}

// Locate segment index for a wrapped s and the parameter u in [0,1] along it.
static inline std::size_t segment_from_s(const PatrolRouteGeometry& g, double s_wrapped, double& u01) {
    double accum = 0.0;
    const std::size_t n = g.seg_len_m.size();
    for (std::size_t seg = 0; seg < n; ++seg) {
        const double L = g.seg_len_m[seg];
        const double next = accum + L;

        const bool is_last = (seg + 1 == n);
        if (is_last || (L > kEpsilon && s_wrapped <= next)) {
            if (L > kEpsilon) {
                u01 = clampd((s_wrapped - accum) / L, 0.0, 1.0);
            } else {
                u01 = 0.0;
            }
            return seg;
        }
        accum = next;
    }
    u01 = 0.0;
    return 0;
}

Vec3d PatrolRoute::evalPosition(double s_m) const {
    if (!valid_) {
        return make_v3(0.0, 0.0, 0.0);
    }

    const double s = wrapS(s_m);
    double u = 0.0;
    const std::size_t seg = segment_from_s(geo_, s, u);
    const std::size_t n = geo_.waypoints_m.size();

    const Vec3d& a = geo_.waypoints_m[seg];
    const Vec3d& b = geo_.waypoints_m[(seg + 1) % n];

    return make_v3(a.x + u * (b.x - a.x),
                   a.y + u * (b.y - a.y),
                   a.z + u * (b.z - a.z));
}

} // namespace world
} // namespace rescue
