#include "HazardField.h"

#include "Hashing.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace rescue {

namespace {

constexpr std::uint32_t kSeedFallback = 0x9E3779B9u;

inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

inline double sanitizeTime(double t_s) {
    return (std::isfinite(t_s) && t_s > 0.0) ? t_s : 0.0;
}

} // namespace

// --------------------
// HazardField
// --------------------

void HazardField::advance(double dt_s) {
    if (!std::isfinite(dt_s) || dt_s <= 0.0) {
        return;
    }
    elapsed_s_ += dt_s;
}

double HazardField::intensityAtNode(const world::SpatialGraph& g, world::NodeId id, double t_s) const {
    if (!g.contains(id)) return 0.0;
    const world::Node& n = g.node(id);
    return intensityAt(n.pos_m, n.cell.level, t_s);
}

// --------------------
// SpreadingHazard
// --------------------

SpreadingHazard::SpreadingHazard(const SpreadingHazardConfig& cfg, std::vector<Origin> origins)
    : cfg_(cfg), origins_(std::move(origins)) {}

std::vector<SpreadingHazard::Origin> SpreadingHazard::defaultOrigins(const world::GraphConfig& graph,
                                                                     const SpreadingHazardConfig& cfg,
                                                                     std::uint32_t seed) {
    std::vector<Origin> out;
    if (graph.levels <= 0 || graph.grid_w <= 0 || graph.grid_h <= 0) {
        return out;
    }

    std::uint32_t s = (seed != 0u) ? seed : kSeedFallback;
    // Warm up so nearby seeds decorrelate.
    for (int k = 0; k < 4; ++k) xorshift32(s);

    const int lower_levels = (graph.levels > 1) ? (graph.levels - 1) : 1;
    const int count = std::min(std::max(cfg.default_origin_count, 1), lower_levels);

    const double w_m = (graph.grid_w - 1) * graph.cell_size_m;
    const double h_m = (graph.grid_h - 1) * graph.cell_size_m;

    for (int k = 0; k < count; ++k) {
        Origin o;
        o.level = k;
        o.pos_m.x = w_m * (0.25 + 0.5 * u01(s));
        o.pos_m.y = h_m * (0.25 + 0.5 * u01(s));
        o.pos_m.z = k * graph.level_height_m;
        out.push_back(o);
    }
    return out;
}

double SpreadingHazard::radiusAt(double t_s) const {
    const double t = sanitizeTime(t_s);
    const double r0 = std::max(0.0, cfg_.initial_radius_m);
    const double rate = std::max(0.0, cfg_.spread_rate_mps);
    return r0 + rate * t;
}

double SpreadingHazard::baseIntensityAt(double t_s) const {
    const double t = sanitizeTime(t_s);
    const double cap = clamp01(cfg_.intensity_cap);
    const double i0 = clamp01(cfg_.initial_intensity);
    const double rate = std::max(0.0, cfg_.intensity_rate_per_s);
    return std::min(cap, i0 + rate * t);
}

double SpreadingHazard::levelMultiplier(int level) const {
    const double rise = std::max(0.0, cfg_.heat_rise_per_level);
    return 1.0 + rise * static_cast<double>(std::max(level, 0));
}

double SpreadingHazard::intensityAt(const world::Vec3d& p_m, int level, double t_s) const {
    const double r = radiusAt(t_s);
    if (!(r > 0.0)) return 0.0;
    const double base = baseIntensityAt(t_s);

    double best = 0.0;
    for (const Origin& o : origins_) {
        const double d = world::distance(p_m, o.pos_m);
        if (!std::isfinite(d) || d > r) continue;
        const double falloff = 1.0 - d / r;
        best = std::max(best, base * falloff);
    }
    return clamp01(best * levelMultiplier(level));
}

// --------------------
// PatrollingHazard
// --------------------

PatrollingHazard::PatrollingHazard(const PatrolHazardConfig& cfg, const world::GraphConfig& graph)
    : cfg_(cfg), route_(cfg.route) {
    route_.recompute(graph);
}

world::Vec3d PatrollingHazard::positionAt(double t_s) const {
    const double t = sanitizeTime(t_s);
    const double speed = std::max(0.0, cfg_.speed_mps);
    return route_.evalPosition(cfg_.start_offset_m + speed * t);
}

double PatrollingHazard::intensityAt(const world::Vec3d& p_m, int level, double t_s) const {
    (void)level; // 3D distance already separates levels.
    if (!route_.isValid()) return 0.0;
    const double d = world::distance(p_m, positionAt(t_s));
    return (std::isfinite(d) && d <= cfg_.danger_radius_m) ? 1.0 : 0.0;
}

// --------------------
// Construction from hints / defaults
// --------------------

int selectHazardHint(const std::vector<HazardHint>& hints,
                     const world::GraphConfig& graph,
                     double threshold) {
    int best = -1;
    double best_conf = -std::numeric_limits<double>::infinity();
    for (std::size_t k = 0; k < hints.size(); ++k) {
        const HazardHint& h = hints[k];
        if (!std::isfinite(h.confidence) || h.confidence < threshold) continue;
        if (h.level < 0 || h.level >= graph.levels) continue;
        if (!std::isfinite(h.position_m.x) || !std::isfinite(h.position_m.y)) continue;
        if (h.confidence > best_conf) {
            best_conf = h.confidence;
            best = static_cast<int>(k);
        }
    }
    return best;
}

static double nearestRouteOffset(const world::PatrolRoute& route, const world::Vec3d& p_m) {
    const auto& geo = route.geometry();
    double s = 0.0;
    double best_s = 0.0;
    double best_d = std::numeric_limits<double>::infinity();
    for (std::size_t k = 0; k < geo.waypoints_m.size(); ++k) {
        const double d = world::distance(geo.waypoints_m[k], p_m);
        if (d < best_d) {
            best_d = d;
            best_s = s;
        }
        s += geo.seg_len_m[k];
    }
    return best_s;
}

HazardBuild buildHazardField(HazardKind kind,
                             const world::SpatialGraph& building,
                             const MissionConfig& cfg,
                             const std::vector<HazardHint>& hints,
                             std::uint32_t seed) {
    const world::GraphConfig& graph = building.config();
    HazardBuild out;
    out.hint_index = selectHazardHint(hints, graph, cfg.hint_confidence_threshold);

    // Accepted sightings are snapped to the closest node on their level.
    const world::Node* sighted = nullptr;
    if (out.hint_index >= 0) {
        const HazardHint& h = hints[static_cast<std::size_t>(out.hint_index)];
        const world::NodeId id = building.nearestNode(h.position_m, h.level);
        if (id != world::kInvalidNode) {
            sighted = &building.node(id);
        }
    }
    if (!hints.empty() && out.hint_index < 0) {
        out.status = Status::error(ErrorCode::HazardHintRejected,
                                   "no hazard hint cleared the confidence threshold; using default placement");
    }

    if (kind == HazardKind::Patrolling) {
        PatrolHazardConfig pc = cfg.patrol;
        if (sighted) {
            // Start the patrol at the waypoint closest to the reported sighting.
            world::PatrolRoute route(pc.route);
            route.recompute(graph);
            if (route.isValid()) {
                pc.start_offset_m = nearestRouteOffset(route, sighted->pos_m);
            }
        }
        auto field = std::make_unique<PatrollingHazard>(pc, graph);
        if (!field->isValid()) {
            out.status = Status::error(ErrorCode::ConfigurationError,
                                       "patrol route does not fit the building");
            return out;
        }
        out.field = std::move(field);
        return out;
    }

    std::vector<SpreadingHazard::Origin> origins;
    if (sighted) {
        SpreadingHazard::Origin o;
        o.level = sighted->cell.level;
        o.pos_m = sighted->pos_m;
        origins.push_back(o);
    } else {
        origins = SpreadingHazard::defaultOrigins(graph, cfg.spreading, seed);
    }
    out.field = std::make_unique<SpreadingHazard>(cfg.spreading, std::move(origins));
    return out;
}

} // namespace rescue
