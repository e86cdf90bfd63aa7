#pragma once

#include <memory>
#include <vector>

#include "RescueConfig.h"
#include "Status.h"
#include "../world/patrol_route.h"
#include "../world/spatial_graph.h"

namespace rescue {

// Candidate hazard origin supplied by the external detection collaborator.
struct HazardHint {
    world::Vec3d position_m{};
    int level = 0;
    double confidence = 0.0;
};

// Time-evolving danger model.
//
// intensityAt() is a pure function of (point, level, time): the field never
// caches per-tick state, so a planning snapshot is just (field, time at
// planning). advance() moves the live clock only.
//
// Both variants fail closed: at t = 0 (before any advance) the initial hazard
// is already present.
class HazardField {
public:
    virtual ~HazardField() = default;

    virtual HazardKind kind() const = 0;

    // In [0,1]. Negative or non-finite t is treated as 0.
    virtual double intensityAt(const world::Vec3d& p_m, int level, double t_s) const = 0;

    // dt must be positive and finite; invalid dt is ignored.
    virtual void advance(double dt_s);

    double elapsed_s() const noexcept { return elapsed_s_; }

    double liveIntensityAt(const world::Vec3d& p_m, int level) const {
        return intensityAt(p_m, level, elapsed_s_);
    }

    double intensityAtNode(const world::SpatialGraph& g, world::NodeId id, double t_s) const;

protected:
    double elapsed_s_ = 0.0;
};

// Fire. Radius and base intensity grow linearly from their initial values;
// higher levels read hotter.
class SpreadingHazard final : public HazardField {
public:
    struct Origin {
        world::Vec3d pos_m{};
        int level = 0;
    };

    SpreadingHazard(const SpreadingHazardConfig& cfg, std::vector<Origin> origins);

    // Seeded placement, one origin per lower level (all but the top level, or
    // level 0 in a single-level building), x/y in the central half of the grid.
    static std::vector<Origin> defaultOrigins(const world::GraphConfig& graph,
                                              const SpreadingHazardConfig& cfg,
                                              std::uint32_t seed);

    HazardKind kind() const override { return HazardKind::Spreading; }
    double intensityAt(const world::Vec3d& p_m, int level, double t_s) const override;

    double radiusAt(double t_s) const;
    double baseIntensityAt(double t_s) const;
    double levelMultiplier(int level) const;

    const std::vector<Origin>& origins() const { return origins_; }
    const SpreadingHazardConfig& config() const { return cfg_; }

private:
    SpreadingHazardConfig cfg_{};
    std::vector<Origin> origins_;
};

// Attacker. Walks a closed route at constant speed; lethal inside a fixed radius.
class PatrollingHazard final : public HazardField {
public:
    PatrollingHazard(const PatrolHazardConfig& cfg, const world::GraphConfig& graph);

    HazardKind kind() const override { return HazardKind::Patrolling; }
    double intensityAt(const world::Vec3d& p_m, int level, double t_s) const override;

    world::Vec3d positionAt(double t_s) const;

    bool isValid() const { return route_.isValid(); }
    const world::PatrolRoute& route() const { return route_; }
    const PatrolHazardConfig& config() const { return cfg_; }

private:
    PatrolHazardConfig cfg_{};
    world::PatrolRoute route_{};
};

struct HazardBuild {
    std::unique_ptr<HazardField> field;
    // Index of the accepted hint, -1 when the default placement was used.
    int hint_index = -1;
    // Ok, HazardHintRejected (hints given but none cleared the threshold), or
    // ConfigurationError (e.g. a patrol route that does not fit the graph).
    Status status{};
};

// Picks the highest-confidence hint at or above the threshold (ties go to the
// earliest). Hints on a level outside the graph are ignored. -1 if none.
int selectHazardHint(const std::vector<HazardHint>& hints,
                     const world::GraphConfig& graph,
                     double threshold);

// Builds the mission's hazard. An accepted hint is snapped to the nearest
// node on its level and seeds the fire origin or the patrol start.
HazardBuild buildHazardField(HazardKind kind,
                             const world::SpatialGraph& building,
                             const MissionConfig& cfg,
                             const std::vector<HazardHint>& hints,
                             std::uint32_t seed);

} // namespace rescue
