#pragma once

#include <cstdint>
#include <vector>

#include "HazardField.h"
#include "RescueConfig.h"
#include "Status.h"
#include "../world/spatial_graph.h"

namespace rescue {

// Additive per-node penalty indexed by NodeId. Empty means "no penalty".
using NodePenalty = std::vector<double>;

struct PlanRequest {
    world::NodeId start = world::kInvalidNode;
    world::NodeId goal = world::kInvalidNode;

    double risk_tolerance = 0.5;

    // Planning-time hazard snapshot. hazard may be null (no hazard term).
    const HazardField* hazard = nullptr;
    double hazard_t_s = 0.0;

    // Cross-mission death penalty and mission-channel penalty.
    const NodePenalty* persistent_penalty = nullptr;
    const NodePenalty* shared_penalty = nullptr;
};

struct PlanResult {
    Status status{};

    // start ... goal, inclusive.
    std::vector<world::NodeId> path;
    // Hazard intensity assumed at each path node (snapshot value).
    std::vector<double> planned_intensity;

    double cost = 0.0;       // hazard-weighted
    double length_m = 0.0;   // unweighted
    int vertical_transitions = 0;
    std::uint32_t expansions = 0;
    double lambda = 0.0;

    bool ok() const noexcept { return status.ok(); }
};

// Best-first (A*) search over the shared graph.
//
// Edge cost to node v:
//   base * (1 + lambda * (hazard(v) + persistent(v) + shared(v)))
//   lambda = danger_weight * (1 - risk_tolerance)
//
// The heuristic lower-bounds the *unweighted* distance only. Since every
// weighted edge costs at least its base, it also lower-bounds the weighted
// remainder, and the search never needs more than that. It is further scaled
// by heuristic_scale in [0,1].
//
// Ties on cost prefer fewer vertical transitions, then the lower node id.
class PathPlanner {
public:
    explicit PathPlanner(world::SpatialGraphPtr graph, const PlannerConfig& cfg = PlannerConfig{});

    // NoPathFound when the frontier is exhausted, the expansion budget runs
    // out, or start/goal are not graph nodes.
    PlanResult plan(const PlanRequest& req) const;

    double lambda(double risk_tolerance) const;
    double heuristic(world::NodeId from, world::NodeId goal) const;

    const PlannerConfig& config() const { return cfg_; }
    const world::SpatialGraph& graph() const { return *graph_; }

private:
    world::SpatialGraphPtr graph_;
    PlannerConfig cfg_{};
};

} // namespace rescue
