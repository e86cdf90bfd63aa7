#pragma once

#include <cstdint>

#include "../world/patrol_route.h"
#include "../world/spatial_graph.h"

namespace rescue {

// ============================================================
// Tunables. Every constant here is configuration, not contract: only the
// monotonicity properties (health never rises, spreading intensity never
// falls, more past success never lowers risk tolerance) are load-bearing.
// ============================================================

enum class HazardKind : int {
    Spreading  = 0, // fire
    Patrolling = 1, // attacker
};

inline const char* hazardKindName(HazardKind k) {
    return (k == HazardKind::Patrolling) ? "attacker" : "fire";
}

struct SpreadingHazardConfig {
    // Footprint at t = 0 (meters) and linear growth (meters per second).
    double initial_radius_m = 2.0;
    double spread_rate_mps = 0.1;

    // Base intensity ramps linearly up to the cap (dimensionless, per second).
    double initial_intensity = 0.5;
    double intensity_rate_per_s = 0.05;
    double intensity_cap = 1.0;

    // Heat rises: multiplier = 1 + heat_rise_per_level * level.
    double heat_rise_per_level = 0.15;

    // Default placement: one origin per lower level, up to this many.
    int default_origin_count = 3;
};

struct PatrolHazardConfig {
    world::PatrolRouteConfig route{};
    double speed_mps = 1.5;
    double danger_radius_m = 3.0;
    // Arc-length position on the loop at t = 0.
    double start_offset_m = 0.0;
};

struct PlannerConfig {
    // lambda = danger_weight * (1 - risk_tolerance).
    double danger_weight = 10.0;

    // Multiplies the unweighted heuristic; clamped to [0,1].
    double heuristic_scale = 1.0;

    // 0 = unlimited.
    std::uint32_t max_expansions = 0;
};

struct AgentConfig {
    // Health lost per tick at intensity 1.0.
    double damage_per_tick = 0.1;

    double replan_threshold = 0.6;
    int lookahead_waypoints = 2;

    // Moves allowed before the agent gives up (Stalled).
    int step_budget = 400;

    // Scale applied to intensities received over the mission channel.
    double shared_penalty_weight = 1.0;
};

struct KnowledgeConfig {
    double death_penalty_weight = 1.0;
    // Weight of a death record per mission of age (1.0 = no decay).
    double penalty_decay = 0.8;
    // Same-level Chebyshev radius (cells) a death record spreads over.
    int penalty_radius_cells = 1;
    // Fraction of the persistent penalty removed on recorded successful prefixes.
    double success_discount = 0.5;

    int prefix_length = 12;
    int max_death_records = 50;
    int max_success_prefixes = 10;
};

struct MissionConfig {
    HazardKind kind = HazardKind::Spreading;

    double tick_s = 0.5;
    int max_ticks = 240;

    int num_agents = 3;

    double base_risk_tolerance = 0.5;
    // tolerance = base - knowledge_gain * (0.5 - success_rate), once history exists.
    double knowledge_gain = 0.4;
    // Agent k gets tolerance + spread * (k - (n-1)/2), clamped.
    double risk_tolerance_spread = 0.0;

    double hint_confidence_threshold = 0.5;

    // Seed for default hazard placement (xorshift32; 0 is remapped).
    std::uint32_t seed = 0x2545F491u;

    SpreadingHazardConfig spreading{};
    PatrolHazardConfig patrol{};
    PlannerConfig planner{};
    AgentConfig agent{};
    KnowledgeConfig knowledge{};
};

struct RunConfig {
    world::GraphConfig graph{};
    MissionConfig mission{};
};

// FNV-1a32 over the effective parameters.
std::uint32_t configHash(const world::GraphConfig& g);
std::uint32_t configHash(const MissionConfig& m);

} // namespace rescue
