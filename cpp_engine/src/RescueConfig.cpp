#include "RescueConfig.h"

#include "Hashing.h"

namespace rescue {

std::uint32_t configHash(const world::GraphConfig& g) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_i32(h, g.levels);
    h = fnv1a32_add_i32(h, g.grid_w);
    h = fnv1a32_add_i32(h, g.grid_h);
    h = fnv1a32_add_f64(h, g.cell_size_m);
    h = fnv1a32_add_f64(h, g.level_height_m);
    h = fnv1a32_add_f64(h, g.vertical_cost_factor);
    h = fnv1a32_add_i32(h, g.stairway.i0);
    h = fnv1a32_add_i32(h, g.stairway.j0);
    h = fnv1a32_add_i32(h, g.stairway.i1);
    h = fnv1a32_add_i32(h, g.stairway.j1);
    h = fnv1a32_add_i32(h, g.start.i);
    h = fnv1a32_add_i32(h, g.start.j);
    h = fnv1a32_add_i32(h, g.start.level);
    h = fnv1a32_add_i32(h, g.target.i);
    h = fnv1a32_add_i32(h, g.target.j);
    h = fnv1a32_add_i32(h, g.target.level);
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(g.obstacles.size()));
    for (const auto& ob : g.obstacles) {
        h = fnv1a32_add_i32(h, ob.rect.i0);
        h = fnv1a32_add_i32(h, ob.rect.j0);
        h = fnv1a32_add_i32(h, ob.rect.i1);
        h = fnv1a32_add_i32(h, ob.rect.j1);
        h = fnv1a32_add_i32(h, ob.level);
    }
    return h;
}

std::uint32_t configHash(const MissionConfig& m) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(m.kind));
    h = fnv1a32_add_f64(h, m.tick_s);
    h = fnv1a32_add_i32(h, m.max_ticks);
    h = fnv1a32_add_i32(h, m.num_agents);
    h = fnv1a32_add_f64(h, m.base_risk_tolerance);
    h = fnv1a32_add_f64(h, m.knowledge_gain);
    h = fnv1a32_add_f64(h, m.risk_tolerance_spread);
    h = fnv1a32_add_f64(h, m.hint_confidence_threshold);
    h = fnv1a32_add_u32(h, m.seed);

    h = fnv1a32_add_f64(h, m.spreading.initial_radius_m);
    h = fnv1a32_add_f64(h, m.spreading.spread_rate_mps);
    h = fnv1a32_add_f64(h, m.spreading.initial_intensity);
    h = fnv1a32_add_f64(h, m.spreading.intensity_rate_per_s);
    h = fnv1a32_add_f64(h, m.spreading.intensity_cap);
    h = fnv1a32_add_f64(h, m.spreading.heat_rise_per_level);
    h = fnv1a32_add_i32(h, m.spreading.default_origin_count);

    h = fnv1a32_add_i32(h, m.patrol.route.lower_level);
    h = fnv1a32_add_i32(h, m.patrol.route.upper_level);
    h = fnv1a32_add_f64(h, m.patrol.route.corner_frac);
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(m.patrol.route.waypoints_m.size()));
    for (const auto& w : m.patrol.route.waypoints_m) {
        h = fnv1a32_add_f64(h, w.x);
        h = fnv1a32_add_f64(h, w.y);
        h = fnv1a32_add_f64(h, w.z);
    }
    h = fnv1a32_add_f64(h, m.patrol.speed_mps);
    h = fnv1a32_add_f64(h, m.patrol.danger_radius_m);
    h = fnv1a32_add_f64(h, m.patrol.start_offset_m);

    h = fnv1a32_add_f64(h, m.planner.danger_weight);
    h = fnv1a32_add_f64(h, m.planner.heuristic_scale);
    h = fnv1a32_add_u32(h, m.planner.max_expansions);

    h = fnv1a32_add_f64(h, m.agent.damage_per_tick);
    h = fnv1a32_add_f64(h, m.agent.replan_threshold);
    h = fnv1a32_add_i32(h, m.agent.lookahead_waypoints);
    h = fnv1a32_add_i32(h, m.agent.step_budget);
    h = fnv1a32_add_f64(h, m.agent.shared_penalty_weight);

    h = fnv1a32_add_f64(h, m.knowledge.death_penalty_weight);
    h = fnv1a32_add_f64(h, m.knowledge.penalty_decay);
    h = fnv1a32_add_i32(h, m.knowledge.penalty_radius_cells);
    h = fnv1a32_add_f64(h, m.knowledge.success_discount);
    h = fnv1a32_add_i32(h, m.knowledge.prefix_length);
    h = fnv1a32_add_i32(h, m.knowledge.max_death_records);
    h = fnv1a32_add_i32(h, m.knowledge.max_success_prefixes);
    return h;
}

} // namespace rescue
