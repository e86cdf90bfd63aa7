#include "Mission.h"

#include "Agent.h"
#include "Hashing.h"
#include "PathPlanner.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace rescue {

namespace {

inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

AgentRecord recordAgent(const world::SpatialGraph& g, const Agent& a) {
    AgentRecord r;
    r.id = a.id();
    r.status = a.status();
    r.risk_tolerance = a.riskTolerance();
    r.trajectory.reserve(a.trajectory().size());
    for (world::NodeId n : a.trajectory()) {
        r.trajectory.push_back(g.node(n).cell);
    }
    r.died = (a.status() == AgentStatus::Dead);
    if (r.died && g.contains(a.deathNode())) {
        r.death_cell = g.node(a.deathNode()).cell;
    }
    r.cause = a.cause();
    r.final_health = a.health();
    r.cumulative_danger = a.cumulativeDanger();
    r.replans = a.replans();
    return r;
}

RunEvent planEvent(int iteration, int tick, HazardKind kind, const Agent& a, const AgentTickReport& rep) {
    RunEvent ev;
    ev.type = RunEventType::AgentPlan;
    ev.iteration = iteration;
    ev.tick = tick;
    ev.kind = kind;
    ev.agent_id = a.id();
    ev.from = rep.before;
    ev.to = rep.after;
    ev.health = a.health();
    ev.risk_tolerance = a.riskTolerance();
    ev.replan = rep.replanned;
    ev.plan_ok = rep.plan.ok();
    ev.path_nodes = static_cast<int>(rep.plan.path.size());
    ev.plan_cost = rep.plan.cost;
    ev.plan_length_m = rep.plan.length_m;
    ev.vertical_transitions = rep.plan.vertical_transitions;
    if (!rep.plan.ok()) ev.message = rep.plan.status.message;
    return ev;
}

RunEvent statusEvent(int iteration, int tick, HazardKind kind, const Agent& a, const AgentTickReport& rep) {
    RunEvent ev;
    ev.type = RunEventType::AgentStatusChange;
    ev.iteration = iteration;
    ev.tick = tick;
    ev.kind = kind;
    ev.agent_id = a.id();
    ev.from = rep.before;
    ev.to = rep.after;
    ev.health = a.health();
    ev.risk_tolerance = a.riskTolerance();
    ev.message = a.cause();
    return ev;
}

} // namespace

Status validateMissionConfig(const MissionConfig& cfg, const world::GraphConfig& graph) {
    if (!std::isfinite(cfg.tick_s) || cfg.tick_s <= 0.0) {
        return Status::error(ErrorCode::ConfigurationError, "tick_s must be positive");
    }
    if (cfg.max_ticks <= 0) {
        return Status::error(ErrorCode::ConfigurationError, "max_ticks must be positive");
    }
    if (cfg.num_agents <= 0) {
        return Status::error(ErrorCode::ConfigurationError, "at least one agent is required");
    }
    if (cfg.kind == HazardKind::Patrolling) {
        world::PatrolRoute route(cfg.patrol.route);
        route.recompute(graph);
        if (!route.isValid()) {
            return Status::error(ErrorCode::ConfigurationError, "patrol route does not fit the building");
        }
    }
    return Status::success();
}

double knowledgeRiskTolerance(const MissionConfig& cfg, const KnowledgeSummary& summary) {
    const double base = clamp01(cfg.base_risk_tolerance);
    if (summary.total_missions <= 0) {
        return base;
    }
    const double gain = (std::isfinite(cfg.knowledge_gain) && cfg.knowledge_gain > 0.0) ? cfg.knowledge_gain : 0.0;
    return clamp01(base - gain * (0.5 - summary.successRate()));
}

double agentRiskTolerance(const MissionConfig& cfg, const KnowledgeSummary& summary, int k) {
    const double center = knowledgeRiskTolerance(cfg, summary);
    const double spread = std::isfinite(cfg.risk_tolerance_spread) ? cfg.risk_tolerance_spread : 0.0;
    const double offset = static_cast<double>(k) - 0.5 * static_cast<double>(std::max(cfg.num_agents, 1) - 1);
    return clamp01(center + spread * offset);
}

std::uint32_t deriveMissionSeed(std::uint32_t base_seed, int iteration) {
    std::uint32_t s = base_seed ^ (0x9E3779B9u * static_cast<std::uint32_t>(iteration + 1));
    if (s == 0u) s = 0x2545F491u;
    xorshift32(s);
    xorshift32(s);
    return (s != 0u) ? s : 0x2545F491u;
}

std::string makeMissionId(int iteration, std::uint32_t seed) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "mission_%d_%08x", iteration, static_cast<unsigned>(seed));
    return std::string(buf);
}

MissionResult runMission(const world::SpatialGraphPtr& graph,
                         const MissionConfig& cfg,
                         const RunContext& ctx) {
    MissionResult res;
    MissionOutcome& out = res.outcome;
    out.mission_id = makeMissionId(ctx.iteration, ctx.seed);
    out.kind = cfg.kind;
    out.seed = ctx.seed;
    out.config_hash = fnv1a32_add_u32(configHash(graph->config()), configHash(cfg));

    res.status = validateMissionConfig(cfg, graph->config());
    if (!res.status.ok()) {
        out.failure_reason = "configuration error";
        res.summary = ctx.summary;
        return res;
    }

    HazardBuild hb = buildHazardField(cfg.kind, *graph, cfg, ctx.hints, ctx.seed);
    if (!hb.field) {
        res.status = hb.status;
        out.failure_reason = "configuration error";
        res.summary = ctx.summary;
        return res;
    }
    out.hint_rejected = (hb.status.code == ErrorCode::HazardHintRejected);
    HazardField& hazard = *hb.field;

    const PathPlanner planner(graph, cfg.planner);
    const NodePenalty persistent = buildDeathPenalty(*graph, ctx.summary, cfg.knowledge);

    std::vector<Agent> agents;
    agents.reserve(static_cast<std::size_t>(cfg.num_agents));
    for (int k = 0; k < cfg.num_agents; ++k) {
        agents.emplace_back(k, graph, &planner, cfg.agent, agentRiskTolerance(cfg, ctx.summary, k));
    }

    KnowledgeChannel channel;
    int tick = 0;

    while (true) {
        if (ctx.cancel && ctx.cancel->load()) {
            out.failure_reason = "aborted";
            break;
        }
        if (tick >= cfg.max_ticks) {
            out.failure_reason = "timeout";
            break;
        }

        ++tick;
        hazard.advance(cfg.tick_s);

        const std::vector<Observation> batch = channel.flush();
        if (!batch.empty()) {
            for (Agent& a : agents) a.receive(batch);
        }

        AgentTickContext actx;
        actx.hazard = &hazard;
        actx.persistent_penalty = &persistent;
        actx.channel = &channel;
        actx.tick = tick;

        for (Agent& a : agents) {
            if (a.terminal()) continue;
            const AgentTickReport rep = a.tick(actx);
            if (rep.planned) {
                res.events.push_back(planEvent(ctx.iteration, tick, cfg.kind, a, rep));
            }
            if (rep.statusChanged()) {
                res.events.push_back(statusEvent(ctx.iteration, tick, cfg.kind, a, rep));
            }
            if (a.status() == AgentStatus::ReachedTarget) {
                out.success = true;
                out.winning_agent = a.id();
                break;
            }
        }
        if (out.success) break;

        const bool all_terminal = std::all_of(agents.begin(), agents.end(),
                                              [](const Agent& a) { return a.terminal(); });
        if (all_terminal) {
            out.failure_reason = "all agents lost";
            break;
        }
    }

    out.ticks = tick;
    out.elapsed_s = hazard.elapsed_s();
    out.agents.reserve(agents.size());
    for (const Agent& a : agents) {
        out.agents.push_back(recordAgent(*graph, a));
    }

    res.summary = ctx.summary.withOutcome(out, cfg.knowledge);
    return res;
}

} // namespace rescue
