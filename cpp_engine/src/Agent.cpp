#include "Agent.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace rescue {

namespace {

inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

} // namespace

std::vector<Observation> KnowledgeChannel::flush() {
    std::vector<Observation> out;
    out.swap(pending_);
    return out;
}

Agent::Agent(int id,
             world::SpatialGraphPtr graph,
             const PathPlanner* planner,
             const AgentConfig& cfg,
             double risk_tolerance)
    : id_(id),
      graph_(std::move(graph)),
      planner_(planner),
      cfg_(cfg),
      risk_tolerance_(clamp01(risk_tolerance)) {
    position_ = graph_->startNode();
    trajectory_.push_back(position_);
    shared_penalty_.assign(static_cast<std::size_t>(graph_->nodeCount()), 0.0);
}

void Agent::receive(const std::vector<Observation>& batch) {
    const double w = (std::isfinite(cfg_.shared_penalty_weight) && cfg_.shared_penalty_weight > 0.0)
                         ? cfg_.shared_penalty_weight
                         : 0.0;
    for (const Observation& obs : batch) {
        if (obs.agent_id == id_) continue;
        if (!graph_->contains(obs.node)) continue;
        double& p = shared_penalty_[static_cast<std::size_t>(obs.node)];
        p = std::max(p, clamp01(obs.intensity) * w);
    }
}

AgentTickReport Agent::tick(const AgentTickContext& ctx) {
    AgentTickReport rep;
    rep.before = status_;

    if (terminal()) {
        rep.after = status_;
        return rep;
    }

    if (status_ == AgentStatus::Planning) {
        if (!runPlanner(ctx, rep)) {
            status_ = AgentStatus::Stalled;
            cause_ = "no path";
            rep.after = status_;
            return rep;
        }
        status_ = AgentStatus::Moving;
        if (position_ == graph_->targetNode()) {
            status_ = AgentStatus::ReachedTarget;
            rep.after = status_;
            return rep;
        }
    }

    if (steps_ >= cfg_.step_budget) {
        status_ = AgentStatus::Stalled;
        cause_ = "step budget exhausted";
        rep.after = status_;
        return rep;
    }

    moveOneStep(ctx, rep);

    // A replan triggered by this step runs now; the next tick moves on it.
    if (status_ == AgentStatus::Replanning) {
        if (!runPlanner(ctx, rep)) {
            status_ = AgentStatus::Stalled;
            cause_ = "no path";
        } else {
            status_ = AgentStatus::Moving;
        }
    }
    rep.after = status_;
    return rep;
}

bool Agent::runPlanner(const AgentTickContext& ctx, AgentTickReport& rep) {
    PlanRequest req;
    req.start = position_;
    req.goal = graph_->targetNode();
    req.risk_tolerance = risk_tolerance_;
    req.hazard = ctx.hazard;
    req.hazard_t_s = ctx.hazard ? ctx.hazard->elapsed_s() : 0.0;
    req.persistent_penalty = ctx.persistent_penalty;
    req.shared_penalty = &shared_penalty_;

    rep.planned = true;
    rep.replanned = (status_ == AgentStatus::Replanning);
    if (rep.replanned) ++replans_;

    rep.plan = planner_->plan(req);
    if (!rep.plan.ok()) {
        return false;
    }

    plan_ = rep.plan.path;
    planned_intensity_ = rep.plan.planned_intensity;
    plan_index_ = 0;
    return true;
}

void Agent::moveOneStep(const AgentTickContext& ctx, AgentTickReport& rep) {
    if (plan_index_ + 1 >= plan_.size()) {
        // Plan used up without reaching the target.
        status_ = AgentStatus::Replanning;
        return;
    }

    ++plan_index_;
    position_ = plan_[plan_index_];
    trajectory_.push_back(position_);
    ++steps_;
    rep.moved = true;

    const world::Node& here = graph_->node(position_);
    const double live = ctx.hazard ? clamp01(ctx.hazard->liveIntensityAt(here.pos_m, here.cell.level)) : 0.0;
    cumulative_danger_ += live;

    const double dmg = live * std::max(0.0, cfg_.damage_per_tick);
    if (std::isfinite(dmg) && dmg > 0.0) {
        health_ = std::max(0.0, health_ - dmg);
    }

    if (health_ <= 0.0) {
        status_ = AgentStatus::Dead;
        death_node_ = position_;
        cause_ = "hazard exposure";
        if (ctx.channel && live > cfg_.replan_threshold) {
            ctx.channel->publish(Observation{id_, position_, live, ctx.tick});
        }
        return;
    }

    if (position_ == graph_->targetNode()) {
        status_ = AgentStatus::ReachedTarget;
        return;
    }

    if (lookaheadExceedsPlan(ctx)) {
        status_ = AgentStatus::Replanning;
    }
}

// Checks the current node and the next lookahead_waypoints plan nodes against
// the live hazard. Every node above threshold is published; the replan fires
// only if one of them is also hotter than assumed when the plan was made.
bool Agent::lookaheadExceedsPlan(const AgentTickContext& ctx) {
    if (!ctx.hazard) return false;

    const std::size_t ahead = static_cast<std::size_t>(std::max(cfg_.lookahead_waypoints, 0));
    const std::size_t last = std::min(plan_index_ + ahead, plan_.size() - 1);

    bool trigger = false;
    for (std::size_t k = plan_index_; k <= last; ++k) {
        const world::NodeId n = plan_[k];
        const world::Node& node = graph_->node(n);
        const double live = clamp01(ctx.hazard->liveIntensityAt(node.pos_m, node.cell.level));
        if (!(live > cfg_.replan_threshold)) continue;

        if (ctx.channel) {
            ctx.channel->publish(Observation{id_, n, live, ctx.tick});
        }
        const double assumed = (k < planned_intensity_.size()) ? planned_intensity_[k] : 0.0;
        if (live > assumed) {
            trigger = true;
        }
    }
    return trigger;
}

} // namespace rescue
