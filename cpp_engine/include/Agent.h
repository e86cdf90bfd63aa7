#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "HazardField.h"
#include "PathPlanner.h"
#include "RescueConfig.h"
#include "../world/spatial_graph.h"

namespace rescue {

enum class AgentStatus : int {
    Planning      = 0,
    Moving        = 1,
    Replanning    = 2,
    ReachedTarget = 3,
    Dead          = 4,
    Stalled       = 5,
};

inline const char* agentStatusName(AgentStatus s) {
    switch (s) {
        case AgentStatus::Planning:      return "planning";
        case AgentStatus::Moving:        return "moving";
        case AgentStatus::Replanning:    return "replanning";
        case AgentStatus::ReachedTarget: return "reached_target";
        case AgentStatus::Dead:          return "dead";
        case AgentStatus::Stalled:       return "stalled";
    }
    return "unknown";
}

inline bool isTerminal(AgentStatus s) {
    return s == AgentStatus::ReachedTarget || s == AgentStatus::Dead || s == AgentStatus::Stalled;
}

// One "I saw danger here" report on the mission channel.
struct Observation {
    int agent_id = -1;
    world::NodeId node = world::kInvalidNode;
    double intensity = 0.0;
    int tick = 0;
};

// Mission-scoped broadcast. Agents publish during their step; the coordinator
// flushes once per tick, before any agent steps, so every agent of tick k sees
// exactly the observations published during tick k-1.
class KnowledgeChannel {
public:
    void publish(const Observation& obs) { pending_.push_back(obs); }

    // Hands over everything published since the last flush, in publish order.
    std::vector<Observation> flush();

    std::size_t pendingCount() const { return pending_.size(); }

private:
    std::vector<Observation> pending_;
};

// Per-tick inputs owned by the coordinator.
struct AgentTickContext {
    const HazardField* hazard = nullptr;
    const NodePenalty* persistent_penalty = nullptr;
    KnowledgeChannel* channel = nullptr;
    int tick = 0;
};

// What happened during one Agent::tick(), for the event stream.
struct AgentTickReport {
    AgentStatus before = AgentStatus::Planning;
    AgentStatus after = AgentStatus::Planning;

    bool planned = false;     // a planner call happened this tick
    bool replanned = false;   // ... and it was a replan
    PlanResult plan{};        // valid when planned
    bool moved = false;

    bool statusChanged() const { return before != after; }
};

// One rescuer.
//
// State machine:
//   Planning -> Moving -> (Replanning <-> Moving) -> {ReachedTarget, Dead, Stalled}
//
// The initial plan and its first move happen in the same tick. A replan
// triggered by a move runs in that tick too, right after the move; the agent
// steps onto the new plan on its next tick. Health never increases.
class Agent {
public:
    Agent(int id,
          world::SpatialGraphPtr graph,
          const PathPlanner* planner,
          const AgentConfig& cfg,
          double risk_tolerance);

    AgentTickReport tick(const AgentTickContext& ctx);

    // Folds other agents' observations into the shared penalty map
    // (max per node, scaled by shared_penalty_weight). Own reports are skipped.
    void receive(const std::vector<Observation>& batch);

    int id() const { return id_; }
    AgentStatus status() const { return status_; }
    bool terminal() const { return isTerminal(status_); }

    world::NodeId position() const { return position_; }
    double health() const { return health_; }
    double riskTolerance() const { return risk_tolerance_; }

    const std::vector<world::NodeId>& plan() const { return plan_; }
    std::size_t planIndex() const { return plan_index_; }
    const std::vector<world::NodeId>& trajectory() const { return trajectory_; }

    const std::string& cause() const { return cause_; }
    world::NodeId deathNode() const { return death_node_; }

    int steps() const { return steps_; }
    int replans() const { return replans_; }
    double cumulativeDanger() const { return cumulative_danger_; }

    const NodePenalty& sharedPenalty() const { return shared_penalty_; }

private:
    bool runPlanner(const AgentTickContext& ctx, AgentTickReport& rep);
    void moveOneStep(const AgentTickContext& ctx, AgentTickReport& rep);
    bool lookaheadExceedsPlan(const AgentTickContext& ctx);

    int id_ = 0;
    world::SpatialGraphPtr graph_;
    const PathPlanner* planner_ = nullptr;
    AgentConfig cfg_{};

    AgentStatus status_ = AgentStatus::Planning;
    world::NodeId position_ = world::kInvalidNode;
    double health_ = 1.0;
    double risk_tolerance_ = 0.5;

    std::vector<world::NodeId> plan_;
    std::vector<double> planned_intensity_;
    std::size_t plan_index_ = 0;

    std::vector<world::NodeId> trajectory_;

    std::string cause_;
    world::NodeId death_node_ = world::kInvalidNode;

    int steps_ = 0;
    int replans_ = 0;
    double cumulative_danger_ = 0.0;

    NodePenalty shared_penalty_;
};

} // namespace rescue
