#pragma once

#include <functional>
#include <string>

#include "Agent.h"
#include "RescueConfig.h"

namespace rescue {

enum class RunEventType : int {
    IterationStart    = 0,
    AgentPlan         = 1,
    AgentStatusChange = 2,
    MissionEnd        = 3,
    Warning           = 4,
    RunEnd            = 5,
};

inline const char* runEventTypeName(RunEventType t) {
    switch (t) {
        case RunEventType::IterationStart:    return "iteration_start";
        case RunEventType::AgentPlan:         return "agent_plan";
        case RunEventType::AgentStatusChange: return "agent_status_change";
        case RunEventType::MissionEnd:        return "mission_end";
        case RunEventType::Warning:           return "warning";
        case RunEventType::RunEnd:            return "run_end";
    }
    return "unknown";
}

// Progress record. Plain data: the core never formats or transports it.
// Only the fields relevant to `type` are meaningful.
struct RunEvent {
    RunEventType type = RunEventType::IterationStart;

    int iteration = 0;
    int tick = 0;
    HazardKind kind = HazardKind::Spreading;

    // AgentPlan / AgentStatusChange
    int agent_id = -1;
    AgentStatus from = AgentStatus::Planning;
    AgentStatus to = AgentStatus::Planning;
    double health = 1.0;
    double risk_tolerance = 0.0;

    // AgentPlan
    bool replan = false;
    bool plan_ok = false;
    int path_nodes = 0;
    double plan_cost = 0.0;
    double plan_length_m = 0.0;
    int vertical_transitions = 0;

    // MissionEnd / RunEnd
    std::string mission_id;
    bool success = false;
    double elapsed_s = 0.0;
    int missions = 0;
    int successes = 0;
    double success_rate = 0.0;

    // Failure reason, agent cause, or warning text.
    std::string message;
};

using EventSink = std::function<void(const RunEvent&)>;

} // namespace rescue
