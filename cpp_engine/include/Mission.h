#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "HazardField.h"
#include "Knowledge.h"
#include "RescueConfig.h"
#include "RunEvent.h"
#include "Status.h"
#include "../world/spatial_graph.h"

namespace rescue {

// Everything one mission reads from the outside. Passed by value; the mission
// never writes back into it.
struct RunContext {
    KnowledgeSummary summary{};
    int iteration = 0;
    std::uint32_t seed = 0;
    std::vector<HazardHint> hints;
    // Checked between ticks only.
    const std::atomic<bool>* cancel = nullptr;
};

struct MissionResult {
    // Ok, or ConfigurationError if the hazard could not be built.
    Status status{};
    MissionOutcome outcome{};
    // context summary extended by this outcome
    KnowledgeSummary summary{};
    std::vector<RunEvent> events;
};

// Rejects settings no mission can run with: non-positive tick or tick budget,
// no agents, a patrol route that does not fit the graph.
Status validateMissionConfig(const MissionConfig& cfg, const world::GraphConfig& graph);

// Derived from the success rate once any history exists:
//   clamp01(base - knowledge_gain * (0.5 - success_rate))
// so more past success never lowers it. base alone with no history.
double knowledgeRiskTolerance(const MissionConfig& cfg, const KnowledgeSummary& summary);

// Agent k of n: knowledge tolerance + spread * (k - (n-1)/2), clamped to [0,1].
double agentRiskTolerance(const MissionConfig& cfg, const KnowledgeSummary& summary, int k);

// Per-iteration seed, never 0.
std::uint32_t deriveMissionSeed(std::uint32_t base_seed, int iteration);

std::string makeMissionId(int iteration, std::uint32_t seed);

// One synchronous attempt. Each tick advances the hazard, delivers last
// tick's channel observations, then steps every live agent in id order.
// Ends on the first agent to reach the target, when every agent is terminal,
// when max_ticks is used up, or on cancellation.
MissionResult runMission(const world::SpatialGraphPtr& graph,
                         const MissionConfig& cfg,
                         const RunContext& ctx);

} // namespace rescue
