#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "HazardField.h"
#include "Knowledge.h"
#include "Mission.h"
#include "RescueConfig.h"
#include "RunEvent.h"
#include "Status.h"
#include "../world/spatial_graph.h"

namespace rescue {

// Accepts "fire" / "attacker" (and the kind names "spreading" / "patrolling").
bool parseScenario(const std::string& name, HazardKind* out);

struct RunRequest {
    HazardKind scenario = HazardKind::Spreading;
    int iterations = 1;
    int agents = 3;
    // Repeat until the first success, at most max_iterations missions.
    bool until_success = false;
    int max_iterations = 50;
};

struct RunReport {
    // Ok, or ConfigurationError when the run was refused before any mission.
    Status status{};

    int missions = 0;
    int successes = 0;
    bool aborted = false;
    int persistence_warnings = 0;

    std::vector<MissionOutcome> outcomes;
    KnowledgeSummary knowledge{};
};

// Control surface. Owns the shared graph for the lifetime of the runner and
// drives missions against one KnowledgeLedger: snapshot -> mission -> commit,
// strictly in that order per mission.
//
// Progress is reported through the event sink as plain RunEvent values.
class RescueRunner {
public:
    // ledger may be null: an in-memory ledger is used.
    explicit RescueRunner(const RunConfig& cfg, KnowledgeLedger* ledger = nullptr);

    void setEventSink(EventSink sink) { sink_ = std::move(sink); }
    void setHints(std::vector<HazardHint> hints) { hints_ = std::move(hints); }
    void setCancelFlag(const std::atomic<bool>* cancel) { cancel_ = cancel; }

    // Builds (or reuses) the graph and validates the mission settings for the
    // request. Fails only with ConfigurationError.
    Status prepare(const RunRequest& req);

    RunReport run(const RunRequest& req);

    const world::SpatialGraphPtr& graph() const { return graph_; }
    const RunConfig& config() const { return cfg_; }
    KnowledgeLedger& ledger() { return *ledger_; }

private:
    MissionConfig missionConfigFor(const RunRequest& req) const;
    void emit(const RunEvent& ev) const;

    RunConfig cfg_{};
    std::unique_ptr<KnowledgeLedger> own_ledger_;
    KnowledgeLedger* ledger_ = nullptr;

    world::SpatialGraphPtr graph_;
    std::uint32_t graph_hash_ = 0;

    std::vector<HazardHint> hints_;
    const std::atomic<bool>* cancel_ = nullptr;
    EventSink sink_;
};

} // namespace rescue
