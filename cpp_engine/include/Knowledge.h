#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "Agent.h"
#include "PathPlanner.h"
#include "RescueConfig.h"
#include "Status.h"
#include "../world/spatial_graph.h"

namespace rescue {

// ============================================================
// Outcome records
// ============================================================

struct AgentRecord {
    int id = 0;
    AgentStatus status = AgentStatus::Planning;
    double risk_tolerance = 0.0;

    // Visited cells, start first.
    std::vector<world::GridCoord> trajectory;

    bool died = false;
    world::GridCoord death_cell{};
    std::string cause;

    double final_health = 1.0;
    double cumulative_danger = 0.0;
    int replans = 0;
};

// Immutable record of one attempt.
struct MissionOutcome {
    std::string mission_id;
    HazardKind kind = HazardKind::Spreading;

    bool success = false;
    int ticks = 0;
    double elapsed_s = 0.0;
    // Empty on success; "timeout", "all agents lost" or "aborted" otherwise.
    std::string failure_reason;
    int winning_agent = -1;

    std::uint32_t seed = 0;
    std::uint32_t config_hash = 0;
    bool hint_rejected = false;

    std::vector<AgentRecord> agents;
};

// Canonical text form (one "M" line, one "A" line per agent, one "E" line).
// Doubles are printed round-trippable, so equal outcomes serialize equally.
std::string serializeOutcome(const MissionOutcome& o);

// Parses exactly one record as produced by serializeOutcome().
bool parseOutcome(const std::string& text, MissionOutcome* out);

std::uint32_t outcomeDigest(const MissionOutcome& o);

// ============================================================
// Cross-mission summary
// ============================================================

struct DeathRecord {
    world::GridCoord cell{};
    int mission_index = 0;
};

struct SuccessPrefix {
    std::vector<world::GridCoord> cells;
    double elapsed_s = 0.0;
    int mission_index = 0;
};

// Aggregate of every outcome folded so far. Never mutated in place:
// withOutcome() returns the extended summary.
struct KnowledgeSummary {
    int total_missions = 0;
    int successful_missions = 0;

    // Oldest first, bounded by KnowledgeConfig::max_death_records.
    std::vector<DeathRecord> deaths;
    // Fastest first, bounded by KnowledgeConfig::max_success_prefixes.
    std::vector<SuccessPrefix> success_prefixes;

    std::map<std::string, int> failure_reasons;

    double success_time_sum_s = 0.0;
    double success_time_min_s = 0.0;
    double success_time_max_s = 0.0;

    // Winning trajectory with the lowest cumulative danger seen so far.
    std::vector<world::GridCoord> best_trajectory;
    double best_trajectory_danger = 0.0;

    double successRate() const {
        return (total_missions > 0) ? static_cast<double>(successful_missions) / total_missions : 0.0;
    }
    double averageSuccessTime() const {
        return (successful_missions > 0) ? success_time_sum_s / successful_missions : 0.0;
    }
    bool hasBestTrajectory() const { return !best_trajectory.empty(); }

    KnowledgeSummary withOutcome(const MissionOutcome& o, const KnowledgeConfig& cfg) const;
};

// Per-node persistent penalty for the planner.
//
// Each death record adds death_penalty_weight * penalty_decay^age to every
// node on its level within penalty_radius_cells (Chebyshev), where age is the
// number of missions since it was recorded. Nodes on a recorded successful
// prefix keep (1 - success_discount) of their penalty.
NodePenalty buildDeathPenalty(const world::SpatialGraph& g,
                              const KnowledgeSummary& summary,
                              const KnowledgeConfig& cfg);

// ============================================================
// Persistence seam
// ============================================================

class OutcomeStore {
public:
    virtual ~OutcomeStore() = default;

    // Committed outcomes, oldest first. A store with no history yet is not an
    // error. PersistenceUnavailable still fills whatever could be read.
    virtual Status loadOutcomes(std::vector<MissionOutcome>* out) const = 0;

    virtual Status appendOutcome(const MissionOutcome& o) = 0;

    // Folds loadOutcomes() into a fresh summary.
    Status loadSummary(const KnowledgeConfig& cfg, KnowledgeSummary* out) const;
};

// Append-only record log. Each record is written with a single write and ends
// with an "E" line; a torn record at the tail is ignored on load.
class FileOutcomeStore final : public OutcomeStore {
public:
    explicit FileOutcomeStore(std::string path) : path_(std::move(path)) {}

    Status loadOutcomes(std::vector<MissionOutcome>* out) const override;
    Status appendOutcome(const MissionOutcome& o) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class MemoryOutcomeStore final : public OutcomeStore {
public:
    Status loadOutcomes(std::vector<MissionOutcome>* out) const override;
    Status appendOutcome(const MissionOutcome& o) override;

    std::size_t size() const { return outcomes_.size(); }

private:
    std::vector<MissionOutcome> outcomes_;
};

// Process-wide owner of the summary. snapshot() and commit() are serialized,
// so a snapshot taken after a commit returns observes it and no two commits
// interleave their writes.
class KnowledgeLedger {
public:
    KnowledgeLedger(std::unique_ptr<OutcomeStore> store, const KnowledgeConfig& cfg);

    // Loads the durable history once. On failure the ledger starts from
    // whatever was readable and reports PersistenceUnavailable. Later calls
    // are no-ops, so outcomes held only in memory are never dropped.
    Status open();

    KnowledgeSummary snapshot() const;

    // Hands out the next global mission index. Counts committed missions and
    // ones reserved but not yet committed, so concurrent runs never share one.
    int reserveMissionIndex();

    // Appends durably, then folds into the in-memory summary. The fold happens
    // even when the append fails, so learning continues within the run.
    Status commit(const MissionOutcome& o, KnowledgeSummary* updated = nullptr);

    const KnowledgeConfig& config() const { return cfg_; }

private:
    mutable std::mutex mu_;
    std::unique_ptr<OutcomeStore> store_;
    KnowledgeConfig cfg_{};
    KnowledgeSummary summary_{};
    bool opened_ = false;
    int next_index_ = 0;
};

} // namespace rescue
