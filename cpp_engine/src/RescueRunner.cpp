#include "RescueRunner.h"

#include <algorithm>
#include <utility>

namespace rescue {

bool parseScenario(const std::string& name, HazardKind* out) {
    if (name == "fire" || name == "spreading") {
        *out = HazardKind::Spreading;
        return true;
    }
    if (name == "attacker" || name == "patrolling") {
        *out = HazardKind::Patrolling;
        return true;
    }
    return false;
}

RescueRunner::RescueRunner(const RunConfig& cfg, KnowledgeLedger* ledger)
    : cfg_(cfg), ledger_(ledger) {
    if (!ledger_) {
        own_ledger_ = std::make_unique<KnowledgeLedger>(std::make_unique<MemoryOutcomeStore>(), cfg_.mission.knowledge);
        ledger_ = own_ledger_.get();
    }
}

void RescueRunner::emit(const RunEvent& ev) const {
    if (sink_) sink_(ev);
}

MissionConfig RescueRunner::missionConfigFor(const RunRequest& req) const {
    MissionConfig m = cfg_.mission;
    m.kind = req.scenario;
    m.num_agents = req.agents;
    return m;
}

Status RescueRunner::prepare(const RunRequest& req) {
    if (req.until_success ? (req.max_iterations <= 0) : (req.iterations <= 0)) {
        return Status::error(ErrorCode::ConfigurationError, "iteration count must be positive");
    }

    const std::uint32_t h = configHash(cfg_.graph);
    if (!graph_ || h != graph_hash_) {
        Status st;
        world::SpatialGraphPtr g = world::SpatialGraph::build(cfg_.graph, &st);
        if (!g) {
            graph_.reset();
            return st;
        }
        graph_ = std::move(g);
        graph_hash_ = h;
    }

    return validateMissionConfig(missionConfigFor(req), cfg_.graph);
}

RunReport RescueRunner::run(const RunRequest& req) {
    RunReport report;

    report.status = prepare(req);
    if (!report.status.ok()) {
        RunEvent ev;
        ev.type = RunEventType::RunEnd;
        ev.kind = req.scenario;
        ev.message = report.status.message;
        emit(ev);
        return report;
    }

    {
        const Status st = ledger_->open();
        if (!st.ok()) {
            ++report.persistence_warnings;
            RunEvent ev;
            ev.type = RunEventType::Warning;
            ev.kind = req.scenario;
            ev.message = st.message;
            emit(ev);
        }
    }

    const MissionConfig mcfg = missionConfigFor(req);
    const int limit = req.until_success ? req.max_iterations : req.iterations;

    for (int k = 0; k < limit; ++k) {
        if (cancel_ && cancel_->load()) {
            report.aborted = true;
            break;
        }

        RunContext ctx;
        ctx.summary = ledger_->snapshot();
        // Global mission index: ids and seeds stay unique across runs sharing a ledger.
        ctx.iteration = ledger_->reserveMissionIndex();
        ctx.seed = deriveMissionSeed(mcfg.seed, ctx.iteration);
        ctx.hints = hints_;
        ctx.cancel = cancel_;

        {
            RunEvent ev;
            ev.type = RunEventType::IterationStart;
            ev.iteration = ctx.iteration;
            ev.kind = mcfg.kind;
            ev.missions = ctx.summary.total_missions;
            ev.successes = ctx.summary.successful_missions;
            ev.success_rate = ctx.summary.successRate();
            ev.risk_tolerance = knowledgeRiskTolerance(mcfg, ctx.summary);
            emit(ev);
        }

        MissionResult mr = runMission(graph_, mcfg, ctx);
        if (!mr.status.ok()) {
            report.status = mr.status;
            break;
        }
        for (const RunEvent& ev : mr.events) emit(ev);

        KnowledgeSummary updated;
        const Status st = ledger_->commit(mr.outcome, &updated);
        if (!st.ok()) {
            ++report.persistence_warnings;
            RunEvent ev;
            ev.type = RunEventType::Warning;
            ev.iteration = ctx.iteration;
            ev.kind = mcfg.kind;
            ev.mission_id = mr.outcome.mission_id;
            ev.message = st.message;
            emit(ev);
        }

        ++report.missions;
        if (mr.outcome.success) ++report.successes;

        {
            RunEvent ev;
            ev.type = RunEventType::MissionEnd;
            ev.iteration = ctx.iteration;
            ev.tick = mr.outcome.ticks;
            ev.kind = mcfg.kind;
            ev.agent_id = mr.outcome.winning_agent;
            ev.mission_id = mr.outcome.mission_id;
            ev.success = mr.outcome.success;
            ev.elapsed_s = mr.outcome.elapsed_s;
            ev.missions = updated.total_missions;
            ev.successes = updated.successful_missions;
            ev.success_rate = updated.successRate();
            ev.message = mr.outcome.failure_reason;
            emit(ev);
        }

        const bool success = mr.outcome.success;
        const bool aborted = (mr.outcome.failure_reason == "aborted");
        report.outcomes.push_back(std::move(mr.outcome));
        if (aborted) {
            report.aborted = true;
            break;
        }
        if (req.until_success && success) break;
    }

    report.knowledge = ledger_->snapshot();

    RunEvent end;
    end.type = RunEventType::RunEnd;
    end.kind = req.scenario;
    end.missions = report.missions;
    end.successes = report.successes;
    end.success_rate = report.knowledge.successRate();
    end.success = (report.successes > 0);
    if (report.aborted) end.message = "aborted";
    emit(end);
    return report;
}

} // namespace rescue
