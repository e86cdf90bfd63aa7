#include "Knowledge.h"
#include "RescueRunner.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "RescueTool usage:\n"
              << "  RescueTool [--scenario fire|attacker] [--iterations n] [--agents n]\n"
              << "             [--until-success] [--max-iterations n] [--seed n]\n"
              << "             [--store file] [--hint x,y,level,confidence]... [--stats-only] [--quiet]\n";
}

bool parseHint(const std::string& text, rescue::HazardHint* out) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) parts.push_back(item);
    if (parts.size() != 4) return false;

    char* end = nullptr;
    out->position_m.x = std::strtod(parts[0].c_str(), &end);
    if (*end != '\0') return false;
    out->position_m.y = std::strtod(parts[1].c_str(), &end);
    if (*end != '\0') return false;
    out->level = static_cast<int>(std::strtol(parts[2].c_str(), &end, 10));
    if (*end != '\0') return false;
    out->confidence = std::strtod(parts[3].c_str(), &end);
    return *end == '\0';
}

void printStatistics(const rescue::KnowledgeSummary& s) {
    std::cout << "=== MISSION STATISTICS ===\n";
    std::cout << "Total missions: " << s.total_missions << "\n";
    std::cout << "Successful missions: " << s.successful_missions << "\n";
    std::cout << "Success rate: " << std::fixed << std::setprecision(1) << (s.successRate() * 100.0) << "%\n";
    if (s.successful_missions > 0) {
        std::cout << "Success time avg/min/max: " << std::setprecision(2)
                  << s.averageSuccessTime() << " / "
                  << s.success_time_min_s << " / "
                  << s.success_time_max_s << " s\n";
    }
    if (!s.failure_reasons.empty()) {
        std::cout << "Failure reasons:\n";
        for (const auto& kv : s.failure_reasons) {
            std::cout << "  " << kv.first << ": " << kv.second << "\n";
        }
    }
    std::cout << "Recorded death positions: " << s.deaths.size() << "\n";
    std::cout << "Recorded successful prefixes: " << s.success_prefixes.size() << "\n";
    if (s.hasBestTrajectory()) {
        std::cout << "Best trajectory: " << s.best_trajectory.size() << " cells, danger "
                  << std::setprecision(3) << s.best_trajectory_danger << "\n";
    }
}

void printEvent(const rescue::RunEvent& ev, bool quiet) {
    using rescue::RunEventType;
    switch (ev.type) {
        case RunEventType::IterationStart:
            std::cout << "[ITER] mission " << ev.iteration << " (" << rescue::hazardKindName(ev.kind)
                      << ") prior success rate " << std::fixed << std::setprecision(3) << ev.success_rate
                      << " risk tolerance " << ev.risk_tolerance << "\n";
            break;
        case RunEventType::AgentPlan:
            if (quiet) break;
            std::cout << "[PLAN] t=" << ev.tick << " agent " << ev.agent_id
                      << (ev.replan ? " replan" : " plan");
            if (ev.plan_ok) {
                std::cout << " nodes=" << ev.path_nodes << " length=" << std::setprecision(1) << ev.plan_length_m
                          << "m cost=" << std::setprecision(2) << ev.plan_cost
                          << " vertical=" << ev.vertical_transitions << "\n";
            } else {
                std::cout << " failed: " << ev.message << "\n";
            }
            break;
        case RunEventType::AgentStatusChange:
            if (quiet) break;
            std::cout << "[AGENT] t=" << ev.tick << " agent " << ev.agent_id << " "
                      << rescue::agentStatusName(ev.from) << " -> " << rescue::agentStatusName(ev.to)
                      << " health=" << std::setprecision(2) << ev.health;
            if (!ev.message.empty()) std::cout << " (" << ev.message << ")";
            std::cout << "\n";
            break;
        case RunEventType::MissionEnd:
            std::cout << "[MISSION] " << ev.mission_id << (ev.success ? " SUCCESS" : " FAILED")
                      << " t=" << std::setprecision(1) << ev.elapsed_s << "s";
            if (ev.success) {
                std::cout << " agent " << ev.agent_id;
            } else {
                std::cout << " (" << ev.message << ")";
            }
            std::cout << " success rate " << std::setprecision(3) << ev.success_rate
                      << " (" << ev.successes << "/" << ev.missions << ")\n";
            break;
        case RunEventType::Warning:
            std::cout << "[WARN] " << ev.message << "\n";
            break;
        case RunEventType::RunEnd:
            std::cout << "[RUN] missions=" << ev.missions << " successes=" << ev.successes
                      << " success rate " << std::setprecision(3) << ev.success_rate;
            if (!ev.message.empty()) std::cout << " (" << ev.message << ")";
            std::cout << "\n";
            break;
    }
}
} // namespace

int main(int argc, char** argv) {
    rescue::RunRequest req;
    rescue::RunConfig cfg;
    std::vector<rescue::HazardHint> hints;
    std::string store_path;
    bool stats_only = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--scenario" && i + 1 < argc) {
            const std::string name = toLower(argv[++i]);
            if (!rescue::parseScenario(name, &req.scenario)) {
                std::cout << "Unsupported scenario: " << name << "\n";
                printUsage();
                return 1;
            }
        } else if (arg == "--iterations" && i + 1 < argc) {
            req.iterations = std::atoi(argv[++i]);
        } else if (arg == "--agents" && i + 1 < argc) {
            req.agents = std::atoi(argv[++i]);
        } else if (arg == "--until-success") {
            req.until_success = true;
        } else if (arg == "--max-iterations" && i + 1 < argc) {
            req.max_iterations = std::atoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            cfg.mission.seed = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 0));
        } else if (arg == "--store" && i + 1 < argc) {
            store_path = argv[++i];
        } else if (arg == "--hint" && i + 1 < argc) {
            rescue::HazardHint h;
            const std::string text = argv[++i];
            if (!parseHint(text, &h)) {
                std::cout << "Malformed hint: " << text << "\n";
                printUsage();
                return 1;
            }
            hints.push_back(h);
        } else if (arg == "--stats-only") {
            stats_only = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    std::unique_ptr<rescue::OutcomeStore> store;
    if (store_path.empty()) {
        store = std::make_unique<rescue::MemoryOutcomeStore>();
    } else {
        store = std::make_unique<rescue::FileOutcomeStore>(store_path);
    }
    rescue::KnowledgeLedger ledger(std::move(store), cfg.mission.knowledge);

    if (stats_only) {
        const rescue::Status st = ledger.open();
        if (!st.ok()) {
            std::cout << "[WARN] " << st.message << "\n";
        }
        printStatistics(ledger.snapshot());
        return 0;
    }

    rescue::RescueRunner runner(cfg, &ledger);
    runner.setHints(hints);
    runner.setEventSink([quiet](const rescue::RunEvent& ev) { printEvent(ev, quiet); });

    const rescue::RunReport report = runner.run(req);
    if (!report.status.ok()) {
        std::cout << "Run refused (" << rescue::errorCodeName(report.status.code) << "): "
                  << report.status.message << "\n";
        return 2;
    }

    printStatistics(report.knowledge);
    return 0;
}
