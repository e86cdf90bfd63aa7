#include "Knowledge.h"

#include "Hashing.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace rescue {

namespace {

// Field values never contain the separators.
std::string cleanField(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        if (c == '\t' || c == '\n' || c == '\r') c = ' ';
    }
    return out;
}

std::vector<std::string> splitTabs(const std::string& line) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = line.find('\t', start);
        if (pos == std::string::npos) {
            out.push_back(line.substr(start));
            return out;
        }
        out.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
}

bool parseInt(const std::string& s, long long* out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    *out = v;
    return true;
}

bool parseInt(const std::string& s, int* out) {
    long long v = 0;
    if (!parseInt(s, &v)) return false;
    *out = static_cast<int>(v);
    return true;
}

bool parseU32(const std::string& s, std::uint32_t* out) {
    long long v = 0;
    if (!parseInt(s, &v) || v < 0 || v > 0xFFFFFFFFll) return false;
    *out = static_cast<std::uint32_t>(v);
    return true;
}

bool parseDouble(const std::string& s, double* out) {
    if (s.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return false;
    *out = v;
    return true;
}

bool parseKind(const std::string& s, HazardKind* out) {
    if (s == hazardKindName(HazardKind::Spreading)) {
        *out = HazardKind::Spreading;
        return true;
    }
    if (s == hazardKindName(HazardKind::Patrolling)) {
        *out = HazardKind::Patrolling;
        return true;
    }
    return false;
}

bool parseCell(const std::string& s, world::GridCoord* out) {
    const std::size_t a = s.find(',');
    const std::size_t b = (a == std::string::npos) ? a : s.find(',', a + 1);
    if (a == std::string::npos || b == std::string::npos) return false;
    return parseInt(s.substr(0, a), &out->i)
        && parseInt(s.substr(a + 1, b - a - 1), &out->j)
        && parseInt(s.substr(b + 1), &out->level);
}

bool parseTrajectory(const std::string& s, std::vector<world::GridCoord>* out) {
    out->clear();
    if (s.empty()) return true;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = s.find(';', start);
        world::GridCoord c;
        if (!parseCell(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start), &c)) {
            return false;
        }
        out->push_back(c);
        if (pos == std::string::npos) return true;
        start = pos + 1;
    }
}

bool parseAgentLine(const std::vector<std::string>& f, AgentRecord* a) {
    if (f.size() != 13 || f[0] != "A") return false;
    int status = 0;
    int died = 0;
    if (!parseInt(f[1], &a->id) || !parseInt(f[2], &status) || !parseDouble(f[3], &a->risk_tolerance)
        || !parseInt(f[4], &died) || !parseInt(f[5], &a->death_cell.i) || !parseInt(f[6], &a->death_cell.j)
        || !parseInt(f[7], &a->death_cell.level) || !parseDouble(f[9], &a->final_health)
        || !parseDouble(f[10], &a->cumulative_danger) || !parseInt(f[11], &a->replans)
        || !parseTrajectory(f[12], &a->trajectory)) {
        return false;
    }
    if (status < 0 || status > static_cast<int>(AgentStatus::Stalled)) return false;
    a->status = static_cast<AgentStatus>(status);
    a->died = (died != 0);
    a->cause = f[8];
    return true;
}

} // namespace

// ============================================================
// Outcome records
// ============================================================

std::string serializeOutcome(const MissionOutcome& o) {
    std::ostringstream os;
    os << std::setprecision(17);
    os << "M\t" << cleanField(o.mission_id)
       << '\t' << hazardKindName(o.kind)
       << '\t' << (o.success ? 1 : 0)
       << '\t' << o.ticks
       << '\t' << o.elapsed_s
       << '\t' << cleanField(o.failure_reason)
       << '\t' << o.winning_agent
       << '\t' << o.seed
       << '\t' << o.config_hash
       << '\t' << (o.hint_rejected ? 1 : 0)
       << '\t' << o.agents.size() << '\n';

    for (const AgentRecord& a : o.agents) {
        os << "A\t" << a.id
           << '\t' << static_cast<int>(a.status)
           << '\t' << a.risk_tolerance
           << '\t' << (a.died ? 1 : 0)
           << '\t' << a.death_cell.i << '\t' << a.death_cell.j << '\t' << a.death_cell.level
           << '\t' << cleanField(a.cause)
           << '\t' << a.final_health
           << '\t' << a.cumulative_danger
           << '\t' << a.replans
           << '\t';
        for (std::size_t k = 0; k < a.trajectory.size(); ++k) {
            const world::GridCoord& c = a.trajectory[k];
            if (k) os << ';';
            os << c.i << ',' << c.j << ',' << c.level;
        }
        os << '\n';
    }

    os << "E\t" << cleanField(o.mission_id) << '\n';
    return os.str();
}

bool parseOutcome(const std::string& text, MissionOutcome* out) {
    std::istringstream is(text);
    std::string line;

    if (!std::getline(is, line)) return false;
    const std::vector<std::string> m = splitTabs(line);
    if (m.size() != 12 || m[0] != "M") return false;

    MissionOutcome o;
    o.mission_id = m[1];
    int success = 0;
    int hint_rejected = 0;
    long long n_agents = 0;
    if (!parseKind(m[2], &o.kind) || !parseInt(m[3], &success) || !parseInt(m[4], &o.ticks)
        || !parseDouble(m[5], &o.elapsed_s) || !parseInt(m[7], &o.winning_agent)
        || !parseU32(m[8], &o.seed) || !parseU32(m[9], &o.config_hash)
        || !parseInt(m[10], &hint_rejected) || !parseInt(m[11], &n_agents) || n_agents < 0) {
        return false;
    }
    o.success = (success != 0);
    o.failure_reason = m[6];
    o.hint_rejected = (hint_rejected != 0);

    for (long long k = 0; k < n_agents; ++k) {
        if (!std::getline(is, line)) return false;
        AgentRecord a;
        if (!parseAgentLine(splitTabs(line), &a)) return false;
        o.agents.push_back(std::move(a));
    }

    if (!std::getline(is, line)) return false;
    const std::vector<std::string> e = splitTabs(line);
    if (e.size() != 2 || e[0] != "E" || e[1] != o.mission_id) return false;

    *out = std::move(o);
    return true;
}

std::uint32_t outcomeDigest(const MissionOutcome& o) {
    return fnv1a32_add_str(fnv1a32_begin(), serializeOutcome(o));
}

// ============================================================
// Summary
// ============================================================

KnowledgeSummary KnowledgeSummary::withOutcome(const MissionOutcome& o, const KnowledgeConfig& cfg) const {
    KnowledgeSummary next = *this;
    const int index = total_missions;
    next.total_missions += 1;

    if (o.success) {
        if (next.successful_missions == 0) {
            next.success_time_min_s = o.elapsed_s;
            next.success_time_max_s = o.elapsed_s;
        } else {
            next.success_time_min_s = std::min(next.success_time_min_s, o.elapsed_s);
            next.success_time_max_s = std::max(next.success_time_max_s, o.elapsed_s);
        }
        next.successful_missions += 1;
        next.success_time_sum_s += o.elapsed_s;

        const auto winner = std::find_if(o.agents.begin(), o.agents.end(),
                                         [&](const AgentRecord& a) { return a.id == o.winning_agent; });
        if (winner != o.agents.end() && !winner->trajectory.empty()) {
            SuccessPrefix p;
            const std::size_t len = std::min(winner->trajectory.size(),
                                             static_cast<std::size_t>(std::max(cfg.prefix_length, 0)));
            p.cells.assign(winner->trajectory.begin(), winner->trajectory.begin() + static_cast<std::ptrdiff_t>(len));
            p.elapsed_s = o.elapsed_s;
            p.mission_index = index;
            next.success_prefixes.push_back(std::move(p));
            std::stable_sort(next.success_prefixes.begin(), next.success_prefixes.end(),
                             [](const SuccessPrefix& a, const SuccessPrefix& b) {
                                 return a.elapsed_s < b.elapsed_s;
                             });
            const std::size_t keep = static_cast<std::size_t>(std::max(cfg.max_success_prefixes, 0));
            if (next.success_prefixes.size() > keep) next.success_prefixes.resize(keep);

            if (!next.hasBestTrajectory() || winner->cumulative_danger < next.best_trajectory_danger) {
                next.best_trajectory = winner->trajectory;
                next.best_trajectory_danger = winner->cumulative_danger;
            }
        }
    } else {
        next.failure_reasons[o.failure_reason.empty() ? std::string("unknown") : o.failure_reason] += 1;
    }

    for (const AgentRecord& a : o.agents) {
        if (a.died) {
            next.deaths.push_back(DeathRecord{a.death_cell, index});
        }
    }
    const std::size_t max_deaths = static_cast<std::size_t>(std::max(cfg.max_death_records, 0));
    if (next.deaths.size() > max_deaths) {
        next.deaths.erase(next.deaths.begin(),
                          next.deaths.begin() + static_cast<std::ptrdiff_t>(next.deaths.size() - max_deaths));
    }
    return next;
}

NodePenalty buildDeathPenalty(const world::SpatialGraph& g,
                              const KnowledgeSummary& summary,
                              const KnowledgeConfig& cfg) {
    NodePenalty pen(static_cast<std::size_t>(g.nodeCount()), 0.0);
    if (summary.deaths.empty()) return pen;

    const double weight = (std::isfinite(cfg.death_penalty_weight) && cfg.death_penalty_weight > 0.0)
                              ? cfg.death_penalty_weight
                              : 0.0;
    const double decay = std::isfinite(cfg.penalty_decay) ? std::clamp(cfg.penalty_decay, 0.0, 1.0) : 0.0;
    const int r = std::max(cfg.penalty_radius_cells, 0);

    for (const DeathRecord& d : summary.deaths) {
        const int age = std::max(summary.total_missions - 1 - d.mission_index, 0);
        const double w = weight * std::pow(decay, age);
        if (!(w > 0.0)) continue;
        for (int dj = -r; dj <= r; ++dj) {
            for (int di = -r; di <= r; ++di) {
                const world::NodeId n = g.nodeAt(d.cell.i + di, d.cell.j + dj, d.cell.level);
                if (n == world::kInvalidNode) continue;
                pen[static_cast<std::size_t>(n)] += w;
            }
        }
    }

    const double keep = 1.0 - (std::isfinite(cfg.success_discount) ? std::clamp(cfg.success_discount, 0.0, 1.0) : 0.0);
    std::vector<bool> discounted(pen.size(), false);
    for (const SuccessPrefix& p : summary.success_prefixes) {
        for (const world::GridCoord& c : p.cells) {
            const world::NodeId n = g.nodeAt(c);
            if (n == world::kInvalidNode || discounted[static_cast<std::size_t>(n)]) continue;
            discounted[static_cast<std::size_t>(n)] = true;
            pen[static_cast<std::size_t>(n)] *= keep;
        }
    }
    return pen;
}

// ============================================================
// Stores
// ============================================================

Status OutcomeStore::loadSummary(const KnowledgeConfig& cfg, KnowledgeSummary* out) const {
    std::vector<MissionOutcome> outcomes;
    const Status st = loadOutcomes(&outcomes);
    KnowledgeSummary s;
    for (const MissionOutcome& o : outcomes) {
        s = s.withOutcome(o, cfg);
    }
    *out = std::move(s);
    return st;
}

Status FileOutcomeStore::loadOutcomes(std::vector<MissionOutcome>* out) const {
    out->clear();
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        // No history yet.
        return Status::success();
    }

    int damaged = 0;
    bool open_record = false;
    std::string block;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        if (line.compare(0, 2, "M\t") == 0) {
            if (open_record) ++damaged;
            open_record = true;
            block = line + '\n';
            continue;
        }
        if (!open_record) {
            ++damaged;
            continue;
        }
        block += line;
        block += '\n';
        if (line.compare(0, 2, "E\t") == 0) {
            MissionOutcome o;
            if (parseOutcome(block, &o)) {
                out->push_back(std::move(o));
            } else {
                ++damaged;
            }
            open_record = false;
            block.clear();
        }
    }
    // An unterminated record at the tail is an interrupted append: ignored.

    if (damaged > 0) {
        return Status::error(ErrorCode::PersistenceUnavailable,
                             std::to_string(damaged) + " damaged record(s) skipped in " + path_);
    }
    return Status::success();
}

Status FileOutcomeStore::appendOutcome(const MissionOutcome& o) {
    std::ofstream f(path_, std::ios::binary | std::ios::app);
    if (!f) {
        return Status::error(ErrorCode::PersistenceUnavailable, "cannot open " + path_ + " for append");
    }
    // Leading newline: a record never continues a torn line.
    const std::string rec = "\n" + serializeOutcome(o);
    f.write(rec.data(), static_cast<std::streamsize>(rec.size()));
    f.flush();
    if (!f) {
        return Status::error(ErrorCode::PersistenceUnavailable, "write to " + path_ + " failed");
    }
    return Status::success();
}

Status MemoryOutcomeStore::loadOutcomes(std::vector<MissionOutcome>* out) const {
    *out = outcomes_;
    return Status::success();
}

Status MemoryOutcomeStore::appendOutcome(const MissionOutcome& o) {
    outcomes_.push_back(o);
    return Status::success();
}

// ============================================================
// Ledger
// ============================================================

KnowledgeLedger::KnowledgeLedger(std::unique_ptr<OutcomeStore> store, const KnowledgeConfig& cfg)
    : store_(std::move(store)), cfg_(cfg) {}

Status KnowledgeLedger::open() {
    std::lock_guard<std::mutex> lock(mu_);
    if (opened_) {
        return Status::success();
    }
    opened_ = true;
    if (!store_) {
        return Status::error(ErrorCode::PersistenceUnavailable, "no outcome store attached");
    }
    KnowledgeSummary loaded;
    const Status st = store_->loadSummary(cfg_, &loaded);
    summary_ = std::move(loaded);
    next_index_ = std::max(next_index_, summary_.total_missions);
    if (!st.ok()) {
        std::cerr << "[WARN] knowledge load: " << st.message << "\n";
    }
    return st;
}

int KnowledgeLedger::reserveMissionIndex() {
    std::lock_guard<std::mutex> lock(mu_);
    next_index_ = std::max(next_index_, summary_.total_missions);
    return next_index_++;
}

KnowledgeSummary KnowledgeLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return summary_;
}

Status KnowledgeLedger::commit(const MissionOutcome& o, KnowledgeSummary* updated) {
    std::lock_guard<std::mutex> lock(mu_);
    Status st = store_ ? store_->appendOutcome(o)
                       : Status::error(ErrorCode::PersistenceUnavailable, "no outcome store attached");
    summary_ = summary_.withOutcome(o, cfg_);
    if (updated) *updated = summary_;
    if (!st.ok()) {
        std::cerr << "[WARN] outcome " << o.mission_id << " kept in memory only: " << st.message << "\n";
    }
    return st;
}

} // namespace rescue
