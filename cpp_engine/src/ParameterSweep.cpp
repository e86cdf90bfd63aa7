#include "ParameterSweep.h"

#include "Knowledge.h"
#include "RescueRunner.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <memory>
#include <numeric>

namespace rescue {

ParameterSweep::ParameterSweep() = default;

void ParameterSweep::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

const std::vector<ParameterSweep::SweepRow>& ParameterSweep::results() const {
    return results_;
}

const char* ParameterSweep::parameterName(Parameter p) {
    switch (p) {
        case Parameter::BaseRiskTolerance: return "base_risk_tolerance";
        case Parameter::DangerWeight:      return "danger_weight";
        case Parameter::ReplanThreshold:   return "replan_threshold";
        case Parameter::DamagePerTick:     return "damage_per_tick";
    }
    return "unknown";
}

bool ParameterSweep::parseParameter(const std::string& name, Parameter* out) {
    if (name == "base_risk_tolerance" || name == "risk_tolerance" || name == "risk") {
        *out = Parameter::BaseRiskTolerance;
    } else if (name == "danger_weight" || name == "lambda") {
        *out = Parameter::DangerWeight;
    } else if (name == "replan_threshold" || name == "threshold") {
        *out = Parameter::ReplanThreshold;
    } else if (name == "damage_per_tick" || name == "damage") {
        *out = Parameter::DamagePerTick;
    } else {
        return false;
    }
    return true;
}

double ParameterSweep::nominalValue(const RunConfig& cfg, Parameter p) {
    switch (p) {
        case Parameter::BaseRiskTolerance: return cfg.mission.base_risk_tolerance;
        case Parameter::DangerWeight:      return cfg.mission.planner.danger_weight;
        case Parameter::ReplanThreshold:   return cfg.mission.agent.replan_threshold;
        case Parameter::DamagePerTick:     return cfg.mission.agent.damage_per_tick;
    }
    return 0.0;
}

void ParameterSweep::applyValue(RunConfig& cfg, Parameter p, double v) {
    switch (p) {
        case Parameter::BaseRiskTolerance: cfg.mission.base_risk_tolerance = v; break;
        case Parameter::DangerWeight:      cfg.mission.planner.danger_weight = v; break;
        case Parameter::ReplanThreshold:   cfg.mission.agent.replan_threshold = v; break;
        case Parameter::DamagePerTick:     cfg.mission.agent.damage_per_tick = v; break;
    }
}

std::vector<double> ParameterSweep::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

ParameterSweep::MetricSummary ParameterSweep::summarize(const std::vector<double>& values) {
    MetricSummary result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

Status ParameterSweep::analyze(Parameter p, const ParameterRange& range) {
    RunRequest req;
    req.scenario = scenario_.kind;
    req.agents = scenario_.agents;
    req.iterations = std::max(scenario_.missions_per_sample, 1);

    for (double v : sampleValues(range)) {
        RunConfig varied = scenario_.run;
        applyValue(varied, p, v);

        KnowledgeLedger ledger(std::make_unique<MemoryOutcomeStore>(), varied.mission.knowledge);
        RescueRunner runner(varied, &ledger);
        const RunReport report = runner.run(req);
        if (!report.status.ok()) {
            return report.status;
        }

        std::vector<double> elapsed;
        std::vector<double> deaths;
        elapsed.reserve(report.outcomes.size());
        deaths.reserve(report.outcomes.size());
        for (const MissionOutcome& o : report.outcomes) {
            elapsed.push_back(o.elapsed_s);
            const auto n_dead = std::count_if(o.agents.begin(), o.agents.end(),
                                              [](const AgentRecord& a) { return a.died; });
            deaths.push_back(static_cast<double>(n_dead));
        }

        SweepRow row;
        row.parameter_name = parameterName(p);
        row.parameter_value = v;
        row.missions = report.missions;
        row.successes = report.successes;
        row.success_rate = (report.missions > 0) ? static_cast<double>(report.successes) / report.missions : 0.0;
        row.elapsed_s = summarize(elapsed);
        row.deaths = summarize(deaths);
        results_.push_back(row);
    }
    return Status::success();
}

Status ParameterSweep::exportCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out) {
        return Status::error(ErrorCode::PersistenceUnavailable, "cannot open " + filename);
    }

    out << "parameter,value,missions,successes,success_rate,"
           "elapsed_mean_s,elapsed_median_s,elapsed_std_s,elapsed_ci_lo_s,elapsed_ci_hi_s,"
           "deaths_mean,deaths_std\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.missions << ','
            << row.successes << ','
            << row.success_rate << ','
            << row.elapsed_s.mean << ','
            << row.elapsed_s.median << ','
            << row.elapsed_s.std_dev << ','
            << row.elapsed_s.ci_lower_95 << ','
            << row.elapsed_s.ci_upper_95 << ','
            << row.deaths.mean << ','
            << row.deaths.std_dev << '\n';
    }
    if (!out) {
        return Status::error(ErrorCode::PersistenceUnavailable, "write to " + filename + " failed");
    }
    return Status::success();
}

} // namespace rescue
