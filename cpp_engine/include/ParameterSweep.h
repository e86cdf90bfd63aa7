#pragma once

#include <string>
#include <vector>

#include "RescueConfig.h"
#include "Status.h"

namespace rescue {

// One-at-a-time sweep of a planning / agent parameter. Every sample runs a
// batch of missions against its own fresh in-memory ledger, so samples never
// learn from each other.
class ParameterSweep {
public:
    enum class Parameter : int {
        BaseRiskTolerance = 0,
        DangerWeight      = 1,
        ReplanThreshold   = 2,
        DamagePerTick     = 3,
    };

    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct ScenarioConfig {
        RunConfig run{};
        HazardKind kind = HazardKind::Spreading;
        int agents = 3;
        int missions_per_sample = 5;
    };

    struct MetricSummary {
        double mean = 0.0;
        double median = 0.0;
        double std_dev = 0.0;
        double ci_lower_95 = 0.0;
        double ci_upper_95 = 0.0;
    };

    struct SweepRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        int missions = 0;
        int successes = 0;
        double success_rate = 0.0;
        MetricSummary elapsed_s{};
        MetricSummary deaths{};
    };

    ParameterSweep();

    void setScenario(const ScenarioConfig& scenario);
    const ScenarioConfig& scenario() const { return scenario_; }

    // Appends one row per sample. ConfigurationError if a sample is refused.
    Status analyze(Parameter p, const ParameterRange& range);

    Status exportCSV(const std::string& filename) const;
    const std::vector<SweepRow>& results() const;

    static const char* parameterName(Parameter p);
    static bool parseParameter(const std::string& name, Parameter* out);
    static double nominalValue(const RunConfig& cfg, Parameter p);
    static void applyValue(RunConfig& cfg, Parameter p, double v);

    static MetricSummary summarize(const std::vector<double>& values);

private:
    ScenarioConfig scenario_{};
    std::vector<SweepRow> results_{};

    std::vector<double> sampleValues(const ParameterRange& range) const;
};

} // namespace rescue
