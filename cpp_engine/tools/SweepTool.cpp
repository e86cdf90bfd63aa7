#include "ParameterSweep.h"
#include "RescueRunner.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "SweepTool usage:\n"
              << "  SweepTool --param <base_risk_tolerance|danger_weight|replan_threshold|damage_per_tick>\n"
              << "            [--min v] [--max v] [--samples n] [--missions n] [--agents n]\n"
              << "            [--scenario fire|attacker] [--out file]\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    std::string out = "sweep.csv";
    bool min_set = false;
    bool max_set = false;

    rescue::ParameterSweep::ScenarioConfig scenario;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--param" && i + 1 < argc) {
            param = toLower(argv[++i]);
        } else if (arg == "--min" && i + 1 < argc) {
            min_val = std::stod(argv[++i]);
            min_set = true;
        } else if (arg == "--max" && i + 1 < argc) {
            max_val = std::stod(argv[++i]);
            max_set = true;
        } else if (arg == "--samples" && i + 1 < argc) {
            samples = std::stoi(argv[++i]);
        } else if (arg == "--missions" && i + 1 < argc) {
            scenario.missions_per_sample = std::stoi(argv[++i]);
        } else if (arg == "--agents" && i + 1 < argc) {
            scenario.agents = std::stoi(argv[++i]);
        } else if (arg == "--scenario" && i + 1 < argc) {
            const std::string name = toLower(argv[++i]);
            if (!rescue::parseScenario(name, &scenario.kind)) {
                std::cout << "Unsupported scenario: " << name << "\n";
                printUsage();
                return 1;
            }
        } else if (arg == "--out" && i + 1 < argc) {
            out = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }

    rescue::ParameterSweep::Parameter p;
    if (!rescue::ParameterSweep::parseParameter(param, &p)) {
        std::cout << "Unsupported parameter: " << param << "\n";
        printUsage();
        return 1;
    }

    rescue::ParameterSweep sweep;
    sweep.setScenario(scenario);

    rescue::ParameterSweep::ParameterRange range;
    range.samples = samples;
    range.nominal = rescue::ParameterSweep::nominalValue(scenario.run, p);
    range.min = min_set ? min_val : range.nominal * 0.5;
    range.max = max_set ? max_val : range.nominal * 1.5;

    const rescue::Status st = sweep.analyze(p, range);
    if (!st.ok()) {
        std::cout << "Sweep refused (" << rescue::errorCodeName(st.code) << "): " << st.message << "\n";
        return 2;
    }

    const rescue::Status wst = sweep.exportCSV(out);
    if (!wst.ok()) {
        std::cout << "Export failed: " << wst.message << "\n";
        return 3;
    }
    std::cout << "Wrote " << sweep.results().size() << " sweep rows to: " << out << "\n";
    return 0;
}
