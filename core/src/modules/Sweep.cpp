#include "modules/Sweep.h"
#include "io/Snapshot.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <omp.h>

std::vector<double> lowResolutionGrid() {
    return {0.25, 0.5, 0.75};
}

std::vector<double> highResolutionGrid() {
    return {0.0, 0.1, 0.2, 0.3, 0.4, 0.5, 0.6, 0.7, 0.8, 0.9, 0.99};
}

std::vector<std::uint64_t> defaultTrackTimes(std::uint64_t horizon) {
    const std::uint64_t step = horizon <= 1000 ? 100 : std::min<std::uint64_t>(5000, horizon / 10);
    std::vector<std::uint64_t> times;
    for (std::uint64_t t = 0; t <= horizon; t += step) {
        times.push_back(t);
    }
    return times;
}

namespace {

struct SweepCell {
    std::size_t inIndex = 0;
    double alphaIn = 0.0;
    double alphaOut = 0.0;
};

std::string rowFileName(const SweepSettings& settings, double alphaIn, const char* suffix) {
    return runFileStem(settings.base) + "_ain" + formatParam(alphaIn) + "_seed-" +
           std::to_string(settings.base.seed) + suffix;
}

bool rowDone(const SweepSettings& settings, double alphaIn) {
    return std::filesystem::exists(sweepFilePath(settings, alphaIn));
}

// Lower triangle; alphaOuts are indexed against the full alphaIns grid
std::vector<SweepCell> buildCells(const SweepSettings& settings) {
    std::vector<SweepCell> cells;
    for (std::size_t n = 0; n < settings.alphaIns.size(); ++n) {
        if (rowDone(settings, settings.alphaIns[n])) continue;
        const std::size_t outCount = std::min(n + 1, settings.alphaOuts.size());
        for (std::size_t m = 0; m < outCount; ++m) {
            cells.push_back({n, settings.alphaIns[n], settings.alphaOuts[m]});
        }
    }
    return cells;
}

}  // namespace

std::string sweepFilePath(const SweepSettings& settings, double alphaIn) {
    return (std::filesystem::path(settings.outputDir) / rowFileName(settings, alphaIn, ".csv")).string();
}

std::string sweepAgentFilePath(const SweepSettings& settings, double alphaIn) {
    return (std::filesystem::path(settings.outputDir) /
            rowFileName(settings, alphaIn, "_agents.csv")).string();
}

std::vector<double> pendingAlphaIns(const SweepSettings& settings) {
    std::vector<double> pending;
    for (double ain : settings.alphaIns) {
        if (!rowDone(settings, ain)) pending.push_back(ain);
    }
    return pending;
}

std::vector<SweepResult> runSweep(const SweepSettings& settings) {
    const auto cells = buildCells(settings);

    // Validate every cell up front: nothing may throw inside the parallel region
    std::vector<ModelConfig> configs;
    configs.reserve(cells.size());
    for (const auto& cell : cells) {
        ModelConfig cfg = settings.base;
        cfg.alphaIn = cell.alphaIn;
        cfg.alphaOut = cell.alphaOut;
        cfg.validate();
        configs.push_back(std::move(cfg));
    }

    std::vector<SweepResult> results(cells.size());
    const std::int64_t count = static_cast<std::int64_t>(cells.size());

    #pragma omp parallel for schedule(dynamic)
    for (std::int64_t c = 0; c < count; ++c) {
        OpinionModel model(configs[c]);
        model.simulate();

        auto& r = results[c];
        r.alphaIn = configs[c].alphaIn;
        r.alphaOut = configs[c].alphaOut;
        r.seed = configs[c].seed;
        r.consensusTime = model.consensusTime();
        r.consensusMean = model.consensusMean();
        r.observations = model.observations();
    }

    std::cerr << "[INFO] sweep finished: " << results.size() << " runs on up to "
              << omp_get_max_threads() << " threads\n";
    return results;
}

namespace {

std::ofstream openOutput(const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("cannot open file '" + path + "'");
    }
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    return out;
}

void writeConsensus(std::ostream& out, const SweepResult& r) {
    if (r.consensusTime >= 0) {
        out << r.consensusTime << "," << r.consensusMean;
    } else {
        out << ",";
    }
}

}  // namespace

std::vector<std::string> writeSweep(const std::vector<SweepResult>& results,
                                    const SweepSettings& settings) {
    std::filesystem::create_directories(settings.outputDir);

    const ModelConfig& base = settings.base;
    const std::uint32_t groupSize = base.nAgents / 2;
    std::vector<std::string> written;

    for (double ain : settings.alphaIns) {
        const std::string path = sweepFilePath(settings, ain);
        if (rowDone(settings, ain)) {
            std::cerr << "[INFO] " << path << " exists, skipping\n";
            continue;
        }

        std::ofstream out = openOutput(path);
        writeProvenance(base, out);
        out << "seed,ain,aout,time,avg_mean_op,std_mean_op,consensus_time,consensus_mean\n";
        for (const auto& r : results) {
            if (r.alphaIn != ain) continue;
            for (const auto& o : r.observations) {
                out << r.seed << "," << r.alphaIn << "," << r.alphaOut << ","
                    << o.time << "," << o.avgMeanOpinion << "," << o.stdMeanOpinion << ",";
                writeConsensus(out, r);
                out << "\n";
            }
        }
        written.push_back(path);

        if (!base.agentReporter) continue;

        const std::string agentPath = sweepAgentFilePath(settings, ain);
        std::ofstream agentOut = openOutput(agentPath);
        writeProvenance(base, agentOut);
        agentOut << "seed,ain,aout,time,agent_id,group,mean_op,sig\n";
        for (const auto& r : results) {
            if (r.alphaIn != ain) continue;
            for (const auto& o : r.observations) {
                for (std::size_t i = 0; i < o.agentMeans.size(); ++i) {
                    const int group = base.socialIdGroups[i < groupSize ? 0 : 1];
                    agentOut << r.seed << "," << r.alphaIn << "," << r.alphaOut << ","
                             << o.time << "," << i << "," << group << ","
                             << o.agentMeans[i] << "," << o.agentSigmas[i] << "\n";
                }
            }
        }
        written.push_back(agentPath);
    }
    return written;
}
