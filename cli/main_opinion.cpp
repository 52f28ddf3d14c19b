#include "kernel/OpinionModel.h"
#include "io/Snapshot.h"
#include "modules/Sweep.h"
#include "utils/Validation.h"
#include <chrono>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>

static void printHelp() {
    std::cerr << "Usage: opinion_cli [--key=value ...]\n"
              << "  --n=N              # number of agents (even)\n"
              << "  --k=K              # average degree, must equal kin + kout\n"
              << "  --kin=K            # intra-group degree\n"
              << "  --kout=K           # inter-group links per agent\n"
              << "  --delta=D          # predisposition of initial opinions\n"
              << "  --kappa=K          # diffusion constant\n"
              << "  --commf=F          # communication frequency\n"
              << "  --sig=S            # spread of initial opinions\n"
              << "  --p=P              # rewiring probability\n"
              << "  --T=T              # horizon (checkpoints 0..T)\n"
              << "  --seed=S           # random seed\n"
              << "  --ain=A --aout=A   # filter transparencies (single run)\n"
              << "  --agents=0|1       # keep per-agent snapshots\n"
              << "  --rule=cumulative|consecutive\n"
              << "  --verbose=0|1      # log rejected posteriors\n"
              << "  --sweep=low|high   # run the (ain, aout) grid and write CSVs\n"
              << "  --out=DIR          # output directory for --sweep (default data)\n";
}

static std::map<std::string, std::string> parseOptions(int argc, char** argv, bool& wantHelp) {
    std::map<std::string, std::string> opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            wantHelp = true;
            continue;
        }
        const auto eq = arg.find('=');
        if (arg.rfind("--", 0) != 0 || eq == std::string::npos) {
            throw std::invalid_argument("Unknown option: " + arg);
        }
        opts[arg.substr(2, eq - 2)] = arg.substr(eq + 1);
    }
    return opts;
}

static std::uint32_t parseCount32(const std::string& v, const char* name) {
    return static_cast<std::uint32_t>(
        validation::parseCount(v, name, std::numeric_limits<std::uint32_t>::max()));
}

static ModelConfig configFromOptions(std::map<std::string, std::string>& opts, std::uint64_t& horizon) {
    ModelConfig cfg;
    auto take = [&opts](const char* key, auto apply) {
        auto it = opts.find(key);
        if (it == opts.end()) return;
        apply(it->second);
        opts.erase(it);
    };
    take("n", [&](const std::string& v) { cfg.nAgents = parseCount32(v, "n"); });
    take("k", [&](const std::string& v) { cfg.k = parseCount32(v, "k"); });
    take("kin", [&](const std::string& v) { cfg.kIn = parseCount32(v, "kin"); });
    take("kout", [&](const std::string& v) { cfg.kOut = parseCount32(v, "kout"); });
    take("delta", [&](const std::string& v) { cfg.delta0 = std::stod(v); });
    take("kappa", [&](const std::string& v) { cfg.kappa = std::stod(v); });
    take("commf", [&](const std::string& v) { cfg.communicationFrequency = std::stod(v); });
    take("sig", [&](const std::string& v) { cfg.sigOp0 = std::stod(v); });
    take("p", [&](const std::string& v) { cfg.pRewire = std::stod(v); });
    take("seed", [&](const std::string& v) { cfg.seed = validation::parseCount(v, "seed"); });
    take("ain", [&](const std::string& v) { cfg.alphaIn = std::stod(v); });
    take("aout", [&](const std::string& v) { cfg.alphaOut = std::stod(v); });
    take("agents", [&](const std::string& v) { cfg.agentReporter = (v == "1" || v == "true"); });
    take("verbose", [&](const std::string& v) { cfg.verbose = (v == "1" || v == "true"); });
    take("T", [&](const std::string& v) { horizon = validation::parseCount(v, "T"); });
    take("rule", [&](const std::string& v) {
        if (v == "cumulative") {
            cfg.consensusRule = ConsensusRule::Cumulative;
        } else if (v == "consecutive") {
            cfg.consensusRule = ConsensusRule::Consecutive;
        } else {
            throw std::invalid_argument("Unknown consensus rule: " + v);
        }
    });
    cfg.trackTimes = defaultTrackTimes(horizon);
    return cfg;
}

int main(int argc, char** argv) {
    const auto start = std::chrono::steady_clock::now();
    try {
        bool wantHelp = false;
        auto opts = parseOptions(argc, argv, wantHelp);
        if (wantHelp) {
            printHelp();
            return 0;
        }

        std::uint64_t horizon = 1000;
        ModelConfig cfg = configFromOptions(opts, horizon);

        std::string sweep;
        std::string outDir = "data";
        if (auto it = opts.find("sweep"); it != opts.end()) {
            sweep = it->second;
            opts.erase(it);
        }
        if (auto it = opts.find("out"); it != opts.end()) {
            outDir = it->second;
            opts.erase(it);
        }
        if (!opts.empty()) {
            std::cerr << "Unknown option: --" << opts.begin()->first << "\n";
            printHelp();
            return 1;
        }

        if (sweep.empty()) {
            OpinionModel model(cfg);
            for (std::uint64_t t = 0; t < horizon && model.running(); ++t) {
                model.step();
                if ((t + 1) % 100 == 0 || t == horizon - 1) {
                    std::cerr << "Tick " << (t + 1) << "/" << horizon << "\r";
                    std::cerr.flush();
                }
            }
            std::cerr << "\n";
            std::cout << reportToJson(model) << "\n";
            std::cout.flush();
            if (model.consensusReached()) {
                std::cerr << "Consensus reached at: " << model.consensusTime() << "\n";
            } else {
                std::cerr << "No consensus within " << horizon << " ticks\n";
            }
        } else {
            SweepSettings settings;
            settings.base = cfg;
            settings.outputDir = outDir;
            if (sweep == "high") {
                settings.alphaIns = highResolutionGrid();
                settings.alphaOuts = highResolutionGrid();
            } else if (sweep == "low") {
                settings.alphaIns = lowResolutionGrid();
                settings.alphaOuts = lowResolutionGrid();
            } else {
                std::cerr << "Unknown sweep resolution: " << sweep << "\n";
                return 1;
            }
            std::cerr << "[INFO] " << pendingAlphaIns(settings).size() << " of "
                      << settings.alphaIns.size() << " alphaIn rows to run\n";
            const auto results = runSweep(settings);
            for (const auto& path : writeSweep(results, settings)) {
                std::cout << path << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start).count();
    std::cerr << secs / 60 << " min " << secs % 60 << " sec\n";
    return 0;
}
