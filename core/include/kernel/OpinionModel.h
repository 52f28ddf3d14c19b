#ifndef OPINION_MODEL_H
#define OPINION_MODEL_H

#include <array>
#include <cstdint>
#include <random>
#include <vector>
#include "kernel/Agent.h"
#include "modules/BeliefSpace.h"
#include "modules/GroupNetwork.h"

// ---------- Consensus Constants ----------
namespace ConsensusConstants {
    constexpr double kSigmaThreshold = 0.01;    // dispersion of mean opinions below which a tick qualifies
    constexpr std::uint32_t kRequiredTicks = 21; // qualifying ticks needed before consensus is declared
}

// How qualifying low-dispersion ticks are counted.
enum class ConsensusRule : std::uint8_t {
    Cumulative,     // any tick under threshold counts, the count never resets
    Consecutive     // the count resets whenever dispersion rises above threshold
};

// ---------- Configuration ----------
struct ModelConfig {
    std::uint32_t nAgents = 100;
    std::array<int, 2> socialIdGroups{0, 1};
    std::uint32_t k = 10;                   // declared average degree, must equal kIn + kOut
    std::uint32_t kIn = 8;
    std::uint32_t kOut = 2;
    double alphaIn = 0.5;                   // in-group filter transparency
    double alphaOut = 0.5;                  // out-group filter transparency
    double sigOp0 = 0.2;                    // spread of initial opinions
    double communicationFrequency = 0.2;
    double kappa = 0.0002;                  // diffusion constant
    double delta0 = 0.0;                    // predisposition of initial opinions
    double pRewire = 0.0;
    std::uint64_t seed = 42;
    std::uint32_t nBeliefs = 200;           // opinion axis resolution

    bool agentReporter = false;             // keep per-agent snapshots at checkpoints
    std::vector<std::uint64_t> trackTimes{0, 100, 200, 300, 400, 500, 600, 700, 800, 900, 1000};
    ConsensusRule consensusRule = ConsensusRule::Cumulative;
    bool verbose = false;

    // Throws ConfigurationError on the first invalid field.
    void validate() const;
};

// One checkpoint record.
struct Observation {
    std::uint64_t time = 0;
    double avgMeanOpinion = 0.0;            // population mean of agent means
    double stdMeanOpinion = 0.0;            // population dispersion of agent means
    std::vector<double> agentMeans;         // only with agentReporter
    std::vector<double> agentSigmas;        // only with agentReporter
};

// ---------- Simulation Engine ----------
class OpinionModel {
public:
    explicit OpinionModel(const ModelConfig& cfg);

    // Lifecycle
    void step();
    void simulate();                        // up to the last checkpoint time
    void simulate(std::uint64_t horizon);

    // Access
    const ModelConfig& config() const { return cfg_; }
    const std::vector<Agent>& agents() const { return agents_; }
    std::vector<Agent>& agentsMut() { return agents_; }
    const GroupNetwork& network() const { return network_; }
    const BeliefSpace& beliefSpace() const { return space_; }
    const DiffusionOperator& diffusion() const { return diffusion_; }
    std::uint64_t time() const { return time_; }

    // Report surface
    const std::vector<Observation>& observations() const { return observations_; }
    double stdMeanOpinion() const { return stdMeanOps_; }
    std::int64_t consensusTime() const { return consensusTime_; }   // 0-based step index, -1 if not reached
    double consensusMean() const { return consensusMean_; }         // NaN if not reached
    bool consensusReached() const { return consensusTime_ >= 0; }
    bool running() const { return running_; }
    double sigmaThresholdConsensus() const { return ConsensusConstants::kSigmaThreshold; }
    std::uint64_t rejectedUpdates() const { return rejectedUpdates_; }
    std::uint32_t qualifyingTicks() const { return consensusCount_; }

    double populationMean() const;
    double populationStd() const;

private:
    void initAgents();
    void observe();
    bool isTrackTime(std::uint64_t t) const;
    void updateConsensus();

    ModelConfig cfg_;
    std::mt19937_64 rng_;
    BeliefSpace space_;
    DiffusionOperator diffusion_;
    GroupNetwork network_;
    std::vector<Agent> agents_;
    std::vector<std::uint32_t> order_;

    std::uint64_t time_ = 0;
    bool running_ = true;
    double stdMeanOps_ = 0.0;
    std::vector<Observation> observations_;

    // Qualifying low-dispersion ticks and the step index of the first of them
    std::uint32_t consensusCount_ = 0;
    std::uint64_t firstConsensusTick_ = 0;
    std::int64_t consensusTime_ = -1;
    double consensusMean_;
    std::uint64_t rejectedUpdates_ = 0;
};

#endif // OPINION_MODEL_H
