#include "kernel/OpinionModel.h"
#include "utils/Validation.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>

void ModelConfig::validate() const {
    validation::require(nAgents > 0 && nAgents % 2 == 0,
                        "nAgents must be even and positive (got " + std::to_string(nAgents) + ")");
    validation::require(socialIdGroups[0] != socialIdGroups[1],
                        "socialIdGroups must hold two distinct labels");
    validation::require(kIn + kOut == k,
                        "kIn + kOut must equal k (kIn=" + std::to_string(kIn) + ", kOut=" +
                        std::to_string(kOut) + ", k=" + std::to_string(k) + ")");
    const std::uint32_t groupSize = nAgents / 2;
    validation::require(kIn < groupSize,
                        "kIn must be smaller than the group size (kIn=" + std::to_string(kIn) +
                        ", group size=" + std::to_string(groupSize) + ")");
    validation::require(kOut <= groupSize,
                        "kOut must not exceed the group size (kOut=" + std::to_string(kOut) +
                        ", group size=" + std::to_string(groupSize) + ")");
    validation::checkUnitInterval(alphaIn, "alphaIn");
    validation::checkUnitInterval(alphaOut, "alphaOut");
    validation::checkUnitInterval(communicationFrequency, "communicationFrequency");
    validation::checkUnitInterval(pRewire, "pRewire");
    validation::require(sigOp0 > 0.0, "sigOp0 must be > 0 (got " + std::to_string(sigOp0) + ")");
    validation::require(kappa >= 0.0, "kappa must be >= 0 (got " + std::to_string(kappa) + ")");
    validation::require(delta0 >= -1.0 && delta0 <= 1.0,
                        "delta0 must be in [-1, 1] (got " + std::to_string(delta0) + ")");
    validation::require(nBeliefs >= 2, "nBeliefs must be >= 2 (got " + std::to_string(nBeliefs) + ")");
    validation::require(!trackTimes.empty(), "trackTimes must not be empty");
    validation::require(std::adjacent_find(trackTimes.begin(), trackTimes.end(),
                                           [](std::uint64_t a, std::uint64_t b) { return a >= b; })
                            == trackTimes.end(),
                        "trackTimes must be strictly increasing");
}

namespace {
    const ModelConfig& validated(const ModelConfig& cfg) {
        cfg.validate();
        return cfg;
    }
}

OpinionModel::OpinionModel(const ModelConfig& cfg)
    : cfg_(validated(cfg)),
      rng_(cfg.seed),
      space_(cfg.nBeliefs),
      diffusion_(space_, cfg.kappa),
      consensusMean_(std::numeric_limits<double>::quiet_NaN()) {
    // Network first: its inter-group pass and agent initialisation share rng_
    NetworkParams net;
    net.nodes = cfg_.nAgents;
    net.kIn = cfg_.kIn;
    net.kOut = cfg_.kOut;
    net.rewireProb = cfg_.pRewire;
    net.seed = cfg_.seed;
    network_ = buildGroupNetwork(net, rng_);

    initAgents();

    order_.resize(agents_.size());
    stdMeanOps_ = populationStd();
    observe();
}

void OpinionModel::initAgents() {
    agents_.clear();
    agents_.reserve(cfg_.nAgents);

    std::uniform_real_distribution<double> uniDist(0.0, 1.0);
    const auto& layout = network_.layout();

    for (std::uint32_t i = 0; i < cfg_.nAgents; ++i) {
        Agent a;
        a.id = i;
        a.group = network_.groupOf(i);
        a.socialIdentity = cfg_.socialIdGroups[a.group];
        a.pos = layout[i];
        a.neighbors = network_.neighbors(i);

        // Sign of the initial mean: group 0 leans positive with 0.5 + delta0/2,
        // group 1 leans the other way
        const double pPositive = a.group == 0 ? 0.5 + cfg_.delta0 / 2.0 : 0.5 - cfg_.delta0 / 2.0;
        const bool positive = uniDist(rng_) < pPositive;
        const double magnitude = uniDist(rng_);
        const double mu0 = positive ? magnitude : -magnitude;

        a.setBelief(space_.normalDensity(mu0, cfg_.sigOp0), space_);
        agents_.push_back(std::move(a));
    }
}

void OpinionModel::step() {
    // Fresh random permutation; updates are sequential and visible to later agents
    std::iota(order_.begin(), order_.end(), 0u);
    std::shuffle(order_.begin(), order_.end(), rng_);

    const AgentContext ctx{space_, diffusion_, cfg_.alphaIn, cfg_.alphaOut,
                           cfg_.communicationFrequency, time_ + 1, cfg_.verbose};
    for (std::uint32_t id : order_) {
        if (stepAgent(agents_, id, ctx, rng_) == UpdateOutcome::Rejected) {
            ++rejectedUpdates_;
        }
    }
    ++time_;

    // Every tick, for precise consensus time
    stdMeanOps_ = populationStd();
    if (isTrackTime(time_)) {
        observe();
    }
    updateConsensus();
}

void OpinionModel::simulate() {
    simulate(cfg_.trackTimes.back());
}

void OpinionModel::simulate(std::uint64_t horizon) {
    while (running_ && time_ < horizon) {
        step();
    }
}

void OpinionModel::updateConsensus() {
    if (stdMeanOps_ < ConsensusConstants::kSigmaThreshold) {
        // Index of the step just taken (0-based), the time the report records
        if (consensusCount_ == 0) firstConsensusTick_ = time_ - 1;
        ++consensusCount_;
    } else if (cfg_.consensusRule == ConsensusRule::Consecutive) {
        consensusCount_ = 0;
    }

    if (consensusTime_ < 0 && consensusCount_ >= ConsensusConstants::kRequiredTicks) {
        consensusTime_ = static_cast<std::int64_t>(firstConsensusTick_);
        consensusMean_ = populationMean();
        // Detailed trajectories not wanted: nothing left to learn from this run
        if (!cfg_.agentReporter) {
            running_ = false;
        }
    }
}

void OpinionModel::observe() {
    Observation obs;
    obs.time = time_;
    obs.avgMeanOpinion = populationMean();
    obs.stdMeanOpinion = populationStd();

    if (cfg_.agentReporter) {
        obs.agentMeans.reserve(agents_.size());
        obs.agentSigmas.reserve(agents_.size());
        for (const auto& a : agents_) {
            obs.agentMeans.push_back(a.meanOpinion);
            obs.agentSigmas.push_back(a.sigma);
        }
    }
    observations_.push_back(std::move(obs));
}

bool OpinionModel::isTrackTime(std::uint64_t t) const {
    return std::binary_search(cfg_.trackTimes.begin(), cfg_.trackTimes.end(), t);
}

double OpinionModel::populationMean() const {
    double sum = 0.0;
    for (const auto& a : agents_) sum += a.meanOpinion;
    return sum / agents_.size();
}

double OpinionModel::populationStd() const {
    const double mean = populationMean();
    double sq = 0.0;
    for (const auto& a : agents_) {
        const double diff = a.meanOpinion - mean;
        sq += diff * diff;
    }
    return std::sqrt(sq / agents_.size());
}
