#include <gtest/gtest.h>
#include "kernel/OpinionModel.h"
#include "utils/Validation.h"
#include <cmath>

namespace {

// Two groups of five, four in-group and two out-group neighbours each
ModelConfig smallConfig(std::uint64_t seed = 1) {
    ModelConfig cfg;
    cfg.nAgents = 10;
    cfg.k = 6;
    cfg.kIn = 4;
    cfg.kOut = 2;
    cfg.seed = seed;
    cfg.trackTimes = {0, 10, 20, 30, 40, 50};
    return cfg;
}

// Frozen dynamics: no communication and no diffusion
ModelConfig frozenConfig() {
    ModelConfig cfg = smallConfig();
    cfg.communicationFrequency = 0.0;
    cfg.kappa = 0.0;
    return cfg;
}

void setAll(OpinionModel& model, double mu) {
    const auto& space = model.beliefSpace();
    for (auto& a : model.agentsMut()) {
        a.setBelief(space.normalDensity(mu, 0.2), space);
    }
}

void polarize(OpinionModel& model) {
    const auto& space = model.beliefSpace();
    for (auto& a : model.agentsMut()) {
        a.setBelief(space.normalDensity(a.id % 2 == 0 ? 0.5 : -0.5, 0.1), space);
    }
}

}  // namespace

TEST(ModelTest, Initialization) {
    ModelConfig cfg = smallConfig();
    cfg.socialIdGroups = {3, 7};
    OpinionModel model(cfg);

    EXPECT_EQ(model.time(), 0u);
    ASSERT_EQ(model.agents().size(), 10u);
    ASSERT_EQ(model.observations().size(), 1u);
    EXPECT_EQ(model.observations()[0].time, 0u);
    EXPECT_FALSE(model.consensusReached());
    EXPECT_TRUE(std::isnan(model.consensusMean()));
    EXPECT_TRUE(model.running());

    for (const auto& a : model.agents()) {
        EXPECT_NEAR(model.beliefSpace().mass(a.belief), 1.0, 1e-12);
        EXPECT_EQ(a.socialIdentity, a.id < 5 ? 3 : 7);
        EXPECT_EQ(a.neighbors, model.network().neighbors(a.id));
    }
}

// delta0 = 1 pins group 0 to positive and group 1 to negative initial means
TEST(ModelTest, FullPredisposition) {
    ModelConfig cfg = smallConfig(9);
    cfg.nAgents = 40;
    cfg.delta0 = 1.0;
    OpinionModel model(cfg);

    for (const auto& a : model.agents()) {
        if (a.group == 0) {
            EXPECT_GT(a.meanOpinion, 0.0) << "agent " << a.id;
        } else {
            EXPECT_LT(a.meanOpinion, 0.0) << "agent " << a.id;
        }
    }
}

TEST(ModelTest, RejectsInvalidConfig) {
    ModelConfig cfg = smallConfig();
    cfg.k = 7;
    EXPECT_THROW(OpinionModel model(cfg), ConfigurationError);

    cfg = smallConfig();
    cfg.alphaIn = 1.5;
    EXPECT_THROW(OpinionModel model(cfg), ConfigurationError);

    cfg = smallConfig();
    cfg.trackTimes = {0, 20, 10};
    EXPECT_THROW(OpinionModel model(cfg), ConfigurationError);

    cfg = smallConfig();
    cfg.kIn = 5;
    cfg.kOut = 1;
    EXPECT_THROW(OpinionModel model(cfg), ConfigurationError);  // kIn == group size
}

TEST(ModelTest, DeterministicRuns) {
    ModelConfig cfg = smallConfig(12345);
    cfg.nAgents = 40;
    cfg.communicationFrequency = 0.5;
    OpinionModel a(cfg);
    OpinionModel b(cfg);

    for (int i = 0; i < 20; ++i) {
        a.step();
        b.step();
    }
    ASSERT_EQ(a.agents().size(), b.agents().size());
    for (std::size_t i = 0; i < a.agents().size(); ++i) {
        EXPECT_DOUBLE_EQ(a.agents()[i].meanOpinion, b.agents()[i].meanOpinion);
        EXPECT_DOUBLE_EQ(a.agents()[i].sigma, b.agents()[i].sigma);
    }
    EXPECT_DOUBLE_EQ(a.stdMeanOpinion(), b.stdMeanOpinion());
}

// Every belief stays a normalised density
TEST(ModelTest, MassConserved) {
    ModelConfig cfg = smallConfig(4);
    cfg.nAgents = 30;
    cfg.communicationFrequency = 0.5;
    cfg.pRewire = 0.2;
    OpinionModel model(cfg);

    for (int i = 0; i < 30; ++i) {
        model.step();
        for (const auto& a : model.agents()) {
            ASSERT_NEAR(model.beliefSpace().mass(a.belief), 1.0, 1e-9);
        }
    }
}

// No talking and no diffusion: beliefs never change
TEST(ModelTest, FrozenDynamicsKeepBeliefs) {
    OpinionModel model(frozenConfig());
    std::vector<BeliefDensity> initial;
    for (const auto& a : model.agents()) initial.push_back(a.belief);

    for (int i = 0; i < 50; ++i) model.step();

    for (std::size_t i = 0; i < initial.size(); ++i) {
        EXPECT_LT((model.agents()[i].belief - initial[i]).cwiseAbs().maxCoeff(), 1e-10);
    }
}

TEST(ModelTest, CheckpointsRecorded) {
    ModelConfig cfg = frozenConfig();
    OpinionModel model(cfg);
    polarize(model);
    model.simulate();

    EXPECT_EQ(model.time(), 50u);
    ASSERT_EQ(model.observations().size(), cfg.trackTimes.size());
    for (std::size_t i = 0; i < cfg.trackTimes.size(); ++i) {
        EXPECT_EQ(model.observations()[i].time, cfg.trackTimes[i]);
        EXPECT_TRUE(model.observations()[i].agentMeans.empty());
    }
    EXPECT_NEAR(model.observations().back().stdMeanOpinion, model.stdMeanOpinion(), 1e-15);
    EXPECT_FALSE(model.consensusReached());
}

// Identical beliefs qualify from the first step (index 0); the run stops once 21 ticks qualify
TEST(ModelTest, EarlyStopAtConsensus) {
    OpinionModel model(frozenConfig());
    setAll(model, 0.3);
    model.simulate(100);

    EXPECT_TRUE(model.consensusReached());
    EXPECT_EQ(model.consensusTime(), 0);
    EXPECT_EQ(model.time(), 21u);
    EXPECT_FALSE(model.running());
    EXPECT_NEAR(model.consensusMean(), 0.3, 1e-3);
    // checkpoints 0, 10, 20 only
    EXPECT_EQ(model.observations().size(), 3u);
}

// With an agent reporter the run continues past consensus to the last checkpoint
TEST(ModelTest, AgentReporterRunsToHorizon) {
    ModelConfig cfg = frozenConfig();
    cfg.agentReporter = true;
    OpinionModel model(cfg);
    setAll(model, -0.4);
    model.simulate();

    EXPECT_EQ(model.time(), 50u);
    EXPECT_TRUE(model.running());
    EXPECT_EQ(model.consensusTime(), 0);
    ASSERT_EQ(model.observations().size(), 6u);
    for (const auto& obs : model.observations()) {
        EXPECT_EQ(obs.agentMeans.size(), 10u);
        EXPECT_EQ(obs.agentSigmas.size(), 10u);
    }
}

// One disagreeing tick does not reset the cumulative count
TEST(ModelTest, CumulativeConsensusCount) {
    OpinionModel model(frozenConfig());
    setAll(model, 0.0);
    for (int i = 0; i < 5; ++i) model.step();
    polarize(model);
    model.step();
    EXPECT_EQ(model.qualifyingTicks(), 5u);

    setAll(model, 0.0);
    model.simulate(100);
    EXPECT_EQ(model.consensusTime(), 0);
    EXPECT_EQ(model.time(), 22u);
}

// The same disturbance restarts a consecutive count
TEST(ModelTest, ConsecutiveConsensusCount) {
    ModelConfig cfg = frozenConfig();
    cfg.consensusRule = ConsensusRule::Consecutive;
    OpinionModel model(cfg);
    setAll(model, 0.0);
    for (int i = 0; i < 5; ++i) model.step();
    polarize(model);
    model.step();
    EXPECT_EQ(model.qualifyingTicks(), 0u);

    setAll(model, 0.0);
    model.simulate(100);
    EXPECT_EQ(model.consensusTime(), 6);
    EXPECT_EQ(model.time(), 27u);
}

// Opposite halves of the axis with alphaOut = 1: cross-group messages are rejected
TEST(ModelTest, RejectedUpdatesCounted) {
    ModelConfig cfg = smallConfig(2);
    cfg.alphaIn = 1.0;
    cfg.alphaOut = 1.0;
    cfg.communicationFrequency = 1.0;
    cfg.kappa = 0.0;
    OpinionModel model(cfg);

    const auto& space = model.beliefSpace();
    const Eigen::Index half = space.bins() / 2;
    for (auto& a : model.agentsMut()) {
        BeliefDensity d = BeliefDensity::Zero(space.bins());
        if (a.group == 0) {
            d.head(half).setConstant(1.0);
        } else {
            d.tail(half).setConstant(1.0);
        }
        a.setBelief(space.normalize(d), space);
    }

    for (int i = 0; i < 20; ++i) model.step();

    EXPECT_GT(model.rejectedUpdates(), 0u);
    for (const auto& a : model.agents()) {
        EXPECT_NEAR(space.mass(a.belief), 1.0, 1e-9);
        if (a.group == 0) {
            EXPECT_LT(a.meanOpinion, 0.0);
        } else {
            EXPECT_GT(a.meanOpinion, 0.0);
        }
    }
}

namespace {

ModelConfig transparentConfig(std::uint64_t seed) {
    ModelConfig cfg = smallConfig(seed);
    cfg.sigOp0 = 0.1;
    cfg.communicationFrequency = 1.0;
    cfg.kappa = 0.0;
    cfg.trackTimes = {0, 100, 200, 300, 400, 500};
    return cfg;
}

}  // namespace

// Small transparent network: opinions collapse onto a shared value well before the horizon
TEST(ModelTest, SmallNetworkReachesConsensus) {
    OpinionModel model(transparentConfig(1));
    const double initialDispersion = model.observations().front().stdMeanOpinion;
    model.simulate();

    ASSERT_TRUE(model.consensusReached());
    EXPECT_LT(model.consensusTime(), 500);
    EXPECT_EQ(model.qualifyingTicks(), ConsensusConstants::kRequiredTicks);
    EXPECT_GE(model.time(), static_cast<std::uint64_t>(model.consensusTime()) + 21);
    EXPECT_FALSE(model.running());
    EXPECT_LT(model.stdMeanOpinion(), ConsensusConstants::kSigmaThreshold);
    EXPECT_LT(model.stdMeanOpinion(), initialDispersion);
    EXPECT_LE(std::abs(model.consensusMean()), 1.0);
}

// Across seeds the same setting almost always ends in consensus
TEST(ModelTest, SmallNetworkConsensusAcrossSeeds) {
    int reached = 0;
    for (std::uint64_t seed = 1; seed <= 20; ++seed) {
        OpinionModel model(transparentConfig(seed));
        const double initialDispersion = model.observations().front().stdMeanOpinion;
        model.simulate();

        if (model.consensusReached()) {
            ++reached;
            EXPECT_LT(model.consensusTime(), 500) << "seed " << seed;
            EXPECT_LT(model.stdMeanOpinion(), initialDispersion) << "seed " << seed;
        }
    }
    EXPECT_GE(reached, 16);
}
