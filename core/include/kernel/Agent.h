#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <random>
#include <vector>
#include "modules/BeliefSpace.h"

// ---------- Agent Structure ----------
struct Agent {
    // Identity
    std::uint32_t id = 0;
    std::uint8_t group = 0;             // 0 or 1 (index into social_id_groups)
    int socialIdentity = 0;             // group label

    // Belief state
    BeliefDensity belief;               // sum(belief) * db == 1
    double meanOpinion = 0.0;           // first moment over the axis
    double sigma = 0.0;                 // dispersion, floored at epsilon

    // Visualization only
    std::array<double, 2> pos{0.0, 0.0};

    // Network (fixed after construction)
    std::vector<std::uint32_t> neighbors;

    bool warnedIsolated = false;

    void setBelief(BeliefDensity density, const BeliefSpace& space);
};

// ---------- Update Context ----------
// Shared read-only collaborators handed to every agent update.
struct AgentContext {
    const BeliefSpace& space;
    const DiffusionOperator& diffusion;
    double alphaIn = 1.0;               // in-group filter transparency
    double alphaOut = 1.0;              // out-group filter transparency
    double communicationFrequency = 0.0;
    std::uint64_t tick = 1;             // tick currently being computed (1-based)
    bool verbose = false;
};

enum class UpdateOutcome : std::uint8_t {
    Interacted,
    Rejected,       // posterior had ~zero mass, prior kept
    Diffused,
    Isolated        // wanted to talk, no neighbours
};

// Posterior mass below this is treated as incompatible prior and message.
constexpr double kPosteriorMassTolerance = std::numeric_limits<double>::epsilon();

// Bayesian update of `listener` from `speaker`'s density seen through the
// group filter. Listener keeps its prior when the posterior is degenerate.
UpdateOutcome interact(Agent& listener, const Agent& speaker, const AgentContext& ctx);

// Apply the diffusion propagator and renormalise.
void diffuse(Agent& agent, const AgentContext& ctx);

// One agent step: communicate with probability f, otherwise diffuse.
// Draw order: branch uniform, then neighbour index when communicating.
UpdateOutcome stepAgent(std::vector<Agent>& population, std::uint32_t id,
                        const AgentContext& ctx, std::mt19937_64& rng);
