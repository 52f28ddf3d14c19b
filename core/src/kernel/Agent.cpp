#include "kernel/Agent.h"
#include "utils/Validation.h"
#include <iostream>
#include <utility>

void Agent::setBelief(BeliefDensity density, const BeliefSpace& space) {
    belief = std::move(density);
    const BeliefSummary s = space.summarize(belief);
    meanOpinion = s.mean;
    sigma = s.sigma;
}

UpdateOutcome interact(Agent& listener, const Agent& speaker, const AgentContext& ctx) {
    const double alpha = (speaker.group == listener.group) ? ctx.alphaIn : ctx.alphaOut;

    // Perceptual blur toward the uniform (non-informative) density
    const BeliefDensity perceived = alpha * speaker.belief + (1.0 - alpha) * ctx.space.uniform();
    BeliefDensity posterior = listener.belief.cwiseProduct(perceived);

    if (!(ctx.space.mass(posterior) >= kPosteriorMassTolerance)) {
        // Prior and perceived message are incompatible (e.g. alpha = 1 with
        // disjoint supports): normalisation would produce NaN, keep the prior.
        if (ctx.verbose) {
            std::cerr << "[DEBUG] agent " << listener.id << " has posterior=0, keeping prior\n";
        }
        return UpdateOutcome::Rejected;
    }

    listener.setBelief(ctx.space.normalize(posterior), ctx.space);
    return UpdateOutcome::Interacted;
}

void diffuse(Agent& agent, const AgentContext& ctx) {
    const BeliefDensity diffused = ctx.diffusion.apply(agent.belief);
    agent.setBelief(ctx.space.normalize(diffused), ctx.space);
}

UpdateOutcome stepAgent(std::vector<Agent>& population, std::uint32_t id,
                        const AgentContext& ctx, std::mt19937_64& rng) {
    validation::checkIndex(id, population.size(), "stepAgent");
    Agent& agent = population[id];

    std::uniform_real_distribution<double> uniDist(0.0, 1.0);
    if (uniDist(rng) < ctx.communicationFrequency) {
        if (agent.neighbors.empty()) {
            if (ctx.tick == 1 && !agent.warnedIsolated) {
                std::cerr << "[WARN] Network not connected (agent=" << agent.id << ")\n";
                agent.warnedIsolated = true;
            }
            return UpdateOutcome::Isolated;
        }
        std::uniform_int_distribution<std::size_t> pick(0, agent.neighbors.size() - 1);
        const std::uint32_t speakerId = agent.neighbors[pick(rng)];
        validation::checkIndex(speakerId, population.size(), "agent.neighbors in stepAgent");
        return interact(agent, population[speakerId], ctx);
    }

    diffuse(agent, ctx);
    return UpdateOutcome::Diffused;
}
