#include "evo_optim/pso_algorithm.hpp"
#include "evo_optim/archiver.hpp"
#include "evo_optim/exceptions.hpp"

#include <algorithm>

namespace evo_optim {

PSOAlgorithm::PSOAlgorithm(double w, double c1, double c2)
: w_(w), c1_(c1), c2_(c2)
{
}

PSOAlgorithm::PSOAlgorithm(const EvolutionConfig& config)
: PSOAlgorithm(config.inertia, config.cognitive_rate, config.social_rate)
{
}

std::vector<Candidate> PSOAlgorithm::reproduce(const RunState& state, VariationContext& context) {
    const Population& swarm = state.population;
    if (swarm.empty()) {
        throw EvolutionError("particle update of an empty swarm");
    }
    if (previous_population_.size() != swarm.size()) previous_population_ = swarm;
    const Population& pbests = state.archive.size() == swarm.size() ? state.archive : swarm;

    // star topology: every particle sees the best personal best
    const Individual& nbest = *std::min_element(pbests.begin(), pbests.end());

    std::uniform_real_distribution<double> dist(0.0, 1.0);
    std::vector<Candidate> offspring;
    offspring.reserve(swarm.size());

    for (size_t p = 0; p < swarm.size(); ++p) {
        const Candidate& x = swarm[p].candidate();
        const Candidate& xprev = previous_population_[p].candidate();
        const Candidate& pbest = pbests[p].candidate();
        const Candidate& gbest = nbest.candidate();

        const size_t n = std::min({x.size(), xprev.size(), pbest.size(), gbest.size()});
        Candidate particle;
        particle.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            double r1 = dist(context.rng);
            double r2 = dist(context.rng);
            double cognitive = c1_ * r1 * (pbest[i] - x[i]);
            double social = c2_ * r2 * (gbest[i] - x[i]);
            particle.push_back(x[i] + w_ * (x[i] - xprev[i]) + cognitive + social);
        }
        offspring.push_back(context.bounder(std::move(particle)));
    }
    return offspring;
}

Population PSOAlgorithm::replace(const Population& population, const Population& offspring,
                                 const EvolutionConfig&) {
    previous_population_ = population;

    Population next;
    next.reserve(population.size());
    for (size_t i = 0; i < population.size(); ++i) {
        // a particle whose new position could not be evaluated stays put
        if (i < offspring.size() && offspring[i].has_fitness()) next.push_back(offspring[i]);
        else next.push_back(population[i]);
    }
    return next;
}

Population PSOAlgorithm::archive(const Population& population, const Population& archive) {
    return personal_best_archive(population, archive);
}

}  // namespace evo_optim
