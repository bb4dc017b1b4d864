#include "evo_optim/de_algorithm.hpp"
#include "evo_optim/archiver.hpp"
#include "evo_optim/exceptions.hpp"

namespace evo_optim {

DEAlgorithm::DEAlgorithm(const EvolutionConfig& config)
: engine_(StrategyDescriptor::parse(config.strategy), config.mutation_scale, config.crossover_rate,
          config.binomial_targeting),
  comparison_(config.replacement_comparison)
{
}

std::string DEAlgorithm::name() const {
    return engine_.descriptor().to_string();
}

std::vector<Candidate> DEAlgorithm::reproduce(const RunState& state, VariationContext& context) {
    if (state.population.empty()) {
        throw EvolutionError("differential evolution of an empty population");
    }
    // rand-based strategies never read the best vector
    static const Candidate kNoBest;
    const Candidate& best = state.archive.empty() ? kNoBest : state.archive.front().candidate();
    return engine_.offspring(state.population, best, context.rng);
}

Population DEAlgorithm::replace(const Population& population, const Population& offspring,
                                const EvolutionConfig& config) {
    return positional_replacement(population, offspring, config.maximize, comparison_);
}

Population DEAlgorithm::archive(const Population& population, const Population&) {
    return global_best_archive(population);
}

}  // namespace evo_optim
