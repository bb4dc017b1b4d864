#ifndef EVO_OPTIM__GENETIC_ALGORITHM_HPP_
#define EVO_OPTIM__GENETIC_ALGORITHM_HPP_

#include <functional>
#include <string>
#include <vector>

#include "evo_optim/optimization_algorithm.hpp"

namespace evo_optim {

// A variation operator: candidates in, modified candidates out.
using Variator = std::function<std::vector<Candidate>(std::vector<Candidate>, VariationContext&)>;

// Operator pipeline: tournament selection, the configured variators applied
// one after another, bounding, then ranked (steady-state) replacement.
class GeneticAlgorithm : public OptimizationAlgorithm {
public:
    explicit GeneticAlgorithm(const EvolutionConfig& config);
    GeneticAlgorithm(std::vector<std::pair<std::string, Variator>> variators);

    std::string name() const override { return "GA"; }
    std::vector<Candidate> reproduce(const RunState& state, VariationContext& context) override;
    Population replace(const Population& population, const Population& offspring,
                       const EvolutionConfig& config) override;
    Population archive(const Population& population, const Population& archive) override;

private:
    std::vector<std::pair<std::string, Variator>> variators_;
};

// Looks a variator up by name: "uniform_crossover", "gaussian_mutation" or
// "uniform_mutation". Throws ConfigurationError for anything else.
Variator make_variator(const std::string& name);

// Picks `num_selected` parents, each the best of `tournament_size` distinct
// random contestants.
Population tournament_selection(const Population& population, size_t num_selected, size_t tournament_size,
                                std::mt19937& rng);

// Pairs (0,1), (2,3), ... cross with probability crossover_rate by swapping
// each gene with probability 0.5.
std::vector<Candidate> uniform_crossover(std::vector<Candidate> candidates, VariationContext& context);

// Adds N(gaussian_mean, gaussian_stdev) to each gene with probability mutation_rate.
std::vector<Candidate> gaussian_mutation(std::vector<Candidate> candidates, VariationContext& context);

// Replaces each gene, with probability mutation_rate, by a uniform draw
// between the bounder's limits. Needs a bounded bounder.
std::vector<Candidate> uniform_mutation(std::vector<Candidate> candidates, VariationContext& context);

}  // namespace evo_optim

#endif
