#ifndef EVO_OPTIM__OPTIMIZATION_ALGORITHM_HPP_
#define EVO_OPTIM__OPTIMIZATION_ALGORITHM_HPP_

#include <random>
#include <string>
#include <vector>

#include "evo_optim/bounder.hpp"
#include "evo_optim/config.hpp"
#include "evo_optim/individual.hpp"
#include "evo_optim/run_state.hpp"

namespace evo_optim {

// What variation operators may read or consume while building offspring.
struct VariationContext {
    const EvolutionConfig& config;
    const BoundingFunction& bounder;
    std::mt19937& rng;
};

// One flavour of generational algorithm. The engine drives the loop; a
// variant decides how offspring are made, who survives and what is archived.
class OptimizationAlgorithm {
public:
    virtual ~OptimizationAlgorithm() = default;

    virtual std::string name() const = 0;

    // Offspring candidates for the next generation, not yet evaluated.
    virtual std::vector<Candidate> reproduce(const RunState& state, VariationContext& context) = 0;

    // Next population. `offspring` holds the evaluated reproduce() output in
    // the same order; individuals whose evaluation failed have no fitness.
    virtual Population replace(const Population& population, const Population& offspring,
                               const EvolutionConfig& config) = 0;

    // Archive after replacement. `archive` is empty on the first call.
    virtual Population archive(const Population& population, const Population& archive) = 0;
};

}  // namespace evo_optim

#endif
