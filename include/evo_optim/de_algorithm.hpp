#ifndef EVO_OPTIM__DE_ALGORITHM_HPP_
#define EVO_OPTIM__DE_ALGORITHM_HPP_

#include "evo_optim/optimization_algorithm.hpp"
#include "evo_optim/replacement.hpp"
#include "evo_optim/strategy.hpp"

namespace evo_optim {

// Differential evolution driven by one of the ten DE/x/y/z strategies.
// Slots keep their identity across generations: offspring i only competes
// with parent i, and the archive holds the global best used as base vector.
class DEAlgorithm : public OptimizationAlgorithm {
public:
    explicit DEAlgorithm(const EvolutionConfig& config);

    std::string name() const override;
    std::vector<Candidate> reproduce(const RunState& state, VariationContext& context) override;
    Population replace(const Population& population, const Population& offspring,
                       const EvolutionConfig& config) override;
    Population archive(const Population& population, const Population& archive) override;

private:
    StrategyEngine engine_;
    ReplacementComparison comparison_;
};

}  // namespace evo_optim

#endif
