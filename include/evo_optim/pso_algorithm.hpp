#ifndef EVO_OPTIM__PSO_ALGORITHM_HPP_
#define EVO_OPTIM__PSO_ALGORITHM_HPP_

#include "evo_optim/optimization_algorithm.hpp"

namespace evo_optim {

// Particle swarm without explicit velocities: a particle's momentum is the
// step from its previous position. The archive holds one personal best per
// particle and the neighbourhood is the whole swarm (star topology).
//
//   x' = x + w (x - x_prev) + c1 r1 (pbest - x) + c2 r2 (nbest - x)
class PSOAlgorithm : public OptimizationAlgorithm {
public:
    // w: inertia, c1: cognitive rate, c2: social rate
    PSOAlgorithm(double w, double c1, double c2);
    explicit PSOAlgorithm(const EvolutionConfig& config);

    std::string name() const override { return "PSO"; }
    std::vector<Candidate> reproduce(const RunState& state, VariationContext& context) override;
    Population replace(const Population& population, const Population& offspring,
                       const EvolutionConfig& config) override;
    Population archive(const Population& population, const Population& archive) override;

private:
    double w_;  // Inertia
    double c1_; // Cognitive (Personal)
    double c2_; // Social (Global)

    // swarm positions one generation back
    Population previous_population_;
};

}  // namespace evo_optim

#endif
