#ifndef EVO_OPTIM__ARCHIVER_HPP_
#define EVO_OPTIM__ARCHIVER_HPP_

#include "evo_optim/individual.hpp"

namespace evo_optim {

// Single-entry archive holding the best individual of `population`.
// Empty when the population is empty.
Population global_best_archive(const Population& population);

// One personal best per slot. The first call copies the population; later
// calls keep, slot by slot, whichever of archive[i] and population[i] is
// better (the population entry wins ties).
Population personal_best_archive(const Population& population, const Population& archive);

}  // namespace evo_optim

#endif
