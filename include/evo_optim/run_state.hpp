#ifndef EVO_OPTIM__RUN_STATE_HPP_
#define EVO_OPTIM__RUN_STATE_HPP_

#include <string>

#include "evo_optim/individual.hpp"

namespace evo_optim {

// Everything that changes between generations. The engine hands out copies;
// observers and termination clauses only ever see a const snapshot.
struct RunState {
    Population population;
    Population archive;
    size_t num_generations = 0;
    size_t num_evaluations = 0;
};

struct RunResult {
    Population population;
    Population archive;
    size_t num_generations = 0;
    size_t num_evaluations = 0;
    std::string termination_cause;
    // Set when the run was aborted mid-generation; the population may then
    // hold individuals that were never re-evaluated.
    bool provisional = false;
};

}  // namespace evo_optim

#endif
