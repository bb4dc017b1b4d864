#ifndef EVO_OPTIM__REPLACEMENT_HPP_
#define EVO_OPTIM__REPLACEMENT_HPP_

#include "evo_optim/individual.hpp"

namespace evo_optim {

// How positional replacement decides between parent[i] and offspring[i].
//   MAGNITUDE: compares |fitness|; the parent keeps its slot only when its
//               magnitude is strictly larger (maximize) or strictly smaller
//               (minimize). Historical DE behaviour, blind to sign.
//   FITNESS:   the parent keeps its slot only when it is strictly better
//               under the maximize-aware ordering.
enum class ReplacementComparison {
    MAGNITUDE,
    FITNESS
};

// Slot-by-slot greedy replacement. result[i] is parents[i] or offspring[i];
// an offspring without fitness never takes the slot.
Population positional_replacement(const Population& parents, const Population& offspring, bool maximize,
                                  ReplacementComparison comparison = ReplacementComparison::MAGNITUDE);

// Steady-state replacement: parents and evaluated offspring are merged and the
// best `size` survive, best first.
Population ranked_replacement(const Population& parents, const Population& offspring, size_t size);

}  // namespace evo_optim

#endif
