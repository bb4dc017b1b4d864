#include "evo_optim/replacement.hpp"
#include "evo_optim/exceptions.hpp"

#include <algorithm>
#include <cmath>

namespace evo_optim {

namespace {

bool parent_keeps_slot(const Individual& parent, const Individual& child, bool maximize,
                       ReplacementComparison comparison) {
    if (comparison == ReplacementComparison::FITNESS) return parent < child;

    const double p = std::fabs(*parent.fitness());
    const double c = std::fabs(*child.fitness());
    return maximize ? p > c : p < c;
}

}  // namespace

Population positional_replacement(const Population& parents, const Population& offspring, bool maximize,
                                  ReplacementComparison comparison) {
    if (parents.size() != offspring.size()) {
        throw EvolutionError("positional replacement needs as many offspring (" + std::to_string(offspring.size()) +
                             ") as parents (" + std::to_string(parents.size()) + ")");
    }

    Population next;
    next.reserve(parents.size());
    for (size_t i = 0; i < parents.size(); ++i) {
        const Individual& parent = parents[i];
        const Individual& child = offspring[i];
        if (!child.has_fitness() || parent_keeps_slot(parent, child, maximize, comparison)) {
            next.push_back(parent);
        } else {
            next.push_back(child);
        }
    }
    return next;
}

Population ranked_replacement(const Population& parents, const Population& offspring, size_t size) {
    Population pool = parents;
    for (const auto& child : offspring) {
        if (child.has_fitness()) pool.push_back(child);
    }
    std::stable_sort(pool.begin(), pool.end());
    if (pool.size() > size) pool.resize(size);
    return pool;
}

}  // namespace evo_optim
