#include "evo_optim/archiver.hpp"

#include <algorithm>

namespace evo_optim {

Population global_best_archive(const Population& population) {
    if (population.empty()) return {};
    return {*std::min_element(population.begin(), population.end())};
}

Population personal_best_archive(const Population& population, const Population& archive) {
    if (archive.empty()) return population;

    Population next;
    next.reserve(population.size());
    for (size_t i = 0; i < population.size(); ++i) {
        if (i < archive.size() && archive[i] < population[i]) next.push_back(archive[i]);
        else next.push_back(population[i]);
    }
    return next;
}

}  // namespace evo_optim
