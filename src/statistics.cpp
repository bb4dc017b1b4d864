#include "evo_optim/statistics.hpp"
#include "evo_optim/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace evo_optim {

FitnessStatistics fitness_statistics(const Population& population) {
    if (population.empty()) {
        throw EvolutionError("fitness statistics of an empty population");
    }

    FitnessStatistics stats;
    stats.best = *std::min_element(population.begin(), population.end())->fitness();
    stats.worst = *std::max_element(population.begin(), population.end())->fitness();

    std::vector<double> values;
    values.reserve(population.size());
    for (const auto& ind : population) values.push_back(*ind.fitness());
    std::sort(values.begin(), values.end());

    const size_t n = values.size();
    stats.median = n % 2 == 1 ? values[n / 2] : 0.5 * (values[n / 2 - 1] + values[n / 2]);
    stats.mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(n);

    double sq = 0.0;
    for (double v : values) sq += (v - stats.mean) * (v - stats.mean);
    stats.std = std::sqrt(sq / static_cast<double>(n));
    return stats;
}

void StatisticsLog::record(const RunState& state) {
    if (state.population.empty()) return;

    GenerationRecord r;
    r.generation = state.num_generations;
    r.evaluations = state.num_evaluations;
    r.population_size = state.population.size();
    r.fitness = fitness_statistics(state.population);
    records_.push_back(r);
}

std::vector<double> StatisticsLog::best_fitness() const {
    std::vector<double> fit;
    fit.reserve(records_.size());
    for (const auto& r : records_) fit.push_back(r.fitness.best);
    return fit;
}

}  // namespace evo_optim
