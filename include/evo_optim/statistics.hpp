#ifndef EVO_OPTIM__STATISTICS_HPP_
#define EVO_OPTIM__STATISTICS_HPP_

#include <vector>

#include "evo_optim/run_state.hpp"

namespace evo_optim {

struct FitnessStatistics {
    double worst = 0.0;
    double best = 0.0;
    double median = 0.0;
    double mean = 0.0;
    double std = 0.0;   // population standard deviation
};

// Throws EvolutionError for an empty population.
FitnessStatistics fitness_statistics(const Population& population);

struct GenerationRecord {
    size_t generation = 0;
    size_t evaluations = 0;
    size_t population_size = 0;
    FitnessStatistics fitness;
};

// In-memory statistics file: one record per observed generation.
class StatisticsLog {
public:
    // Empty populations are not recorded.
    void record(const RunState& state);

    const std::vector<GenerationRecord>& records() const { return records_; }
    bool empty() const { return records_.empty(); }
    size_t size() const { return records_.size(); }

    // The "Best Fit" column.
    std::vector<double> best_fitness() const;

private:
    std::vector<GenerationRecord> records_;
};

}  // namespace evo_optim

#endif
