#ifndef EVO_OPTIM__CONFIG_HPP_
#define EVO_OPTIM__CONFIG_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "rclcpp/parameter_value.hpp"

#include "evo_optim/replacement.hpp"
#include "evo_optim/strategy.hpp"

namespace evo_optim {

// Named values forwarded to every evaluation task. ParameterValue only holds
// plain data (bool, integer, double, string and arrays of those), so a
// context can always be copied to a worker.
using EvaluationContext = std::map<std::string, rclcpp::ParameterValue>;

// Every option the engine and its operators read. Validated once when a run
// starts; options the engine does not know go into `extensions` and reach the
// evaluator through the evaluation context.
struct EvolutionConfig {
    size_t pop_size = 100;
    bool maximize = true;

    // differential evolution
    double mutation_scale = 0.5;   // F
    double crossover_rate = 0.9;   // CR, also the GA crossover probability
    std::string strategy = "DE/rand/1/bin";
    BinomialTargeting binomial_targeting = BinomialTargeting::FIXED_DIMENSION;
    ReplacementComparison replacement_comparison = ReplacementComparison::MAGNITUDE;

    // genetic algorithm
    size_t num_selected = 0;       // 0 selects pop_size parents
    size_t tournament_size = 2;
    double mutation_rate = 0.1;
    double gaussian_mean = 0.0;
    double gaussian_stdev = 1.0;
    std::vector<std::string> variators = {"uniform_crossover", "gaussian_mutation"};

    // particle swarm
    double inertia = 0.5;
    double cognitive_rate = 2.1;
    double social_rate = 2.1;

    // evaluation
    unsigned workers = 0;          // 0 uses the hardware concurrency

    // termination, a zero or unset value disables the clause
    size_t max_evaluations = 0;
    size_t max_generations = 0;
    double max_time = 0.0;         // seconds
    std::optional<double> convergence_tolerance;

    std::optional<std::uint32_t> seed;

    std::map<std::string, rclcpp::ParameterValue> extensions;

    // Throws ConfigurationError on the first invalid option.
    void validate() const;

    unsigned resolved_workers() const;

    // Typed options plus extensions, as handed to evaluation tasks.
    EvaluationContext evaluation_context() const;
};

// Converts an integer option read from an external source (ROS parameters)
// to a count. Negative values, and zero unless `allow_zero`, throw
// ConfigurationError naming the option.
size_t checked_count(int64_t value, const std::string& name, bool allow_zero = false);

}  // namespace evo_optim

#endif
