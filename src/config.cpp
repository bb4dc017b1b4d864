#include "evo_optim/config.hpp"
#include "evo_optim/exceptions.hpp"

#include <thread>

namespace evo_optim {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) throw ConfigurationError(message);
}

bool is_probability(double p) {
    return p >= 0.0 && p <= 1.0;
}

}  // namespace

void EvolutionConfig::validate() const {
    require(pop_size > 0, "pop_size must be positive");
    require(mutation_scale >= 0.0, "mutation_scale (F) must not be negative");
    require(is_probability(crossover_rate), "crossover_rate must lie in [0, 1]");
    require(is_probability(mutation_rate), "mutation_rate must lie in [0, 1]");
    require(tournament_size > 0, "tournament_size must be positive");
    require(gaussian_stdev > 0.0, "gaussian_stdev must be positive");
    require(max_time >= 0.0, "max_time must not be negative");
    require(!convergence_tolerance || *convergence_tolerance >= 0.0, "tol must not be negative");

    // throws on an unknown identifier
    StrategyDescriptor::parse(strategy);

    for (const auto& [name, value] : extensions) {
        require(value.get_type() != rclcpp::ParameterType::PARAMETER_NOT_SET,
                "option '" + name + "' has no value and cannot be sent to evaluators");
    }
}

size_t checked_count(int64_t value, const std::string& name, bool allow_zero) {
    if (value < 0 || (value == 0 && !allow_zero)) {
        throw ConfigurationError(name + " must be " + (allow_zero ? "non-negative" : "positive") +
                                 ", got " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

unsigned EvolutionConfig::resolved_workers() const {
    if (workers > 0) return workers;
    const unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

EvaluationContext EvolutionConfig::evaluation_context() const {
    EvaluationContext context;
    for (const auto& [name, value] : extensions) {
        if (value.get_type() == rclcpp::ParameterType::PARAMETER_NOT_SET) {
            throw ConfigurationError("option '" + name + "' has no value and cannot be sent to evaluators");
        }
        context[name] = value;
    }

    context["pop_size"] = rclcpp::ParameterValue(static_cast<int64_t>(pop_size));
    context["maximize"] = rclcpp::ParameterValue(maximize);
    context["mutation_scale"] = rclcpp::ParameterValue(mutation_scale);
    context["crossover_rate"] = rclcpp::ParameterValue(crossover_rate);
    context["mutation_rate"] = rclcpp::ParameterValue(mutation_rate);
    context["strategy"] = rclcpp::ParameterValue(strategy);
    context["max_evaluations"] = rclcpp::ParameterValue(static_cast<int64_t>(max_evaluations));
    context["max_generations"] = rclcpp::ParameterValue(static_cast<int64_t>(max_generations));
    return context;
}

}  // namespace evo_optim
