#include "evo_optim/termination.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include "rclcpp/logging.hpp"

namespace evo_optim {

void Terminator::add(TerminationClause clause) {
    clauses_.push_back(std::move(clause));
}

std::optional<std::string> Terminator::should_terminate(const RunState& state, const EvolutionConfig& config) const {
    auto logger = rclcpp::get_logger("evo_optim.termination");
    for (const auto& clause : clauses_) {
        RCLCPP_DEBUG(logger, "termination test using %s at generation %zu and evaluation %zu",
                     clause.name.c_str(), state.num_generations, state.num_evaluations);
        if (clause.predicate(state, config)) {
            RCLCPP_DEBUG(logger, "termination from %s at generation %zu and evaluation %zu",
                         clause.name.c_str(), state.num_generations, state.num_evaluations);
            return clause.name;
        }
    }
    return std::nullopt;
}

TerminationClause default_termination() {
    return {"default_termination", [](const RunState&, const EvolutionConfig&) { return true; }};
}

TerminationClause evaluation_termination(size_t max_evaluations) {
    return {"evaluation_termination", [max_evaluations](const RunState& state, const EvolutionConfig&) {
        return state.num_evaluations >= max_evaluations;
    }};
}

TerminationClause generation_termination(size_t max_generations) {
    return {"generation_termination", [max_generations](const RunState& state, const EvolutionConfig&) {
        return state.num_generations >= max_generations;
    }};
}

TerminationClause time_termination(double max_seconds) {
    auto start = std::make_shared<std::optional<std::chrono::steady_clock::time_point>>();
    return {"time_termination", [start, max_seconds](const RunState&, const EvolutionConfig&) {
        const auto now = std::chrono::steady_clock::now();
        if (!*start) *start = now;
        return std::chrono::duration<double>(now - **start).count() >= max_seconds;
    }};
}

TerminationClause user_termination(std::shared_ptr<const std::atomic<bool>> stop) {
    return {"user_termination", [stop](const RunState&, const EvolutionConfig&) {
        return stop && stop->load();
    }};
}

TerminationClause convergence_termination(std::shared_ptr<const StatisticsLog> log, double tol, bool maximize) {
    return {"convergence_termination", [log, tol, maximize](const RunState&, const EvolutionConfig&) {
        if (!log) return false;
        const std::vector<double> fit = log->best_fitness();
        if (fit.size() <= 3) return false;

        const double last = fit[fit.size() - 1];
        const double previous = fit[fit.size() - 2];
        if (std::fabs(last - previous) > std::fabs(last * tol)) return false;

        if (maximize) {
            return last >= previous && last >= *std::max_element(fit.begin(), fit.end());
        }
        return last <= previous && last <= *std::min_element(fit.begin(), fit.end());
    }};
}

}  // namespace evo_optim
