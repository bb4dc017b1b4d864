#include "evo_optim/genetic_algorithm.hpp"
#include "evo_optim/archiver.hpp"
#include "evo_optim/exceptions.hpp"
#include "evo_optim/replacement.hpp"
#include "evo_optim/strategy.hpp"

#include <algorithm>

#include "rclcpp/logging.hpp"

namespace evo_optim {

Variator make_variator(const std::string& name) {
    if (name == "uniform_crossover") return uniform_crossover;
    if (name == "gaussian_mutation") return gaussian_mutation;
    if (name == "uniform_mutation") return uniform_mutation;
    throw ConfigurationError("unknown variator '" + name + "'");
}

GeneticAlgorithm::GeneticAlgorithm(const EvolutionConfig& config) {
    for (const auto& name : config.variators) {
        variators_.emplace_back(name, make_variator(name));
    }
}

GeneticAlgorithm::GeneticAlgorithm(std::vector<std::pair<std::string, Variator>> variators)
: variators_(std::move(variators))
{
}

std::vector<Candidate> GeneticAlgorithm::reproduce(const RunState& state, VariationContext& context) {
    auto logger = rclcpp::get_logger("evo_optim.ga");
    const size_t num_selected = context.config.num_selected > 0 ? context.config.num_selected
                                                                : context.config.pop_size;

    Population parents = tournament_selection(state.population, num_selected, context.config.tournament_size,
                                              context.rng);
    RCLCPP_DEBUG(logger, "selected %zu candidates", parents.size());

    std::vector<Candidate> candidates;
    candidates.reserve(parents.size());
    for (const auto& p : parents) candidates.push_back(p.candidate());

    for (auto& [name, variator] : variators_) {
        RCLCPP_DEBUG(logger, "variation using %s at generation %zu and evaluation %zu",
                     name.c_str(), state.num_generations, state.num_evaluations);
        candidates = variator(std::move(candidates), context);
    }

    for (auto& c : candidates) c = context.bounder(std::move(c));
    return candidates;
}

Population GeneticAlgorithm::replace(const Population& population, const Population& offspring,
                                     const EvolutionConfig& config) {
    return ranked_replacement(population, offspring, config.pop_size);
}

Population GeneticAlgorithm::archive(const Population& population, const Population&) {
    return global_best_archive(population);
}

Population tournament_selection(const Population& population, size_t num_selected, size_t tournament_size,
                                std::mt19937& rng) {
    if (population.empty()) {
        throw EvolutionError("tournament selection from an empty population");
    }
    const size_t k = std::min(tournament_size, population.size());

    Population selected;
    selected.reserve(num_selected);
    for (size_t i = 0; i < num_selected; ++i) {
        auto contestants = sample_distinct_indices(population.size(), k, {}, rng);
        size_t winner = contestants.front();
        for (size_t c : contestants) {
            if (population[c] < population[winner]) winner = c;
        }
        selected.push_back(population[winner]);
    }
    return selected;
}

std::vector<Candidate> uniform_crossover(std::vector<Candidate> candidates, VariationContext& context) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    for (size_t i = 0; i + 1 < candidates.size(); i += 2) {
        if (dist(context.rng) < context.config.crossover_rate) {
            auto& mom = candidates[i];
            auto& dad = candidates[i + 1];
            const size_t n = std::min(mom.size(), dad.size());
            for (size_t j = 0; j < n; ++j) {
                if (dist(context.rng) < 0.5) std::swap(mom[j], dad[j]);
            }
        }
    }
    return candidates;
}

std::vector<Candidate> gaussian_mutation(std::vector<Candidate> candidates, VariationContext& context) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    std::normal_distribution<double> gauss(context.config.gaussian_mean, context.config.gaussian_stdev);

    for (auto& c : candidates) {
        for (auto& gene : c) {
            if (dist(context.rng) < context.config.mutation_rate) gene += gauss(context.rng);
        }
    }
    return candidates;
}

std::vector<Candidate> uniform_mutation(std::vector<Candidate> candidates, VariationContext& context) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    for (auto& c : candidates) {
        const auto lo = context.bounder.lower_bound(c.size());
        const auto hi = context.bounder.upper_bound(c.size());
        if (lo.empty() || hi.empty()) {
            throw ConfigurationError("uniform_mutation requires a bounder with lower and upper bounds");
        }
        const size_t n = std::min({c.size(), lo.size(), hi.size()});
        for (size_t j = 0; j < n; ++j) {
            if (dist(context.rng) <= context.config.mutation_rate) {
                std::uniform_real_distribution<double> value(lo[j], hi[j]);
                c[j] = value(context.rng);
            }
        }
    }
    return candidates;
}

}  // namespace evo_optim
