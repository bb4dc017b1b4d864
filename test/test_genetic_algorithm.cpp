#include <gtest/gtest.h>

#include <algorithm>

#include "evo_optim/exceptions.hpp"
#include "evo_optim/genetic_algorithm.hpp"

using namespace evo_optim;

namespace {

Population make_population(const std::vector<double>& fitness) {
    Population pop;
    for (size_t i = 0; i < fitness.size(); ++i) {
        Individual ind({static_cast<double>(i), static_cast<double>(i)}, false);
        ind.set_fitness(fitness[i]);
        pop.push_back(ind);
    }
    return pop;
}

std::vector<Candidate> pairs() {
    return {{0.0, 0.0, 0.0, 0.0}, {1.0, 1.0, 1.0, 1.0}, {2.0, 2.0, 2.0, 2.0}, {3.0, 3.0, 3.0, 3.0}};
}

}  // namespace

TEST(TournamentSelection, FullTournamentAlwaysPicksBest) {
    std::mt19937 rng(4);
    Population selected = tournament_selection(make_population({3.0, 0.5, 2.0, 9.0}), 6, 4, rng);
    ASSERT_EQ(selected.size(), 6u);
    for (const auto& ind : selected) EXPECT_DOUBLE_EQ(*ind.fitness(), 0.5);
}

TEST(TournamentSelection, EmptyPopulationThrows) {
    std::mt19937 rng(4);
    EXPECT_THROW(tournament_selection({}, 2, 2, rng), EvolutionError);
}

TEST(UniformCrossover, ZeroRateLeavesCandidates) {
    EvolutionConfig config;
    config.crossover_rate = 0.0;
    Bounder bounder;
    std::mt19937 rng(1);
    VariationContext context{config, bounder, rng};
    EXPECT_EQ(uniform_crossover(pairs(), context), pairs());
}

TEST(UniformCrossover, SwapsGenesWithinPairs) {
    EvolutionConfig config;
    config.crossover_rate = 1.0;
    Bounder bounder;
    std::mt19937 rng(1);
    VariationContext context{config, bounder, rng};

    auto children = uniform_crossover(pairs(), context);
    ASSERT_EQ(children.size(), 4u);
    for (size_t g = 0; g < 4; ++g) {
        EXPECT_DOUBLE_EQ(children[0][g] + children[1][g], 1.0);
        EXPECT_DOUBLE_EQ(children[2][g] + children[3][g], 5.0);
    }
}

TEST(GaussianMutation, ZeroRateLeavesCandidates) {
    EvolutionConfig config;
    config.mutation_rate = 0.0;
    Bounder bounder;
    std::mt19937 rng(1);
    VariationContext context{config, bounder, rng};
    EXPECT_EQ(gaussian_mutation(pairs(), context), pairs());
}

TEST(UniformMutation, DrawsWithinBounderLimits) {
    EvolutionConfig config;
    config.mutation_rate = 1.0;
    Bounder bounder(10.0, 11.0);
    std::mt19937 rng(1);
    VariationContext context{config, bounder, rng};

    for (const auto& c : uniform_mutation(pairs(), context)) {
        for (double g : c) {
            EXPECT_GE(g, 10.0);
            EXPECT_LE(g, 11.0);
        }
    }
}

TEST(UniformMutation, NeedsBoundedBounder) {
    EvolutionConfig config;
    Bounder bounder;
    std::mt19937 rng(1);
    VariationContext context{config, bounder, rng};
    EXPECT_THROW(uniform_mutation(pairs(), context), ConfigurationError);
}

TEST(GeneticAlgorithm, UnknownVariatorIsRejected) {
    EvolutionConfig config;
    config.variators = {"uniform_crossover", "bit_flip"};
    EXPECT_THROW(GeneticAlgorithm ga(config), ConfigurationError);
}

TEST(GeneticAlgorithm, ReproduceSelectsVariesAndBounds) {
    EvolutionConfig config;
    config.pop_size = 4;
    config.maximize = false;
    config.mutation_rate = 1.0;
    config.gaussian_stdev = 100.0;
    GeneticAlgorithm ga(config);

    Bounder bounder(-1.0, 1.0);
    std::mt19937 rng(8);
    VariationContext context{config, bounder, rng};

    RunState state;
    state.population = make_population({1.0, 2.0, 3.0, 4.0});
    auto offspring = ga.reproduce(state, context);
    ASSERT_EQ(offspring.size(), 4u);
    for (const auto& c : offspring) {
        for (double g : c) {
            EXPECT_GE(g, -1.0);
            EXPECT_LE(g, 1.0);
        }
    }
}

TEST(GeneticAlgorithm, CustomVariatorPipelineRunsInOrder) {
    std::vector<std::string> calls;
    auto record = [&calls](const std::string& name) {
        return [&calls, name](std::vector<Candidate> cs, VariationContext&) {
            calls.push_back(name);
            return cs;
        };
    };
    std::vector<std::pair<std::string, Variator>> pipeline{{"first", record("first")}, {"second", record("second")}};
    GeneticAlgorithm ga(pipeline);

    EvolutionConfig config;
    config.pop_size = 2;
    Bounder bounder;
    std::mt19937 rng(8);
    VariationContext context{config, bounder, rng};
    RunState state;
    state.population = make_population({1.0, 2.0});
    ga.reproduce(state, context);
    EXPECT_EQ(calls, (std::vector<std::string>{"first", "second"}));
}

TEST(GeneticAlgorithm, ReplacementKeepsPopulationSize) {
    EvolutionConfig config;
    config.pop_size = 3;
    GeneticAlgorithm ga(config);
    Population next = ga.replace(make_population({5.0, 6.0, 7.0}), make_population({1.0, 9.0}), config);
    ASSERT_EQ(next.size(), 3u);
    EXPECT_DOUBLE_EQ(*next[0].fitness(), 1.0);
}
