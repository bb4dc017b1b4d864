#include <gtest/gtest.h>

#include <cmath>
#include <set>

#include "evo_optim/exceptions.hpp"
#include "evo_optim/strategy.hpp"

using namespace evo_optim;

namespace {

constexpr size_t kDim = 4;

// pop[i][g] = 0.1 i + 0.01 g, so rand/1 with donors 1, 2, 3 and F = 0.5
// gives 0.05 + 0.01 g, inside the repair interval.
Population ladder_population(size_t size) {
    Population pop;
    for (size_t i = 0; i < size; ++i) {
        Candidate c(kDim);
        for (size_t g = 0; g < kDim; ++g) c[g] = 0.1 * i + 0.01 * g;
        Individual ind(c, false);
        ind.set_fitness(static_cast<double>(i));
        pop.push_back(ind);
    }
    return pop;
}

size_t changed_genes(const Candidate& before, const Candidate& after) {
    size_t n = 0;
    for (size_t g = 0; g < before.size(); ++g) {
        if (std::fabs(before[g] - after[g]) > 1e-12) ++n;
    }
    return n;
}

const std::vector<size_t> kDonors{1, 2, 3, 4, 5};

}  // namespace

TEST(StrategyDescriptor, ParsesEveryKnownStrategy) {
    const auto& names = known_strategies();
    EXPECT_EQ(names.size(), 10u);
    for (const auto& name : names) {
        EXPECT_EQ(StrategyDescriptor::parse(name).to_string(), name);
    }
}

TEST(StrategyDescriptor, ParsesComponents) {
    auto d = StrategyDescriptor::parse("DE/rand-to-best/1/exp");
    EXPECT_EQ(d.base, BaseVector::RAND_TO_BEST);
    EXPECT_EQ(d.difference_count, 1);
    EXPECT_EQ(d.crossover, CrossoverScheme::EXPONENTIAL);
}

TEST(StrategyDescriptor, RejectsUnknownIdentifiers) {
    EXPECT_THROW(StrategyDescriptor::parse("DE/foo/1/bin"), ConfigurationError);
    EXPECT_THROW(StrategyDescriptor::parse("DE/rand/3/bin"), ConfigurationError);
    EXPECT_THROW(StrategyDescriptor::parse("DE/rand/1/xyz"), ConfigurationError);
    EXPECT_THROW(StrategyDescriptor::parse("GA/rand/1/bin"), ConfigurationError);
    EXPECT_THROW(StrategyDescriptor::parse("DE/rand-to-best/2/bin"), ConfigurationError);
    EXPECT_THROW(StrategyDescriptor::parse(""), ConfigurationError);
}

TEST(SampleDistinctIndices, DrawsDistinctAllowedIndices) {
    std::mt19937 rng(7);
    for (int trial = 0; trial < 100; ++trial) {
        auto idx = sample_distinct_indices(10, 5, {3}, rng);
        ASSERT_EQ(idx.size(), 5u);
        std::set<size_t> unique(idx.begin(), idx.end());
        EXPECT_EQ(unique.size(), 5u);
        EXPECT_EQ(unique.count(3), 0u);
        for (size_t i : idx) EXPECT_LT(i, 10u);
    }
}

TEST(SampleDistinctIndices, ThrowsWhenTooFewIndicesRemain) {
    std::mt19937 rng(7);
    EXPECT_THROW(sample_distinct_indices(5, 5, {0}, rng), ConfigurationError);
    EXPECT_NO_THROW(sample_distinct_indices(6, 5, {0}, rng));
}

TEST(StrategyEngine, PopulationBelowSixCannotSupplyDonors) {
    StrategyEngine engine(StrategyDescriptor::parse("DE/rand/1/bin"), 0.5, 0.9);
    std::mt19937 rng(1);
    EXPECT_THROW(engine.offspring(ladder_population(5), {}, rng), ConfigurationError);
}

TEST(StrategyEngine, OneOffspringPerSlot) {
    StrategyEngine engine(StrategyDescriptor::parse("DE/rand/2/exp"), 0.5, 0.9);
    std::mt19937 rng(1);
    auto offspring = engine.offspring(ladder_population(8), {}, rng);
    ASSERT_EQ(offspring.size(), 8u);
    for (const auto& c : offspring) {
        ASSERT_EQ(c.size(), kDim);
        for (double g : c) {
            EXPECT_GE(g, kRepairLower);
            EXPECT_LE(g, kRepairUpper);
        }
    }
}

TEST(StrategyEngine, SameSeedSameOffspring) {
    StrategyEngine engine(StrategyDescriptor::parse("DE/best/1/bin"), 0.5, 0.9);
    const Population pop = ladder_population(6);
    const Candidate best = pop.front().candidate();
    std::mt19937 a(123);
    std::mt19937 b(123);
    EXPECT_EQ(engine.offspring(pop, best, a), engine.offspring(pop, best, b));
}

TEST(StrategyEngine, RotatingBinomialWithFullRateMutatesEveryGene) {
    StrategyEngine engine(StrategyDescriptor::parse("DE/rand/1/bin"), 0.5, 1.0, BinomialTargeting::ROTATING);
    const Population pop = ladder_population(6);
    std::mt19937 rng(3);
    Candidate trial = engine.trial(pop, 0, kDonors, {}, rng);
    EXPECT_EQ(changed_genes(pop[0].candidate(), trial), kDim);
    for (size_t g = 0; g < kDim; ++g) EXPECT_NEAR(trial[g], 0.05 + 0.01 * g, 1e-12);
}

TEST(StrategyEngine, RotatingBinomialWithZeroRateMutatesOneGene) {
    StrategyEngine engine(StrategyDescriptor::parse("DE/rand/1/bin"), 0.5, 0.0, BinomialTargeting::ROTATING);
    const Population pop = ladder_population(6);
    std::mt19937 rng(3);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(changed_genes(pop[0].candidate(), engine.trial(pop, 0, kDonors, {}, rng)), 1u);
    }
}

TEST(StrategyEngine, FixedDimensionBinomialMutatesOneGene) {
    const Population pop = ladder_population(6);
    std::mt19937 rng(5);
    for (double cr : {0.0, 0.5, 1.0}) {
        StrategyEngine engine(StrategyDescriptor::parse("DE/rand/1/bin"), 0.5, cr,
                              BinomialTargeting::FIXED_DIMENSION);
        for (int i = 0; i < 20; ++i) {
            EXPECT_EQ(changed_genes(pop[0].candidate(), engine.trial(pop, 0, kDonors, {}, rng)), 1u);
        }
    }
}

TEST(StrategyEngine, ExponentialWithFullRateMutatesEveryGene) {
    StrategyEngine engine(StrategyDescriptor::parse("DE/rand/1/exp"), 0.5, 1.0);
    const Population pop = ladder_population(6);
    std::mt19937 rng(11);
    Candidate trial = engine.trial(pop, 0, kDonors, {}, rng);
    EXPECT_EQ(changed_genes(pop[0].candidate(), trial), kDim);
}

TEST(StrategyEngine, ExponentialWithZeroRateStopsAfterFirstGene) {
    StrategyEngine engine(StrategyDescriptor::parse("DE/rand/1/exp"), 0.5, 0.0);
    const Population pop = ladder_population(6);
    std::mt19937 rng(11);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(changed_genes(pop[0].candidate(), engine.trial(pop, 0, kDonors, {}, rng)), 1u);
    }
}

TEST(StrategyEngine, BestBasedRuleUsesGlobalBest) {
    StrategyEngine engine(StrategyDescriptor::parse("DE/best/1/bin"), 0.5, 1.0, BinomialTargeting::ROTATING);
    const Population pop = ladder_population(6);
    const Candidate best{0.5, 0.5, 0.5, 0.5};
    std::mt19937 rng(2);
    // best + F (r2 - r3) = 0.5 + 0.5 (0.2 - 0.3)
    Candidate trial = engine.trial(pop, 0, kDonors, best, rng);
    for (double g : trial) EXPECT_NEAR(g, 0.45, 1e-12);
}

TEST(StrategyEngine, BestBasedRuleNeedsMatchingBest) {
    StrategyEngine engine(StrategyDescriptor::parse("DE/best/2/bin"), 0.5, 0.9);
    std::mt19937 rng(2);
    EXPECT_THROW(engine.offspring(ladder_population(6), {}, rng), EvolutionError);
}

TEST(StrategyEngine, OutOfRangeGenesAreRedrawnOnAGrid) {
    StrategyEngine engine(StrategyDescriptor::parse("DE/rand/1/bin"), 50.0, 1.0, BinomialTargeting::ROTATING);
    const Population pop = ladder_population(6);
    std::mt19937 rng(9);
    Candidate trial = engine.trial(pop, 0, kDonors, {}, rng);
    for (double g : trial) {
        EXPECT_GE(g, 0.0);
        EXPECT_LE(g, 1.0);
        EXPECT_NEAR(g * 1000.0, std::round(g * 1000.0), 1e-9);
    }
}
