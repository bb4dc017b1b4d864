#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>

#include "evo_optim/exceptions.hpp"
#include "evo_optim/individual.hpp"

using namespace evo_optim;

namespace {

Individual make(double fitness, bool maximize) {
    Individual ind({fitness}, maximize);
    ind.set_fitness(fitness);
    return ind;
}

}  // namespace

TEST(Individual, LessMeansBetterWhenMaximizing) {
    Individual a = make(5.0, true);
    Individual b = make(3.0, true);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_TRUE(b > a);
    EXPECT_TRUE(a <= b);
    EXPECT_TRUE(b >= a);
}

TEST(Individual, LessMeansBetterWhenMinimizing) {
    Individual a = make(5.0, false);
    Individual b = make(3.0, false);
    EXPECT_TRUE(b < a);
    EXPECT_FALSE(a < b);
}

TEST(Individual, EqualFitnessIsNeitherBetter) {
    Individual a = make(2.0, false);
    Individual b = make(2.0, false);
    EXPECT_FALSE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_TRUE(a <= b);
    EXPECT_TRUE(a >= b);
}

TEST(Individual, ComparingWithoutFitnessThrows) {
    Individual a({1.0}, false);
    Individual b = make(1.0, false);
    EXPECT_THROW((void)(a < b), ComparisonError);
    EXPECT_THROW((void)(b < a), ComparisonError);
}

TEST(Individual, SortingPutsBestFirst) {
    Population pop{make(3.0, false), make(-1.0, false), make(7.0, false), make(0.5, false)};
    std::sort(pop.begin(), pop.end());
    EXPECT_DOUBLE_EQ(*pop.front().fitness(), -1.0);
    EXPECT_DOUBLE_EQ(*pop.back().fitness(), 7.0);
}

TEST(Individual, NewCandidateInvalidatesEvaluation) {
    Individual ind = make(4.0, true);
    ind.set_responses({{"r1", 1.0}});
    ind.set_candidate({1.0, 2.0});
    EXPECT_FALSE(ind.has_fitness());
    EXPECT_TRUE(ind.responses().empty());
    EXPECT_EQ(ind.candidate(), (Candidate{1.0, 2.0}));
}

TEST(Individual, EqualityUsesCandidateAndFitness) {
    Individual a = make(1.0, true);
    Individual b = make(1.0, true);
    EXPECT_EQ(a, b);
    b.set_fitness(2.0);
    EXPECT_NE(a, b);
}

TEST(Individual, PrintsUnsetFitnessAsUndefined) {
    Individual ind({0.5, 0.25}, true);
    std::ostringstream out;
    out << ind;
    EXPECT_EQ(out.str(), "[0.5, 0.25] : undefined");
}
