#include <gtest/gtest.h>

#include "evo_optim/archiver.hpp"

using namespace evo_optim;

namespace {

Individual make(double fitness, double gene, bool maximize = false) {
    Individual ind({gene}, maximize);
    ind.set_fitness(fitness);
    return ind;
}

}  // namespace

TEST(GlobalBestArchive, HoldsTheBestIndividual) {
    Population pop{make(3.0, 0.0), make(-2.0, 1.0), make(7.0, 2.0)};
    Population archive = global_best_archive(pop);
    ASSERT_EQ(archive.size(), 1u);
    EXPECT_EQ(archive[0].candidate()[0], 1.0);

    for (auto& ind : pop) ind = make(*ind.fitness(), ind.candidate()[0], true);
    EXPECT_EQ(global_best_archive(pop)[0].candidate()[0], 2.0);
}

TEST(GlobalBestArchive, EmptyPopulation) {
    EXPECT_TRUE(global_best_archive({}).empty());
}

TEST(PersonalBestArchive, FirstCallCopiesPopulation) {
    Population pop{make(3.0, 0.0), make(1.0, 1.0)};
    EXPECT_EQ(personal_best_archive(pop, {}), pop);
}

TEST(PersonalBestArchive, KeepsBetterEntryPerSlot) {
    Population archive{make(1.0, 0.0), make(5.0, 1.0), make(2.0, 2.0)};
    Population pop{make(4.0, 10.0), make(0.5, 11.0), make(2.0, 12.0)};

    Population next = personal_best_archive(pop, archive);
    ASSERT_EQ(next.size(), 3u);
    EXPECT_EQ(next[0].candidate()[0], 0.0);
    EXPECT_EQ(next[1].candidate()[0], 11.0);
    // ties go to the current population
    EXPECT_EQ(next[2].candidate()[0], 12.0);
}
