#include <gtest/gtest.h>

#include "evo_optim/bounder.hpp"
#include "evo_optim/exceptions.hpp"

using namespace evo_optim;

TEST(Bounder, ClampsIntoScalarBounds) {
    Bounder bounder(0.0, 1.0);
    Candidate c = bounder({0.2, -0.1, 0.76, 1.3, 0.4});
    EXPECT_EQ(c, (Candidate{0.2, 0.0, 0.76, 1.0, 0.4}));
}

TEST(Bounder, PerDimensionBounds) {
    Bounder bounder(std::vector<double>{0.0, -1.0, 2.0}, std::vector<double>{1.0, 0.0, 3.0});
    EXPECT_EQ(bounder({5.0, 5.0, 5.0}), (Candidate{1.0, 0.0, 3.0}));
    EXPECT_EQ(bounder({-5.0, -5.0, -5.0}), (Candidate{0.0, -1.0, 2.0}));
}

TEST(Bounder, ShortExplicitBoundLeavesTrailingGenes) {
    Bounder bounder(std::vector<double>{0.0}, std::vector<double>{1.0});
    EXPECT_EQ(bounder({2.0, 2.0, -2.0}), (Candidate{1.0, 2.0, -2.0}));
}

TEST(Bounder, MissingSideLeavesCandidateUnchanged) {
    const Candidate c{-10.0, 0.5, 10.0};
    EXPECT_EQ(Bounder()(c), c);
    EXPECT_EQ(Bounder(std::nullopt, 1.0)(c), c);
    EXPECT_EQ(Bounder(0.0, std::nullopt)(c), c);

    EXPECT_FALSE(Bounder().is_bounded());
    EXPECT_TRUE(Bounder().lower_bound(3).empty());
    EXPECT_TRUE(Bounder(0.0, 1.0).is_bounded());
    EXPECT_EQ(Bounder(0.0, 1.0).upper_bound(2), (std::vector<double>{1.0, 1.0}));
}

TEST(DiscreteBounder, SnapsToNearestLegalValue) {
    DiscreteBounder bounder({1, 4, 8, 16});
    Candidate c = bounder({6, 10, 13, 3, 4, 0, 1, 12, 2});
    EXPECT_EQ(c, (Candidate{4, 8, 16, 4, 4, 1, 1, 8, 1}));
}

TEST(DiscreteBounder, TiesGoToFirstListedValue) {
    DiscreteBounder bounder({8, 4});
    EXPECT_EQ(bounder({6}), (Candidate{8}));
}

TEST(DiscreteBounder, ReportsRangeOfValues) {
    DiscreteBounder bounder({4, 1, 16, 8});
    EXPECT_EQ(bounder.lower_bound(2), (std::vector<double>{1, 1}));
    EXPECT_EQ(bounder.upper_bound(2), (std::vector<double>{16, 16}));
}

TEST(DiscreteBounder, RejectsEmptyValueSet) {
    EXPECT_THROW(DiscreteBounder(std::vector<double>{}), ConfigurationError);
}
