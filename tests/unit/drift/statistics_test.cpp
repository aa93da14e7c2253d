/// @file statistics_test.cpp
/// @brief Tests for distribution functions and order statistics

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "drift/statistics.h"

namespace sentinel::drift::stats {
namespace {

TEST(SortedPercentileTest, LinearInterpolation) {
    const std::vector<double> values = {1.0, 2.0, 3.0, 4.0};

    EXPECT_DOUBLE_EQ(SortedPercentile(values, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(SortedPercentile(values, 0.5), 2.5);
    EXPECT_DOUBLE_EQ(SortedPercentile(values, 1.0), 4.0);
    EXPECT_DOUBLE_EQ(SortedPercentile({1.0, 2.0, 3.0, 4.0, 5.0}, 0.1), 1.4);
}

TEST(SortedPercentileTest, SingleValue) {
    EXPECT_DOUBLE_EQ(SortedPercentile({10.0}, 0.3), 10.0);
}

TEST(SortedPercentileTest, EqualNeighboursAreExact) {
    const std::vector<double> values = {0.1, 0.1, 0.1, 0.7};
    EXPECT_EQ(SortedPercentile(values, 0.6), 0.1);
}

TEST(KolmogorovSmirnovTest, IdenticalSamples) {
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovStatistic({1, 2, 3}, {3, 2, 1}), 0.0);
}

TEST(KolmogorovSmirnovTest, DisjointSamples) {
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovStatistic({1, 2, 3}, {4, 5, 6}), 1.0);
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovStatistic({4, 5, 6}, {1, 2, 3}), 1.0);
}

TEST(KolmogorovSmirnovTest, TiesAreSteppedTogether) {
    // F1 jumps to 1 at x=1; F2 is 0.5 there
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovStatistic({1, 1, 1, 1}, {1, 1, 2, 2}), 0.5);
}

TEST(KolmogorovSmirnovTest, PartialOverlap) {
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovStatistic({1, 2, 3, 4}, {3, 4, 5, 6}), 0.5);
}

TEST(KolmogorovSmirnovTest, EmptySample) {
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovStatistic({}, {1.0}), 0.0);
}

TEST(KolmogorovSmirnovTest, ExactPValueKnownValues) {
    // Complete separation of n=m=5: 2 / C(10, 5)
    EXPECT_NEAR(KolmogorovSmirnovExactPValue(1.0, 5, 5), 2.0 / 252.0, 1e-12);
    // n=m=3: 2 / C(6, 3)
    EXPECT_NEAR(KolmogorovSmirnovExactPValue(1.0, 3, 3), 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovExactPValue(0.0, 5, 5), 1.0);
}

TEST(KolmogorovSmirnovTest, ExactPValueIsSymmetricInSizes) {
    EXPECT_NEAR(KolmogorovSmirnovExactPValue(0.5, 4, 6),
                KolmogorovSmirnovExactPValue(0.5, 6, 4), 1e-15);
}

TEST(KolmogorovSmirnovTest, ExactPValueMonotoneInStatistic) {
    double previous = 1.0;
    for (double d = 0.1; d <= 1.0; d += 0.1) {
        const double p = KolmogorovSmirnovExactPValue(d, 20, 30);
        EXPECT_LE(p, previous + 1e-12) << "d=" << d;
        previous = p;
    }
}

TEST(KolmogorovSurvivalTest, KnownValues) {
    EXPECT_DOUBLE_EQ(KolmogorovSurvival(0.0), 1.0);
    EXPECT_NEAR(KolmogorovSurvival(0.5), 0.9639, 1e-4);
    EXPECT_NEAR(KolmogorovSurvival(1.0), 0.2700, 1e-4);
    EXPECT_NEAR(KolmogorovSurvival(1.3581), 0.05, 1e-4);
    EXPECT_NEAR(KolmogorovSurvival(1.6276), 0.01, 1e-4);
    EXPECT_LT(KolmogorovSurvival(5.0), 1e-20);
}

TEST(KolmogorovSurvivalTest, ContinuousAcrossBranches) {
    EXPECT_NEAR(KolmogorovSurvival(1.18 - 1e-9), KolmogorovSurvival(1.18 + 1e-9), 1e-6);
}

TEST(KolmogorovSmirnovTest, PValueDispatch) {
    // Small samples take the exact path
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovPValue(1.0, 5, 5), KolmogorovSmirnovExactPValue(1.0, 5, 5));
    // The exact path is chosen by the larger sample size, not the product
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovPValue(0.05, 1000, 1000),
                     KolmogorovSmirnovExactPValue(0.05, 1000, 1000));
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovPValue(0.5, 3, kKsExactMaxSampleSize),
                     KolmogorovSmirnovExactPValue(0.5, 3, kKsExactMaxSampleSize));
    // Beyond it the asymptotic path takes over
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovPValue(0.5, 3, kKsExactMaxSampleSize + 1),
                     KolmogorovSmirnovAsymptoticPValue(0.5, 3, kKsExactMaxSampleSize + 1));
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovPValue(0.3, 0, 10), 1.0);
}

TEST(KolmogorovSmirnovTest, ExactPValueStaysAProbabilityForLargeSamples) {
    const double p = KolmogorovSmirnovExactPValue(0.05, 1000, 1000);
    EXPECT_GT(p, 0.0);
    EXPECT_LT(p, 1.0);
    EXPECT_NEAR(p, KolmogorovSmirnovAsymptoticPValue(0.05, 1000, 1000), 0.01);
}

TEST(KolmogorovSmirnovTest, AsymptoticCloseToExactForModerateSamples) {
    const double exact = KolmogorovSmirnovExactPValue(0.2, 100, 100);
    const double asymptotic = KolmogorovSmirnovAsymptoticPValue(0.2, 100, 100);
    EXPECT_NEAR(exact, asymptotic, 0.01);
}

TEST(GammaTest, RegularizedGammaQ) {
    // Q(1, x) = exp(-x)
    EXPECT_NEAR(RegularizedGammaQ(1.0, 0.5), std::exp(-0.5), 1e-12);
    EXPECT_NEAR(RegularizedGammaQ(1.0, 5.0), std::exp(-5.0), 1e-12);
    EXPECT_DOUBLE_EQ(RegularizedGammaQ(2.0, 0.0), 1.0);
    // Q(2, x) = (1 + x) exp(-x)
    EXPECT_NEAR(RegularizedGammaQ(2.0, 3.0), 4.0 * std::exp(-3.0), 1e-12);
}

TEST(GammaTest, ChiSquaredSurvival) {
    EXPECT_NEAR(ChiSquaredSurvival(3.841458820694124, 1), 0.05, 1e-9);
    EXPECT_NEAR(ChiSquaredSurvival(5.991464547107979, 2), 0.05, 1e-9);
    EXPECT_NEAR(ChiSquaredSurvival(20.0, 2), std::exp(-10.0), 1e-12);
    EXPECT_NEAR(ChiSquaredSurvival(18.307038053275146, 10), 0.05, 1e-9);
    EXPECT_DOUBLE_EQ(ChiSquaredSurvival(0.0, 3), 1.0);
    EXPECT_DOUBLE_EQ(ChiSquaredSurvival(4.0, 0), 1.0);
}

TEST(GammaTest, ChiSquaredSurvivalLargeStatistic) {
    const double p = ChiSquaredSurvival(500.0, 3);
    EXPECT_GE(p, 0.0);
    EXPECT_LT(p, 1e-100);
}

}  // namespace
}  // namespace sentinel::drift::stats
