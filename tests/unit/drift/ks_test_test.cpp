/// @file ks_test_test.cpp
/// @brief Tests for the two-sample Kolmogorov-Smirnov test

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "drift/ks_test.h"
#include "test_helpers.h"

namespace driftscope::drift {
namespace {

using driftscope::testing::NormalSample;
using driftscope::testing::RepeatedOneToFive;

TEST(KsTest, IdenticalSamplesHaveZeroStatistic) {
    auto sample = NormalSample(500, 0.0, 1.0, 7);

    auto result = KolmogorovSmirnovTest(sample, sample);

    EXPECT_DOUBLE_EQ(result.statistic, 0.0);
    EXPECT_NEAR(result.p_value, 1.0, 1e-12);
}

TEST(KsTest, TiedValuesAcrossSamplesDoNotCreateGap) {
    auto sample = RepeatedOneToFive(20);

    auto result = KolmogorovSmirnovTest(sample, sample);

    EXPECT_DOUBLE_EQ(result.statistic, 0.0);
    EXPECT_NEAR(result.p_value, 1.0, 1e-12);
}

TEST(KsTest, SameValuesInDifferentOrder) {
    std::vector<double> a = {5.0, 1.0, 3.0, 2.0, 4.0};
    std::vector<double> b = {1.0, 2.0, 3.0, 4.0, 5.0};

    EXPECT_DOUBLE_EQ(KolmogorovSmirnovStatistic(a, b), 0.0);
}

TEST(KsTest, SeparatedNormalsAreDetected) {
    auto reference = NormalSample(1000, 0.0, 1.0, 42);
    auto production = NormalSample(1000, 5.0, 1.0, 43);

    auto result = KolmogorovSmirnovTest(reference, production);

    EXPECT_GT(result.statistic, 0.8);
    EXPECT_LT(result.p_value, 1e-10);
}

TEST(KsTest, DisjointSupportsGiveStatisticOne) {
    std::vector<double> a = {1.0, 2.0, 3.0};
    std::vector<double> b = {10.0, 11.0, 12.0, 13.0};

    EXPECT_DOUBLE_EQ(KolmogorovSmirnovStatistic(a, b), 1.0);
}

TEST(KsTest, KnownSmallExample) {
    // F1 jumps at 1,2,3,4; F2 at 3,4,5,6. Largest gap is at x = 2: 0.5 - 0
    std::vector<double> a = {1.0, 2.0, 3.0, 4.0};
    std::vector<double> b = {3.0, 4.0, 5.0, 6.0};

    EXPECT_DOUBLE_EQ(KolmogorovSmirnovStatistic(a, b), 0.5);
}

TEST(KsTest, UnequalSampleSizes) {
    std::vector<double> a = {0.0, 0.0, 1.0, 1.0};
    std::vector<double> b = {0.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0};

    // F1(0) = 0.5, F2(0) = 0.125
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovStatistic(a, b), 0.375);
}

TEST(KsTest, StatisticIsSymmetric) {
    auto a = NormalSample(300, 0.0, 1.0, 1);
    auto b = NormalSample(200, 0.3, 1.2, 2);

    EXPECT_DOUBLE_EQ(KolmogorovSmirnovStatistic(a, b), KolmogorovSmirnovStatistic(b, a));
}

TEST(KsTest, EmptySampleYieldsNeutralResult) {
    std::vector<double> empty;
    std::vector<double> values = {1.0, 2.0};

    auto result = KolmogorovSmirnovTest(empty, values);
    EXPECT_DOUBLE_EQ(result.statistic, 0.0);
    EXPECT_DOUBLE_EQ(result.p_value, 1.0);
}

TEST(KsTest, KolmogorovSurvivalKnownValues) {
    EXPECT_DOUBLE_EQ(KolmogorovSurvival(0.0), 1.0);
    // Q(1.36) is the classic 5% critical value
    EXPECT_NEAR(KolmogorovSurvival(1.36), 0.0494, 5e-4);
    EXPECT_NEAR(KolmogorovSurvival(1.0), 0.2700, 5e-4);
    EXPECT_LT(KolmogorovSurvival(5.0), 1e-20);
}

TEST(KsTest, KolmogorovSurvivalIsMonotone) {
    double previous = 1.0;
    for (double lambda = 0.0; lambda <= 3.0; lambda += 0.05) {
        const double q = KolmogorovSurvival(lambda);
        EXPECT_LE(q, previous + 1e-12) << "lambda=" << lambda;
        EXPECT_GE(q, 0.0);
        EXPECT_LE(q, 1.0);
        previous = q;
    }
}

TEST(KsTest, PValueUsesEffectiveSampleSize) {
    // n_eff = 100*100/200 = 50, sqrt = 7.0711; lambda = (7.0711+0.12+0.0156)*0.2
    const double expected = KolmogorovSurvival((std::sqrt(50.0) + 0.12 + 0.11 / std::sqrt(50.0)) * 0.2);
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovPValue(0.2, 100, 100), expected);
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovPValue(0.0, 100, 100), 1.0);
    EXPECT_DOUBLE_EQ(KolmogorovSmirnovPValue(0.5, 0, 100), 1.0);
}

TEST(KsTest, PValueShrinksWithSampleSize) {
    EXPECT_GT(KolmogorovSmirnovPValue(0.1, 50, 50), KolmogorovSmirnovPValue(0.1, 500, 500));
}

}  // namespace
}  // namespace driftscope::drift
