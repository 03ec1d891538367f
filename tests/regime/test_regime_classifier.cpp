/// @file tests/regime/test_regime_classifier.cpp
/// @brief Unit tests for FitWindow and RegimeClassifier.

#include "bmsd/regime.hpp"
#include "bmsd/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace bmsd;

namespace {

/// MSD = c · lag^alpha on lags 0, step, 2·step, … (n points).
MSDCurve power_law(double c, double alpha, std::size_t n, double step = 1.0) {
    MSDCurve curve;
    for (std::size_t i = 0; i < n; ++i) {
        const double lag = step * static_cast<double>(i);
        curve.lag.push_back(lag);
        curve.msd.push_back(i == 0 ? 0.0 : c * std::pow(lag, alpha));
        curve.pairs.push_back(n - i);
    }
    return curve;
}

}  // namespace

// ─── Slope ────────────────────────────────────────────────────────────────────

TEST(Regime_Fit, DiffusiveCurveHasUnitSlope) {
    const double D = 2.5e-11;
    const auto curve = power_law(4.0 * D, 1.0, 200, 1e-4);
    const RegimeClassifier classifier;
    const auto report = classifier.fit(curve);
    EXPECT_NEAR(report.slope, 1.0, 1e-6);
    EXPECT_EQ(report.regime, Regime::Diffusive);
    EXPECT_NEAR(report.generalized_diffusion() / (4.0 * D), 1.0, 1e-6);
    EXPECT_NEAR(report.r_squared, 1.0, 1e-9);
}

TEST(Regime_Fit, BallisticCurveHasSlopeTwo) {
    const auto curve = power_law(3.7, 2.0, 100);
    const auto report = RegimeClassifier{}.fit(curve);
    EXPECT_NEAR(report.slope, 2.0, 1e-6);
    EXPECT_EQ(report.regime, Regime::Ballistic);
}

TEST(Regime_Fit, IntermediateSlope) {
    const auto report = RegimeClassifier{}.fit(power_law(1.0, 1.5, 50));
    EXPECT_NEAR(report.slope, 1.5, 1e-9);
    EXPECT_EQ(report.regime, Regime::Intermediate);
}

TEST(Regime_Fit, ExcludesZeroLagAndZeroMsd) {
    const std::vector<double> lag{0.0, 1.0, 2.0, 3.0, 4.0};
    const std::vector<double> msd{0.0, 1.0, 0.0, 9.0, 16.0};
    const auto report = RegimeClassifier{}.fit(lag, msd);
    EXPECT_EQ(report.points, 3u);
    EXPECT_NEAR(report.slope, 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(report.lag_min, 1.0);
    EXPECT_DOUBLE_EQ(report.lag_max, 4.0);
}

TEST(Regime_Fit, WindowRestrictsPoints) {
    // Ballistic below lag 10, diffusive above.
    MSDCurve curve;
    for (int i = 1; i <= 100; ++i) {
        const double t = i;
        curve.lag.push_back(t);
        curve.msd.push_back(t < 10.0 ? t * t : 10.0 * t);
    }
    const RegimeClassifier classifier;
    const auto early = classifier.fit(curve, FitWindow{.lag_max = 9.0});
    const auto late  = classifier.fit(curve, FitWindow{.lag_min = 20.0});
    EXPECT_NEAR(early.slope, 2.0, 1e-9);
    EXPECT_NEAR(late.slope, 1.0, 1e-9);
    EXPECT_EQ(early.points, 9u);
}

TEST(Regime_Fit, FittedLineReproducesPowerLaw) {
    const auto report = RegimeClassifier{}.fit(power_law(0.5, 2.0, 20));
    EXPECT_NEAR(report.fitted(3.0), 4.5, 1e-9);
}

// ─── Errors ───────────────────────────────────────────────────────────────────

TEST(Regime_Fit, FewerThanTwoPointsThrows) {
    const std::vector<double> lag{0.0, 1.0};
    const std::vector<double> msd{0.0, 1.0};
    EXPECT_THROW((void)RegimeClassifier{}.fit(lag, msd), InsufficientData);
}

TEST(Regime_Fit, RepeatedLagIsRankDeficient) {
    const std::vector<double> lag{1.0, 1.0, 1.0};
    const std::vector<double> msd{1.0, 2.0, 3.0};
    EXPECT_THROW((void)RegimeClassifier{}.fit(lag, msd), InsufficientData);
}

TEST(Regime_Fit, MismatchedLengthsThrow) {
    const std::vector<double> lag{1.0, 2.0, 3.0};
    const std::vector<double> msd{1.0, 2.0};
    EXPECT_THROW((void)RegimeClassifier{}.fit(lag, msd), InvalidParameter);
}

TEST(Regime_Fit, InvertedWindowThrows) {
    EXPECT_THROW((void)RegimeClassifier{}.fit(power_law(1.0, 1.0, 10),
                                              FitWindow{.lag_min = 5.0, .lag_max = 2.0}),
                 InvalidParameter);
}

TEST(Regime_Construct, RejectsNonPositiveTolerance) {
    EXPECT_THROW((void)RegimeClassifier{0.0}, InvalidParameter);
    EXPECT_THROW((void)RegimeClassifier{-0.1}, InvalidParameter);
}

// ─── Classification ───────────────────────────────────────────────────────────

TEST(Regime_Classify, ToleranceBands) {
    const RegimeClassifier classifier(0.1);
    EXPECT_EQ(classifier.classify(1.95), Regime::Ballistic);
    EXPECT_EQ(classifier.classify(1.05), Regime::Diffusive);
    EXPECT_EQ(classifier.classify(1.5), Regime::Intermediate);
    EXPECT_EQ(classifier.classify(0.5), Regime::Intermediate);
    EXPECT_EQ(to_string(Regime::Diffusive), "diffusive");
}

// ─── FitWindow ────────────────────────────────────────────────────────────────

TEST(FitWindow_LeadingDecade, FirstPositiveLagToTenthOfLast) {
    const auto window = FitWindow::leading_decade(power_law(1.0, 1.0, 101));
    ASSERT_TRUE(window.lag_min && window.lag_max);
    EXPECT_DOUBLE_EQ(*window.lag_min, 2.0);
    EXPECT_DOUBLE_EQ(*window.lag_max, 9.0);
}

TEST(FitWindow_LeadingDecade, ExcludesBothEnds) {
    const auto curve  = power_law(1.0, 1.0, 101);
    const auto window = FitWindow::leading_decade(curve);
    EXPECT_FALSE(window.contains(1.0));
    EXPECT_FALSE(window.contains(10.0));
    EXPECT_TRUE(window.contains(5.0));
}

TEST(FitWindow_LeadingDecade, EmptyInteriorFallsBack) {
    // Lags 0..20: no lag lies strictly inside (1, 2).
    const auto window = FitWindow::leading_decade(power_law(1.0, 1.0, 21));
    EXPECT_FALSE(window.lag_min.has_value());
    EXPECT_FALSE(window.lag_max.has_value());
}

TEST(FitWindow_LeadingDecade, ShortCurveUsesEverything) {
    const auto window = FitWindow::leading_decade(power_law(1.0, 1.0, 5));
    EXPECT_FALSE(window.lag_min.has_value());
    EXPECT_FALSE(window.lag_max.has_value());
}

TEST(FitWindow_Contains, OpenBounds) {
    const FitWindow window{.lag_min = 1.0};
    EXPECT_FALSE(window.contains(0.5));
    EXPECT_TRUE(window.contains(1.0));
    EXPECT_TRUE(window.contains(1e9));
}
