/// @file tests/msd/test_msd_estimator.cpp
/// @brief Unit tests for MSDEstimator: direct, sliding-window and analytic.

#include "bmsd/msd.hpp"
#include "bmsd/constants.hpp"
#include "bmsd/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace bmsd;

namespace {

/// Straight-line motion r(t) = (vx·t, vy·t) sampled at `times`.
Trajectory linear_motion(std::vector<double> times, double vx, double vy = 0.0) {
    std::vector<double> x, y;
    for (double t : times) {
        x.push_back(vx * t);
        y.push_back(vy * t);
    }
    return TrajectoryBuilder::from_samples(std::move(times), x, y);
}

std::vector<double> uniform_times(std::size_t n, double dt) {
    std::vector<double> t(n);
    for (std::size_t i = 0; i < n; ++i) t[i] = static_cast<double>(i) * dt;
    return t;
}

PhysicalParameters nanoparticle() {
    return PhysicalParameters{.mass = 1e-20, .radius = 5e-9};
}

}  // namespace

// ─── Direct ───────────────────────────────────────────────────────────────────

TEST(MSD_Direct, LagZeroIsZero) {
    const auto curve = MSDEstimator::direct(linear_motion(uniform_times(5, 0.5), 2.0, 1.0));
    ASSERT_EQ(curve.size(), 5u);
    EXPECT_EQ(curve.lag[0], 0.0);
    EXPECT_EQ(curve.msd[0], 0.0);
}

TEST(MSD_Direct, SquaredDisplacementFromFirstSample) {
    const auto curve = MSDEstimator::direct(linear_motion({1.0, 2.0, 4.0}, 3.0, 4.0));
    // Offsets from t0 = 1: Δt = 1, 3; |Δr| = 5Δt.
    EXPECT_DOUBLE_EQ(curve.lag[1], 1.0);
    EXPECT_DOUBLE_EQ(curve.lag[2], 3.0);
    EXPECT_DOUBLE_EQ(curve.msd[1], 25.0);
    EXPECT_DOUBLE_EQ(curve.msd[2], 225.0);
}

TEST(MSD_Direct, FewerThanTwoPointsThrows) {
    const auto single = TrajectoryBuilder::from_samples({0.0}, std::vector<double>{0.0},
                                                        std::vector<double>{0.0});
    EXPECT_THROW((void)MSDEstimator::direct(single), InsufficientData);
    EXPECT_THROW((void)MSDEstimator::sliding_window(single), InsufficientData);
}

TEST(MSD_Direct, NonNegativeOnSimulatedPath) {
    SimulationConfig cfg;
    cfg.physics  = nanoparticle();
    cfg.dt       = 1e-6;
    cfg.duration = 1e-3;
    RandomForceGenerator rng(42);
    const auto curve = MSDEstimator::direct(TrajectoryBuilder(cfg).build(rng));
    for (double m : curve.msd) {
        EXPECT_GE(m, 0.0);
    }
}

// ─── Sliding window ───────────────────────────────────────────────────────────

TEST(MSD_Sliding, UniformGridAveragesAllPairs) {
    const auto curve = MSDEstimator::sliding_window(linear_motion(uniform_times(6, 0.1), 1.0));
    ASSERT_EQ(curve.size(), 6u);
    for (std::size_t k = 0; k < curve.size(); ++k) {
        const double lag = 0.1 * static_cast<double>(k);
        EXPECT_NEAR(curve.lag[k], lag, 1e-15);
        EXPECT_NEAR(curve.msd[k], lag * lag, 1e-14);
        EXPECT_EQ(curve.pairs[k], k == 0 ? 6u : 6u - k);
    }
}

TEST(MSD_Sliding, AveragesOverStartingPoints) {
    // Lag 1 always moves by 1; lag 2 moves by 0, 0, 2.
    const std::vector<double> x{0.0, 1.0, 0.0, 1.0, 2.0};
    const std::vector<double> y(5, 0.0);
    const auto traj = TrajectoryBuilder::from_samples(uniform_times(5, 1.0), x, y);
    const auto curve = MSDEstimator::sliding_window(traj);
    EXPECT_DOUBLE_EQ(curve.msd[1], 1.0);
    EXPECT_DOUBLE_EQ(curve.msd[2], 4.0 / 3.0);
}

TEST(MSD_Sliding, MaxLagStepsTruncates) {
    const auto curve = MSDEstimator::sliding_window(
        linear_motion(uniform_times(50, 1.0), 1.0), SlidingWindowOptions{.max_lag_steps = 10});
    EXPECT_EQ(curve.size(), 11u);
    EXPECT_DOUBLE_EQ(curve.lag.back(), 10.0);
}

TEST(MSD_Sliding, IrregularGridIsBinnedByMeanStep) {
    // Mean step 4/3. Pair lags: 1, 3, 4, 2, 3, 1 → bins 1, 2, 3, 2, 2, 1.
    const auto curve = MSDEstimator::sliding_window(linear_motion({0.0, 1.0, 3.0, 4.0}, 1.0));
    ASSERT_EQ(curve.size(), 4u);
    EXPECT_DOUBLE_EQ(curve.lag[1], 1.0);
    EXPECT_DOUBLE_EQ(curve.lag[2], 8.0 / 3.0);
    EXPECT_DOUBLE_EQ(curve.lag[3], 4.0);
    EXPECT_DOUBLE_EQ(curve.msd[1], 1.0);
    EXPECT_DOUBLE_EQ(curve.msd[2], 22.0 / 3.0);
    EXPECT_DOUBLE_EQ(curve.msd[3], 16.0);
    EXPECT_EQ(curve.pairs[1], 2u);
    EXPECT_EQ(curve.pairs[2], 3u);
    EXPECT_EQ(curve.pairs[3], 1u);
}

TEST(MSD_Sliding, RejectsNonPositiveBinWidth) {
    EXPECT_THROW((void)MSDEstimator::sliding_window(
                     linear_motion({0.0, 1.0, 3.0}, 1.0),
                     SlidingWindowOptions{.bin_width = 0.0}),
                 InvalidParameter);
}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

TEST(MSD_Estimate, DispatchesOnMode) {
    const auto traj = linear_motion(uniform_times(8, 0.5), 1.0);
    EXPECT_EQ(MSDEstimator::estimate(traj, EstimatorMode::Direct).pairs[3], 1u);
    EXPECT_EQ(MSDEstimator::estimate(traj, EstimatorMode::SlidingWindow).pairs[3], 5u);
    EXPECT_NEAR(MSDEstimator::estimate(traj, EstimatorMode::Vacf).msd[4], 4.0, 1e-12);
}

TEST(MSD_Estimate, VacfModeRejectsIrregularGrid) {
    EXPECT_THROW((void)MSDEstimator::estimate(linear_motion({0.0, 1.0, 3.0}, 1.0),
                                              EstimatorMode::Vacf),
                 MalformedInput);
}

// ─── Analytic underdamped ─────────────────────────────────────────────────────

TEST(MSD_Analytic, ZeroAtLagZero) {
    EXPECT_EQ(MSDEstimator::analytic_underdamped(nanoparticle(), 0.0), 0.0);
}

TEST(MSD_Analytic, DiffusiveLimitIsFourDt) {
    const auto p = nanoparticle();
    const double t = 1000.0 * p.relaxation_time();
    const double msd = MSDEstimator::analytic_underdamped(p, t);
    EXPECT_NEAR(msd / (4.0 * p.diffusion() * t), 1.0, 0.05);
}

TEST(MSD_Analytic, BallisticLimitPerAxis) {
    const auto p = nanoparticle();
    const double t = 1e-3 * p.relaxation_time();
    const double kT_m = p.thermal_energy() / p.mass;

    const double one_axis = MSDEstimator::analytic_underdamped(
        p, t, AnalyticOptions{.dimensions = 1});
    EXPECT_NEAR(one_axis / (kT_m * t * t), 1.0, 0.01);

    const double plane = MSDEstimator::analytic_underdamped(p, t);
    EXPECT_NEAR(plane / (2.0 * kT_m * t * t), 1.0, 0.01);
}

TEST(MSD_Analytic, MatchesClosedFormWithinTolerance) {
    const auto p = nanoparticle();
    for (double x : {0.1, 1.0, 10.0, 100.0}) {
        const double t = x * p.relaxation_time();
        const double numeric = MSDEstimator::analytic_underdamped(p, t);
        EXPECT_NEAR(numeric / MSDEstimator::closed_form(p, t), 1.0, 0.01) << "t/tau = " << x;
    }
}

TEST(MSD_Analytic, TighterToleranceConverges) {
    const auto p = nanoparticle();
    const double t = 5.0 * p.relaxation_time();
    const double exact = MSDEstimator::closed_form(p, t);
    const double coarse = MSDEstimator::analytic_underdamped(p, t, AnalyticOptions{.tolerance = 1e-2});
    const double fine   = MSDEstimator::analytic_underdamped(p, t, AnalyticOptions{.tolerance = 1e-8});
    EXPECT_LE(std::abs(fine - exact), std::abs(coarse - exact));
    EXPECT_NEAR(fine / exact, 1.0, 1e-6);
}

TEST(MSD_Analytic, CurveOverLags) {
    const auto p = nanoparticle();
    const std::vector<double> lags{0.0, 1e-11, 1e-10, 1e-9};
    const auto curve = MSDEstimator::analytic_underdamped(p, lags);
    ASSERT_EQ(curve.size(), 4u);
    EXPECT_EQ(curve.msd[0], 0.0);
    for (std::size_t i = 1; i < curve.size(); ++i) {
        EXPECT_GT(curve.msd[i], curve.msd[i - 1]);
        EXPECT_EQ(curve.pairs[i], 0u);
    }
}

TEST(MSD_Analytic, RejectsBadArguments) {
    const auto p = nanoparticle();
    EXPECT_THROW((void)MSDEstimator::analytic_underdamped(p, -1.0), InvalidParameter);
    EXPECT_THROW((void)MSDEstimator::analytic_underdamped(p, 1e-9, AnalyticOptions{.tolerance = 0.0}),
                 InvalidParameter);
    EXPECT_THROW((void)MSDEstimator::analytic_underdamped(p, 1e-9, AnalyticOptions{.dimensions = 0}),
                 InvalidParameter);
    auto bad = p;
    bad.mass = 0.0;
    EXPECT_THROW((void)MSDEstimator::analytic_underdamped(bad, 1e-9), InvalidParameter);
}

TEST(MSD_Analytic, VelocityAutocorrelationDecays) {
    const auto p = nanoparticle();
    const double c0 = MSDEstimator::velocity_autocorrelation(p, 0.0);
    EXPECT_NEAR(c0 / (2.0 * p.thermal_energy() / p.mass), 1.0, 1e-12);
    EXPECT_NEAR(MSDEstimator::velocity_autocorrelation(p, p.relaxation_time()) / c0,
                std::exp(-1.0), 1e-12);
}
