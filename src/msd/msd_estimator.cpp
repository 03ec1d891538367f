/// @file src/msd/msd_estimator.cpp
/// @brief MSDEstimator — direct, sliding-window and analytic MSD.

#include "bmsd/msd.hpp"
#include "bmsd/errors.hpp"
#include "bmsd/vacf.hpp"

#include "trapezoid.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace bmsd {

namespace {

void require_points(const Trajectory& trajectory) {
    if (trajectory.size() < 2) {
        throw InsufficientData(fmt::format(
            "MSD needs at least 2 samples (got {})", trajectory.size()));
    }
}

void check_analytic_options(const AnalyticOptions& options) {
    if (!std::isfinite(options.tolerance) || options.tolerance <= 0.0) {
        throw InvalidParameter(fmt::format(
            "VACF integration tolerance must be finite and > 0 (got {})", options.tolerance));
    }
    if (options.dimensions < 1) {
        throw InvalidParameter(fmt::format(
            "dimensions must be >= 1 (got {})", options.dimensions));
    }
}

}  // namespace

// ─── Direct ───────────────────────────────────────────────────────────────────

MSDCurve MSDEstimator::direct(const Trajectory& trajectory) {
    require_points(trajectory);

    const std::size_t n  = trajectory.size();
    const double      t0 = trajectory.time(0);
    const Vec2&       r0 = trajectory.position(0);

    MSDCurve curve;
    curve.lag.reserve(n);
    curve.msd.reserve(n);
    curve.pairs.assign(n, 1);
    for (std::size_t i = 0; i < n; ++i) {
        curve.lag.push_back(trajectory.time(i) - t0);
        curve.msd.push_back((trajectory.position(i) - r0).squaredNorm());
    }
    // Exact zero, independent of the initial position's rounding.
    curve.msd[0] = 0.0;
    return curve;
}

// ─── Sliding window ───────────────────────────────────────────────────────────

MSDCurve MSDEstimator::sliding_window(const Trajectory& trajectory,
                                      const SlidingWindowOptions& options) {
    require_points(trajectory);

    const auto step = trajectory.grid().uniform_step();
    if (step && !options.bin_width) {
        return sliding_uniform(trajectory, *step, options.max_lag_steps);
    }

    const double width = options.bin_width.value_or(trajectory.grid().dt());
    if (!std::isfinite(width) || width <= 0.0) {
        throw InvalidParameter(fmt::format("lag bin width must be finite and > 0 (got {})", width));
    }
    return sliding_binned(trajectory, width, options.max_lag_steps);
}

MSDCurve MSDEstimator::sliding_uniform(const Trajectory& trajectory, double step,
                                       std::size_t max_lag_steps) {
    const std::size_t n = trajectory.size();
    const std::size_t k_max =
        max_lag_steps == 0 ? n - 1 : std::min(max_lag_steps, n - 1);
    const auto r = trajectory.positions();

    MSDCurve curve;
    curve.lag.reserve(k_max + 1);
    curve.msd.reserve(k_max + 1);
    curve.pairs.reserve(k_max + 1);

    curve.lag.push_back(0.0);
    curve.msd.push_back(0.0);
    curve.pairs.push_back(n);

    for (std::size_t k = 1; k <= k_max; ++k) {
        double sum = 0.0;
        for (std::size_t i = 0; i + k < n; ++i) {
            sum += (r[i + k] - r[i]).squaredNorm();
        }
        curve.lag.push_back(static_cast<double>(k) * step);
        curve.msd.push_back(sum / static_cast<double>(n - k));
        curve.pairs.push_back(n - k);
    }
    return curve;
}

MSDCurve MSDEstimator::sliding_binned(const Trajectory& trajectory, double width,
                                      std::size_t max_bins) {
    const std::size_t n = trajectory.size();
    const auto& grid = trajectory.grid();

    std::size_t bins = static_cast<std::size_t>(std::llround(grid.span() / width)) + 1;
    if (max_bins != 0) {
        bins = std::min(bins, max_bins + 1);
    }

    std::vector<double>      sum_sq(bins, 0.0);
    std::vector<double>      sum_lag(bins, 0.0);
    std::vector<std::size_t> count(bins, 0);

    for (std::size_t i = 0; i + 1 < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            const double lag = grid.at(j) - grid.at(i);
            // Positive lags never share bin 0 with the zero lag.
            const auto bin = std::max<std::size_t>(
                1, static_cast<std::size_t>(std::llround(lag / width)));
            if (bin >= bins) {
                // Lags grow with j for fixed i.
                break;
            }
            sum_sq[bin]  += (trajectory.position(j) - trajectory.position(i)).squaredNorm();
            sum_lag[bin] += lag;
            ++count[bin];
        }
    }

    MSDCurve curve;
    curve.lag.push_back(0.0);
    curve.msd.push_back(0.0);
    curve.pairs.push_back(n);
    for (std::size_t b = 1; b < bins; ++b) {
        if (count[b] == 0) {
            continue;
        }
        const double c = static_cast<double>(count[b]);
        curve.lag.push_back(sum_lag[b] / c);
        curve.msd.push_back(sum_sq[b] / c);
        curve.pairs.push_back(count[b]);
    }
    return curve;
}

MSDCurve MSDEstimator::estimate(const Trajectory& trajectory, EstimatorMode mode) {
    switch (mode) {
        case EstimatorMode::Direct:        return direct(trajectory);
        case EstimatorMode::SlidingWindow: return sliding_window(trajectory);
        case EstimatorMode::Vacf:          return VacfEstimator::msd_from_trajectory(trajectory);
    }
    throw InvalidParameter("unsupported estimator mode");
}

// ─── Analytic underdamped ─────────────────────────────────────────────────────

double MSDEstimator::velocity_autocorrelation(const PhysicalParameters& physics,
                                              double tau,
                                              int dimensions) noexcept {
    return static_cast<double>(dimensions) * physics.thermal_energy() / physics.mass
         * std::exp(-tau / physics.relaxation_time());
}

double MSDEstimator::closed_form(const PhysicalParameters& physics,
                                 double t,
                                 int dimensions) noexcept {
    const double tau_p = physics.relaxation_time();
    const double c0    = static_cast<double>(dimensions) * physics.thermal_energy() / physics.mass;
    const double x     = t / tau_p;
    // x − 1 + e^{−x} without cancellation at small x.
    return 2.0 * c0 * tau_p * tau_p * (x + std::expm1(-x));
}

double MSDEstimator::analytic_underdamped(const PhysicalParameters& physics,
                                          double t,
                                          const AnalyticOptions& options) {
    physics.validate();
    check_analytic_options(options);
    if (!std::isfinite(t) || t < 0.0) {
        throw InvalidParameter(fmt::format("lag time must be finite and >= 0 (got {})", t));
    }
    if (t == 0.0) {
        return 0.0;
    }

    const int d = options.dimensions;
    const auto integrand = [&](double tau) {
        return (t - tau) * velocity_autocorrelation(physics, tau, d);
    };

    const auto integral = detail::trapezoid_converged(
        integrand, 0.0, t,
        constants::VACF_INITIAL_SUBSTEPS, constants::VACF_MAX_SUBSTEPS,
        options.tolerance);
    if (!integral) {
        throw NumericInstability(fmt::format(
            "VACF integral at t = {:.3e} s did not converge to {} within {} sub-steps",
            t, options.tolerance, constants::VACF_MAX_SUBSTEPS));
    }
    return 2.0 * *integral;
}

MSDCurve MSDEstimator::analytic_underdamped(const PhysicalParameters& physics,
                                            std::span<const double> lags,
                                            const AnalyticOptions& options) {
    MSDCurve curve;
    curve.lag.reserve(lags.size());
    curve.msd.reserve(lags.size());
    curve.pairs.assign(lags.size(), 0);
    for (double t : lags) {
        curve.lag.push_back(t);
        curve.msd.push_back(analytic_underdamped(physics, t, options));
    }
    return curve;
}

}  // namespace bmsd
