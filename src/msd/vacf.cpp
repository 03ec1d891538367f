/// @file src/msd/vacf.cpp
/// @brief Finite-difference velocities, empirical VACF and VACF → MSD.

#include "bmsd/vacf.hpp"
#include "bmsd/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace bmsd {

// ─── VelocityEstimator ────────────────────────────────────────────────────────

std::vector<Vec2> VelocityEstimator::finite_difference(const Trajectory& trajectory) {
    const std::size_t n = trajectory.size();
    if (n < 2) {
        throw InsufficientData(fmt::format(
            "velocity estimate needs at least 2 samples (got {})", n));
    }

    const auto slope = [&](std::size_t a, std::size_t b) -> Vec2 {
        return (trajectory.position(b) - trajectory.position(a))
             / (trajectory.time(b) - trajectory.time(a));
    };

    std::vector<Vec2> v(n);
    v[0]     = slope(0, 1);
    v[n - 1] = slope(n - 2, n - 1);
    for (std::size_t i = 1; i + 1 < n; ++i) {
        v[i] = slope(i - 1, i + 1);
    }
    return v;
}

// ─── VacfEstimator ────────────────────────────────────────────────────────────

std::vector<double> VacfEstimator::autocorrelation(std::span<const double> v) {
    const std::size_t n = v.size();
    if (n == 0) {
        throw InsufficientData("autocorrelation of an empty series");
    }
    std::vector<double> c(n, 0.0);
    for (std::size_t k = 0; k < n; ++k) {
        double sum = 0.0;
        for (std::size_t i = 0; i + k < n; ++i) {
            sum += v[i] * v[i + k];
        }
        c[k] = sum / static_cast<double>(n - k);
    }
    return c;
}

std::vector<double> VacfEstimator::autocorrelation(std::span<const Vec2> v) {
    const std::size_t n = v.size();
    if (n == 0) {
        throw InsufficientData("autocorrelation of an empty series");
    }
    std::vector<double> c(n, 0.0);
    for (std::size_t k = 0; k < n; ++k) {
        double sum = 0.0;
        for (std::size_t i = 0; i + k < n; ++i) {
            sum += v[i].dot(v[i + k]);
        }
        c[k] = sum / static_cast<double>(n - k);
    }
    return c;
}

MSDCurve VacfEstimator::msd_from_vacf(std::span<const double> vacf, double dt) {
    if (!std::isfinite(dt) || dt <= 0.0) {
        throw InvalidParameter(fmt::format("dt must be finite and > 0 (got {})", dt));
    }
    if (vacf.empty()) {
        throw InsufficientData("MSD from an empty VACF");
    }

    // Trapezoid of ∫₀^{t_k} (t_k − τ) C(τ) dτ on the sample points τ_j = j·dt:
    //   dt · [ k·dt·C_0 / 2 + Σ_{j=1}^{k−1} (k − j)·dt·C_j ]
    // The end point carries weight (t_k − t_k) = 0. Running sums
    // S0 = Σ C_j and S1 = Σ j·C_j over j = 1..k−1 make each lag O(1).
    const std::size_t n = vacf.size();
    MSDCurve curve;
    curve.lag.reserve(n);
    curve.msd.reserve(n);
    curve.pairs.reserve(n);

    double s0 = 0.0;
    double s1 = 0.0;
    for (std::size_t k = 0; k < n; ++k) {
        if (k >= 2) {
            const std::size_t j = k - 1;
            s0 += vacf[j];
            s1 += static_cast<double>(j) * vacf[j];
        }
        const double kd = static_cast<double>(k);
        const double integral =
            dt * dt * (0.5 * kd * vacf[0] + kd * s0 - s1);
        curve.lag.push_back(kd * dt);
        // A noisy empirical VACF can push the integral slightly below zero.
        curve.msd.push_back(std::max(0.0, 2.0 * integral));
        curve.pairs.push_back(n - k);
    }
    return curve;
}

MSDCurve VacfEstimator::msd_from_trajectory(const Trajectory& trajectory) {
    if (trajectory.size() < 2) {
        throw InsufficientData(fmt::format(
            "VACF needs at least 2 samples (got {})", trajectory.size()));
    }
    const auto step = trajectory.grid().uniform_step();
    if (!step) {
        throw MalformedInput("VACF integration requires uniformly sampled times");
    }
    const auto velocities = VelocityEstimator::finite_difference(trajectory);
    return msd_from_vacf(autocorrelation(std::span<const Vec2>(velocities)), *step);
}

}  // namespace bmsd
