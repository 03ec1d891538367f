#pragma once

/// @file src/msd/trapezoid.hpp
/// @brief Composite trapezoidal rule with step-halving refinement.
///
/// Internal to src/msd/. Not part of the public API.

#include <cmath>
#include <cstddef>
#include <optional>

namespace bmsd::detail {

/// Composite trapezoid of f over [a, b] with n equal sub-intervals.
template <typename F>
[[nodiscard]] double trapezoid(const F& f, double a, double b, std::size_t n) noexcept {
    const double h = (b - a) / static_cast<double>(n);
    double sum = 0.5 * (f(a) + f(b));
    for (std::size_t i = 1; i < n; ++i) {
        sum += f(a + static_cast<double>(i) * h);
    }
    return sum * h;
}

/// Refine by halving the sub-step until |I_2n − I_n| ≤ rtol·|I_2n|.
///
/// Each refinement reuses the previous estimate and only evaluates the new
/// midpoints. Returns `nullopt` if `max_n` sub-intervals are reached first.
template <typename F>
[[nodiscard]] std::optional<double>
trapezoid_converged(const F& f, double a, double b,
                    std::size_t n0, std::size_t max_n, double rtol) noexcept {
    std::size_t n = n0;
    double coarse = trapezoid(f, a, b, n);
    while (2 * n <= max_n) {
        // I_2n = I_n / 2 + h_2n · Σ f(midpoints of the n intervals)
        const double h = (b - a) / static_cast<double>(n);
        double mid = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            mid += f(a + (static_cast<double>(i) + 0.5) * h);
        }
        const double fine = 0.5 * coarse + 0.5 * h * mid;
        n *= 2;
        if (std::abs(fine - coarse) <= rtol * std::abs(fine)) {
            return fine;
        }
        coarse = fine;
    }
    return std::nullopt;
}

}  // namespace bmsd::detail
