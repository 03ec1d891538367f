/**
 * @file  prop_power_law_slope.cpp
 * @brief Property: ∀ c > 0, α ∈ [0.2, 2.5]: fitting MSD = c·lag^α recovers α
 *        and log10(c) to 1e-6.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_power_law_slope
 *
 * Basis:
 *   log10(c·t^α) = log10 c + α·log10 t is exactly linear, so least squares
 *   must reproduce the coefficients up to rounding, whatever the lag spacing.
 */

#include <rapidcheck.h>

#include <cmath>
#include <vector>

#include "bmsd/regime.hpp"

using namespace bmsd;

int main() {
    rc::check(
        "power_law_slope: exact power laws fit exactly",
        [](int alpha_raw, int exp_raw, int n_raw) {
            const double alpha = 0.2 + 0.001 * static_cast<double>(std::abs(alpha_raw % 2301));
            const double c     = std::pow(10.0, static_cast<double>(exp_raw % 20) - 10.0);
            const std::size_t n = 3 + static_cast<std::size_t>(std::abs(n_raw % 500));

            MSDCurve curve;
            for (std::size_t i = 0; i < n; ++i) {
                const double lag = 1e-6 * static_cast<double>(i);
                curve.lag.push_back(lag);
                curve.msd.push_back(i == 0 ? 0.0 : c * std::pow(lag, alpha));
            }

            const auto report = RegimeClassifier{}.fit(curve);
            RC_ASSERT(std::abs(report.slope - alpha) < 1e-6);
            RC_ASSERT(std::abs(report.intercept - std::log10(c)) < 1e-6);
            RC_ASSERT(report.points == n - 1);
        }
    );

    return 0;
}
