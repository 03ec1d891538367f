/// @file src/regime/regime_classifier.cpp
/// @brief Ordinary least squares on log10(MSD) vs log10(lag).

#include "bmsd/regime.hpp"
#include "bmsd/errors.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <vector>

namespace bmsd {

std::string_view to_string(Regime regime) noexcept {
    switch (regime) {
        case Regime::Ballistic:    return "ballistic";
        case Regime::Diffusive:    return "diffusive";
        case Regime::Intermediate: return "intermediate";
    }
    return "unknown";
}

// ─── FitWindow ────────────────────────────────────────────────────────────────

FitWindow FitWindow::leading_decade(const MSDCurve& curve) noexcept {
    const auto first = std::find_if(curve.lag.begin(), curve.lag.end(),
                                    [](double lag) { return lag > 0.0; });
    if (first == curve.lag.end()) {
        return FitWindow{};
    }
    const double t1 = *first;
    const double hi = curve.lag.back() * constants::DEFAULT_FIT_MAX_FRACTION;

    // Open interval (t1, hi): both the first lag and the cut-off are excluded.
    std::optional<double> lo_in, hi_in;
    std::size_t inside = 0;
    for (double lag : curve.lag) {
        if (lag > t1 && lag < hi) {
            if (!lo_in) lo_in = lag;
            hi_in = lag;
            ++inside;
        }
    }
    // Too short a curve falls back to all of it.
    if (inside < constants::MIN_FIT_POINTS) {
        return FitWindow{};
    }
    return FitWindow{.lag_min = lo_in, .lag_max = hi_in};
}

bool FitWindow::contains(double lag) const noexcept {
    if (lag_min && lag < *lag_min) return false;
    if (lag_max && lag > *lag_max) return false;
    return true;
}

// ─── RegimeReport ─────────────────────────────────────────────────────────────

double RegimeReport::generalized_diffusion() const noexcept {
    return std::pow(10.0, intercept);
}

double RegimeReport::fitted(double lag) const noexcept {
    return std::pow(10.0, intercept + slope * std::log10(lag));
}

std::string RegimeReport::to_string() const {
    return fmt::format(
        "slope={:.4f}  intercept={:.4f}  R2={:.5f}  points={}  lags=[{:.3e}, {:.3e}] s  regime={}",
        slope, intercept, r_squared, points, lag_min, lag_max, bmsd::to_string(regime));
}

// ─── RegimeClassifier ─────────────────────────────────────────────────────────

RegimeClassifier::RegimeClassifier(double tolerance)
    : tolerance_(tolerance) {
    if (!std::isfinite(tolerance) || tolerance <= 0.0) {
        throw InvalidParameter(fmt::format(
            "regime tolerance must be finite and > 0 (got {})", tolerance));
    }
}

Regime RegimeClassifier::classify(double slope) const noexcept {
    if (std::abs(slope - constants::BALLISTIC_SLOPE) <= tolerance_) return Regime::Ballistic;
    if (std::abs(slope - constants::DIFFUSIVE_SLOPE) <= tolerance_) return Regime::Diffusive;
    return Regime::Intermediate;
}

RegimeReport RegimeClassifier::fit(const MSDCurve& curve, const FitWindow& window) const {
    return fit(curve.lag, curve.msd, window);
}

RegimeReport RegimeClassifier::fit(std::span<const double> lag,
                                   std::span<const double> msd,
                                   const FitWindow& window) const {
    if (lag.size() != msd.size()) {
        throw InvalidParameter(fmt::format(
            "lag and MSD lengths differ ({} vs {})", lag.size(), msd.size()));
    }
    if (window.lag_min && window.lag_max && *window.lag_min > *window.lag_max) {
        throw InvalidParameter(fmt::format(
            "fit window is inverted: [{}, {}]", *window.lag_min, *window.lag_max));
    }

    // ── Filter to points whose logarithms exist ───────────────────────────────
    std::vector<double> log_lag;
    std::vector<double> log_msd;
    double lo = 0.0;
    double hi = 0.0;
    for (std::size_t i = 0; i < lag.size(); ++i) {
        const double t = lag[i];
        const double m = msd[i];
        if (!std::isfinite(t) || !std::isfinite(m) || t <= 0.0 || m <= 0.0) continue;
        if (!window.contains(t)) continue;
        if (log_lag.empty()) {
            lo = t;
            hi = t;
        }
        lo = std::min(lo, t);
        hi = std::max(hi, t);
        log_lag.push_back(std::log10(t));
        log_msd.push_back(std::log10(m));
    }

    const std::size_t n = log_lag.size();
    if (n < constants::MIN_FIT_POINTS) {
        throw InsufficientData(fmt::format(
            "log-log fit needs at least {} points with positive lag and MSD (got {})",
            constants::MIN_FIT_POINTS, n));
    }

    // ── Least squares: [log_lag 1] · [slope intercept]ᵀ = log_msd ─────────────
    Eigen::MatrixX2d design(static_cast<Eigen::Index>(n), 2);
    Eigen::VectorXd  rhs(static_cast<Eigen::Index>(n));
    for (std::size_t i = 0; i < n; ++i) {
        const auto row = static_cast<Eigen::Index>(i);
        design(row, 0) = log_lag[i];
        design(row, 1) = 1.0;
        rhs(row)       = log_msd[i];
    }

    const Eigen::ColPivHouseholderQR<Eigen::MatrixX2d> qr(design);
    if (qr.rank() < 2) {
        throw InsufficientData("log-log fit needs at least 2 distinct lags");
    }
    const Eigen::Vector2d coef = qr.solve(rhs);

    const Eigen::VectorXd residual = rhs - design * coef;
    const double ss_res = residual.squaredNorm();
    const double ss_tot = (rhs.array() - rhs.mean()).matrix().squaredNorm();
    const double r2     = ss_tot > 0.0 ? 1.0 - ss_res / ss_tot : 1.0;

    return RegimeReport{
        .slope     = coef(0),
        .intercept = coef(1),
        .r_squared = r2,
        .points    = n,
        .lag_min   = lo,
        .lag_max   = hi,
        .regime    = classify(coef(0)),
    };
}

}  // namespace bmsd
