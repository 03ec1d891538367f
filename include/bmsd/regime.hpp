#pragma once

/// @file include/bmsd/regime.hpp
/// @brief RegimeClassifier — log-log slope of an MSD curve.
///
/// # Module: Regime Classifier
///
/// ## Responsibility
/// Fit log10(MSD) = slope · log10(lag) + intercept by ordinary least squares
/// over a caller-chosen lag window and name the diffusive regime the slope
/// corresponds to.
///
/// ## Classification
/// ```
/// |slope − 2| ≤ tol  →  Ballistic     (MSD ∝ t², inertia dominated)
/// |slope − 1| ≤ tol  →  Diffusive     (MSD ∝ t,  friction dominated)
/// otherwise          →  Intermediate
/// ```
///
/// ## Edge Cases
/// - Points with lag ≤ 0, MSD ≤ 0 or any non-finite value are dropped,
///   since their logarithm is undefined
/// - Fewer than 2 remaining points, or all remaining lags equal, throws
///   InsufficientData

#include "bmsd/constants.hpp"
#include "bmsd/msd.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace bmsd {

enum class Regime { Ballistic, Diffusive, Intermediate };

[[nodiscard]] std::string_view to_string(Regime regime) noexcept;

// ─── FitWindow ────────────────────────────────────────────────────────────────

/// Inclusive lag bounds of the fit; an absent bound is open.
struct FitWindow {
    std::optional<double> lag_min{};
    std::optional<double> lag_max{};

    /// Lags strictly between the first positive lag and
    /// DEFAULT_FIT_MAX_FRACTION of the last lag, falling back to the whole
    /// curve when fewer than MIN_FIT_POINTS lags fall inside.
    [[nodiscard]] static FitWindow leading_decade(const MSDCurve& curve) noexcept;

    [[nodiscard]] bool contains(double lag) const noexcept;
};

// ─── RegimeReport ─────────────────────────────────────────────────────────────

struct RegimeReport {
    double      slope;      ///< d log10(MSD) / d log10(lag)
    double      intercept;  ///< log10(MSD) at lag = 1 s
    double      r_squared;  ///< Coefficient of determination in log space
    std::size_t points;     ///< Points that entered the fit
    double      lag_min;    ///< Smallest lag used (s)
    double      lag_max;    ///< Largest lag used (s)
    Regime      regime;

    /// Generalised diffusion coefficient K = 10^intercept, i.e.
    /// MSD ≈ K · lag^slope (m²/s^slope).
    [[nodiscard]] double generalized_diffusion() const noexcept;

    /// Fitted MSD at `lag`.
    [[nodiscard]] double fitted(double lag) const noexcept;

    [[nodiscard]] std::string to_string() const;
};

// ─── RegimeClassifier ─────────────────────────────────────────────────────────

class RegimeClassifier {
public:
    /// # Throws
    /// InvalidParameter unless tolerance is finite and positive.
    explicit RegimeClassifier(double tolerance = constants::DEFAULT_REGIME_TOLERANCE);

    /// Fit a curve over `window`.
    ///
    /// # Throws
    /// InvalidParameter if lag_min > lag_max; InsufficientData as above.
    [[nodiscard]] RegimeReport fit(const MSDCurve& curve,
                                   const FitWindow& window = {}) const;

    /// Fit parallel lag / MSD sequences over `window`.
    ///
    /// # Throws
    /// InvalidParameter if the sequences differ in length or the window is
    /// inverted; InsufficientData as above.
    [[nodiscard]] RegimeReport fit(std::span<const double> lag,
                                   std::span<const double> msd,
                                   const FitWindow& window = {}) const;

    /// Name the regime of a slope.
    [[nodiscard]] Regime classify(double slope) const noexcept;

    [[nodiscard]] double tolerance() const noexcept { return tolerance_; }

private:
    double tolerance_;
};

} // namespace bmsd
