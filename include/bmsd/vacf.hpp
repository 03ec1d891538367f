#pragma once

/// @file include/bmsd/vacf.hpp
/// @brief Velocity and VACF estimation from sampled positions.
///
/// # Module: VACF
///
/// ## Responsibility
/// The experimental counterpart of the analytic VACF route: estimate
/// velocities from sampled positions, form the empirical velocity
/// autocorrelation, and integrate it into an MSD curve.
///
/// ## Formulas
/// ```
/// v_0     = (r_1 − r_0) / (t_1 − t_0)
/// v_i     = (r_{i+1} − r_{i−1}) / (t_{i+1} − t_{i−1})      interior
/// v_{N−1} = (r_{N−1} − r_{N−2}) / (t_{N−1} − t_{N−2})
///
/// C(k)    = 1/(N−k) Σ_i v_i · v_{i+k}
///
/// MSD(t_k) = 2 ∫₀^{t_k} (t_k − τ) C(τ) dτ     trapezoidal, uniform dt
/// ```

#include "bmsd/msd.hpp"
#include "bmsd/trajectory.hpp"
#include "bmsd/types.hpp"

#include <span>
#include <vector>

namespace bmsd {

class VelocityEstimator {
public:
    VelocityEstimator() = delete;

    /// Finite-difference velocities, one per sample, on any grid.
    ///
    /// # Throws
    /// InsufficientData if the trajectory has fewer than 2 points.
    [[nodiscard]] static std::vector<Vec2> finite_difference(const Trajectory& trajectory);
};

class VacfEstimator {
public:
    VacfEstimator() = delete;

    /// Autocorrelation of a scalar series; result has the series' length.
    ///
    /// # Throws
    /// InsufficientData on an empty series.
    [[nodiscard]] static std::vector<double> autocorrelation(std::span<const double> v);

    /// Autocorrelation of a planar series using the dot product.
    [[nodiscard]] static std::vector<double> autocorrelation(std::span<const Vec2> v);

    /// Integrate a VACF sampled every `dt` into an MSD curve of equal length.
    ///
    /// # Throws
    /// InvalidParameter if dt is non-positive; InsufficientData if `vacf`
    /// is empty.
    [[nodiscard]] static MSDCurve msd_from_vacf(std::span<const double> vacf, double dt);

    /// Velocity → VACF → MSD in one call.
    ///
    /// # Throws
    /// MalformedInput if the trajectory is not uniformly sampled;
    /// InsufficientData if it has fewer than 2 points.
    [[nodiscard]] static MSDCurve msd_from_trajectory(const Trajectory& trajectory);
};

} // namespace bmsd
