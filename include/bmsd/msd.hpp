#pragma once

/// @file include/bmsd/msd.hpp
/// @brief MSDEstimator — mean squared displacement curves.
///
/// # Module: MSD Estimator
///
/// ## Responsibility
/// Turn a position time series into an MSDCurve, or evaluate the analytic
/// MSD of the underdamped Langevin model at requested lag times.
///
/// ## Modes
/// | Mode            | Formula                                              | Use for                    |
/// |-----------------|------------------------------------------------------|----------------------------|
/// | `Direct`        | MSD(t_i) = |r_i − r_0|²                              | fixed-origin simulations   |
/// | `SlidingWindow` | MSD(Δ) = ⟨|r_{i+k} − r_i|²⟩ over pairs with lag ≈ Δ | experimental / any window  |
/// | `Vacf`          | MSD(t) = 2 ∫₀ᵗ (t − τ) C(τ) dτ, empirical C          | uniformly sampled data     |
/// | analytic        | MSD(t) = 2 ∫₀ᵗ (t − τ) C_vv(τ) dτ                   | overlay / validation       |
///
/// The direct mode is valid because a simulated trajectory starts from a
/// known fixed point, not because of any averaging; it is single-trajectory
/// and noisy. The caller chooses the mode: the right one depends on whether
/// the input is a fixed-origin simulation or an arbitrary experimental window.
///
/// ## Analytic VACF
/// For d independent axes C_vv(τ) = d · (k_BT/m) · exp(−γτ/m). The integral
/// is evaluated with the trapezoidal rule, doubling the number of τ
/// sub-intervals until the relative change drops below the tolerance. Limits:
/// ```
/// t ≪ m/γ :  MSD → d · (k_BT/m) · t²     (ballistic)
/// t ≫ m/γ :  MSD → 2 · d · D · t         (diffusive; 4Dt in the plane)
/// ```
///
/// ## Guarantees
/// - Estimated curves start with (0, 0); analytic MSD at lag 0 is 0
/// - Returned MSD values are ≥ 0 for finite input
/// - Non-decreasing only in expectation; a single noisy trajectory is not

#include "bmsd/constants.hpp"
#include "bmsd/parameters.hpp"
#include "bmsd/trajectory.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace bmsd {

// ─── MSDCurve ─────────────────────────────────────────────────────────────────

/// Ordered (lag, MSD) pairs, one per achievable lag.
struct MSDCurve {
    std::vector<double>      lag;    ///< s, non-decreasing, lag[0] = 0
    std::vector<double>      msd;    ///< m², ≥ 0
    std::vector<std::size_t> pairs;  ///< Displacements averaged at each lag (0 = analytic)

    [[nodiscard]] std::size_t size() const noexcept { return lag.size(); }
    [[nodiscard]] bool empty() const noexcept { return lag.empty(); }
};

// ─── Options ──────────────────────────────────────────────────────────────────

enum class EstimatorMode {
    Direct,         ///< Displacement from the first sample, no averaging
    SlidingWindow,  ///< Time average over every pair at each lag
    Vacf,           ///< Finite-difference VACF integrated into an MSD (VacfEstimator)
};

struct SlidingWindowOptions {
    /// Largest lag in grid steps (0 = every achievable lag). On irregular
    /// grids the bound applies to lag bins.
    std::size_t max_lag_steps = 0;

    /// Lag bin width for irregularly sampled data (default: mean spacing).
    std::optional<double> bin_width{};
};

struct AnalyticOptions {
    /// Relative change below which trapezoid refinement stops.
    double tolerance = constants::DEFAULT_VACF_TOLERANCE;

    /// Number of independent axes summed into the MSD.
    int dimensions = constants::DIMENSIONS;
};

// ─── MSDEstimator ─────────────────────────────────────────────────────────────

class MSDEstimator {
public:
    MSDEstimator() = delete;

    /// Direct mode: lag_i = t_i − t_0, MSD_i = |r_i − r_0|².
    ///
    /// # Throws
    /// InsufficientData if the trajectory has fewer than 2 points.
    [[nodiscard]] static MSDCurve direct(const Trajectory& trajectory);

    /// Sliding-window mode.
    ///
    /// On a uniform grid (regular, or explicit with uniform spacing) lag k
    /// averages all N − k pairs (i, i + k) and reports lag k·dt. On an
    /// irregular grid every pair is assigned to the nearest multiple of the
    /// bin width (at least one bin) and the reported lag is the mean actual
    /// lag of the pairs in that bin.
    ///
    /// # Throws
    /// InsufficientData if the trajectory has fewer than 2 points;
    /// InvalidParameter for a non-positive bin width.
    [[nodiscard]] static MSDCurve sliding_window(const Trajectory& trajectory,
                                                 const SlidingWindowOptions& options = {});

    /// Dispatch on `mode` with default options. `Vacf` requires a uniformly
    /// sampled trajectory.
    [[nodiscard]] static MSDCurve estimate(const Trajectory& trajectory,
                                           EstimatorMode mode);

    /// Analytic underdamped MSD at one lag time `t` ≥ 0.
    ///
    /// # Throws
    /// InvalidParameter for invalid physics, t < 0, a non-positive tolerance
    /// or dimensions < 1; NumericInstability if refinement does not converge
    /// within VACF_MAX_SUBSTEPS.
    [[nodiscard]] static double analytic_underdamped(const PhysicalParameters& physics,
                                                     double t,
                                                     const AnalyticOptions& options = {});

    /// Analytic underdamped MSD at every lag in `lags`.
    [[nodiscard]] static MSDCurve analytic_underdamped(const PhysicalParameters& physics,
                                                       std::span<const double> lags,
                                                       const AnalyticOptions& options = {});

    /// Analytic VACF C_vv(τ) = d · (k_BT/m) · exp(−γτ/m).
    [[nodiscard]] static double velocity_autocorrelation(const PhysicalParameters& physics,
                                                         double tau,
                                                         int dimensions = constants::DIMENSIONS) noexcept;

    /// Closed form of the same integral,
    /// 2·d·(k_BT/m)·τ_p²·(t/τ_p − 1 + exp(−t/τ_p)), used as a reference.
    [[nodiscard]] static double closed_form(const PhysicalParameters& physics,
                                            double t,
                                            int dimensions = constants::DIMENSIONS) noexcept;

private:
    static MSDCurve sliding_uniform(const Trajectory& trajectory, double step,
                                    std::size_t max_lag_steps);
    static MSDCurve sliding_binned(const Trajectory& trajectory, double width,
                                   std::size_t max_bins);
};

} // namespace bmsd
