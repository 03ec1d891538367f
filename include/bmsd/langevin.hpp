#pragma once

/// @file include/bmsd/langevin.hpp
/// @brief Langevin integrators for one axis of a Brownian particle.
///
/// # Module: Langevin Integrator
///
/// ## Responsibility
/// Advance (position, velocity) by one timestep given one stochastic
/// increment. Each axis is integrated independently; there are no cross
/// terms between x and y.
///
/// ## Schemes
/// Overdamped (Euler–Maruyama for dx = √(2D) dW):
/// ```
/// x_{i+1} = x_i + η_i,                   η_i ~ N(0, 2 D dt)
/// ```
/// Underdamped (semi-implicit / symplectic Euler):
/// ```
/// v_{i+1} = v_i + (−γ/m · v_i) dt + (F_i/m) dt,   F_i ~ N(0, 2 γ k_BT / dt)
/// x_{i+1} = x_i + v_{i+1} dt
/// ```
///
/// ## Dispatch
/// The two schemes are alternatives of a closed `std::variant`. The caller
/// visits it once per trajectory and runs the whole step loop inside the
/// chosen alternative, so the hot loop never branches on the regime.
///
/// ## Guarantees
/// - `step` is noexcept, allocation-free and deterministic
/// - Construction validates its inputs and throws InvalidParameter

#include "bmsd/parameters.hpp"
#include "bmsd/types.hpp"

#include <variant>

namespace bmsd {

// ─── AxisState ────────────────────────────────────────────────────────────────

/// Phase-space state of one axis.
struct AxisState {
    double position = 0.0;  ///< m
    double velocity = 0.0;  ///< m/s (always 0 for the overdamped scheme)
};

// ─── OverdampedIntegrator ─────────────────────────────────────────────────────

class OverdampedIntegrator {
public:
    static constexpr bool tracks_velocity = false;

    /// # Throws
    /// InvalidParameter if diffusion is negative or non-finite, or dt ≤ 0.
    OverdampedIntegrator(double diffusion, double dt);

    /// Variance of the position increment, 2·D·dt.
    [[nodiscard]] double noise_variance() const noexcept;

    /// x_{i+1} = x_i + increment.
    [[nodiscard]] AxisState step(const AxisState& state,
                                 double increment) const noexcept;

    [[nodiscard]] double dt() const noexcept { return dt_; }
    [[nodiscard]] double diffusion() const noexcept { return diffusion_; }

private:
    double diffusion_;
    double dt_;
};

// ─── UnderdampedIntegrator ────────────────────────────────────────────────────

class UnderdampedIntegrator {
public:
    static constexpr bool tracks_velocity = true;

    /// # Throws
    /// InvalidParameter if mass, friction or dt is non-positive, or the
    /// thermal energy is negative; any non-finite input also throws.
    UnderdampedIntegrator(double mass, double friction,
                          double thermal_energy, double dt);

    /// Variance of the random force, σ_F² = 2·γ·k_BT / dt.
    [[nodiscard]] double noise_variance() const noexcept;

    /// One semi-implicit Euler step driven by random force `force`.
    [[nodiscard]] AxisState step(const AxisState& state,
                                 double force) const noexcept;

    /// Velocity relaxation time m/γ.
    [[nodiscard]] double relaxation_time() const noexcept;

    /// dt / (m/γ).
    [[nodiscard]] double stability_ratio() const noexcept;

    [[nodiscard]] double dt() const noexcept { return dt_; }

private:
    double mass_;
    double friction_;
    double thermal_energy_;
    double dt_;
};

// ─── LangevinIntegrator ───────────────────────────────────────────────────────

/// Closed choice of damping regime, fixed at configuration time.
using LangevinIntegrator = std::variant<OverdampedIntegrator, UnderdampedIntegrator>;

/// Validate `config` and build the integrator for its regime.
///
/// For the underdamped regime the step is checked against the relaxation
/// time: if dt / (m/γ) exceeds MAX_STABLE_DT_FRACTION, StabilityPolicy::Fail
/// throws NumericInstability and StabilityPolicy::Warn prints a warning to
/// stderr and proceeds.
///
/// # Throws
/// InvalidParameter, NumericInstability.
[[nodiscard]] LangevinIntegrator make_integrator(const SimulationConfig& config);

/// The regime an integrator implements.
[[nodiscard]] DampingRegime regime_of(const LangevinIntegrator& integrator) noexcept;

} // namespace bmsd
