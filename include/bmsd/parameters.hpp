#pragma once

/// @file include/bmsd/parameters.hpp
/// @brief Physical parameters, time grids and the simulation configuration.
///
/// # Module: Parameters
///
/// ## Responsibility
/// Hold every input of a run in one place, derive the Stokes friction,
/// thermal energy and diffusion coefficient, and validate eagerly so that
/// no integration starts from an invalid configuration.
///
/// ## Derived Quantities
/// ```
/// γ   = 6 π η a          Stokes drag (kg/s)
/// k_BT                   thermal energy (J)
/// D   = k_BT / γ         diffusion coefficient (m²/s)
/// τ_p = m / γ            velocity relaxation time (s)
/// ```
///
/// ## Guarantees
/// - `validate()` throws InvalidParameter naming the offending field
/// - Derived-quantity accessors are noexcept and assume a validated object

#include "bmsd/constants.hpp"
#include "bmsd/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace bmsd {

// ─── PhysicalParameters ───────────────────────────────────────────────────────

/// The particle and the medium it diffuses in.
struct PhysicalParameters {
    double mass        = 0.0;                            ///< kg, > 0
    double radius      = 0.0;                            ///< m, > 0
    double temperature = constants::DEFAULT_TEMPERATURE; ///< K, ≥ 0 (0 = noiseless)
    double viscosity   = constants::DEFAULT_VISCOSITY;   ///< Pa·s, > 0

    /// Throw InvalidParameter unless mass, radius, viscosity are finite and
    /// positive and temperature is finite and non-negative.
    void validate() const;

    /// Stokes friction coefficient γ = 6πηa.
    [[nodiscard]] double friction() const noexcept;

    /// Thermal energy k_B·T.
    [[nodiscard]] double thermal_energy() const noexcept;

    /// Stokes–Einstein diffusion coefficient D = k_BT/γ.
    [[nodiscard]] double diffusion() const noexcept;

    /// Velocity relaxation time m/γ.
    [[nodiscard]] double relaxation_time() const noexcept;
};

// ─── TimeGrid ─────────────────────────────────────────────────────────────────

/// Sample times of a trajectory.
///
/// A regular grid is defined by dt and a total duration and yields
/// N = floor(duration/dt) steps, i.e. N + 1 points t_i = i·dt starting at 0.
/// An explicit grid holds the strictly increasing times of an experimental
/// trace, which need not start at zero nor be uniformly spaced.
class TimeGrid {
public:
    enum class Kind { Regular, Explicit };

    /// Build a regular grid.
    ///
    /// # Throws
    /// InvalidParameter if dt or duration is non-positive or non-finite, if
    /// the duration is shorter than one step, or if the step count exceeds
    /// MAX_GRID_STEPS.
    [[nodiscard]] static TimeGrid regular(double dt, double duration);

    /// Build an explicit grid from sample times.
    ///
    /// # Throws
    /// MalformedInput if `times` is empty, contains a non-finite value, or is
    /// not strictly increasing.
    [[nodiscard]] static TimeGrid from_samples(std::vector<double> times);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_regular() const noexcept { return kind_ == Kind::Regular; }

    /// Number of sample points (steps + 1).
    [[nodiscard]] std::size_t size() const noexcept;

    /// Number of steps between the first and the last sample.
    [[nodiscard]] std::size_t steps() const noexcept { return size() - 1; }

    /// Time of sample `i`. Precondition: i < size().
    [[nodiscard]] double at(std::size_t i) const noexcept;

    /// Step size: dt for a regular grid, mean spacing for an explicit one
    /// (0 for a single-sample explicit grid).
    [[nodiscard]] double dt() const noexcept;

    /// Time spanned from the first to the last sample.
    [[nodiscard]] double span() const noexcept;

    /// The common step if every spacing matches the mean within
    /// UNIFORM_GRID_RTOL; always the dt of a regular grid.
    [[nodiscard]] std::optional<double> uniform_step() const noexcept;

    /// Materialised sample times.
    [[nodiscard]] std::vector<double> times() const;

private:
    TimeGrid(Kind kind, double dt, std::size_t steps, std::vector<double> samples);

    Kind                kind_;
    double              dt_;
    std::size_t         steps_;
    std::vector<double> samples_;  ///< Empty for a regular grid
};

// ─── SimulationConfig ─────────────────────────────────────────────────────────

/// Every input of one simulated run, constructed once at the boundary.
struct SimulationConfig {
    PhysicalParameters physics{};

    double dt       = 0.0;  ///< Integration step (s), > 0
    double duration = 0.0;  ///< Total simulated time (s), > 0

    DampingRegime regime = DampingRegime::Overdamped;

    /// Starting position. Velocity always starts at zero.
    Vec2 initial_position = Vec2::Zero();

    /// Fixed seed for reproducible runs; `nullopt` draws one from system
    /// entropy so repeated runs differ.
    std::optional<std::uint64_t> seed{};

    StabilityPolicy stability = StabilityPolicy::Fail;

    /// Validate physics, dt, duration and the initial position.
    ///
    /// # Throws
    /// InvalidParameter on the first invalid field.
    void validate() const;

    /// The regular grid implied by dt and duration.
    [[nodiscard]] TimeGrid grid() const;

    /// dt / (m/γ): how coarse the step is relative to velocity relaxation.
    [[nodiscard]] double stability_ratio() const noexcept;
};

} // namespace bmsd
