#pragma once

#include <cstddef>

/// @file include/bmsd/constants.hpp
/// @brief Physical constants, simulation defaults and numerical tolerances.

namespace bmsd::constants {

// ─── Physical Constants ───────────────────────────────────────────────────────

/// Boltzmann constant k_B in J/K (exact, SI 2019).
static constexpr double BOLTZMANN = 1.380649e-23;

/// π to double precision.
static constexpr double PI = 3.14159265358979323846;

// ─── Medium Defaults ──────────────────────────────────────────────────────────

/// Room temperature in kelvin. Overridable through PhysicalParameters.
static constexpr double DEFAULT_TEMPERATURE = 298.15;

/// Dynamic viscosity of water in Pa·s. Overridable through PhysicalParameters.
static constexpr double DEFAULT_VISCOSITY = 1e-3;

/// Spatial dimensions of every trajectory (x and y, integrated independently).
static constexpr int DIMENSIONS = 2;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Largest dt / (m/γ) ratio accepted for the underdamped integrator before the
/// stability policy is applied. Explicit Euler on the velocity decays only
/// while γ·dt/m < 2; a tenth keeps the relaxation resolved.
static constexpr double MAX_STABLE_DT_FRACTION = 0.1;

/// Relative tolerance used to decide whether an explicit time column is
/// uniformly sampled.
static constexpr double UNIFORM_GRID_RTOL = 1e-6;

// ─── Analytic MSD Integration ─────────────────────────────────────────────────

/// Default convergence tolerance: halving the τ sub-step changes the integral
/// by less than this relative amount.
static constexpr double DEFAULT_VACF_TOLERANCE = 0.01;

/// Initial number of trapezoid sub-intervals over [0, t].
static constexpr std::size_t VACF_INITIAL_SUBSTEPS = 16;

/// Upper bound on trapezoid sub-intervals before convergence is declared failed.
static constexpr std::size_t VACF_MAX_SUBSTEPS = std::size_t{1} << 22;

// ─── Grid Limits ──────────────────────────────────────────────────────────────

/// Largest number of integration steps a regular grid may request. Guards
/// against duration/dt typos that would exhaust memory.
static constexpr std::size_t MAX_GRID_STEPS = 100'000'000;

// ─── Regime Classification ────────────────────────────────────────────────────

/// Slope exponent of the ballistic regime (MSD ∝ t²).
static constexpr double BALLISTIC_SLOPE = 2.0;

/// Slope exponent of the diffusive regime (MSD ∝ t).
static constexpr double DIFFUSIVE_SLOPE = 1.0;

/// Default half-width of the slope band that counts as "≈ 1" or "≈ 2".
static constexpr double DEFAULT_REGIME_TOLERANCE = 0.1;

/// Minimum number of (positive lag, positive MSD) points for a log-log fit.
static constexpr std::size_t MIN_FIT_POINTS = 2;

/// Default upper fit bound as a fraction of the final lag.
static constexpr double DEFAULT_FIT_MAX_FRACTION = 0.1;

} // namespace bmsd::constants
