#pragma once

/// @file include/bmsd/types.hpp
/// @brief Shared primitive types for the bmsd Brownian-motion MSD toolkit.
///
/// Every module includes this file. It defines the planar vector alias used
/// for positions and velocities, and the small closed enumerations that
/// select behaviour at configuration time.

#include <Eigen/Dense>

#include <optional>
#include <string_view>

namespace bmsd {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// A planar vector: position (m) or velocity (m/s), components [x, y].
using Vec2 = Eigen::Vector2d;

// ─── Damping Regime ───────────────────────────────────────────────────────────

/// Which Langevin equation the integrator discretises.
enum class DampingRegime {
    Overdamped,   ///< Position only: dx = √(2D) dW
    Underdamped,  ///< Position and velocity: m dv = −γ v dt + F dt
};

/// Human-readable name: "overdamped" / "underdamped".
[[nodiscard]] std::string_view to_string(DampingRegime regime) noexcept;

/// Parse a regime selector.
///
/// Accepts "overdamped" / "underdamped" (any case), and a yes/no answer to
/// "use underdamped Langevin?" ("y"/"yes" → Underdamped, "n"/"no" →
/// Overdamped).
///
/// # Returns
/// `nullopt` for any other text.
[[nodiscard]] std::optional<DampingRegime>
parse_damping_regime(std::string_view text) noexcept;

// ─── Stability Policy ─────────────────────────────────────────────────────────

/// What to do when dt is too coarse for the underdamped relaxation time.
enum class StabilityPolicy {
    Fail,  ///< Throw NumericInstability before integrating
    Warn,  ///< Print a warning to stderr and integrate anyway
};

} // namespace bmsd
