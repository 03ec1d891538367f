#pragma once

/// @file include/bmsd/trajectory.hpp
/// @brief Trajectory container and the builder that fills it.
///
/// # Module: Trajectory Builder
///
/// ## Responsibility
/// Run a LangevinIntegrator over every step of a regular TimeGrid, once per
/// axis with independent noise, and assemble the resulting planar positions
/// (and velocities, for the underdamped scheme) into a Trajectory. The
/// alternate entry point `from_samples` adapts an experimental (t, x, y)
/// series into the same representation without integrating anything.
///
/// ## Ownership
/// A Trajectory is produced once and is immutable afterwards. It shares
/// ownership of the TimeGrid it was sampled on, so downstream estimators can
/// tell regular simulation grids from irregular experimental sampling.
///
/// ## Guarantees
/// - Simulated trajectories have exactly steps + 1 points
/// - Point 0 is the configured initial position with zero velocity
/// - Either a complete Trajectory is returned or an exception is thrown

#include "bmsd/langevin.hpp"
#include "bmsd/parameters.hpp"
#include "bmsd/random_force.hpp"
#include "bmsd/types.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

namespace bmsd {

// ─── Trajectory ───────────────────────────────────────────────────────────────

class Trajectory {
public:
    /// # Throws
    /// MalformedInput if `grid` is null, positions do not match the grid
    /// size, or velocities are non-empty and do not match either.
    Trajectory(std::shared_ptr<const TimeGrid> grid,
               std::vector<Vec2>               positions,
               std::vector<Vec2>               velocities = {});

    [[nodiscard]] std::size_t size() const noexcept { return positions_.size(); }

    [[nodiscard]] const TimeGrid& grid() const noexcept { return *grid_; }
    [[nodiscard]] std::shared_ptr<const TimeGrid> shared_grid() const noexcept { return grid_; }

    [[nodiscard]] double time(std::size_t i) const noexcept { return grid_->at(i); }
    [[nodiscard]] const Vec2& position(std::size_t i) const noexcept { return positions_[i]; }
    [[nodiscard]] std::span<const Vec2> positions() const noexcept { return positions_; }

    /// True for trajectories produced by the underdamped integrator.
    [[nodiscard]] bool has_velocity() const noexcept { return !velocities_.empty(); }

    /// Precondition: has_velocity() and i < size().
    [[nodiscard]] const Vec2& velocity(std::size_t i) const noexcept { return velocities_[i]; }
    [[nodiscard]] std::span<const Vec2> velocities() const noexcept { return velocities_; }

    /// Component series, index 0 = x, 1 = y.
    [[nodiscard]] std::vector<double> axis(int component) const;

private:
    std::shared_ptr<const TimeGrid> grid_;
    std::vector<Vec2>               positions_;
    std::vector<Vec2>               velocities_;
};

// ─── TrajectoryBuilder ────────────────────────────────────────────────────────

class TrajectoryBuilder {
public:
    /// Validate `config` eagerly and prepare its integrator and grid.
    ///
    /// # Throws
    /// InvalidParameter, NumericInstability (see make_integrator).
    explicit TrajectoryBuilder(SimulationConfig config);

    /// Integrate a full trajectory, consuming noise from `rng`: all x-axis
    /// increments are drawn first, then all y-axis increments.
    ///
    /// # Throws
    /// NumericInstability if any position or velocity is not finite, under
    /// either stability policy.
    [[nodiscard]] Trajectory build(RandomForceGenerator& rng) const;

    /// Adapt an experimental series into a Trajectory on an explicit grid.
    ///
    /// # Throws
    /// MalformedInput if the columns differ in length, are empty, contain a
    /// non-finite value, or the time column is not strictly increasing.
    [[nodiscard]] static Trajectory from_samples(std::vector<double> t,
                                                 std::span<const double> x,
                                                 std::span<const double> y);

    [[nodiscard]] const SimulationConfig&   config() const noexcept { return config_; }
    [[nodiscard]] const LangevinIntegrator& integrator() const noexcept { return integrator_; }
    [[nodiscard]] const TimeGrid&           grid() const noexcept { return *grid_; }

private:
    SimulationConfig                config_;
    LangevinIntegrator              integrator_;
    std::shared_ptr<const TimeGrid> grid_;
};

} // namespace bmsd
