/// @file src/trajectory/trajectory_builder.cpp
/// @brief TrajectoryBuilder — step loop and experimental adapter.
///
/// `build` visits the integrator variant once. Inside the visit the step
/// loop is instantiated for the concrete scheme, so neither the regime nor
/// the velocity bookkeeping is re-decided per step.

#include "bmsd/trajectory.hpp"
#include "bmsd/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <utility>
#include <variant>

namespace bmsd {

namespace {

/// Integrate one axis over `noise.size()` steps.
/// `positions` / `velocities` have noise.size() + 1 entries; slot 0 is
/// filled from `start`. `velocities` may be empty when the scheme does not
/// track velocity.
template <typename Integrator>
void integrate_axis(const Integrator&           integrator,
                    AxisState                   start,
                    const std::vector<double>&  noise,
                    std::vector<double>&        positions,
                    std::vector<double>&        velocities) {
    AxisState state = start;
    positions[0] = state.position;
    if constexpr (Integrator::tracks_velocity) {
        velocities[0] = state.velocity;
    }
    for (std::size_t i = 0; i < noise.size(); ++i) {
        state = integrator.step(state, noise[i]);
        positions[i + 1] = state.position;
        if constexpr (Integrator::tracks_velocity) {
            velocities[i + 1] = state.velocity;
        }
    }
}

/// Reject a run that overflowed. The stability policy only relaxes the
/// pre-check on dt; a diverged record is never returned.
void require_finite(const TimeGrid&            grid,
                    char                       axis,
                    const std::vector<double>& positions,
                    const std::vector<double>& velocities) {
    const auto bad = [](double v) { return !std::isfinite(v); };
    auto step = static_cast<std::size_t>(
        std::find_if(positions.begin(), positions.end(), bad) - positions.begin());
    const auto vstep = static_cast<std::size_t>(
        std::find_if(velocities.begin(), velocities.end(), bad) - velocities.begin());
    if (vstep < velocities.size()) {
        step = std::min(step, vstep);
    }
    if (step < positions.size()) {
        throw NumericInstability(fmt::format(
            "integration diverged on the {} axis at step {} (t = {:.4e} s)",
            axis, step, grid.at(step)));
    }
}

}  // namespace

// ─── TrajectoryBuilder ────────────────────────────────────────────────────────

TrajectoryBuilder::TrajectoryBuilder(SimulationConfig config)
    : config_(std::move(config)),
      integrator_(make_integrator(config_)),
      grid_(std::make_shared<const TimeGrid>(config_.grid())) {}

Trajectory TrajectoryBuilder::build(RandomForceGenerator& rng) const {
    const std::size_t steps  = grid_->steps();
    const std::size_t points = grid_->size();

    return std::visit(
        [&](const auto& integrator) {
            using Integrator = std::decay_t<decltype(integrator)>;

            const double variance = integrator.noise_variance();
            const auto noise_x = rng.sample(steps, variance);
            const auto noise_y = rng.sample(steps, variance);

            std::vector<double> x(points), y(points);
            std::vector<double> vx, vy;
            if constexpr (Integrator::tracks_velocity) {
                vx.resize(points);
                vy.resize(points);
            }

            const Vec2& r0 = config_.initial_position;
            integrate_axis(integrator, AxisState{r0.x(), 0.0}, noise_x, x, vx);
            integrate_axis(integrator, AxisState{r0.y(), 0.0}, noise_y, y, vy);
            require_finite(*grid_, 'x', x, vx);
            require_finite(*grid_, 'y', y, vy);

            std::vector<Vec2> positions(points);
            std::vector<Vec2> velocities;
            for (std::size_t i = 0; i < points; ++i) {
                positions[i] = Vec2(x[i], y[i]);
            }
            if constexpr (Integrator::tracks_velocity) {
                velocities.resize(points);
                for (std::size_t i = 0; i < points; ++i) {
                    velocities[i] = Vec2(vx[i], vy[i]);
                }
            }
            return Trajectory(grid_, std::move(positions), std::move(velocities));
        },
        integrator_);
}

// ─── Experimental adapter ─────────────────────────────────────────────────────

Trajectory TrajectoryBuilder::from_samples(std::vector<double>     t,
                                           std::span<const double> x,
                                           std::span<const double> y) {
    if (t.size() != x.size() || t.size() != y.size()) {
        throw MalformedInput(fmt::format(
            "column lengths differ: t={} x={} y={}", t.size(), x.size(), y.size()));
    }

    std::vector<Vec2> positions;
    positions.reserve(x.size());
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            throw MalformedInput(fmt::format("position sample {} is not real-valued", i));
        }
        positions.emplace_back(x[i], y[i]);
    }

    auto grid = std::make_shared<const TimeGrid>(TimeGrid::from_samples(std::move(t)));
    return Trajectory(std::move(grid), std::move(positions));
}

}  // namespace bmsd
