/// @file src/physics/parameters.cpp
/// @brief PhysicalParameters, TimeGrid and SimulationConfig.

#include "bmsd/parameters.hpp"
#include "bmsd/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace bmsd {

namespace {

void require_positive(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidParameter(fmt::format("{} must be finite and > 0 (got {})", name, value));
    }
}

}  // namespace

// ─── PhysicalParameters ───────────────────────────────────────────────────────

void PhysicalParameters::validate() const {
    require_positive(mass,      "mass");
    require_positive(radius,    "radius");
    require_positive(viscosity, "viscosity");
    if (!std::isfinite(temperature) || temperature < 0.0) {
        throw InvalidParameter(
            fmt::format("temperature must be finite and >= 0 (got {})", temperature));
    }
}

double PhysicalParameters::friction() const noexcept {
    return 6.0 * constants::PI * viscosity * radius;
}

double PhysicalParameters::thermal_energy() const noexcept {
    return constants::BOLTZMANN * temperature;
}

double PhysicalParameters::diffusion() const noexcept {
    return thermal_energy() / friction();
}

double PhysicalParameters::relaxation_time() const noexcept {
    return mass / friction();
}

// ─── TimeGrid ─────────────────────────────────────────────────────────────────

TimeGrid::TimeGrid(Kind kind, double dt, std::size_t steps, std::vector<double> samples)
    : kind_(kind), dt_(dt), steps_(steps), samples_(std::move(samples)) {}

TimeGrid TimeGrid::regular(double dt, double duration) {
    require_positive(dt,       "dt");
    require_positive(duration, "duration");

    // Absorb rounding so that e.g. 1e-5 / 1e-9 counts 10000 steps, not 9999.
    const double ratio = duration / dt;
    const double steps = std::floor(ratio * (1.0 + 4.0 * constants::FLOAT_EPSILON));
    if (steps < 1.0) {
        throw InvalidParameter(
            fmt::format("duration {} is shorter than one step of dt {}", duration, dt));
    }
    if (steps > static_cast<double>(constants::MAX_GRID_STEPS)) {
        throw InvalidParameter(
            fmt::format("duration/dt = {:.3e} steps exceeds the limit of {}",
                        steps, constants::MAX_GRID_STEPS));
    }
    return TimeGrid(Kind::Regular, dt, static_cast<std::size_t>(steps), {});
}

TimeGrid TimeGrid::from_samples(std::vector<double> times) {
    if (times.empty()) {
        throw MalformedInput("time column is empty");
    }
    for (std::size_t i = 0; i < times.size(); ++i) {
        if (!std::isfinite(times[i])) {
            throw MalformedInput(fmt::format("time sample {} is not finite", i));
        }
        if (i > 0 && times[i] <= times[i - 1]) {
            throw MalformedInput(fmt::format(
                "time column is not strictly increasing at sample {} ({} after {})",
                i, times[i], times[i - 1]));
        }
    }
    const std::size_t steps = times.size() - 1;
    const double mean_dt =
        steps == 0 ? 0.0 : (times.back() - times.front()) / static_cast<double>(steps);
    return TimeGrid(Kind::Explicit, mean_dt, steps, std::move(times));
}

std::size_t TimeGrid::size() const noexcept {
    return steps_ + 1;
}

double TimeGrid::at(std::size_t i) const noexcept {
    if (kind_ == Kind::Regular) {
        return static_cast<double>(i) * dt_;
    }
    return samples_[i];
}

double TimeGrid::dt() const noexcept {
    return dt_;
}

double TimeGrid::span() const noexcept {
    if (kind_ == Kind::Regular) {
        return static_cast<double>(steps_) * dt_;
    }
    return samples_.back() - samples_.front();
}

std::optional<double> TimeGrid::uniform_step() const noexcept {
    if (kind_ == Kind::Regular) {
        return dt_;
    }
    if (steps_ == 0) {
        return std::nullopt;
    }
    const double tol = constants::UNIFORM_GRID_RTOL * dt_;
    for (std::size_t i = 1; i < samples_.size(); ++i) {
        if (std::abs((samples_[i] - samples_[i - 1]) - dt_) > tol) {
            return std::nullopt;
        }
    }
    return dt_;
}

std::vector<double> TimeGrid::times() const {
    if (kind_ == Kind::Explicit) {
        return samples_;
    }
    std::vector<double> out(size());
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = at(i);
    }
    return out;
}

// ─── SimulationConfig ─────────────────────────────────────────────────────────

void SimulationConfig::validate() const {
    physics.validate();
    require_positive(dt,       "dt");
    require_positive(duration, "duration");
    if (!initial_position.allFinite()) {
        throw InvalidParameter("initial position must be finite");
    }
}

TimeGrid SimulationConfig::grid() const {
    return TimeGrid::regular(dt, duration);
}

double SimulationConfig::stability_ratio() const noexcept {
    return dt / physics.relaxation_time();
}

}  // namespace bmsd
