/// @file src/integrator/langevin_integrator.cpp
/// @brief Overdamped and underdamped Langevin steppers.

#include "bmsd/langevin.hpp"
#include "bmsd/constants.hpp"
#include "bmsd/errors.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cmath>

namespace bmsd {

namespace {

void require_positive(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidParameter(fmt::format("{} must be finite and > 0 (got {})", name, value));
    }
}

void require_non_negative(double value, const char* name) {
    if (!std::isfinite(value) || value < 0.0) {
        throw InvalidParameter(fmt::format("{} must be finite and >= 0 (got {})", name, value));
    }
}

}  // namespace

// ─── OverdampedIntegrator ─────────────────────────────────────────────────────

OverdampedIntegrator::OverdampedIntegrator(double diffusion, double dt)
    : diffusion_(diffusion), dt_(dt) {
    require_non_negative(diffusion, "diffusion coefficient");
    require_positive(dt, "dt");
}

double OverdampedIntegrator::noise_variance() const noexcept {
    return 2.0 * diffusion_ * dt_;
}

AxisState OverdampedIntegrator::step(const AxisState& state,
                                     double increment) const noexcept {
    return AxisState{
        .position = state.position + increment,
        .velocity = 0.0,
    };
}

// ─── UnderdampedIntegrator ────────────────────────────────────────────────────

UnderdampedIntegrator::UnderdampedIntegrator(double mass, double friction,
                                             double thermal_energy, double dt)
    : mass_(mass), friction_(friction), thermal_energy_(thermal_energy), dt_(dt) {
    require_positive(mass, "mass");
    require_positive(friction, "friction");
    require_non_negative(thermal_energy, "thermal energy");
    require_positive(dt, "dt");
}

double UnderdampedIntegrator::noise_variance() const noexcept {
    // Fluctuation-dissipation at this discretisation: ⟨F_i F_j⟩ = 2γk_BT/dt δ_ij.
    return 2.0 * friction_ * thermal_energy_ / dt_;
}

AxisState UnderdampedIntegrator::step(const AxisState& state,
                                      double force) const noexcept {
    const double drag = -friction_ / mass_ * state.velocity;
    const double v    = state.velocity + drag * dt_ + (force / mass_) * dt_;
    return AxisState{
        .position = state.position + v * dt_,
        .velocity = v,
    };
}

double UnderdampedIntegrator::relaxation_time() const noexcept {
    return mass_ / friction_;
}

double UnderdampedIntegrator::stability_ratio() const noexcept {
    return dt_ / relaxation_time();
}

// ─── Factory ──────────────────────────────────────────────────────────────────

LangevinIntegrator make_integrator(const SimulationConfig& config) {
    config.validate();
    const auto& p = config.physics;

    if (config.regime == DampingRegime::Overdamped) {
        return OverdampedIntegrator(p.diffusion(), config.dt);
    }

    UnderdampedIntegrator integrator(p.mass, p.friction(), p.thermal_energy(), config.dt);

    const double ratio = integrator.stability_ratio();
    if (ratio > constants::MAX_STABLE_DT_FRACTION) {
        const auto message = fmt::format(
            "dt = {:.3e} s is {:.3g} x the velocity relaxation time m/gamma = {:.3e} s "
            "(limit {}); the underdamped integration may diverge",
            config.dt, ratio, integrator.relaxation_time(),
            constants::MAX_STABLE_DT_FRACTION);
        if (config.stability == StabilityPolicy::Fail) {
            throw NumericInstability(message);
        }
        fmt::print(stderr, "Warning: {}\n", message);
    }
    return integrator;
}

DampingRegime regime_of(const LangevinIntegrator& integrator) noexcept {
    return std::holds_alternative<UnderdampedIntegrator>(integrator)
        ? DampingRegime::Underdamped
        : DampingRegime::Overdamped;
}

}  // namespace bmsd
