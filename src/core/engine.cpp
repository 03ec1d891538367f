/// @file src/core/engine.cpp
/// @brief Engine — sequential MSD pipeline.

#include "bmsd/engine.hpp"
#include "bmsd/errors.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace bmsd {

// ─── AnalysisResult / ComparisonResult ───────────────────────────────────────

std::string AnalysisResult::to_string() const {
    std::string out = fmt::format(
        "samples      : {}\n"
        "time span    : {:.4e} s\n"
        "final MSD    : {:.4e} m^2\n"
        "log-log fit  : {}\n",
        trajectory.size(),
        trajectory.grid().span(),
        msd.msd.empty() ? 0.0 : msd.msd.back(),
        report.to_string());
    if (analytic && !analytic->empty()) {
        out += fmt::format("analytic MSD : {:.4e} m^2 at lag {:.4e} s\n",
                           analytic->msd.back(), analytic->lag.back());
    }
    if (seed) {
        out += fmt::format("seed         : {}\n", *seed);
    }
    return out;
}

double ComparisonResult::slope_difference() const noexcept {
    return simulation.slope - data.slope;
}

bool ComparisonResult::agrees(double rtol) const noexcept {
    return std::abs(slope_difference()) <= rtol * std::abs(data.slope);
}

std::string ComparisonResult::to_string() const {
    std::string out = fmt::format(
        "Slope from data       : {:.4f}\n"
        "Slope from simulation : {:.4f}\n"
        "Difference            : {:.4e}\n",
        data.slope, simulation.slope, std::abs(slope_difference()));
    if (seed) {
        out += fmt::format("Seed                  : {}\n", *seed);
    }
    return out;
}

// ─── Engine ───────────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config)),
      classifier_(config_.regime_tolerance) {
    if (config_.overlay_points < 2) {
        throw InvalidParameter(fmt::format(
            "overlay_points must be >= 2 (got {})", config_.overlay_points));
    }
    const auto& w = config_.fit_window;
    if (w.lag_min && w.lag_max && *w.lag_min > *w.lag_max) {
        throw InvalidParameter(fmt::format(
            "fit window is inverted: [{}, {}]", *w.lag_min, *w.lag_max));
    }
}

AnalysisResult Engine::simulate() const {
    const auto& seed = config_.simulation.seed;
    RandomForceGenerator rng = seed ? RandomForceGenerator(*seed) : RandomForceGenerator();
    return simulate(rng);
}

AnalysisResult Engine::simulate(RandomForceGenerator& rng) const {
    const auto& sim = config_.simulation;
    const std::optional<std::uint64_t> seed =
        rng.fresh() ? std::optional<std::uint64_t>(rng.seed()) : std::nullopt;

    // ── Step 1: validate and build the integrator before drawing anything ────
    const TrajectoryBuilder builder(sim);
    if (config_.verbose) {
        const auto& p = sim.physics;
        fmt::print(stderr,
                   "[bmsd] {} run: {} steps of {:.3e} s, gamma={:.4e} kg/s, D={:.4e} m^2/s, "
                   "m/gamma={:.4e} s, seed={}\n",
                   to_string(sim.regime), builder.grid().steps(), sim.dt,
                   p.friction(), p.diffusion(), p.relaxation_time(), rng.seed());
    }

    // ── Step 2: integrate ─────────────────────────────────────────────────────
    Trajectory trajectory = builder.build(rng);

    // ── Step 3: estimate ──────────────────────────────────────────────────────
    MSDCurve msd = MSDEstimator::estimate(trajectory, config_.estimator);

    std::optional<MSDCurve> analytic;
    if (config_.analytic_overlay && sim.regime == DampingRegime::Underdamped) {
        const auto lags = overlay_lags(msd, config_.overlay_points);
        analytic = MSDEstimator::analytic_underdamped(sim.physics, lags, config_.analytic);
    }

    // ── Step 4: classify ──────────────────────────────────────────────────────
    const RegimeReport report = classifier_.fit(msd, window_for(msd));
    if (config_.verbose) {
        fmt::print(stderr, "[bmsd] {}\n", report.to_string());
    }

    return AnalysisResult{
        .trajectory = std::move(trajectory),
        .msd        = std::move(msd),
        .analytic   = std::move(analytic),
        .report     = report,
        .seed       = seed,
    };
}

AnalysisResult Engine::analyze(Trajectory trajectory, EstimatorMode mode) const {
    MSDCurve msd = MSDEstimator::estimate(trajectory, mode);
    const RegimeReport report = classifier_.fit(msd, window_for(msd));
    if (config_.verbose) {
        fmt::print(stderr, "[bmsd] {} samples, {}\n", trajectory.size(), report.to_string());
    }
    return AnalysisResult{
        .trajectory = std::move(trajectory),
        .msd        = std::move(msd),
        .analytic   = std::nullopt,
        .report     = report,
        .seed       = std::nullopt,
    };
}

ComparisonResult Engine::compare(const Trajectory& experimental,
                                 const PhysicalParameters& physics,
                                 RandomForceGenerator& rng) const {
    const auto step = experimental.grid().uniform_step();
    if (!step) {
        throw MalformedInput("comparison requires a uniformly sampled trace");
    }

    SimulationConfig sim;
    sim.physics          = physics;
    sim.dt               = *step;
    sim.duration         = experimental.grid().span();
    sim.regime           = DampingRegime::Overdamped;
    sim.initial_position = experimental.position(0);
    if (rng.fresh()) {
        sim.seed = rng.seed();
    }
    sim.stability        = config_.simulation.stability;

    const TrajectoryBuilder builder(sim);
    const Trajectory simulated = builder.build(rng);

    const MSDCurve data_msd = MSDEstimator::sliding_window(experimental);
    const MSDCurve sim_msd  = MSDEstimator::sliding_window(simulated);

    // Both curves are fitted over the window chosen on the data.
    const FitWindow window = window_for(data_msd);
    return ComparisonResult{
        .data       = classifier_.fit(data_msd, window),
        .simulation = classifier_.fit(sim_msd, window),
        .seed       = sim.seed,
    };
}

FitWindow Engine::window_for(const MSDCurve& curve) const noexcept {
    const auto& w = config_.fit_window;
    if (w.lag_min || w.lag_max) {
        return w;
    }
    return FitWindow::leading_decade(curve);
}

std::vector<double> Engine::overlay_lags(const MSDCurve& curve, std::size_t points) {
    std::vector<double> out{0.0};

    const auto first = std::find_if(curve.lag.begin(), curve.lag.end(),
                                    [](double lag) { return lag > 0.0; });
    if (first == curve.lag.end()) {
        return out;
    }
    const double lo = *first;
    const double hi = curve.lag.back();

    // Snap log-spaced targets onto lags the curve actually has.
    for (std::size_t j = 0; j < points; ++j) {
        const double frac   = static_cast<double>(j) / static_cast<double>(points - 1);
        const double target = lo * std::pow(hi / lo, frac);
        auto it = std::lower_bound(first, curve.lag.end(), target);
        if (it == curve.lag.end()) {
            it = std::prev(curve.lag.end());
        }
        if (*it > out.back()) {
            out.push_back(*it);
        }
    }
    return out;
}

}  // namespace bmsd
