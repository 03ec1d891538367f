#pragma once

/// @file include/bmsd/engine.hpp
/// @brief Engine — the sequential MSD analysis pipeline.
///
/// # Module: Engine
///
/// ## Responsibility
/// Orchestrate one run end to end:
///   SimulationConfig → RandomForceGenerator + LangevinIntegrator →
///   TrajectoryBuilder → MSDEstimator → RegimeClassifier → AnalysisResult
///
/// For experimental data the builder is replaced by TraceLoader and the
/// downstream stages are unchanged.
///
/// ## Usage
/// ```cpp
/// EngineConfig cfg;
/// cfg.simulation.physics.mass   = 1e-20;
/// cfg.simulation.physics.radius = 5e-9;
/// cfg.simulation.dt             = 1e-12;
/// cfg.simulation.duration       = 1e-8;
/// cfg.simulation.regime         = DampingRegime::Underdamped;
///
/// Engine engine(cfg);
/// auto result = engine.simulate();
/// fmt::print("{}\n", result.to_string());
/// ```
///
/// ## Guarantees
/// - Single-threaded and synchronous; each call owns its outputs
/// - No partial results: a call returns a complete AnalysisResult or throws
/// - `simulate()` validates the whole configuration before integrating

#include "bmsd/constants.hpp"
#include "bmsd/msd.hpp"
#include "bmsd/parameters.hpp"
#include "bmsd/random_force.hpp"
#include "bmsd/regime.hpp"
#include "bmsd/trajectory.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bmsd {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    /// Inputs of the simulated path (unused by `analyze`).
    SimulationConfig simulation{};

    /// Estimator applied to simulated trajectories.
    EstimatorMode estimator = EstimatorMode::Direct;

    /// Lag window of the log-log fit. With both bounds absent the leading
    /// decade of the curve is used (FitWindow::leading_decade).
    FitWindow fit_window{};

    /// Slope half-band for regime naming.
    double regime_tolerance = constants::DEFAULT_REGIME_TOLERANCE;

    /// Overlay the analytic VACF-integrated MSD on underdamped runs.
    bool analytic_overlay = true;

    /// Number of log-spaced lags at which the overlay is evaluated.
    std::size_t overlay_points = 100;

    AnalyticOptions analytic{};

    /// If true, emit per-stage progress to stderr.
    bool verbose = false;
};

// ─── Results ──────────────────────────────────────────────────────────────────

struct AnalysisResult {
    Trajectory              trajectory;
    MSDCurve                msd;
    std::optional<MSDCurve> analytic;  ///< Underdamped overlay, if requested
    RegimeReport            report;
    /// Seed that replays the simulated run; empty for experimental data and
    /// for runs drawn from an already consumed generator.
    std::optional<std::uint64_t> seed;

    [[nodiscard]] std::string to_string() const;
};

/// Experimental trace versus an overdamped simulation on the same time span.
struct ComparisonResult {
    RegimeReport  data;
    RegimeReport  simulation;
    std::optional<std::uint64_t> seed;  ///< As in AnalysisResult

    [[nodiscard]] double slope_difference() const noexcept;

    /// |Δslope| ≤ rtol · |data slope|.
    [[nodiscard]] bool agrees(double rtol) const noexcept;

    [[nodiscard]] std::string to_string() const;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    /// # Throws
    /// InvalidParameter for a non-positive regime tolerance, fewer than 2
    /// overlay points or an inverted fit window.
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Simulate with the configured seed, or an entropy seed if none is set.
    [[nodiscard]] AnalysisResult simulate() const;

    /// Simulate drawing noise from `rng`. The seed is reported only when
    /// `rng` had not been drawn from before.
    [[nodiscard]] AnalysisResult simulate(RandomForceGenerator& rng) const;

    /// Estimate and classify an externally supplied trajectory.
    [[nodiscard]] AnalysisResult analyze(Trajectory trajectory,
                                         EstimatorMode mode = EstimatorMode::SlidingWindow) const;

    /// Simulate overdamped motion with `physics` over the experimental trace's
    /// step and span, starting where the trace starts, then fit the
    /// sliding-window MSD of both over the same window.
    ///
    /// # Throws
    /// MalformedInput if the trace is not uniformly sampled; anything the
    /// simulation or the fit may throw.
    [[nodiscard]] ComparisonResult compare(const Trajectory& experimental,
                                           const PhysicalParameters& physics,
                                           RandomForceGenerator& rng) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] FitWindow window_for(const MSDCurve& curve) const noexcept;

    /// Log-spaced subset of the positive lags of `curve`.
    [[nodiscard]] static std::vector<double>
    overlay_lags(const MSDCurve& curve, std::size_t points);

    EngineConfig     config_;
    RegimeClassifier classifier_;
};

} // namespace bmsd
