/**
 * @file  bench/bench_msd.cpp
 * @brief Google Benchmark suite for trajectory integration and MSD estimation.
 *
 * Benchmarks
 * ----------
 *   BM_Build_Overdamped / Underdamped   — noise draw + step loop
 *   BM_MSD_Direct                       — O(N) fixed-origin curve
 *   BM_MSD_SlidingWindow                — O(N·K) time-averaged curve
 *   BM_MSD_Vacf                         — finite differences + O(N²) VACF
 *   BM_Analytic_Underdamped             — converged trapezoid per lag
 *   BM_Fit_LogLog                       — QR least squares
 *
 * Build (CMake):
 *   cmake -DBMSD_BUILD_BENCH=ON ..
 *   cmake --build . --target bench_msd
 *   ./bench_msd --benchmark_format=json
 *
 * Throughput units: items/second (trajectory samples processed).
 */

#include "benchmark/benchmark.h"

#include "bmsd/msd.hpp"
#include "bmsd/regime.hpp"
#include "bmsd/trajectory.hpp"
#include "bmsd/vacf.hpp"

#include <cstdint>
#include <vector>

using namespace bmsd;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static SimulationConfig make_config(DampingRegime regime, std::size_t steps) {
    SimulationConfig cfg;
    cfg.physics  = PhysicalParameters{.mass = 1e-20, .radius = 5e-9};
    cfg.dt       = 1e-12;
    cfg.duration = 1e-12 * static_cast<double>(steps);
    cfg.regime   = regime;
    return cfg;
}

static Trajectory make_trajectory(std::size_t steps) {
    RandomForceGenerator rng(42);
    return TrajectoryBuilder(make_config(DampingRegime::Overdamped, steps)).build(rng);
}

static void set_throughput(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

// ── Integration ────────────────────────────────────────────────────────────────

static void BM_Build_Overdamped(benchmark::State& state) {
    const auto steps = static_cast<std::size_t>(state.range(0));
    const TrajectoryBuilder builder(make_config(DampingRegime::Overdamped, steps));
    RandomForceGenerator rng(1);
    for (auto _ : state) {
        auto traj = builder.build(rng);
        benchmark::DoNotOptimize(traj.positions().data());
    }
    set_throughput(state, steps);
}
BENCHMARK(BM_Build_Overdamped)->RangeMultiplier(8)->Range(1 << 10, 1 << 19)->Unit(benchmark::kMicrosecond);

static void BM_Build_Underdamped(benchmark::State& state) {
    const auto steps = static_cast<std::size_t>(state.range(0));
    const TrajectoryBuilder builder(make_config(DampingRegime::Underdamped, steps));
    RandomForceGenerator rng(1);
    for (auto _ : state) {
        auto traj = builder.build(rng);
        benchmark::DoNotOptimize(traj.positions().data());
    }
    set_throughput(state, steps);
}
BENCHMARK(BM_Build_Underdamped)->RangeMultiplier(8)->Range(1 << 10, 1 << 19)->Unit(benchmark::kMicrosecond);

// ── Estimators ─────────────────────────────────────────────────────────────────

static void BM_MSD_Direct(benchmark::State& state) {
    const auto traj = make_trajectory(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto curve = MSDEstimator::direct(traj);
        benchmark::DoNotOptimize(curve.msd.data());
    }
    set_throughput(state, traj.size());
}
BENCHMARK(BM_MSD_Direct)->RangeMultiplier(8)->Range(1 << 10, 1 << 19)->Unit(benchmark::kMicrosecond);

static void BM_MSD_SlidingWindow(benchmark::State& state) {
    const auto traj = make_trajectory(static_cast<std::size_t>(state.range(0)));
    const SlidingWindowOptions options{.max_lag_steps = 1000};
    for (auto _ : state) {
        auto curve = MSDEstimator::sliding_window(traj, options);
        benchmark::DoNotOptimize(curve.msd.data());
    }
    set_throughput(state, traj.size());
}
BENCHMARK(BM_MSD_SlidingWindow)->RangeMultiplier(4)->Range(1 << 12, 1 << 16)->Unit(benchmark::kMillisecond);

static void BM_MSD_Vacf(benchmark::State& state) {
    const auto traj = make_trajectory(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto curve = VacfEstimator::msd_from_trajectory(traj);
        benchmark::DoNotOptimize(curve.msd.data());
    }
    set_throughput(state, traj.size());
}
BENCHMARK(BM_MSD_Vacf)->RangeMultiplier(4)->Range(1 << 10, 1 << 14)->Unit(benchmark::kMillisecond);

static void BM_Analytic_Underdamped(benchmark::State& state) {
    const PhysicalParameters physics{.mass = 1e-20, .radius = 5e-9};
    std::vector<double> lags;
    for (int i = 0; i < 100; ++i) {
        lags.push_back(1e-12 * (1 << (i % 16)));
    }
    for (auto _ : state) {
        auto curve = MSDEstimator::analytic_underdamped(physics, lags);
        benchmark::DoNotOptimize(curve.msd.data());
    }
    set_throughput(state, lags.size());
}
BENCHMARK(BM_Analytic_Underdamped)->Unit(benchmark::kMillisecond);

static void BM_Fit_LogLog(benchmark::State& state) {
    const auto traj  = make_trajectory(static_cast<std::size_t>(state.range(0)));
    const auto curve = MSDEstimator::direct(traj);
    const RegimeClassifier classifier;
    for (auto _ : state) {
        auto report = classifier.fit(curve);
        benchmark::DoNotOptimize(report.slope);
    }
    set_throughput(state, curve.size());
}
BENCHMARK(BM_Fit_LogLog)->RangeMultiplier(8)->Range(1 << 10, 1 << 19)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
