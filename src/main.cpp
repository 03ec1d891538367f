/// @file src/main.cpp
/// @brief bmsd CLI entry point.
///
/// Usage:
///   bmsd --simulate [options]          Simulate a trajectory and fit its MSD
///   bmsd --interactive [options]       Prompt for the physical inputs on stdin
///   bmsd --analyze <csv> [options]     MSD of an experimental t,x,y trace
///   bmsd --compare <csv> [options]     Trace vs overdamped simulation slopes
///   bmsd --help                        Print usage

#include "bmsd/constants.hpp"
#include "bmsd/curve_writer.hpp"
#include "bmsd/data_loader.hpp"
#include "bmsd/engine.hpp"
#include "bmsd/errors.hpp"
#include "bmsd/types.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <charconv>
#include <cstdio>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  bmsd --simulate [options]       Simulate Brownian motion and fit log-log MSD\n"
        "  bmsd --interactive [options]    Same, prompting for mass, radius, x0, y0, dt,\n"
        "                                  duration and regime on stdin\n"
        "  bmsd --analyze <csv> [options]  MSD of an experimental trace\n"
        "  bmsd --compare <csv> [options]  Compare a trace with an overdamped simulation\n"
        "  bmsd --help                     Show this help\n"
        "\n"
        "Simulation options:\n"
        "  --mass <kg>  --radius <m>  --dt <s>  --duration <s>\n"
        "  --regime overdamped|underdamped     (default overdamped)\n"
        "  --x0 <m>  --y0 <m>                  initial position (default 0)\n"
        "  --temperature <K>                   (default {})\n"
        "  --viscosity <Pa.s>                  (default {})\n"
        "  --seed <n>                          fixed seed (default: system entropy)\n"
        "  --warn-unstable                     warn instead of failing when dt >= {} m/gamma\n"
        "  --no-analytic                       skip the analytic underdamped overlay\n"
        "\n"
        "Analysis options:\n"
        "  --mode direct|sliding|vacf          estimator (simulate: direct, analyze: sliding)\n"
        "  --fit-min <s>  --fit-max <s>        log-log fit window (default: leading decade)\n"
        "  --tolerance <slope>                 regime band half-width (default {})\n"
        "  --out <csv>                         write lag,msd,log10 columns and fit line\n"
        "  --trajectory-out <csv>              write the trajectory (t,x,y[,vx,vy])\n"
        "  --verbose                           progress on stderr\n"
        "\n"
        "CSV input format (header required): t,x,y\n",
        bmsd::constants::DEFAULT_TEMPERATURE, bmsd::constants::DEFAULT_VISCOSITY,
        bmsd::constants::MAX_STABLE_DT_FRACTION, bmsd::constants::DEFAULT_REGIME_TOLERANCE);
}

// ─── Argument parsing ─────────────────────────────────────────────────────────

struct CliOptions {
    std::string                  command;
    std::string                  input;
    bmsd::EngineConfig           engine{};
    std::optional<bmsd::EstimatorMode> mode{};
    std::string                  out;
    std::string                  trajectory_out;
};

double parse_double(std::string_view flag, std::string_view text) {
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw bmsd::InvalidParameter(fmt::format("{} expects a number, got '{}'", flag, text));
    }
    return value;
}

std::uint64_t parse_seed(std::string_view text) {
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        throw bmsd::InvalidParameter(fmt::format("--seed expects an unsigned integer, got '{}'", text));
    }
    return value;
}

bmsd::EstimatorMode parse_mode(std::string_view text) {
    if (text == "direct")  return bmsd::EstimatorMode::Direct;
    if (text == "sliding") return bmsd::EstimatorMode::SlidingWindow;
    if (text == "vacf")    return bmsd::EstimatorMode::Vacf;
    throw bmsd::InvalidParameter(fmt::format("unknown --mode '{}'", text));
}

bmsd::DampingRegime parse_regime(std::string_view text) {
    const auto regime = bmsd::parse_damping_regime(text);
    if (!regime) {
        throw bmsd::InvalidParameter(fmt::format("unsupported damping regime '{}'", text));
    }
    return *regime;
}

CliOptions parse_args(const std::vector<std::string_view>& args) {
    CliOptions opts;
    opts.command = std::string(args.at(0));
    std::size_t i = 1;

    if (opts.command == "--analyze" || opts.command == "--compare") {
        if (args.size() < 2) {
            throw bmsd::InvalidParameter(fmt::format("{} requires a CSV file path", opts.command));
        }
        opts.input = std::string(args[1]);
        i = 2;
    }

    auto& sim = opts.engine.simulation;
    for (; i < args.size(); ++i) {
        const std::string_view flag = args[i];

        // Switches.
        if (flag == "--warn-unstable") { sim.stability = bmsd::StabilityPolicy::Warn; continue; }
        if (flag == "--no-analytic")   { opts.engine.analytic_overlay = false;       continue; }
        if (flag == "--verbose")       { opts.engine.verbose = true;                 continue; }

        // Everything else takes a value.
        if (i + 1 >= args.size()) {
            throw bmsd::InvalidParameter(fmt::format("{} requires a value", flag));
        }
        const std::string_view value = args[++i];

        if      (flag == "--mass")           sim.physics.mass        = parse_double(flag, value);
        else if (flag == "--radius")         sim.physics.radius      = parse_double(flag, value);
        else if (flag == "--temperature")    sim.physics.temperature = parse_double(flag, value);
        else if (flag == "--viscosity")      sim.physics.viscosity   = parse_double(flag, value);
        else if (flag == "--dt")             sim.dt                  = parse_double(flag, value);
        else if (flag == "--duration")       sim.duration            = parse_double(flag, value);
        else if (flag == "--x0")             sim.initial_position.x() = parse_double(flag, value);
        else if (flag == "--y0")             sim.initial_position.y() = parse_double(flag, value);
        else if (flag == "--regime")         sim.regime              = parse_regime(value);
        else if (flag == "--seed")           sim.seed                = parse_seed(value);
        else if (flag == "--mode")           opts.mode               = parse_mode(value);
        else if (flag == "--fit-min")        opts.engine.fit_window.lag_min = parse_double(flag, value);
        else if (flag == "--fit-max")        opts.engine.fit_window.lag_max = parse_double(flag, value);
        else if (flag == "--tolerance")      opts.engine.regime_tolerance   = parse_double(flag, value);
        else if (flag == "--out")            opts.out            = std::string(value);
        else if (flag == "--trajectory-out") opts.trajectory_out = std::string(value);
        else throw bmsd::InvalidParameter(fmt::format("unknown option '{}'", flag));
    }
    return opts;
}

// ─── Interactive intake ───────────────────────────────────────────────────────

/// Prompt for one value on stdin.
std::string prompt(const char* question) {
    fmt::print("{}", question);
    std::fflush(stdout);
    std::string line;
    if (!std::getline(std::cin, line)) {
        throw bmsd::InvalidParameter(fmt::format("no answer to '{}'", question));
    }
    return line;
}

void prompt_simulation(bmsd::SimulationConfig& sim) {
    const auto number = [](const char* question) {
        const std::string answer = prompt(question);
        const auto first = answer.find_first_not_of(" \t\r");
        const auto last  = answer.find_last_not_of(" \t\r");
        const std::string_view trimmed = first == std::string::npos
            ? std::string_view{}
            : std::string_view(answer).substr(first, last - first + 1);
        return parse_double(question, trimmed);
    };

    sim.physics.mass         = number("Enter the mass of the particle (kg): ");
    sim.physics.radius       = number("Enter the radius of the particle (m): ");
    sim.initial_position.x() = number("Enter the initial x position (m): ");
    sim.initial_position.y() = number("Enter the initial y position (m): ");
    sim.dt                   = number("Enter the timestep (s): ");
    sim.duration             = number("Enter total simulation time (s): ");
    sim.regime               = parse_regime(prompt("Use underdamped Langevin? (yes/no): "));
}

// ─── Commands ─────────────────────────────────────────────────────────────────

void write_outputs(const CliOptions& opts, const bmsd::AnalysisResult& result) {
    if (!opts.out.empty()) {
        bmsd::CurveWriter::write_file(opts.out, bmsd::CurveWriter::to_csv(result.msd, result.report));
        fmt::print("MSD curve written to '{}'\n", opts.out);
        if (result.analytic) {
            const std::string path = opts.out + ".analytic.csv";
            bmsd::CurveWriter::write_file(path, bmsd::CurveWriter::to_csv(*result.analytic));
            fmt::print("Analytic overlay written to '{}'\n", path);
        }
    }
    if (!opts.trajectory_out.empty()) {
        bmsd::CurveWriter::write_file(opts.trajectory_out,
                                      bmsd::CurveWriter::trajectory_csv(result.trajectory));
        fmt::print("Trajectory written to '{}'\n", opts.trajectory_out);
    }
}

int run_simulate(CliOptions opts) {
    opts.engine.estimator = opts.mode.value_or(bmsd::EstimatorMode::Direct);
    const bmsd::Engine engine(opts.engine);
    const auto result = engine.simulate();

    fmt::print("Estimated slope of log-log MSD: {:.3f} ({})\n",
               result.report.slope, bmsd::to_string(result.report.regime));
    fmt::print("{}", result.to_string());
    write_outputs(opts, result);
    return 0;
}

int run_analyze(const CliOptions& opts) {
    auto trajectory = bmsd::TraceLoader::load_csv(opts.input);
    fmt::print("Loaded {} samples from '{}'\n", trajectory.size(), opts.input);

    const bmsd::Engine engine(opts.engine);
    const auto result = engine.analyze(std::move(trajectory),
                                       opts.mode.value_or(bmsd::EstimatorMode::SlidingWindow));
    fmt::print("Estimated slope of log-log MSD: {:.3f} ({})\n",
               result.report.slope, bmsd::to_string(result.report.regime));
    fmt::print("{}", result.to_string());
    write_outputs(opts, result);
    return 0;
}

int run_compare(const CliOptions& opts) {
    const auto trajectory = bmsd::TraceLoader::load_csv(opts.input);
    fmt::print("Loaded {} samples from '{}'\n", trajectory.size(), opts.input);

    const auto& sim = opts.engine.simulation;
    bmsd::RandomForceGenerator rng = sim.seed ? bmsd::RandomForceGenerator(*sim.seed)
                                              : bmsd::RandomForceGenerator();
    const bmsd::Engine engine(opts.engine);
    const auto result = engine.compare(trajectory, sim.physics, rng);
    fmt::print("{}", result.to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::vector<std::string_view> args(argv + 1, argv + argc);
    const std::string_view mode = args.front();

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }
    if (mode != "--simulate" && mode != "--interactive" &&
        mode != "--analyze" && mode != "--compare") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    try {
        CliOptions opts = parse_args(args);

        if (mode == "--simulate") {
            return run_simulate(std::move(opts));
        }
        if (mode == "--interactive") {
            prompt_simulation(opts.engine.simulation);
            return run_simulate(std::move(opts));
        }
        if (mode == "--analyze") {
            return run_analyze(opts);
        }
        return run_compare(opts);
    } catch (const bmsd::Error& ex) {
        fmt::print(stderr, "Error [{}]: {}\n", bmsd::to_string(ex.kind()), ex.what());
        return 1;
    } catch (const std::exception& ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
        return 1;
    }
}
