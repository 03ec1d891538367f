/**
 * @file  fuzz_trace_loader.cpp
 * @brief libFuzzer target for TraceLoader::parse_csv_string and the MSD
 *        estimators downstream of it.
 *
 * Build:
 *   cmake -DBMSD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_trace_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_trace_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Malformed text is reported as bmsd::Error, never anything else.
 *   3. If a trajectory is returned:
 *      a. its time column is strictly increasing and finite
 *      b. every position is finite
 *      c. direct and sliding-window MSD start at (0, 0) and are ≥ 0
 *
 * Fuzzer strategy:
 *   Input is passed directly as CSV text. The parser must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • "nan", "inf", "-inf" tokens
 *     • Missing, duplicated or reordered header columns
 *     • Short rows, empty cells, trailing commas
 *     • Comment and blank lines anywhere
 *     • Exponential notation: "1e308", "1e-308"
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "bmsd/data_loader.hpp"
#include "bmsd/errors.hpp"
#include "bmsd/msd.hpp"

using namespace bmsd;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    try {
        const auto traj = TraceLoader::parse_csv_string(input);

        // Invariant 3a/3b
        for (std::size_t i = 0; i < traj.size(); ++i) {
            assert(std::isfinite(traj.time(i)));
            assert(std::isfinite(traj.position(i).x()));
            assert(std::isfinite(traj.position(i).y()));
            if (i > 0) {
                assert(traj.time(i) > traj.time(i - 1));
            }
        }

        if (traj.size() >= 2 && traj.size() <= 512) {
            // Invariant 3c
            for (auto mode : {EstimatorMode::Direct, EstimatorMode::SlidingWindow}) {
                const auto curve = MSDEstimator::estimate(traj, mode);
                assert(curve.lag.front() == 0.0);
                assert(curve.msd.front() == 0.0);
                for (double m : curve.msd) {
                    assert(m >= 0.0);
                }
            }
        }
    } catch (const Error& e) {
        // Invariant 2: reported, typed rejection.
        assert(e.what() != nullptr);
    }

    return 0;
}
