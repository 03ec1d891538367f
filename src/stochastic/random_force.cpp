/// @file src/stochastic/random_force.cpp
/// @brief RandomForceGenerator — Gaussian increments from an owned engine.

#include "bmsd/random_force.hpp"
#include "bmsd/errors.hpp"

#include <fmt/format.h>

#include <cmath>

namespace bmsd {

// ─── Construction ─────────────────────────────────────────────────────────────

RandomForceGenerator::RandomForceGenerator()
    : RandomForceGenerator(entropy_seed()) {}

RandomForceGenerator::RandomForceGenerator(std::uint64_t seed)
    : seed_(seed), engine_(seed) {}

std::uint64_t RandomForceGenerator::entropy_seed() {
    std::random_device device;
    const auto hi = static_cast<std::uint64_t>(device());
    const auto lo = static_cast<std::uint64_t>(device());
    return (hi << 32) ^ lo;
}

// ─── Sampling ─────────────────────────────────────────────────────────────────

void RandomForceGenerator::check_variance(double variance) {
    if (!std::isfinite(variance) || variance < 0.0) {
        throw InvalidParameter(
            fmt::format("noise variance must be finite and >= 0 (got {})", variance));
    }
}

std::vector<double> RandomForceGenerator::sample(std::size_t count, double variance) {
    if (count == 0) {
        throw InvalidParameter("sample count must be >= 1");
    }
    check_variance(variance);

    // Unit draws scaled by σ: σ = 0 gives exact zeros and still advances the
    // engine, so the stream position does not depend on the variance.
    const double sigma = std::sqrt(variance);
    std::vector<double> out(count);
    for (auto& value : out) {
        value = sigma * unit_(engine_);
    }
    draws_ += count;
    return out;
}

double RandomForceGenerator::draw(double variance) {
    check_variance(variance);
    ++draws_;
    return std::sqrt(variance) * unit_(engine_);
}

}  // namespace bmsd
