/// @file tests/stochastic/test_random_force.cpp
/// @brief Unit tests for RandomForceGenerator.

#include "bmsd/random_force.hpp"
#include "bmsd/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numeric>
#include <vector>

using namespace bmsd;

TEST(RandomForce_Seed, SameSeedSameSamples) {
    RandomForceGenerator a(42);
    RandomForceGenerator b(42);
    EXPECT_EQ(a.sample(1000, 2.5), b.sample(1000, 2.5));
}

TEST(RandomForce_Seed, DifferentSeedsDiffer) {
    RandomForceGenerator a(1);
    RandomForceGenerator b(2);
    EXPECT_NE(a.sample(16, 1.0), b.sample(16, 1.0));
}

TEST(RandomForce_Seed, SeedIsRetrievable) {
    RandomForceGenerator seeded(123456789ULL);
    EXPECT_EQ(seeded.seed(), 123456789ULL);

    // An entropy-seeded generator replays when rebuilt from its own seed.
    RandomForceGenerator entropy;
    RandomForceGenerator replay(entropy.seed());
    EXPECT_EQ(entropy.sample(8, 1.0), replay.sample(8, 1.0));
}

TEST(RandomForce_Seed, DrawsAreCounted) {
    RandomForceGenerator rng(9);
    EXPECT_TRUE(rng.fresh());
    (void)rng.sample(10, 1.0);
    (void)rng.draw(1.0);
    EXPECT_EQ(rng.draws(), 11u);
    EXPECT_FALSE(rng.fresh());
}

TEST(RandomForce_Sample, ReturnsRequestedCount) {
    RandomForceGenerator rng(7);
    EXPECT_EQ(rng.sample(37, 1.0).size(), 37u);
}

TEST(RandomForce_Sample, ZeroVarianceYieldsExactZeros) {
    RandomForceGenerator rng(7);
    for (double v : rng.sample(100, 0.0)) {
        EXPECT_EQ(v, 0.0);
    }
}

TEST(RandomForce_Sample, MomentsMatchVariance) {
    RandomForceGenerator rng(2024);
    const double variance = 4.0;
    const auto s = rng.sample(200'000, variance);

    const double mean = std::accumulate(s.begin(), s.end(), 0.0) / static_cast<double>(s.size());
    double ss = 0.0;
    for (double v : s) ss += (v - mean) * (v - mean);
    const double var = ss / static_cast<double>(s.size() - 1);

    EXPECT_NEAR(mean, 0.0, 0.02);
    EXPECT_NEAR(var / variance, 1.0, 0.02);
}

TEST(RandomForce_Sample, TinyVarianceScalesLinearly) {
    // Physical variances are ~1e-20; scaling must not underflow to zero.
    RandomForceGenerator a(5);
    RandomForceGenerator b(5);
    const auto unit  = a.sample(10, 1.0);
    const auto small = b.sample(10, 1e-20);
    for (std::size_t i = 0; i < unit.size(); ++i) {
        EXPECT_NEAR(small[i], unit[i] * 1e-10, 1e-22);
    }
}

TEST(RandomForce_Sample, RejectsZeroCount) {
    RandomForceGenerator rng(1);
    EXPECT_THROW((void)rng.sample(0, 1.0), InvalidParameter);
}

TEST(RandomForce_Sample, RejectsNegativeOrNonFiniteVariance) {
    RandomForceGenerator rng(1);
    EXPECT_THROW((void)rng.sample(4, -1.0), InvalidParameter);
    EXPECT_THROW((void)rng.sample(4, std::numeric_limits<double>::infinity()), InvalidParameter);
    EXPECT_THROW((void)rng.draw(std::nan("")), InvalidParameter);
}

TEST(RandomForce_Draw, ConsumesSameStreamAsSample) {
    RandomForceGenerator a(99);
    RandomForceGenerator b(99);
    const auto batch = a.sample(3, 1.0);
    EXPECT_EQ(b.draw(1.0), batch[0]);
    EXPECT_EQ(b.draw(1.0), batch[1]);
    EXPECT_EQ(b.draw(1.0), batch[2]);
}
