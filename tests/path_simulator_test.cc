// SPDX-License-Identifier: MIT
/**
 * @file path_simulator_test.cc
 * @brief Tests for GBM path and mini-path generation
 */

#include <gtest/gtest.h>
#include "src/simulation/path_simulator.hpp"
#include "src/simulation/random_source.hpp"
#include <cmath>
#include <vector>

namespace lsmc {
namespace {

class PathSimulatorTest : public ::testing::Test {
protected:
    static constexpr double kRate = 0.05;
    static constexpr double kVol = 0.2;

    PathSimulator make_simulator(double dt) const {
        return PathSimulator(GbmDynamics{.rate = kRate, .volatility = kVol, .dt = dt});
    }
};

// ============================================================================
// Full-length paths
// ============================================================================

TEST_F(PathSimulatorTest, ShapeAndStartRow) {
    auto sim = make_simulator(1.0 / 63.0);
    RandomSource rng(42);
    PathTensor x = sim.simulate(500, 64, 1.0, rng);

    ASSERT_EQ(x.rows(), 64);
    ASSERT_EQ(x.cols(), 500);
    for (Eigen::Index p = 0; p < x.cols(); ++p) {
        EXPECT_EQ(x(0, p), 1.0);
    }
}

TEST_F(PathSimulatorTest, StrictlyPositive) {
    auto sim = make_simulator(0.1);
    RandomSource rng(7);
    PathTensor x = sim.simulate(1000, 11, 100.0, rng);
    EXPECT_GT(x.minCoeff(), 0.0);
    EXPECT_TRUE(x.allFinite());
}

TEST_F(PathSimulatorTest, SameSeedIsBitIdentical) {
    auto sim = make_simulator(0.25);
    RandomSource rng1(123);
    RandomSource rng2(123);
    PathTensor a = sim.simulate(256, 5, 1.0, rng1);
    PathTensor b = sim.simulate(256, 5, 1.0, rng2);
    EXPECT_TRUE(a == b);
}

TEST_F(PathSimulatorTest, DifferentSeedsDiffer) {
    auto sim = make_simulator(0.25);
    RandomSource rng1(1);
    RandomSource rng2(2);
    PathTensor a = sim.simulate(64, 5, 1.0, rng1);
    PathTensor b = sim.simulate(64, 5, 1.0, rng2);
    EXPECT_FALSE(a == b);
}

TEST_F(PathSimulatorTest, StreamsAreIndependent) {
    RandomSource pricing(9, RandomStream::Pricing);
    RandomSource dual(9, RandomStream::DualBound);
    EXPECT_NE(pricing.normal(), dual.normal());
}

TEST_F(PathSimulatorTest, DrawsAreTimeMajor) {
    const double dt = 0.5;
    auto sim = make_simulator(dt);
    RandomSource rng(2024);
    PathTensor x = sim.simulate(3, 3, 1.5, rng);

    RandomSource ref(2024);
    std::vector<double> z(6);
    for (double& zi : z) zi = ref.normal();

    const double mu = (kRate - 0.5 * kVol * kVol) * dt;
    const double sd = kVol * std::sqrt(dt);
    for (int p = 0; p < 3; ++p) {
        const double l1 = 0.0 + mu + sd * z[p];
        const double l2 = l1 + mu + sd * z[3 + p];
        EXPECT_DOUBLE_EQ(x(1, p), 1.5 * std::exp(l1));
        EXPECT_DOUBLE_EQ(x(2, p), 1.5 * std::exp(l2));
    }
}

TEST_F(PathSimulatorTest, RiskNeutralMean) {
    // E[S_T] = S0 exp(rT); with 200k paths the standard error is ~5e-4
    auto sim = make_simulator(1.0);
    RandomSource rng(11);
    PathTensor x = sim.simulate(200000, 2, 1.0, rng);
    EXPECT_NEAR(x.row(1).mean(), std::exp(kRate), 3e-3);

    Eigen::RowVectorXd log_ret = x.row(1).array().log().matrix();
    const double mean = log_ret.mean();
    const double var = (log_ret.array() - mean).square().mean();
    EXPECT_NEAR(mean, kRate - 0.5 * kVol * kVol, 2e-3);
    EXPECT_NEAR(var, kVol * kVol, 2e-3);
}

TEST_F(PathSimulatorTest, SinglePathSingleStep) {
    auto sim = make_simulator(1.0);
    RandomSource rng(5);
    PathTensor x = sim.simulate(1, 2, 1.0, rng);
    ASSERT_EQ(x.rows(), 2);
    ASSERT_EQ(x.cols(), 1);
    EXPECT_EQ(x(0, 0), 1.0);
    EXPECT_GT(x(1, 0), 0.0);
}

// ============================================================================
// Mini-paths
// ============================================================================

TEST_F(PathSimulatorTest, MiniPathShapeAndStart) {
    auto sim = make_simulator(0.1);
    RandomSource rng(3);
    std::vector<double> origins = {0.8, 1.0, 1.2};
    MiniPathBundle bundle = sim.simulate_minipaths(origins, 16, rng);

    EXPECT_EQ(bundle.n_origin(), 3u);
    EXPECT_EQ(bundle.n_minipath(), 16u);
    for (size_t i = 0; i < origins.size(); ++i) {
        EXPECT_EQ(bundle.start(static_cast<Eigen::Index>(i)), origins[i]);
    }
    EXPECT_GT(bundle.terminal.minCoeff(), 0.0);
}

TEST_F(PathSimulatorTest, MiniPathConditionalMean) {
    const double dt = 0.25;
    auto sim = make_simulator(dt);
    RandomSource rng(17);
    std::vector<double> origins = {2.0};
    MiniPathBundle bundle = sim.simulate_minipaths(origins, 200000, rng);
    EXPECT_NEAR(bundle.terminal.row(0).mean(), 2.0 * std::exp(kRate * dt), 3e-3);
}

TEST_F(PathSimulatorTest, MiniPathsReproducible) {
    auto sim = make_simulator(0.1);
    std::vector<double> origins = {0.9, 1.1};
    RandomSource rng1(77);
    RandomSource rng2(77);
    MiniPathBundle a = sim.simulate_minipaths(origins, 32, rng1);
    MiniPathBundle b = sim.simulate_minipaths(origins, 32, rng2);
    EXPECT_TRUE(a.terminal == b.terminal);
}

}  // namespace
}  // namespace lsmc
