// SPDX-License-Identifier: MIT
/**
 * @file lsm_pricer_test.cc
 * @brief End-to-end tests for LongstaffSchwartzPricer
 */

#include <gtest/gtest.h>
#include "src/option/bias_study.hpp"
#include "src/option/lsm_pricer.hpp"
#include "src/simulation/path_simulator.hpp"
#include "src/simulation/random_source.hpp"
#include <cmath>
#include <numeric>
#include <variant>

namespace lsmc {
namespace {

// Finite-difference price of the at-the-money American put used throughout
constexpr double kReferencePrice = 0.060879;

LsmConfig reference_config() {
    return LsmConfig{
        .spot = 1.0,
        .strike = 1.0,
        .rate = 0.05,
        .volatility = 0.2,
        .maturity = 1.0,
        .n_timestep = 64,
        .n_path = 100000,
        .seed = 1,
        .use_in_the_money = false,
        .use_independent_paths = true,
        .order = 3,
    };
}

// ============================================================================
// Construction
// ============================================================================

TEST(LsmPricerTest, CreateValidates) {
    LsmConfig config = reference_config();
    config.volatility = -0.2;

    auto pricer = LongstaffSchwartzPricer::create(config);
    ASSERT_FALSE(pricer.has_value());
    EXPECT_EQ(pricer.error().code, ValidationErrorCode::InvalidVolatility);
}

TEST(LsmPricerTest, DefaultPayoffIsPutOnStrike) {
    LsmConfig config = reference_config();
    config.strike = 1.2;
    auto pricer = LongstaffSchwartzPricer::create(config);
    ASSERT_TRUE(pricer.has_value());
    EXPECT_EQ(pricer->payoff().name(), "put");
    EXPECT_DOUBLE_EQ(pricer->payoff()(1.0), 0.2);
    EXPECT_DOUBLE_EQ(pricer->discount_factor(), std::exp(-0.05 / 63.0));
}

TEST(LsmPricerTest, CustomPayoff) {
    LsmConfig config = reference_config();
    config.n_path = 2000;
    config.n_timestep = 8;
    config.payoff = Payoff::call(1.0);

    auto pricer = LongstaffSchwartzPricer::create(config);
    ASSERT_TRUE(pricer.has_value());
    auto result = pricer->solve();
    ASSERT_TRUE(result.has_value()) << result.error();

    // Early exercise of a call on a non-dividend stock is never optimal, so
    // the price sits near Black-Scholes (0.1045)
    EXPECT_NEAR(result->npv, 0.1045, 5.0 * result->stddev);
}

// ============================================================================
// Reproducibility
// ============================================================================

TEST(LsmPricerTest, SameSeedIsBitIdentical) {
    LsmConfig config = reference_config();
    config.n_path = 3000;
    config.n_timestep = 16;

    auto pricer = LongstaffSchwartzPricer::create(config);
    ASSERT_TRUE(pricer.has_value());
    auto a = pricer->solve();
    auto b = pricer->solve();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    EXPECT_EQ(a->npv, b->npv);
    EXPECT_EQ(a->stddev, b->stddev);
    EXPECT_TRUE(a->beta == b->beta);
    EXPECT_TRUE(a->x == b->x);
}

TEST(LsmPricerTest, IndependentPathsValueFreshPaths) {
    LsmConfig config = reference_config();
    config.n_path = 3000;
    config.n_timestep = 16;

    LsmConfig same = config;
    same.use_independent_paths = false;

    auto independent = LongstaffSchwartzPricer(config).solve();
    auto in_sample = LongstaffSchwartzPricer(same).solve();
    ASSERT_TRUE(independent.has_value());
    ASSERT_TRUE(in_sample.has_value());

    // The first pass draws the same paths in both modes; only the second
    // pass differs
    EXPECT_FALSE(independent->x == in_sample->x);
    EXPECT_TRUE(independent->beta == in_sample->beta);
}

// ============================================================================
// Accuracy
// ============================================================================

TEST(LsmPricerTest, ReferenceScenario) {
    auto pricer = LongstaffSchwartzPricer::create(reference_config());
    ASSERT_TRUE(pricer.has_value());
    auto result = pricer->solve();
    ASSERT_TRUE(result.has_value()) << result.error();

    EXPECT_GT(result->stddev, 0.0);
    EXPECT_TRUE(std::isfinite(result->stddev));
    EXPECT_NEAR(result->npv, kReferencePrice, 0.004);
    // Out-of-sample valuation uses a feasible policy: a lower bound
    EXPECT_LT(result->npv, kReferencePrice + 4.0 * result->stddev);
}

TEST(LsmPricerTest, StandardErrorShrinksWithPathCount) {
    LsmConfig small = reference_config();
    small.n_path = 1000;
    small.n_timestep = 32;
    LsmConfig large = small;
    large.n_path = 100000;

    auto a = LongstaffSchwartzPricer(small).solve();
    auto b = LongstaffSchwartzPricer(large).solve();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    // 1 / sqrt(n): a factor of 10 for 100x more paths
    const double ratio = a->stddev / b->stddev;
    EXPECT_GT(ratio, 7.0);
    EXPECT_LT(ratio, 13.0);
}

TEST(LsmPricerTest, UpperBoundAboveLowerBound) {
    LsmConfig config = reference_config();
    config.n_path = 1000;
    config.n_timestep = 9;

    auto pricer = LongstaffSchwartzPricer::create(config);
    ASSERT_TRUE(pricer.has_value());
    auto lower = pricer->solve();
    ASSERT_TRUE(lower.has_value());

    auto upper = pricer->upper_bound(*lower, 100);
    ASSERT_TRUE(upper.has_value()) << upper.error();
    EXPECT_GE(upper->upper_bound, lower->npv - 3.0 * (lower->stddev + upper->stddev));

    auto again = pricer->upper_bound(*lower, 100);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->upper_bound, upper->upper_bound);
}

// ============================================================================
// In-the-money regression
// ============================================================================

TEST(LsmPricerTest, InTheMoneyRegressionPrices) {
    LsmConfig config = reference_config();
    config.n_path = 20000;
    config.n_timestep = 16;
    config.use_in_the_money = true;

    auto pricer = LongstaffSchwartzPricer::create(config);
    ASSERT_TRUE(pricer.has_value());
    auto result = pricer->solve();
    ASSERT_TRUE(result.has_value()) << result.error();

    EXPECT_GT(result->stddev, 0.0);
    // Fifteen exercise dates: slightly below the American value
    EXPECT_NEAR(result->npv, kReferencePrice, 0.004);
    EXPECT_LT(result->npv, kReferencePrice + 4.0 * result->stddev);
}

TEST(LsmPricerTest, InTheMoneyFitFailureCarriesTimestep) {
    // Deep out of the money: some dates have one or two in-the-money paths
    LsmConfig config{
        .strike = 0.6,
        .n_timestep = 16,
        .n_path = 2000,
        .seed = 3,
        .use_in_the_money = true,
    };
    auto pricer = LongstaffSchwartzPricer::create(config);
    ASSERT_TRUE(pricer.has_value());

    auto result = pricer->solve();
    ASSERT_FALSE(result.has_value());
    ASSERT_TRUE(is_fit_error(result.error()));
    const FitError& err = std::get<FitError>(result.error());
    EXPECT_EQ(err.code, FitErrorCode::InsufficientSamples);
    ASSERT_GE(err.timestep, 1u);
    ASSERT_LE(err.timestep, config.n_timestep - 2);
    EXPECT_GE(err.n_samples, 1u);
    EXPECT_LT(err.n_samples, config.order);

    // Regenerate the fit paths and check the reported date against them
    PathSimulator sim(GbmDynamics{.rate = config.rate, .volatility = config.volatility,
                                  .dt = config.dt()});
    RandomSource rng(config.seed, RandomStream::Pricing);
    PathTensor x = sim.simulate(config.n_path, config.n_timestep, config.spot, rng);

    auto in_the_money = [&](size_t t) {
        return static_cast<size_t>(
            (x.row(static_cast<Eigen::Index>(t)).array() < config.strike).count());
    };
    EXPECT_EQ(in_the_money(err.timestep), err.n_samples);
    // Later dates were fitted before the failure: empty or large enough
    for (size_t t = err.timestep + 1; t + 1 < config.n_timestep; ++t) {
        const size_t n = in_the_money(t);
        EXPECT_TRUE(n == 0 || n >= config.order) << "t=" << t << " n=" << n;
    }
}

TEST(LsmPricerTest, InTheMoneyAndFullRegressionAgree) {
    // Reduced-size comparison of the two regression modes over 20 seeds
    BiasStudyConfig study{.n_repetitions = 20, .first_seed = 1,
                          .reference_price = kReferencePrice};

    LsmConfig all_paths = reference_config();
    all_paths.n_path = 20000;
    LsmConfig itm_only = all_paths;
    itm_only.use_in_the_money = true;

    auto full = run_bias_study(all_paths, study);
    auto itm = run_bias_study(itm_only, study);
    ASSERT_TRUE(full.has_value()) << full.error();
    ASSERT_TRUE(itm.has_value()) << itm.error();

    for (const BiasStudyResult* r : {&*full, &*itm}) {
        ASSERT_EQ(r->npvs.size(), 20u);
        ASSERT_EQ(r->histogram.counts.size(), 20u);
        EXPECT_EQ(std::accumulate(r->histogram.counts.begin(), r->histogram.counts.end(),
                                  size_t{0}),
                  20u);
        EXPECT_GT(r->standard_error, 0.0);
        ASSERT_TRUE(r->bias.has_value());
        EXPECT_LT(std::abs(*r->bias), 0.003);
    }

    // The direction of the difference needs the full-size study; at this
    // size the two means agree within their standard errors
    const double se = std::hypot(full->standard_error, itm->standard_error);
    EXPECT_NEAR(itm->mean, full->mean, 4.0 * se);
}

}  // namespace
}  // namespace lsmc
