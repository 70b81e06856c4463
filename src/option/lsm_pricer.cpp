// SPDX-License-Identifier: MIT
#include "src/option/lsm_pricer.hpp"
#include "src/simulation/random_source.hpp"
#include "src/support/lsmc_trace.h"
#include <cmath>

namespace lsmc {

LongstaffSchwartzPricer::LongstaffSchwartzPricer(const LsmConfig& config)
    : config_(config)
    , payoff_(config.payoff.value_or(Payoff::put(config.strike)))
    , simulator_(GbmDynamics{
          .rate = config.rate,
          .volatility = config.volatility,
          .dt = config.dt(),
      })
{}

std::expected<LongstaffSchwartzPricer, ValidationError>
LongstaffSchwartzPricer::create(const LsmConfig& config) noexcept {
    auto validation = validate_lsm_config(config);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }
    return LongstaffSchwartzPricer(config);
}

double LongstaffSchwartzPricer::discount_factor() const {
    return std::exp(-config_.rate * config_.dt());
}

std::expected<LsmResult, PricingError> LongstaffSchwartzPricer::solve() const {
    LSMC_TRACE_ALGO_START(LSMC_MODULE_PRICER, config_.n_timestep, config_.n_path, config_.order);

    RandomSource rng(config_.seed, RandomStream::Pricing);
    const RegressionConfig regression{
        .order = config_.order,
        .in_the_money_only = config_.use_in_the_money,
    };
    const double df = discount_factor();

    PathTensor fit_paths = simulator_.simulate(config_.n_path, config_.n_timestep,
                                               config_.spot, rng);
    auto fitted = fit_and_value(std::move(fit_paths), payoff_, df, regression);
    if (!fitted.has_value() || !config_.use_independent_paths) {
        if (fitted.has_value()) {
            LSMC_TRACE_ALGO_COMPLETE(LSMC_MODULE_PRICER, config_.n_path, fitted->npv);
        }
        return fitted;
    }

    // Second pass: fresh paths from the same stream, coefficients held fixed
    PathTensor value_paths = simulator_.simulate(config_.n_path, config_.n_timestep,
                                                 config_.spot, rng);
    auto valued = apply_and_value(std::move(value_paths), payoff_, df, fitted->beta);
    if (valued.has_value()) {
        LSMC_TRACE_ALGO_COMPLETE(LSMC_MODULE_PRICER, config_.n_path, valued->npv);
    }
    return valued;
}

std::expected<DualBoundResult, PricingError>
LongstaffSchwartzPricer::upper_bound(const LsmResult& result, size_t n_minipath) const {
    RandomSource rng(config_.seed, RandomStream::DualBound);
    return compute_upper_bound(result, payoff_, simulator_, n_minipath, rng);
}

}  // namespace lsmc
