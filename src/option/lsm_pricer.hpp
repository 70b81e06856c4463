// SPDX-License-Identifier: MIT
/**
 * @file lsm_pricer.hpp
 * @brief American option pricing by least-squares Monte Carlo
 *
 * LongstaffSchwartzPricer sequences the path simulator, the backward
 * induction engine and (on request) the dual upper-bound estimator for one
 * validated LsmConfig. It holds no mutable state: every call builds its own
 * random source from the configured seed, so repeated calls with a seed
 * return bit-identical results.
 */

#pragma once

#include "src/option/backward_induction.hpp"
#include "src/option/dual_upper_bound.hpp"
#include "src/option/lsm_config.hpp"
#include "src/option/payoff.hpp"
#include "src/simulation/path_simulator.hpp"
#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>

namespace lsmc {

/**
 * @brief Longstaff-Schwartz pricer for a single-strike American option
 *
 * The LSM price is a lower bound (the exercise policy is estimated from a
 * finite sample); upper_bound() complements it with Rogers' dual bound.
 *
 * Independent-paths mode: coefficients are fitted on one path set and the
 * reported price comes from a second, freshly simulated set valued with
 * those coefficients held fixed. This removes the look-ahead bias of
 * fitting and valuing on the same paths.
 *
 * Thread-safety: All methods are const and thread-safe.
 */
class LongstaffSchwartzPricer {
public:
    /**
     * @brief Construct pricer without validation
     *
     * The config must already have passed validate_lsm_config(); an invalid
     * one (e.g. negative volatility) is priced without any error. Use
     * create() unless the config was validated by the caller.
     */
    explicit LongstaffSchwartzPricer(const LsmConfig& config);

    /// Factory with validation via validate_lsm_config()
    static std::expected<LongstaffSchwartzPricer, ValidationError>
    create(const LsmConfig& config) noexcept;

    /**
     * @brief Price the option
     *
     * @return Tensors, coefficients, npv and standard error; or the first
     *         FitError (with its timestep). No partial result is returned.
     */
    std::expected<LsmResult, PricingError> solve() const;

    /**
     * @brief Dual upper bound for a result produced by this pricer
     *
     * Mini-paths are drawn from a stream derived from the configured seed,
     * independent of the pricing stream.
     *
     * @param result Output of solve()
     * @param n_minipath Mini-paths per outer path and date (>= 1)
     */
    std::expected<DualBoundResult, PricingError>
    upper_bound(const LsmResult& result, size_t n_minipath) const;

    const LsmConfig& config() const { return config_; }
    const Payoff& payoff() const { return payoff_; }

    /// Per-step discount factor exp(-r dt)
    double discount_factor() const;

private:
    LsmConfig config_;
    Payoff payoff_;
    PathSimulator simulator_;
};

}  // namespace lsmc
