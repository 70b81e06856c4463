// SPDX-License-Identifier: MIT
/**
 * @file lsm_config.hpp
 * @brief Construction-time parameters of a Longstaff-Schwartz pricing run
 */

#pragma once

#include "src/option/payoff.hpp"
#include "src/support/error_types.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>

namespace lsmc {

/**
 * @brief Model, simulation and regression parameters
 *
 * All parameters are in consistent units:
 * - Prices in currency units
 * - Time in years
 * - Rate and volatility as decimals (e.g., 0.05 for 5%)
 *
 * Dates are t = 0 (today) .. n_timestep - 1 (expiry), equally spaced by
 * dt = maturity / (n_timestep - 1).
 */
struct LsmConfig {
    double spot = 1.0;          ///< Spot price S0
    double strike = 1.0;        ///< Strike K (used by the default put payoff)
    double rate = 0.05;         ///< Continuously compounded risk-free rate
    double volatility = 0.2;    ///< Lognormal volatility
    double maturity = 1.0;      ///< Time to expiry in years
    size_t n_timestep = 64;     ///< Number of dates including today
    size_t n_path = 100000;     ///< Number of simulated paths per path set
    std::optional<uint64_t> seed;  ///< Omit for a non-reproducible run
    bool use_in_the_money = false;      ///< Regress on in-the-money paths only
    bool use_independent_paths = false; ///< Fit and value on separate path sets
    std::optional<Payoff> payoff;  ///< Defaults to Payoff::put(strike)
    size_t order = 3;           ///< Polynomial coefficients (degree + 1)

    double dt() const { return maturity / static_cast<double>(n_timestep - 1); }
};

/**
 * @brief Validate configuration
 *
 * Checks for:
 * - Positive, finite spot, strike, maturity and volatility
 * - Finite rate (negative rates allowed)
 * - n_timestep >= 2, n_path >= 1, order >= 1
 *
 * @return void on success, ValidationError on the first failing field
 */
std::expected<void, ValidationError> validate_lsm_config(const LsmConfig& config);

/**
 * @brief Convert a floating path count (e.g. 1.0e5) to an integral one
 *
 * Rejects non-finite, non-positive and non-integral values instead of
 * truncating them.
 */
std::expected<size_t, ValidationError> checked_path_count(double n_path);

}  // namespace lsmc
