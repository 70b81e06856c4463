// SPDX-License-Identifier: MIT
/**
 * @file backward_induction.hpp
 * @brief Longstaff-Schwartz dynamic programming over simulated paths
 *
 * Moves backward from expiry to today. At every interior date the value of
 * continuing is estimated by regressing discounted next-date values on the
 * current price; a path is exercised when its payoff strictly exceeds
 * max(continuation, 0).
 *
 * Two modes run the same recursion:
 * - fit_and_value(): regress at every date and return the coefficients
 * - apply_and_value(): reuse coefficients fitted on an independent path set
 */

#pragma once

#include "src/math/tensor_types.hpp"
#include "src/option/continuation_regression.hpp"
#include "src/option/payoff.hpp"
#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>

namespace lsmc {

/**
 * @brief Complete output of one backward induction run
 *
 * Tensors are `n_timestep x n_path` (beta is `n_timestep x order`). The
 * first and last rows of `c` and `beta` are zero: no regression is made
 * today or at expiry.
 */
struct LsmResult {
    PathTensor x;               ///< Simulated prices
    PathTensor h;               ///< Exercise values h(x)
    PathTensor v;               ///< Value along each path under the fitted policy
    PathTensor c;               ///< Regression estimate of the continuation value
    CoefficientTensor beta;     ///< Continuation polynomial per date
    ExerciseTensor exercise;    ///< True where the policy stops (or expires in the money)
    double discount_factor = 1.0;  ///< Per-step exp(-r dt)
    double npv = 0.0;           ///< mean(v[0, :])
    double stddev = 0.0;        ///< Standard error of npv

    size_t n_timestep() const { return static_cast<size_t>(x.rows()); }
    size_t n_path() const { return static_cast<size_t>(x.cols()); }
    size_t order() const { return static_cast<size_t>(beta.cols()); }
};

/**
 * @brief Run the recursion, fitting a continuation polynomial at each date
 *
 * @param x Price tensor with at least two dates and one path
 * @param payoff Exercise value
 * @param discount_factor Per-step discount factor exp(-r dt)
 * @param config Polynomial order and in-the-money restriction
 * @return Result, or FitError (with the failing timestep) if any fit fails
 */
[[nodiscard]] std::expected<LsmResult, PricingError>
fit_and_value(PathTensor x,
              const Payoff& payoff,
              double discount_factor,
              const RegressionConfig& config);

/**
 * @brief Run the recursion with fixed continuation coefficients
 *
 * Rows of `beta` for interior dates are used as-is; no regression is done.
 *
 * @param beta Coefficients, `x.rows() x order`
 * @return Result, or ValidationError(ShapeMismatch) if `beta` does not
 *         have one row per date
 */
[[nodiscard]] std::expected<LsmResult, PricingError>
apply_and_value(PathTensor x,
                const Payoff& payoff,
                double discount_factor,
                const CoefficientTensor& beta);

}  // namespace lsmc
