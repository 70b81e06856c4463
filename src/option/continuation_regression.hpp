// SPDX-License-Identifier: MIT
/**
 * @file continuation_regression.hpp
 * @brief Continuation-value regression on one cross-section of paths
 */

#pragma once

#include "src/support/error_types.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <expected>
#include <span>

namespace lsmc {

/// Regression settings shared by every date of a run
struct RegressionConfig {
    size_t order = 3;               ///< Number of coefficients (degree + 1)
    bool in_the_money_only = false; ///< Fit only on paths with payoff > 0
};

/// Fitted continuation function at one date
struct ContinuationFit {
    Eigen::VectorXd coefficients;  ///< Ascending powers, size `order`
    size_t n_samples = 0;          ///< Paths used in the fit (0 for an empty in-the-money set)
};

/**
 * @brief Fit price -> discounted future value at one date
 *
 * With `in_the_money_only`, only paths whose payoff is strictly positive
 * enter the fit. If that subset is empty no path can be exercised at this
 * date anyway, so the continuation function is the zero polynomial and
 * `n_samples` is 0. A non-empty subset smaller than `order`, or a
 * rank-deficient cross-section, is a FitError.
 *
 * @param prices Cross-section x[t, :]
 * @param targets Discounted values v[t, :] (already multiplied by the discount factor)
 * @param payoffs Exercise values h[t, :]
 * @param config Polynomial order and subset selection
 */
[[nodiscard]] std::expected<ContinuationFit, FitError>
fit_continuation(std::span<const double> prices,
                 std::span<const double> targets,
                 std::span<const double> payoffs,
                 const RegressionConfig& config);

}  // namespace lsmc
