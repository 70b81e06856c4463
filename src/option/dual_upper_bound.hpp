// SPDX-License-Identifier: MIT
/**
 * @file dual_upper_bound.hpp
 * @brief Rogers dual upper bound with nested mini-path simulation
 *
 * For any martingale M with M[0] = 0, E[max_t (h[t] - M[t])] bounds the
 * American price from above. The martingale is built from the fitted
 * continuation function: at each date the increment is the realised value
 * max(h[t], c[t]) minus its one-step conditional expectation, estimated by
 * averaging over freshly simulated mini-paths.
 *
 * Cost: (n_timestep - 1) * n_path * n_minipath simulated endpoints.
 */

#pragma once

#include "src/math/tensor_types.hpp"
#include "src/option/backward_induction.hpp"
#include "src/option/payoff.hpp"
#include "src/simulation/path_simulator.hpp"
#include "src/simulation/random_source.hpp"
#include "src/support/error_types.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <expected>

namespace lsmc {

struct DualBoundResult {
    double upper_bound = 0.0;         ///< mean(per_path_bound)
    double stddev = 0.0;              ///< Standard error of upper_bound
    Eigen::VectorXd per_path_bound;   ///< max_t (h[t, p] - M[t, p])
    PathTensor martingale;            ///< M[t, p], row 0 is zero
};

/**
 * @brief Estimate the dual upper bound from a completed backward induction
 *
 * Only `x`, `h`, `c` and `beta` of the result are used.
 *
 * @param result Output of fit_and_value() or apply_and_value()
 * @param payoff Payoff the result was produced with
 * @param simulator Simulator with the same dynamics and dt as the outer paths
 * @param n_minipath Mini-paths per outer path and date (>= 1)
 * @param rng Random source for the mini-paths
 * @return Bound, or ValidationError for a bad mini-path count or
 *         inconsistent tensor shapes
 */
[[nodiscard]] std::expected<DualBoundResult, PricingError>
compute_upper_bound(const LsmResult& result,
                    const Payoff& payoff,
                    const PathSimulator& simulator,
                    size_t n_minipath,
                    RandomSource& rng);

}  // namespace lsmc
