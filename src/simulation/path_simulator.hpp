// SPDX-License-Identifier: MIT
/**
 * @file path_simulator.hpp
 * @brief Geometric Brownian motion paths under the risk-neutral measure
 */

#pragma once

#include "src/math/tensor_types.hpp"
#include "src/simulation/random_source.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstddef>
#include <span>

namespace lsmc {

/// GBM parameters for one simulation grid
struct GbmDynamics {
    double rate = 0.0;        ///< Risk-free rate (drift under Q)
    double volatility = 0.0;  ///< Lognormal volatility
    double dt = 0.0;          ///< Time between consecutive dates (years)
};

/**
 * @brief One-step mini-path bundles used for conditional expectations
 *
 * Every origin i has `n_minipath` two-date paths: date 0 is `start[i]`,
 * date 1 is `terminal(i, j)`.
 */
struct MiniPathBundle {
    Eigen::VectorXd start;  ///< Origin prices, size n_origin
    PathTensor terminal;    ///< Endpoints, n_origin x n_minipath

    size_t n_origin() const { return static_cast<size_t>(terminal.rows()); }
    size_t n_minipath() const { return static_cast<size_t>(terminal.cols()); }
};

/**
 * @brief GBM path generator
 *
 * Holds only the dynamics; the random source is passed explicitly to every
 * call so the caller controls seeding and stream order.
 *
 * log S(t+dt) - log S(t) = (r - sigma^2/2) dt + sigma sqrt(dt) Z
 */
class PathSimulator {
public:
    explicit PathSimulator(const GbmDynamics& dynamics)
        : dynamics_(dynamics)
    {}

    /**
     * @brief Simulate full-length paths from a common start value
     *
     * Draws are consumed time-major: every path's step-1 increment, then
     * every path's step-2 increment, and so on. Row 0 equals `s0` exactly.
     *
     * @param n_path Number of paths (columns)
     * @param n_timestep Number of dates including today (rows)
     * @param s0 Start value
     * @param rng Random source, advanced by (n_timestep - 1) * n_path draws
     * @return Price tensor, n_timestep x n_path
     */
    PathTensor simulate(size_t n_path, size_t n_timestep, double s0, RandomSource& rng) const;

    /**
     * @brief Simulate one bundle of one-step mini-paths per origin price
     *
     * Draws are consumed origin-major.
     *
     * @param origins Start price of each bundle
     * @param n_minipath Mini-paths per bundle
     * @param rng Random source, advanced by origins.size() * n_minipath draws
     */
    MiniPathBundle simulate_minipaths(std::span<const double> origins,
                                      size_t n_minipath,
                                      RandomSource& rng) const;

    const GbmDynamics& dynamics() const { return dynamics_; }

private:
    double drift() const {
        return (dynamics_.rate - 0.5 * dynamics_.volatility * dynamics_.volatility) * dynamics_.dt;
    }

    double diffusion() const {
        return dynamics_.volatility * std::sqrt(dynamics_.dt);
    }

    GbmDynamics dynamics_;
};

}  // namespace lsmc
