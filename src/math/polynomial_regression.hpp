// SPDX-License-Identifier: MIT
/**
 * @file polynomial_regression.hpp
 * @brief Least-squares polynomial fitting and evaluation in one variable
 *
 * Coefficients are stored in ascending powers:
 *   p(x) = beta[0] + beta[1] x + ... + beta[order-1] x^(order-1)
 */

#pragma once

#include "src/support/error_types.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <expected>
#include <span>

namespace lsmc {

/**
 * @brief Fit a least-squares polynomial of degree `order - 1`
 *
 * Solves the Vandermonde system with a divide-and-conquer SVD. The design
 * matrix must have full column rank: a cross-section with (near) zero
 * variance, or fewer distinct abscissae than coefficients, is reported as
 * SingularDesign instead of returning a minimum-norm solution.
 *
 * @param x Abscissae (prices)
 * @param y Targets, same length as x
 * @param order Number of coefficients (>= 1)
 * @return Coefficients (size `order`), or FitError with `timestep` left at 0
 */
[[nodiscard]] std::expected<Eigen::VectorXd, FitError>
fit_polynomial(std::span<const double> x, std::span<const double> y, size_t order);

/// Evaluate polynomial at a single point (Horner)
inline double evaluate_polynomial(std::span<const double> coeffs, double x) noexcept {
    double acc = 0.0;
    for (size_t k = coeffs.size(); k-- > 0;) {
        acc = acc * x + coeffs[k];
    }
    return acc;
}

/// Evaluate polynomial over an array, out[i] = p(x[i])
void evaluate_polynomial(std::span<const double> coeffs,
                         std::span<const double> x,
                         std::span<double> out);

}  // namespace lsmc
