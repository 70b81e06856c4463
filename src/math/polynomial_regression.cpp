// SPDX-License-Identifier: MIT
#include "src/math/polynomial_regression.hpp"
#include "src/support/parallel.hpp"
#include <cassert>
#include <cmath>

namespace lsmc {

namespace {

/// Relative singular-value cutoff below which a column is considered dependent
constexpr double kRankThreshold = 1e-12;

}  // namespace

std::expected<Eigen::VectorXd, FitError>
fit_polynomial(std::span<const double> x, std::span<const double> y, size_t order) {
    assert(x.size() == y.size());
    assert(order >= 1);

    const size_t n = x.size();
    if (n < order) {
        return std::unexpected(FitError{
            .code = FitErrorCode::InsufficientSamples,
            .n_samples = n,
        });
    }

    const auto rows = static_cast<Eigen::Index>(n);
    const auto cols = static_cast<Eigen::Index>(order);

    Eigen::MatrixXd A(rows, cols);
    Eigen::VectorXd b(rows);
    for (Eigen::Index i = 0; i < rows; ++i) {
        double power = 1.0;
        for (Eigen::Index k = 0; k < cols; ++k) {
            A(i, k) = power;
            power *= x[static_cast<size_t>(i)];
        }
        b(i) = y[static_cast<size_t>(i)];
    }

    Eigen::BDCSVD<Eigen::MatrixXd> svd(A, Eigen::ComputeThinU | Eigen::ComputeThinV);
    svd.setThreshold(kRankThreshold);

    const auto rank = static_cast<size_t>(svd.rank());
    if (rank < order) {
        return std::unexpected(FitError{
            .code = FitErrorCode::SingularDesign,
            .n_samples = n,
            .rank = rank,
        });
    }

    Eigen::VectorXd beta = svd.solve(b);
    if (!beta.allFinite()) {
        return std::unexpected(FitError{
            .code = FitErrorCode::NonFiniteCoefficients,
            .n_samples = n,
            .rank = rank,
        });
    }
    return beta;
}

void evaluate_polynomial(std::span<const double> coeffs,
                         std::span<const double> x,
                         std::span<double> out) {
    assert(x.size() == out.size());
    const size_t n = x.size();

    LSMC_PRAGMA_PARALLEL_FOR
    for (size_t i = 0; i < n; ++i) {
        out[i] = evaluate_polynomial(coeffs, x[i]);
    }
}

}  // namespace lsmc
