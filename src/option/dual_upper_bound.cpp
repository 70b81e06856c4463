// SPDX-License-Identifier: MIT
#include "src/option/dual_upper_bound.hpp"
#include "src/math/polynomial_regression.hpp"
#include "src/math/statistics.hpp"
#include "src/support/lsmc_trace.h"
#include "src/support/parallel.hpp"
#include <algorithm>
#include <span>

namespace lsmc {

namespace {

std::expected<void, ValidationError> validate_shapes(const LsmResult& r) {
    const Eigen::Index n_t = r.x.rows();
    const Eigen::Index n_p = r.x.cols();
    if (n_t < 2) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTimestepCount,
                                               static_cast<double>(n_t)));
    }
    if (n_p < 1) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidPathCount,
                                               static_cast<double>(n_p)));
    }
    if (r.h.rows() != n_t || r.h.cols() != n_p) {
        return std::unexpected(ValidationError(ValidationErrorCode::ShapeMismatch,
                                               static_cast<double>(r.h.size()), 0));
    }
    if (r.c.rows() != n_t || r.c.cols() != n_p) {
        return std::unexpected(ValidationError(ValidationErrorCode::ShapeMismatch,
                                               static_cast<double>(r.c.size()), 1));
    }
    if (r.beta.rows() != n_t || r.beta.cols() < 1) {
        return std::unexpected(ValidationError(ValidationErrorCode::ShapeMismatch,
                                               static_cast<double>(r.beta.rows()), 2));
    }
    return {};
}

}  // namespace

std::expected<DualBoundResult, PricingError>
compute_upper_bound(const LsmResult& result,
                    const Payoff& payoff,
                    const PathSimulator& simulator,
                    size_t n_minipath,
                    RandomSource& rng) {
    if (n_minipath < 1) {
        LSMC_TRACE_VALIDATION_ERROR(LSMC_MODULE_DUAL_BOUND,
                                    static_cast<int>(ValidationErrorCode::InvalidMinipathCount),
                                    0.0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidMinipathCount, 0.0));
    }
    auto shapes = validate_shapes(result);
    if (!shapes.has_value()) {
        return std::unexpected(shapes.error());
    }

    const Eigen::Index n_t = result.x.rows();
    const Eigen::Index n_p = result.x.cols();
    const Eigen::Index order = result.beta.cols();
    const double inv_m = 1.0 / static_cast<double>(n_minipath);

    LSMC_TRACE_ALGO_START(LSMC_MODULE_DUAL_BOUND, n_t, n_p, n_minipath);

    DualBoundResult out;
    out.martingale = PathTensor::Zero(n_t, n_p);
    out.per_path_bound = result.h.row(0).transpose();  // t = 0 term, M[0] = 0

    Eigen::VectorXd increment(n_p);

    for (Eigen::Index t = 1; t < n_t; ++t) {
        // Mini-paths are drawn sequentially; everything after is per-path
        MiniPathBundle mini = simulator.simulate_minipaths(row_span(result.x, t - 1),
                                                           n_minipath, rng);
        const std::span<const double> beta_t(result.beta.data() + t * order,
                                             static_cast<size_t>(order));

        LSMC_PRAGMA_PARALLEL_FOR_STATIC
        for (Eigen::Index p = 0; p < n_p; ++p) {
            double sum = 0.0;
            for (Eigen::Index j = 0; j < mini.terminal.cols(); ++j) {
                const double s = mini.terminal(p, j);
                sum += std::max(payoff(s), evaluate_polynomial(beta_t, s));
            }
            const double expected_value = sum * inv_m;
            const double realised = std::max(result.h(t, p), result.c(t, p));
            increment(p) = realised - expected_value;

            const double m = out.martingale(t - 1, p) + increment(p);
            out.martingale(t, p) = m;
            out.per_path_bound(p) = std::max(out.per_path_bound(p), result.h(t, p) - m);
        }

        LSMC_TRACE_DUAL_STEP(t, n_minipath, increment.mean());
    }

    const std::span<const double> bound(out.per_path_bound.data(),
                                        static_cast<size_t>(out.per_path_bound.size()));
    out.upper_bound = sample_mean(bound);
    out.stddev = standard_error(bound);

    LSMC_TRACE_ALGO_COMPLETE(LSMC_MODULE_DUAL_BOUND, n_p, out.upper_bound);
    return out;
}

}  // namespace lsmc
