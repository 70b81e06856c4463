// SPDX-License-Identifier: MIT
#include "src/option/backward_induction.hpp"
#include "src/math/polynomial_regression.hpp"
#include "src/math/statistics.hpp"
#include "src/support/lsmc_trace.h"
#include "src/support/parallel.hpp"
#include <algorithm>
#include <optional>

namespace lsmc {

namespace {

/**
 * Shared recursion. Exactly one of `config` (fit mode) and `fixed_beta`
 * (apply mode) is set.
 */
std::expected<LsmResult, PricingError>
run_backward_induction(PathTensor x,
                       const Payoff& payoff,
                       double discount_factor,
                       std::optional<RegressionConfig> config,
                       const CoefficientTensor* fixed_beta) {
    const Eigen::Index n_t = x.rows();
    const Eigen::Index n_p = x.cols();

    if (n_t < 2) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTimestepCount,
                                               static_cast<double>(n_t)));
    }
    if (n_p < 1) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidPathCount,
                                               static_cast<double>(n_p)));
    }

    const Eigen::Index order = fixed_beta ? fixed_beta->cols()
                                          : static_cast<Eigen::Index>(config->order);

    LSMC_TRACE_ALGO_START(LSMC_MODULE_BACKWARD_INDUCTION, n_t, n_p, order);

    LsmResult r;
    r.discount_factor = discount_factor;
    r.h = payoff.apply(x);
    r.x = std::move(x);
    r.v = PathTensor::Zero(n_t, n_p);
    r.c = PathTensor::Zero(n_t, n_p);
    r.beta = CoefficientTensor::Zero(n_t, order);
    r.exercise = ExerciseTensor::Constant(n_t, n_p, false);

    // Expiry: exercise if in the money, otherwise expire worthless
    const Eigen::Index last = n_t - 1;
    r.v.row(last) = r.h.row(last);
    r.exercise.row(last) = r.h.row(last).array() > 0.0;

    for (Eigen::Index t = last - 1; t >= 1; --t) {
        r.v.row(t) = discount_factor * r.v.row(t + 1);

        if (fixed_beta) {
            r.beta.row(t) = fixed_beta->row(t);
        } else {
            auto fit = fit_continuation(row_span(r.x, t), row_span(r.v, t),
                                        row_span(r.h, t), *config);
            if (!fit.has_value()) {
                FitError err = fit.error();
                err.timestep = static_cast<size_t>(t);
                LSMC_TRACE_FIT_FAILED(t, static_cast<int>(err.code), err.n_samples);
                return std::unexpected(err);
            }
            if (fit->n_samples == 0) {
                LSMC_TRACE_EMPTY_IN_THE_MONEY(t, n_p);
            } else {
                LSMC_TRACE_REGRESSION_FIT(t, fit->n_samples, order);
            }
            r.beta.row(t) = fit->coefficients.transpose();
        }

        const std::span<const double> coeffs(r.beta.data() + t * order,
                                             static_cast<size_t>(order));
        evaluate_polynomial(coeffs, row_span(r.x, t), row_span(r.c, t));

        // Exercise where the payoff strictly beats the clamped continuation.
        // A negative regression estimate must not trigger exercise on its own.
        LSMC_PRAGMA_PARALLEL_FOR
        for (Eigen::Index p = 0; p < n_p; ++p) {
            const double h = r.h(t, p);
            if (h > std::max(r.c(t, p), 0.0)) {
                r.v(t, p) = h;
                r.exercise(t, p) = true;
            }
        }
    }

    // Today: no exercise decision
    r.v.row(0) = discount_factor * r.v.row(1);

    const auto v0 = row_span(r.v, 0);
    r.npv = sample_mean(v0);
    r.stddev = standard_error(v0);

    LSMC_TRACE_ALGO_COMPLETE(LSMC_MODULE_BACKWARD_INDUCTION, n_p, r.npv);
    return r;
}

}  // namespace

std::expected<LsmResult, PricingError>
fit_and_value(PathTensor x,
              const Payoff& payoff,
              double discount_factor,
              const RegressionConfig& config) {
    if (config.order < 1) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidPolynomialOrder,
                                               static_cast<double>(config.order)));
    }
    return run_backward_induction(std::move(x), payoff, discount_factor, config, nullptr);
}

std::expected<LsmResult, PricingError>
apply_and_value(PathTensor x,
                const Payoff& payoff,
                double discount_factor,
                const CoefficientTensor& beta) {
    if (beta.rows() != x.rows()) {
        return std::unexpected(ValidationError(ValidationErrorCode::ShapeMismatch,
                                               static_cast<double>(beta.rows()),
                                               static_cast<size_t>(x.rows())));
    }
    if (beta.cols() < 1) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidPolynomialOrder,
                                               static_cast<double>(beta.cols())));
    }
    return run_backward_induction(std::move(x), payoff, discount_factor, std::nullopt, &beta);
}

}  // namespace lsmc
