// SPDX-License-Identifier: MIT
#include "src/option/continuation_regression.hpp"
#include "src/math/polynomial_regression.hpp"
#include <cassert>
#include <vector>

namespace lsmc {

std::expected<ContinuationFit, FitError>
fit_continuation(std::span<const double> prices,
                 std::span<const double> targets,
                 std::span<const double> payoffs,
                 const RegressionConfig& config) {
    assert(prices.size() == targets.size());
    assert(prices.size() == payoffs.size());

    const auto order = static_cast<Eigen::Index>(config.order);

    if (!config.in_the_money_only) {
        auto beta = fit_polynomial(prices, targets, config.order);
        if (!beta.has_value()) {
            return std::unexpected(beta.error());
        }
        return ContinuationFit{std::move(beta.value()), prices.size()};
    }

    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(prices.size());
    ys.reserve(prices.size());
    for (size_t i = 0; i < prices.size(); ++i) {
        if (payoffs[i] > 0.0) {
            xs.push_back(prices[i]);
            ys.push_back(targets[i]);
        }
    }

    if (xs.empty()) {
        return ContinuationFit{Eigen::VectorXd::Zero(order), 0};
    }

    auto beta = fit_polynomial(xs, ys, config.order);
    if (!beta.has_value()) {
        return std::unexpected(beta.error());
    }
    return ContinuationFit{std::move(beta.value()), xs.size()};
}

}  // namespace lsmc
