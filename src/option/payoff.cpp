// SPDX-License-Identifier: MIT
#include "src/option/payoff.hpp"
#include "src/support/parallel.hpp"
#include <algorithm>
#include <cassert>

namespace lsmc {

Payoff Payoff::put(double strike) {
    return Payoff([strike](double s) { return std::max(strike - s, 0.0); }, "put");
}

Payoff Payoff::call(double strike) {
    return Payoff([strike](double s) { return std::max(s - strike, 0.0); }, "call");
}

Payoff Payoff::custom(Function fn, std::string name) {
    return Payoff(std::move(fn), std::move(name));
}

void Payoff::apply(std::span<const double> prices, std::span<double> out) const {
    assert(prices.size() == out.size());
    const size_t n = prices.size();

    LSMC_PRAGMA_PARALLEL_FOR
    for (size_t i = 0; i < n; ++i) {
        out[i] = fn_(prices[i]);
    }
}

PathTensor Payoff::apply(const PathTensor& prices) const {
    PathTensor h(prices.rows(), prices.cols());
    apply(std::span<const double>(prices.data(), static_cast<size_t>(prices.size())),
          std::span<double>(h.data(), static_cast<size_t>(h.size())));
    return h;
}

}  // namespace lsmc
