// SPDX-License-Identifier: MIT
/**
 * @file payoff.hpp
 * @brief Exercise value as a pluggable elementwise function
 */

#pragma once

#include "src/math/tensor_types.hpp"
#include <functional>
#include <span>
#include <string>
#include <utility>

namespace lsmc {

/**
 * @brief Exercise payoff S -> h(S)
 *
 * Any payoff (put, call, custom) must be a pure function of the price: no
 * shared state, defined for zero and negative inputs. Array-shaped inputs
 * are handled by applying it elementwise.
 *
 * Thread-safety: const methods may be called concurrently as long as the
 * wrapped function is pure.
 */
class Payoff {
public:
    using Function = std::function<double(double)>;

    /// max(K - S, 0)
    static Payoff put(double strike);

    /// max(S - K, 0)
    static Payoff call(double strike);

    /// Wrap an arbitrary pure function
    static Payoff custom(Function fn, std::string name = "custom");

    double operator()(double price) const { return fn_(price); }

    /// out[i] = h(prices[i]); spans must have equal length
    void apply(std::span<const double> prices, std::span<double> out) const;

    /// Same-shaped tensor of exercise values
    PathTensor apply(const PathTensor& prices) const;

    const std::string& name() const { return name_; }

private:
    Payoff(Function fn, std::string name)
        : fn_(std::move(fn)), name_(std::move(name))
    {}

    Function fn_;
    std::string name_;
};

}  // namespace lsmc
