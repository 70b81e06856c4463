// SPDX-License-Identifier: MIT
#include "src/option/lsm_config.hpp"
#include "src/support/lsmc_trace.h"
#include <cmath>

namespace lsmc {

namespace {

std::unexpected<ValidationError> reject(ValidationErrorCode code, double value) {
    LSMC_TRACE_VALIDATION_ERROR(LSMC_MODULE_PRICER, static_cast<int>(code), value);
    return std::unexpected(ValidationError(code, value));
}

}  // namespace

std::expected<void, ValidationError> validate_lsm_config(const LsmConfig& config) {
    if (config.spot <= 0.0 || !std::isfinite(config.spot)) {
        return reject(ValidationErrorCode::InvalidSpotPrice, config.spot);
    }
    if (config.strike <= 0.0 || !std::isfinite(config.strike)) {
        return reject(ValidationErrorCode::InvalidStrike, config.strike);
    }
    if (config.maturity <= 0.0 || !std::isfinite(config.maturity)) {
        return reject(ValidationErrorCode::InvalidMaturity, config.maturity);
    }
    if (config.volatility <= 0.0 || !std::isfinite(config.volatility)) {
        return reject(ValidationErrorCode::InvalidVolatility, config.volatility);
    }
    // Negative rates are allowed
    if (!std::isfinite(config.rate)) {
        return reject(ValidationErrorCode::InvalidRate, config.rate);
    }
    if (config.n_timestep < 2) {
        return reject(ValidationErrorCode::InvalidTimestepCount,
                      static_cast<double>(config.n_timestep));
    }
    if (config.n_path < 1) {
        return reject(ValidationErrorCode::InvalidPathCount,
                      static_cast<double>(config.n_path));
    }
    if (config.order < 1) {
        return reject(ValidationErrorCode::InvalidPolynomialOrder,
                      static_cast<double>(config.order));
    }
    return {};
}

std::expected<size_t, ValidationError> checked_path_count(double n_path) {
    // Above 2^53 consecutive integers are no longer representable
    constexpr double kMaxExactInteger = 9007199254740992.0;
    if (!std::isfinite(n_path) || n_path < 1.0 || std::floor(n_path) != n_path ||
        n_path > kMaxExactInteger) {
        return reject(ValidationErrorCode::InvalidPathCount, n_path);
    }
    return static_cast<size_t>(n_path);
}

}  // namespace lsmc
