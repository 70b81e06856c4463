// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>
#include <variant>

namespace lsmc {

/// Error codes for parameter validation failures
enum class ValidationErrorCode {
    InvalidSpotPrice,
    InvalidStrike,
    InvalidMaturity,
    InvalidVolatility,
    InvalidRate,
    InvalidPathCount,
    InvalidTimestepCount,
    InvalidPolynomialOrder,
    InvalidMinipathCount,
    InvalidRepetitionCount,
    ShapeMismatch
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Optional index for array/tensor errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                    double value = 0.0,
                    size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Error codes for continuation-value regression failures
enum class FitErrorCode {
    InsufficientSamples,   ///< Fewer regression samples than coefficients
    SingularDesign,        ///< Design matrix is rank deficient
    NonFiniteCoefficients  ///< Solve produced NaN or Inf
};

/// Detailed regression failure
///
/// `timestep` is filled in by the backward induction engine; the
/// regressor itself does not know which date it is fitting.
struct FitError {
    FitErrorCode code;
    size_t timestep = 0;   ///< Timestep whose regression failed
    size_t n_samples = 0;  ///< Number of samples fed to the fit
    size_t rank = 0;       ///< Numerical rank of the design matrix (if computed)
};

/// Any failure surfaced by the pricing facade
using PricingError = std::variant<ValidationError, FitError>;

/// Get error code as integer for diagnostics
inline int error_code(const PricingError& error) {
    return std::visit([](const auto& e) -> int {
        return static_cast<int>(e.code);
    }, error);
}

inline bool is_fit_error(const PricingError& error) {
    return std::holds_alternative<FitError>(error);
}

inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const FitError& err) {
    os << "FitError{code=" << static_cast<int>(err.code)
       << ", timestep=" << err.timestep
       << ", n_samples=" << err.n_samples
       << ", rank=" << err.rank << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const PricingError& err) {
    std::visit([&os](const auto& e) { os << e; }, err);
    return os;
}

}  // namespace lsmc
