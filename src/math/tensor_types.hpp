// SPDX-License-Identifier: MIT
/**
 * @file tensor_types.hpp
 * @brief Time-by-path tensor aliases shared by the simulator and the engines
 *
 * All tensors are indexed `[t, path]` and stored row-major, so the
 * cross-section at one date is a contiguous block of `n_path` doubles.
 */

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <span>

namespace lsmc {

/// Dense `n_timestep x n_path` tensor (prices, payoffs, values, continuation)
using PathTensor = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Regression coefficients, `n_timestep x order`, ascending powers per row
using CoefficientTensor = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Exercise decisions, `n_timestep x n_path`
using ExerciseTensor = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Read-only view of row `t` (the cross-section at one date)
inline std::span<const double> row_span(const PathTensor& m, Eigen::Index t) {
    return {m.data() + t * m.cols(), static_cast<size_t>(m.cols())};
}

/// Mutable view of row `t`
inline std::span<double> row_span(PathTensor& m, Eigen::Index t) {
    return {m.data() + t * m.cols(), static_cast<size_t>(m.cols())};
}

}  // namespace lsmc
