// SPDX-License-Identifier: MIT
#include "src/simulation/path_simulator.hpp"
#include "src/support/lsmc_trace.h"
#include "src/support/parallel.hpp"
#include <cmath>

namespace lsmc {

PathTensor PathSimulator::simulate(size_t n_path, size_t n_timestep, double s0,
                                   RandomSource& rng) const {
    const auto rows = static_cast<Eigen::Index>(n_timestep);
    const auto cols = static_cast<Eigen::Index>(n_path);

    LSMC_TRACE_ALGO_START(LSMC_MODULE_PATH_SIMULATOR, n_timestep, n_path, 0);

    PathTensor x(rows, cols);
    if (rows == 0 || cols == 0) {
        return x;
    }

    // Cumulative log-price increments, accumulated in place row by row
    const double mu = drift();
    const double sd = diffusion();
    x.row(0).setZero();
    for (Eigen::Index t = 1; t < rows; ++t) {
        for (Eigen::Index p = 0; p < cols; ++p) {
            x(t, p) = x(t - 1, p) + mu + sd * rng.normal();
        }
    }

    x.row(0).setConstant(s0);
    for (Eigen::Index t = 1; t < rows; ++t) {
        auto row = row_span(x, t);
        LSMC_PRAGMA_SIMD
        for (size_t p = 0; p < row.size(); ++p) {
            row[p] = s0 * std::exp(row[p]);
        }
    }
    return x;
}

MiniPathBundle PathSimulator::simulate_minipaths(std::span<const double> origins,
                                                 size_t n_minipath,
                                                 RandomSource& rng) const {
    const auto n_origin = static_cast<Eigen::Index>(origins.size());
    const auto cols = static_cast<Eigen::Index>(n_minipath);

    MiniPathBundle bundle;
    bundle.start = Eigen::Map<const Eigen::VectorXd>(origins.data(), n_origin);
    bundle.terminal.resize(n_origin, cols);

    const double mu = drift();
    const double sd = diffusion();
    for (Eigen::Index i = 0; i < n_origin; ++i) {
        for (Eigen::Index j = 0; j < cols; ++j) {
            bundle.terminal(i, j) = mu + sd * rng.normal();
        }
    }

    LSMC_PRAGMA_PARALLEL_FOR
    for (Eigen::Index i = 0; i < n_origin; ++i) {
        const double s0 = origins[static_cast<size_t>(i)];
        for (Eigen::Index j = 0; j < cols; ++j) {
            bundle.terminal(i, j) = s0 * std::exp(bundle.terminal(i, j));
        }
    }
    return bundle;
}

}  // namespace lsmc
