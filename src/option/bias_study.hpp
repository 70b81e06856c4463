// SPDX-License-Identifier: MIT
/**
 * @file bias_study.hpp
 * @brief Repeated seeded pricing runs to measure the bias of the LSM estimate
 *
 * Runs the same configuration with seeds first_seed, first_seed + 1, ...
 * and summarises the distribution of npv. Comparing two studies (e.g. with
 * and without the in-the-money restriction) against a reference price shows
 * which configuration is less biased.
 */

#pragma once

#include "src/math/statistics.hpp"
#include "src/option/lsm_config.hpp"
#include "src/support/error_types.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

namespace lsmc {

struct BiasStudyConfig {
    size_t n_repetitions = 50;
    uint64_t first_seed = 1;
    size_t n_bins = 20;                    ///< Histogram bins
    std::optional<double> reference_price; ///< E.g. a finite-difference value
};

struct BiasStudyResult {
    std::vector<double> npvs;       ///< One price per repetition, in seed order
    double mean = 0.0;              ///< Mean of npvs
    double standard_error = 0.0;    ///< Standard error of the mean over repetitions
    std::optional<double> bias;     ///< mean - reference_price, if a reference was given
    Histogram histogram;            ///< Distribution of npvs
};

/**
 * @brief Price `n_repetitions` times with consecutive seeds
 *
 * The seed in `config` is ignored. The first failing repetition aborts the
 * study and its error is returned.
 */
[[nodiscard]] std::expected<BiasStudyResult, PricingError>
run_bias_study(const LsmConfig& config, const BiasStudyConfig& study);

}  // namespace lsmc
