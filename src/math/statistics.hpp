// SPDX-License-Identifier: MIT
/**
 * @file statistics.hpp
 * @brief Sample statistics for Monte Carlo estimates
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace lsmc {

/// Arithmetic mean (0 for an empty sample)
inline double sample_mean(std::span<const double> xs) noexcept {
    if (xs.empty()) return 0.0;
    double sum = 0.0;
    for (double x : xs) sum += x;
    return sum / static_cast<double>(xs.size());
}

/// Population standard deviation (divides by n)
inline double sample_stddev(std::span<const double> xs) noexcept {
    if (xs.empty()) return 0.0;
    const double mean = sample_mean(xs);
    double ss = 0.0;
    for (double x : xs) {
        const double d = x - mean;
        ss += d * d;
    }
    return std::sqrt(ss / static_cast<double>(xs.size()));
}

/// Standard error of the mean: stddev / sqrt(n)
inline double standard_error(std::span<const double> xs) noexcept {
    if (xs.empty()) return 0.0;
    return sample_stddev(xs) / std::sqrt(static_cast<double>(xs.size()));
}

/// Equal-width histogram over [lower, upper]
struct Histogram {
    double lower = 0.0;
    double upper = 0.0;
    std::vector<size_t> counts;

    double bin_width() const {
        return counts.empty() ? 0.0 : (upper - lower) / static_cast<double>(counts.size());
    }

    /// Centre of bin i
    double bin_center(size_t i) const {
        return lower + (static_cast<double>(i) + 0.5) * bin_width();
    }
};

/**
 * @brief Bin a sample into `n_bins` equal-width bins spanning its range
 *
 * The maximum lands in the last bin. A degenerate sample (all values equal)
 * puts everything in bin 0 of a zero-width histogram.
 */
inline Histogram make_histogram(std::span<const double> xs, size_t n_bins) {
    Histogram hist;
    if (xs.empty() || n_bins == 0) return hist;

    auto [lo, hi] = std::minmax_element(xs.begin(), xs.end());
    hist.lower = *lo;
    hist.upper = *hi;
    hist.counts.assign(n_bins, 0);

    const double width = hist.bin_width();
    for (double x : xs) {
        size_t bin = 0;
        if (width > 0.0) {
            bin = static_cast<size_t>((x - hist.lower) / width);
            bin = std::min(bin, n_bins - 1);
        }
        ++hist.counts[bin];
    }
    return hist;
}

}  // namespace lsmc
