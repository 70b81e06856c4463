// SPDX-License-Identifier: MIT
/**
 * @file random_source.hpp
 * @brief Explicitly seeded Gaussian generator handle
 */

#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace lsmc {

/// Stream ids used by the pricer; one seed feeds every stream
enum class RandomStream : uint32_t {
    Pricing = 0,     ///< Outer paths (both passes of the independent-paths protocol)
    DualBound = 1,   ///< Mini-paths of the upper-bound estimator
};

/**
 * @brief Gaussian random source threaded through the path simulator
 *
 * Wraps a 64-bit Mersenne Twister seeded from (seed, stream) through
 * std::seed_seq, so a single user seed yields independent, deterministic
 * substreams. Without a seed the generator is seeded from std::random_device
 * and the run is not reproducible.
 *
 * Not thread-safe: draws must happen in a fixed sequential order.
 */
class RandomSource {
public:
    explicit RandomSource(std::optional<uint64_t> seed,
                          RandomStream stream = RandomStream::Pricing)
        : engine_(make_engine(seed, stream))
    {}

    /// Standard normal draw
    double normal() { return normal_(engine_); }

    std::mt19937_64& engine() { return engine_; }

private:
    static std::mt19937_64 make_engine(std::optional<uint64_t> seed, RandomStream stream) {
        uint64_t s = 0;
        if (seed.has_value()) {
            s = *seed;
        } else {
            std::random_device rd;
            s = (static_cast<uint64_t>(rd()) << 32) ^ rd();
        }
        std::seed_seq seq{
            static_cast<uint32_t>(s & 0xffffffffu),
            static_cast<uint32_t>(s >> 32),
            static_cast<uint32_t>(stream)};
        return std::mt19937_64(seq);
    }

    std::mt19937_64 engine_;
    std::normal_distribution<double> normal_{0.0, 1.0};
};

}  // namespace lsmc
