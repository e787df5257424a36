// rng.hpp: explicit, seedable random streams (no global generator)
#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace core {

/**
 * @brief SplitMix64 generator satisfying UniformRandomBitGenerator.
 * @note Each stream owns its state; pass streams by reference, never share
 *       one across threads.
 */
struct SplitMix64 {
    using result_type = std::uint64_t;
    std::uint64_t state;

    explicit SplitMix64(std::uint64_t seed = 0x9E3779B97F4A7C15ULL) noexcept : state(seed) {}

    static constexpr result_type min() noexcept { return std::numeric_limits<result_type>::min(); }
    static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

    inline std::uint64_t next_u64() noexcept {
        std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }
    inline result_type operator()() noexcept { return next_u64(); }

    inline double next_unit_double() noexcept {
        // 53-bit mantissa
        return (next_u64() >> 11) * (1.0 / (1ull << 53));
    }
};

inline std::uint64_t splitmix_hash(std::uint64_t x) noexcept {
    SplitMix64 sm(x);
    return sm.next_u64();
}

// Unbiased mapping of a 64-bit URBG output to [0, n) using Lemire's
// multiply-high method with a tiny rejection loop.
// Precondition: n > 0.
template <class URBG>
inline std::uint64_t uniform_bounded(URBG& rng, std::uint64_t n) noexcept {
    using u128 = unsigned __int128;
    std::uint64_t x = rng();
    u128 m = (u128)x * (u128)n;
    std::uint64_t l = (std::uint64_t)m;
    if (l < n) {
        const std::uint64_t t = (-n) % n;
        while (l < t) { x = rng(); m = (u128)x * (u128)n; l = (std::uint64_t)m; }
    }
    return (std::uint64_t)(m >> 64);
}

// Derive one independent seed per job from a master seed. Job j always gets
// the same seed for a given master, whatever order jobs run in.
inline std::vector<std::uint64_t> seed_jobs(std::size_t jobs, std::uint64_t master_seed) {
    SplitMix64 master(master_seed);
    std::vector<std::uint64_t> seeds(jobs);
    for (std::size_t i = 0; i < jobs; ++i) seeds[i] = splitmix_hash(master());
    return seeds;
}

} // namespace core
