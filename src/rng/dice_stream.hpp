/**
 * DiceStream: Seeded PCG32 stream behind every dice roll.
 *
 * A 64-bit seed (derived from a seed string's SHA-256, see dice.hpp) is
 * expanded through SplitMix64 into PCG32 state and increment. Bounded draws
 * use Lemire's multiply-shift with rejection, so dice are unbiased.
 *
 * Header-only. Identical seeds give identical sequences on every platform.
 */

#ifndef STRAT_RNG_DICE_STREAM_HPP
#define STRAT_RNG_DICE_STREAM_HPP

#include <cstdint>

namespace strat::rng {

inline uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

class DiceStream {
public:
    explicit DiceStream(uint64_t seed) : seed_(seed) {
        state_ = splitmix64(seed);
        inc_ = (splitmix64(seed ^ 0xDA442D24ULL) << 1u) | 1u;
        next_u32();
    }

    uint32_t next_u32() {
        uint64_t old = state_;
        state_ = old * 6364136223846793005ULL + inc_;
        uint32_t xorshifted = static_cast<uint32_t>(((old >> 18u) ^ old) >> 27u);
        uint32_t rot = static_cast<uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-static_cast<int32_t>(rot)) & 31));
    }

    uint64_t next_u64() {
        uint64_t hi = next_u32();
        uint64_t lo = next_u32();
        return (hi << 32) | lo;
    }

    /** Unbiased draw in [0, n). n == 0 yields 0. */
    uint32_t uniform_u32(uint32_t n) {
        if (n == 0) return 0;
        uint64_t m = static_cast<uint64_t>(next_u32()) * n;
        uint32_t lo = static_cast<uint32_t>(m);
        if (lo < n) {
            uint32_t t = static_cast<uint32_t>(-n) % n;
            while (lo < t) {
                m = static_cast<uint64_t>(next_u32()) * n;
                lo = static_cast<uint32_t>(m);
            }
        }
        return static_cast<uint32_t>(m >> 32);
    }

    /** Inclusive range [lo, hi]; caller guarantees lo <= hi. */
    int64_t uniform_int(int64_t lo, int64_t hi) {
        uint64_t span = static_cast<uint64_t>(hi) - static_cast<uint64_t>(lo) + 1u;
        if (span == 0) {
            return static_cast<int64_t>(next_u64());   // full 64-bit range
        }
        if (span <= 0xFFFFFFFFULL) {
            return lo + static_cast<int64_t>(uniform_u32(static_cast<uint32_t>(span)));
        }
        uint64_t threshold = (0 - span) % span;
        uint64_t r = next_u64();
        while (r < threshold) r = next_u64();
        return static_cast<int64_t>(static_cast<uint64_t>(lo) + r % span);
    }

    /** One die with the given number of sides, 1..sides. */
    int roll_die(int sides) {
        return 1 + static_cast<int>(uniform_u32(static_cast<uint32_t>(sides)));
    }

    /** [0, 1) with 53 bits of precision. */
    double uniform01() {
        return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0);
    }

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
    uint64_t state_ = 0;
    uint64_t inc_ = 1;
};

} // namespace strat::rng

#endif // STRAT_RNG_DICE_STREAM_HPP
