/**
 * Dice: Deterministic seeded randomness for every rules decision.
 *
 * A seed string "<campaign>:<day>:<part>:<label>" is hashed with SHA-256;
 * the first 8 digest bytes (big endian) seed a DiceStream. Every function
 * here is pure: the same seed and arguments always give the same result,
 * so a campaign can be replayed from its recorded (seed, notation) pairs.
 *
 * Usage:
 *   auto s = rng::seed(campaign_id, day, DayPart::MORNING, "battle_roll");
 *   int total = rng::roll_dice(s, "2d6").total;
 *   bool lost = rng::check_success(s + ":fork", 2.0 / 6.0, "1d6").success;
 */

#ifndef STRAT_RNG_DICE_HPP
#define STRAT_RNG_DICE_HPP

#include "core/enums.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace strat::rng {

/** Misuse of the dice API: bad notation, empty options, inverted range. */
class InvalidInput : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct DiceNotation {
    int count = 1;
    int sides = 6;
};

struct DiceRoll {
    std::string notation;
    std::vector<int> rolls;
    int total = 0;
    std::string seed;
};

template <typename T>
struct ChoiceResult {
    T choice;
    size_t index = 0;
    std::string seed;
};

struct IntResult {
    int64_t value = 0;
    int64_t min = 0;
    int64_t max = 0;
    std::string seed;
};

struct SuccessCheck {
    bool success = false;
    int roll = 0;
    int target = 0;
    double probability = 0.0;
    std::string seed;
};

// ── Seeds ──

/**
 * Build a seed string from campaign coordinates.
 * @throws InvalidInput if campaign_id or day is negative
 */
std::string seed(int64_t campaign_id, int day, const std::string& day_part,
                 const std::string& label);

std::string seed(int64_t campaign_id, int day, DayPart day_part,
                 const std::string& label);

/** First 8 bytes (big endian) of SHA-256(seed). */
uint64_t seed_to_u64(const std::string& seed);

// ── Dice ──

/**
 * Parse "NdM" (case-insensitive). N >= 1, M >= 2.
 * @throws InvalidInput on anything else
 */
DiceNotation parse_notation(const std::string& notation);

DiceRoll roll_dice(const std::string& seed, const std::string& notation = "2d6");

// ── Choice and bounded integers ──

/**
 * Uniform index in [0, count).
 * @throws InvalidInput if count is 0
 */
size_t random_index(const std::string& seed, size_t count);

template <typename T>
ChoiceResult<T> random_choice(const std::string& seed, const std::vector<T>& options) {
    if (options.empty()) throw InvalidInput("options list cannot be empty");
    size_t index = random_index(seed, options.size());
    return ChoiceResult<T>{options[index], index, seed};
}

/** @throws InvalidInput if min > max */
IntResult random_int(const std::string& seed, int64_t min, int64_t max);

/**
 * Index drawn with probability proportional to its weight.
 * @throws InvalidInput on empty weights, a negative weight, or a zero total
 */
size_t weighted_choice(const std::string& seed, const std::vector<double>& weights);

// ── Probability checks ──

/**
 * Exact distribution of the sum of `count` dice with `sides` faces,
 * indexed by total (entries below `count` are zero). Cached per (count, sides).
 */
const std::vector<double>& dice_distribution(int count, int sides);

/**
 * Smallest T with P(sum >= T) >= probability. probability <= 0 gives
 * max + 1 (never succeeds), probability >= 1 gives the minimum roll.
 */
int success_threshold(double probability, int count, int sides);

/**
 * Roll `notation` and succeed when the total reaches the threshold for
 * `probability`.
 * @throws InvalidInput if probability is outside [0, 1] or notation is bad
 */
SuccessCheck check_success(const std::string& seed, double probability,
                           const std::string& notation = "1d6");

} // namespace strat::rng

#endif // STRAT_RNG_DICE_HPP
