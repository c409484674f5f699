/**
 * Dice Implementation: seed hashing, notation parsing, exact thresholds
 */

#include "rng/dice.hpp"
#include "rng/dice_stream.hpp"
#include <openssl/evp.h>
#include <cmath>
#include <map>
#include <mutex>
#include <regex>
#include <utility>

namespace strat::rng {

namespace {

// Float drift allowed when comparing cumulative sums (2/6 on 1d6 must hit 5+).
constexpr double kProbabilityEpsilon = 1e-12;

std::mutex g_distribution_mutex;
std::map<std::pair<int, int>, std::vector<double>> g_distributions;

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Seeds
// ═══════════════════════════════════════════════════════════════

std::string seed(int64_t campaign_id, int day, const std::string& day_part,
                 const std::string& label) {
    if (campaign_id < 0) {
        throw InvalidInput("campaign_id must be non-negative, got " + std::to_string(campaign_id));
    }
    if (day < 0) {
        throw InvalidInput("day must be non-negative, got " + std::to_string(day));
    }
    return std::to_string(campaign_id) + ":" + std::to_string(day) + ":" +
           day_part + ":" + label;
}

std::string seed(int64_t campaign_id, int day, DayPart day_part, const std::string& label) {
    return seed(campaign_id, day, std::string(day_part_to_string(day_part)), label);
}

uint64_t seed_to_u64(const std::string& seed) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(seed.data(), seed.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1 ||
        digest_len < 8) {
        throw std::runtime_error("SHA-256 digest failed for seed: " + seed);
    }
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | digest[i];
    }
    return value;
}

// ═══════════════════════════════════════════════════════════════
// Dice
// ═══════════════════════════════════════════════════════════════

DiceNotation parse_notation(const std::string& notation) {
    static const std::regex kPattern(R"(^(\d+)d(\d+)$)", std::regex::icase);
    std::smatch match;
    if (!std::regex_match(notation, match, kPattern)) {
        throw InvalidInput("Invalid dice notation: '" + notation +
                           "'. Expected format: NdM (e.g., '2d6', '1d20')");
    }

    DiceNotation out;
    try {
        out.count = std::stoi(match[1].str());
        out.sides = std::stoi(match[2].str());
    } catch (const std::out_of_range&) {
        throw InvalidInput("Dice notation out of range: '" + notation + "'");
    }

    if (out.count < 1) {
        throw InvalidInput("Number of dice must be positive, got " + std::to_string(out.count));
    }
    if (out.sides < 2) {
        throw InvalidInput("Number of sides must be at least 2, got " + std::to_string(out.sides));
    }
    return out;
}

DiceRoll roll_dice(const std::string& seed, const std::string& notation) {
    DiceNotation dice = parse_notation(notation);
    DiceStream stream(seed_to_u64(seed));

    DiceRoll result;
    result.notation = notation;
    result.seed = seed;
    result.rolls.reserve(static_cast<size_t>(dice.count));
    for (int i = 0; i < dice.count; i++) {
        int face = stream.roll_die(dice.sides);
        result.rolls.push_back(face);
        result.total += face;
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════
// Choice and bounded integers
// ═══════════════════════════════════════════════════════════════

size_t random_index(const std::string& seed, size_t count) {
    if (count == 0) throw InvalidInput("options list cannot be empty");
    DiceStream stream(seed_to_u64(seed));
    return static_cast<size_t>(stream.uniform_int(0, static_cast<int64_t>(count) - 1));
}

IntResult random_int(const std::string& seed, int64_t min, int64_t max) {
    if (min > max) {
        throw InvalidInput("min (" + std::to_string(min) + ") cannot be greater than max (" +
                           std::to_string(max) + ")");
    }
    DiceStream stream(seed_to_u64(seed));
    return IntResult{stream.uniform_int(min, max), min, max, seed};
}

size_t weighted_choice(const std::string& seed, const std::vector<double>& weights) {
    if (weights.empty()) throw InvalidInput("weights list cannot be empty");

    double total = 0.0;
    for (double w : weights) {
        if (w < 0.0 || !std::isfinite(w)) throw InvalidInput("weights must be finite and non-negative");
        total += w;
    }
    if (total <= 0.0) throw InvalidInput("weights must not all be zero");

    DiceStream stream(seed_to_u64(seed));
    double point = stream.uniform01() * total;
    double running = 0.0;
    size_t last_positive = 0;
    for (size_t i = 0; i < weights.size(); i++) {
        if (weights[i] <= 0.0) continue;
        last_positive = i;
        running += weights[i];
        if (point < running) return i;
    }
    return last_positive;
}

// ═══════════════════════════════════════════════════════════════
// Probability checks
// ═══════════════════════════════════════════════════════════════

const std::vector<double>& dice_distribution(int count, int sides) {
    std::lock_guard<std::mutex> lock(g_distribution_mutex);

    auto key = std::make_pair(count, sides);
    auto it = g_distributions.find(key);
    if (it != g_distributions.end()) return it->second;

    // pmf[t] = P(sum of dice so far == t), convolved one die at a time
    const double face_p = 1.0 / sides;
    std::vector<double> pmf{1.0};
    for (int d = 0; d < count; d++) {
        std::vector<double> next(pmf.size() + static_cast<size_t>(sides), 0.0);
        for (size_t total = 0; total < pmf.size(); total++) {
            if (pmf[total] == 0.0) continue;
            for (int face = 1; face <= sides; face++) {
                next[total + static_cast<size_t>(face)] += pmf[total] * face_p;
            }
        }
        pmf = std::move(next);
    }

    return g_distributions.emplace(key, std::move(pmf)).first->second;
}

int success_threshold(double probability, int count, int sides) {
    const int min_roll = count;
    const int max_roll = count * sides;

    if (probability <= 0.0) return max_roll + 1;
    if (probability >= 1.0) return min_roll;

    const auto& pmf = dice_distribution(count, sides);
    double cumulative = 0.0;
    for (int target = max_roll; target >= min_roll; target--) {
        cumulative += pmf[static_cast<size_t>(target)];
        if (cumulative + kProbabilityEpsilon >= probability) return target;
    }
    return min_roll;
}

SuccessCheck check_success(const std::string& seed, double probability,
                           const std::string& notation) {
    if (!(probability >= 0.0 && probability <= 1.0)) {
        throw InvalidInput("probability must be between 0.0 and 1.0, got " +
                           std::to_string(probability));
    }

    DiceNotation dice = parse_notation(notation);
    int target = success_threshold(probability, dice.count, dice.sides);
    DiceRoll roll = roll_dice(seed, notation);

    return SuccessCheck{roll.total >= target, roll.total, target, probability, seed};
}

} // namespace strat::rng
