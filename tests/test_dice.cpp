#include "rng/dice.hpp"
#include "rng/dice_stream.hpp"
#include <gtest/gtest.h>
#include <numeric>
#include <set>

using namespace strat;
using namespace strat::rng;

TEST(Seed, FormatsCampaignCoordinates) {
    EXPECT_EQ(seed(1, 0, DayPart::MORNING, "battle"), "1:0:morning:battle");
    EXPECT_EQ(seed(42, 17, "night", "fork"), "42:17:night:fork");
}

TEST(Seed, RejectsNegativeCoordinates) {
    EXPECT_THROW(seed(-1, 0, "morning", "x"), InvalidInput);
    EXPECT_THROW(seed(1, -3, "morning", "x"), InvalidInput);
}

TEST(Seed, HashIsStableAndSensitive) {
    EXPECT_EQ(seed_to_u64("1:0:morning:battle"), seed_to_u64("1:0:morning:battle"));
    EXPECT_NE(seed_to_u64("1:0:morning:battle"), seed_to_u64("1:0:morning:battle2"));
}

TEST(Dice, SameSeedSameRoll) {
    auto a = roll_dice("determinism", "3d6");
    auto b = roll_dice("determinism", "3d6");
    EXPECT_EQ(a.rolls, b.rolls);
    EXPECT_EQ(a.total, b.total);
    EXPECT_EQ(a.seed, "determinism");
    EXPECT_EQ(a.notation, "3d6");
}

TEST(Dice, RollsStayOnTheFaces) {
    for (int i = 0; i < 200; i++) {
        auto roll = roll_dice("faces-" + std::to_string(i), "2d6");
        ASSERT_EQ(roll.rolls.size(), 2u);
        for (int face : roll.rolls) {
            EXPECT_GE(face, 1);
            EXPECT_LE(face, 6);
        }
        EXPECT_EQ(roll.total, std::accumulate(roll.rolls.begin(), roll.rolls.end(), 0));
    }
}

TEST(Dice, NotationIsCaseInsensitive) {
    auto n = parse_notation("1D20");
    EXPECT_EQ(n.count, 1);
    EXPECT_EQ(n.sides, 20);
}

TEST(Dice, BadNotationThrows) {
    EXPECT_THROW(parse_notation("d6"), InvalidInput);
    EXPECT_THROW(parse_notation("0d6"), InvalidInput);
    EXPECT_THROW(parse_notation("2d1"), InvalidInput);
    EXPECT_THROW(parse_notation("2d6+1"), InvalidInput);
    EXPECT_THROW(roll_dice("x", "banana"), InvalidInput);
}

TEST(Choice, IndexWithinBounds) {
    std::vector<std::string> options{"a", "b", "c"};
    for (int i = 0; i < 50; i++) {
        auto pick = random_choice("choice-" + std::to_string(i), options);
        ASSERT_LT(pick.index, options.size());
        EXPECT_EQ(pick.choice, options[pick.index]);
    }
    EXPECT_THROW(random_choice("x", std::vector<int>{}), InvalidInput);
}

TEST(Choice, RandomIntIsInclusive) {
    std::set<int64_t> seen;
    for (int i = 0; i < 300; i++) {
        auto r = random_int("int-" + std::to_string(i), -2, 2);
        EXPECT_GE(r.value, -2);
        EXPECT_LE(r.value, 2);
        seen.insert(r.value);
    }
    EXPECT_EQ(seen.size(), 5u);
    EXPECT_EQ(random_int("same", 7, 7).value, 7);
    EXPECT_THROW(random_int("x", 3, 2), InvalidInput);
}

TEST(Choice, WeightedNeverPicksZeroWeight) {
    std::vector<double> weights{0.0, 1.0, 0.0, 3.0};
    for (int i = 0; i < 200; i++) {
        size_t idx = weighted_choice("weighted-" + std::to_string(i), weights);
        EXPECT_TRUE(idx == 1 || idx == 3) << "picked " << idx;
    }
    EXPECT_THROW(weighted_choice("x", {}), InvalidInput);
    EXPECT_THROW(weighted_choice("x", {0.0, 0.0}), InvalidInput);
    EXPECT_THROW(weighted_choice("x", {1.0, -1.0}), InvalidInput);
}

TEST(Probability, DistributionOfTwoDice) {
    const auto& pmf = dice_distribution(2, 6);
    ASSERT_EQ(pmf.size(), 13u);
    EXPECT_DOUBLE_EQ(pmf[1], 0.0);
    EXPECT_DOUBLE_EQ(pmf[2], 1.0 / 36.0);
    EXPECT_DOUBLE_EQ(pmf[7], 6.0 / 36.0);
    EXPECT_NEAR(std::accumulate(pmf.begin(), pmf.end(), 0.0), 1.0, 1e-12);
}

TEST(Probability, ThresholdsAreExact) {
    EXPECT_EQ(success_threshold(2.0 / 6.0, 1, 6), 5);
    EXPECT_EQ(success_threshold(0.5, 1, 6), 4);
    EXPECT_EQ(success_threshold(1.0 / 36.0, 2, 6), 12);
    EXPECT_EQ(success_threshold(1.0, 2, 6), 2);
    EXPECT_EQ(success_threshold(0.0, 2, 6), 13);
}

TEST(Probability, CheckSuccessAgreesWithThreshold) {
    for (int i = 0; i < 100; i++) {
        auto check = check_success("check-" + std::to_string(i), 0.5, "1d6");
        EXPECT_EQ(check.target, 4);
        EXPECT_EQ(check.success, check.roll >= 4);
    }
    EXPECT_FALSE(check_success("never", 0.0, "1d6").success);
    EXPECT_TRUE(check_success("always", 1.0, "1d6").success);
    EXPECT_THROW(check_success("x", 1.5, "1d6"), InvalidInput);
    EXPECT_THROW(check_success("x", -0.1, "1d6"), InvalidInput);
}

TEST(DiceStream, UniformIntCoversRange) {
    DiceStream stream(seed_to_u64("stream"));
    std::set<int64_t> seen;
    for (int i = 0; i < 500; i++) {
        int64_t v = stream.uniform_int(1, 4);
        EXPECT_GE(v, 1);
        EXPECT_LE(v, 4);
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 4u);
}
