#include "campaign_fixture.hpp"
#include "rules/movement.hpp"
#include "rules/supply.hpp"
#include <gtest/gtest.h>

using namespace strat;
using namespace strat::rules;
using strat::test::make_army;
using strat::test::make_detachment;

namespace {

class MovementTest : public strat::test::CampaignTest {
protected:
    double miles(MovementType type, MovementOptions options = {}) {
        return calculate_daily_movement_miles(campaign.unit_types, army(1), type, options, rules);
    }

    MovementOptions off_road() {
        MovementOptions options;
        options.on_road = false;
        return options;
    }
};

} // namespace

// ── Allowances ──

TEST_F(MovementTest, BaseAllowances) {
    EXPECT_DOUBLE_EQ(miles(MovementType::STANDARD), 12.0);
    EXPECT_DOUBLE_EQ(miles(MovementType::FORCED), 18.0);
    EXPECT_DOUBLE_EQ(miles(MovementType::NIGHT), 6.0);
    EXPECT_DOUBLE_EQ(miles(MovementType::STANDARD, off_road()), 6.0);
    EXPECT_DOUBLE_EQ(miles(MovementType::FORCED, off_road()), 9.0);
    EXPECT_DOUBLE_EQ(miles(MovementType::NIGHT, off_road()), 0.0);
}

TEST_F(MovementTest, CavalryOnlyForcedMarchDoubles) {
    army(1).detachments = {make_detachment(101, 2, 500)};
    EXPECT_DOUBLE_EQ(miles(MovementType::FORCED), 36.0);
    EXPECT_DOUBLE_EQ(miles(MovementType::STANDARD), 12.0);

    army(1).detachments.push_back(make_detachment(102, 1, 100));
    EXPECT_DOUBLE_EQ(miles(MovementType::FORCED), 18.0);
}

TEST_F(MovementTest, WeatherSlowsAllButRangers) {
    MovementOptions options;
    options.weather_modifier = -1;
    EXPECT_DOUBLE_EQ(miles(MovementType::STANDARD, options), 11.0);

    options.traits.push_back(Trait{7, "Ranger", ""});
    EXPECT_DOUBLE_EQ(miles(MovementType::STANDARD, options), 12.0);
}

TEST_F(MovementTest, WeatherNeverGoesNegative) {
    MovementOptions options = off_road();
    options.weather_modifier = -2;
    EXPECT_DOUBLE_EQ(miles(MovementType::NIGHT, options), 0.0);
}

TEST_F(MovementTest, LongColumnIsCapped) {
    army(1).detachments = {make_detachment(101, 1, 40000)};
    EXPECT_GT(column_length_miles(campaign.unit_types, army(1), {}, rules),
              rules.movement.column_length_threshold);
    EXPECT_DOUBLE_EQ(miles(MovementType::STANDARD), 6.0);
    EXPECT_DOUBLE_EQ(miles(MovementType::FORCED), 12.0);
    EXPECT_DOUBLE_EQ(miles(MovementType::NIGHT), 6.0);
}

TEST_F(MovementTest, LogisticianHalvesTheColumn) {
    army(1).detachments = {make_detachment(101, 1, 40000)};
    std::vector<Trait> traits{Trait{3, "Logistician", ""}};
    EXPECT_DOUBLE_EQ(column_length_miles(campaign.unit_types, army(1), traits, rules), 5.0);
}

// ── Validation ──

TEST_F(MovementTest, WagonsStayOnRoadsAndBridges) {
    army(1).detachments[0].wagons = 3;

    auto result = validate_movement_order(campaign.unit_types, army(1), {false, true}, {}, false);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, "Cannot travel off-road with wagons");

    result = validate_movement_order(campaign.unit_types, army(1), {false}, {true}, false);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, "Cannot ford rivers with wagons");

    result = validate_movement_order(campaign.unit_types, army(1), {false, false}, {false}, true);
    EXPECT_TRUE(result.valid);
}

TEST_F(MovementTest, NoNightMarchOffRoad) {
    auto result = validate_movement_order(campaign.unit_types, army(1), {true}, {}, true);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, "Cannot night march off-road");
}

TEST_F(MovementTest, RoadBoundUnitsCannotLeaveTheRoad) {
    army(1).detachments.push_back(make_detachment(102, 3, 20));

    auto result = validate_movement_order(campaign.unit_types, army(1), {true}, {}, false);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, "Cannot travel off-road with Elephants");

    EXPECT_TRUE(validate_movement_order(campaign.unit_types, army(1), {false}, {}, false).valid);
}

// ── Night forks ──

TEST(WrongFork, ChanceBounds) {
    RulesConfig rules;
    rules.movement.night_wrong_path_chance = 0;
    EXPECT_FALSE(should_take_wrong_fork("fork-a", rules));

    rules.movement.night_wrong_path_chance = 6;
    EXPECT_TRUE(should_take_wrong_fork("fork-a", rules));
}

TEST(WrongFork, SameSeedSameFork) {
    RulesConfig rules;
    for (int i = 0; i < 20; i++) {
        std::string seed = "fork-" + std::to_string(i);
        EXPECT_EQ(should_take_wrong_fork(seed, rules), should_take_wrong_fork(seed, rules));
    }
}

// ── Supply snapshot ──

TEST(SupplySnapshot, CapacityAndConsumptionFromComposition) {
    Campaign campaign = strat::test::make_campaign();
    RulesConfig rules;
    Army& army = campaign.armies.at(ArmyId(1));
    army.detachments = {make_detachment(101, 1, 1000), make_detachment(102, 2, 100, 2)};

    auto snap = build_supply_snapshot(campaign, army, rules);
    EXPECT_EQ(snap.total_soldiers, 1100);
    EXPECT_EQ(snap.total_cavalry, 100);
    EXPECT_EQ(snap.total_wagons, 2);
    EXPECT_EQ(snap.noncombatants, 275);
    EXPECT_EQ(snap.capacity, (1000 + 275) * 15 + 100 * 75 + 2 * 1000);
    EXPECT_EQ(snap.consumption, (1000 + 275) + 100 * 10 + 2 * 10);
}

TEST(SupplySnapshot, SpartanCarriesFewerFollowers) {
    Campaign campaign = strat::test::make_campaign();
    RulesConfig rules;
    campaign.commanders.at(CommanderId(1)).traits.push_back(Trait{2, "Spartan", ""});
    auto snap = build_supply_snapshot(campaign, campaign.armies.at(ArmyId(1)), rules);
    EXPECT_EQ(snap.noncombatants, 125);
}
