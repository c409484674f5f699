#include "campaign_fixture.hpp"
#include "io/report_writer.hpp"
#include "orders/tick_driver.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace strat;
using namespace strat::orders;
using strat::test::add_order;

namespace {

JsonValue road_move(int64_t to_hex, double miles) {
    JsonValue leg = JsonValue::object();
    leg.set("to_hex_id", to_hex).set("distance_miles", miles);
    JsonValue legs = JsonValue::array();
    legs.push_back(std::move(leg));
    JsonValue params = JsonValue::object();
    params.set("movement_type", "standard").set("legs", std::move(legs));
    return params;
}

std::vector<const JsonValue*> records_of(const Campaign& campaign, const std::string& type) {
    std::vector<const JsonValue*> out;
    for (const auto& record : campaign.event_log) {
        if (record["type"].get_string() == type) out.push_back(&record);
    }
    return out;
}

void add_siege(Campaign& campaign, int threshold) {
    Siege siege;
    siege.id = SiegeId(1);
    siege.stronghold_id = StrongholdId(1);
    siege.attacker_army_ids = {ArmyId(1)};
    siege.defender_army_id = ArmyId(2);
    siege.current_threshold = threshold;
    campaign.sieges[siege.id] = siege;
}

class TickDriverTest : public strat::test::CampaignTest {
protected:
    TickDriver driver{campaign, rules};
};

} // namespace

// ── Calendar ──

TEST_F(TickDriverTest, DayAdvancesAndPartResets) {
    driver.run_day();
    EXPECT_EQ(campaign.current_day, 1);
    EXPECT_EQ(campaign.current_part, DayPart::MORNING);
    EXPECT_EQ(campaign.season, Season::SPRING);
}

TEST_F(TickDriverTest, SeasonTurnsAfterNinetyOneDays) {
    campaign.current_day = 90;
    driver.run_day();
    EXPECT_EQ(campaign.current_day, 91);
    EXPECT_EQ(campaign.season, Season::SUMMER);

    driver.run_day();
    EXPECT_EQ(campaign.season, Season::SUMMER);
}

TEST_F(TickDriverTest, ProgressReportsEveryDay) {
    std::vector<int> seen;
    driver.run_days(3, [&seen](int done, int total) {
        EXPECT_EQ(total, 3);
        seen.push_back(done);
    });
    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(campaign.current_day, 3);
}

// ── Start of day ──

TEST_F(TickDriverTest, MarchStatusClearsNextMorning) {
    add_order(campaign, 1, 1, 1, "move", road_move(2, 6.0));
    driver.run_part(DayPart::MORNING);
    EXPECT_EQ(army(1).status, ArmyStatus::MARCHING);

    driver.run_day();
    EXPECT_EQ(army(1).status, ArmyStatus::IDLE);
    EXPECT_DOUBLE_EQ(army(1).movement_points_remaining, 1.0);
    EXPECT_EQ(army(1).current_hex_id, HexId(2));
}

TEST_F(TickDriverTest, SnapshotRefreshesLogistics) {
    army(1).supplies_capacity = 1;
    army(1).daily_supply_consumption = 1;
    driver.run_day();
    EXPECT_EQ(army(1).noncombatant_count, 250);
    EXPECT_EQ(army(1).supplies_capacity, 1250 * 15);
    EXPECT_EQ(army(1).daily_supply_consumption, 1250);
    EXPECT_EQ(army(1).supplies_current, 5000 - 1250);
}

TEST_F(TickDriverTest, ForcedMarchFatigueCostsMorale) {
    army(1).forced_march_days = 7.5;
    driver.run_day();
    EXPECT_EQ(army(1).morale_current, 8);
    EXPECT_DOUBLE_EQ(army(1).forced_march_days, 0.5);
}

TEST_F(TickDriverTest, RestExpiresAfterDuration) {
    army(1).status = ArmyStatus::RESTING;
    army(1).rest_duration_days = 2;
    army(1).rest_started_day = 0;

    driver.run_days(2);
    EXPECT_EQ(army(1).status, ArmyStatus::RESTING);

    driver.run_day();
    EXPECT_EQ(army(1).status, ArmyStatus::IDLE);
    EXPECT_FALSE(army(1).rest_duration_days.has_value());
}

TEST_F(TickDriverTest, WeeklyMarchCountResets) {
    army(1).days_marched_this_week = 4;
    campaign.current_day = 7;
    driver.run_day();
    EXPECT_EQ(army(1).days_marched_this_week, 0);
}

// ── Supplies and sieges ──

TEST_F(TickDriverTest, EmptyWagonsStarve) {
    army(1).supplies_current = 0;
    driver.run_day();

    EXPECT_EQ(army(1).days_without_supplies, 1);
    EXPECT_EQ(army(2).days_without_supplies, 0);

    auto starving = records_of(campaign, "starvation");
    ASSERT_EQ(starving.size(), 1u);
    EXPECT_EQ((*starving[0])["army_id"].as_int(), 1);
    EXPECT_EQ((*starving[0])["day"].as_int(), 0);
    EXPECT_FALSE((*starving[0])["dissolved"].as_bool());
}

TEST_F(TickDriverTest, MercenaryUpkeepChargedDaily) {
    MercenaryContract contract;
    contract.id = MercenaryContractId(4);
    contract.commander_id = CommanderId(1);
    contract.army_id = ArmyId(1);
    campaign.mercenary_contracts[contract.id] = contract;
    campaign.current_day = 1;
    army(1).loot_carried = 5000;

    driver.run_day();
    EXPECT_EQ(army(1).loot_carried, 4000);
    auto records = records_of(campaign, "mercenary_upkeep");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ((*records[0])["contract_id"].as_int(), 4);
    EXPECT_EQ((*records[0])["amount_due"].as_int(), 1000);
    EXPECT_TRUE((*records[0])["paid"].as_bool());
}

TEST_F(TickDriverTest, SiegeAdvancesOnTheLastDayOfTheWeek) {
    add_siege(campaign, 10);

    driver.run_days(6);
    EXPECT_EQ(campaign.sieges.at(SiegeId(1)).weeks_elapsed, 0);
    EXPECT_TRUE(records_of(campaign, "siege_week").empty());

    driver.run_day();
    const Siege& siege = campaign.sieges.at(SiegeId(1));
    EXPECT_EQ(siege.weeks_elapsed, 1);
    EXPECT_EQ(siege.current_threshold, 9);

    auto weeks = records_of(campaign, "siege_week");
    ASSERT_EQ(weeks.size(), 1u);
    EXPECT_EQ((*weeks[0])["day"].as_int(), 6);
    const bool opened = (*weeks[0])["gates_opened"].as_bool();
    EXPECT_EQ(opened, siege.status == SiegeStatus::GATES_OPENED);
    EXPECT_EQ(opened, campaign.strongholds.at(StrongholdId(1)).gates_open);
}

TEST_F(TickDriverTest, StarvedSiegeOpensTheGates) {
    add_siege(campaign, 0);
    campaign.current_day = 6;
    driver.run_day();

    EXPECT_EQ(campaign.sieges.at(SiegeId(1)).status, SiegeStatus::GATES_OPENED);
    EXPECT_TRUE(campaign.strongholds.at(StrongholdId(1)).gates_open);
}

TEST_F(TickDriverTest, FinishedSiegesStayPut) {
    add_siege(campaign, 10);
    campaign.sieges.at(SiegeId(1)).status = SiegeStatus::LIFTED;
    campaign.current_day = 6;
    driver.run_day();
    EXPECT_EQ(campaign.sieges.at(SiegeId(1)).weeks_elapsed, 0);
}

// ── Order scheduling ──

TEST_F(TickDriverTest, DueOrdersSortByPriorityThenIssue) {
    add_order(campaign, 1, 1, 1, "rest").priority = 5;
    add_order(campaign, 2, 1, 1, "rest").priority = 1;
    Order& early = add_order(campaign, 3, 1, 1, "rest");
    early.priority = 1;
    early.issued_at = 0;
    add_order(campaign, 4, 1, 1, "rest").execute_day = 2;
    add_order(campaign, 5, 1, 1, "rest").execute_part = DayPart::EVENING;
    add_order(campaign, 6, 1, 1, "rest").status = OrderStatus::CANCELLED;

    std::vector<int64_t> ids;
    for (Order* order : orders_due(campaign, 0, DayPart::MORNING)) ids.push_back(order->id.value);
    EXPECT_EQ(ids, (std::vector<int64_t>{3, 2, 1}));

    auto evening = orders_due(campaign, 0, DayPart::EVENING);
    ASSERT_EQ(evening.size(), 1u);
    EXPECT_EQ(evening[0]->id, OrderId(5));

    auto later = orders_due(campaign, 2, DayPart::MORNING);
    EXPECT_EQ(later.size(), 4u);
}

TEST_F(TickDriverTest, OrderResultsAreLogged) {
    add_order(campaign, 1, 1, 1, "move", road_move(2, 6.0));
    add_order(campaign, 2, 1, 1, "teleport").execute_part = DayPart::NIGHT;
    driver.run_day();

    const Order& move = campaign.orders.at(OrderId(1));
    EXPECT_EQ(move.status, OrderStatus::COMPLETED);
    ASSERT_TRUE(move.execute_day.has_value());
    EXPECT_EQ(*move.execute_day, 0);

    auto results = records_of(campaign, "order_result");
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ((*results[0])["order_id"].as_int(), 1);
    EXPECT_EQ((*results[0])["part"].as_string(), "morning");
    EXPECT_EQ((*results[0])["status"].as_string(), "completed");
    EXPECT_EQ((*results[0])["events"].size(), 1u);
    EXPECT_EQ((*results[1])["part"].as_string(), "night");
    EXPECT_EQ((*results[1])["status"].as_string(), "failed");

    driver.run_day();
    EXPECT_EQ(records_of(campaign, "order_result").size(), 2u);
}

TEST_F(TickDriverTest, RunPartLeavesTheCalendarAlone) {
    add_order(campaign, 1, 1, 1, "rest").execute_part = DayPart::EVENING;
    driver.run_part(DayPart::EVENING);
    EXPECT_EQ(campaign.current_day, 0);
    EXPECT_EQ(campaign.current_part, DayPart::EVENING);
    EXPECT_EQ(army(1).status, ArmyStatus::RESTING);
}

// ── Determinism ──

TEST(TickDeterminism, IdenticalCampaignsGiveIdenticalReports) {
    RulesConfig rules;
    auto simulate = [&rules]() {
        Campaign campaign = strat::test::make_campaign();
        campaign.armies.at(ArmyId(1)).supplies_current = 3000;
        add_order(campaign, 1, 1, 1, "move", road_move(2, 6.0));
        JsonValue besiege = JsonValue::object();
        besiege.set("stronghold_id", 1);
        add_order(campaign, 2, 1, 1, "besiege", std::move(besiege)).execute_day = 1;
        JsonValue assault = JsonValue::object();
        assault.set("stronghold_id", 1);
        add_order(campaign, 3, 1, 1, "assault", std::move(assault)).execute_day = 8;

        TickDriver driver(campaign, rules);
        driver.run_days(10);

        std::ostringstream out;
        write_campaign_report(campaign, out);
        return out.str();
    };

    const std::string first = simulate();
    EXPECT_EQ(first, simulate());
    EXPECT_NE(first.find("\"siege_week\""), std::string::npos);
}
