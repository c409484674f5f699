#include "campaign_fixture.hpp"
#include "orders/order_parser.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace strat;
using namespace strat::orders;
using strat::test::add_order;

namespace {

JsonValue leg(int64_t to_hex, double miles) {
    JsonValue out = JsonValue::object();
    out.set("to_hex_id", to_hex).set("distance_miles", miles);
    return out;
}

JsonValue move_params(JsonValue first_leg, const char* movement_type = "standard") {
    JsonValue legs = JsonValue::array();
    legs.push_back(std::move(first_leg));
    JsonValue params = JsonValue::object();
    params.set("movement_type", movement_type).set("legs", std::move(legs));
    return params;
}

class DispatcherTest : public strat::test::CampaignTest {};

} // namespace

// ── Lifecycle ──

TEST_F(DispatcherTest, TerminalOrderIsLeftAlone) {
    Order& order = add_order(campaign, 1, 1, 1, "rest");
    order.status = OrderStatus::COMPLETED;

    auto result = run(order);
    EXPECT_EQ(result.status, OrderStatus::COMPLETED);
    EXPECT_EQ(result.detail, "order already resolved");
    EXPECT_FALSE(order.result.has_value());
    EXPECT_NE(army(1).status, ArmyStatus::RESTING);
}

TEST_F(DispatcherTest, CompletedOrderRunsOnlyOnce) {
    Order& order = add_order(campaign, 1, 1, 1, "move", move_params(leg(2, 6.0)));
    ASSERT_EQ(run(order).status, OrderStatus::COMPLETED);

    const Army before = army(1);
    const std::string detail = order.result->detail;
    const size_t event_count = order.result->events.size();

    auto again = run(order);
    EXPECT_EQ(again.status, OrderStatus::COMPLETED);
    EXPECT_EQ(again.detail, "order already resolved");
    EXPECT_TRUE(again.events.empty());
    EXPECT_EQ(order.status, OrderStatus::COMPLETED);
    ASSERT_TRUE(order.result.has_value());
    EXPECT_EQ(order.result->detail, detail);
    EXPECT_EQ(order.result->events.size(), event_count);

    EXPECT_EQ(army(1).current_hex_id, before.current_hex_id);
    EXPECT_DOUBLE_EQ(army(1).movement_points_remaining, before.movement_points_remaining);
    EXPECT_EQ(army(1).status, before.status);
    EXPECT_EQ(army(1).morale_current, before.morale_current);
    EXPECT_EQ(army(1).supplies_current, before.supplies_current);
    EXPECT_EQ(army(1).days_marched_this_week, before.days_marched_this_week);
}

TEST_F(DispatcherTest, FailedOrderRunsOnlyOnce) {
    Order& order = add_order(campaign, 1, 1, 1, "move", move_params(leg(2, 13.0)));
    ASSERT_EQ(run(order).status, OrderStatus::FAILED);

    auto again = run(order);
    EXPECT_EQ(again.status, OrderStatus::FAILED);
    EXPECT_EQ(again.detail, "order already resolved");
    EXPECT_EQ(order.result->detail, "movement exceeds daily allowance");
    EXPECT_EQ(army(1).current_hex_id, HexId(1));
}

TEST_F(DispatcherTest, UnknownTypeFails) {
    Order& order = add_order(campaign, 1, 1, 1, "teleport");
    auto result = run(order);
    EXPECT_EQ(result.status, OrderStatus::FAILED);
    EXPECT_EQ(result.detail, "unsupported order type: teleport");
    EXPECT_EQ(order.status, OrderStatus::FAILED);
    ASSERT_TRUE(order.result.has_value());
    EXPECT_EQ(order.result->detail, "unsupported order type: teleport");
}

TEST_F(DispatcherTest, MissingArmyFails) {
    Order& order = add_order(campaign, 1, 99, 1, "rest");
    EXPECT_EQ(run(order).detail, "army 99 not found");
    EXPECT_EQ(order.status, OrderStatus::FAILED);
}

TEST_F(DispatcherTest, ArmyCheckPrecedesPayload) {
    Order& move = add_order(campaign, 1, std::nullopt, 1, "move");
    EXPECT_EQ(run(move).detail, "move order requires an army");

    Order& forage = add_order(campaign, 2, std::nullopt, 1, "forage");
    EXPECT_EQ(run(forage).detail, "forage order requires an army");
}

TEST_F(DispatcherTest, PayloadErrorsBecomeDetails) {
    Order& forage = add_order(campaign, 1, 1, 1, "forage");
    EXPECT_EQ(run(forage).detail, "forage order missing hex_ids");

    Order& move = add_order(campaign, 2, 1, 1, "move");
    EXPECT_EQ(run(move).detail, "movement order missing legs");

    Order& gallop = add_order(campaign, 3, 1, 1, "move", move_params(leg(2, 6.0), "gallop"));
    EXPECT_EQ(run(gallop).detail, "invalid movement type: gallop");

    Order& backwards = add_order(campaign, 4, 1, 1, "move", move_params(leg(2, -1.0)));
    EXPECT_EQ(run(backwards).detail, "movement leg requires positive distance");

    JsonValue fork = leg(2, 3.0);
    fork.set("has_fork", true);
    Order& lost = add_order(campaign, 5, 1, 1, "move", move_params(std::move(fork), "night"));
    EXPECT_EQ(run(lost).detail, "movement leg with fork requires alternate_hex_id");

    for (int64_t id = 1; id <= 5; id++) {
        EXPECT_EQ(campaign.orders.at(OrderId(id)).status, OrderStatus::FAILED);
    }
    EXPECT_EQ(army(1).current_hex_id, HexId(1));
}

TEST_F(DispatcherTest, CancelOnlyLiveOrders) {
    Order& order = add_order(campaign, 1, 1, 1, "rest");
    EXPECT_TRUE(cancel_order(order));
    EXPECT_EQ(order.status, OrderStatus::CANCELLED);
    EXPECT_FALSE(cancel_order(order));
    EXPECT_EQ(run(order).detail, "order already resolved");
}

// ── Move ──

TEST_F(DispatcherTest, StandardRoadMove) {
    Order& order = add_order(campaign, 1, 1, 1, "move", move_params(leg(2, 6.0)));
    auto result = run(order);

    ASSERT_EQ(result.status, OrderStatus::COMPLETED) << result.detail;
    EXPECT_EQ(army(1).current_hex_id, HexId(2));
    EXPECT_DOUBLE_EQ(army(1).movement_points_remaining, 0.5);
    EXPECT_EQ(army(1).status, ArmyStatus::MARCHING);
    EXPECT_EQ(army(1).days_marched_this_week, 1);
    EXPECT_EQ(campaign.commanders.at(CommanderId(1)).current_hex_id, HexId(2));

    ASSERT_EQ(result.events.size(), 1u);
    EXPECT_EQ(result.events[0]["type"].as_string(), "movement");
    EXPECT_EQ(result.events[0]["from_hex_id"].as_int(), 1);
    EXPECT_EQ(result.events[0]["to_hex_id"].as_int(), 2);
    EXPECT_DOUBLE_EQ(result.events[0]["fraction"].as_number(), 0.5);
    EXPECT_EQ(order.status, OrderStatus::COMPLETED);
}

TEST_F(DispatcherTest, OverlongMoveLeavesArmyInPlace) {
    Order& order = add_order(campaign, 1, 1, 1, "move", move_params(leg(2, 13.0)));
    auto result = run(order);

    EXPECT_EQ(result.status, OrderStatus::FAILED);
    EXPECT_EQ(result.detail, "movement exceeds daily allowance");
    EXPECT_EQ(army(1).current_hex_id, HexId(1));
    EXPECT_DOUBLE_EQ(army(1).movement_points_remaining, 1.0);
    EXPECT_EQ(army(1).status, ArmyStatus::IDLE);
}

TEST_F(DispatcherTest, MultiLegFractionsAccumulate) {
    JsonValue params = move_params(leg(2, 6.0));
    JsonValue second = leg(3, 3.0);
    JsonValue legs = params["legs"];
    legs.push_back(std::move(second));
    params.set("legs", std::move(legs));

    auto result = run(add_order(campaign, 1, 1, 1, "move", std::move(params)));
    ASSERT_EQ(result.status, OrderStatus::COMPLETED) << result.detail;
    EXPECT_EQ(army(1).current_hex_id, HexId(3));
    EXPECT_DOUBLE_EQ(army(1).movement_points_remaining, 0.25);
    EXPECT_EQ(result.detail, "moved to hex 3 via 2 leg(s)");
}

TEST_F(DispatcherTest, ForcedMarchAccruesFatigue) {
    auto result = run(add_order(campaign, 1, 1, 1, "move", move_params(leg(2, 18.0), "forced")));
    ASSERT_EQ(result.status, OrderStatus::COMPLETED) << result.detail;
    EXPECT_EQ(army(1).status, ArmyStatus::FORCED_MARCH);
    EXPECT_DOUBLE_EQ(army(1).forced_march_days, 1.0);
    EXPECT_DOUBLE_EQ(army(1).movement_points_remaining, 0.0);
}

TEST_F(DispatcherTest, WagonsCannotLeaveTheRoad) {
    army(1).detachments[0].wagons = 2;
    JsonValue off_road = leg(2, 3.0);
    off_road.set("on_road", false);

    auto result = run(add_order(campaign, 1, 1, 1, "move", move_params(std::move(off_road))));
    EXPECT_EQ(result.status, OrderStatus::FAILED);
    EXPECT_EQ(result.detail, "Cannot travel off-road with wagons");
}

TEST_F(DispatcherTest, NightForkCanDivert) {
    rules.movement.night_wrong_path_chance = 6;
    JsonValue fork = leg(2, 3.0);
    fork.set("has_fork", true).set("alternate_hex_id", 4);

    auto result = run(add_order(campaign, 1, 1, 1, "move", move_params(std::move(fork), "night")));
    ASSERT_EQ(result.status, OrderStatus::COMPLETED) << result.detail;
    EXPECT_EQ(army(1).current_hex_id, HexId(4));
    EXPECT_EQ(army(1).status, ArmyStatus::NIGHT_MARCH);
    EXPECT_NE(result.detail.find("took wrong fork on leg 1"), std::string::npos);
    EXPECT_TRUE(result.events[0]["diverted"].as_bool());
}

TEST_F(DispatcherTest, NightForkHeldWithoutChance) {
    rules.movement.night_wrong_path_chance = 0;
    JsonValue fork = leg(2, 3.0);
    fork.set("has_fork", true).set("alternate_hex_id", 4);

    auto result = run(add_order(campaign, 1, 1, 1, "move", move_params(std::move(fork), "night")));
    ASSERT_EQ(result.status, OrderStatus::COMPLETED) << result.detail;
    EXPECT_EQ(army(1).current_hex_id, HexId(2));
}

// ── Rest ──

TEST_F(DispatcherTest, RestRestoresMorale) {
    army(1).morale_current = 6;
    army(1).days_marched_this_week = 3;
    JsonValue params = JsonValue::object();
    params.set("duration_days", 3);

    auto result = run(add_order(campaign, 1, 1, 1, "rest", std::move(params)));
    ASSERT_EQ(result.status, OrderStatus::COMPLETED);
    EXPECT_EQ(result.detail, "resting for 3 day(s)");
    EXPECT_EQ(army(1).status, ArmyStatus::RESTING);
    EXPECT_EQ(army(1).rest_duration_days, 3);
    EXPECT_EQ(army(1).morale_current, 9);
    EXPECT_EQ(army(1).days_marched_this_week, 0);
}

TEST_F(DispatcherTest, HarriedArmyCannotRest) {
    JsonValue harried = JsonValue::object();
    harried.set("day", 0);
    army(1).status_effects.set("harried", std::move(harried));

    auto result = run(add_order(campaign, 1, 1, 1, "rest"));
    EXPECT_EQ(result.status, OrderStatus::FAILED);
    EXPECT_EQ(result.detail, "army is harried and cannot rest today");
}

TEST_F(DispatcherTest, RestNeedsPositiveDuration) {
    JsonValue params = JsonValue::object();
    params.set("duration_days", 0);
    EXPECT_EQ(run(add_order(campaign, 1, 1, 1, "rest", std::move(params))).detail,
              "rest duration must be positive");
}

// ── Parameter coercion ──

TEST(OrderParser, IntegersFromLooseValues) {
    EXPECT_EQ(to_integer(JsonValue(12)), 12);
    EXPECT_EQ(to_integer(JsonValue(" 7 ")), 7);
    EXPECT_EQ(to_integer(JsonValue(3.7)), 3);
    EXPECT_EQ(to_integer(JsonValue(true)), 1);
    EXPECT_FALSE(to_integer(JsonValue("seven")).has_value());
    EXPECT_FALSE(to_integer(JsonValue()).has_value());
}

TEST(OrderParser, IntegersOutsideInt64Rejected) {
    EXPECT_FALSE(to_integer(JsonValue(1e30)).has_value());
    EXPECT_FALSE(to_integer(JsonValue(-1e19)).has_value());
    EXPECT_FALSE(to_integer(JsonValue(std::nan(""))).has_value());
    EXPECT_FALSE(to_integer(JsonValue("99999999999999999999")).has_value());
    EXPECT_EQ(to_integer(JsonValue(static_cast<int64_t>(4294967496LL))), 4294967496LL);
}

TEST(OrderParser, IntFieldsRejectOutOfRangeValues) {
    JsonValue rest = JsonValue::object();
    rest.set("duration_days", static_cast<int64_t>(2147483648LL));
    EXPECT_THROW(parse_payload(OrderKind::REST, rest), PayloadError);

    JsonValue assault = JsonValue::object();
    assault.set("stronghold_id", 1).set("attacker_fixed_roll", static_cast<int64_t>(4294967301LL));
    EXPECT_THROW(parse_payload(OrderKind::ASSAULT, assault), PayloadError);

    JsonValue operation = JsonValue::object();
    operation.set("loot_cost", static_cast<int64_t>(-4294967296LL));
    EXPECT_THROW(parse_payload(OrderKind::LAUNCH_OPERATION, operation), PayloadError);

    JsonValue move = move_params(leg(2, 6.0));
    move.set("weather_modifier", static_cast<int64_t>(4294967297LL));
    EXPECT_THROW(parse_payload(OrderKind::MOVE, move), PayloadError);
}

TEST(OrderParser, TransferAmountSaturates) {
    JsonValue params = JsonValue::object();
    params.set("target_army_id", 2).set("amount", static_cast<int64_t>(4294967496LL));
    auto payload = parse_payload(OrderKind::SUPPLY_TRANSFER, params);
    EXPECT_EQ(std::get<SupplyTransferPayload>(payload).amount, std::numeric_limits<int>::max());
}

TEST(OrderParser, FlagsFromLooseValues) {
    EXPECT_TRUE(is_truthy_flag(JsonValue("Yes")));
    EXPECT_TRUE(is_truthy_flag(JsonValue(" on ")));
    EXPECT_TRUE(is_truthy_flag(JsonValue(1)));
    EXPECT_FALSE(is_truthy_flag(JsonValue("no")));
    EXPECT_FALSE(is_truthy_flag(JsonValue()));
}

TEST(OrderParser, StringIdsAreAccepted) {
    JsonValue params = JsonValue::object();
    params.set("target_army_id", "2").set("amount", "150");
    auto payload = parse_payload(OrderKind::SUPPLY_TRANSFER, params);
    const auto& transfer = std::get<SupplyTransferPayload>(payload);
    EXPECT_EQ(transfer.target_army_id, ArmyId(2));
    EXPECT_EQ(transfer.amount, 150);
}

TEST(OrderParser, KindTagsRoundTrip) {
    EXPECT_EQ(parse_order_kind("naval_move"), OrderKind::NAVAL_MOVE);
    EXPECT_FALSE(parse_order_kind("Move").has_value());
    EXPECT_FALSE(requires_army(OrderKind::SEND_MESSAGE));
    EXPECT_TRUE(requires_army(OrderKind::HARRY));
}
