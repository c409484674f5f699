/**
 * Shared campaign builders for the test suite.
 *
 * make_campaign() gives a five-hex road running east (hex ids 1..5 at
 * q = 0..4), two factions, and two 1000-strong infantry armies:
 *   army 1, commander 1, faction 1, at hex 1
 *   army 2, commander 2, faction 2, at hex 3, garrisoning stronghold 1
 * Commander 3 (faction 1) has no army. Both armies start at morale 9/9
 * with supplies 5000 / 20000.
 */

#ifndef STRAT_TESTS_CAMPAIGN_FIXTURE_HPP
#define STRAT_TESTS_CAMPAIGN_FIXTURE_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include "orders/dispatcher.hpp"
#include <gtest/gtest.h>
#include <optional>
#include <string>

namespace strat::test {

inline Detachment make_detachment(int64_t id, int64_t unit_type, int soldiers, int wagons = 0) {
    Detachment det;
    det.id = DetachmentId(id);
    det.unit_type_id = UnitTypeId(unit_type);
    det.soldiers = soldiers;
    det.wagons = wagons;
    return det;
}

inline Army make_army(int64_t id, int64_t commander, int64_t hex, int soldiers = 1000) {
    Army army;
    army.id = ArmyId(id);
    army.commander_id = CommanderId(commander);
    army.current_hex_id = HexId(hex);
    army.detachments.push_back(make_detachment(id * 100 + 1, 1, soldiers));
    army.morale_current = 9;
    army.morale_resting = 9;
    army.morale_max = 12;
    army.supplies_current = 5000;
    army.supplies_capacity = 20000;
    army.daily_supply_consumption = 1250;
    army.movement_points_remaining = 1.0;
    return army;
}

inline Campaign make_campaign() {
    Campaign campaign;
    campaign.id = CampaignId(1);
    campaign.name = "test campaign";

    for (int64_t f = 1; f <= 2; f++) {
        Faction faction;
        faction.id = FactionId(f);
        faction.name = "Faction " + std::to_string(f);
        campaign.factions[faction.id] = faction;
    }

    for (int64_t h = 1; h <= 5; h++) {
        Hex hex;
        hex.id = HexId(h);
        hex.q = static_cast<int>(h - 1);
        hex.r = 0;
        hex.has_road = true;
        hex.controlling_faction_id = FactionId(h <= 2 ? 1 : 2);
        campaign.map.hexes[hex.id] = hex;
    }

    UnitType infantry;
    infantry.id = UnitTypeId(1);
    infantry.name = "Spearmen";
    infantry.category = "infantry";
    campaign.unit_types[infantry.id] = infantry;

    UnitType cavalry;
    cavalry.id = UnitTypeId(2);
    cavalry.name = "Horse";
    cavalry.category = "cavalry";
    cavalry.supply_cost_per_day = 10;
    campaign.unit_types[cavalry.id] = cavalry;

    UnitType elephants;
    elephants.id = UnitTypeId(3);
    elephants.name = "Elephants";
    elephants.category = "infantry";
    elephants.can_travel_offroad = false;
    campaign.unit_types[elephants.id] = elephants;

    const int64_t commander_hexes[] = {1, 3, 1};
    for (int64_t c = 1; c <= 3; c++) {
        Commander commander;
        commander.id = CommanderId(c);
        commander.name = "Commander " + std::to_string(c);
        commander.faction_id = FactionId(c == 2 ? 2 : 1);
        commander.current_hex_id = HexId(commander_hexes[c - 1]);
        campaign.commanders[commander.id] = commander;
    }

    campaign.armies[ArmyId(1)] = make_army(1, 1, 1);
    campaign.armies[ArmyId(2)] = make_army(2, 2, 3);

    Stronghold keep;
    keep.id = StrongholdId(1);
    keep.hex_id = HexId(3);
    keep.type = StrongholdType::TOWN;
    keep.controlling_faction_id = FactionId(2);
    keep.defensive_bonus = 4;
    keep.garrison_army_id = ArmyId(2);
    keep.supplies_held = 2000;
    keep.loot_held = 600;
    campaign.strongholds[keep.id] = keep;

    return campaign;
}

/** Add a PENDING order due at day 0, morning. */
inline Order& add_order(Campaign& campaign, int64_t id, std::optional<int64_t> army,
                        int64_t commander, const std::string& type,
                        JsonValue parameters = JsonValue::object()) {
    Order order;
    order.id = OrderId(id);
    if (army) order.army_id = ArmyId(*army);
    order.commander_id = CommanderId(commander);
    order.order_type = type;
    order.parameters = std::move(parameters);
    order.issued_at = id;
    campaign.orders[order.id] = std::move(order);
    return campaign.orders[OrderId(id)];
}

/** Fixture with a fresh campaign and default rules per test. */
class CampaignTest : public ::testing::Test {
protected:
    Campaign campaign = make_campaign();
    RulesConfig rules;

    orders::OrderExecutionResult run(Order& order) {
        orders::OrderContext context{campaign, campaign.current_part, rules};
        return orders::execute_order(context, order);
    }

    Army& army(int64_t id) { return campaign.armies.at(ArmyId(id)); }
};

} // namespace strat::test

#endif // STRAT_TESTS_CAMPAIGN_FIXTURE_HPP
