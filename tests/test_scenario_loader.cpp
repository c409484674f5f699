#include "io/rules_loader.hpp"
#include "io/scenario_loader.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace strat;

namespace {

const char* kScenario = R"({
    "id": 7,
    "name": "Border War",
    "current_day": 3,
    "current_part": "evening",
    "season": "fall",
    "factions": [{"id": 1, "name": "North"}, {"id": 2, "name": "South"}],
    "hexes": [
        {"id": 10, "q": 0, "r": 0, "has_road": true, "settlement": 2,
         "controlling_faction_id": 1},
        {"id": 11, "q": 1, "r": 0, "terrain": "hills", "is_torched": true}
    ],
    "unit_types": [
        {"id": 1, "name": "Spearmen", "category": "infantry"},
        {"id": 2, "name": "Lancers", "category": "cavalry", "supply_cost_per_day": 10,
         "special_abilities": {"skirmisher": true}}
    ],
    "commanders": [
        {"id": 5, "name": "Aldric", "faction_id": 1, "current_hex_id": 10,
         "traits": ["Poet", {"id": 3, "name": "Logistician"}]}
    ],
    "armies": [
        {"id": 20, "commander_id": 5, "current_hex_id": 10, "status": "resting",
         "morale_current": 8, "supplies_current": 4000, "rest_duration_days": 2,
         "detachments": [{"id": 200, "unit_type_id": 1, "soldiers": 900},
                         {"id": 201, "unit_type_id": 2, "soldiers": 100, "wagons": 1},
                         {"id": 202, "unit_type_id": 1, "soldiers": 0,
                          "instance_data": {"supplies_equivalent": 1000}}]}
    ],
    "strongholds": [
        {"id": 30, "hex_id": 11, "type": "fortress", "controlling_faction_id": 2,
         "defensive_bonus": 3}
    ],
    "sieges": [
        {"id": 40, "stronghold_id": 30, "attacker_army_ids": [20], "current_threshold": 18}
    ],
    "orders": [
        {"id": 50, "army_id": 20, "commander_id": 5, "order_type": "move",
         "parameters": {"movement_type": "standard"}, "execute_day": 4,
         "execute_part": "night", "priority": 2}
    ],
    "mercenary_contracts": [
        {"id": 60, "company_id": 2, "commander_id": 5, "army_id": 20, "start_day": 1,
         "negotiated_rates": {"cavalry": 4}}
    ],
    "rules": {"siege": {"town_threshold": 8}, "mercenaries": {"grace_days_without_pay": 5}}
})";

JsonValue scenario() { return JsonReader::parse(kScenario); }

/** Replace one top-level array with `json`. */
JsonValue with(const std::string& key, const std::string& json) {
    JsonValue root = scenario();
    root.set(key, JsonReader::parse(json));
    return root;
}

std::string load_error(const JsonValue& root) {
    try {
        ScenarioLoader::load(root);
    } catch (const ScenarioError& e) {
        return e.what();
    }
    return "";
}

} // namespace

// ── Loading ──

TEST(ScenarioLoader, ReadsCampaignHeader) {
    Campaign campaign = ScenarioLoader::load(scenario());
    EXPECT_EQ(campaign.id, CampaignId(7));
    EXPECT_EQ(campaign.name, "Border War");
    EXPECT_EQ(campaign.current_day, 3);
    EXPECT_EQ(campaign.current_part, DayPart::EVENING);
    EXPECT_EQ(campaign.season, Season::FALL);
    EXPECT_EQ(campaign.factions.size(), 2u);
}

TEST(ScenarioLoader, ReadsEntities) {
    Campaign campaign = ScenarioLoader::load(scenario());

    const Hex& road = campaign.map.hexes.at(HexId(10));
    EXPECT_TRUE(road.has_road);
    EXPECT_EQ(road.settlement, 2);
    EXPECT_EQ(road.foraging_times_remaining, 5);
    EXPECT_EQ(road.controlling_faction_id, FactionId(1));
    EXPECT_EQ(campaign.map.hexes.at(HexId(11)).terrain, "hills");
    EXPECT_TRUE(campaign.map.hexes.at(HexId(11)).is_torched);

    const UnitType& lancers = campaign.unit_types.at(UnitTypeId(2));
    EXPECT_EQ(lancers.category, "cavalry");
    EXPECT_TRUE(lancers.has_ability("skirmisher"));

    const Commander& aldric = campaign.commanders.at(CommanderId(5));
    ASSERT_EQ(aldric.traits.size(), 2u);
    EXPECT_EQ(aldric.traits[0].name, "Poet");
    EXPECT_EQ(aldric.traits[1].id, 3);
    EXPECT_TRUE(aldric.has_trait("logistician"));

    const Army& army = campaign.armies.at(ArmyId(20));
    EXPECT_EQ(army.status, ArmyStatus::RESTING);
    EXPECT_EQ(army.morale_current, 8);
    EXPECT_EQ(army.total_soldiers(), 1000);
    ASSERT_EQ(army.detachments.size(), 3u);
    EXPECT_EQ(army.detachments[1].wagons, 1);
    EXPECT_FALSE(army.detachments[1].supplies_equivalent.has_value());
    EXPECT_EQ(army.detachments[2].supplies_equivalent, 1000);
    ASSERT_TRUE(army.rest_duration_days.has_value());
    EXPECT_EQ(*army.rest_duration_days, 2);

    const Stronghold& keep = campaign.strongholds.at(StrongholdId(30));
    EXPECT_EQ(keep.type, StrongholdType::FORTRESS);
    EXPECT_FALSE(keep.garrison_army_id.has_value());

    const Siege& siege = campaign.sieges.at(SiegeId(40));
    EXPECT_EQ(siege.status, SiegeStatus::ONGOING);
    EXPECT_EQ(siege.current_threshold, 18);
    EXPECT_EQ(siege.attacker_army_ids, (std::vector<ArmyId>{ArmyId(20)}));
}

TEST(ScenarioLoader, ReadsMercenaryContracts) {
    Campaign campaign = ScenarioLoader::load(scenario());
    const MercenaryContract& contract = campaign.mercenary_contracts.at(MercenaryContractId(60));
    EXPECT_EQ(contract.company_id, 2);
    EXPECT_EQ(contract.army_id, ArmyId(20));
    EXPECT_EQ(contract.status, "active");
    EXPECT_EQ(contract.last_upkeep_day, 1);
    EXPECT_EQ(contract.cavalry_rate, 4);
    EXPECT_FALSE(contract.infantry_rate.has_value());
}

TEST(ScenarioLoader, ReadsOrderSchedule) {
    Campaign campaign = ScenarioLoader::load(scenario());
    const Order& order = campaign.orders.at(OrderId(50));
    EXPECT_EQ(order.order_type, "move");
    EXPECT_EQ(order.status, OrderStatus::PENDING);
    EXPECT_EQ(order.issued_at, 50);
    EXPECT_EQ(order.priority, 2);
    ASSERT_TRUE(order.execute_day.has_value());
    EXPECT_EQ(*order.execute_day, 4);
    ASSERT_TRUE(order.execute_part.has_value());
    EXPECT_EQ(*order.execute_part, DayPart::NIGHT);
    EXPECT_EQ(order.parameters["movement_type"].as_string(), "standard");
}

TEST(ScenarioLoader, EmptyScenarioIsValid) {
    Campaign campaign = ScenarioLoader::load(JsonValue::object());
    EXPECT_EQ(campaign.id, CampaignId(1));
    EXPECT_TRUE(campaign.armies.empty());
    EXPECT_THROW(ScenarioLoader::load(JsonValue(3)), ScenarioError);
}

// ── Validation ──

TEST(ScenarioLoader, DuplicateIdsRejected) {
    EXPECT_EQ(load_error(with("factions", R"([{"id": 1}, {"id": 1}])")),
              "duplicate faction id 1");
}

TEST(ScenarioLoader, MissingIdsRejected) {
    EXPECT_EQ(load_error(with("hexes", R"([{"q": 0}])")),
              "hex: missing or non-numeric \"id\"");
    EXPECT_EQ(load_error(with("orders", R"([{"id": 9, "commander_id": 5}])")),
              "order 9: missing \"order_type\"");
}

TEST(ScenarioLoader, DanglingReferencesRejected) {
    EXPECT_EQ(load_error(with("commanders", R"([{"id": 5, "faction_id": 9}])")),
              "commander 5: unknown faction 9");

    JsonValue bad_army = with("armies", R"([{"id": 20, "commander_id": 5, "current_hex_id": 99}])");
    EXPECT_EQ(load_error(bad_army), "army 20: unknown hex 99");

    EXPECT_EQ(load_error(with("sieges", R"([{"id": 40, "stronghold_id": 31}])")),
              "siege 40: unknown stronghold 31");
    EXPECT_EQ(load_error(with("strongholds",
                              R"([{"id": 30, "hex_id": 11, "controlling_faction_id": 2,
                                  "garrison_army_id": 21}])")),
              "stronghold 30: unknown garrison army 21");
    EXPECT_EQ(load_error(with("mercenary_contracts",
                              R"([{"id": 60, "commander_id": 5, "army_id": 21}])")),
              "mercenary contract 60: unknown army 21");
}

TEST(ScenarioLoader, MissingFileThrows) {
    EXPECT_THROW(ScenarioLoader::load_file("/nonexistent/scenario.json"), std::runtime_error);
}

// ── Rules overrides ──

TEST(RulesLoader, OverridesApplyByField) {
    RulesConfig rules;
    load_rules_overrides(scenario()["rules"], rules);
    EXPECT_EQ(rules.siege.town_threshold, 8);
    EXPECT_EQ(rules.siege.city_threshold, 15);
    EXPECT_EQ(rules.mercenaries.grace_days_without_pay, 5);
    EXPECT_EQ(rules.mercenaries.desertion_chance_denominator, 6);
}

TEST(RulesLoader, WrongTypesKeepDefaults) {
    RulesConfig rules;
    auto overrides = JsonReader::parse(R"({
        "movement": {"road_standard_miles_per_day": "fast", "night_miles_per_day": 5},
        "messaging": {"friendly_miles_per_day": 60},
        "supply": {"base_noncombatant_ratio": 0.3},
        "astrology": {"omens": 3}
    })");
    load_rules_overrides(overrides, rules);

    EXPECT_EQ(rules.movement.road_standard_miles_per_day, 12);
    EXPECT_EQ(rules.movement.night_miles_per_day, 5);
    EXPECT_EQ(rules.messaging.friendly_miles_per_day, 60);
    EXPECT_DOUBLE_EQ(rules.supply.base_noncombatant_ratio, 0.3);
}
