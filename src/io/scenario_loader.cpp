#include "io/scenario_loader.hpp"
#include <optional>
#include <utility>

namespace strat {

namespace {

template <typename IdT>
IdT require_id(const JsonValue& def, const char* key, const std::string& what) {
    const auto& v = def[key];
    if (!v.is_number()) throw ScenarioError(what + ": missing or non-numeric \"" + key + "\"");
    return IdT(v.as_int64());
}

template <typename IdT>
std::optional<IdT> optional_id(const JsonValue& def, const char* key) {
    const auto& v = def[key];
    if (!v.is_number()) return std::nullopt;
    return IdT(v.as_int64());
}

std::optional<int> optional_int(const JsonValue& def, const char* key) {
    const auto& v = def[key];
    if (!v.is_number()) return std::nullopt;
    return v.as_int();
}

template <typename IdT>
std::vector<IdT> id_list(const JsonValue& arr) {
    std::vector<IdT> out;
    for (const auto& v : arr.as_array()) {
        if (v.is_number()) out.push_back(IdT(v.as_int64()));
    }
    return out;
}

template <typename Map, typename Entity>
void insert_unique(Map& map, Entity entity, const char* what) {
    const auto id = entity.id;
    if (!map.emplace(id, std::move(entity)).second) {
        throw ScenarioError(std::string("duplicate ") + what + " id " + to_string(id));
    }
}

template <typename Entity, typename Parse>
std::vector<Entity> parse_all(const JsonValue& arr, Parse parse) {
    std::vector<Entity> out;
    if (!arr.is_array()) return out;
    for (const auto& def : arr.as_array()) out.push_back(parse(def));
    return out;
}

std::vector<Trait> parse_traits(const JsonValue& arr) {
    std::vector<Trait> traits;
    for (const auto& def : arr.as_array()) {
        Trait t;
        if (def.is_string()) {
            t.name = def.as_string();
        } else {
            t.id = def["id"].get_int64(0);
            t.name = def["name"].get_string();
            t.description = def["description"].get_string();
        }
        traits.push_back(std::move(t));
    }
    return traits;
}

std::vector<JsonValue> json_list(const JsonValue& arr) {
    return arr.is_array() ? arr.as_array() : std::vector<JsonValue>{};
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Entities
// ═══════════════════════════════════════════════════════════════

Hex ScenarioLoader::parse_hex(const JsonValue& def) {
    Hex hex;
    hex.id = require_id<HexId>(def, "id", "hex");
    hex.q = def["q"].get_int(0);
    hex.r = def["r"].get_int(0);
    hex.terrain = def["terrain"].get_string(hex.terrain);
    hex.settlement = def["settlement"].get_int(0);
    hex.is_good_country = def["is_good_country"].get_bool(false);
    hex.has_road = def["has_road"].get_bool(false);
    hex.foraging_times_remaining = def["foraging_times_remaining"].get_int(
        hex.foraging_times_remaining);
    hex.is_torched = def["is_torched"].get_bool(false);
    hex.last_foraged_day = optional_int(def, "last_foraged_day");
    hex.last_recruited_day = optional_int(def, "last_recruited_day");
    hex.last_torched_day = optional_int(def, "last_torched_day");
    hex.last_control_change_day = optional_int(def, "last_control_change_day");
    hex.controlling_faction_id = optional_id<FactionId>(def, "controlling_faction_id");
    return hex;
}

UnitType ScenarioLoader::parse_unit_type(const JsonValue& def) {
    UnitType unit;
    unit.id = require_id<UnitTypeId>(def, "id", "unit type");
    unit.name = def["name"].get_string();
    unit.category = def["category"].get_string(unit.category);
    unit.battle_multiplier = def["battle_multiplier"].get_number(1.0);
    unit.supply_cost_per_day = def["supply_cost_per_day"].get_int(1);
    unit.can_travel_offroad = def["can_travel_offroad"].get_bool(true);
    unit.special_abilities = def["special_abilities"].is_object() ? def["special_abilities"]
                                                                  : JsonValue::object();
    return unit;
}

Commander ScenarioLoader::parse_commander(const JsonValue& def) {
    Commander commander;
    commander.id = require_id<CommanderId>(def, "id", "commander");
    const std::string what = "commander " + to_string(commander.id);
    commander.name = def["name"].get_string("Commander " + to_string(commander.id));
    commander.faction_id = require_id<FactionId>(def, "faction_id", what);
    commander.age = def["age"].get_int(commander.age);
    commander.traits = parse_traits(def["traits"]);
    commander.current_hex_id = optional_id<HexId>(def, "current_hex_id");
    commander.status = def["status"].get_string(commander.status);
    commander.captured_by_faction_id = optional_id<FactionId>(def, "captured_by_faction_id");
    return commander;
}

Army ScenarioLoader::parse_army(const JsonValue& def) {
    Army army;
    army.id = require_id<ArmyId>(def, "id", "army");
    const std::string what = "army " + to_string(army.id);
    army.commander_id = require_id<CommanderId>(def, "commander_id", what);
    army.current_hex_id = require_id<HexId>(def, "current_hex_id", what);

    for (const auto& d : def["detachments"].as_array()) {
        Detachment det;
        det.id = require_id<DetachmentId>(d, "id", what + " detachment");
        det.unit_type_id = require_id<UnitTypeId>(d, "unit_type_id",
                                                  what + " detachment " + to_string(det.id));
        det.soldiers = d["soldiers"].get_int(0);
        det.wagons = d["wagons"].get_int(0);
        det.engines = d["engines"].get_int(0);
        det.name = d["name"].get_string();
        det.supplies_equivalent = optional_int(d, "supplies_equivalent");
        if (!det.supplies_equivalent) {
            det.supplies_equivalent = optional_int(d["instance_data"], "supplies_equivalent");
        }
        army.detachments.push_back(std::move(det));
    }

    army.status = string_to_army_status(def["status"].get_string("idle"));
    army.movement_points_remaining = def["movement_points_remaining"].get_number(0.0);
    army.morale_current = def["morale_current"].get_int(army.morale_current);
    army.morale_resting = def["morale_resting"].get_int(army.morale_resting);
    army.morale_max = def["morale_max"].get_int(army.morale_max);
    army.supplies_current = def["supplies_current"].get_int(0);
    army.supplies_capacity = def["supplies_capacity"].get_int(0);
    army.daily_supply_consumption = def["daily_supply_consumption"].get_int(0);
    army.loot_carried = def["loot_carried"].get_int(0);
    army.noncombatant_count = def["noncombatant_count"].get_int(0);
    army.noncombatant_percentage = def["noncombatant_percentage"].get_number(
        army.noncombatant_percentage);
    army.forced_march_days = def["forced_march_days"].get_number(0.0);
    army.days_without_supplies = def["days_without_supplies"].get_int(0);
    army.days_marched_this_week = def["days_marched_this_week"].get_int(0);
    if (def["status_effects"].is_object()) army.status_effects = def["status_effects"];
    army.column_length_miles = def["column_length_miles"].get_number(0.0);
    army.rest_duration_days = optional_int(def, "rest_duration_days");
    army.rest_started_day = optional_int(def, "rest_started_day");
    army.destination_hex_id = optional_id<HexId>(def, "destination_hex_id");
    army.embarked_ship_id = optional_id<ShipId>(def, "embarked_ship_id");
    army.is_blockaded = def["is_blockaded"].get_bool(false);
    army.last_battle_day = optional_int(def, "last_battle_day");
    return army;
}

Stronghold ScenarioLoader::parse_stronghold(const JsonValue& def) {
    Stronghold s;
    s.id = require_id<StrongholdId>(def, "id", "stronghold");
    const std::string what = "stronghold " + to_string(s.id);
    s.hex_id = require_id<HexId>(def, "hex_id", what);
    s.type = string_to_stronghold_type(def["type"].get_string("town"));
    s.controlling_faction_id = require_id<FactionId>(def, "controlling_faction_id", what);
    s.defensive_bonus = def["defensive_bonus"].get_int(0);
    s.threshold = def["threshold"].get_int(s.threshold);
    s.current_threshold = def["current_threshold"].get_int(s.threshold);
    s.gates_open = def["gates_open"].get_bool(false);
    s.garrison_army_id = optional_id<ArmyId>(def, "garrison_army_id");
    s.supplies_held = def["supplies_held"].get_int(0);
    s.loot_held = def["loot_held"].get_int(0);
    return s;
}

Ship ScenarioLoader::parse_ship(const JsonValue& def) {
    Ship ship;
    ship.id = require_id<ShipId>(def, "id", "ship");
    const std::string what = "ship " + to_string(ship.id);
    ship.name = def["name"].get_string();
    ship.controlling_faction_id = require_id<FactionId>(def, "controlling_faction_id", what);
    ship.current_hex_id = require_id<HexId>(def, "current_hex_id", what);
    ship.status = string_to_naval_status(def["status"].get_string("available"));
    ship.morale = def["morale"].get_int(ship.morale);
    ship.embarked_army_id = optional_id<ArmyId>(def, "embarked_army_id");
    ship.current_route = id_list<HexId>(def["current_route"]);
    ship.travel_days_remaining = def["travel_days_remaining"].get_number(0.0);
    return ship;
}

Siege ScenarioLoader::parse_siege(const JsonValue& def) {
    Siege siege;
    siege.id = require_id<SiegeId>(def, "id", "siege");
    siege.stronghold_id = require_id<StrongholdId>(def, "stronghold_id",
                                                   "siege " + to_string(siege.id));
    siege.attacker_army_ids = id_list<ArmyId>(def["attacker_army_ids"]);
    siege.defender_army_id = optional_id<ArmyId>(def, "defender_army_id");
    siege.started_on_day = def["started_on_day"].get_int(0);
    siege.weeks_elapsed = def["weeks_elapsed"].get_int(0);
    siege.current_threshold = def["current_threshold"].get_int(0);
    siege.threshold_modifiers = json_list(def["threshold_modifiers"]);
    siege.siege_engines_count = def["siege_engines_count"].get_int(0);
    siege.attempts = json_list(def["attempts"]);
    siege.status = string_to_siege_status(def["status"].get_string("ongoing"));
    return siege;
}

Order ScenarioLoader::parse_order(const JsonValue& def) {
    Order order;
    order.id = require_id<OrderId>(def, "id", "order");
    const std::string what = "order " + to_string(order.id);
    order.army_id = optional_id<ArmyId>(def, "army_id");
    order.commander_id = require_id<CommanderId>(def, "commander_id", what);
    order.order_type = def["order_type"].get_string();
    if (order.order_type.empty()) throw ScenarioError(what + ": missing \"order_type\"");
    if (def["parameters"].is_object()) order.parameters = def["parameters"];
    order.issued_at = def["issued_at"].get_int64(order.id.value);
    order.execute_day = optional_int(def, "execute_day");
    if (def["execute_part"].is_string()) {
        order.execute_part = string_to_day_part(def["execute_part"].as_string());
    }
    order.priority = def["priority"].get_int(0);
    order.status = string_to_order_status(def["status"].get_string("pending"));
    return order;
}

Message ScenarioLoader::parse_message(const JsonValue& def) {
    Message m;
    m.id = require_id<MessageId>(def, "id", "message");
    const std::string what = "message " + to_string(m.id);
    m.sender_id = require_id<CommanderId>(def, "sender_id", what);
    m.recipient_id = require_id<CommanderId>(def, "recipient_id", what);
    m.content = def["content"].get_string();
    m.sent_on_day = def["sent_on_day"].get_int(0);
    m.delivered_on_day = optional_int(def, "delivered_on_day");
    m.travel_time_days = def["travel_time_days"].get_number(0.0);
    m.territory_type = def["territory_type"].get_string(m.territory_type);
    m.status = def["status"].get_string(m.status);
    m.days_remaining = def["days_remaining"].get_number(m.travel_time_days);
    m.failure_reason = def["failure_reason"].get_string();
    return m;
}

Operation ScenarioLoader::parse_operation(const JsonValue& def) {
    Operation op;
    op.id = require_id<OperationId>(def, "id", "operation");
    op.commander_id = require_id<CommanderId>(def, "commander_id",
                                              "operation " + to_string(op.id));
    op.operation_type = string_to_operation_type(def["operation_type"].get_string());
    if (def["target_descriptor"].is_object()) op.target_descriptor = def["target_descriptor"];
    op.loot_cost = def["loot_cost"].get_int(0);
    op.complexity = def["complexity"].get_string(op.complexity);
    op.success_chance = def["success_chance"].get_number(0.0);
    op.executed_on_day = optional_int(def, "executed_on_day");
    op.outcome = string_to_operation_outcome(def["outcome"].get_string("pending"));
    op.result = def["result"];
    op.territory_type = def["territory_type"].get_string(op.territory_type);
    op.difficulty_modifier = def["difficulty_modifier"].get_int(0);
    return op;
}

MercenaryContract ScenarioLoader::parse_mercenary_contract(const JsonValue& def) {
    MercenaryContract contract;
    contract.id = require_id<MercenaryContractId>(def, "id", "mercenary contract");
    const std::string what = "mercenary contract " + to_string(contract.id);
    contract.company_id = def["company_id"].get_int64(0);
    contract.commander_id = require_id<CommanderId>(def, "commander_id", what);
    contract.army_id = optional_id<ArmyId>(def, "army_id");
    contract.start_day = def["start_day"].get_int(0);
    contract.end_day = optional_int(def, "end_day");
    contract.status = def["status"].get_string(contract.status);
    contract.last_upkeep_day = def["last_upkeep_day"].get_int(contract.start_day);
    contract.infantry_rate = optional_int(def["negotiated_rates"], "infantry");
    contract.cavalry_rate = optional_int(def["negotiated_rates"], "cavalry");
    contract.days_unpaid = def["days_unpaid"].get_int(0);
    return contract;
}

// ═══════════════════════════════════════════════════════════════
// Campaign
// ═══════════════════════════════════════════════════════════════

Campaign ScenarioLoader::load(const JsonValue& scenario) {
    if (!scenario.is_object()) throw ScenarioError("scenario is not a JSON object");

    Campaign campaign;
    campaign.id = CampaignId(scenario["id"].get_int64(1));
    campaign.name = scenario["name"].get_string("campaign");
    campaign.current_day = scenario["current_day"].get_int(0);
    campaign.current_part = string_to_day_part(scenario["current_part"].get_string("morning"));
    campaign.season = string_to_season(scenario["season"].get_string("spring"));
    campaign.status = scenario["status"].get_string("active");

    for (const auto& def : json_list(scenario["factions"])) {
        Faction f;
        f.id = require_id<FactionId>(def, "id", "faction");
        f.name = def["name"].get_string();
        f.color = def["color"].get_string();
        insert_unique(campaign.factions, std::move(f), "faction");
    }

    for (auto& e : parse_all<Hex>(scenario["hexes"], parse_hex)) {
        insert_unique(campaign.map.hexes, std::move(e), "hex");
    }
    for (auto& e : parse_all<UnitType>(scenario["unit_types"], parse_unit_type)) {
        insert_unique(campaign.unit_types, std::move(e), "unit type");
    }
    for (auto& e : parse_all<Commander>(scenario["commanders"], parse_commander)) {
        insert_unique(campaign.commanders, std::move(e), "commander");
    }
    for (auto& e : parse_all<Army>(scenario["armies"], parse_army)) {
        insert_unique(campaign.armies, std::move(e), "army");
    }
    for (auto& e : parse_all<Stronghold>(scenario["strongholds"], parse_stronghold)) {
        insert_unique(campaign.strongholds, std::move(e), "stronghold");
    }
    for (auto& e : parse_all<Ship>(scenario["ships"], parse_ship)) {
        insert_unique(campaign.ships, std::move(e), "ship");
    }
    for (auto& e : parse_all<Siege>(scenario["sieges"], parse_siege)) {
        insert_unique(campaign.sieges, std::move(e), "siege");
    }
    for (auto& e : parse_all<Order>(scenario["orders"], parse_order)) {
        insert_unique(campaign.orders, std::move(e), "order");
    }
    for (auto& e : parse_all<Message>(scenario["messages"], parse_message)) {
        insert_unique(campaign.messages, std::move(e), "message");
    }
    for (auto& e : parse_all<Operation>(scenario["operations"], parse_operation)) {
        insert_unique(campaign.operations, std::move(e), "operation");
    }
    for (auto& e : parse_all<MercenaryContract>(scenario["mercenary_contracts"],
                                                parse_mercenary_contract)) {
        insert_unique(campaign.mercenary_contracts, std::move(e), "mercenary contract");
    }

    check_references(campaign);
    return campaign;
}

Campaign ScenarioLoader::load_file(const std::string& path) {
    return load(JsonReader::parse_file(path));
}

void ScenarioLoader::check_references(const Campaign& campaign) {
    auto fail = [](const std::string& what, const std::string& ref) {
        throw ScenarioError(what + ": unknown " + ref);
    };

    for (const auto& [id, commander] : campaign.commanders) {
        if (!campaign.factions.count(commander.faction_id)) {
            fail("commander " + to_string(id), "faction " + to_string(commander.faction_id));
        }
    }
    for (const auto& [id, army] : campaign.armies) {
        const std::string what = "army " + to_string(id);
        if (!campaign.commanders.count(army.commander_id)) {
            fail(what, "commander " + to_string(army.commander_id));
        }
        if (!campaign.map.get_hex(army.current_hex_id)) {
            fail(what, "hex " + to_string(army.current_hex_id));
        }
        for (const auto& det : army.detachments) {
            if (!campaign.unit_types.count(det.unit_type_id)) {
                fail(what, "unit type " + to_string(det.unit_type_id));
            }
        }
    }
    for (const auto& [id, s] : campaign.strongholds) {
        const std::string what = "stronghold " + to_string(id);
        if (!campaign.map.get_hex(s.hex_id)) fail(what, "hex " + to_string(s.hex_id));
        if (s.garrison_army_id && !campaign.armies.count(*s.garrison_army_id)) {
            fail(what, "garrison army " + to_string(*s.garrison_army_id));
        }
    }
    for (const auto& [id, siege] : campaign.sieges) {
        if (!campaign.strongholds.count(siege.stronghold_id)) {
            fail("siege " + to_string(id), "stronghold " + to_string(siege.stronghold_id));
        }
    }
    for (const auto& [id, contract] : campaign.mercenary_contracts) {
        const std::string what = "mercenary contract " + to_string(id);
        if (!campaign.commanders.count(contract.commander_id)) {
            fail(what, "commander " + to_string(contract.commander_id));
        }
        if (contract.army_id && !campaign.armies.count(*contract.army_id)) {
            fail(what, "army " + to_string(*contract.army_id));
        }
    }
    for (const auto& [id, order] : campaign.orders) {
        if (!campaign.commanders.count(order.commander_id)) {
            fail("order " + to_string(id), "commander " + to_string(order.commander_id));
        }
    }
}

} // namespace strat
