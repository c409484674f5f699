#include "io/report_writer.hpp"
#include "io/json_writer.hpp"

namespace strat {

namespace {

template <typename IdT>
void optional_id(JsonWriter& w, const char* key, const std::optional<IdT>& id) {
    w.key(key);
    if (id) w.value(id->value);
    else w.null_value();
}

void optional_int(JsonWriter& w, const char* key, const std::optional<int>& v) {
    w.key(key);
    if (v) w.value(*v);
    else w.null_value();
}

void write_army(JsonWriter& w, const Army& army) {
    w.begin_object();
    w.kv("id", army.id.value);
    w.kv("commander_id", army.commander_id.value);
    w.kv("hex_id", army.current_hex_id.value);
    w.kv("status", army_status_to_string(army.status));
    w.kv("soldiers", army.total_soldiers());
    w.kv("noncombatants", army.noncombatant_count);
    w.kv("morale", army.morale_current);
    w.kv("supplies", army.supplies_current);
    w.kv("supplies_capacity", army.supplies_capacity);
    w.kv("loot", army.loot_carried);
    w.kv("movement_points_remaining", army.movement_points_remaining);
    w.kv("forced_march_days", army.forced_march_days);
    w.kv("days_without_supplies", army.days_without_supplies);
    optional_id(w, "embarked_ship_id", army.embarked_ship_id);

    w.key("detachments").begin_array();
    for (const auto& det : army.detachments) {
        w.begin_object();
        w.kv("id", det.id.value);
        w.kv("unit_type_id", det.unit_type_id.value);
        w.kv("soldiers", det.soldiers);
        w.kv("wagons", det.wagons);
        w.end_object();
    }
    w.end_array();

    w.key("status_effects").value(army.status_effects);
    w.end_object();
}

void write_stronghold(JsonWriter& w, const Stronghold& s) {
    w.begin_object();
    w.kv("id", s.id.value);
    w.kv("hex_id", s.hex_id.value);
    w.kv("type", stronghold_type_to_string(s.type));
    w.kv("controlling_faction_id", s.controlling_faction_id.value);
    w.kv("gates_open", s.gates_open);
    optional_id(w, "garrison_army_id", s.garrison_army_id);
    w.kv("current_threshold", s.current_threshold);
    w.kv("supplies_held", s.supplies_held);
    w.kv("loot_held", s.loot_held);
    w.end_object();
}

void write_siege(JsonWriter& w, const Siege& siege) {
    w.begin_object();
    w.kv("id", siege.id.value);
    w.kv("stronghold_id", siege.stronghold_id.value);
    w.kv("status", siege_status_to_string(siege.status));
    w.kv("weeks_elapsed", siege.weeks_elapsed);
    w.kv("current_threshold", siege.current_threshold);
    w.key("attacker_army_ids").begin_array();
    for (const auto& id : siege.attacker_army_ids) w.value(id.value);
    w.end_array();
    w.end_object();
}

void write_ship(JsonWriter& w, const Ship& ship) {
    w.begin_object();
    w.kv("id", ship.id.value);
    w.kv("name", ship.name);
    w.kv("hex_id", ship.current_hex_id.value);
    w.kv("status", naval_status_to_string(ship.status));
    optional_id(w, "embarked_army_id", ship.embarked_army_id);
    w.kv("travel_days_remaining", ship.travel_days_remaining);
    w.end_object();
}

void write_message(JsonWriter& w, const Message& m) {
    w.begin_object();
    w.kv("id", m.id.value);
    w.kv("sender_id", m.sender_id.value);
    w.kv("recipient_id", m.recipient_id.value);
    w.kv("status", m.status);
    w.kv("sent_on_day", m.sent_on_day);
    optional_int(w, "delivered_on_day", m.delivered_on_day);
    w.kv("days_remaining", m.days_remaining);
    if (!m.failure_reason.empty()) w.kv("failure_reason", m.failure_reason);
    w.end_object();
}

void write_operation(JsonWriter& w, const Operation& op) {
    w.begin_object();
    w.kv("id", op.id.value);
    w.kv("commander_id", op.commander_id.value);
    w.kv("operation_type", operation_type_to_string(op.operation_type));
    w.kv("outcome", operation_outcome_to_string(op.outcome));
    optional_int(w, "executed_on_day", op.executed_on_day);
    w.key("result").value(op.result);
    w.end_object();
}

void write_recruitment(JsonWriter& w, const RecruitmentProject& p) {
    w.begin_object();
    w.kv("id", p.id.value);
    w.kv("stronghold_id", p.stronghold_id.value);
    w.kv("completes_on_day", p.completes_on_day);
    w.kv("infantry", p.infantry);
    w.kv("cavalry", p.cavalry);
    w.kv("revolt_triggered", p.revolt_triggered);
    w.end_object();
}

void write_order(JsonWriter& w, const Order& order) {
    w.begin_object();
    w.kv("id", order.id.value);
    w.kv("order_type", order.order_type);
    optional_id(w, "army_id", order.army_id);
    w.kv("status", order_status_to_string(order.status));
    optional_int(w, "execute_day", order.execute_day);
    w.key("result");
    if (order.result) {
        w.begin_object();
        w.kv("detail", order.result->detail);
        w.key("events").begin_array();
        for (const auto& event : order.result->events) w.value(event);
        w.end_array();
        w.end_object();
    } else {
        w.null_value();
    }
    w.end_object();
}

void write_contract(JsonWriter& w, const MercenaryContract& c) {
    w.begin_object();
    w.kv("id", c.id.value);
    optional_id(w, "army_id", c.army_id);
    w.kv("status", c.status);
    w.kv("last_upkeep_day", c.last_upkeep_day);
    w.kv("days_unpaid", c.days_unpaid);
    w.end_object();
}

template <typename Map, typename Fn>
void write_map(JsonWriter& w, const char* key, const Map& map, Fn write) {
    w.key(key).begin_array();
    for (const auto& [id, entity] : map) write(w, entity);
    w.end_array();
}

} // anonymous namespace

void write_campaign_report(const Campaign& campaign, std::ostream& os) {
    JsonWriter w(os);
    w.begin_object();
    w.kv("campaign_id", campaign.id.value);
    w.kv("name", campaign.name);
    w.kv("current_day", campaign.current_day);
    w.kv("current_part", day_part_to_string(campaign.current_part));
    w.kv("season", season_to_string(campaign.season));

    write_map(w, "armies", campaign.armies, write_army);
    write_map(w, "strongholds", campaign.strongholds, write_stronghold);
    write_map(w, "sieges", campaign.sieges, write_siege);
    write_map(w, "ships", campaign.ships, write_ship);
    write_map(w, "messages", campaign.messages, write_message);
    write_map(w, "operations", campaign.operations, write_operation);
    write_map(w, "recruitments", campaign.recruitments, write_recruitment);
    write_map(w, "mercenary_contracts", campaign.mercenary_contracts, write_contract);
    write_map(w, "orders", campaign.orders, write_order);

    w.key("event_log").begin_array();
    for (const auto& event : campaign.event_log) w.value(event);
    w.end_array();

    w.end_object();
    os << "\n";
}

} // namespace strat
