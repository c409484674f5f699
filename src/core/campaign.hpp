/**
 * Campaign: Root aggregate holding every entity of one campaign.
 *
 * All entity state lives in id-keyed std::maps owned by the Campaign. Rules
 * code receives a Campaign& and mutates entities in place; nothing keeps
 * its own copy. Lookups return a pointer, nullptr when the id is unknown.
 */

#ifndef STRAT_CAMPAIGN_HPP
#define STRAT_CAMPAIGN_HPP

#include "core/enums.hpp"
#include "core/ids.hpp"
#include "io/json_reader.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strat {

// ── Factions and commanders ──

struct Trait {
    int64_t id = 0;
    std::string name;
    std::string description;
};

/** Case-insensitive trait lookup. */
bool has_trait(const std::vector<Trait>& traits, const std::string& name);

struct Faction {
    FactionId id;
    std::string name;
    std::string color;
};

struct Commander {
    CommanderId id;
    std::string name;
    FactionId faction_id;
    int age = 30;
    std::vector<Trait> traits;
    std::optional<HexId> current_hex_id;
    std::string status = "active";            // active | escaped | captured
    std::optional<FactionId> captured_by_faction_id;

    bool has_trait(const std::string& name) const { return strat::has_trait(traits, name); }
};

// ── Map ──

struct Hex {
    HexId id;
    int q = 0;
    int r = 0;
    std::string terrain = "flatland";
    int settlement = 0;
    bool is_good_country = false;
    bool has_road = false;
    int foraging_times_remaining = 5;
    bool is_torched = false;
    std::optional<int> last_foraged_day;
    std::optional<int> last_recruited_day;
    std::optional<int> last_torched_day;
    std::optional<int> last_control_change_day;
    std::optional<FactionId> controlling_faction_id;
};

struct CampaignMap {
    std::map<HexId, Hex> hexes;

    Hex* get_hex(HexId id);
    const Hex* get_hex(HexId id) const;

    /** Hex at axial coordinates, nullptr if the map has none there. */
    Hex* hex_at(int q, int r);
};

// ── Forces ──

struct UnitType {
    UnitTypeId id;
    std::string name;
    std::string category = "infantry";        // infantry | cavalry | siege | ...
    double battle_multiplier = 1.0;
    int supply_cost_per_day = 1;
    bool can_travel_offroad = true;
    JsonValue special_abilities;              // e.g. {"skirmisher": true}

    bool has_ability(const std::string& name) const {
        return special_abilities[name].truthy();
    }
};

struct Detachment {
    DetachmentId id;
    UnitTypeId unit_type_id;
    int soldiers = 0;
    int wagons = 0;
    int engines = 0;
    std::string name;
    std::optional<int> supplies_equivalent;   // wizards carry the encumbrance value
};

struct Army {
    ArmyId id;
    CommanderId commander_id;
    HexId current_hex_id;
    std::vector<Detachment> detachments;
    ArmyStatus status = ArmyStatus::IDLE;
    double movement_points_remaining = 0.0;
    int morale_current = 9;
    int morale_resting = 9;
    int morale_max = 12;
    int supplies_current = 0;
    int supplies_capacity = 0;
    int daily_supply_consumption = 0;
    int loot_carried = 0;
    int noncombatant_count = 0;
    double noncombatant_percentage = 0.25;
    double forced_march_days = 0.0;
    int days_without_supplies = 0;
    int days_marched_this_week = 0;
    JsonValue status_effects = JsonValue::object();
    double column_length_miles = 0.0;
    std::optional<int> rest_duration_days;
    std::optional<int> rest_started_day;
    std::optional<HexId> destination_hex_id;
    std::optional<ShipId> embarked_ship_id;
    bool is_blockaded = false;
    std::vector<OrderId> orders_queue;
    std::optional<int> last_battle_day;

    int total_soldiers() const;
    int total_wagons() const;
};

using UnitTypeMap = std::map<UnitTypeId, UnitType>;

struct Stronghold {
    StrongholdId id;
    HexId hex_id;
    StrongholdType type = StrongholdType::TOWN;
    FactionId controlling_faction_id;
    int defensive_bonus = 0;
    int threshold = 10;
    int current_threshold = 10;
    bool gates_open = false;
    std::optional<ArmyId> garrison_army_id;
    int supplies_held = 0;
    int loot_held = 0;
};

struct Ship {
    ShipId id;
    std::string name;
    FactionId controlling_faction_id;
    HexId current_hex_id;
    NavalStatus status = NavalStatus::AVAILABLE;
    int morale = 9;
    std::optional<ArmyId> embarked_army_id;
    std::vector<HexId> current_route;
    double travel_days_remaining = 0.0;
};

struct Siege {
    SiegeId id;
    StrongholdId stronghold_id;
    std::vector<ArmyId> attacker_army_ids;
    std::optional<ArmyId> defender_army_id;
    int started_on_day = 0;
    int weeks_elapsed = 0;
    int current_threshold = 0;
    std::vector<JsonValue> threshold_modifiers;
    int siege_engines_count = 0;
    std::vector<JsonValue> attempts;
    SiegeStatus status = SiegeStatus::ONGOING;
};

// ── Messaging, operations, recruitment ──

struct Message {
    MessageId id;
    CommanderId sender_id;
    CommanderId recipient_id;
    std::string content;
    int sent_on_day = 0;
    std::optional<int> delivered_on_day;
    double travel_time_days = 0.0;
    std::string territory_type = "friendly";
    std::string status = "in_transit";        // in_transit | delivered | failed
    double days_remaining = 0.0;
    std::string failure_reason;
};

struct Operation {
    OperationId id;
    CommanderId commander_id;
    OperationType operation_type = OperationType::INTELLIGENCE;
    JsonValue target_descriptor = JsonValue::object();
    int loot_cost = 0;
    std::string complexity = "standard";      // simple | standard | complex
    double success_chance = 0.0;
    std::optional<int> executed_on_day;
    OperationOutcome outcome = OperationOutcome::PENDING;
    JsonValue result;
    std::string territory_type = "friendly";
    int difficulty_modifier = 0;
};

struct RecruitmentProject {
    RecruitmentId id;
    StrongholdId stronghold_id;
    FactionId faction_id;
    CommanderId commander_id;
    HexId rally_hex_id;
    int started_on_day = 0;
    int completes_on_day = 0;
    int infantry = 0;
    int cavalry = 0;
    int wagons = 0;
    int noncombatants = 0;
    std::vector<HexId> source_hex_ids;
    OrderId pending_order_id;
    bool revolt_triggered = false;
};

/** A hired company paid in loot from the army it marches with. */
struct MercenaryContract {
    MercenaryContractId id;
    int64_t company_id = 0;
    CommanderId commander_id;
    std::optional<ArmyId> army_id;
    int start_day = 0;
    std::optional<int> end_day;
    std::string status = "active";            // active | unpaid | terminated
    int last_upkeep_day = 0;
    std::optional<int> infantry_rate;         // negotiated, per soldier per day
    std::optional<int> cavalry_rate;
    int days_unpaid = 0;
};

// ── Orders ──

struct OrderResult {
    std::string detail;
    std::vector<JsonValue> events;
};

/** Carried by a raise_army order between muster start and completion. */
struct RecruitmentSchedule {
    RecruitmentId project_id;
    UnitTypeId infantry_unit_type_id;
    std::optional<UnitTypeId> cavalry_unit_type_id;
    std::string army_name;
};

struct Order {
    OrderId id;
    std::optional<ArmyId> army_id;
    CommanderId commander_id;
    std::string order_type;
    JsonValue parameters = JsonValue::object();
    int64_t issued_at = 0;                    // submission sequence / epoch seconds
    std::optional<int> execute_day;
    std::optional<DayPart> execute_part;
    int priority = 0;
    OrderStatus status = OrderStatus::PENDING;
    std::optional<OrderResult> result;
    std::optional<RecruitmentSchedule> schedule;
};

// ── Campaign ──

class Campaign {
public:
    CampaignId id;
    std::string name;
    int current_day = 0;
    DayPart current_part = DayPart::MORNING;
    Season season = Season::SPRING;
    std::string status = "active";

    CampaignMap map;
    std::map<FactionId, Faction> factions;
    std::map<CommanderId, Commander> commanders;
    std::map<ArmyId, Army> armies;
    std::map<StrongholdId, Stronghold> strongholds;
    std::map<ShipId, Ship> ships;
    UnitTypeMap unit_types;
    std::map<SiegeId, Siege> sieges;
    std::map<OrderId, Order> orders;
    std::map<MessageId, Message> messages;
    std::map<OperationId, Operation> operations;
    std::map<RecruitmentId, RecruitmentProject> recruitments;
    std::map<MercenaryContractId, MercenaryContract> mercenary_contracts;

    /** Order results and tick events in the order they happened. */
    std::vector<JsonValue> event_log;

    Army* get_army(ArmyId id);
    const Army* get_army(ArmyId id) const;
    Commander* get_commander(CommanderId id);
    const Commander* get_commander(CommanderId id) const;
    Faction* get_faction(FactionId id);
    Stronghold* get_stronghold(StrongholdId id);
    Ship* get_ship(ShipId id);
    Siege* get_siege(SiegeId id);
    Order* get_order(OrderId id);
    Operation* get_operation(OperationId id);
    RecruitmentProject* get_recruitment(RecruitmentId id);
    const UnitType* get_unit_type(UnitTypeId id) const;

    /** Faction of the army's commander, if both exist. */
    std::optional<FactionId> army_faction(const Army& army) const;

    /** First siege recorded against the stronghold, any status. */
    Siege* find_siege_by_stronghold(StrongholdId id);

    /** Army whose detachment list contains the detachment. */
    Army* find_army_by_detachment(DetachmentId id);

    ArmyId next_army_id() const;
    SiegeId next_siege_id() const;
    MessageId next_message_id() const;
    OperationId next_operation_id() const;
    RecruitmentId next_recruitment_id() const;
    FactionId next_faction_id() const;
    CommanderId next_commander_id() const;
    DetachmentId next_detachment_id() const;
};

} // namespace strat

#endif // STRAT_CAMPAIGN_HPP
