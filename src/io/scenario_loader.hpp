/**
 * ScenarioLoader: Build a Campaign from scenario JSON.
 *
 * Scenario layout (every array optional):
 * {
 *   "id": 1, "name": "...", "current_day": 0, "current_part": "morning",
 *   "season": "spring",
 *   "factions":    [{"id", "name", "color"}],
 *   "commanders":  [{"id", "name", "faction_id", "age", "current_hex_id",
 *                    "traits": [{"id", "name", "description"} | "name"]}],
 *   "hexes":       [{"id", "q", "r", "terrain", "settlement", "has_road", ...}],
 *   "unit_types":  [{"id", "name", "category", "battle_multiplier",
 *                    "supply_cost_per_day", "can_travel_offroad",
 *                    "special_abilities"}],
 *   "armies":      [{"id", "commander_id", "current_hex_id",
 *                    "detachments": [{"id", "unit_type_id", "soldiers", ...}], ...}],
 *   "strongholds": [...], "ships": [...], "sieges": [...],
 *   "orders":      [{"id", "army_id", "commander_id", "order_type",
 *                    "parameters", "execute_day", "execute_part", "priority"}],
 *   "messages": [...], "operations": [...],
 *   "rules": { ... see io/rules_loader.hpp ... }
 * }
 *
 * Cross references are checked after every entity is read, so entities
 * may appear in any order.
 */

#ifndef STRAT_IO_SCENARIO_LOADER_HPP
#define STRAT_IO_SCENARIO_LOADER_HPP

#include "core/campaign.hpp"
#include "io/json_reader.hpp"
#include <stdexcept>
#include <string>

namespace strat {

/** Malformed or inconsistent scenario; the message names the entity. */
class ScenarioError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ScenarioLoader {
public:
    /**
     * @throws ScenarioError on missing ids, duplicates or dangling references
     */
    static Campaign load(const JsonValue& scenario);

    /**
     * @throws std::runtime_error on file or parse errors, ScenarioError as load()
     */
    static Campaign load_file(const std::string& path);

    static Hex parse_hex(const JsonValue& def);
    static UnitType parse_unit_type(const JsonValue& def);
    static Commander parse_commander(const JsonValue& def);
    static Army parse_army(const JsonValue& def);
    static Stronghold parse_stronghold(const JsonValue& def);
    static Ship parse_ship(const JsonValue& def);
    static Siege parse_siege(const JsonValue& def);
    static Order parse_order(const JsonValue& def);
    static Message parse_message(const JsonValue& def);
    static Operation parse_operation(const JsonValue& def);
    static MercenaryContract parse_mercenary_contract(const JsonValue& def);

private:
    static void check_references(const Campaign& campaign);
};

} // namespace strat

#endif // STRAT_IO_SCENARIO_LOADER_HPP
