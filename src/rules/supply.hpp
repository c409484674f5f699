/**
 * Supply: Capacity, consumption, column length, foraging and torching.
 *
 * Foraging and torching mutate the campaign (army supplies, hex counters,
 * torched flags). Revolt risk is rolled on seeded dice scoped to the
 * campaign's current day-part; spawning rebels is left to the caller.
 */

#ifndef STRAT_RULES_SUPPLY_HPP
#define STRAT_RULES_SUPPLY_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include <string>
#include <vector>

namespace strat::rules {

struct SupplySnapshot {
    int total_soldiers = 0;
    int total_cavalry = 0;
    int total_wagons = 0;
    int noncombatants = 0;
    int capacity = 0;
    int consumption = 0;
    double column_length_miles = 0.0;
    int wizard_detachments = 0;
};

struct HexFailure {
    HexId hex_id;
    std::string reason;
};

struct ForageOutcome {
    bool success = false;
    int supplies_gained = 0;
    std::vector<HexId> foraged_hexes;
    std::vector<HexFailure> failed_hexes;
    bool revolt_triggered = false;
};

struct TorchOutcome {
    bool success = false;
    std::vector<HexId> torched_hexes;
    std::vector<HexFailure> failed_hexes;
    bool revolt_triggered = false;
};

struct SupplyOptions {
    std::string weather = "clear";    // clear | bad | storm | very_bad
};

/** Result of one day's consumption for an army. */
struct ConsumptionOutcome {
    int consumed = 0;
    bool starving = false;
    bool morale_failed = false;
    bool dissolved = false;
    JsonValue consequence;            // morale consequence details, if any
};

/** "cavalry", "infantry", ... ; unknown unit types count as infantry. */
std::string unit_category(const UnitTypeMap& unit_types, UnitTypeId id);

bool unit_has_ability(const UnitTypeMap& unit_types, UnitTypeId id, const std::string& ability);

/** Traits of the army's commander, empty if the commander is unknown. */
std::vector<Trait> commander_traits(const Campaign& campaign, const Army& army);

SupplySnapshot build_supply_snapshot(const Campaign& campaign, const Army& army,
                                     const RulesConfig& rules);

/** Miles of road the marching column occupies. */
double column_length_miles(const UnitTypeMap& unit_types, const Army& army,
                           const std::vector<Trait>& traits, const RulesConfig& rules);

/** Hexes reachable for foraging/torching from the army's hex. */
int foraging_range(const UnitTypeMap& unit_types, const Army& army,
                   const std::vector<Trait>& traits, const std::string& weather,
                   const RulesConfig& rules);

ForageOutcome forage(Campaign& campaign, Army& army, const std::vector<HexId>& target_hexes,
                     const RulesConfig& rules, const SupplyOptions& options = {});

TorchOutcome torch(Campaign& campaign, Army& army, const std::vector<HexId>& target_hexes,
                   const RulesConfig& rules, const SupplyOptions& options = {});

/**
 * Eat one day of supplies. An army that cannot eat loses morale, makes a
 * seeded morale check, and dissolves after the configured number of days.
 */
ConsumptionOutcome consume_daily_supplies(Campaign& campaign, Army& army,
                                          const RulesConfig& rules);

} // namespace strat::rules

#endif // STRAT_RULES_SUPPLY_HPP
