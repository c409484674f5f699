/**
 * Movement: Daily march allowances, order validation, and night forks.
 *
 * Base allowance (miles/day):
 *   standard  12 road / 6 off-road
 *   forced    18 road / 9 off-road   (doubled for all-cavalry armies)
 *   night      6 road / no off-road
 * Weather reduces the allowance unless the commander is a Ranger; columns
 * longer than the configured threshold are capped at 6 standard / 12 forced.
 */

#ifndef STRAT_RULES_MOVEMENT_HPP
#define STRAT_RULES_MOVEMENT_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include <string>
#include <vector>

namespace strat::rules {

struct MovementOptions {
    bool on_road = true;
    std::vector<Trait> traits;
    int weather_modifier = 0;         // -1 bad, -2 very bad
};

struct MovementValidation {
    bool valid = true;
    std::string error;
};

/** Miles the army can cover in one day of the given movement type. */
double calculate_daily_movement_miles(const UnitTypeMap& unit_types, const Army& army,
                                      MovementType movement_type,
                                      const MovementOptions& options,
                                      const RulesConfig& rules);

/**
 * Rejects off-road legs or river fords with wagons, off-road night marches,
 * and off-road legs for unit types that must stay on the road.
 */
MovementValidation validate_movement_order(const UnitTypeMap& unit_types, const Army& army,
                                           const std::vector<bool>& off_road_legs,
                                           const std::vector<bool>& has_river_fords,
                                           bool is_night);

/** Chance night_wrong_path_chance in 6, rolled on 1d6. */
bool should_take_wrong_fork(const std::string& seed, const RulesConfig& rules);

} // namespace strat::rules

#endif // STRAT_RULES_MOVEMENT_HPP
