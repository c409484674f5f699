/**
 * Naval: Embarkation, courses, and per-part ship travel.
 *
 * Ships sail at the friendly speed; each route leg costs at least one hex
 * of 6 miles. Embarked armies move with their ship when it arrives.
 */

#ifndef STRAT_RULES_NAVAL_HPP
#define STRAT_RULES_NAVAL_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include <string>
#include <vector>

namespace strat::rules {

constexpr int kHexMiles = 6;
constexpr int kDayPartsPerDay = 4;

struct NavalActionResult {
    bool success = false;
    std::string detail;
};

NavalActionResult embark_army(Army& army, Ship& ship, const RulesConfig& rules);

/** Fails while the ship still has travel time left. */
NavalActionResult disembark_army(Army& army, Ship& ship, const RulesConfig& rules);

NavalActionResult set_course(const Campaign& campaign, Ship& ship,
                             const std::vector<HexId>& route, const RulesConfig& rules);

/** Count down travel timers by one day-part and land ships that arrive. */
void advance_ships(Campaign& campaign, double day_fraction = 1.0 / kDayPartsPerDay);

} // namespace strat::rules

#endif // STRAT_RULES_NAVAL_HPP
