/**
 * Siege: Weekly threshold progression.
 *
 * Each week the threshold drops by the default modifier, shifts by every
 * recorded modifier ({"type": ..., "value": n} uses value, otherwise the
 * type's configured amount) and by one per siege engine. It never falls
 * below the starvation threshold. A 2d6 roll above it opens the gates.
 */

#ifndef STRAT_RULES_SIEGE_HPP
#define STRAT_RULES_SIEGE_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include <string>

namespace strat::rules {

struct SiegeAdvanceResult {
    bool gates_opened = false;
    int threshold_after = 0;
    int roll = 0;
};

/** Starting threshold for a stronghold of the given type. */
int siege_threshold_for(StrongholdType type, const RulesConfig& rules);

SiegeAdvanceResult advance_siege(Siege& siege, const std::string& roll_seed,
                                 const RulesConfig& rules);

} // namespace strat::rules

#endif // STRAT_RULES_SIEGE_HPP
