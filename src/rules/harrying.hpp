/**
 * Harrying: Detachments raiding an enemy army.
 *
 * Success on 1d6 <= min(6, 2 + modifier), where skirmishers add 1 and
 * cavalry adds 2. Objectives:
 *   kill   20% of the raiding soldiers' count in enemy casualties
 *   torch  (2d6 + modifier) x soldiers supplies burned
 *   steal  (1d6 + modifier) x soldiers of loot, then supplies up to capacity
 * A failed raid costs the raiders 20% of their soldiers. Either way the
 * target is marked "harried" and its movement points are capped at 0.5.
 */

#ifndef STRAT_RULES_HARRYING_HPP
#define STRAT_RULES_HARRYING_HPP

#include "core/campaign.hpp"
#include <string>
#include <vector>

namespace strat::rules {

struct HarryingResult {
    bool success = false;
    std::string detail;
    int roll = 0;
    int modifier = 0;
    int inflicted_casualties = 0;
    int attacker_losses = 0;
    int supplies_burned = 0;
    int supplies_stolen = 0;
    int loot_stolen = 0;
};

/**
 * @param detached  detachments of `attacker` taking part in the raid
 * @param objective "kill", "torch" or "steal" (case-insensitive)
 * @throws std::invalid_argument on no detachments, no soldiers, or an
 *         unknown objective
 */
HarryingResult resolve_harrying(Campaign& campaign, Army& attacker, Army& target,
                                const std::vector<Detachment*>& detached,
                                const std::string& objective = "kill");

} // namespace strat::rules

#endif // STRAT_RULES_HARRYING_HPP
