/**
 * Mercenaries: Daily upkeep for hired companies.
 *
 * Upkeep is charged in loot from the army a contract is attached to, for
 * every day since it was last settled. A contract the army cannot pay
 * goes unpaid and costs morale; once unpaid past the grace period the
 * company may walk away.
 */

#ifndef STRAT_RULES_MERCENARIES_HPP
#define STRAT_RULES_MERCENARIES_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include <vector>

namespace strat::rules {

struct UpkeepOutcome {
    MercenaryContractId contract_id;
    ArmyId army_id;
    int amount_due = 0;
    bool paid = false;
    int days_unpaid = 0;
    bool deserted = false;
};

/** Loot per day owed for the soldiers of the contract's army. */
int daily_upkeep_cost(const Campaign& campaign, const MercenaryContract& contract,
                      const RulesConfig& rules);

/** Settle every active or unpaid contract that has days due. */
std::vector<UpkeepOutcome> process_daily_upkeep(Campaign& campaign, const RulesConfig& rules);

} // namespace strat::rules

#endif // STRAT_RULES_MERCENARIES_HPP
