/**
 * Recruitment: Mustering new armies from a stronghold's hinterland.
 *
 * A stronghold draws from every settled hex its faction controls that is
 * not closer to another stronghold (ties go to the higher-ranked type,
 * then the lower id). Infantry is the settlement sum rounded to the
 * nearest hundred; good country adds 25% cavalry and 5% wagons of its
 * settlement, scaled by the same rounding. Hexes recruited again within
 * the cooldown may revolt and spawn a rebel faction with an army.
 */

#ifndef STRAT_RULES_RECRUITMENT_HPP
#define STRAT_RULES_RECRUITMENT_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace strat::rules {

struct RecruitmentStart {
    RecruitmentId project_id;
    std::vector<ArmyId> revolt_army_ids;
    std::string detail;
};

struct RecruitmentCompletionOptions {
    std::string army_name;
    UnitTypeId infantry_type_id;
    std::optional<UnitTypeId> cavalry_type_id;
};

struct RecruitmentCompletion {
    ArmyId army_id;
    std::string detail;
};

/** Hexes that would answer a muster at this stronghold, in map order. */
std::vector<HexId> eligible_recruitment_hexes(const Campaign& campaign,
                                              const Stronghold& stronghold);

/**
 * Register a recruitment project completing after the muster duration.
 * @throws std::invalid_argument if no hex is eligible or the yield is zero
 */
RecruitmentStart start_recruitment(Campaign& campaign, const Stronghold& stronghold,
                                   const Commander& commander, HexId rally_hex_id,
                                   OrderId pending_order_id, const RulesConfig& rules);

/**
 * Create the army for a finished project and remove the project.
 * @throws std::invalid_argument if the project, commander or rally hex is gone
 */
RecruitmentCompletion complete_recruitment(Campaign& campaign, RecruitmentId project_id,
                                           const RecruitmentCompletionOptions& options,
                                           const RulesConfig& rules);

} // namespace strat::rules

#endif // STRAT_RULES_RECRUITMENT_HPP
