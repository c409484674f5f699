#ifndef STRAT_RNG_CAMPAIGN_SEED_HPP
#define STRAT_RNG_CAMPAIGN_SEED_HPP

#include "core/campaign.hpp"
#include "rng/dice.hpp"
#include <string>

namespace strat::rng {

/** Seed scoped to the campaign's current day and day-part. */
inline std::string campaign_seed(const Campaign& campaign, const std::string& label) {
    return seed(campaign.id.value, campaign.current_day, campaign.current_part, label);
}

} // namespace strat::rng

#endif // STRAT_RNG_CAMPAIGN_SEED_HPP
