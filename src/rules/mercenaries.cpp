#include "rules/mercenaries.hpp"
#include "rng/campaign_seed.hpp"
#include "rules/morale.hpp"
#include "rules/supply.hpp"

namespace strat::rules {

namespace {

int rate_or(const std::optional<int>& negotiated, int fallback) {
    return negotiated && *negotiated ? *negotiated : fallback;
}

bool roll_desertion(const Campaign& campaign, const MercenaryContract& contract,
                    const RulesConfig& rules) {
    const auto& mr = rules.mercenaries;
    const int roll = rng::roll_dice(rng::campaign_seed(campaign, "mercenary-desertion:" +
                                                                     to_string(contract.id)),
                                    "1d" + std::to_string(mr.desertion_chance_denominator))
                         .total;
    return roll <= mr.desertion_chance_numerator;
}

} // anonymous namespace

int daily_upkeep_cost(const Campaign& campaign, const MercenaryContract& contract,
                      const RulesConfig& rules) {
    if (!contract.army_id) return 0;
    const Army* army = campaign.get_army(*contract.army_id);
    if (!army) return 0;

    int infantry = 0;
    int cavalry = 0;
    for (const auto& det : army->detachments) {
        if (unit_category(campaign.unit_types, det.unit_type_id) == "cavalry") {
            cavalry += det.soldiers;
        } else {
            infantry += det.soldiers;
        }
    }
    return infantry * rate_or(contract.infantry_rate, rules.mercenaries.infantry_upkeep_per_day) +
           cavalry * rate_or(contract.cavalry_rate, rules.mercenaries.cavalry_upkeep_per_day);
}

std::vector<UpkeepOutcome> process_daily_upkeep(Campaign& campaign, const RulesConfig& rules) {
    const auto& mr = rules.mercenaries;
    std::vector<UpkeepOutcome> outcomes;

    for (auto& [id, contract] : campaign.mercenary_contracts) {
        if (contract.status != "active" && contract.status != "unpaid") continue;
        if (!contract.army_id) continue;
        Army* army = campaign.get_army(*contract.army_id);
        if (!army) continue;

        const int days_due = campaign.current_day - contract.last_upkeep_day;
        if (days_due <= 0) continue;

        UpkeepOutcome outcome;
        outcome.contract_id = id;
        outcome.army_id = army->id;
        outcome.amount_due = daily_upkeep_cost(campaign, contract, rules) * days_due;
        contract.last_upkeep_day = campaign.current_day;

        if (army->loot_carried >= outcome.amount_due) {
            army->loot_carried -= outcome.amount_due;
            contract.days_unpaid = 0;
            contract.status = "active";
            outcome.paid = true;
            outcomes.push_back(outcome);
            continue;
        }

        contract.days_unpaid += days_due;
        contract.status = "unpaid";
        adjust_morale(*army, -mr.morale_penalty_unpaid);
        outcome.days_unpaid = contract.days_unpaid;

        if (contract.days_unpaid > mr.grace_days_without_pay &&
            roll_desertion(campaign, contract, rules)) {
            contract.status = "terminated";
            JsonValue effect = JsonValue::object();
            effect.set("contract_id", id.value).set("day", campaign.current_day);
            army->status_effects.set("mercenaries_deserted", std::move(effect));
            adjust_morale(*army, -mr.morale_penalty_unpaid);
            outcome.deserted = true;
        }
        outcomes.push_back(outcome);
    }
    return outcomes;
}

} // namespace strat::rules
