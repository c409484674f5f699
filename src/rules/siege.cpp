#include "rules/siege.hpp"
#include "rng/dice.hpp"
#include <algorithm>

namespace strat::rules {

int siege_threshold_for(StrongholdType type, const RulesConfig& rules) {
    switch (type) {
        case StrongholdType::TOWN:     return rules.siege.town_threshold;
        case StrongholdType::CITY:     return rules.siege.city_threshold;
        case StrongholdType::FORTRESS: return rules.siege.fortress_threshold;
    }
    return rules.siege.town_threshold;
}

SiegeAdvanceResult advance_siege(Siege& siege, const std::string& roll_seed,
                                 const RulesConfig& rules) {
    const auto& sr = rules.siege;

    siege.weeks_elapsed++;
    int threshold = siege.current_threshold + sr.default_modifier;

    for (const auto& modifier : siege.threshold_modifiers) {
        const auto& value = modifier["value"];
        if (value.is_number()) {
            threshold += static_cast<int>(value.as_number());
            continue;
        }
        const std::string kind = modifier["type"].get_string();
        if (kind == "disease")       threshold += sr.disease_modifier;
        else if (kind == "resupply") threshold += sr.resupply_modifier;
        else if (kind == "attacked") threshold += sr.attacked_modifier;
    }

    threshold -= siege.siege_engines_count * sr.siege_engine_reduction_per_detachment;
    siege.current_threshold = std::max(sr.starvation_threshold, threshold);

    SiegeAdvanceResult result;
    result.roll = rng::roll_dice(roll_seed, "2d6").total;
    result.threshold_after = siege.current_threshold;
    result.gates_opened = result.roll > siege.current_threshold;
    if (result.gates_opened) siege.status = SiegeStatus::GATES_OPENED;
    return result;
}

} // namespace strat::rules
