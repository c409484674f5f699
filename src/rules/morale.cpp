#include "rules/morale.hpp"
#include "rng/dice.hpp"
#include <algorithm>

namespace strat::rules {

namespace {

void apply_losses(Army& army, double loss_pct) {
    for (auto& det : army.detachments) {
        det.soldiers = std::max(1, static_cast<int>(det.soldiers * (1.0 - loss_pct)));
    }
    army.supplies_current = static_cast<int>(army.supplies_current * (1.0 - loss_pct));
}

// Pick up to `wanted` distinct detachment indices, never all of them.
std::vector<size_t> pick_detachments(const Army& army, int wanted, const std::string& seed) {
    const int available = std::max(0, static_cast<int>(army.detachments.size()) - 1);
    wanted = std::min(wanted, available);

    std::vector<size_t> remaining;
    for (size_t i = 0; i < army.detachments.size(); i++) remaining.push_back(i);

    std::vector<size_t> picked;
    for (int i = 0; i < wanted; i++) {
        auto choice = rng::random_choice(seed + "_" + std::to_string(i), remaining);
        picked.push_back(choice.choice);
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(choice.index));
    }
    return picked;
}

// Remove the detachments at `indices`; returns their ids.
JsonValue remove_detachments(Army& army, std::vector<size_t> indices) {
    std::sort(indices.begin(), indices.end());
    JsonValue ids = JsonValue::array();
    for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
        ids.push_back(JsonValue(army.detachments[*it].id.value));
        army.detachments.erase(army.detachments.begin() + static_cast<std::ptrdiff_t>(*it));
    }
    return ids;
}

JsonValue ids_of(const Army& army, const std::vector<size_t>& indices) {
    JsonValue ids = JsonValue::array();
    for (size_t idx : indices) ids.push_back(JsonValue(army.detachments[idx].id.value));
    return ids;
}

} // anonymous namespace

const char* morale_consequence_to_string(MoraleConsequence consequence) {
    switch (consequence) {
        case MoraleConsequence::MUTINY:                    return "MUTINY";
        case MoraleConsequence::MASS_DESERTION:            return "MASS_DESERTION";
        case MoraleConsequence::DETACHMENTS_DEFECT:        return "DETACHMENTS_DEFECT";
        case MoraleConsequence::MAJOR_DESERTION:           return "MAJOR_DESERTION";
        case MoraleConsequence::ARMY_SPLITS:               return "ARMY_SPLITS";
        case MoraleConsequence::RANDOM_DETACHMENT_DEFECTS: return "RANDOM_DETACHMENT_DEFECTS";
        case MoraleConsequence::DESERTION:                 return "DESERTION";
        case MoraleConsequence::DETACHMENTS_DEPART:        return "DETACHMENTS_DEPART";
        case MoraleConsequence::CAMP_FOLLOWERS:            return "CAMP_FOLLOWERS";
        case MoraleConsequence::DETACHMENT_DEPARTS:        return "DETACHMENT_DEPARTS";
        case MoraleConsequence::NO_CONSEQUENCES:           return "NO_CONSEQUENCES";
    }
    return "";
}

void adjust_morale(Army& army, int change) {
    army.morale_current = std::clamp(army.morale_current + change, 0, army.morale_max);
}

MoraleCheck roll_morale_check(int morale, const std::string& seed) {
    int roll = rng::roll_dice(seed, "2d6").total;
    return MoraleCheck{roll <= morale, roll};
}

JsonValue apply_morale_consequence(Army& army, int roll, const std::vector<Trait>& traits,
                                   const std::string& seed, int current_day) {
    int effective_roll = has_trait(traits, "poet") ? roll + 2 : roll;
    effective_roll = std::clamp(effective_roll, 2, 12);
    auto consequence = static_cast<MoraleConsequence>(effective_roll);

    JsonValue details = JsonValue::object();
    details.set("consequence_type", morale_consequence_to_string(consequence));
    details.set("roll", roll);

    switch (consequence) {
        case MoraleConsequence::MUTINY: {
            std::vector<size_t> defecting;
            for (size_t i = 0; i < army.detachments.size(); i++) {
                auto check = rng::check_success(seed + ":mutiny_det_" + std::to_string(i),
                                                19.0 / 20.0, "1d20");
                if (check.success) defecting.push_back(i);
            }
            // One detachment always stays loyal, so a mutiny never leaves an empty army.
            if (!defecting.empty() && defecting.size() >= army.detachments.size()) {
                defecting.pop_back();
            }
            details.set("defecting_detachments", static_cast<int>(defecting.size()));
            details.set("detachment_ids", remove_detachments(army, defecting));
            break;
        }

        case MoraleConsequence::MASS_DESERTION:
            apply_losses(army, 0.30);
            details.set("loss_percentage", 0.30);
            break;

        case MoraleConsequence::DETACHMENTS_DEFECT: {
            int count = rng::roll_dice(seed + ":defect_count", "1d6").total;
            auto picked = pick_detachments(army, count, seed + ":defect_selection");
            details.set("defecting_detachments", static_cast<int>(picked.size()));
            details.set("detachment_ids", remove_detachments(army, picked));
            break;
        }

        case MoraleConsequence::MAJOR_DESERTION:
            apply_losses(army, 0.20);
            details.set("loss_percentage", 0.20);
            break;

        case MoraleConsequence::ARMY_SPLITS: {
            std::vector<size_t> splitting;
            for (size_t i = 0; i < army.detachments.size(); i++) {
                auto check = rng::check_success(seed + ":split_det_" + std::to_string(i),
                                                3.0 / 6.0, "1d6");
                if (check.success) splitting.push_back(i);
            }
            if (!splitting.empty() && splitting.size() >= army.detachments.size()) {
                splitting.pop_back();
            }
            details.set("splitting_detachments", static_cast<int>(splitting.size()));
            details.set("detachment_ids", remove_detachments(army, splitting));
            break;
        }

        case MoraleConsequence::RANDOM_DETACHMENT_DEFECTS: {
            auto picked = pick_detachments(army, 1, seed + ":single_defect");
            details.set("defecting_detachments", static_cast<int>(picked.size()));
            details.set("detachment_ids", remove_detachments(army, picked));
            break;
        }

        case MoraleConsequence::DESERTION:
            apply_losses(army, 0.10);
            details.set("loss_percentage", 0.10);
            break;

        case MoraleConsequence::DETACHMENTS_DEPART: {
            int count = rng::roll_dice(seed + ":depart_count", "1d6").total;
            int days_gone = rng::roll_dice(seed + ":depart_days", "2d6").total;
            auto picked = pick_detachments(army, count, seed + ":depart_selection");
            if (!picked.empty()) {
                JsonValue departed = JsonValue::object();
                departed.set("detachment_ids", ids_of(army, picked));
                departed.set("return_day", current_day + days_gone);
                army.status_effects.set("departed_detachments", std::move(departed));
                details.set("return_in_days", days_gone);
            }
            details.set("departing_detachments", static_cast<int>(picked.size()));
            break;
        }

        case MoraleConsequence::CAMP_FOLLOWERS: {
            int increase = static_cast<int>(army.noncombatant_count * 0.05);
            army.noncombatant_count += increase;
            details.set("noncombatant_increase", increase);
            break;
        }

        case MoraleConsequence::DETACHMENT_DEPARTS: {
            int days_gone = rng::roll_dice(seed + ":single_depart_days", "2d6").total;
            auto picked = pick_detachments(army, 1, seed + ":single_depart_selection");
            if (!picked.empty()) {
                JsonValue departed = JsonValue::object();
                departed.set("detachment_ids", ids_of(army, picked));
                departed.set("return_day", current_day + days_gone);
                army.status_effects.set("departed_detachments", std::move(departed));
                details.set("return_in_days", days_gone);
            }
            details.set("departing_detachments", static_cast<int>(picked.size()));
            break;
        }

        case MoraleConsequence::NO_CONSEQUENCES:
            break;
    }

    if (has_trait(traits, "veteran") &&
        (consequence == MoraleConsequence::ARMY_SPLITS || consequence == MoraleConsequence::MUTINY)) {
        details.set("veteran_prevented_rout", true);
    }

    return details;
}

} // namespace strat::rules
