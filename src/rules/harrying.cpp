#include "rules/harrying.hpp"
#include "rng/campaign_seed.hpp"
#include "rules/supply.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace strat::rules {

namespace {

constexpr int kBaseSuccessThreshold = 2;
constexpr int kKillPercent = 20;
constexpr int kFailureLossDivisor = 5;        // 20%

void take_casualties(std::vector<Detachment*>& detachments, int losses) {
    for (Detachment* det : detachments) {
        if (losses <= 0) break;
        int loss = std::min(det->soldiers, losses);
        det->soldiers -= loss;
        losses -= loss;
    }
}

void take_casualties(Army& target, int casualties) {
    for (auto& det : target.detachments) {
        if (casualties <= 0) break;
        int loss = std::min(det.soldiers, casualties);
        det.soldiers -= loss;
        casualties -= loss;
    }
    if (casualties > 0) {
        target.noncombatant_count = std::max(0, target.noncombatant_count - casualties);
    }
}

void mark_harried(Army& attacker, Army& target, int current_day, const std::string& objective) {
    attacker.status = ArmyStatus::HARRYING;
    attacker.movement_points_remaining = 0.0;

    JsonValue harried = JsonValue::object();
    harried.set("day", current_day).set("objective", objective).set("penalty", 0.5);
    target.status_effects.set("harried", std::move(harried));
    target.movement_points_remaining = std::min(target.movement_points_remaining, 0.5);
}

} // anonymous namespace

HarryingResult resolve_harrying(Campaign& campaign, Army& attacker, Army& target,
                                const std::vector<Detachment*>& detached,
                                const std::string& objective_name) {
    if (detached.empty()) {
        throw std::invalid_argument("harrying requires at least one detachment");
    }

    int total_soldiers = 0;
    for (const Detachment* det : detached) total_soldiers += det->soldiers;
    if (total_soldiers <= 0) {
        throw std::invalid_argument("harrying detachment has no soldiers");
    }

    std::string objective = objective_name;
    std::transform(objective.begin(), objective.end(), objective.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (objective != "kill" && objective != "torch" && objective != "steal") {
        throw std::invalid_argument("unknown harrying objective: " + objective_name);
    }

    bool skirmisher = false;
    bool cavalry = false;
    for (const Detachment* det : detached) {
        skirmisher = skirmisher || unit_has_ability(campaign.unit_types, det->unit_type_id,
                                                    "skirmisher");
        cavalry = cavalry || unit_category(campaign.unit_types, det->unit_type_id) == "cavalry";
    }

    HarryingResult result;
    result.modifier = (skirmisher ? 1 : 0) + (cavalry ? 2 : 0);

    const std::string seed = rng::campaign_seed(
        campaign, "harry:" + to_string(attacker.id) + ":" + to_string(target.id));
    result.roll = rng::roll_dice(seed, "1d6").total;
    result.success = result.roll <= std::min(6, kBaseSuccessThreshold + result.modifier);

    mark_harried(attacker, target, campaign.current_day, objective);

    if (!result.success) {
        result.attacker_losses = std::max(1, total_soldiers / kFailureLossDivisor);
        std::vector<Detachment*> raiders = detached;
        take_casualties(raiders, result.attacker_losses);
        result.detail = "harrying failed: detachment lost " +
                        std::to_string(result.attacker_losses) + " soldiers";
        return result;
    }

    if (objective == "kill") {
        result.inflicted_casualties = std::max(1, total_soldiers * kKillPercent / 100);
        take_casualties(target, result.inflicted_casualties);
        result.detail = "harrying success: inflicted " +
                        std::to_string(result.inflicted_casualties) + " casualties";
    } else if (objective == "torch") {
        int burn_roll = std::max(1, rng::roll_dice(seed + ":torch", "2d6").total + result.modifier);
        result.supplies_burned = std::min(total_soldiers * burn_roll, target.supplies_current);
        target.supplies_current -= result.supplies_burned;
        result.detail = "harrying success: torched " + std::to_string(result.supplies_burned) +
                        " supplies";
    } else {
        int steal_roll = std::max(1, rng::roll_dice(seed + ":steal", "1d6").total + result.modifier);
        int haul = total_soldiers * steal_roll;
        result.loot_stolen = std::min(haul, target.loot_carried);
        target.loot_carried -= result.loot_stolen;
        attacker.loot_carried += result.loot_stolen;

        int remaining = haul - result.loot_stolen;
        if (remaining > 0) {
            int capacity = std::max(0, attacker.supplies_capacity - attacker.supplies_current);
            result.supplies_stolen = std::min({remaining, target.supplies_current, capacity});
            target.supplies_current -= result.supplies_stolen;
            attacker.supplies_current += result.supplies_stolen;
        }
        result.detail = "harrying success: stole " + std::to_string(result.loot_stolen) + " loot";
        if (result.supplies_stolen) {
            result.detail += " and " + std::to_string(result.supplies_stolen) + " supplies";
        }
    }
    return result;
}

} // namespace strat::rules
