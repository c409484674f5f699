#include "rules/supply.hpp"
#include "core/hex_math.hpp"
#include "rng/campaign_seed.hpp"
#include "rules/morale.hpp"
#include <algorithm>

namespace strat::rules {

namespace {

struct CompositionTotals {
    int infantry = 0;
    int cavalry = 0;
    int wagons = 0;
    int noncombatants = 0;
};

int calculate_noncombatants(const UnitTypeMap& unit_types, const Army& army,
                            const std::vector<Trait>& traits, const RulesConfig& rules) {
    const int total_soldiers = army.total_soldiers();
    const int total_wagons = army.total_wagons();

    bool exclusive_skirmisher = total_wagons == 0 && !army.detachments.empty();
    for (const auto& det : army.detachments) {
        if (!unit_has_ability(unit_types, det.unit_type_id, "offroad_full_speed") ||
            !unit_has_ability(unit_types, det.unit_type_id, "acts_as_cavalry_for_foraging")) {
            exclusive_skirmisher = false;
            break;
        }
    }

    double ratio = rules.supply.base_noncombatant_ratio;
    if (exclusive_skirmisher) {
        ratio = rules.supply.exclusive_skirmisher_ratio;
    } else if (has_trait(traits, "spartan")) {
        ratio = rules.supply.spartan_ratio;
    }
    return static_cast<int>(total_soldiers * ratio);
}

CompositionTotals composition(const UnitTypeMap& unit_types, const Army& army,
                              const std::vector<Trait>& traits, const RulesConfig& rules) {
    CompositionTotals totals;
    int soldiers = 0;
    for (const auto& det : army.detachments) {
        soldiers += det.soldiers;
        totals.wagons += det.wagons;
        if (unit_category(unit_types, det.unit_type_id) == "cavalry") {
            totals.cavalry += det.soldiers;
        }
    }
    totals.infantry = soldiers - totals.cavalry;
    totals.noncombatants = calculate_noncombatants(unit_types, army, traits, rules);
    return totals;
}

double column_from_totals(const CompositionTotals& totals, const std::vector<Trait>& traits) {
    double infantry_nc_miles = (totals.infantry + totals.noncombatants) / 5000.0;
    double cavalry_miles = totals.cavalry / 2000.0;
    double wagon_miles = totals.wagons / 50.0;
    double column = std::max({infantry_nc_miles, cavalry_miles, wagon_miles});
    if (has_trait(traits, "logistician")) column *= 0.5;
    return column;
}

int hex_distance(const Hex& a, const Hex& b) {
    return strat::hex_distance({a.q, a.r}, {b.q, b.r});
}

// "friendly", "recently_conquered", "neutral" or "hostile" from the army's view
std::string classify_territory(const Campaign& campaign, const Army& army, const Hex& hex,
                               const RulesConfig& rules) {
    if (!hex.controlling_faction_id) return "neutral";
    auto faction = campaign.army_faction(army);
    if (faction && *faction == *hex.controlling_faction_id) {
        if (hex.last_control_change_day &&
            campaign.current_day - *hex.last_control_change_day <=
                rules.recruitment.recently_conquered_days) {
            return "recently_conquered";
        }
        return "friendly";
    }
    return "hostile";
}

bool check_revolt(const Campaign& campaign, const Army& army, const Hex& hex,
                  bool torching, const RulesConfig& rules) {
    const auto& supply = rules.supply;
    int chance = 0;
    if (torching) {
        chance = supply.torch_revolt_chance;
    } else {
        bool within_year = hex.last_foraged_day &&
            campaign.current_day - *hex.last_foraged_day <= supply.revolt_cooldown_days;
        if (!within_year) return false;
        chance = supply.forage_revolt_chance_repeat;
    }

    if (classify_territory(campaign, army, hex, rules) == "hostile") {
        chance += torching ? supply.torch_revolt_hostile_modifier
                           : supply.forage_revolt_hostile_modifier;
    }
    if (has_trait(commander_traits(campaign, army), "honorable")) {
        chance = std::max(0, chance - 1);
    }

    const std::string label = std::string(torching ? "torch-revolt:" : "forage-revolt:") +
                              to_string(army.id) + ":" + to_string(hex.id);
    int roll = rng::roll_dice(rng::campaign_seed(campaign, label), "1d6").total;
    return roll <= chance;
}

void mark_torched(Hex& hex, int day) {
    hex.is_torched = true;
    hex.foraging_times_remaining = 0;
    hex.last_torched_day = day;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Composition helpers
// ═══════════════════════════════════════════════════════════════

std::string unit_category(const UnitTypeMap& unit_types, UnitTypeId id) {
    auto it = unit_types.find(id);
    return it == unit_types.end() ? "infantry" : it->second.category;
}

bool unit_has_ability(const UnitTypeMap& unit_types, UnitTypeId id, const std::string& ability) {
    auto it = unit_types.find(id);
    return it != unit_types.end() && it->second.has_ability(ability);
}

std::vector<Trait> commander_traits(const Campaign& campaign, const Army& army) {
    const Commander* commander = campaign.get_commander(army.commander_id);
    return commander ? commander->traits : std::vector<Trait>{};
}

SupplySnapshot build_supply_snapshot(const Campaign& campaign, const Army& army,
                                     const RulesConfig& rules) {
    const auto traits = commander_traits(campaign, army);
    const auto totals = composition(campaign.unit_types, army, traits, rules);
    const auto& supply = rules.supply;

    SupplySnapshot snap;
    snap.total_soldiers = totals.infantry + totals.cavalry;
    snap.total_cavalry = totals.cavalry;
    snap.total_wagons = totals.wagons;
    snap.noncombatants = totals.noncombatants;

    int capacity = (totals.infantry + totals.noncombatants) * supply.infantry_capacity +
                   totals.cavalry * supply.cavalry_capacity +
                   totals.wagons * supply.wagon_capacity;
    if (has_trait(traits, "logistician")) capacity = static_cast<int>(capacity * 1.20);

    for (const auto& det : army.detachments) {
        if (det.supplies_equivalent == supply.wizard_supply_encumbrance) snap.wizard_detachments++;
    }
    capacity -= snap.wizard_detachments * supply.wizard_supply_encumbrance;
    snap.capacity = std::max(0, capacity);

    snap.consumption = (totals.infantry + totals.noncombatants) * supply.infantry_consumption +
                       totals.cavalry * supply.cavalry_consumption +
                       totals.wagons * supply.wagon_consumption;
    snap.column_length_miles = column_from_totals(totals, traits);
    return snap;
}

double column_length_miles(const UnitTypeMap& unit_types, const Army& army,
                           const std::vector<Trait>& traits, const RulesConfig& rules) {
    return column_from_totals(composition(unit_types, army, traits, rules), traits);
}

int foraging_range(const UnitTypeMap& unit_types, const Army& army,
                   const std::vector<Trait>& traits, const std::string& weather,
                   const RulesConfig& rules) {
    const auto& vis = rules.visibility;
    int range = vis.base_radius;

    bool has_cavalry = false;
    for (const auto& det : army.detachments) {
        if (unit_category(unit_types, det.unit_type_id) == "cavalry" ||
            unit_has_ability(unit_types, det.unit_type_id, "acts_as_cavalry_for_foraging")) {
            has_cavalry = true;
            break;
        }
    }
    if (has_cavalry) range += vis.cavalry_bonus;
    if (has_cavalry && has_trait(traits, "outrider")) range += vis.outrider_bonus;

    int penalty = 0;
    if (weather == "bad" || weather == "storm") {
        penalty = vis.bad_weather_penalty;
    } else if (weather == "very_bad") {
        penalty = vis.very_bad_weather_penalty;
    }
    if (has_trait(traits, "ranger")) penalty = 0;

    return std::max(0, range - penalty);
}

// ═══════════════════════════════════════════════════════════════
// Foraging & torching
// ═══════════════════════════════════════════════════════════════

ForageOutcome forage(Campaign& campaign, Army& army, const std::vector<HexId>& target_hexes,
                     const RulesConfig& rules, const SupplyOptions& options) {
    ForageOutcome outcome;
    const Hex* army_hex = campaign.map.get_hex(army.current_hex_id);
    if (!army_hex) {
        outcome.failed_hexes.push_back({army.current_hex_id, "army hex missing"});
        return outcome;
    }

    const auto traits = commander_traits(campaign, army);
    const int range = foraging_range(campaign.unit_types, army, traits, options.weather, rules);
    const auto snapshot = build_supply_snapshot(campaign, army, rules);

    for (HexId hex_id : target_hexes) {
        Hex* target = campaign.map.get_hex(hex_id);
        if (!target) {
            outcome.failed_hexes.push_back({hex_id, "hex not found"});
            continue;
        }
        if (hex_distance(*army_hex, *target) > range) {
            outcome.failed_hexes.push_back({hex_id, "hex out of range"});
            continue;
        }
        if (target->is_torched) {
            outcome.failed_hexes.push_back({hex_id, "hex torched"});
            continue;
        }
        if (target->foraging_times_remaining <= 0) {
            outcome.failed_hexes.push_back({hex_id, "foraging exhausted"});
            continue;
        }
        if (target->settlement <= 0) {
            outcome.failed_hexes.push_back({hex_id, "no settlement"});
            continue;
        }

        if (check_revolt(campaign, army, *target, false, rules)) {
            outcome.revolt_triggered = true;
        }

        int gained = target->settlement * rules.supply.foraging_multiplier;
        if (has_trait(traits, "raider")) gained = static_cast<int>(gained * 1.10);

        target->foraging_times_remaining -= 1;
        target->last_foraged_day = campaign.current_day;
        outcome.supplies_gained += gained;
        outcome.foraged_hexes.push_back(hex_id);
    }

    if (outcome.supplies_gained > 0) {
        int capacity = army.supplies_capacity > 0 ? army.supplies_capacity : snapshot.capacity;
        army.supplies_current = std::min(capacity, army.supplies_current + outcome.supplies_gained);
    }

    outcome.success = !outcome.foraged_hexes.empty();
    return outcome;
}

TorchOutcome torch(Campaign& campaign, Army& army, const std::vector<HexId>& target_hexes,
                   const RulesConfig& rules, const SupplyOptions& options) {
    TorchOutcome outcome;
    const Hex* army_hex = campaign.map.get_hex(army.current_hex_id);
    if (!army_hex) {
        outcome.failed_hexes.push_back({army.current_hex_id, "army hex missing"});
        return outcome;
    }

    const auto traits = commander_traits(campaign, army);
    const int range = foraging_range(campaign.unit_types, army, traits, options.weather, rules);

    for (HexId hex_id : target_hexes) {
        Hex* target = campaign.map.get_hex(hex_id);
        if (!target) {
            outcome.failed_hexes.push_back({hex_id, "hex not found"});
            continue;
        }
        if (hex_distance(*army_hex, *target) > range) {
            outcome.failed_hexes.push_back({hex_id, "hex out of range"});
            continue;
        }

        if (check_revolt(campaign, army, *target, true, rules)) {
            outcome.revolt_triggered = true;
        }

        mark_torched(*target, campaign.current_day);
        for (const auto& coord : hexes_in_range({target->q, target->r}, range)) {
            if (coord.q == target->q && coord.r == target->r) continue;
            if (Hex* nearby = campaign.map.hex_at(coord.q, coord.r)) {
                mark_torched(*nearby, campaign.current_day);
            }
        }
        outcome.torched_hexes.push_back(hex_id);
    }

    if (!outcome.torched_hexes.empty()) army.status = ArmyStatus::TORCHING;
    outcome.success = !outcome.torched_hexes.empty();
    return outcome;
}

// ═══════════════════════════════════════════════════════════════
// Daily consumption
// ═══════════════════════════════════════════════════════════════

ConsumptionOutcome consume_daily_supplies(Campaign& campaign, Army& army,
                                          const RulesConfig& rules) {
    ConsumptionOutcome outcome;
    const int needed = army.daily_supply_consumption;

    if (army.supplies_current >= needed) {
        army.supplies_current -= needed;
        army.days_without_supplies = 0;
        outcome.consumed = needed;
        return outcome;
    }

    outcome.consumed = army.supplies_current;
    outcome.starving = true;
    army.supplies_current = 0;
    army.days_without_supplies += 1;
    adjust_morale(army, -rules.morale.starvation_morale_loss_per_day);

    const std::string seed = rng::campaign_seed(campaign, "starvation:" + to_string(army.id));
    auto check = roll_morale_check(army.morale_current, seed);
    if (!check.success) {
        outcome.morale_failed = true;
        outcome.consequence = apply_morale_consequence(
            army, check.roll, commander_traits(campaign, army), seed + ":consequence",
            campaign.current_day);
    }

    if (army.days_without_supplies >= rules.morale.starvation_dissolution_days) {
        army.status = ArmyStatus::ROUTED;
        outcome.dissolved = true;
    }
    return outcome;
}

} // namespace strat::rules
