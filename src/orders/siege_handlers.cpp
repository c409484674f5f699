#include "orders/handlers.hpp"
#include "rng/campaign_seed.hpp"
#include "rules/battle.hpp"
#include "rules/morale.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace strat::orders {

namespace {

constexpr double kAssaultLossPct = 0.10;
constexpr int kCommanderEscapeThreshold = 3;     // 1d6 <= 3 escapes
constexpr int kPillageMorale = 2;

/** Detail fragment plus the event record it produced, if any. */
struct CaptureOutcome {
    std::string detail;
    JsonValue event;
};

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += sep;
        out += part;
    }
    return out;
}

void apply_assault_losses(Army& army) {
    for (auto& det : army.detachments) {
        det.soldiers = std::max(1, static_cast<int>(det.soldiers * (1.0 - kAssaultLossPct)));
    }
    army.supplies_current = static_cast<int>(army.supplies_current * (1.0 - kAssaultLossPct));
}

int capture_supply_multiplier(StrongholdType type) {
    switch (type) {
        case StrongholdType::TOWN:     return 10000;
        case StrongholdType::CITY:     return 100000;
        case StrongholdType::FORTRESS: return 1000;
    }
    return 0;
}

double camp_follower_ratio(StrongholdType type) {
    switch (type) {
        case StrongholdType::FORTRESS: return 0.05;
        case StrongholdType::TOWN:     return 0.10;
        case StrongholdType::CITY:     return 0.15;
    }
    return 0.0;
}

void transfer_control(Campaign& campaign, Stronghold& stronghold, Siege* siege,
                      const Commander* commander, const Army& army) {
    if (commander) {
        stronghold.controlling_faction_id = commander->faction_id;
        if (Hex* hex = campaign.map.get_hex(stronghold.hex_id)) {
            hex->controlling_faction_id = commander->faction_id;
            hex->last_control_change_day = campaign.current_day;
        }
    }
    stronghold.gates_open = true;
    stronghold.garrison_army_id = army.id;
    if (siege) siege->status = SiegeStatus::SUCCESSFUL_ASSAULT;
}

std::optional<CaptureOutcome> capture_supplies(const Campaign& campaign, Stronghold& stronghold,
                                               Army& army, const Siege* siege) {
    const int weeks = siege ? siege->weeks_elapsed : 0;
    const int multiplier = capture_supply_multiplier(stronghold.type);
    int roll = rng::roll_dice(rng::campaign_seed(campaign, "capture-supply:" +
                                                               to_string(stronghold.id) + ":" +
                                                               std::to_string(weeks)),
                              "1d6")
                   .total;
    const int gain = std::max(0, roll - weeks) * multiplier;
    if (gain <= 0) return std::nullopt;

    const int loaded = std::min(gain, std::max(0, army.supplies_capacity - army.supplies_current));
    army.supplies_current += loaded;
    const int stored = gain - loaded;
    stronghold.supplies_held += stored;

    CaptureOutcome out;
    out.detail = "captured " + std::to_string(gain) + " supplies";
    if (loaded) out.detail += " (" + std::to_string(loaded) + " loaded)";
    out.event = JsonValue::object();
    out.event.set("type", "capture_supplies")
             .set("amount", gain)
             .set("loaded", loaded)
             .set("stored", stored);
    return out;
}

std::optional<CaptureOutcome> gain_camp_followers(const Stronghold& stronghold, Army& army) {
    const double ratio = camp_follower_ratio(stronghold.type);
    if (ratio <= 0.0) return std::nullopt;

    const int pool = army.noncombatant_count ? army.noncombatant_count : army.total_soldiers();
    const int gain = std::max(1, static_cast<int>(std::nearbyint(pool * ratio)));
    army.noncombatant_count += gain;

    CaptureOutcome out;
    out.detail = "gained " + std::to_string(gain) + " camp followers";
    out.event = JsonValue::object();
    out.event.set("type", "noncombatant_gain").set("amount", gain);
    return out;
}

/** Pillage when authorised, otherwise the army must pass a discipline check. */
std::optional<CaptureOutcome> pillage_or_discipline(const Campaign& campaign, bool pillage,
                                                    const Commander* commander, Army& army,
                                                    Stronghold& stronghold) {
    if (pillage) {
        const int loot = stronghold.loot_held / 2;
        stronghold.loot_held -= loot;
        army.loot_carried += loot;

        const int supplies = stronghold.supplies_held / 2;
        stronghold.supplies_held -= supplies;
        const int loaded = std::min(supplies,
                                    std::max(0, army.supplies_capacity - army.supplies_current));
        army.supplies_current += loaded;
        rules::adjust_morale(army, kPillageMorale);

        CaptureOutcome out;
        out.detail = "pillage authorised (" + std::to_string(loot) + " loot, " +
                     std::to_string(loaded) + " supplies)";
        out.event = JsonValue::object();
        out.event.set("type", "pillage").set("loot", loot).set("supplies", loaded);
        return out;
    }

    const std::string seed = rng::campaign_seed(campaign, "discipline:" + to_string(army.id));
    auto check = rules::roll_morale_check(army.morale_current, seed);
    if (check.success) return std::nullopt;

    const std::vector<Trait> traits = commander ? commander->traits : std::vector<Trait>{};
    JsonValue consequence = rules::apply_morale_consequence(army, check.roll, traits,
                                                            seed + ":consequence",
                                                            campaign.current_day);
    CaptureOutcome out;
    out.detail = "discipline check failed";
    out.event = JsonValue::object();
    out.event.set("type", "discipline_failed")
             .set("roll", check.roll)
             .set("consequence", std::move(consequence));
    return out;
}

std::optional<CaptureOutcome> resolve_defender_commander(Campaign& campaign,
                                                         const Army& defender,
                                                         const Commander* victor) {
    Commander* commander = campaign.get_commander(defender.commander_id);
    if (!commander) return std::nullopt;

    int roll = rng::roll_dice(rng::campaign_seed(campaign, "assault-escape:" +
                                                               to_string(commander->id)),
                              "1d6")
                   .total;

    CaptureOutcome out;
    out.event = JsonValue::object();
    if (roll <= kCommanderEscapeThreshold) {
        commander->status = "escaped";
        commander->current_hex_id.reset();
        out.detail = "defender commander escaped";
        out.event.set("type", "commander_escaped");
    } else {
        commander->status = "captured";
        if (victor) commander->captured_by_faction_id = victor->faction_id;
        out.detail = "defender commander captured";
        out.event.set("type", "commander_captured");
    }
    out.event.set("commander_id", commander->id.value);
    return out;
}

} // anonymous namespace

OrderExecutionResult handle(OrderContext& context, Order&, Army* army, const BesiegePayload& p) {
    Campaign& campaign = context.campaign;
    Stronghold* stronghold = campaign.get_stronghold(p.stronghold_id);
    if (!stronghold) return failure("stronghold not found");

    std::vector<JsonValue> events;
    Siege* siege = campaign.find_siege_by_stronghold(p.stronghold_id);
    if (!siege) {
        Siege fresh;
        fresh.id = campaign.next_siege_id();
        fresh.stronghold_id = p.stronghold_id;
        fresh.attacker_army_ids.push_back(army->id);
        fresh.defender_army_id = stronghold->garrison_army_id;
        fresh.started_on_day = campaign.current_day;
        fresh.current_threshold = stronghold->current_threshold;
        fresh.siege_engines_count = p.siege_engines;

        JsonValue event = JsonValue::object();
        event.set("type", "siege_started")
             .set("siege_id", fresh.id.value)
             .set("stronghold_id", p.stronghold_id.value)
             .set("threshold", fresh.current_threshold);
        events.push_back(std::move(event));

        campaign.sieges[fresh.id] = std::move(fresh);
    } else if (std::find(siege->attacker_army_ids.begin(), siege->attacker_army_ids.end(),
                         army->id) == siege->attacker_army_ids.end()) {
        siege->attacker_army_ids.push_back(army->id);
    }

    army->status = ArmyStatus::BESIEGING;
    return completed("besieging stronghold " + to_string(p.stronghold_id), std::move(events));
}

OrderExecutionResult handle(OrderContext& context, Order&, Army* army, const AssaultPayload& p) {
    Campaign& campaign = context.campaign;

    Stronghold* stronghold = campaign.get_stronghold(p.stronghold_id);
    if (!stronghold) return failure("stronghold not found");
    if (!stronghold->garrison_army_id) return failure("stronghold has no garrison army");
    Army* defender = campaign.get_army(*stronghold->garrison_army_id);
    if (!defender) return failure("stronghold has no garrison army");
    if (defender == army) return failure("army cannot assault its own garrison");

    Siege* siege = campaign.find_siege_by_stronghold(p.stronghold_id);
    const int engines = siege ? siege->siege_engines_count : 0;
    const int defender_bonus = std::max(0, stronghold->defensive_bonus - engines);

    rules::BattleOptions options;
    options.attacker_modifier = -1 + p.attacker_modifier;
    options.defender_modifier = defender_bonus + p.defender_modifier;
    if (p.attacker_fixed_roll) options.attacker_fixed_rolls[army->id] = *p.attacker_fixed_roll;
    if (p.defender_fixed_roll) options.defender_fixed_rolls[defender->id] = *p.defender_fixed_roll;
    const std::string label = "assault:" + to_string(stronghold->id);
    options.attacker_seed = rng::campaign_seed(campaign, label + ":attacker");
    options.defender_seed = rng::campaign_seed(campaign, label + ":defender");
    options.outcome_seed = rng::campaign_seed(campaign, label + ":outcome");

    army->status = ArmyStatus::IN_BATTLE;
    defender->status = ArmyStatus::IN_BATTLE;
    army->last_battle_day = campaign.current_day;
    defender->last_battle_day = campaign.current_day;

    auto result = rules::resolve_battle({army}, {defender}, campaign.unit_types, options,
                                        context.rules);
    const bool attacker_won = result.winner == rules::BattleSide::ATTACKER;
    apply_assault_losses(attacker_won ? *defender : *army);

    std::vector<JsonValue> events;
    JsonValue battle_event = result.to_json();
    battle_event.set("type", "battle").set("stronghold_id", stronghold->id.value);
    events.push_back(std::move(battle_event));

    std::vector<std::string> detail_parts{std::string("assault result: ") +
                                          rules::battle_side_to_string(result.winner)};

    if (attacker_won) {
        const Commander* commander = campaign.get_commander(army->commander_id);
        transfer_control(campaign, *stronghold, siege, commander, *army);

        std::optional<CaptureOutcome> outcomes[] = {
            capture_supplies(campaign, *stronghold, *army, siege),
            gain_camp_followers(*stronghold, *army),
            pillage_or_discipline(campaign, p.pillage, commander, *army, *stronghold),
            resolve_defender_commander(campaign, *defender, commander),
        };
        for (auto& outcome : outcomes) {
            if (!outcome) continue;
            detail_parts.push_back(outcome->detail);
            if (!outcome->event.is_null()) events.push_back(std::move(outcome->event));
        }
    }

    if (army->status != ArmyStatus::ROUTED) army->status = ArmyStatus::IDLE;
    if (attacker_won) {
        defender->status = ArmyStatus::ROUTED;
    } else if (defender->status != ArmyStatus::ROUTED) {
        defender->status = ArmyStatus::IDLE;
    }

    if (context.verbose) {
        std::cerr << "[SIEGE] assault on stronghold " << stronghold->id << ": "
                  << rules::battle_side_to_string(result.winner) << " by "
                  << result.roll_difference << "\n";
    }
    return completed(join(detail_parts, "; "), std::move(events));
}

} // namespace strat::orders
