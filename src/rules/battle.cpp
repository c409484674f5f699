#include "rules/battle.hpp"
#include "rng/dice.hpp"
#include "rules/morale.hpp"
#include <algorithm>
#include <cmath>

namespace strat::rules {

namespace {

constexpr int kMajorCaptureDiff = 6;
constexpr int kMinorCaptureDiff = 4;
constexpr int kMajorCasualtyDiff = 6;
constexpr int kSignificantCasualtyDiff = 4;
constexpr int kModerateCasualtyDiff = 2;

struct SideContext {
    double strength = 1.0;
    const std::string* seed = nullptr;
    const std::map<ArmyId, int>* fixed_rolls = nullptr;
    const std::map<ArmyId, int>* modifiers = nullptr;
    int side_modifier = 0;
};

int floor_div(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

ArmyBattleRecord roll_for_army(const Army& army, const SideContext& side,
                               double enemy_strength, const RulesConfig& rules) {
    ArmyBattleRecord record;

    auto fixed = side.fixed_rolls->find(army.id);
    if (fixed != side.fixed_rolls->end()) {
        record.base_roll = fixed->second;
    } else {
        record.base_roll = rng::roll_dice(*side.seed + ":" + to_string(army.id), "2d6").total;
    }

    int numeric = numeric_advantage(side.strength, enemy_strength, rules);
    if (numeric) record.modifiers["numeric"] = numeric;

    int morale_bonus = std::clamp(floor_div(army.morale_current - army.morale_resting, 2), -2, 2);
    if (morale_bonus) record.modifiers["morale"] = morale_bonus;

    if (army.status_effects["sick_or_exhausted"].truthy()) {
        record.modifiers["exhaustion"] = -1;
    }

    auto per_army = side.modifiers->find(army.id);
    if (per_army != side.modifiers->end() && per_army->second) {
        record.modifiers["order"] = per_army->second;
    }

    if (side.side_modifier) record.modifiers["side"] = side.side_modifier;

    int total_modifier = 0;
    for (const auto& [name, value] : record.modifiers) total_modifier += value;
    record.roll = record.base_roll + total_modifier;
    return record;
}

std::map<ArmyId, ArmyBattleRecord> build_side_records(const std::vector<Army*>& armies,
                                                      const SideContext& side,
                                                      double enemy_strength,
                                                      const RulesConfig& rules) {
    std::map<ArmyId, ArmyBattleRecord> records;
    for (const Army* army : armies) {
        records[army->id] = roll_for_army(*army, side, enemy_strength, rules);
    }
    return records;
}

int best_roll(const std::map<ArmyId, ArmyBattleRecord>& records) {
    if (records.empty()) return 0;
    int best = records.begin()->second.roll;
    for (const auto& [id, rec] : records) best = std::max(best, rec.roll);
    return best;
}

void apply_battle_resolution(Army& army, ArmyBattleRecord& record, int own_difference,
                             bool winning, const std::string& outcome_seed,
                             const RulesConfig& rules) {
    CasualtyEntry entry = lookup_casualties(std::abs(own_difference));
    double casualty = winning ? entry.winner_pct : entry.loser_pct;
    record.casualty_pct = casualty;

    for (auto& det : army.detachments) {
        det.soldiers = std::max(1, static_cast<int>(det.soldiers * (1.0 - casualty)));
    }
    army.supplies_current = static_cast<int>(army.supplies_current * (1.0 - casualty));

    record.morale_delta = winning ? entry.winner_morale : entry.loser_morale;
    adjust_morale(army, record.morale_delta);

    if (army.morale_current <= rules.battle.rout_threshold) {
        army.status = ArmyStatus::ROUTED;
        record.routed = true;
    }

    int capture_target = 0;
    if (!winning && own_difference <= -kMajorCaptureDiff) {
        capture_target = rules.battle.capture_chance_major;
    } else if (!winning && own_difference <= -kMinorCaptureDiff) {
        capture_target = rules.battle.capture_chance_minor;
    }

    if (capture_target > 0) {
        int roll = rng::roll_dice(outcome_seed + ":commander-capture:" + to_string(army.id),
                                  "1d6").total;
        if (roll <= capture_target) record.commander_captured = true;
    }
}

void apply_retreat_if_needed(Army& army, ArmyBattleRecord& record, int roll_difference,
                             const std::string& outcome_seed, const RulesConfig& rules) {
    const auto& b = rules.battle;
    if (record.routed) {
        int retreat_roll = rng::roll_dice(outcome_seed + ":retreat:" + to_string(army.id),
                                          "1d" + std::to_string(std::max(2, b.retreat_hexes_max)))
                               .total;
        record.retreat_hexes = std::clamp(retreat_roll, b.retreat_hexes_min,
                                          std::max(b.retreat_hexes_min, b.retreat_hexes_max));

        int loss_die = rng::roll_dice(outcome_seed + ":retreat-supplies:" + to_string(army.id),
                                      "1d" + std::to_string(std::max(2, b.retreat_supply_loss_die)))
                           .total;
        double loss_pct = std::min(1.0, loss_die * b.retreat_supply_loss_multiplier / 100.0);
        army.supplies_current = static_cast<int>(army.supplies_current * (1.0 - loss_pct));
        return;
    }

    if (roll_difference <= 0) return;

    int fallback = rng::roll_dice(outcome_seed + ":fallback:" + to_string(army.id), "1d2").total;
    if (fallback == 1) record.retreat_hexes = b.retreat_hexes_min;
}

JsonValue record_to_json(ArmyId id, const ArmyBattleRecord& rec) {
    JsonValue modifiers = JsonValue::object();
    for (const auto& [name, value] : rec.modifiers) modifiers.set(name, value);

    JsonValue out = JsonValue::object();
    out.set("army_id", id.value)
       .set("base_roll", rec.base_roll)
       .set("roll", rec.roll)
       .set("modifiers", std::move(modifiers))
       .set("casualty_pct", rec.casualty_pct)
       .set("morale_delta", rec.morale_delta)
       .set("routed", rec.routed)
       .set("commander_captured", rec.commander_captured);
    out.set("retreat_hexes", rec.retreat_hexes ? JsonValue(*rec.retreat_hexes) : JsonValue());
    return out;
}

} // anonymous namespace

CasualtyEntry lookup_casualties(int diff) {
    if (diff >= kMajorCasualtyDiff)       return {0.05, 0.20, 2, -2};
    if (diff >= kSignificantCasualtyDiff) return {0.05, 0.15, 2, -2};
    if (diff >= kModerateCasualtyDiff)    return {0.05, 0.10, 1, -2};
    if (diff >= 1)                        return {0.10, 0.10, 0, -1};
    return {0.05, 0.05, -1, 0};
}

int numeric_advantage(double own_strength, double enemy_strength, const RulesConfig& rules) {
    if (enemy_strength <= 0.0) return 3;
    double ratio = own_strength / enemy_strength;
    if (ratio <= 1.0) return 0;
    double step = rules.battle.multi_side_numeric_bonus_ratio;
    if (step <= 0.0) return 0;
    // 1e-9 keeps exact multiples (1.2 / 0.1) from flooring one step short
    return static_cast<int>((ratio - 1.0) / step + 1e-9);
}

double effective_strength(const Army& army, const UnitTypeMap& unit_types) {
    double strength = 0.0;
    for (const auto& det : army.detachments) {
        auto it = unit_types.find(det.unit_type_id);
        double multiplier = it != unit_types.end() ? it->second.battle_multiplier : 1.0;
        strength += det.soldiers * multiplier;
    }
    return std::max(1.0, strength);
}

BattleResult resolve_battle(const std::vector<Army*>& attackers,
                            const std::vector<Army*>& defenders,
                            const UnitTypeMap& unit_types,
                            const BattleOptions& options,
                            const RulesConfig& rules) {
    double attacker_strength = 0.0;
    for (const Army* a : attackers) attacker_strength += effective_strength(*a, unit_types);
    double defender_strength = 0.0;
    for (const Army* d : defenders) defender_strength += effective_strength(*d, unit_types);
    attacker_strength = std::max(1.0, attacker_strength);
    defender_strength = std::max(1.0, defender_strength);

    SideContext attacker_side{attacker_strength, &options.attacker_seed,
                              &options.attacker_fixed_rolls, &options.attacker_modifiers,
                              options.attacker_modifier};
    SideContext defender_side{defender_strength, &options.defender_seed,
                              &options.defender_fixed_rolls, &options.defender_modifiers,
                              options.defender_modifier};

    BattleResult result;
    result.attacker_records = build_side_records(attackers, attacker_side, defender_strength, rules);
    result.defender_records = build_side_records(defenders, defender_side, attacker_strength, rules);

    const int attacker_best = best_roll(result.attacker_records);
    const int defender_best = best_roll(result.defender_records);
    const int raw_difference = attacker_best - defender_best;

    // Exact ties go to the defender with a zero difference.
    result.winner = raw_difference > 0 ? BattleSide::ATTACKER : BattleSide::DEFENDER;
    result.roll_difference = std::abs(raw_difference);

    const bool attacker_won = result.winner == BattleSide::ATTACKER;

    for (Army* army : attackers) {
        auto& record = result.attacker_records[army->id];
        apply_battle_resolution(*army, record, record.roll - defender_best, attacker_won,
                                options.outcome_seed, rules);
        if (record.commander_captured) result.captured_commanders.push_back(army->commander_id);
    }
    for (Army* army : defenders) {
        auto& record = result.defender_records[army->id];
        apply_battle_resolution(*army, record, record.roll - attacker_best, !attacker_won,
                                options.outcome_seed, rules);
        if (record.commander_captured) result.captured_commanders.push_back(army->commander_id);
    }

    const auto& losers = attacker_won ? defenders : attackers;
    auto& losing_records = attacker_won ? result.defender_records : result.attacker_records;
    for (Army* army : losers) {
        apply_retreat_if_needed(*army, losing_records[army->id], result.roll_difference,
                                options.outcome_seed, rules);
    }

    return result;
}

JsonValue BattleResult::to_json() const {
    JsonValue attackers = JsonValue::array();
    for (const auto& [id, rec] : attacker_records) attackers.push_back(record_to_json(id, rec));
    JsonValue defenders = JsonValue::array();
    for (const auto& [id, rec] : defender_records) defenders.push_back(record_to_json(id, rec));
    JsonValue captured = JsonValue::array();
    for (const auto& c : captured_commanders) captured.push_back(JsonValue(c.value));

    JsonValue out = JsonValue::object();
    out.set("winner", battle_side_to_string(winner))
       .set("roll_difference", roll_difference)
       .set("attackers", std::move(attackers))
       .set("defenders", std::move(defenders))
       .set("captured_commanders", std::move(captured));
    return out;
}

} // namespace strat::rules
