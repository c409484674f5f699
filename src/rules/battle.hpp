/**
 * Battle: Resolve one engagement between two sides of one or more armies.
 *
 * Each army rolls 2d6 (or a caller-fixed roll) plus modifiers:
 *   numeric    floor((own / enemy - 1) / ratio), 3 if the enemy has no strength
 *   morale     clamp(floor((current - resting) / 2), -2, 2)
 *   exhaustion -1 while "sick_or_exhausted" is set
 *   order      per-army modifier from BattleOptions
 *   side       flat per-side modifier from BattleOptions
 * The best total on each side decides the winner; a tie goes to the
 * defender with roll difference 0. Casualties, morale shifts, routs,
 * commander captures and retreats are applied to the armies in place.
 *
 * The resolver never throws for non-empty sides: strengths are floored at
 * 1 and morale is clamped to [0, max].
 */

#ifndef STRAT_RULES_BATTLE_HPP
#define STRAT_RULES_BATTLE_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include "io/json_reader.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strat::rules {

enum class BattleSide {
    ATTACKER,
    DEFENDER
};

inline const char* battle_side_to_string(BattleSide side) {
    return side == BattleSide::ATTACKER ? "attacker" : "defender";
}

struct BattleOptions {
    int attacker_modifier = 0;
    int defender_modifier = 0;
    std::map<ArmyId, int> attacker_modifiers;
    std::map<ArmyId, int> defender_modifiers;
    std::map<ArmyId, int> attacker_fixed_rolls;
    std::map<ArmyId, int> defender_fixed_rolls;

    // Prefixes for every draw in the battle; callers scope them to the tick.
    std::string attacker_seed = "attacker-battle";
    std::string defender_seed = "defender-battle";
    std::string outcome_seed = "battle-outcome";
};

struct ArmyBattleRecord {
    int base_roll = 0;
    int roll = 0;                               // base roll plus modifiers
    std::map<std::string, int> modifiers;
    double casualty_pct = 0.0;
    int morale_delta = 0;
    bool routed = false;
    std::optional<int> retreat_hexes;
    bool commander_captured = false;
};

struct BattleResult {
    BattleSide winner = BattleSide::DEFENDER;
    std::map<ArmyId, ArmyBattleRecord> attacker_records;
    std::map<ArmyId, ArmyBattleRecord> defender_records;
    int roll_difference = 0;
    std::vector<CommanderId> captured_commanders;

    /** Event-record form: winner, roll_difference, per-army records. */
    JsonValue to_json() const;
};

/** Row of the casualty table for one roll-difference magnitude. */
struct CasualtyEntry {
    double winner_pct = 0.0;
    double loser_pct = 0.0;
    int winner_morale = 0;
    int loser_morale = 0;
};

/**
 * Casualty table keyed by |roll difference|:
 *   >= 6  5% / 20%, +2 / -2
 *   >= 4  5% / 15%, +2 / -2
 *   >= 2  5% / 10%, +1 / -2
 *   == 1 10% / 10%,  0 / -1
 *   == 0  5% /  5%, -1 /  0
 */
CasualtyEntry lookup_casualties(int diff_magnitude);

/** Side strength bonus against the enemy side's strength. */
int numeric_advantage(double own_strength, double enemy_strength, const RulesConfig& rules);

/** Sum of soldiers times unit battle multiplier, at least 1. */
double effective_strength(const Army& army, const UnitTypeMap& unit_types);

BattleResult resolve_battle(const std::vector<Army*>& attackers,
                            const std::vector<Army*>& defenders,
                            const UnitTypeMap& unit_types,
                            const BattleOptions& options,
                            const RulesConfig& rules);

} // namespace strat::rules

#endif // STRAT_RULES_BATTLE_HPP
