/**
 * Morale: Adjustment, 2d6 morale checks, and the failure consequence table.
 */

#ifndef STRAT_RULES_MORALE_HPP
#define STRAT_RULES_MORALE_HPP

#include "core/campaign.hpp"
#include "io/json_reader.hpp"
#include <string>
#include <vector>

namespace strat::rules {

/** Consequence of a failed morale check, keyed by the (modified) 2d6 roll. */
enum class MoraleConsequence {
    MUTINY = 2,                   // each detachment defects on 19/20
    MASS_DESERTION = 3,           // 30% loss
    DETACHMENTS_DEFECT = 4,       // 1d6 detachments defect
    MAJOR_DESERTION = 5,          // 20% loss
    ARMY_SPLITS = 6,              // each detachment leaves on 3/6
    RANDOM_DETACHMENT_DEFECTS = 7,
    DESERTION = 8,                // 10% loss
    DETACHMENTS_DEPART = 9,       // 1d6 detachments leave for 2d6 days
    CAMP_FOLLOWERS = 10,          // +5% noncombatants
    DETACHMENT_DEPARTS = 11,      // one detachment leaves for 2d6 days
    NO_CONSEQUENCES = 12
};

const char* morale_consequence_to_string(MoraleConsequence consequence);

struct MoraleCheck {
    bool success = false;
    int roll = 0;
};

/** Shift morale by `change`, clamped to [0, morale_max]. */
void adjust_morale(Army& army, int change);

/** 2d6 against current morale; success when roll <= morale. */
MoraleCheck roll_morale_check(int morale, const std::string& seed);

/**
 * Apply the consequence for a failed check's roll to the army in place.
 * The Poet trait adds 2 to the roll. Defecting or splitting detachments
 * leave the army; at least one detachment always remains.
 *
 * @return details record: consequence_type, roll, and per-consequence keys
 */
JsonValue apply_morale_consequence(Army& army, int roll, const std::vector<Trait>& traits,
                                   const std::string& seed, int current_day);

} // namespace strat::rules

#endif // STRAT_RULES_MORALE_HPP
