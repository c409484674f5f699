/**
 * Operations: Espionage resolution (intelligence, assassination, sabotage).
 *
 * Target = clamp(base - modifier, 2, 12) where the modifier sums the
 * operation's difficulty, +2 simple / -2 complex, and -1 in hostile
 * territory. Success when 2d6 >= target.
 */

#ifndef STRAT_RULES_OPERATIONS_HPP
#define STRAT_RULES_OPERATIONS_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include <optional>
#include <string>

namespace strat::rules {

struct OperationResult {
    bool success = false;
    int roll = 0;
    int target = 0;
    std::string detail;
};

/** Resolve immediately; records outcome, day, and {roll, target, success}. */
OperationResult resolve_operation(Campaign& campaign, Operation& operation,
                                  const RulesConfig& rules,
                                  const std::optional<std::string>& seed = std::nullopt);

} // namespace strat::rules

#endif // STRAT_RULES_OPERATIONS_HPP
