#include "rules/operations.hpp"
#include "rng/campaign_seed.hpp"
#include <algorithm>

namespace strat::rules {

OperationResult resolve_operation(Campaign& campaign, Operation& operation,
                                  const RulesConfig& rules,
                                  const std::optional<std::string>& seed) {
    const auto& ops = rules.operations;

    int modifier = operation.difficulty_modifier;
    if (operation.complexity == "simple")       modifier += ops.simple_modifier;
    else if (operation.complexity == "complex") modifier += ops.complex_modifier;
    if (operation.territory_type == "hostile")  modifier += ops.hostile_territory_modifier;

    OperationResult result;
    result.target = std::clamp(ops.base_success_target - modifier, 2, 12);

    const std::string roll_seed =
        seed ? *seed : rng::campaign_seed(campaign, "operation:" + to_string(operation.id));
    result.roll = rng::roll_dice(roll_seed, "2d6").total;
    result.success = result.roll >= result.target;
    result.detail = result.success ? "operation success" : "operation failed";

    operation.executed_on_day = campaign.current_day;
    operation.success_chance = result.target;
    operation.outcome = result.success ? OperationOutcome::SUCCESS : OperationOutcome::FAILURE;
    operation.result = JsonValue::object();
    operation.result.set("roll", result.roll)
                    .set("target", result.target)
                    .set("success", result.success);
    return result;
}

} // namespace strat::rules
