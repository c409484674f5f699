/**
 * Order dispatcher: PENDING → EXECUTING → {COMPLETED, FAILED}.
 *
 * execute_order resolves the order's tag and parameters to a typed payload
 * and runs the matching handler against the campaign. Validation problems
 * never escape as exceptions: they become a FAILED status with a detail.
 * Terminal orders are returned untouched, so dispatching twice is harmless.
 *
 * Usage:
 *   OrderContext ctx{campaign, DayPart::MORNING, rules};
 *   auto result = execute_order(ctx, *campaign.get_order(OrderId(7)));
 *   if (result.status == OrderStatus::FAILED) std::cerr << result.detail;
 */

#ifndef STRAT_ORDERS_DISPATCHER_HPP
#define STRAT_ORDERS_DISPATCHER_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include "io/json_reader.hpp"
#include <string>
#include <vector>

namespace strat::orders {

struct OrderContext {
    Campaign& campaign;
    DayPart day_part;
    const RulesConfig& rules;
    bool verbose = false;
};

struct OrderExecutionResult {
    OrderStatus status = OrderStatus::PENDING;
    std::string detail;
    std::vector<JsonValue> events;
};

OrderExecutionResult execute_order(OrderContext& context, Order& order);

/**
 * Cancel a PENDING or EXECUTING order.
 * @return false (and no change) if the order is already terminal
 */
bool cancel_order(Order& order);

} // namespace strat::orders

#endif // STRAT_ORDERS_DISPATCHER_HPP
