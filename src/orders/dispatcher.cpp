#include "orders/dispatcher.hpp"
#include "orders/handlers.hpp"
#include "orders/order_parser.hpp"
#include <iostream>
#include <variant>

namespace strat::orders {

namespace {

OrderExecutionResult fail_order(Order& order, const std::string& detail) {
    order.status = OrderStatus::FAILED;
    order.result = OrderResult{detail, {}};
    return failure(detail);
}

void log_result(const OrderContext& context, const Order& order,
                const OrderExecutionResult& result) {
    if (!context.verbose) return;
    std::cerr << "[ORDER] day " << context.campaign.current_day
              << " " << day_part_to_string(context.day_part)
              << " #" << order.id << " " << order.order_type
              << " -> " << order_status_to_string(result.status);
    if (!result.detail.empty()) std::cerr << ": " << result.detail;
    std::cerr << "\n";
}

} // anonymous namespace

OrderExecutionResult execute_order(OrderContext& context, Order& order) {
    if (is_terminal(order.status)) {
        return {order.status, "order already resolved", {}};
    }

    auto kind = parse_order_kind(order.order_type);
    if (!kind) {
        auto result = fail_order(order, "unsupported order type: " + order.order_type);
        log_result(context, order, result);
        return result;
    }

    Army* army = nullptr;
    if (order.army_id) {
        army = context.campaign.get_army(*order.army_id);
        if (!army) {
            auto result = fail_order(order, "army " + to_string(*order.army_id) + " not found");
            log_result(context, order, result);
            return result;
        }
    }
    if (!army && requires_army(*kind)) {
        auto result = fail_order(order, std::string(order_kind_to_string(*kind)) +
                                            " order requires an army");
        log_result(context, order, result);
        return result;
    }

    OrderPayload payload;
    try {
        payload = parse_payload(*kind, order.parameters);
    } catch (const PayloadError& e) {
        auto result = fail_order(order, e.what());
        log_result(context, order, result);
        return result;
    }

    order.status = OrderStatus::EXECUTING;
    OrderExecutionResult result = std::visit(
        [&](const auto& p) { return handle(context, order, army, p); }, payload);

    order.status = result.status;
    if (!result.detail.empty() || !result.events.empty()) {
        order.result = OrderResult{result.detail, result.events};
    } else {
        order.result.reset();
    }
    log_result(context, order, result);
    return result;
}

bool cancel_order(Order& order) {
    if (order.status != OrderStatus::PENDING && order.status != OrderStatus::EXECUTING) {
        return false;
    }
    order.status = OrderStatus::CANCELLED;
    return true;
}

} // namespace strat::orders
