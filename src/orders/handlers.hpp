/**
 * Order handlers: one overload of handle() per payload type.
 *
 * The dispatcher visits the parsed OrderPayload and calls the overload
 * matching its alternative, so a payload without a handler does not
 * compile. `army` is non-null for every kind where requires_army() holds.
 */

#ifndef STRAT_ORDERS_HANDLERS_HPP
#define STRAT_ORDERS_HANDLERS_HPP

#include "orders/dispatcher.hpp"
#include "orders/order_types.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace strat::orders {

/** Thrown inside handlers for a rejection that becomes the FAILED detail. */
class OrderRejected : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline OrderExecutionResult failure(std::string detail) {
    return {OrderStatus::FAILED, std::move(detail), {}};
}

inline OrderExecutionResult completed(std::string detail, std::vector<JsonValue> events = {}) {
    return {OrderStatus::COMPLETED, std::move(detail), std::move(events)};
}

// ── March ──

/** Realized movement of one move order. */
struct MovementPlan {
    MovementType movement_type = MovementType::STANDARD;
    std::vector<MoveLeg> legs;                // legs actually travelled
    double total_fraction = 0.0;
    HexId final_hex;
    bool diverted = false;
    std::string diversion_detail;
};

/**
 * Validate and walk the legs without mutating anything.
 * @throws OrderRejected on validation failure, zero allowance, or a day
 *         fraction above 1
 */
MovementPlan plan_movement(const OrderContext& context, const Army& army, const Order& order,
                           const MovePayload& payload);

OrderExecutionResult handle(OrderContext& context, Order& order, Army* army, const MovePayload& p);
OrderExecutionResult handle(OrderContext& context, Order& order, Army* army, const RestPayload& p);

// ── Supply ──

OrderExecutionResult handle(OrderContext& context, Order& order, Army* army, const ForagePayload& p);
OrderExecutionResult handle(OrderContext& context, Order& order, Army* army, const TorchPayload& p);
OrderExecutionResult handle(OrderContext& context, Order& order, Army* army,
                            const SupplyTransferPayload& p);

// ── Siege ──

OrderExecutionResult handle(OrderContext& context, Order& order, Army* army, const BesiegePayload& p);
OrderExecutionResult handle(OrderContext& context, Order& order, Army* army, const AssaultPayload& p);

// ── Naval ──

OrderExecutionResult handle(OrderContext& context, Order& order, Army* army, const EmbarkPayload& p);
OrderExecutionResult handle(OrderContext& context, Order& order, Army* army,
                            const DisembarkPayload& p);
OrderExecutionResult handle(OrderContext& context, Order& order, Army* army,
                            const NavalMovePayload& p);

// ── Command ──

OrderExecutionResult handle(OrderContext& context, Order& order, Army* army,
                            const SendMessagePayload& p);
OrderExecutionResult handle(OrderContext& context, Order& order, Army* army,
                            const LaunchOperationPayload& p);
OrderExecutionResult handle(OrderContext& context, Order& order, Army* army,
                            const RaiseArmyPayload& p);
OrderExecutionResult handle(OrderContext& context, Order& order, Army* army, const HarryPayload& p);

} // namespace strat::orders

#endif // STRAT_ORDERS_HANDLERS_HPP
