#include "orders/handlers.hpp"
#include "rules/naval.hpp"

namespace strat::orders {

namespace {

OrderExecutionResult from_naval(const rules::NavalActionResult& result) {
    return {result.success ? OrderStatus::COMPLETED : OrderStatus::FAILED, result.detail, {}};
}

} // anonymous namespace

OrderExecutionResult handle(OrderContext& context, Order&, Army* army, const EmbarkPayload& p) {
    Ship* ship = context.campaign.get_ship(p.ship_id);
    if (!ship) return failure("ship not found");
    return from_naval(rules::embark_army(*army, *ship, context.rules));
}

OrderExecutionResult handle(OrderContext& context, Order&, Army* army,
                            const DisembarkPayload& p) {
    Ship* ship = context.campaign.get_ship(p.ship_id);
    if (!ship) return failure("ship not found");
    return from_naval(rules::disembark_army(*army, *ship, context.rules));
}

OrderExecutionResult handle(OrderContext& context, Order&, Army*, const NavalMovePayload& p) {
    Ship* ship = context.campaign.get_ship(p.ship_id);
    if (!ship) return failure("ship not found");
    return from_naval(rules::set_course(context.campaign, *ship, p.route, context.rules));
}

} // namespace strat::orders
