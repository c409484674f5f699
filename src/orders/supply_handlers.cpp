#include "orders/handlers.hpp"
#include "rules/supply.hpp"
#include <algorithm>

namespace strat::orders {

namespace {

JsonValue hex_list(const std::vector<HexId>& hexes) {
    JsonValue out = JsonValue::array();
    for (const auto& id : hexes) out.push_back(JsonValue(id.value));
    return out;
}

} // anonymous namespace

OrderExecutionResult handle(OrderContext& context, Order&, Army* army, const ForagePayload& p) {
    auto outcome = rules::forage(context.campaign, *army, p.hex_ids, context.rules);

    std::string detail = "foraged " + std::to_string(outcome.foraged_hexes.size()) + " hex(es)";
    if (outcome.supplies_gained) {
        detail += " gaining " + std::to_string(outcome.supplies_gained) + " supplies";
    }
    if (outcome.revolt_triggered) detail += "; revolt triggered";

    JsonValue event = JsonValue::object();
    event.set("type", "forage")
         .set("army_id", army->id.value)
         .set("hexes", hex_list(outcome.foraged_hexes))
         .set("supplies_gained", outcome.supplies_gained)
         .set("revolt_triggered", outcome.revolt_triggered);

    if (!outcome.success) return {OrderStatus::FAILED, detail, {event}};
    army->status = ArmyStatus::FORAGING;
    return completed(detail, {event});
}

OrderExecutionResult handle(OrderContext& context, Order&, Army* army, const TorchPayload& p) {
    auto outcome = rules::torch(context.campaign, *army, p.hex_ids, context.rules);

    std::string detail = "torched " + std::to_string(outcome.torched_hexes.size()) + " hex(es)";
    if (outcome.revolt_triggered) detail += "; revolt triggered";

    JsonValue event = JsonValue::object();
    event.set("type", "torch")
         .set("army_id", army->id.value)
         .set("hexes", hex_list(outcome.torched_hexes))
         .set("revolt_triggered", outcome.revolt_triggered);

    if (!outcome.success) return {OrderStatus::FAILED, detail, {event}};
    army->status = ArmyStatus::TORCHING;
    return completed(detail, {event});
}

OrderExecutionResult handle(OrderContext& context, Order&, Army* army,
                            const SupplyTransferPayload& p) {
    if (p.amount <= 0) return failure("transfer amount must be positive");

    Army* target = context.campaign.get_army(p.target_army_id);
    if (!target) return failure("target army not found");

    const int available = std::min(p.amount, army->supplies_current);
    const int free_capacity = std::max(0, target->supplies_capacity - target->supplies_current);
    const int transferred = std::min(available, free_capacity);
    if (transferred <= 0) return failure("no supplies transferable");

    army->supplies_current -= transferred;
    target->supplies_current += transferred;

    JsonValue event = JsonValue::object();
    event.set("type", "supply_transfer")
         .set("from_army_id", army->id.value)
         .set("to_army_id", target->id.value)
         .set("amount", transferred);
    return completed("transferred " + std::to_string(transferred) + " supplies to army " +
                         to_string(target->id),
                     {event});
}

} // namespace strat::orders
