#include "orders/handlers.hpp"
#include "rules/harrying.hpp"
#include "rules/messaging.hpp"
#include "rules/operations.hpp"
#include "rules/recruitment.hpp"
#include <stdexcept>

namespace strat::orders {

// ── Messages and operations ──

OrderExecutionResult handle(OrderContext& context, Order& order, Army* army,
                            const SendMessagePayload& p) {
    Campaign& campaign = context.campaign;

    Message message;
    message.id = campaign.next_message_id();
    message.sender_id = army ? army->commander_id : order.commander_id;
    message.recipient_id = p.recipient_id;
    message.content = p.content;
    message.sent_on_day = campaign.current_day;
    message.territory_type = p.territory_type;

    std::optional<HexId> from_hex;
    if (army) from_hex = army->current_hex_id;
    std::optional<HexId> to_hex;
    if (const Commander* recipient = campaign.get_commander(p.recipient_id)) {
        to_hex = recipient->current_hex_id;
    }

    auto result = rules::dispatch_message(campaign, std::move(message), context.rules,
                                          from_hex, to_hex);
    if (!result.success) return failure(result.detail);

    JsonValue event = JsonValue::object();
    event.set("type", "message_sent")
         .set("message_id", result.message_id->value)
         .set("recipient_id", p.recipient_id.value);
    return completed(result.detail, {event});
}

OrderExecutionResult handle(OrderContext& context, Order& order, Army*,
                            const LaunchOperationPayload& p) {
    Campaign& campaign = context.campaign;

    Operation* operation = p.operation_id ? campaign.get_operation(*p.operation_id) : nullptr;
    if (!operation) {
        Operation fresh;
        fresh.id = campaign.next_operation_id();
        fresh.commander_id = order.commander_id;
        fresh.operation_type = p.operation_type;
        fresh.target_descriptor = p.target_descriptor;
        fresh.loot_cost = p.loot_cost ? *p.loot_cost : context.rules.operations.loot_cost_default;
        fresh.complexity = p.complexity;
        fresh.territory_type = p.territory_type;
        fresh.difficulty_modifier = p.difficulty_modifier;
        const OperationId id = fresh.id;
        campaign.operations[id] = std::move(fresh);
        operation = campaign.get_operation(id);
    }

    auto outcome = rules::resolve_operation(campaign, *operation, context.rules);

    JsonValue event = JsonValue::object();
    event.set("type", "operation")
         .set("operation_id", operation->id.value)
         .set("operation_type", operation_type_to_string(operation->operation_type))
         .set("roll", outcome.roll)
         .set("target", outcome.target)
         .set("success", outcome.success);
    return completed(outcome.detail, {event});
}

// ── Recruitment ──

namespace {

OrderExecutionResult start_raise_army(OrderContext& context, Order& order,
                                      const RaiseArmyPayload& p) {
    Campaign& campaign = context.campaign;

    const Stronghold* stronghold = campaign.get_stronghold(p.stronghold_id);
    if (!stronghold) return failure("stronghold not found");
    const Commander* commander = campaign.get_commander(p.new_commander_id);
    if (!commander) return failure("commander not found");
    if (!campaign.get_unit_type(p.infantry_unit_type_id)) return failure("unit type not found");
    if (p.cavalry_unit_type_id && !campaign.get_unit_type(*p.cavalry_unit_type_id)) {
        return failure("unit type not found");
    }

    const HexId rally_hex_id = p.rally_hex_id ? *p.rally_hex_id : stronghold->hex_id;
    if (!campaign.map.get_hex(rally_hex_id)) return failure("rally hex not found");

    rules::RecruitmentStart start;
    try {
        start = rules::start_recruitment(campaign, *stronghold, *commander, rally_hex_id,
                                         order.id, context.rules);
    } catch (const std::invalid_argument& e) {
        return failure(e.what());
    }

    RecruitmentSchedule schedule;
    schedule.project_id = start.project_id;
    schedule.infantry_unit_type_id = p.infantry_unit_type_id;
    schedule.cavalry_unit_type_id = p.cavalry_unit_type_id;
    schedule.army_name = p.army_name ? *p.army_name : commander->name;
    order.schedule = schedule;
    order.execute_day = campaign.get_recruitment(start.project_id)->completes_on_day;

    std::vector<JsonValue> events;
    if (!start.revolt_army_ids.empty()) {
        JsonValue ids = JsonValue::array();
        for (const auto& id : start.revolt_army_ids) ids.push_back(JsonValue(id.value));
        JsonValue event = JsonValue::object();
        event.set("type", "recruitment_revolt").set("army_ids", std::move(ids));
        events.push_back(std::move(event));
    }
    return {OrderStatus::EXECUTING, start.detail, std::move(events)};
}

OrderExecutionResult complete_raise_army(OrderContext& context, Order& order,
                                         const RecruitmentSchedule& schedule) {
    Campaign& campaign = context.campaign;

    const RecruitmentProject* project = campaign.get_recruitment(schedule.project_id);
    if (!project) return failure("recruitment project missing");

    if (campaign.current_day < project->completes_on_day) {
        const int remaining = project->completes_on_day - campaign.current_day;
        order.execute_day = project->completes_on_day;
        return {OrderStatus::EXECUTING,
                "recruitment in progress; " + std::to_string(remaining) + " day(s) remaining",
                {}};
    }

    rules::RecruitmentCompletionOptions options;
    options.army_name = schedule.army_name;
    options.infantry_type_id = schedule.infantry_unit_type_id;
    options.cavalry_type_id = schedule.cavalry_unit_type_id;

    rules::RecruitmentCompletion completion;
    try {
        completion = rules::complete_recruitment(campaign, schedule.project_id, options,
                                                 context.rules);
    } catch (const std::invalid_argument& e) {
        return failure(e.what());
    }

    JsonValue event = JsonValue::object();
    event.set("type", "army_raised")
         .set("army_id", completion.army_id.value)
         .set("army_name", schedule.army_name);
    return completed(completion.detail, {event});
}

} // anonymous namespace

OrderExecutionResult handle(OrderContext& context, Order& order, Army*,
                            const RaiseArmyPayload& p) {
    if (!order.schedule) return start_raise_army(context, order, p);
    const RecruitmentSchedule schedule = *order.schedule;
    return complete_raise_army(context, order, schedule);
}

// ── Harrying ──

OrderExecutionResult handle(OrderContext& context, Order&, Army* army, const HarryPayload& p) {
    Campaign& campaign = context.campaign;

    std::vector<Detachment*> selected;
    for (const auto& id : p.detachment_ids) {
        for (auto& det : army->detachments) {
            if (det.id == id) selected.push_back(&det);
        }
    }
    if (selected.empty()) return failure("no matching detachments for harrying");

    Army* target = campaign.get_army(p.target_army_id);
    if (!target) return failure("target army not found");
    if (target == army) return failure("army cannot harry itself");

    rules::HarryingResult outcome;
    try {
        outcome = rules::resolve_harrying(campaign, *army, *target, selected, p.objective);
    } catch (const std::invalid_argument& e) {
        return failure(e.what());
    }

    JsonValue event = JsonValue::object();
    event.set("type", "harry")
         .set("success", outcome.success)
         .set("target_army_id", p.target_army_id.value)
         .set("objective", p.objective)
         .set("roll", outcome.roll)
         .set("modifier", outcome.modifier)
         .set("inflicted_casualties", outcome.inflicted_casualties)
         .set("attacker_losses", outcome.attacker_losses)
         .set("supplies_burned", outcome.supplies_burned)
         .set("supplies_stolen", outcome.supplies_stolen)
         .set("loot_stolen", outcome.loot_stolen);

    return {outcome.success ? OrderStatus::COMPLETED : OrderStatus::FAILED, outcome.detail,
            {event}};
}

} // namespace strat::orders
