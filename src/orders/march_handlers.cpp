#include "orders/handlers.hpp"
#include "rng/campaign_seed.hpp"
#include "rules/morale.hpp"
#include "rules/movement.hpp"
#include "rules/supply.hpp"
#include <algorithm>

namespace strat::orders {

MovementPlan plan_movement(const OrderContext& context, const Army& army, const Order& order,
                           const MovePayload& payload) {
    const Campaign& campaign = context.campaign;

    std::vector<bool> off_road_legs;
    std::vector<bool> river_fords;
    bool any_night_leg = false;
    for (const auto& leg : payload.legs) {
        off_road_legs.push_back(!leg.on_road);
        river_fords.push_back(leg.has_river_ford);
        any_night_leg = any_night_leg || leg.is_night;
    }
    const bool night_order = payload.movement_type == MovementType::NIGHT;

    auto validation = rules::validate_movement_order(campaign.unit_types, army, off_road_legs,
                                                     river_fords, night_order || any_night_leg);
    if (!validation.valid) {
        throw OrderRejected(validation.error.empty() ? "movement validation failed"
                                                     : validation.error);
    }

    const std::vector<Trait> traits = rules::commander_traits(campaign, army);

    MovementPlan plan;
    plan.movement_type = payload.movement_type;
    plan.final_hex = army.current_hex_id;

    int index = 0;
    for (const auto& leg : payload.legs) {
        index++;
        MovementType leg_type = leg.is_night ? MovementType::NIGHT : payload.movement_type;
        rules::MovementOptions options{leg.on_road, traits, payload.weather_modifier};

        double allowance = rules::calculate_daily_movement_miles(campaign.unit_types, army,
                                                                 leg_type, options,
                                                                 context.rules);
        if (allowance <= 0.0) throw OrderRejected("movement allowance is zero for a leg");

        plan.total_fraction += leg.distance_miles / allowance;
        plan.legs.push_back(leg);
        plan.final_hex = leg.to_hex_id;

        if ((night_order || leg.is_night) && leg.has_fork && leg.alternate_hex_id) {
            std::string seed = rng::campaign_seed(
                campaign, "night-fork:" + to_string(order.id) + ":" + std::to_string(index));
            if (rules::should_take_wrong_fork(seed, context.rules)) {
                plan.final_hex = *leg.alternate_hex_id;
                plan.diverted = true;
                plan.diversion_detail = "took wrong fork on leg " + std::to_string(index);
                break;
            }
        }
    }

    if (plan.total_fraction > 1.0) throw OrderRejected("movement exceeds daily allowance");
    return plan;
}

OrderExecutionResult handle(OrderContext& context, Order& order, Army* army,
                            const MovePayload& p) {
    MovementPlan plan;
    try {
        plan = plan_movement(context, *army, order, p);
    } catch (const OrderRejected& e) {
        return failure(e.what());
    }

    const HexId from_hex = army->current_hex_id;
    army->current_hex_id = plan.final_hex;
    army->destination_hex_id.reset();
    army->movement_points_remaining = std::max(0.0, 1.0 - plan.total_fraction);
    army->days_marched_this_week++;

    const bool night = plan.movement_type == MovementType::NIGHT ||
                       std::any_of(plan.legs.begin(), plan.legs.end(),
                                   [](const MoveLeg& leg) { return leg.is_night; });
    if (plan.movement_type == MovementType::FORCED) {
        army->status = ArmyStatus::FORCED_MARCH;
        army->forced_march_days += plan.total_fraction;
    } else if (night) {
        army->status = ArmyStatus::NIGHT_MARCH;
    } else {
        army->status = ArmyStatus::MARCHING;
    }

    if (Commander* commander = context.campaign.get_commander(army->commander_id)) {
        commander->current_hex_id = plan.final_hex;
    }

    std::string detail = "moved to hex " + to_string(plan.final_hex) + " via " +
                         std::to_string(plan.legs.size()) + " leg(s)";
    if (plan.diverted) detail += " (" + plan.diversion_detail + ")";

    JsonValue event = JsonValue::object();
    event.set("type", "movement")
         .set("army_id", army->id.value)
         .set("from_hex_id", from_hex.value)
         .set("to_hex_id", plan.final_hex.value)
         .set("movement_type", movement_type_to_string(plan.movement_type))
         .set("legs", static_cast<int>(plan.legs.size()))
         .set("fraction", plan.total_fraction)
         .set("diverted", plan.diverted);
    return completed(detail, {event});
}

OrderExecutionResult handle(OrderContext& context, Order&, Army* army, const RestPayload& p) {
    const auto& harried = army->status_effects["harried"];
    if (harried.is_object() && harried["day"].is_number() &&
        harried["day"].as_int() == context.campaign.current_day) {
        return failure("army is harried and cannot rest today");
    }
    if (p.duration_days <= 0) return failure("rest duration must be positive");

    army->status = ArmyStatus::RESTING;
    army->rest_duration_days = p.duration_days;
    army->rest_started_day = context.campaign.current_day;
    army->days_marched_this_week = 0;
    army->movement_points_remaining = 0.0;
    army->destination_hex_id.reset();
    rules::adjust_morale(*army, std::max(0, army->morale_resting - army->morale_current));

    return completed("resting for " + std::to_string(p.duration_days) + " day(s)");
}

} // namespace strat::orders
