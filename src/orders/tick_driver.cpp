#include "orders/tick_driver.hpp"
#include "orders/dispatcher.hpp"
#include "rng/campaign_seed.hpp"
#include "rules/mercenaries.hpp"
#include "rules/messaging.hpp"
#include "rules/morale.hpp"
#include "rules/naval.hpp"
#include "rules/siege.hpp"
#include "rules/supply.hpp"
#include <algorithm>
#include <iostream>
#include <tuple>

namespace strat::orders {

namespace {

constexpr double kPartFraction = 1.0 / rules::kDayPartsPerDay;

bool is_march_status(ArmyStatus status) {
    return status == ArmyStatus::MARCHING || status == ArmyStatus::FORCED_MARCH ||
           status == ArmyStatus::NIGHT_MARCH || status == ArmyStatus::HARRYING;
}

JsonValue order_record(const Campaign& campaign, DayPart part, const Order& order,
                       const OrderExecutionResult& result) {
    JsonValue events = JsonValue::array();
    for (const auto& event : result.events) events.push_back(event);

    JsonValue record = JsonValue::object();
    record.set("type", "order_result")
          .set("day", campaign.current_day)
          .set("part", day_part_to_string(part))
          .set("order_id", order.id.value)
          .set("order_type", order.order_type)
          .set("status", order_status_to_string(result.status))
          .set("detail", result.detail)
          .set("events", std::move(events));
    return record;
}

} // anonymous namespace

std::vector<Order*> orders_due(Campaign& campaign, int day, DayPart part) {
    std::vector<Order*> due;
    for (auto& [id, order] : campaign.orders) {
        if (order.status != OrderStatus::PENDING && order.status != OrderStatus::EXECUTING) {
            continue;
        }
        const int execute_day = order.execute_day ? *order.execute_day : day;
        if (execute_day != day) continue;
        const DayPart execute_part = order.execute_part ? *order.execute_part : DayPart::MORNING;
        if (execute_part != part) continue;
        due.push_back(&order);
    }

    std::sort(due.begin(), due.end(), [day](const Order* a, const Order* b) {
        const int a_day = a->execute_day ? *a->execute_day : day;
        const int b_day = b->execute_day ? *b->execute_day : day;
        return std::tie(a_day, a->priority, a->issued_at, a->id) <
               std::tie(b_day, b->priority, b->issued_at, b->id);
    });
    return due;
}

TickDriver::TickDriver(Campaign& campaign, const RulesConfig& rules, TickConfig config)
    : campaign_(campaign), rules_(rules), config_(config) {}

void TickDriver::run_day() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.verbose) {
        std::cerr << "[TICK] day " << campaign_.current_day << " ("
                  << season_to_string(campaign_.season) << ")\n";
    }

    start_of_day();
    for (DayPart part : kDayParts) execute_part(part);
    consume_supplies();
    pay_mercenaries();
    if ((campaign_.current_day + 1) % kDaysPerWeek == 0) advance_sieges();
    end_of_day();
}

void TickDriver::run_days(int days, ProgressCallback progress) {
    for (int i = 0; i < days; i++) {
        run_day();
        if (progress) progress(i + 1, days);
    }
}

void TickDriver::run_part(DayPart part) {
    std::lock_guard<std::mutex> lock(mutex_);
    execute_part(part);
}

// ── Day phases ──

void TickDriver::start_of_day() {
    for (auto& [id, army] : campaign_.armies) {
        const auto snapshot = rules::build_supply_snapshot(campaign_, army, rules_);
        army.supplies_capacity = snapshot.capacity;
        army.daily_supply_consumption = snapshot.consumption;
        army.noncombatant_count = snapshot.noncombatants;
        army.column_length_miles = snapshot.column_length_miles;
        army.movement_points_remaining = 1.0;

        if (campaign_.current_day % kDaysPerWeek == 0) army.days_marched_this_week = 0;

        if (is_march_status(army.status)) army.status = ArmyStatus::IDLE;

        if (army.status == ArmyStatus::RESTING && army.rest_duration_days) {
            const int started = army.rest_started_day ? *army.rest_started_day
                                                      : campaign_.current_day;
            if (campaign_.current_day - started >= *army.rest_duration_days) {
                army.rest_duration_days.reset();
                army.rest_started_day.reset();
                army.status = ArmyStatus::IDLE;
            }
        }

        if (army.forced_march_days >= kDaysPerWeek) {
            const int penalties = static_cast<int>(army.forced_march_days / kDaysPerWeek);
            rules::adjust_morale(army,
                                 -penalties * rules_.morale.forced_march_morale_loss_per_week);
            army.forced_march_days -= penalties * kDaysPerWeek;
        }
    }
}

void TickDriver::execute_part(DayPart part) {
    campaign_.current_part = part;
    rules::advance_messages(campaign_, rules_, kPartFraction);
    rules::advance_ships(campaign_, kPartFraction);

    OrderContext context{campaign_, part, rules_, config_.verbose};
    for (Order* order : orders_due(campaign_, campaign_.current_day, part)) {
        auto result = execute_order(context, *order);
        if (result.status == OrderStatus::COMPLETED || result.status == OrderStatus::FAILED) {
            order->execute_day = campaign_.current_day;
        }
        campaign_.event_log.push_back(order_record(campaign_, part, *order, result));
    }
}

void TickDriver::consume_supplies() {
    for (auto& [id, army] : campaign_.armies) {
        auto outcome = rules::consume_daily_supplies(campaign_, army, rules_);
        if (!outcome.starving) continue;

        JsonValue record = JsonValue::object();
        record.set("type", "starvation")
              .set("day", campaign_.current_day)
              .set("army_id", id.value)
              .set("days_without_supplies", army.days_without_supplies)
              .set("morale_failed", outcome.morale_failed)
              .set("dissolved", outcome.dissolved);
        if (!outcome.consequence.is_null()) record.set("consequence", outcome.consequence);
        campaign_.event_log.push_back(std::move(record));

        if (config_.verbose) {
            std::cerr << "[TICK] army " << id << " starving (" << army.days_without_supplies
                      << " day(s))" << (outcome.dissolved ? ", dissolved" : "") << "\n";
        }
    }
}

void TickDriver::pay_mercenaries() {
    for (const auto& outcome : rules::process_daily_upkeep(campaign_, rules_)) {
        JsonValue record = JsonValue::object();
        record.set("type", "mercenary_upkeep")
              .set("day", campaign_.current_day)
              .set("contract_id", outcome.contract_id.value)
              .set("army_id", outcome.army_id.value)
              .set("amount_due", outcome.amount_due)
              .set("paid", outcome.paid)
              .set("days_unpaid", outcome.days_unpaid)
              .set("deserted", outcome.deserted);
        campaign_.event_log.push_back(std::move(record));

        if (config_.verbose && !outcome.paid) {
            std::cerr << "[TICK] contract " << outcome.contract_id << " unpaid ("
                      << outcome.days_unpaid << " day(s))"
                      << (outcome.deserted ? ", company deserted" : "") << "\n";
        }
    }
}

void TickDriver::advance_sieges() {
    for (auto& [id, siege] : campaign_.sieges) {
        if (siege.status != SiegeStatus::ONGOING) continue;

        auto result = rules::advance_siege(
            siege, rng::campaign_seed(campaign_, "siege:" + to_string(id)), rules_);
        if (result.gates_opened) {
            if (Stronghold* stronghold = campaign_.get_stronghold(siege.stronghold_id)) {
                stronghold->gates_open = true;
            }
        }

        JsonValue record = JsonValue::object();
        record.set("type", "siege_week")
              .set("day", campaign_.current_day)
              .set("siege_id", id.value)
              .set("weeks_elapsed", siege.weeks_elapsed)
              .set("threshold", result.threshold_after)
              .set("roll", result.roll)
              .set("gates_opened", result.gates_opened);
        campaign_.event_log.push_back(std::move(record));

        if (config_.verbose) {
            std::cerr << "[SIEGE] siege " << id << " week " << siege.weeks_elapsed
                      << ": threshold " << result.threshold_after << ", roll " << result.roll
                      << (result.gates_opened ? ", gates opened" : "") << "\n";
        }
    }
}

void TickDriver::end_of_day() {
    campaign_.current_day++;
    campaign_.current_part = DayPart::MORNING;
    if (campaign_.current_day % kDaysPerSeason == 0) {
        campaign_.season = next_season(campaign_.season);
        if (config_.verbose) {
            std::cerr << "[TICK] season is now " << season_to_string(campaign_.season) << "\n";
        }
    }
}

} // namespace strat::orders
