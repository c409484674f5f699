/**
 * TickDriver: Advances a campaign one day at a time.
 *
 * A day is: start-of-day refresh, four day-parts (messages, ships, then
 * every order due at that part), supply consumption, the weekly siege
 * advance, and the day/season roll. One driver serves one campaign; its
 * mutex is held for a whole run_day or run_part so concurrent callers
 * never interleave ticks.
 *
 * Usage:
 *   TickDriver driver(campaign, rules, {verbose});
 *   driver.run_days(30);
 */

#ifndef STRAT_ORDERS_TICK_DRIVER_HPP
#define STRAT_ORDERS_TICK_DRIVER_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include <functional>
#include <mutex>
#include <vector>

namespace strat::orders {

constexpr int kDaysPerWeek = 7;
constexpr int kDaysPerSeason = 91;

struct TickConfig {
    bool verbose = false;
};

/** Orders due at (day, part), in execution order. */
std::vector<Order*> orders_due(Campaign& campaign, int day, DayPart part);

class TickDriver {
public:
    /** Called after each finished day with (days done, days requested). */
    using ProgressCallback = std::function<void(int, int)>;

    TickDriver(Campaign& campaign, const RulesConfig& rules, TickConfig config = {});

    /** Run one full day and advance the calendar. */
    void run_day();

    /** Run `days` consecutive days. */
    void run_days(int days, ProgressCallback progress = nullptr);

    /**
     * Run a single day-part of the current day: messages, ships and due
     * orders. Does not touch the calendar.
     */
    void run_part(DayPart part);

    Campaign& campaign() { return campaign_; }

private:
    Campaign& campaign_;
    const RulesConfig& rules_;
    TickConfig config_;
    std::mutex mutex_;

    void start_of_day();
    void execute_part(DayPart part);
    void consume_supplies();
    void pay_mercenaries();
    void advance_sieges();
    void end_of_day();
};

} // namespace strat::orders

#endif // STRAT_ORDERS_TICK_DRIVER_HPP
