/**
 * Campaign report: JSON snapshot of a campaign after a run.
 *
 * {
 *   "campaign_id", "name", "current_day", "current_part", "season",
 *   "armies":      [{id, commander_id, hex_id, status, morale, supplies, ...}],
 *   "strongholds": [{id, controlling_faction_id, gates_open, garrison_army_id, ...}],
 *   "sieges":      [{id, stronghold_id, status, weeks_elapsed, current_threshold}],
 *   "ships", "messages", "operations", "recruitments",
 *   "orders":      [{id, order_type, status, execute_day, result}],
 *   "event_log":   [ ... ]
 * }
 */

#ifndef STRAT_IO_REPORT_WRITER_HPP
#define STRAT_IO_REPORT_WRITER_HPP

#include "core/campaign.hpp"
#include <ostream>

namespace strat {

void write_campaign_report(const Campaign& campaign, std::ostream& os);

} // namespace strat

#endif // STRAT_IO_REPORT_WRITER_HPP
