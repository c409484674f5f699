/**
 * Messaging: Courier dispatch and delivery.
 *
 * Travel time is max(1, hexes * 6 / speed) days, speed by territory
 * (friendly 48, neutral 42, hostile 36 miles/day). On arrival the courier
 * rolls for delivery: 19 in 20 through friendly or neutral country, 5 in 6
 * through hostile country. Failed messages are marked "failed" with
 * failure_reason "intercepted".
 */

#ifndef STRAT_RULES_MESSAGING_HPP
#define STRAT_RULES_MESSAGING_HPP

#include "core/campaign.hpp"
#include "core/rules_config.hpp"
#include "rules/naval.hpp"
#include <optional>
#include <string>
#include <vector>

namespace strat::rules {

struct MessageDispatchResult {
    bool success = false;
    std::string detail;
    std::optional<MessageId> message_id;
};

/**
 * Compute travel time and store the message in the campaign.
 * Endpoints default to the sender's and recipient's current hexes.
 */
MessageDispatchResult dispatch_message(Campaign& campaign, Message message,
                                       const RulesConfig& rules,
                                       std::optional<HexId> from_hex = std::nullopt,
                                       std::optional<HexId> to_hex = std::nullopt);

/** Count down in-transit messages and roll delivery for arrivals. */
void advance_messages(Campaign& campaign, const RulesConfig& rules,
                      double day_fraction = 1.0 / kDayPartsPerDay);

std::vector<const Message*> pending_messages_for_commander(const Campaign& campaign,
                                                           CommanderId commander_id);

} // namespace strat::rules

#endif // STRAT_RULES_MESSAGING_HPP
