#include "rules/messaging.hpp"
#include "core/hex_math.hpp"
#include "rng/campaign_seed.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace strat::rules {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/** Miles per day through the territory, 0 if the territory is unknown. */
int courier_speed(const std::string& territory, const RulesConfig& rules) {
    if (territory == "friendly") return rules.messaging.friendly_miles_per_day;
    if (territory == "neutral")  return rules.messaging.neutral_miles_per_day;
    if (territory == "hostile")  return rules.messaging.hostile_miles_per_day;
    return 0;
}

} // anonymous namespace

MessageDispatchResult dispatch_message(Campaign& campaign, Message message,
                                       const RulesConfig& rules,
                                       std::optional<HexId> from_hex,
                                       std::optional<HexId> to_hex) {
    const std::string territory = lowercase(message.territory_type);
    const int speed = courier_speed(territory, rules);
    if (speed <= 0) return {false, "unknown territory: " + territory, std::nullopt};

    if (!from_hex) {
        if (const Commander* sender = campaign.get_commander(message.sender_id)) {
            from_hex = sender->current_hex_id;
        }
    }
    if (!to_hex) {
        if (const Commander* recipient = campaign.get_commander(message.recipient_id)) {
            to_hex = recipient->current_hex_id;
        }
    }
    if (!from_hex || !to_hex) {
        return {false, "sender or recipient location unknown", std::nullopt};
    }

    const Hex* origin = campaign.map.get_hex(*from_hex);
    const Hex* destination = campaign.map.get_hex(*to_hex);
    if (!origin || !destination) {
        return {false, "origin or destination hex missing", std::nullopt};
    }

    int hexes = std::max(1, hex_distance({origin->q, origin->r},
                                         {destination->q, destination->r}));
    double travel_days = std::max(1.0, static_cast<double>(hexes * kHexMiles) / speed);

    message.territory_type = territory;
    message.travel_time_days = travel_days;
    message.days_remaining = travel_days;
    message.status = "in_transit";
    const MessageId id = message.id;
    campaign.messages[id] = std::move(message);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "message dispatched: %.2f days", travel_days);
    return {true, buf, id};
}

void advance_messages(Campaign& campaign, const RulesConfig& rules, double day_fraction) {
    const auto& mr = rules.messaging;
    for (auto& [id, message] : campaign.messages) {
        if (message.status != "in_transit") continue;

        message.days_remaining = std::max(0.0, message.days_remaining - day_fraction);
        if (message.days_remaining > 0.0) continue;

        const bool hostile = lowercase(message.territory_type) == "hostile";
        const int numerator = hostile ? mr.hostile_success_numerator
                                      : mr.friendly_success_numerator;
        const int denominator = hostile ? mr.hostile_success_denominator
                                        : mr.friendly_success_denominator;

        int roll = rng::roll_dice(rng::campaign_seed(campaign, "message:" + to_string(id)),
                                  "1d" + std::to_string(std::max(2, denominator)))
                       .total;
        if (roll <= numerator) {
            message.status = "delivered";
            message.delivered_on_day = campaign.current_day;
            message.failure_reason.clear();
        } else {
            message.status = "failed";
            message.failure_reason = "intercepted";
        }
    }
}

std::vector<const Message*> pending_messages_for_commander(const Campaign& campaign,
                                                           CommanderId commander_id) {
    std::vector<const Message*> out;
    for (const auto& [id, message] : campaign.messages) {
        if (message.recipient_id == commander_id && message.status == "in_transit") {
            out.push_back(&message);
        }
    }
    return out;
}

} // namespace strat::rules
