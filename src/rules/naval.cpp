#include "rules/naval.hpp"
#include "core/hex_math.hpp"
#include <algorithm>

namespace strat::rules {

NavalActionResult embark_army(Army& army, Ship& ship, const RulesConfig& rules) {
    if (army.embarked_ship_id) return {false, "army already embarked"};
    if (ship.embarked_army_id) return {false, "ship already transporting an army"};
    if (army.current_hex_id != ship.current_hex_id) {
        return {false, "army and ship must share a hex"};
    }
    if (ship.status != NavalStatus::AVAILABLE && ship.status != NavalStatus::TRANSPORTING) {
        return {false, std::string("ship status ") + naval_status_to_string(ship.status) +
                       " disallows embarkation"};
    }

    army.embarked_ship_id = ship.id;
    ship.embarked_army_id = army.id;
    ship.status = NavalStatus::TRANSPORTING;
    ship.travel_days_remaining = std::max(ship.travel_days_remaining,
                                          static_cast<double>(rules.naval.embark_days));
    return {true, "army embarked"};
}

NavalActionResult disembark_army(Army& army, Ship& ship, const RulesConfig& rules) {
    if (army.embarked_ship_id != ship.id || ship.embarked_army_id != army.id) {
        return {false, "army not embarked on specified ship"};
    }
    if (ship.travel_days_remaining > 0.0) return {false, "ship is still en route"};

    army.embarked_ship_id.reset();
    ship.embarked_army_id.reset();
    ship.status = NavalStatus::AVAILABLE;
    ship.travel_days_remaining = rules.naval.disembark_days;
    army.current_hex_id = ship.current_hex_id;
    return {true, "army disembarked"};
}

NavalActionResult set_course(const Campaign& campaign, Ship& ship,
                             const std::vector<HexId>& route, const RulesConfig& rules) {
    if (route.empty()) return {false, "route required"};
    if (ship.embarked_army_id && !campaign.get_army(*ship.embarked_army_id)) {
        return {false, "embarked army missing"};
    }

    int total_miles = 0;
    HexId current = ship.current_hex_id;
    for (const HexId& target : route) {
        const Hex* start = campaign.map.get_hex(current);
        const Hex* end = campaign.map.get_hex(target);
        if (!start || !end) return {false, "route references unknown hex"};
        int hexes = hex_distance({start->q, start->r}, {end->q, end->r});
        total_miles += std::max(1, hexes) * kHexMiles;
        current = target;
    }

    ship.current_route = route;
    ship.travel_days_remaining =
        std::max(0.0, static_cast<double>(total_miles) / rules.naval.friendly_miles_per_day);
    ship.status = ship.embarked_army_id ? NavalStatus::TRANSPORTING : NavalStatus::AVAILABLE;
    return {true, "course set for " + std::to_string(route.size()) + " leg(s)"};
}

void advance_ships(Campaign& campaign, double day_fraction) {
    for (auto& [id, ship] : campaign.ships) {
        ship.travel_days_remaining = std::max(0.0, ship.travel_days_remaining - day_fraction);
        if (ship.current_route.empty() || ship.travel_days_remaining > 0.0) continue;

        const HexId destination = ship.current_route.back();
        ship.current_hex_id = destination;
        ship.current_route.clear();
        ship.status = ship.embarked_army_id ? NavalStatus::TRANSPORTING : NavalStatus::AVAILABLE;

        if (ship.embarked_army_id) {
            if (Army* army = campaign.get_army(*ship.embarked_army_id)) {
                army->current_hex_id = destination;
                army->is_blockaded = false;
            }
        }
    }
}

} // namespace strat::rules
