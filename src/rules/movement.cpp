#include "rules/movement.hpp"
#include "rng/dice.hpp"
#include "rules/supply.hpp"
#include <algorithm>

namespace strat::rules {

double calculate_daily_movement_miles(const UnitTypeMap& unit_types, const Army& army,
                                      MovementType movement_type,
                                      const MovementOptions& options,
                                      const RulesConfig& rules) {
    const auto& mv = rules.movement;

    int base = 0;
    switch (movement_type) {
        case MovementType::STANDARD:
            base = options.on_road ? mv.road_standard_miles_per_day
                                   : mv.offroad_standard_miles_per_day;
            break;
        case MovementType::FORCED:
            base = options.on_road ? mv.road_forced_miles_per_day
                                   : mv.offroad_forced_miles_per_day;
            break;
        case MovementType::NIGHT:
            base = options.on_road ? mv.night_miles_per_day : 0;
            break;
    }

    bool cavalry_only = !army.detachments.empty();
    for (const auto& det : army.detachments) {
        if (unit_category(unit_types, det.unit_type_id) != "cavalry") {
            cavalry_only = false;
            break;
        }
    }
    if (movement_type == MovementType::FORCED && cavalry_only) {
        base *= mv.cavalry_forced_multiplier;
    }

    if (!has_trait(options.traits, "ranger")) {
        base += options.weather_modifier;
    }
    base = std::max(0, base);

    double column = column_length_miles(unit_types, army, options.traits, rules);
    if (column > mv.column_length_threshold) {
        if (movement_type == MovementType::STANDARD) {
            return std::min(base, mv.column_capped_standard_speed);
        }
        if (movement_type == MovementType::FORCED) {
            return std::min(base, mv.column_capped_forced_speed);
        }
    }
    return base;
}

MovementValidation validate_movement_order(const UnitTypeMap& unit_types, const Army& army,
                                           const std::vector<bool>& off_road_legs,
                                           const std::vector<bool>& has_river_fords,
                                           bool is_night) {
    const bool any_off_road = std::find(off_road_legs.begin(), off_road_legs.end(), true) !=
                              off_road_legs.end();
    const bool any_ford = std::find(has_river_fords.begin(), has_river_fords.end(), true) !=
                          has_river_fords.end();
    const int wagons = army.total_wagons();

    if (any_off_road && wagons > 0) return {false, "Cannot travel off-road with wagons"};
    if (is_night && any_off_road)   return {false, "Cannot night march off-road"};
    if (any_ford && wagons > 0)     return {false, "Cannot ford rivers with wagons"};

    if (any_off_road) {
        for (const auto& det : army.detachments) {
            auto it = unit_types.find(det.unit_type_id);
            if (it != unit_types.end() && !it->second.can_travel_offroad) {
                return {false, "Cannot travel off-road with " + it->second.name};
            }
        }
    }
    return {true, ""};
}

bool should_take_wrong_fork(const std::string& seed, const RulesConfig& rules) {
    double probability = std::clamp(rules.movement.night_wrong_path_chance / 6.0, 0.0, 1.0);
    return rng::check_success(seed, probability, "1d6").success;
}

} // namespace strat::rules
