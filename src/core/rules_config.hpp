/**
 * RulesConfig: Tunable constants for every rules subsystem.
 *
 * Defaults live here; a scenario's "rules" block or a --rules file can
 * override individual fields (see io/rules_loader.hpp).
 */

#ifndef STRAT_RULES_CONFIG_HPP
#define STRAT_RULES_CONFIG_HPP

namespace strat {

struct SupplyRules {
    int infantry_capacity = 15;
    int noncombatant_capacity = 15;
    int cavalry_capacity = 75;
    int wagon_capacity = 1000;
    int infantry_consumption = 1;
    int noncombatant_consumption = 1;
    int cavalry_consumption = 10;
    int wagon_consumption = 10;
    double base_noncombatant_ratio = 0.25;
    double spartan_ratio = 0.125;
    double exclusive_skirmisher_ratio = 0.10;
    int foraging_multiplier = 500;
    int foraging_limit_per_season = 5;
    int torch_revolt_chance = 1;              // out of 6
    int forage_revolt_chance_repeat = 2;      // out of 6
    int torch_revolt_hostile_modifier = 1;
    int forage_revolt_hostile_modifier = 1;
    int revolt_cooldown_days = 365;
    int wizard_supply_encumbrance = 1000;
};

struct MoraleRules {
    int default_resting = 9;
    int default_max = 12;
    int forced_march_morale_loss_per_week = 1;
    int starvation_morale_loss_per_day = 1;
    int starvation_dissolution_days = 14;
};

struct MovementRules {
    int road_standard_miles_per_day = 12;
    int road_forced_miles_per_day = 18;
    int offroad_standard_miles_per_day = 6;
    int offroad_forced_miles_per_day = 9;
    int night_miles_per_day = 6;
    int cavalry_forced_multiplier = 2;
    double column_length_threshold = 6.0;
    int column_capped_standard_speed = 6;
    int column_capped_forced_speed = 12;
    int night_wrong_path_chance = 2;          // out of 6
};

struct VisibilityRules {
    int base_radius = 1;
    int cavalry_bonus = 1;
    int outrider_bonus = 1;
    int bad_weather_penalty = 1;
    int very_bad_weather_penalty = 2;
};

struct RevoltOutcomeRules {
    int infantry_die_size = 20;
    int infantry_multiplier = 500;
};

struct BattleRules {
    int rout_threshold = 2;
    int retreat_hexes_min = 1;
    int retreat_hexes_max = 6;
    int retreat_supply_loss_die = 6;
    int retreat_supply_loss_multiplier = 10;  // percent per pip
    int capture_chance_minor = 1;             // out of 6, roll diff 4-5
    int capture_chance_major = 2;             // out of 6, roll diff 6+
    double multi_side_numeric_bonus_ratio = 0.1;
};

struct SiegeRules {
    int town_threshold = 10;
    int city_threshold = 15;
    int fortress_threshold = 20;
    int default_modifier = -1;                // per week
    int disease_modifier = -1;
    int resupply_modifier = 2;
    int attacked_modifier = 1;
    int siege_engine_reduction_per_detachment = 1;
    int starvation_threshold = 0;
};

struct NavalRules {
    int friendly_miles_per_day = 48;
    int hostile_miles_per_day = 36;
    int riverine_miles_per_day = 36;
    int embark_days = 1;
    int disembark_days = 1;
};

struct MessagingRules {
    int friendly_success_numerator = 19;
    int friendly_success_denominator = 20;
    int hostile_success_numerator = 5;
    int hostile_success_denominator = 6;
    int friendly_miles_per_day = 48;
    int hostile_miles_per_day = 36;
    int neutral_miles_per_day = 42;
};

struct RecruitmentRules {
    int muster_duration_days = 30;
    int recruitment_cooldown_days = 365;
    int revolt_chance = 1;                    // out of 6
    int recently_conquered_days = 90;
};

struct MercenaryRules {
    int infantry_upkeep_per_day = 1;          // loot per soldier
    int cavalry_upkeep_per_day = 3;
    int grace_days_without_pay = 3;
    int morale_penalty_unpaid = 1;
    int desertion_chance_numerator = 1;
    int desertion_chance_denominator = 6;
};

struct OperationsRules {
    int base_success_target = 7;
    int simple_modifier = 2;
    int complex_modifier = -2;
    int hostile_territory_modifier = -1;
    int loot_cost_default = 100;
};

struct RulesConfig {
    SupplyRules supply;
    MoraleRules morale;
    MovementRules movement;
    VisibilityRules visibility;
    RevoltOutcomeRules revolt_outcome;
    BattleRules battle;
    SiegeRules siege;
    NavalRules naval;
    MessagingRules messaging;
    RecruitmentRules recruitment;
    MercenaryRules mercenaries;
    OperationsRules operations;
};

} // namespace strat

#endif // STRAT_RULES_CONFIG_HPP
