#include "io/rules_loader.hpp"
#include <stdexcept>

namespace strat {

namespace {

void read(const JsonValue& section, const char* key, int& field) {
    const auto& v = section[key];
    if (v.is_number()) field = v.as_int();
}

void read(const JsonValue& section, const char* key, double& field) {
    const auto& v = section[key];
    if (v.is_number()) field = v.as_number();
}

void apply_supply(const JsonValue& s, SupplyRules& r) {
    read(s, "infantry_capacity", r.infantry_capacity);
    read(s, "noncombatant_capacity", r.noncombatant_capacity);
    read(s, "cavalry_capacity", r.cavalry_capacity);
    read(s, "wagon_capacity", r.wagon_capacity);
    read(s, "infantry_consumption", r.infantry_consumption);
    read(s, "noncombatant_consumption", r.noncombatant_consumption);
    read(s, "cavalry_consumption", r.cavalry_consumption);
    read(s, "wagon_consumption", r.wagon_consumption);
    read(s, "base_noncombatant_ratio", r.base_noncombatant_ratio);
    read(s, "spartan_ratio", r.spartan_ratio);
    read(s, "exclusive_skirmisher_ratio", r.exclusive_skirmisher_ratio);
    read(s, "foraging_multiplier", r.foraging_multiplier);
    read(s, "foraging_limit_per_season", r.foraging_limit_per_season);
    read(s, "torch_revolt_chance", r.torch_revolt_chance);
    read(s, "forage_revolt_chance_repeat", r.forage_revolt_chance_repeat);
    read(s, "torch_revolt_hostile_modifier", r.torch_revolt_hostile_modifier);
    read(s, "forage_revolt_hostile_modifier", r.forage_revolt_hostile_modifier);
    read(s, "revolt_cooldown_days", r.revolt_cooldown_days);
    read(s, "wizard_supply_encumbrance", r.wizard_supply_encumbrance);
}

void apply_morale(const JsonValue& s, MoraleRules& r) {
    read(s, "default_resting", r.default_resting);
    read(s, "default_max", r.default_max);
    read(s, "forced_march_morale_loss_per_week", r.forced_march_morale_loss_per_week);
    read(s, "starvation_morale_loss_per_day", r.starvation_morale_loss_per_day);
    read(s, "starvation_dissolution_days", r.starvation_dissolution_days);
}

void apply_movement(const JsonValue& s, MovementRules& r) {
    read(s, "road_standard_miles_per_day", r.road_standard_miles_per_day);
    read(s, "road_forced_miles_per_day", r.road_forced_miles_per_day);
    read(s, "offroad_standard_miles_per_day", r.offroad_standard_miles_per_day);
    read(s, "offroad_forced_miles_per_day", r.offroad_forced_miles_per_day);
    read(s, "night_miles_per_day", r.night_miles_per_day);
    read(s, "cavalry_forced_multiplier", r.cavalry_forced_multiplier);
    read(s, "column_length_threshold", r.column_length_threshold);
    read(s, "column_capped_standard_speed", r.column_capped_standard_speed);
    read(s, "column_capped_forced_speed", r.column_capped_forced_speed);
    read(s, "night_wrong_path_chance", r.night_wrong_path_chance);
}

void apply_visibility(const JsonValue& s, VisibilityRules& r) {
    read(s, "base_radius", r.base_radius);
    read(s, "cavalry_bonus", r.cavalry_bonus);
    read(s, "outrider_bonus", r.outrider_bonus);
    read(s, "bad_weather_penalty", r.bad_weather_penalty);
    read(s, "very_bad_weather_penalty", r.very_bad_weather_penalty);
}

void apply_revolt_outcome(const JsonValue& s, RevoltOutcomeRules& r) {
    read(s, "infantry_die_size", r.infantry_die_size);
    read(s, "infantry_multiplier", r.infantry_multiplier);
}

void apply_battle(const JsonValue& s, BattleRules& r) {
    read(s, "rout_threshold", r.rout_threshold);
    read(s, "retreat_hexes_min", r.retreat_hexes_min);
    read(s, "retreat_hexes_max", r.retreat_hexes_max);
    read(s, "retreat_supply_loss_die", r.retreat_supply_loss_die);
    read(s, "retreat_supply_loss_multiplier", r.retreat_supply_loss_multiplier);
    read(s, "capture_chance_minor", r.capture_chance_minor);
    read(s, "capture_chance_major", r.capture_chance_major);
    read(s, "multi_side_numeric_bonus_ratio", r.multi_side_numeric_bonus_ratio);
}

void apply_siege(const JsonValue& s, SiegeRules& r) {
    read(s, "town_threshold", r.town_threshold);
    read(s, "city_threshold", r.city_threshold);
    read(s, "fortress_threshold", r.fortress_threshold);
    read(s, "default_modifier", r.default_modifier);
    read(s, "disease_modifier", r.disease_modifier);
    read(s, "resupply_modifier", r.resupply_modifier);
    read(s, "attacked_modifier", r.attacked_modifier);
    read(s, "siege_engine_reduction_per_detachment", r.siege_engine_reduction_per_detachment);
    read(s, "starvation_threshold", r.starvation_threshold);
}

void apply_naval(const JsonValue& s, NavalRules& r) {
    read(s, "friendly_miles_per_day", r.friendly_miles_per_day);
    read(s, "hostile_miles_per_day", r.hostile_miles_per_day);
    read(s, "riverine_miles_per_day", r.riverine_miles_per_day);
    read(s, "embark_days", r.embark_days);
    read(s, "disembark_days", r.disembark_days);
}

void apply_messaging(const JsonValue& s, MessagingRules& r) {
    read(s, "friendly_success_numerator", r.friendly_success_numerator);
    read(s, "friendly_success_denominator", r.friendly_success_denominator);
    read(s, "hostile_success_numerator", r.hostile_success_numerator);
    read(s, "hostile_success_denominator", r.hostile_success_denominator);
    read(s, "friendly_miles_per_day", r.friendly_miles_per_day);
    read(s, "hostile_miles_per_day", r.hostile_miles_per_day);
    read(s, "neutral_miles_per_day", r.neutral_miles_per_day);
}

void apply_recruitment(const JsonValue& s, RecruitmentRules& r) {
    read(s, "muster_duration_days", r.muster_duration_days);
    read(s, "recruitment_cooldown_days", r.recruitment_cooldown_days);
    read(s, "revolt_chance", r.revolt_chance);
    read(s, "recently_conquered_days", r.recently_conquered_days);
}

void apply_mercenaries(const JsonValue& s, MercenaryRules& r) {
    read(s, "infantry_upkeep_per_day", r.infantry_upkeep_per_day);
    read(s, "cavalry_upkeep_per_day", r.cavalry_upkeep_per_day);
    read(s, "grace_days_without_pay", r.grace_days_without_pay);
    read(s, "morale_penalty_unpaid", r.morale_penalty_unpaid);
    read(s, "desertion_chance_numerator", r.desertion_chance_numerator);
    read(s, "desertion_chance_denominator", r.desertion_chance_denominator);
}

void apply_operations(const JsonValue& s, OperationsRules& r) {
    read(s, "base_success_target", r.base_success_target);
    read(s, "simple_modifier", r.simple_modifier);
    read(s, "complex_modifier", r.complex_modifier);
    read(s, "hostile_territory_modifier", r.hostile_territory_modifier);
    read(s, "loot_cost_default", r.loot_cost_default);
}

} // anonymous namespace

void load_rules_overrides(const JsonValue& overrides, RulesConfig& rules) {
    if (!overrides.is_object()) return;

    apply_supply(overrides["supply"], rules.supply);
    apply_morale(overrides["morale"], rules.morale);
    apply_movement(overrides["movement"], rules.movement);
    apply_visibility(overrides["visibility"], rules.visibility);
    apply_revolt_outcome(overrides["revolt_outcome"], rules.revolt_outcome);
    apply_battle(overrides["battle"], rules.battle);
    apply_siege(overrides["siege"], rules.siege);
    apply_naval(overrides["naval"], rules.naval);
    apply_messaging(overrides["messaging"], rules.messaging);
    apply_recruitment(overrides["recruitment"], rules.recruitment);
    apply_mercenaries(overrides["mercenaries"], rules.mercenaries);
    apply_operations(overrides["operations"], rules.operations);
}

void load_rules_file(const std::string& path, RulesConfig& rules) {
    JsonValue root = JsonReader::parse_file(path);
    if (!root.is_object()) throw std::runtime_error("rules file is not a JSON object: " + path);
    // A full scenario file carries its overrides under "rules".
    load_rules_overrides(root.has("rules") ? root["rules"] : root, rules);
}

} // namespace strat
