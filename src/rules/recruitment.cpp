#include "rules/recruitment.hpp"
#include "core/hex_math.hpp"
#include "rng/campaign_seed.hpp"
#include "rules/supply.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace strat::rules {

namespace {

constexpr double kCavalryShare = 0.25;
constexpr double kWagonShare = 0.05;
constexpr int kStartingSupplyDays = 14;
constexpr int kMinimumRevoltInfantry = 500;

int stronghold_priority(StrongholdType type) {
    switch (type) {
        case StrongholdType::FORTRESS: return 3;
        case StrongholdType::CITY:     return 2;
        case StrongholdType::TOWN:     return 1;
    }
    return 0;
}

// Halves round to even.
int round_to_nearest_hundred(double value) {
    return static_cast<int>(std::nearbyint(value / 100.0) * 100.0);
}

UnitTypeId default_infantry_type(const Campaign& campaign) {
    for (const auto& [id, unit] : campaign.unit_types) {
        if (unit.category == "infantry") return id;
    }
    if (!campaign.unit_types.empty()) return campaign.unit_types.begin()->first;
    return UnitTypeId(1);
}

void provision_new_army(const Campaign& campaign, Army& army, const RulesConfig& rules) {
    SupplySnapshot snapshot = build_supply_snapshot(campaign, army, rules);
    army.supplies_capacity = snapshot.capacity;
    army.daily_supply_consumption = snapshot.consumption;
    army.column_length_miles = snapshot.column_length_miles;
    army.supplies_current = snapshot.consumption * kStartingSupplyDays;
}

bool should_revolt(const Campaign& campaign, const Hex& hex, const RulesConfig& rules) {
    if (!hex.last_recruited_day) return false;
    const auto& rr = rules.recruitment;
    if (campaign.current_day - *hex.last_recruited_day > rr.recruitment_cooldown_days) {
        return false;
    }

    int chance = rr.revolt_chance;
    if (hex.last_control_change_day &&
        campaign.current_day - *hex.last_control_change_day <= rr.recently_conquered_days) {
        chance = std::min(6, chance * 2);
    }
    if (chance <= 0) return false;

    auto roll = rng::roll_dice(rng::campaign_seed(campaign, "recruit-revolt:" + to_string(hex.id)),
                               "1d6");
    return roll.total <= chance;
}

ArmyId spawn_revolt(Campaign& campaign, const Hex& hex, const RulesConfig& rules) {
    Faction faction;
    faction.id = campaign.next_faction_id();
    faction.name = "Rebels of Hex " + to_string(hex.id);
    faction.color = "#777777";
    campaign.factions[faction.id] = faction;

    Commander leader;
    leader.id = campaign.next_commander_id();
    leader.name = "Rebel Leader " + to_string(leader.id);
    leader.faction_id = faction.id;
    leader.current_hex_id = hex.id;
    campaign.commanders[leader.id] = leader;

    const auto& ro = rules.revolt_outcome;
    int roll = rng::roll_dice(rng::campaign_seed(campaign, "revolt-size:" + to_string(hex.id)),
                              "1d" + std::to_string(std::max(2, ro.infantry_die_size)))
                   .total;
    int infantry = std::max(kMinimumRevoltInfantry, roll * ro.infantry_multiplier);

    Detachment rebels;
    rebels.id = campaign.next_detachment_id();
    rebels.unit_type_id = default_infantry_type(campaign);
    rebels.soldiers = infantry;

    Army army;
    army.id = campaign.next_army_id();
    army.commander_id = leader.id;
    army.current_hex_id = hex.id;
    army.detachments.push_back(rebels);
    army.morale_current = rules.morale.default_resting;
    army.morale_resting = rules.morale.default_resting;
    army.morale_max = rules.morale.default_max;
    army.noncombatant_count = static_cast<int>(infantry * rules.supply.base_noncombatant_ratio);
    army.noncombatant_percentage = rules.supply.base_noncombatant_ratio;
    army.status_effects.set("revolt", true);

    const ArmyId army_id = army.id;
    Army& stored = campaign.armies[army_id] = std::move(army);
    provision_new_army(campaign, stored, rules);
    return army_id;
}

} // anonymous namespace

std::vector<HexId> eligible_recruitment_hexes(const Campaign& campaign,
                                              const Stronghold& stronghold) {
    std::vector<HexId> eligible;
    const Hex* home = campaign.map.get_hex(stronghold.hex_id);
    if (!home) return eligible;

    const HexCoord home_coord{home->q, home->r};
    const int priority = stronghold_priority(stronghold.type);

    for (const auto& [hex_id, hex] : campaign.map.hexes) {
        if (hex.controlling_faction_id != stronghold.controlling_faction_id) continue;
        if (hex.settlement <= 0) continue;

        const HexCoord coord{hex.q, hex.r};
        const int distance = hex_distance(coord, home_coord);

        bool closer_elsewhere = false;
        for (const auto& [other_id, other] : campaign.strongholds) {
            if (other_id == stronghold.id) continue;
            const Hex* other_hex = campaign.map.get_hex(other.hex_id);
            if (!other_hex) continue;

            const int other_distance = hex_distance(coord, {other_hex->q, other_hex->r});
            const int other_priority = stronghold_priority(other.type);
            if (other_distance < distance ||
                (other_distance == distance &&
                 (other_priority > priority ||
                  (other_priority == priority && other_id < stronghold.id)))) {
                closer_elsewhere = true;
                break;
            }
        }
        if (!closer_elsewhere) eligible.push_back(hex_id);
    }
    return eligible;
}

RecruitmentStart start_recruitment(Campaign& campaign, const Stronghold& stronghold,
                                   const Commander& commander, HexId rally_hex_id,
                                   OrderId pending_order_id, const RulesConfig& rules) {
    const std::vector<HexId> hexes = eligible_recruitment_hexes(campaign, stronghold);
    if (hexes.empty()) throw std::invalid_argument("no eligible hexes for recruitment");

    double infantry_raw = 0.0;
    double cavalry_raw = 0.0;
    double wagon_raw = 0.0;
    for (const HexId& id : hexes) {
        const Hex* hex = campaign.map.get_hex(id);
        infantry_raw += hex->settlement;
        if (hex->is_good_country) {
            cavalry_raw += hex->settlement * kCavalryShare;
            wagon_raw += hex->settlement * kWagonShare;
        }
    }
    if (infantry_raw <= 0.0) throw std::invalid_argument("recruitment area has zero settlement");

    const int infantry = round_to_nearest_hundred(infantry_raw);
    if (infantry <= 0) throw std::invalid_argument("recruitment yielded too few infantry");

    const double scale = infantry / infantry_raw;
    const int cavalry = static_cast<int>(std::nearbyint(cavalry_raw * scale));
    const int wagons = static_cast<int>(std::nearbyint(wagon_raw * scale));

    RecruitmentStart start;
    bool revolt_triggered = false;
    for (const HexId& id : hexes) {
        Hex* hex = campaign.map.get_hex(id);
        if (should_revolt(campaign, *hex, rules)) {
            revolt_triggered = true;
            start.revolt_army_ids.push_back(spawn_revolt(campaign, *hex, rules));
        }
        hex->last_recruited_day = campaign.current_day;
    }

    RecruitmentProject project;
    project.id = campaign.next_recruitment_id();
    project.stronghold_id = stronghold.id;
    project.faction_id = commander.faction_id;
    project.commander_id = commander.id;
    project.rally_hex_id = rally_hex_id;
    project.started_on_day = campaign.current_day;
    project.completes_on_day = campaign.current_day + rules.recruitment.muster_duration_days;
    project.infantry = infantry;
    project.cavalry = cavalry;
    project.wagons = wagons;
    project.noncombatants = static_cast<int>(infantry * rules.supply.base_noncombatant_ratio);
    project.source_hex_ids = hexes;
    project.pending_order_id = pending_order_id;
    project.revolt_triggered = revolt_triggered;

    start.project_id = project.id;
    start.detail = "recruitment underway; infantry=" + std::to_string(infantry) +
                   ", cavalry=" + std::to_string(cavalry) +
                   ", wagons=" + std::to_string(wagons) +
                   ", completes day " + std::to_string(project.completes_on_day);
    campaign.recruitments[project.id] = std::move(project);
    return start;
}

RecruitmentCompletion complete_recruitment(Campaign& campaign, RecruitmentId project_id,
                                           const RecruitmentCompletionOptions& options,
                                           const RulesConfig& rules) {
    const RecruitmentProject* project = campaign.get_recruitment(project_id);
    if (!project) throw std::invalid_argument("recruitment project not found");

    Commander* commander = campaign.get_commander(project->commander_id);
    if (!commander) throw std::invalid_argument("assigned commander not found");
    if (!campaign.map.get_hex(project->rally_hex_id)) {
        throw std::invalid_argument("rally hex not found");
    }

    Detachment infantry;
    infantry.id = campaign.next_detachment_id();
    infantry.unit_type_id = options.infantry_type_id;
    infantry.soldiers = project->infantry;
    infantry.wagons = project->wagons;
    infantry.name = options.army_name + " Infantry";

    Army army;
    army.id = campaign.next_army_id();
    army.commander_id = commander->id;
    army.current_hex_id = project->rally_hex_id;
    army.detachments.push_back(infantry);
    if (project->cavalry > 0 && options.cavalry_type_id) {
        Detachment cavalry;
        cavalry.id = DetachmentId(infantry.id.value + 1);
        cavalry.unit_type_id = *options.cavalry_type_id;
        cavalry.soldiers = project->cavalry;
        cavalry.name = options.army_name + " Cavalry";
        army.detachments.push_back(cavalry);
    }
    army.morale_current = rules.morale.default_resting;
    army.morale_resting = rules.morale.default_resting;
    army.morale_max = rules.morale.default_max;
    army.noncombatant_count = project->noncombatants;
    army.noncombatant_percentage = rules.supply.base_noncombatant_ratio;

    RecruitmentCompletion completion;
    completion.army_id = army.id;
    completion.detail = "army " + options.army_name + " raised with " +
                        std::to_string(project->infantry) + " infantry";
    if (project->cavalry) {
        completion.detail += " and " + std::to_string(project->cavalry) + " cavalry";
    }

    commander->current_hex_id = project->rally_hex_id;
    const ArmyId army_id = army.id;
    Army& stored = campaign.armies[army_id] = std::move(army);
    provision_new_army(campaign, stored, rules);

    campaign.recruitments.erase(project_id);
    return completion;
}

} // namespace strat::rules
