#include "core/campaign.hpp"
#include <algorithm>
#include <cctype>

namespace strat {

namespace {

template <typename Map, typename Key>
auto* lookup(Map& m, const Key& key) {
    auto it = m.find(key);
    return it == m.end() ? nullptr : &it->second;
}

// Largest key plus one, or 1 for an empty map.
template <typename IdT, typename Map>
IdT next_key(const Map& m) {
    if (m.empty()) return IdT(1);
    return IdT(m.rbegin()->first.value + 1);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

bool has_trait(const std::vector<Trait>& traits, const std::string& trait_name) {
    const std::string wanted = lowercase(trait_name);
    for (const auto& t : traits) {
        if (lowercase(t.name) == wanted) return true;
    }
    return false;
}

// ── CampaignMap ──

Hex* CampaignMap::get_hex(HexId id) { return lookup(hexes, id); }
const Hex* CampaignMap::get_hex(HexId id) const { return lookup(hexes, id); }

Hex* CampaignMap::hex_at(int q, int r) {
    for (auto& [id, hex] : hexes) {
        if (hex.q == q && hex.r == r) return &hex;
    }
    return nullptr;
}

// ── Army ──

int Army::total_soldiers() const {
    int total = 0;
    for (const auto& det : detachments) total += det.soldiers;
    return total;
}

int Army::total_wagons() const {
    int total = 0;
    for (const auto& det : detachments) total += det.wagons;
    return total;
}

// ── Campaign lookups ──

Army* Campaign::get_army(ArmyId id) { return lookup(armies, id); }
const Army* Campaign::get_army(ArmyId id) const { return lookup(armies, id); }
Commander* Campaign::get_commander(CommanderId id) { return lookup(commanders, id); }
const Commander* Campaign::get_commander(CommanderId id) const { return lookup(commanders, id); }
Faction* Campaign::get_faction(FactionId id) { return lookup(factions, id); }
Stronghold* Campaign::get_stronghold(StrongholdId id) { return lookup(strongholds, id); }
Ship* Campaign::get_ship(ShipId id) { return lookup(ships, id); }
Siege* Campaign::get_siege(SiegeId id) { return lookup(sieges, id); }
Order* Campaign::get_order(OrderId id) { return lookup(orders, id); }
Operation* Campaign::get_operation(OperationId id) { return lookup(operations, id); }
RecruitmentProject* Campaign::get_recruitment(RecruitmentId id) { return lookup(recruitments, id); }
const UnitType* Campaign::get_unit_type(UnitTypeId id) const { return lookup(unit_types, id); }

std::optional<FactionId> Campaign::army_faction(const Army& army) const {
    const Commander* commander = get_commander(army.commander_id);
    if (!commander) return std::nullopt;
    return commander->faction_id;
}

Siege* Campaign::find_siege_by_stronghold(StrongholdId id) {
    for (auto& [siege_id, siege] : sieges) {
        if (siege.stronghold_id == id) return &siege;
    }
    return nullptr;
}

Army* Campaign::find_army_by_detachment(DetachmentId id) {
    for (auto& [army_id, army] : armies) {
        for (const auto& det : army.detachments) {
            if (det.id == id) return &army;
        }
    }
    return nullptr;
}

ArmyId Campaign::next_army_id() const { return next_key<ArmyId>(armies); }
SiegeId Campaign::next_siege_id() const { return next_key<SiegeId>(sieges); }
MessageId Campaign::next_message_id() const { return next_key<MessageId>(messages); }
OperationId Campaign::next_operation_id() const { return next_key<OperationId>(operations); }
RecruitmentId Campaign::next_recruitment_id() const { return next_key<RecruitmentId>(recruitments); }
FactionId Campaign::next_faction_id() const { return next_key<FactionId>(factions); }
CommanderId Campaign::next_commander_id() const { return next_key<CommanderId>(commanders); }

DetachmentId Campaign::next_detachment_id() const {
    int64_t max_id = 0;
    for (const auto& [army_id, army] : armies) {
        for (const auto& det : army.detachments) {
            max_id = std::max(max_id, det.id.value);
        }
    }
    return DetachmentId(max_id + 1);
}

} // namespace strat
