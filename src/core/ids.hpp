/**
 * Strongly typed integer identifiers for campaign entities.
 *
 * Each entity kind gets its own Id<Tag> so an ArmyId cannot be passed where
 * a StrongholdId is expected. Ids are ordered, which keeps std::map iteration
 * (and therefore every tick) deterministic.
 */

#ifndef STRAT_IDS_HPP
#define STRAT_IDS_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace strat {

template <typename Tag>
struct Id {
    int64_t value = 0;

    constexpr Id() = default;
    constexpr explicit Id(int64_t v) : value(v) {}

    constexpr bool operator==(const Id& o) const { return value == o.value; }
    constexpr bool operator!=(const Id& o) const { return value != o.value; }
    constexpr bool operator<(const Id& o) const { return value < o.value; }
    constexpr bool operator>(const Id& o) const { return value > o.value; }
};

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const Id<Tag>& id) {
    return os << id.value;
}

template <typename Tag>
std::string to_string(const Id<Tag>& id) {
    return std::to_string(id.value);
}

struct CampaignTag;
struct HexTag;
struct FactionTag;
struct StrongholdTag;
struct CommanderTag;
struct ArmyTag;
struct DetachmentTag;
struct UnitTypeTag;
struct OrderTag;
struct MessageTag;
struct SiegeTag;
struct ShipTag;
struct OperationTag;
struct RecruitmentTag;
struct MercenaryContractTag;

using CampaignId    = Id<CampaignTag>;
using HexId         = Id<HexTag>;
using FactionId     = Id<FactionTag>;
using StrongholdId  = Id<StrongholdTag>;
using CommanderId   = Id<CommanderTag>;
using ArmyId        = Id<ArmyTag>;
using DetachmentId  = Id<DetachmentTag>;
using UnitTypeId    = Id<UnitTypeTag>;
using OrderId       = Id<OrderTag>;
using MessageId     = Id<MessageTag>;
using SiegeId       = Id<SiegeTag>;
using ShipId        = Id<ShipTag>;
using OperationId   = Id<OperationTag>;
using RecruitmentId = Id<RecruitmentTag>;
using MercenaryContractId = Id<MercenaryContractTag>;

} // namespace strat

#endif // STRAT_IDS_HPP
