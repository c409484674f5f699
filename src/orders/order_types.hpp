/**
 * Order kinds and their typed payloads.
 *
 * Orders arrive with a wire tag ("move", "assault", ...) and a loosely
 * typed JsonValue parameter object. The dispatcher resolves the tag to an
 * OrderKind and parses the parameters into exactly one payload struct of
 * the OrderPayload variant before any handler runs.
 */

#ifndef STRAT_ORDERS_ORDER_TYPES_HPP
#define STRAT_ORDERS_ORDER_TYPES_HPP

#include "core/enums.hpp"
#include "core/ids.hpp"
#include "io/json_reader.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strat::orders {

enum class OrderKind {
    MOVE,
    REST,
    FORAGE,
    TORCH,
    SUPPLY_TRANSFER,
    BESIEGE,
    ASSAULT,
    EMBARK,
    DISEMBARK,
    NAVAL_MOVE,
    SEND_MESSAGE,
    LAUNCH_OPERATION,
    RAISE_ARMY,
    HARRY
};

inline const char* order_kind_to_string(OrderKind kind) {
    switch (kind) {
        case OrderKind::MOVE:             return "move";
        case OrderKind::REST:             return "rest";
        case OrderKind::FORAGE:           return "forage";
        case OrderKind::TORCH:            return "torch";
        case OrderKind::SUPPLY_TRANSFER:  return "supply_transfer";
        case OrderKind::BESIEGE:          return "besiege";
        case OrderKind::ASSAULT:          return "assault";
        case OrderKind::EMBARK:           return "embark";
        case OrderKind::DISEMBARK:        return "disembark";
        case OrderKind::NAVAL_MOVE:       return "naval_move";
        case OrderKind::SEND_MESSAGE:     return "send_message";
        case OrderKind::LAUNCH_OPERATION: return "launch_operation";
        case OrderKind::RAISE_ARMY:       return "raise_army";
        case OrderKind::HARRY:            return "harry";
    }
    return "unknown";
}

/** nullopt for tags no handler understands. */
inline std::optional<OrderKind> parse_order_kind(const std::string& tag) {
    static const OrderKind kAll[] = {
        OrderKind::MOVE, OrderKind::REST, OrderKind::FORAGE, OrderKind::TORCH,
        OrderKind::SUPPLY_TRANSFER, OrderKind::BESIEGE, OrderKind::ASSAULT,
        OrderKind::EMBARK, OrderKind::DISEMBARK, OrderKind::NAVAL_MOVE,
        OrderKind::SEND_MESSAGE, OrderKind::LAUNCH_OPERATION, OrderKind::RAISE_ARMY,
        OrderKind::HARRY
    };
    for (OrderKind kind : kAll) {
        if (tag == order_kind_to_string(kind)) return kind;
    }
    return std::nullopt;
}

/** Kinds that act through an army and fail without one. */
inline bool requires_army(OrderKind kind) {
    switch (kind) {
        case OrderKind::NAVAL_MOVE:
        case OrderKind::SEND_MESSAGE:
        case OrderKind::LAUNCH_OPERATION:
        case OrderKind::RAISE_ARMY:
            return false;
        default:
            return true;
    }
}

// ═══════════════════════════════════════════════════════════════
// Payloads
// ═══════════════════════════════════════════════════════════════

struct MoveLeg {
    HexId to_hex_id;
    double distance_miles = 0.0;
    bool on_road = true;
    bool has_river_ford = false;
    bool is_night = false;
    bool has_fork = false;
    std::optional<HexId> alternate_hex_id;
};

struct MovePayload {
    MovementType movement_type = MovementType::STANDARD;
    std::vector<MoveLeg> legs;
    int weather_modifier = 0;
};

struct RestPayload {
    int duration_days = 1;
};

struct ForagePayload {
    std::vector<HexId> hex_ids;
};

struct TorchPayload {
    std::vector<HexId> hex_ids;
};

struct SupplyTransferPayload {
    ArmyId target_army_id;
    int amount = 0;
};

struct BesiegePayload {
    StrongholdId stronghold_id;
    int siege_engines = 0;
};

struct AssaultPayload {
    StrongholdId stronghold_id;
    std::optional<int> attacker_fixed_roll;
    std::optional<int> defender_fixed_roll;
    int attacker_modifier = 0;
    int defender_modifier = 0;
    bool pillage = false;
};

struct EmbarkPayload {
    ShipId ship_id;
};

struct DisembarkPayload {
    ShipId ship_id;
};

struct NavalMovePayload {
    ShipId ship_id;
    std::vector<HexId> route;
};

struct SendMessagePayload {
    CommanderId recipient_id;
    std::string content;
    std::string territory_type = "friendly";
};

struct LaunchOperationPayload {
    std::optional<OperationId> operation_id;
    OperationType operation_type = OperationType::INTELLIGENCE;
    JsonValue target_descriptor = JsonValue::object();
    std::string territory_type = "friendly";
    int difficulty_modifier = 0;
    std::optional<int> loot_cost;             // rules default when absent
    std::string complexity = "standard";
};

struct RaiseArmyPayload {
    StrongholdId stronghold_id;
    CommanderId new_commander_id;
    UnitTypeId infantry_unit_type_id;
    std::optional<UnitTypeId> cavalry_unit_type_id;
    std::optional<HexId> rally_hex_id;        // stronghold hex when absent
    std::optional<std::string> army_name;     // commander name when absent
};

struct HarryPayload {
    std::vector<DetachmentId> detachment_ids;
    ArmyId target_army_id;
    std::string objective = "kill";
};

using OrderPayload = std::variant<
    MovePayload,
    RestPayload,
    ForagePayload,
    TorchPayload,
    SupplyTransferPayload,
    BesiegePayload,
    AssaultPayload,
    EmbarkPayload,
    DisembarkPayload,
    NavalMovePayload,
    SendMessagePayload,
    LaunchOperationPayload,
    RaiseArmyPayload,
    HarryPayload>;

} // namespace strat::orders

#endif // STRAT_ORDERS_ORDER_TYPES_HPP
