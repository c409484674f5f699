#include "orders/order_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace strat::orders {

namespace {

std::string trimmed_lower(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(start, end - start + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<double> to_real(const JsonValue& value) {
    if (value.is_number()) return value.as_number();
    if (value.is_string()) {
        const std::string& s = value.as_string();
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        errno = 0;
        double v = std::strtod(s.c_str(), &end);
        if (errno != 0 || *end != '\0') return std::nullopt;
        return v;
    }
    return std::nullopt;
}

int64_t require_integer(const JsonValue& value, const std::string& error) {
    auto v = to_integer(value);
    if (!v) throw PayloadError(error);
    return *v;
}

/** Absent or null gives nullopt; present but not an integer throws. */
std::optional<int64_t> optional_integer(const JsonValue& value, const std::string& error) {
    if (value.is_null()) return std::nullopt;
    return require_integer(value, error);
}

/** Out-of-range values are a PayloadError rather than a silent wrap. */
int narrow_int(int64_t v, const std::string& error) {
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw PayloadError(error);
    }
    return static_cast<int>(v);
}

int integer_or(const JsonValue& value, int def, const std::string& error) {
    auto v = optional_integer(value, error);
    return v ? narrow_int(*v, error) : def;
}

bool flag_or(const JsonValue& value, bool def) {
    return value.is_null() ? def : value.truthy();
}

std::string string_or(const JsonValue& value, const std::string& def) {
    if (value.is_null()) return def;
    if (value.is_string()) return value.as_string();
    if (value.is_integral()) return std::to_string(value.as_int64());
    if (value.is_bool()) return value.as_bool() ? "True" : "False";
    if (value.is_number()) return std::to_string(value.as_number());
    return def;
}

/** Lenient hex list: non-integers are skipped. */
std::vector<HexId> hex_id_list(const JsonValue& values) {
    std::vector<HexId> out;
    if (!values.is_array()) return out;
    for (const auto& v : values.as_array()) {
        if (auto id = to_integer(v)) out.push_back(HexId(*id));
    }
    return out;
}

MovementType parse_movement_type(const JsonValue& value) {
    const std::string name = string_or(value, "standard");
    if (name == "standard") return MovementType::STANDARD;
    if (name == "forced")   return MovementType::FORCED;
    if (name == "night")    return MovementType::NIGHT;
    throw PayloadError("invalid movement type: " + name);
}

// ── Per-kind parsers ──

MovePayload parse_move(const JsonValue& p) {
    const auto& legs = p["legs"];
    if (!legs.is_array() || legs.size() == 0) {
        throw PayloadError("movement order missing legs");
    }

    MovePayload out;
    out.movement_type = parse_movement_type(p["movement_type"]);
    out.weather_modifier = integer_or(p["weather_modifier"], 0,
                                      "weather_modifier must be an int");

    for (const auto& raw : legs.as_array()) {
        MoveLeg leg;
        leg.to_hex_id = HexId(require_integer(raw["to_hex_id"], "movement leg missing to_hex_id"));

        auto distance = raw["distance_miles"].is_null() ? std::optional<double>(0.0)
                                                        : to_real(raw["distance_miles"]);
        if (!distance) throw PayloadError("movement leg requires distance_miles");
        if (*distance <= 0.0) throw PayloadError("movement leg requires positive distance");
        leg.distance_miles = *distance;

        leg.on_road = flag_or(raw["on_road"], true);
        leg.has_river_ford = flag_or(raw["has_river_ford"], false);
        leg.is_night = flag_or(raw["is_night"], false);
        leg.has_fork = flag_or(raw["has_fork"], false);

        const auto& alternate = raw["alternate_hex_id"];
        if (leg.has_fork && alternate.is_null()) {
            throw PayloadError("movement leg with fork requires alternate_hex_id");
        }
        if (auto alt = optional_integer(alternate, "alternate_hex_id must be an int")) {
            leg.alternate_hex_id = HexId(*alt);
        }
        out.legs.push_back(leg);
    }
    return out;
}

RestPayload parse_rest(const JsonValue& p) {
    RestPayload out;
    out.duration_days = integer_or(p["duration_days"], 1, "rest duration must be an int");
    return out;
}

SupplyTransferPayload parse_supply_transfer(const JsonValue& p) {
    const std::string error = "supply transfer requires target_army_id and amount";
    SupplyTransferPayload out;
    out.target_army_id = ArmyId(require_integer(p["target_army_id"], error));
    // Saturates; the handler clamps to what can actually move.
    const int64_t amount = require_integer(p["amount"], error);
    out.amount = static_cast<int>(std::clamp<int64_t>(amount, std::numeric_limits<int>::min(),
                                                      std::numeric_limits<int>::max()));
    return out;
}

BesiegePayload parse_besiege(const JsonValue& p) {
    BesiegePayload out;
    out.stronghold_id = StrongholdId(require_integer(p["stronghold_id"],
                                                     "besiege order missing stronghold_id"));
    out.siege_engines = integer_or(p["siege_engines"], 0, "siege_engines must be an int");
    return out;
}

AssaultPayload parse_assault(const JsonValue& p) {
    AssaultPayload out;
    out.stronghold_id = StrongholdId(require_integer(p["stronghold_id"],
                                                     "assault order missing stronghold_id"));
    if (auto v = optional_integer(p["attacker_fixed_roll"], "attacker_fixed_roll must be an int")) {
        out.attacker_fixed_roll = narrow_int(*v, "attacker_fixed_roll must be an int");
    }
    if (auto v = optional_integer(p["defender_fixed_roll"], "defender_fixed_roll must be an int")) {
        out.defender_fixed_roll = narrow_int(*v, "defender_fixed_roll must be an int");
    }
    out.attacker_modifier = integer_or(p["attacker_modifier"], 0, "attacker_modifier must be an int");
    out.defender_modifier = integer_or(p["defender_modifier"], 0, "defender_modifier must be an int");
    out.pillage = is_truthy_flag(p["pillage"]);
    return out;
}

NavalMovePayload parse_naval_move(const JsonValue& p) {
    NavalMovePayload out;
    out.ship_id = ShipId(require_integer(p["ship_id"], "naval move requires ship_id"));

    const auto& route = p["route"];
    if (!route.is_array() || route.size() == 0) throw PayloadError("naval move requires route");
    for (const auto& v : route.as_array()) {
        out.route.push_back(HexId(require_integer(v, "invalid hex id in route")));
    }
    return out;
}

SendMessagePayload parse_send_message(const JsonValue& p) {
    SendMessagePayload out;
    out.recipient_id = CommanderId(require_integer(p["recipient_id"],
                                                   "send_message requires recipient_id"));
    out.content = string_or(p["content"], "");
    out.territory_type = trimmed_lower(string_or(p["territory_type"], "friendly"));
    return out;
}

LaunchOperationPayload parse_launch_operation(const JsonValue& p) {
    LaunchOperationPayload out;
    if (auto id = optional_integer(p["operation_id"], "invalid operation_id")) {
        out.operation_id = OperationId(*id);
    }

    const auto& descriptor = p["target_descriptor"];
    if (descriptor.is_object()) {
        out.target_descriptor = descriptor;
    } else if (!descriptor.is_null()) {
        throw PayloadError("target_descriptor must be a mapping");
    }

    out.operation_type = string_to_operation_type(string_or(p["operation_type"], "intelligence"));
    out.territory_type = string_or(p["territory_type"], "friendly");
    out.difficulty_modifier = integer_or(p["difficulty_modifier"], 0,
                                         "difficulty_modifier must be an int");
    if (auto cost = optional_integer(p["loot_cost"], "loot_cost must be an int")) {
        out.loot_cost = narrow_int(*cost, "loot_cost must be an int");
    }
    out.complexity = string_or(p["complexity"], "standard");
    return out;
}

RaiseArmyPayload parse_raise_army(const JsonValue& p) {
    RaiseArmyPayload out;
    out.stronghold_id = StrongholdId(require_integer(p["stronghold_id"],
                                                     "stronghold_id must be an int"));
    out.new_commander_id = CommanderId(require_integer(p["new_commander_id"],
                                                       "commander not found"));
    out.infantry_unit_type_id = UnitTypeId(require_integer(p["infantry_unit_type_id"],
                                                           "unit type id must be an int"));
    if (auto cav = optional_integer(p["cavalry_unit_type_id"], "unit type id must be an int")) {
        out.cavalry_unit_type_id = UnitTypeId(*cav);
    }
    if (p["rally_hex_id"].truthy()) {
        out.rally_hex_id = HexId(require_integer(p["rally_hex_id"], "rally hex not found"));
    }
    if (!p["army_name"].is_null()) out.army_name = string_or(p["army_name"], "");
    return out;
}

HarryPayload parse_harry(const JsonValue& p) {
    const auto& ids = p["detachment_ids"];
    if (!ids.is_array() || ids.size() == 0) {
        throw PayloadError("harry order requires detachment_ids");
    }

    HarryPayload out;
    for (const auto& v : ids.as_array()) {
        DetachmentId id(require_integer(v, "detachment_ids must be integers"));
        if (std::find(out.detachment_ids.begin(), out.detachment_ids.end(), id) ==
            out.detachment_ids.end()) {
            out.detachment_ids.push_back(id);
        }
    }
    out.target_army_id = ArmyId(require_integer(p["target_army_id"],
                                                "harry order requires target_army_id"));
    out.objective = trimmed_lower(string_or(p["objective"], "kill"));
    return out;
}

} // anonymous namespace

std::optional<int64_t> to_integer(const JsonValue& value) {
    if (value.is_integral()) return value.as_int64();
    if (value.is_number()) {
        // Truncates like an int() cast; NaN, infinities and values past int64 are rejected.
        const double d = value.as_number();
        if (!std::isfinite(d) || d < -0x1p63 || d >= 0x1p63) return std::nullopt;
        return static_cast<int64_t>(d);
    }
    if (value.is_bool()) return value.as_bool() ? 1 : 0;
    if (value.is_string()) {
        std::string s = value.as_string();
        size_t start = s.find_first_not_of(" \t");
        size_t end = s.find_last_not_of(" \t");
        if (start == std::string::npos) return std::nullopt;
        s = s.substr(start, end - start + 1);
        char* stop = nullptr;
        errno = 0;
        long long v = std::strtoll(s.c_str(), &stop, 10);
        if (errno != 0 || *stop != '\0') return std::nullopt;
        return static_cast<int64_t>(v);
    }
    return std::nullopt;
}

bool is_truthy_flag(const JsonValue& value) {
    if (value.is_bool()) return value.as_bool();
    if (value.is_number()) return value.as_number() != 0.0;
    if (value.is_string()) {
        const std::string s = trimmed_lower(value.as_string());
        return s == "true" || s == "yes" || s == "y" || s == "1" || s == "on";
    }
    return false;
}

OrderPayload parse_payload(OrderKind kind, const JsonValue& p) {
    switch (kind) {
        case OrderKind::MOVE:            return parse_move(p);
        case OrderKind::REST:            return parse_rest(p);
        case OrderKind::FORAGE: {
            ForagePayload out{hex_id_list(p["hex_ids"])};
            if (out.hex_ids.empty()) throw PayloadError("forage order missing hex_ids");
            return out;
        }
        case OrderKind::TORCH: {
            TorchPayload out{hex_id_list(p["hex_ids"])};
            if (out.hex_ids.empty()) throw PayloadError("torch order missing hex_ids");
            return out;
        }
        case OrderKind::SUPPLY_TRANSFER: return parse_supply_transfer(p);
        case OrderKind::BESIEGE:         return parse_besiege(p);
        case OrderKind::ASSAULT:         return parse_assault(p);
        case OrderKind::EMBARK:
            return EmbarkPayload{ShipId(require_integer(p["ship_id"],
                                                        "embark order missing ship_id"))};
        case OrderKind::DISEMBARK:
            return DisembarkPayload{ShipId(require_integer(p["ship_id"],
                                                           "disembark order missing ship_id"))};
        case OrderKind::NAVAL_MOVE:       return parse_naval_move(p);
        case OrderKind::SEND_MESSAGE:     return parse_send_message(p);
        case OrderKind::LAUNCH_OPERATION: return parse_launch_operation(p);
        case OrderKind::RAISE_ARMY:       return parse_raise_army(p);
        case OrderKind::HARRY:            return parse_harry(p);
    }
    throw PayloadError(std::string("no parser for order kind ") + order_kind_to_string(kind));
}

} // namespace strat::orders
