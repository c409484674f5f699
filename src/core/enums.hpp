/**
 * Campaign enumerations and their wire-string conversions.
 *
 * The string forms are the ones used in scenario files and reports.
 */

#ifndef STRAT_ENUMS_HPP
#define STRAT_ENUMS_HPP

#include <string>

namespace strat {

// ── Calendar ──

enum class DayPart {
    MORNING,
    MIDDAY,
    EVENING,
    NIGHT
};

constexpr DayPart kDayParts[] = {
    DayPart::MORNING, DayPart::MIDDAY, DayPart::EVENING, DayPart::NIGHT
};

inline const char* day_part_to_string(DayPart part) {
    switch (part) {
        case DayPart::MORNING: return "morning";
        case DayPart::MIDDAY:  return "midday";
        case DayPart::EVENING: return "evening";
        case DayPart::NIGHT:   return "night";
    }
    return "";
}

inline DayPart string_to_day_part(const std::string& s) {
    if (s == "midday")  return DayPart::MIDDAY;
    if (s == "evening") return DayPart::EVENING;
    if (s == "night")   return DayPart::NIGHT;
    return DayPart::MORNING;
}

enum class Season {
    SPRING,
    SUMMER,
    FALL,
    WINTER
};

inline const char* season_to_string(Season season) {
    switch (season) {
        case Season::SPRING: return "spring";
        case Season::SUMMER: return "summer";
        case Season::FALL:   return "fall";
        case Season::WINTER: return "winter";
    }
    return "";
}

inline Season string_to_season(const std::string& s) {
    if (s == "summer") return Season::SUMMER;
    if (s == "fall")   return Season::FALL;
    if (s == "winter") return Season::WINTER;
    return Season::SPRING;
}

inline Season next_season(Season season) {
    switch (season) {
        case Season::SPRING: return Season::SUMMER;
        case Season::SUMMER: return Season::FALL;
        case Season::FALL:   return Season::WINTER;
        case Season::WINTER: return Season::SPRING;
    }
    return Season::SPRING;
}

// ── Armies ──

enum class ArmyStatus {
    IDLE,
    MARCHING,
    FORCED_MARCH,
    NIGHT_MARCH,
    RESTING,
    FORAGING,
    TORCHING,
    BESIEGING,
    IN_BATTLE,
    HARRYING,
    ROUTED,
    GARRISONED
};

inline const char* army_status_to_string(ArmyStatus status) {
    switch (status) {
        case ArmyStatus::IDLE:         return "idle";
        case ArmyStatus::MARCHING:     return "marching";
        case ArmyStatus::FORCED_MARCH: return "forced_march";
        case ArmyStatus::NIGHT_MARCH:  return "night_march";
        case ArmyStatus::RESTING:      return "resting";
        case ArmyStatus::FORAGING:     return "foraging";
        case ArmyStatus::TORCHING:     return "torching";
        case ArmyStatus::BESIEGING:    return "besieging";
        case ArmyStatus::IN_BATTLE:    return "in_battle";
        case ArmyStatus::HARRYING:     return "harrying";
        case ArmyStatus::ROUTED:       return "routed";
        case ArmyStatus::GARRISONED:   return "garrisoned";
    }
    return "";
}

inline ArmyStatus string_to_army_status(const std::string& s) {
    if (s == "marching")     return ArmyStatus::MARCHING;
    if (s == "forced_march") return ArmyStatus::FORCED_MARCH;
    if (s == "night_march")  return ArmyStatus::NIGHT_MARCH;
    if (s == "resting")      return ArmyStatus::RESTING;
    if (s == "foraging")     return ArmyStatus::FORAGING;
    if (s == "torching")     return ArmyStatus::TORCHING;
    if (s == "besieging")    return ArmyStatus::BESIEGING;
    if (s == "in_battle")    return ArmyStatus::IN_BATTLE;
    if (s == "harrying")     return ArmyStatus::HARRYING;
    if (s == "routed")       return ArmyStatus::ROUTED;
    if (s == "garrisoned")   return ArmyStatus::GARRISONED;
    return ArmyStatus::IDLE;
}

enum class MovementType {
    STANDARD,
    FORCED,
    NIGHT
};

inline const char* movement_type_to_string(MovementType type) {
    switch (type) {
        case MovementType::STANDARD: return "standard";
        case MovementType::FORCED:   return "forced";
        case MovementType::NIGHT:    return "night";
    }
    return "";
}

// ── Orders ──

enum class OrderStatus {
    PENDING,
    EXECUTING,
    COMPLETED,
    CANCELLED,
    FAILED
};

inline const char* order_status_to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING:   return "pending";
        case OrderStatus::EXECUTING: return "executing";
        case OrderStatus::COMPLETED: return "completed";
        case OrderStatus::CANCELLED: return "cancelled";
        case OrderStatus::FAILED:    return "failed";
    }
    return "";
}

inline OrderStatus string_to_order_status(const std::string& s) {
    if (s == "executing") return OrderStatus::EXECUTING;
    if (s == "completed") return OrderStatus::COMPLETED;
    if (s == "cancelled") return OrderStatus::CANCELLED;
    if (s == "failed")    return OrderStatus::FAILED;
    return OrderStatus::PENDING;
}

inline bool is_terminal(OrderStatus status) {
    return status == OrderStatus::COMPLETED ||
           status == OrderStatus::FAILED ||
           status == OrderStatus::CANCELLED;
}

// ── Strongholds and sieges ──

enum class StrongholdType {
    TOWN,
    CITY,
    FORTRESS
};

inline const char* stronghold_type_to_string(StrongholdType type) {
    switch (type) {
        case StrongholdType::TOWN:     return "town";
        case StrongholdType::CITY:     return "city";
        case StrongholdType::FORTRESS: return "fortress";
    }
    return "";
}

inline StrongholdType string_to_stronghold_type(const std::string& s) {
    if (s == "city")     return StrongholdType::CITY;
    if (s == "fortress") return StrongholdType::FORTRESS;
    return StrongholdType::TOWN;
}

enum class SiegeStatus {
    ONGOING,
    GATES_OPENED,
    SUCCESSFUL_ASSAULT,
    LIFTED
};

inline const char* siege_status_to_string(SiegeStatus status) {
    switch (status) {
        case SiegeStatus::ONGOING:            return "ongoing";
        case SiegeStatus::GATES_OPENED:       return "gates_opened";
        case SiegeStatus::SUCCESSFUL_ASSAULT: return "successful_assault";
        case SiegeStatus::LIFTED:             return "lifted";
    }
    return "";
}

inline SiegeStatus string_to_siege_status(const std::string& s) {
    if (s == "gates_opened")       return SiegeStatus::GATES_OPENED;
    if (s == "successful_assault") return SiegeStatus::SUCCESSFUL_ASSAULT;
    if (s == "lifted")             return SiegeStatus::LIFTED;
    return SiegeStatus::ONGOING;
}

// ── Naval ──

enum class NavalStatus {
    AVAILABLE,
    TRANSPORTING,
    FLED
};

inline const char* naval_status_to_string(NavalStatus status) {
    switch (status) {
        case NavalStatus::AVAILABLE:    return "available";
        case NavalStatus::TRANSPORTING: return "transporting";
        case NavalStatus::FLED:         return "fled";
    }
    return "";
}

inline NavalStatus string_to_naval_status(const std::string& s) {
    if (s == "transporting") return NavalStatus::TRANSPORTING;
    if (s == "fled")         return NavalStatus::FLED;
    return NavalStatus::AVAILABLE;
}

// ── Operations ──

enum class OperationType {
    INTELLIGENCE,
    ASSASSINATION,
    SABOTAGE
};

inline const char* operation_type_to_string(OperationType type) {
    switch (type) {
        case OperationType::INTELLIGENCE:  return "intelligence";
        case OperationType::ASSASSINATION: return "assassination";
        case OperationType::SABOTAGE:      return "sabotage";
    }
    return "";
}

inline OperationType string_to_operation_type(const std::string& s) {
    if (s == "assassination") return OperationType::ASSASSINATION;
    if (s == "sabotage")      return OperationType::SABOTAGE;
    return OperationType::INTELLIGENCE;
}

enum class OperationOutcome {
    PENDING,
    SUCCESS,
    FAILURE,
    INTERRUPTED
};

inline const char* operation_outcome_to_string(OperationOutcome outcome) {
    switch (outcome) {
        case OperationOutcome::PENDING:     return "pending";
        case OperationOutcome::SUCCESS:     return "success";
        case OperationOutcome::FAILURE:     return "failure";
        case OperationOutcome::INTERRUPTED: return "interrupted";
    }
    return "";
}

inline OperationOutcome string_to_operation_outcome(const std::string& s) {
    if (s == "success")     return OperationOutcome::SUCCESS;
    if (s == "failure")     return OperationOutcome::FAILURE;
    if (s == "interrupted") return OperationOutcome::INTERRUPTED;
    return OperationOutcome::PENDING;
}

} // namespace strat

#endif // STRAT_ENUMS_HPP
