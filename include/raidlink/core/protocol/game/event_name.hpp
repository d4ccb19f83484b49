#pragma once

#include <cstdint>
#include <string_view>


namespace raidlink::core::protocol::game {

// ===============================================
// EVENT NAME ENUM
// ===============================================
enum class EventName : std::uint8_t {
    // ---- inbound ----
    ObjectCollected,
    ObjectUncollected,
    AllFindsReset,
    ObjectCreated,
    ObjectDeleted,
    NpcCreated,
    NpcUpdated,
    NpcDeleted,
    LocationUpdateIntervalChanged,
    GameModeChanged,
    AdminDiagnosticPing,
    // ---- outbound ----
    RegisterDevice,
    ClientDiagnosticPong,
    Unknown
};

// Convert enum → wire name
[[nodiscard]]
inline constexpr std::string_view to_string(EventName e) noexcept {
    switch (e) {
        case EventName::ObjectCollected:               return "object_collected";
        case EventName::ObjectUncollected:             return "object_uncollected";
        case EventName::AllFindsReset:                 return "all_finds_reset";
        case EventName::ObjectCreated:                 return "object_created";
        case EventName::ObjectDeleted:                 return "object_deleted";
        case EventName::NpcCreated:                    return "npc_created";
        case EventName::NpcUpdated:                    return "npc_updated";
        case EventName::NpcDeleted:                    return "npc_deleted";
        case EventName::LocationUpdateIntervalChanged: return "location_update_interval_changed";
        case EventName::GameModeChanged:               return "game_mode_changed";
        case EventName::AdminDiagnosticPing:           return "admin_diagnostic_ping";
        case EventName::RegisterDevice:                return "register_device";
        case EventName::ClientDiagnosticPong:          return "client_diagnostic_pong";
        default:                                       return "unknown";
    }
}

// Convert wire name → enum
[[nodiscard]]
inline constexpr EventName to_event_name(std::string_view s) noexcept {
    switch (s.size()) {
        case 11: // "npc_created", "npc_updated", "npc_deleted"
            if (s == "npc_created") return EventName::NpcCreated;
            if (s == "npc_updated") return EventName::NpcUpdated;
            if (s == "npc_deleted") return EventName::NpcDeleted;
            break;
        case 14: // "object_created", "object_deleted"
            if (s == "object_created") return EventName::ObjectCreated;
            if (s == "object_deleted") return EventName::ObjectDeleted;
            break;
        case 15: // "all_finds_reset", "register_device"
            if (s == "all_finds_reset") return EventName::AllFindsReset;
            if (s == "register_device") return EventName::RegisterDevice;
            break;
        case 16: // "object_collected"
            if (s == "object_collected") return EventName::ObjectCollected;
            break;
        case 17: // "game_mode_changed"
            if (s == "game_mode_changed") return EventName::GameModeChanged;
            break;
        case 18: // "object_uncollected"
            if (s == "object_uncollected") return EventName::ObjectUncollected;
            break;
        case 21: // "admin_diagnostic_ping"
            if (s == "admin_diagnostic_ping") return EventName::AdminDiagnosticPing;
            break;
        case 22: // "client_diagnostic_pong"
            if (s == "client_diagnostic_pong") return EventName::ClientDiagnosticPong;
            break;
        case 32: // "location_update_interval_changed"
            if (s == "location_update_interval_changed") return EventName::LocationUpdateIntervalChanged;
            break;
    }
    return EventName::Unknown;
}

} // namespace raidlink::core::protocol::game
