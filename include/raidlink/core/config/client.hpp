#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

#include "raidlink/core/config/timing.hpp"
#include "raidlink/core/protocol/policy/liveness.hpp"


namespace raidlink::core::config {

inline constexpr const char* DEFAULT_BASE_URL = "http://localhost:5000";

// -----------------------------------------------------------------------------
// Runtime configuration of one client connection.
//
// The primary client and every diagnostic probe get their own copy; probes
// tweak timeouts and switch off reconnection and device registration.
// -----------------------------------------------------------------------------
struct Client {
    std::string base_url    = DEFAULT_BASE_URL;
    std::string device_uuid;

    // Connection manager
    std::chrono::milliseconds handshake_timeout = HANDSHAKE_TIMEOUT;
    std::chrono::milliseconds reconnect_delay   = RECONNECT_DELAY;
    bool auto_reconnect  = true;
    bool register_device = true;

    // Heartbeat monitor
    protocol::policy::Liveness liveness = protocol::policy::Liveness::Passive;
    std::chrono::milliseconds heartbeat_grace          = HEARTBEAT_GRACE;
    std::chrono::milliseconds heartbeat_check_interval = HEARTBEAT_CHECK_INTERVAL;
    std::chrono::milliseconds heartbeat_stale_after    = HEARTBEAT_STALE_AFTER;
    std::uint32_t             heartbeat_failure_limit  = HEARTBEAT_FAILURE_LIMIT;
    std::chrono::milliseconds client_ping_interval     = CLIENT_PING_INTERVAL;

    inline void dump(std::ostream& os) const {
        os << "  Base URL          : " << base_url << '\n'
           << "  Device UUID       : " << (device_uuid.empty() ? "<none>" : device_uuid) << '\n'
           << "  Handshake timeout : " << handshake_timeout.count() << " ms\n"
           << "  Reconnect         : " << (auto_reconnect ? "on" : "off")
           << " (" << reconnect_delay.count() << " ms)\n"
           << "  Liveness          : " << protocol::policy::to_string(liveness) << '\n';
    }
};

// Settings for a throwaway diagnostic connection derived from the primary one
[[nodiscard]]
inline Client make_probe(const std::string& base_url, std::chrono::milliseconds timeout) {
    Client cfg;
    cfg.base_url          = base_url;
    cfg.handshake_timeout = timeout;
    cfg.auto_reconnect    = false;
    cfg.register_device   = false;
    return cfg;
}

} // namespace raidlink::core::config
