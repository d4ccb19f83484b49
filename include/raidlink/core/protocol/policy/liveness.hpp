#pragma once

#include <cstdint>
#include <string_view>

namespace raidlink::core::protocol::policy {

// Which side drives the heartbeat.
//
// Servers in the field have used both directions over time, so inbound pings
// and pongs are always honored. The policy only decides whether the client
// sends its own periodic pings on top.
enum class Liveness : std::uint8_t {
    Passive,  // Answer server pings, never originate one
    Active    // Also send a client ping every CLIENT_PING_INTERVAL
};

[[nodiscard]]
inline constexpr std::string_view to_string(Liveness policy) noexcept {
    switch (policy) {
        case Liveness::Passive: return "Passive";
        case Liveness::Active:  return "Active";
        default:                return "Unknown";
    }
}

} // namespace raidlink::core::protocol::policy
