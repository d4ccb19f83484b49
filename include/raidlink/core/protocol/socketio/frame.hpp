#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>


namespace raidlink::core::protocol::socketio {

/*
===============================================================================
 Socket.IO over Engine.IO v4 frames
===============================================================================

One WebSocket text frame decodes into exactly one Frame:

   0{...}             Open           session handshake from the server
   2                  Ping           server heartbeat probe
   3                  Pong           answer to a client ping
   40 / 40{...}       NamespaceAck   default namespace joined
   42[name,payload]   Event          application event
   anything else      Unknown

Frames are immutable values once decoded.
===============================================================================
*/

enum class FrameType : std::uint8_t {
    Open,
    Ping,
    Pong,
    NamespaceAck,
    Event,
    Unknown
};

[[nodiscard]]
inline constexpr std::string_view to_string(FrameType t) noexcept {
    switch (t) {
        case FrameType::Open:         return "Open";
        case FrameType::Ping:         return "Ping";
        case FrameType::Pong:         return "Pong";
        case FrameType::NamespaceAck: return "NamespaceAck";
        case FrameType::Event:        return "Event";
        case FrameType::Unknown:      return "Unknown";
        default:                      return "Invalid";
    }
}

// Engine.IO session parameters carried by the Open frame.
// Fields the server omitted stay at their defaults.
struct SessionInfo {
    std::string   sid;
    std::uint64_t ping_interval_ms = 0;
    std::uint64_t ping_timeout_ms  = 0;
};

namespace frame {

struct Open {
    SessionInfo session;
};

struct Ping {};
struct Pong {};

struct NamespaceAck {
    std::optional<std::string> sid;   // diagnostics only
};

struct Event {
    std::string name;
    std::string payload;              // JSON object text (minified)
};

struct Unknown {
    std::string raw;
};

} // namespace frame

using Frame = std::variant<
    frame::Open,
    frame::Ping,
    frame::Pong,
    frame::NamespaceAck,
    frame::Event,
    frame::Unknown
>;

[[nodiscard]]
inline FrameType type_of(const Frame& f) noexcept {
    return static_cast<FrameType>(f.index());
}

} // namespace raidlink::core::protocol::socketio
