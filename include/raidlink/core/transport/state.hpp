#pragma once

#include <cstdint>
#include <string_view>


namespace raidlink::core::transport {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
//
// Externally observable connection state. Error carries a message that is
// held by the Connection (see Connection::error_message()).
//
// Invariant: State::Connected implies the Socket.IO handshake is Ready.
//
enum class State : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Error
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected: return "Disconnected";
        case State::Connecting:   return "Connecting";
        case State::Connected:    return "Connected";
        case State::Error:        return "Error";
        default:                  return "Unknown";
    }
}


// ===============================================================
// EVENT ENUM (internal FSM inputs)
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    ConnectRequested,
    DisconnectRequested,

    // --- Handshake ---
    HandshakeReady,
    HandshakeTimedOut,

    // --- Transport lifecycle ---
    TransportFailed,      // Error event or failed open
    TransportClosed,      // Remote close

    // --- Retry ---
    ReconnectTimerExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::ConnectRequested:      return "ConnectRequested";
        case Event::DisconnectRequested:   return "DisconnectRequested";
        case Event::HandshakeReady:        return "HandshakeReady";
        case Event::HandshakeTimedOut:     return "HandshakeTimedOut";
        case Event::TransportFailed:       return "TransportFailed";
        case Event::TransportClosed:       return "TransportClosed";
        case Event::ReconnectTimerExpired: return "ReconnectTimerExpired";
        default:                           return "UnknownEvent";
    }
}

} // namespace raidlink::core::transport
