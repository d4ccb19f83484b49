/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents externally observable, edge-triggered facts
emitted by transport::Connection via its poll_signal() interface.

Signals are:
  - Edge-triggered (not level- or state-based)
  - Single-shot per occurrence
  - Poll-driven, callback-free

Signals are informational. The authoritative view is Connection::state()
and Connection::error_message(); a collaborator that misses a signal can
always recover by reading state.

-------------------------------------------------------------------------------
 Delivery Semantics
-------------------------------------------------------------------------------

- Signals are pushed into a bounded SPSC ring owned by the Connection
- If the ring is full the new signal is dropped and a warning is logged

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected
  The Socket.IO handshake reached Ready and the state became Connected.
  Emitted exactly once per successful handshake.

Disconnected
  disconnect() moved a non-Disconnected connection to Disconnected.

Failed
  The connection entered the Error state (transport failure, remote close,
  handshake timeout, invalid URL). error_message() holds the cause.

RetryScheduled
  A single-shot reconnect timer was armed.

LivenessThreatened
  The heartbeat monitor crossed its consecutive-failure threshold.
  Advisory only, no state change is implied.

===============================================================================
*/
#pragma once

#include <cstdint>
#include <string_view>


namespace raidlink::core::transport::connection {

enum class Signal : uint8_t {
    None,
    Connected,
    Disconnected,
    Failed,
    RetryScheduled,
    LivenessThreatened,
};

[[nodiscard]]
inline std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:               return "None";
        case Signal::Connected:          return "Connected";
        case Signal::Disconnected:       return "Disconnected";
        case Signal::Failed:             return "Failed";
        case Signal::RetryScheduled:     return "RetryScheduled";
        case Signal::LivenessThreatened: return "LivenessThreatened";
        default:                         return "Unknown";
    }
}

} // namespace raidlink::core::transport::connection
