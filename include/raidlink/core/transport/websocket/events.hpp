#pragma once

/*
===============================================================================
 raidlink::core::transport::websocket::Event
===============================================================================

Event emitted by a WebSocket transport implementation and delivered to the
owning Connection via a lock-free SPSC ring buffer.

A single ordered channel carries both the control plane (Open / Close /
Error) and the text frames. Keeping them in one ring guarantees that the
Connection observes "open" before the first frame, and every frame before
the close that followed it.

-------------------------------------------------------------------------------
 Threading Model
-------------------------------------------------------------------------------

WebSocket:
    - Runs an internal IO thread
    - Pushes Event objects into the ring

Connection:
    - Runs on a single-threaded poll loop
    - Drains events via poll_event()

-------------------------------------------------------------------------------
 Reliability Contract
-------------------------------------------------------------------------------

• Events MUST NOT be dropped. A full ring delays the producer.
• Close or Error is delivered at most once per transport lifetime.

===============================================================================
*/

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "raidlink/core/transport/error.hpp"

namespace raidlink::core::transport::websocket {

enum class EventType : std::uint8_t {
    None    = 0,
    Open    = 1,   // Upgrade completed, frames may follow
    Message = 2,   // One complete text frame
    Close   = 3,   // Closed by the remote endpoint
    Error   = 4,   // Transport failure, `error` holds the classification
};

[[nodiscard]]
inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
        case EventType::None:    return "None";
        case EventType::Open:    return "Open";
        case EventType::Message: return "Message";
        case EventType::Close:   return "Close";
        case EventType::Error:   return "Error";
        default:                 return "Unknown";
    }
}

struct Event {
    EventType type = EventType::None;
    transport::Error error = transport::Error::None;  // valid only if type == Error
    std::string payload;                              // valid only if type == Message

    static Event make_open() {
        Event ev;
        ev.type = EventType::Open;
        return ev;
    }

    static Event make_message(std::string text) {
        Event ev;
        ev.type = EventType::Message;
        ev.payload = std::move(text);
        return ev;
    }

    static Event make_close() {
        Event ev;
        ev.type = EventType::Close;
        return ev;
    }

    static Event make_error(transport::Error e) {
        Event ev;
        ev.type  = EventType::Error;
        ev.error = e;
        return ev;
    }
};

} // namespace raidlink::core::transport::websocket
