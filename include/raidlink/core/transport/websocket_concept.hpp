/*
===============================================================================
WebSocketConcept (Pull-Based)
===============================================================================

Defines the minimal transport contract required by Connection.

The WebSocket implementation:

  • Owns its IO thread
  • connect() only starts the attempt and never blocks on the network
  • Reports progress (Open / Message / Close / Error) through poll_event()
  • close() is synchronous: once it returns no event is produced anymore
    and no socket is left open
  • Is fully lifecycle-managed by Connection

No callbacks. No dynamic dispatch.

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

Producer thread:
  - WebSocket IO thread, pushes events

Consumer thread:
  - Connection::poll() caller thread
  - Calls connect(), send(), close() and poll_event()

===============================================================================
*/
#pragma once

#include <string_view>
#include <concepts>

#include "raidlink/core/transport/error.hpp"
#include "raidlink/core/transport/parse_url.hpp"
#include "raidlink/core/transport/websocket/events.hpp"


namespace raidlink::core::transport {

template<class WS>
concept WebSocketConcept =
    requires(
        WS ws,
        const ParsedUrl& url,
        const std::string_view msg,
        websocket::Event& ev
    )
{
    // Lifecycle
    { ws.connect(url) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // Sending (text frame)
    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // Event ring
    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace raidlink::core::transport
