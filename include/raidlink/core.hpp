#pragma once

/*
================================================================================
raidlink Core: Socket.IO client for the treasure-hunt game server
================================================================================

Primary entry points:

    raidlink::core::SessionT        game client (connection + events + handlers)
    raidlink::core::HealthPollerT   out-of-band /health supervisor
    raidlink::core::DiagnosticsT    full reachability report

all bound to the Boost.Beast transport and std::chrono::steady_clock.

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------

Two threads per live connection:

    [Transport thread]   owned by beast::WebSocket
        async_read -> push websocket::Event into an SPSC ring -> next read

    [Application thread] whoever calls poll()
        pop events -> decode -> handshake / heartbeat / timers -> handlers

Every state transition, timer and handler runs on the application thread.
Nothing advances unless poll() is called. The transport thread only moves
bytes; when the ring is full it waits instead of dropping a frame.

Diagnostics probes and health checks run their own private IO threads and
report results by value; they never touch the session they sit next to.
================================================================================
*/

#include "raidlink/core/config/client.hpp"
#include "raidlink/core/diagnostics/report.hpp"
#include "raidlink/core/health/http_check.hpp"
#include "raidlink/core/health/poller.hpp"
#include "raidlink/core/session.hpp"
#include "raidlink/core/transport/beast/http_get.hpp"
#include "raidlink/core/transport/beast/websocket.hpp"
#include "raidlink/core/transport/connection.hpp"


namespace raidlink::core {

namespace transport {
    using WebSocketT  = beast::WebSocket;
    using ConnectionT = Connection<WebSocketT>;
} // namespace transport

    using SessionT      = Session<transport::WebSocketT>;
    using HealthPollerT = health::Poller<health::HttpHealthCheck>;
    using DiagnosticsT  = diagnostics::Report<transport::WebSocketT, transport::beast::HttpGet>;

} // namespace raidlink::core
