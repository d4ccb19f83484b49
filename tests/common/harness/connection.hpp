/*
===============================================================================
 Connection Test Harness
===============================================================================

Purpose:
--------
Provides a minimal, deterministic harness for testing
raidlink::core::transport::Connection FSM behavior.

Design:
-------
- Telemetry outlives Connection
- Connection lifetime is explicit and controllable
- Time only moves through ManualClock::advance()
- Connection signals are drained deterministically
- No callbacks, no threads, no hidden behavior

This enables:
- Destructor behavior testing
- Timer assertions (handshake deadline, reconnect delay, heartbeat)
- Precise lifecycle assertions

===============================================================================
*/
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "raidlink/core/config/client.hpp"
#include "raidlink/core/transport/connection.hpp"
#include "raidlink/core/transport/connection/signal.hpp"
#include "raidlink/core/transport/telemetry/connection.hpp"
#include "raidlink/core/transport/websocket_concept.hpp"
#include "common/manual_clock.hpp"
#include "common/mock_websocket.hpp"
#include "common/test_check.hpp"

// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace raidlink::core;
using namespace raidlink::core::transport;

using raidlink::test::ManualClock;
using WebSocketUnderTest = test::MockWebSocket;

// Assert that WebSocketUnderTest conforms to transport::WebSocketConcept concept
static_assert(WebSocketConcept<WebSocketUnderTest>);

using ConnectionUnderTest = Connection<WebSocketUnderTest, ManualClock>;


namespace raidlink::core::transport::test {
namespace harness {

struct Connection {
    // -------------------------------------------------------------------------
    // Persistent telemetry (must outlive Connection)
    // -------------------------------------------------------------------------
    telemetry::Connection telemetry;

    // -------------------------------------------------------------------------
    // Connection under test (explicit lifetime)
    // -------------------------------------------------------------------------
    config::Client cfg;
    std::unique_ptr<ConnectionUnderTest> connection;

    // -------------------------------------------------------------------------
    // Signal counters
    // -------------------------------------------------------------------------
    std::uint32_t connect_signals{0};
    std::uint32_t disconnect_signals{0};
    std::uint32_t failed_signals{0};
    std::uint32_t retry_schedule_signals{0};
    std::uint32_t liveness_warning_signals{0};

    // Ordered signal log (optional inspection)
    std::vector<connection::Signal> signals;

    explicit Connection(config::Client c = test_config())
        : cfg(std::move(c))
    {
        MockWebSocket::reset();
        ManualClock::reset();
        make_connection();
    }

    // Base URL on a port the mock scripts can key on
    [[nodiscard]]
    static config::Client test_config() {
        config::Client c;
        c.base_url = "http://127.0.0.1:5001";
        c.device_uuid = "123e4567-e89b-12d3-a456-426614174000";
        return c;
    }

    inline void make_connection() {
        connection = std::make_unique<ConnectionUnderTest>(cfg, telemetry);
    }

    inline void destroy_connection() {
        connection.reset(); // ~Connection() runs here
    }

    // Transport of the current attempt, nullptr when none
    [[nodiscard]]
    inline MockWebSocket* ws() noexcept {
        return connection ? connection->ws() : nullptr;
    }

    // One poll() followed by a signal drain
    inline void step() {
        connection->poll();
        drain_signals();
    }

    // Advance the manual clock, then step
    template<class Rep, class Period>
    inline void advance(std::chrono::duration<Rep, Period> d) {
        ManualClock::advance(d);
        step();
    }

    // connect() and run the scripted handshake to completion
    inline void connect_and_handshake() {
        connection->connect();
        step();   // Open + session -> "40" sent, ack queued
        step();   // ack -> Ready
    }

    inline void drain_signals() noexcept {
        if (!connection) {
            return;
        }
        connection::Signal sig;
        while (connection->poll_signal(sig)) {
            switch (sig) {
            case connection::Signal::Connected:
                ++connect_signals;
                break;
            case connection::Signal::Disconnected:
                ++disconnect_signals;
                break;
            case connection::Signal::Failed:
                ++failed_signals;
                break;
            case connection::Signal::RetryScheduled:
                ++retry_schedule_signals;
                break;
            case connection::Signal::LivenessThreatened:
                ++liveness_warning_signals;
                break;
            case connection::Signal::None:
            default:
                break;
            }
            signals.push_back(sig);
        }
    }

    // Reset counters and signal log (does NOT affect connection state)
    inline void reset_counters() noexcept {
        connect_signals = 0;
        disconnect_signals = 0;
        failed_signals = 0;
        retry_schedule_signals = 0;
        liveness_warning_signals = 0;
        signals.clear();
    }
};

} // namespace harness

using ConnectionHarness = harness::Connection;

} // namespace raidlink::core::transport::test
