/*
===============================================================================
 diagnostics::ConnectionTest - Group G Unit Tests
===============================================================================

Scope:
------
These tests validate the single-connection diagnostic probe: an isolated
Socket.IO connection that reports whether the server completes the handshake
and answers one client ping.

Covered Requirements:
---------------------
G1. Successful handshake followed by a pong
G2. Synchronous transport failure reported with its cause
G3. Server that never acknowledges the namespace -> handshake timeout
G4. Handshake completed but no pong before the deadline -> still a success
G5. Probe never retries and leaves no transport behind
G6. Pong probing disabled -> finishes on the handshake

Non-Goals:
----------
- Real network traffic

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>

#include "raidlink/core/diagnostics/connection_test.hpp"
#include "common/manual_clock.hpp"
#include "common/mock_websocket.hpp"
#include "common/test_check.hpp"

using namespace std::chrono_literals;
using namespace raidlink::core;
using raidlink::test::ManualClock;
using transport::test::MockWebSocket;

using ProbeUnderTest = diagnostics::ConnectionTest<MockWebSocket, ManualClock>;

namespace {

constexpr const char* SERVER_URL = "http://127.0.0.1:5001";

void fresh() {
    ManualClock::reset();
    MockWebSocket::reset();
}

} // namespace


// -----------------------------------------------------------------------------
// Group G1: success
// -----------------------------------------------------------------------------
void test_success_with_pong() {
    std::cout << "[TEST] Group G1: handshake and pong\n";
    fresh();
    ProbeUnderTest probe{SERVER_URL};
    probe.start();
    TEST_CHECK(!probe.done());
    TEST_CHECK_EQ(MockWebSocket::connect_calls(), 1);
    TEST_CHECK_EQ(MockWebSocket::last()->url().port, std::string("5001"));

    ManualClock::advance(40ms);
    TEST_CHECK(!probe.poll());     // handshake done, ping in flight
    TEST_CHECK(probe.result().connected);
    TEST_CHECK(probe.result().handshake_latency == 40ms);
    TEST_CHECK_EQ(MockWebSocket::last()->sent_count("2"), 1u);

    TEST_CHECK(probe.poll());      // pong
    TEST_CHECK(probe.done());
    TEST_CHECK(probe.result().pong_received);
    TEST_CHECK(probe.result().error == transport::Error::None);
    TEST_CHECK_EQ(probe.result().summary(), std::string("[OK] Socket.IO handshake completed in 40ms, pong received"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G2: synchronous failure
// -----------------------------------------------------------------------------
void test_connect_failure() {
    std::cout << "[TEST] Group G2: transport failure carries its cause\n";
    fresh();
    MockWebSocket::Script refused;
    refused.connect_result = transport::Error::HostUnreachable;
    MockWebSocket::set_default_script(refused);

    ProbeUnderTest probe{SERVER_URL};
    probe.start();
    TEST_CHECK(probe.poll());
    TEST_CHECK(!probe.result().connected);
    TEST_CHECK(probe.result().error == transport::Error::HostUnreachable);
    TEST_CHECK_EQ(probe.result().error_message, std::string(transport::describe(transport::Error::HostUnreachable)));
    TEST_CHECK(probe.result().summary().rfind("[FAIL] Socket.IO connection failed: host unreachable", 0) == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G3: handshake timeout
// -----------------------------------------------------------------------------
void test_handshake_timeout() {
    std::cout << "[TEST] Group G3: namespace never acknowledged\n";
    fresh();
    MockWebSocket::Script silent;
    silent.ack_namespace = false;
    MockWebSocket::set_default_script(silent);

    ProbeUnderTest probe{SERVER_URL, 5s};
    probe.start();
    TEST_CHECK(!probe.poll());
    TEST_CHECK_EQ(MockWebSocket::last()->sent_count("40"), 1u);

    ManualClock::advance(4999ms);
    TEST_CHECK(!probe.poll());
    ManualClock::advance(1ms);
    TEST_CHECK(probe.poll());
    TEST_CHECK(!probe.result().connected);
    TEST_CHECK(probe.result().error == transport::Error::HandshakeTimeout);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G4: missing pong
// -----------------------------------------------------------------------------
void test_missing_pong_is_not_a_failure() {
    std::cout << "[TEST] Group G4: no pong before the deadline\n";
    fresh();
    MockWebSocket::Script mute;
    mute.answer_pings = false;
    MockWebSocket::set_default_script(mute);

    ProbeUnderTest probe{SERVER_URL, 5s};
    probe.start();
    TEST_CHECK(!probe.poll());
    TEST_CHECK(probe.result().connected);

    ManualClock::advance(5s);
    TEST_CHECK(probe.poll());
    TEST_CHECK(probe.result().connected);
    TEST_CHECK(!probe.result().pong_received);
    TEST_CHECK(probe.result().error == transport::Error::None);
    TEST_CHECK(probe.result().summary().find("no pong observed") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G5: isolation
// -----------------------------------------------------------------------------
void test_probe_is_isolated() {
    std::cout << "[TEST] Group G5: no retry, no leftover transport\n";
    fresh();
    MockWebSocket::Script closing;
    closing.async_error = transport::Error::TransportFailure;
    MockWebSocket::set_default_script(closing);

    ProbeUnderTest probe{SERVER_URL};
    probe.start();
    TEST_CHECK(probe.poll());
    TEST_CHECK(probe.result().error == transport::Error::TransportFailure);
    TEST_CHECK(!probe.connection()->reconnect_pending());
    TEST_CHECK(probe.connection()->state() == transport::State::Disconnected);
    TEST_CHECK_EQ(MockWebSocket::live_count(), 0u);

    ManualClock::advance(1min);
    TEST_CHECK(probe.poll());
    TEST_CHECK_EQ(MockWebSocket::connect_calls(), 1);

    // Probes never register a device
    fresh();
    ProbeUnderTest ok{SERVER_URL};
    ok.start();
    (void)ok.poll();
    for (const auto& frame : MockWebSocket::last()->sent()) {
        TEST_CHECK(frame.find("register_device") == std::string::npos);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G6: pong probing off
// -----------------------------------------------------------------------------
void test_without_pong_probe() {
    std::cout << "[TEST] Group G6: finishes on handshake when pong probing is off\n";
    fresh();
    ProbeUnderTest probe{SERVER_URL, 3s, false};
    probe.start();
    TEST_CHECK(probe.poll());
    TEST_CHECK(probe.result().connected);
    TEST_CHECK(!probe.result().pong_received);
    TEST_CHECK_EQ(MockWebSocket::live_count(), 0u);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_success_with_pong();
    test_connect_failure();
    test_handshake_timeout();
    test_missing_pong_is_not_a_failure();
    test_probe_is_isolated();
    test_without_pong_probe();

    std::cout << "\n[GROUP G - CONNECTION TEST DIAGNOSTIC TESTS PASSED]\n";
    return 0;
}
