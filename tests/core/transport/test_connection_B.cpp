/*
===============================================================================
 transport::Connection - Group B Unit Tests
===============================================================================

Scope:
------
These tests validate how the connection drives the Socket.IO handshake on
top of a scripted transport.

Covered Requirements:
---------------------
B1. Full handshake
    - Open -> "40" sent exactly once -> NamespaceAck -> Connected
    - Connected signal emitted exactly once, epoch incremented

B2. Namespace connect waits for the session
    - Nothing is sent before the Engine.IO Open frame

B3. Connected exactly once
    - Duplicate acks after Ready emit nothing

B4. Legacy ready event
    - A "connected" event in place of the ack completes the handshake

B5. Malformed session info
    - An Open frame with unparsable JSON still advances the handshake

Non-Goals:
----------
- Handshake deadline (Group C)
- Heartbeat (Group D)

===============================================================================
*/

#include <iostream>
#include <string>

#include "common/harness/connection.hpp"

using raidlink::core::transport::test::ConnectionHarness;
using protocol::socketio::HandshakeState;


// -----------------------------------------------------------------------------
// Group B1: Full handshake
// -----------------------------------------------------------------------------
void test_full_handshake() {
    std::cout << "[TEST] Group B1: full handshake\n";
    ConnectionHarness h;

    h.connect_and_handshake();

    TEST_CHECK(h.connection->state() == State::Connected);
    TEST_CHECK(h.connection->handshake_state() == HandshakeState::Ready);
    TEST_CHECK_EQ(h.connection->handshake().session().sid, std::string("mock-sid"));
    TEST_CHECK_EQ(h.connection->handshake().session().ping_interval_ms, 25000u);
    TEST_CHECK(h.connection->handshake().namespace_sid().value_or("") == "mock-ns");
    TEST_CHECK_EQ(h.ws()->sent_count("40"), 1u);
    TEST_CHECK_EQ(h.ws()->sent().size(), 1u);
    TEST_CHECK_EQ(h.connect_signals, 1u);
    TEST_CHECK_EQ(h.connection->epoch(), 1u);
    TEST_CHECK(h.connection->display_status() == "Connected");
    TEST_CHECK(h.connection->error_message().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B2: Namespace connect waits for the session
// -----------------------------------------------------------------------------
void test_namespace_connect_waits_for_open() {
    std::cout << "[TEST] Group B2: namespace connect waits for Open\n";
    WebSocketUnderTest::Script script;
    script.open_session = false;
    ConnectionHarness h;
    WebSocketUnderTest::set_default_script(script);

    h.connection->connect();
    h.step();
    h.step();
    TEST_CHECK(h.ws()->sent().empty());
    TEST_CHECK(h.connection->handshake_state() == HandshakeState::AwaitingSession);
    TEST_CHECK(h.connection->state() == State::Connecting);

    h.ws()->inject_message(std::string(WebSocketUnderTest::SESSION_FRAME));
    h.step();
    TEST_CHECK_EQ(h.ws()->sent_count("40"), 1u);
    TEST_CHECK(h.connection->state() == State::Connected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B3: Connected exactly once
// -----------------------------------------------------------------------------
void test_connected_exactly_once() {
    std::cout << "[TEST] Group B3: Connected emitted exactly once\n";
    ConnectionHarness h;
    h.connect_and_handshake();

    h.ws()->inject_message("40");
    h.ws()->inject_message(R"(40{"sid":"again"})");
    h.ws()->inject_message(std::string(WebSocketUnderTest::SESSION_FRAME));
    h.step();

    TEST_CHECK_EQ(h.connect_signals, 1u);
    TEST_CHECK_EQ(h.connection->epoch(), 1u);
    TEST_CHECK_EQ(h.ws()->sent_count("40"), 1u);
    TEST_CHECK(h.connection->state() == State::Connected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B4: Legacy ready event
// -----------------------------------------------------------------------------
void test_legacy_ready_event() {
    std::cout << "[TEST] Group B4: legacy 'connected' event\n";
    WebSocketUnderTest::Script script;
    script.ack_namespace = false;
    ConnectionHarness h;
    WebSocketUnderTest::set_default_script(script);

    h.connection->connect();
    h.step();
    TEST_CHECK(h.connection->handshake_state() == HandshakeState::AwaitingNamespaceAck);

    h.ws()->inject_message(R"(42["connected",{"message":"welcome"}])");
    h.step();
    TEST_CHECK(h.connection->state() == State::Connected);
    TEST_CHECK_EQ(h.connect_signals, 1u);

    // The legacy event itself is not an application event
    protocol::socketio::frame::Event ev;
    TEST_CHECK(!h.connection->poll_event(ev));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B5: Malformed session info
// -----------------------------------------------------------------------------
void test_malformed_open_frame() {
    std::cout << "[TEST] Group B5: malformed Open frame\n";
    WebSocketUnderTest::Script script;
    script.open_session = false;
    ConnectionHarness h;
    WebSocketUnderTest::set_default_script(script);

    h.connection->connect();
    h.ws()->inject_message("0{this is not json");
    h.step();

    TEST_CHECK_EQ(h.ws()->sent_count("40"), 1u);
    TEST_CHECK(h.connection->state() == State::Connected);
    TEST_CHECK(h.connection->handshake().session().sid.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_full_handshake();
    test_namespace_connect_waits_for_open();
    test_connected_exactly_once();
    test_legacy_ready_event();
    test_malformed_open_frame();

    std::cout << "\n[GROUP B - HANDSHAKE SEQUENCING TESTS PASSED]\n";
    return 0;
}
