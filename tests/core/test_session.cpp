/*
===============================================================================
 raidlink::core::Session - Group S Unit Tests
===============================================================================

Scope:
------
These tests validate the protocol duties the session adds on top of the
connection, against the scripted transport and a manual clock.

Covered Requirements:
---------------------
S1. register_device is sent once per successful handshake
S2. No registration without a device UUID or when disabled
S3. admin_diagnostic_ping is answered with client_diagnostic_pong before
    consumer handlers run; the pong echoes ping_id and admin_session_id
S4. poll() routes application events to typed handlers
S5. The signal observer sees every connection signal
S6. Application sends are rejected while not Connected

Non-Goals:
----------
- Handshake details (connection Group B)
- Parser validation (test_parsers.cpp)

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "raidlink/core/config/client.hpp"
#include "raidlink/core/session.hpp"
#include "common/manual_clock.hpp"
#include "common/mock_websocket.hpp"
#include "common/test_check.hpp"

using namespace std::chrono_literals;
using namespace raidlink::core;
using namespace raidlink::core::protocol::game;
using raidlink::test::ManualClock;
using WebSocketUnderTest = transport::test::MockWebSocket;
using SessionUnderTest = Session<WebSocketUnderTest, ManualClock>;

namespace {

constexpr const char* DEVICE_UUID = "123e4567-e89b-12d3-a456-426614174000";

config::Client session_config() {
    config::Client cfg;
    cfg.base_url = "http://10.0.0.5:5001";
    cfg.device_uuid = DEVICE_UUID;
    return cfg;
}

void reset_environment() {
    WebSocketUnderTest::reset();
    ManualClock::reset();
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace


// -----------------------------------------------------------------------------
// Group S1: register_device per handshake
// -----------------------------------------------------------------------------
void test_register_device_per_handshake() {
    std::cout << "[TEST] Group S1: register_device once per handshake\n";
    reset_environment();
    SessionUnderTest session{session_config()};

    session.connect();
    session.poll();
    TEST_CHECK(session.state() == transport::State::Connected);
    TEST_CHECK_EQ(session.devices_registered(), 1u);

    auto* ws = session.connection().ws();
    const std::string expected = std::string(R"(42["register_device",{"device_uuid":")") + DEVICE_UUID + "\"}]";
    TEST_CHECK_EQ(ws->sent_count(expected), 1u);

    // More polling does not register again
    session.poll();
    ManualClock::advance(1min);
    session.poll();
    TEST_CHECK_EQ(session.devices_registered(), 1u);

    // Drop and reconnect: registered again on the new handshake
    session.connection().ws()->inject_close();
    session.poll();
    TEST_CHECK(session.state() == transport::State::Error);
    ManualClock::advance(session.config().reconnect_delay);
    session.poll();
    session.poll();
    TEST_CHECK(session.state() == transport::State::Connected);
    TEST_CHECK_EQ(session.devices_registered(), 2u);
    TEST_CHECK_EQ(session.connection().ws()->sent_count(expected), 1u);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group S2: registration disabled
// -----------------------------------------------------------------------------
void test_registration_disabled() {
    std::cout << "[TEST] Group S2: no registration without UUID\n";
    reset_environment();

    config::Client no_uuid = session_config();
    no_uuid.device_uuid.clear();
    SessionUnderTest a{no_uuid};
    a.connect();
    a.poll();
    TEST_CHECK(a.state() == transport::State::Connected);
    TEST_CHECK_EQ(a.devices_registered(), 0u);
    TEST_CHECK_EQ(a.connection().ws()->sent().size(), 1u);   // "40" only

    config::Client disabled = session_config();
    disabled.register_device = false;
    SessionUnderTest b{disabled};
    b.connect();
    b.poll();
    TEST_CHECK_EQ(b.devices_registered(), 0u);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group S3: diagnostic pong before handlers
// -----------------------------------------------------------------------------
void test_diagnostic_pong_first() {
    std::cout << "[TEST] Group S3: diagnostic pong sent before handlers\n";
    reset_environment();
    SessionUnderTest session{session_config()};
    session.connect();
    session.poll();

    std::string last_sent_in_handler;
    int handler_calls = 0;
    session.on<schema::AdminDiagnosticPing>([&](const schema::AdminDiagnosticPing& ping) {
        ++handler_calls;
        TEST_CHECK_EQ(ping.ping_id, std::string("p-1"));
        last_sent_in_handler = session.connection().ws()->sent().back();
    });

    session.connection().ws()->inject_message(R"(42["admin_diagnostic_ping",{"ping_id":"p-1","admin_session_id":"adm-9"}])");
    TEST_CHECK_EQ(session.poll(), 1u);

    TEST_CHECK_EQ(handler_calls, 1);
    TEST_CHECK_EQ(session.diagnostic_pongs_sent(), 1u);
    TEST_CHECK(starts_with(last_sent_in_handler, R"(42["client_diagnostic_pong",{"ping_id":"p-1","client_timestamp":")"));
    TEST_CHECK(last_sent_in_handler.find(R"("admin_session_id":"adm-9"}])") != std::string::npos);

    // A malformed ping is not answered
    session.connection().ws()->inject_message(R"(42["admin_diagnostic_ping",{"admin_session_id":"adm-9"}])");
    session.poll();
    TEST_CHECK_EQ(session.diagnostic_pongs_sent(), 1u);
    TEST_CHECK_EQ(handler_calls, 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group S4: typed routing
// -----------------------------------------------------------------------------
void test_typed_routing() {
    std::cout << "[TEST] Group S4: events routed to typed handlers\n";
    reset_environment();
    SessionUnderTest session{session_config()};
    session.connect();
    session.poll();

    std::vector<std::string> seen;
    session.on<schema::ObjectCollected>([&](const schema::ObjectCollected& ev) { seen.push_back("collected:" + ev.object_id); });
    session.on<schema::NpcDeleted>([&](const schema::NpcDeleted& ev) { seen.push_back("npc_deleted:" + ev.npc_id); });
    const auto interval_id = session.on<schema::LocationUpdateIntervalChanged>(
        [&](const schema::LocationUpdateIntervalChanged&) { seen.push_back("interval"); });

    struct Tracker { int resets = 0; };
    auto tracker = std::make_shared<Tracker>();
    session.on<schema::AllFindsReset, Tracker>(tracker, [](Tracker& t, const schema::AllFindsReset&) { ++t.resets; });

    auto* ws = session.connection().ws();
    ws->inject_message(R"(42["object_collected",{"object_id":"chest-7","found_by":"dev-1","found_at":"2025-06-01T10:00:00Z"}])");
    ws->inject_message(R"(42["npc_deleted",{"npc_id":"npc-4"}])");
    ws->inject_message(R"(42["npc_deleted",{}])");
    ws->inject_message(R"(42["all_finds_reset",{}])");
    TEST_CHECK_EQ(session.poll(), 4u);

    TEST_CHECK_EQ(seen.size(), 2u);
    TEST_CHECK_EQ(seen[0], std::string("collected:chest-7"));
    TEST_CHECK_EQ(seen[1], std::string("npc_deleted:npc-4"));
    TEST_CHECK_EQ(tracker->resets, 1);
    TEST_CHECK_EQ(session.router().dropped(), 1u);

    TEST_CHECK(session.remove_handler(interval_id));
    ws->inject_message(R"(42["location_update_interval_changed",{"interval_seconds":5}])");
    session.poll();
    TEST_CHECK_EQ(seen.size(), 2u);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group S5: signal observer
// -----------------------------------------------------------------------------
void test_signal_observer() {
    std::cout << "[TEST] Group S5: signal observer\n";
    reset_environment();
    SessionUnderTest session{session_config()};

    std::vector<transport::connection::Signal> signals;
    session.on_signal([&](transport::connection::Signal sig) { signals.push_back(sig); });

    session.connect();
    session.poll();
    session.disconnect();
    session.poll();

    TEST_CHECK_EQ(signals.size(), 2u);
    TEST_CHECK(signals[0] == transport::connection::Signal::Connected);
    TEST_CHECK(signals[1] == transport::connection::Signal::Disconnected);
    TEST_CHECK(session.display_status() == "Disconnected");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group S6: send gate
// -----------------------------------------------------------------------------
void test_send_rejected_when_offline() {
    std::cout << "[TEST] Group S6: sends rejected while offline\n";
    reset_environment();
    SessionUnderTest session{session_config()};

    TEST_CHECK(!session.send(schema::RegisterDevice{DEVICE_UUID}));
    TEST_CHECK(!session.send_event("custom", "{}"));

    session.connect();
    session.poll();
    TEST_CHECK(session.send_event("custom", R"({"k":1})"));
    TEST_CHECK_EQ(session.connection().ws()->sent().back(), std::string(R"(42["custom",{"k":1}])"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_register_device_per_handshake();
    test_registration_disabled();
    test_diagnostic_pong_first();
    test_typed_routing();
    test_signal_observer();
    test_send_rejected_when_offline();

    std::cout << "\n[GROUP S - SESSION TESTS PASSED]\n";
    return 0;
}
