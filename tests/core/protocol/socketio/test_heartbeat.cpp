/*
===============================================================================
 protocol::socketio::Heartbeat - Group L Unit Tests
===============================================================================

Scope:
------
These tests validate the heartbeat ledger and the staleness verdict, driven
by a manual clock.

Covered Requirements:
---------------------
L1. Server pings and pongs are recorded and reset the failure count
L2. No liveness signal -> one failure per check, LivenessThreatened once
    when the limit is crossed
L3. A fresh signal after the threat re-arms the verdict
L4. Active policy asks for a client ping every interval; Passive never does
L5. stop() forgets the ledger and silences every timer
L6. Pongs alone keep the connection fresh (no server pings needed)

Non-Goals:
----------
- Closing the connection (the verdict is advisory)
- Frame encoding

===============================================================================
*/

#include <chrono>
#include <iostream>

#include "raidlink/core/protocol/policy/liveness.hpp"
#include "raidlink/core/protocol/socketio/heartbeat.hpp"
#include "common/manual_clock.hpp"
#include "common/test_check.hpp"

using namespace std::chrono_literals;
using namespace raidlink::core::protocol;
using raidlink::test::ManualClock;

using HeartbeatUnderTest = socketio::Heartbeat<ManualClock>;

namespace {

HeartbeatUnderTest::Config short_config(policy::Liveness liveness = policy::Liveness::Passive) {
    HeartbeatUnderTest::Config cfg;
    cfg.liveness       = liveness;
    cfg.grace          = 1s;
    cfg.check_interval = 10s;
    cfg.stale_after    = 10s;
    cfg.failure_limit  = 3;
    cfg.ping_interval  = 5s;
    return cfg;
}

} // namespace


// -----------------------------------------------------------------------------
// Group L1: ledger
// -----------------------------------------------------------------------------
void test_ledger_records_signals() {
    std::cout << "[TEST] Group L1: ledger records pings and pongs\n";
    ManualClock::reset();
    HeartbeatUnderTest hb{short_config()};
    hb.start();

    TEST_CHECK(!hb.ledger().last_inbound_server_ping_at);
    hb.on_server_ping();
    TEST_CHECK(hb.ledger().last_inbound_server_ping_at == ManualClock::now());

    ManualClock::advance(2s);
    hb.on_ping_sent();
    hb.on_pong();
    TEST_CHECK(hb.ledger().last_outbound_ping_at == ManualClock::now());
    TEST_CHECK(hb.ledger().last_inbound_pong_at == ManualClock::now());
    TEST_CHECK_EQ(hb.ledger().consecutive_failures, 0u);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group L2: staleness verdict
// -----------------------------------------------------------------------------
void test_liveness_threatened_once() {
    std::cout << "[TEST] Group L2: threat raised once at the failure limit\n";
    ManualClock::reset();
    HeartbeatUnderTest hb{short_config()};
    hb.start();

    int threats = 0;
    // First check at grace + interval, then every interval
    ManualClock::advance(11s);
    threats += hb.poll().liveness_threatened;
    TEST_CHECK_EQ(hb.ledger().consecutive_failures, 1u);

    ManualClock::advance(10s);
    threats += hb.poll().liveness_threatened;
    TEST_CHECK_EQ(threats, 0);

    ManualClock::advance(10s);
    threats += hb.poll().liveness_threatened;
    TEST_CHECK_EQ(hb.ledger().consecutive_failures, 3u);
    TEST_CHECK_EQ(threats, 1);

    // Further failures do not repeat the verdict
    ManualClock::advance(10s);
    threats += hb.poll().liveness_threatened;
    TEST_CHECK_EQ(hb.ledger().consecutive_failures, 4u);
    TEST_CHECK_EQ(threats, 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group L3: recovery
// -----------------------------------------------------------------------------
void test_recovery_rearms_verdict() {
    std::cout << "[TEST] Group L3: fresh signal resets and re-arms\n";
    ManualClock::reset();
    HeartbeatUnderTest hb{short_config()};
    hb.start();

    ManualClock::advance(11s);
    (void)hb.poll();
    ManualClock::advance(10s);
    (void)hb.poll();
    ManualClock::advance(10s);
    TEST_CHECK(hb.poll().liveness_threatened);

    // A pong clears the failures; a recent signal passes the next check
    hb.on_pong();
    TEST_CHECK_EQ(hb.ledger().consecutive_failures, 0u);
    ManualClock::advance(10s);
    TEST_CHECK(!hb.poll().liveness_threatened);
    TEST_CHECK_EQ(hb.ledger().consecutive_failures, 0u);

    // Silence again: the verdict can fire a second time
    int threats = 0;
    for (int i = 0; i < 3; ++i) {
        ManualClock::advance(10s);
        threats += hb.poll().liveness_threatened;
    }
    TEST_CHECK_EQ(threats, 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group L4: client pings by policy
// -----------------------------------------------------------------------------
void test_client_ping_policy() {
    std::cout << "[TEST] Group L4: client pings follow the liveness policy\n";
    ManualClock::reset();

    HeartbeatUnderTest passive{short_config(policy::Liveness::Passive)};
    HeartbeatUnderTest active{short_config(policy::Liveness::Active)};
    passive.start();
    active.start();

    int passive_pings = 0;
    int active_pings = 0;
    for (int i = 0; i < 10; ++i) {
        ManualClock::advance(1s);
        passive_pings += passive.poll().send_ping;
        active_pings += active.poll().send_ping;
    }
    TEST_CHECK_EQ(passive_pings, 0);
    // Due at 1s and 6s
    TEST_CHECK_EQ(active_pings, 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group L5: stop
// -----------------------------------------------------------------------------
void test_stop_silences_timers() {
    std::cout << "[TEST] Group L5: stop() silences every timer\n";
    ManualClock::reset();
    HeartbeatUnderTest hb{short_config(policy::Liveness::Active)};
    hb.start();
    hb.on_server_ping();
    TEST_CHECK(hb.running());

    hb.stop();
    TEST_CHECK(!hb.running());
    TEST_CHECK(!hb.ledger().last_inbound_server_ping_at);

    ManualClock::advance(120s);
    const auto actions = hb.poll();
    TEST_CHECK(!actions.send_ping);
    TEST_CHECK(!actions.liveness_threatened);
    TEST_CHECK_EQ(hb.ledger().consecutive_failures, 0u);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group L6: pong-only liveness
// -----------------------------------------------------------------------------
void test_pongs_alone_keep_fresh() {
    std::cout << "[TEST] Group L6: pongs alone keep the connection fresh\n";
    ManualClock::reset();
    HeartbeatUnderTest hb{short_config(policy::Liveness::Active)};
    hb.start();

    // Server never pings; it only answers client pings
    int threats = 0;
    for (int i = 0; i < 60; ++i) {
        ManualClock::advance(1s);
        const auto actions = hb.poll();
        if (actions.send_ping) {
            hb.on_ping_sent();
            hb.on_pong();
        }
        threats += actions.liveness_threatened;
        TEST_CHECK_EQ(hb.ledger().consecutive_failures, 0u);
    }
    TEST_CHECK_EQ(threats, 0);
    TEST_CHECK(!hb.ledger().last_inbound_server_ping_at);
    TEST_CHECK(hb.ledger().last_inbound_pong_at.has_value());

    // Once pongs stop, the same checks start counting
    ManualClock::advance(21s);
    (void)hb.poll();
    TEST_CHECK(hb.ledger().consecutive_failures >= 1u);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_ledger_records_signals();
    test_liveness_threatened_once();
    test_recovery_rearms_verdict();
    test_client_ping_policy();
    test_stop_silences_timers();
    test_pongs_alone_keep_fresh();

    std::cout << "\n[GROUP L - HEARTBEAT TESTS PASSED]\n";
    return 0;
}
