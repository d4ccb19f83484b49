/*
===============================================================================
 diagnostics::PortScan - Group Q Unit Tests
===============================================================================

Scope:
------
These tests validate the multi-port scan: one isolated connection test per
candidate port, a single winner, and a cause for every other port.

Covered Requirements:
---------------------
Q1. split_endpoint() / default_port()
Q2. Candidate ports: configured port first, no duplicates
Q3. First port to complete the handshake is the only winner
Q4. Ports that connect after the winner are reported as failures
Q5. Slow ports finish on their own per-port timeout
Q6. No winner when every port fails
Q7. Unusable base URL refuses to start

Non-Goals:
----------
- Real network traffic

===============================================================================
*/

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "raidlink/core/diagnostics/port_scan.hpp"
#include "raidlink/core/diagnostics/report.hpp"
#include "common/manual_clock.hpp"
#include "common/mock_websocket.hpp"
#include "common/test_check.hpp"

using namespace std::chrono_literals;
using namespace raidlink::core;
using raidlink::test::ManualClock;
using transport::test::MockWebSocket;

using ScanUnderTest = diagnostics::PortScan<MockWebSocket, ManualClock>;

namespace {

void fresh() {
    ManualClock::reset();
    MockWebSocket::reset();
}

MockWebSocket::Script refused() {
    MockWebSocket::Script s;
    s.connect_result = transport::Error::HostUnreachable;
    return s;
}

MockWebSocket::Script silent() {
    MockWebSocket::Script s;
    s.open_session = false;
    return s;
}

} // namespace


// -----------------------------------------------------------------------------
// Group Q1: endpoint parsing
// -----------------------------------------------------------------------------
void test_split_endpoint() {
    std::cout << "[TEST] Group Q1: split_endpoint / default_port\n";
    std::string scheme;
    std::string host;
    std::uint16_t port = 0;

    TEST_CHECK(diagnostics::split_endpoint("http://192.168.1.20:5001/socket", scheme, host, port));
    TEST_CHECK_EQ(scheme, std::string("http"));
    TEST_CHECK_EQ(host, std::string("192.168.1.20"));
    TEST_CHECK_EQ(port, 5001);

    TEST_CHECK(diagnostics::split_endpoint("https://game.example.com", scheme, host, port));
    TEST_CHECK_EQ(host, std::string("game.example.com"));
    TEST_CHECK_EQ(port, 0);
    TEST_CHECK_EQ(diagnostics::default_port(scheme), 443);
    TEST_CHECK_EQ(diagnostics::default_port("http"), 80);

    TEST_CHECK(!diagnostics::split_endpoint("192.168.1.20:5001", scheme, host, port));
    TEST_CHECK(!diagnostics::split_endpoint("http://:5001", scheme, host, port));
    TEST_CHECK(!diagnostics::split_endpoint("http://host:0", scheme, host, port));
    TEST_CHECK(!diagnostics::split_endpoint("http://host:70000", scheme, host, port));
    TEST_CHECK(!diagnostics::split_endpoint("http://host:50x1", scheme, host, port));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group Q2: candidate ports
// -----------------------------------------------------------------------------
void test_candidate_ports() {
    std::cout << "[TEST] Group Q2: configured port first, no duplicates\n";

    const auto known = diagnostics::candidate_ports(8080);
    TEST_CHECK_EQ(known.size(), diagnostics::common_ports().size());
    TEST_CHECK_EQ(known.front(), 8080);
    TEST_CHECK_EQ(std::count(known.begin(), known.end(), std::uint16_t{8080}), 1);

    const auto custom = diagnostics::candidate_ports(9000);
    TEST_CHECK_EQ(custom.size(), diagnostics::common_ports().size() + 1);
    TEST_CHECK_EQ(custom.front(), 9000);
    TEST_CHECK_EQ(custom[1], diagnostics::common_ports().front());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group Q3 / Q4 / Q5: mixed outcomes
// -----------------------------------------------------------------------------
void test_mixed_scan() {
    std::cout << "[TEST] Group Q3-Q5: single winner, late successes, per-port timeout\n";
    fresh();
    MockWebSocket::set_port_script("5000", refused());
    MockWebSocket::set_port_script("8080", silent());

    ScanUnderTest scan{"http://127.0.0.1:5001", {5001, 5000, 8080, 3000}, 3s};
    TEST_CHECK(scan.start());
    TEST_CHECK_EQ(MockWebSocket::connect_calls(), 4);
    TEST_CHECK(MockWebSocket::find("3000") != nullptr);

    TEST_CHECK(!scan.poll());       // 8080 still waiting for its session
    const auto& r = scan.result();
    TEST_CHECK_EQ(r.host, std::string("127.0.0.1"));
    TEST_CHECK(r.found());
    TEST_CHECK_EQ(*r.winner, 5001);
    TEST_CHECK_EQ(r.failures.size(), 2u);

    TEST_CHECK_EQ(r.failures[0].port, 5000);
    TEST_CHECK(r.failures[0].error == transport::Error::HostUnreachable);

    TEST_CHECK_EQ(r.failures[1].port, 3000);
    TEST_CHECK(r.failures[1].error == transport::Error::None);
    TEST_CHECK(r.failures[1].message.find("port 5001 answered first") != std::string::npos);

    ManualClock::advance(2999ms);
    TEST_CHECK(!scan.poll());
    ManualClock::advance(1ms);
    TEST_CHECK(scan.poll());
    TEST_CHECK_EQ(r.failures.size(), 3u);
    TEST_CHECK_EQ(r.failures[2].port, 8080);
    TEST_CHECK(r.failures[2].error == transport::Error::HandshakeTimeout);
    TEST_CHECK_EQ(*r.winner, 5001);

    // Every probe closed its transport
    TEST_CHECK_EQ(MockWebSocket::live_count(), 0u);

    const std::string text = r.summary();
    TEST_CHECK(text.find("[OK] Port 5001 speaks Socket.IO") != std::string::npos);
    TEST_CHECK(text.find("[--] Port 8080") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group Q6: no winner
// -----------------------------------------------------------------------------
void test_no_winner() {
    std::cout << "[TEST] Group Q6: every port fails\n";
    fresh();
    MockWebSocket::set_default_script(refused());

    ScanUnderTest scan{"http://10.1.1.1:5001", {5001, 5000}};
    TEST_CHECK(scan.start());
    TEST_CHECK(scan.poll());
    TEST_CHECK(!scan.result().found());
    TEST_CHECK_EQ(scan.result().failures.size(), 2u);
    TEST_CHECK(scan.result().summary().find("[FAIL] No port answered") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group Q7: unusable URL
// -----------------------------------------------------------------------------
void test_unusable_url() {
    std::cout << "[TEST] Group Q7: scan refuses an unusable URL\n";
    fresh();
    ScanUnderTest scan{"http://", {5001}};
    TEST_CHECK(!scan.start());
    TEST_CHECK(scan.done());
    TEST_CHECK(scan.poll());
    TEST_CHECK_EQ(MockWebSocket::connect_calls(), 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_split_endpoint();
    test_candidate_ports();
    test_mixed_scan();
    test_no_winner();
    test_unusable_url();

    std::cout << "\n[GROUP Q - PORT SCAN TESTS PASSED]\n";
    return 0;
}
