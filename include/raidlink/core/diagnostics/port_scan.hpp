#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "raidlink/core/config/timing.hpp"
#include "raidlink/core/diagnostics/connection_test.hpp"
#include "raidlink/core/diagnostics/result.hpp"
#include "raidlink/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace raidlink::core::diagnostics {

// Splits "scheme://host[:port][/...]" into scheme, host and port.
// Port is 0 when absent. Returns false without scheme or host.
[[nodiscard]]
inline bool split_endpoint(std::string_view url, std::string& scheme, std::string& host, std::uint16_t& port) {
    const auto sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0) {
        return false;
    }
    scheme = std::string(url.substr(0, sep));
    std::string_view rest = url.substr(sep + 3);
    rest = rest.substr(0, rest.find_first_of("/?#"));
    const auto colon = rest.find(':');
    host = std::string(rest.substr(0, colon));
    port = 0;
    if (colon != std::string_view::npos) {
        unsigned value = 0;
        const std::string_view digits = rest.substr(colon + 1);
        if (digits.empty() || digits.size() > 5) {
            return false;
        }
        for (char c : digits) {
            if (c < '0' || c > '9') {
                return false;
            }
            value = value * 10 + static_cast<unsigned>(c - '0');
        }
        if (value == 0 || value > 65535) {
            return false;
        }
        port = static_cast<std::uint16_t>(value);
    }
    return !host.empty();
}

// Port implied by the scheme when the URL carries none
[[nodiscard]]
inline std::uint16_t default_port(std::string_view scheme) noexcept {
    return (scheme == "https" || scheme == "wss") ? 443 : 80;
}

/*
===============================================================================
 PortScan
===============================================================================

Runs one ConnectionTest per candidate port against the same host, all at
once, each with its own short timeout and no pong probing.

The first test to complete the handshake is the single winner; ties are
broken by the order in which poll() observes completion. Every other port,
including ones that also connected later, goes into the failure list with
its own cause. The scan is done when every test is.
===============================================================================
*/
template<
    transport::WebSocketConcept WS,
    timer::ClockConcept Clock = std::chrono::steady_clock
>
class PortScan {
public:
    PortScan(std::string base_url, std::vector<std::uint16_t> ports,
             std::chrono::milliseconds per_port_timeout = config::DIAG_PORT_TIMEOUT)
        : base_url_(transport::normalize_base_url(base_url))
        , ports_(std::move(ports))
        , timeout_(per_port_timeout)
    {}

    PortScan(const PortScan&) = delete;
    PortScan& operator=(const PortScan&) = delete;

    // False when the base URL has no usable scheme and host
    [[nodiscard]]
    inline bool start() {
        std::string scheme;
        std::uint16_t ignored = 0;
        if (!split_endpoint(base_url_, scheme, result_.host, ignored)) {
            RL_WARN("[DIAG] Port scan: cannot extract host from '" << base_url_ << "'");
            done_ = true;
            return false;
        }
        RL_INFO("[DIAG] Scanning " << ports_.size() << " port(s) on " << result_.host);
        for (std::uint16_t port : ports_) {
            auto& probe = probes_.emplace_back();
            probe.port = port;
            probe.test = std::make_unique<ConnectionTest<WS, Clock>>(
                scheme + "://" + result_.host + ":" + std::to_string(port), timeout_, /*probe_pong=*/false);
            probe.test->start();
        }
        done_ = probes_.empty();
        return true;
    }

    // Returns true once every port has a final outcome
    inline bool poll() {
        if (done_) {
            return true;
        }
        std::size_t pending = 0;
        for (auto& probe : probes_) {
            if (probe.reported) {
                continue;
            }
            if (!probe.test->poll()) {
                ++pending;
                continue;
            }
            probe.reported = true;
            record_(probe.port, probe.test->result());
        }
        done_ = (pending == 0);
        if (done_) {
            RL_INFO("[DIAG] Port scan finished" << (result_.winner ? ", winner port " + std::to_string(*result_.winner) : ", no winner"));
        }
        return done_;
    }

    inline void cancel() {
        for (auto& probe : probes_) {
            probe.test->cancel();
        }
        done_ = true;
    }

    [[nodiscard]] inline bool done() const noexcept { return done_; }
    [[nodiscard]] inline const PortScanResult& result() const noexcept { return result_; }
    [[nodiscard]] inline const std::vector<std::uint16_t>& ports() const noexcept { return ports_; }

private:
    struct Probe {
        std::uint16_t port = 0;
        std::unique_ptr<ConnectionTest<WS, Clock>> test;
        bool reported = false;
    };

    std::string base_url_;
    std::vector<std::uint16_t> ports_;
    std::chrono::milliseconds timeout_;

    std::vector<Probe> probes_;
    PortScanResult result_;
    bool done_ = false;

    inline void record_(std::uint16_t port, const ConnectionResult& r) {
        if (r.connected && !result_.winner) {
            result_.winner = port;
            result_.winner_latency = r.handshake_latency;
            RL_INFO("[DIAG] Port " << port << " completed the handshake first");
            return;
        }
        PortFailure failure;
        failure.port = port;
        if (r.connected) {
            failure.message = "handshake completed, but port " + std::to_string(*result_.winner) + " answered first";
        } else {
            failure.error = r.error;
            failure.message = r.error_message;
        }
        result_.failures.push_back(std::move(failure));
    }
};

} // namespace raidlink::core::diagnostics
