#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "raidlink/core/diagnostics/connection_test.hpp"
#include "raidlink/core/diagnostics/http_test.hpp"
#include "raidlink/core/diagnostics/port_scan.hpp"
#include "raidlink/core/diagnostics/result.hpp"
#include "raidlink/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace raidlink::core::diagnostics {

// Ports a development server is usually found on
inline const std::vector<std::uint16_t>& common_ports() {
    static const std::vector<std::uint16_t> ports{5001, 5000, 8080, 3000, 8000, 80, 443};
    return ports;
}

// Candidate list with the configured port first and no duplicates
[[nodiscard]]
inline std::vector<std::uint16_t> candidate_ports(std::uint16_t configured) {
    std::vector<std::uint16_t> out;
    out.reserve(common_ports().size() + 1);
    out.push_back(configured);
    for (std::uint16_t p : common_ports()) {
        if (p != configured) {
            out.push_back(p);
        }
    }
    return out;
}

/*
===============================================================================
 Report
===============================================================================

Full diagnostic run against one server URL. Three isolated probes run side
by side:

  1. HTTP connectivity (GET {base}/health)
  2. Single Socket.IO connection test against the configured URL
  3. Port scan over candidate_ports(configured port)

The report is done when all three are. A bare "host:port" input is accepted
and treated as http://.
===============================================================================
*/
template<
    transport::WebSocketConcept WS,
    transport::HttpGetConcept Getter,
    timer::ClockConcept Clock = std::chrono::steady_clock
>
class Report {
public:
    explicit Report(std::string server_url, std::vector<std::uint16_t> ports = {})
        : server_url_(std::move(server_url))
        , base_url_(transport::normalize_base_url(server_url_))
        , extra_ports_(std::move(ports))
    {}

    Report(const Report&) = delete;
    Report& operator=(const Report&) = delete;

    inline void start() {
        std::string scheme;
        std::string host;
        std::uint16_t port = 0;
        if (!split_endpoint(base_url_, scheme, host, port)) {
            error_ = "Invalid server URL: " + server_url_ + ". Use a format like http://192.168.1.20:5001";
            RL_WARN("[DIAG] " << error_);
            done_ = true;
            return;
        }
        if (port == 0) {
            port = default_port(scheme);
        }
        RL_INFO("[DIAG] Running diagnostics for " << host << ":" << port);

        http_ = std::make_unique<HttpTest<Getter>>(base_url_);
        http_->start();

        connection_ = std::make_unique<ConnectionTest<WS, Clock>>(base_url_);
        connection_->start();

        std::vector<std::uint16_t> ports = extra_ports_.empty() ? candidate_ports(port) : extra_ports_;
        scan_ = std::make_unique<PortScan<WS, Clock>>(base_url_, std::move(ports));
        (void)scan_->start();
    }

    // Returns true once every probe is final
    inline bool poll() {
        if (done_) {
            return true;
        }
        const bool http_done = http_->poll();
        const bool conn_done = connection_->poll();
        const bool scan_done = scan_->poll();
        done_ = http_done && conn_done && scan_done;
        if (done_) {
            RL_INFO("[DIAG] Diagnostics complete");
        }
        return done_;
    }

    inline void cancel() {
        if (http_) http_->cancel();
        if (connection_) connection_->cancel();
        if (scan_) scan_->cancel();
        done_ = true;
    }

    [[nodiscard]] inline bool done() const noexcept { return done_; }
    [[nodiscard]] inline const std::string& error() const noexcept { return error_; }

    [[nodiscard]]
    inline std::optional<HttpTestResult> http_result() const {
        return http_ ? std::optional<HttpTestResult>(http_->result()) : std::nullopt;
    }

    [[nodiscard]]
    inline std::optional<ConnectionResult> connection_result() const {
        return connection_ ? std::optional<ConnectionResult>(connection_->result()) : std::nullopt;
    }

    [[nodiscard]]
    inline std::optional<PortScanResult> port_scan_result() const {
        return scan_ ? std::optional<PortScanResult>(scan_->result()) : std::nullopt;
    }

    [[nodiscard]]
    inline std::string summary() const {
        std::ostringstream oss;
        oss << "Network Diagnostics for " << server_url_ << "\n";
        if (http_) {
            oss << "\nHTTP Test:\n  " << http_->result().summary() << "\n";
        }
        if (connection_) {
            oss << "\nSocket.IO Connection Test:\n  " << connection_->result().summary() << "\n";
        }
        if (scan_) {
            oss << "\nCommon Ports Test (" << scan_->result().host << "):\n";
            scan_->result().dump(oss);
        }
        if (!error_.empty()) {
            oss << "\nError: " << error_ << "\n";
        }
        return oss.str();
    }

#ifdef RL_UNIT_TEST
public:
    HttpTest<Getter>* http_test() noexcept {
        return http_.get();
    }
#endif // RL_UNIT_TEST

private:
    std::string server_url_;
    std::string base_url_;
    std::vector<std::uint16_t> extra_ports_;

    std::unique_ptr<HttpTest<Getter>> http_;
    std::unique_ptr<ConnectionTest<WS, Clock>> connection_;
    std::unique_ptr<PortScan<WS, Clock>> scan_;

    std::string error_;
    bool done_ = false;
};

} // namespace raidlink::core::diagnostics
