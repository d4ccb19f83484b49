#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "raidlink/core/transport/error.hpp"


namespace raidlink::core::diagnostics {

/*
===============================================================================
Diagnostic result values
===============================================================================

Diagnostics never touch the primary connection; everything they learn is
reported through these values. Each has a one-line summary() for operators.
===============================================================================
*/

// Single-connection test
struct ConnectionResult {
    std::string url;
    bool connected = false;                                  // Reached NamespaceAck
    std::optional<std::chrono::milliseconds> handshake_latency;
    bool pong_received = false;                              // Answer to one client ping
    transport::Error error = transport::Error::None;
    std::string error_message;                               // describe(error), empty on success

    [[nodiscard]]
    inline std::string summary() const {
        std::ostringstream oss;
        if (connected) {
            oss << "[OK] Socket.IO handshake completed";
            if (handshake_latency) {
                oss << " in " << handshake_latency->count() << "ms";
            }
            oss << (pong_received ? ", pong received" : ", no pong observed");
        } else {
            oss << "[FAIL] Socket.IO connection failed: " << error_message;
        }
        return oss.str();
    }
};

struct PortFailure {
    std::uint16_t port = 0;
    transport::Error error = transport::Error::None;         // None: port worked but lost the race
    std::string message;
};

// Multi-port scan
struct PortScanResult {
    std::string host;
    std::optional<std::uint16_t> winner;                     // First port to complete the handshake
    std::optional<std::chrono::milliseconds> winner_latency;
    std::vector<PortFailure> failures;                       // Every other port, in completion order

    [[nodiscard]] inline bool found() const noexcept { return winner.has_value(); }

    inline void dump(std::ostream& os) const {
        if (winner) {
            os << "  [OK] Port " << *winner << " speaks Socket.IO";
            if (winner_latency) {
                os << " (" << winner_latency->count() << "ms)";
            }
            os << '\n';
        } else {
            os << "  [FAIL] No port answered the Socket.IO handshake\n";
        }
        for (const auto& f : failures) {
            os << "  [--] Port " << f.port << ": " << f.message << '\n';
        }
    }

    [[nodiscard]]
    inline std::string summary() const {
        std::ostringstream oss;
        dump(oss);
        return oss.str();
    }
};

// HTTP connectivity test
struct HttpTestResult {
    std::string url;
    bool reachable = false;                                  // Any HTTP response received
    std::optional<unsigned> status_code;
    std::optional<std::chrono::milliseconds> latency;
    std::string error;

    [[nodiscard]]
    inline std::string summary() const {
        std::ostringstream oss;
        if (reachable) {
            oss << "[OK] HTTP reachable";
            if (latency) {
                oss << " (" << latency->count() << "ms)";
            }
            if (status_code) {
                oss << " (HTTP " << *status_code << ")";
            }
        } else {
            oss << "[FAIL] HTTP not reachable: " << (error.empty() ? "unknown error" : error);
        }
        return oss.str();
    }
};

} // namespace raidlink::core::diagnostics
