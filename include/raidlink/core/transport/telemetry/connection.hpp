#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"

namespace raidlink::core::transport::telemetry {

// ============================================================================
// Connection Telemetry
//
// Observes connection-level decisions of transport::Connection.
// Mechanical facts only. Updated through RL_TL1 so a build without
// RAIDLINK_ENABLE_TELEMETRY_L1 pays nothing.
// ============================================================================

struct alignas(64) Connection final {
    // Lifecycle
    lcr::metrics::atomic::counter32 connect_calls_total;
    lcr::metrics::atomic::counter32 handshakes_completed_total;
    lcr::metrics::atomic::counter32 handshake_timeouts_total;
    lcr::metrics::atomic::counter32 transport_failures_total;
    lcr::metrics::atomic::counter32 disconnect_calls_total;

    // Retry
    lcr::metrics::atomic::counter32 reconnects_scheduled_total;

    // Frames
    lcr::metrics::atomic::counter64 frames_rx_total;
    lcr::metrics::atomic::counter64 frames_tx_total;
    lcr::metrics::atomic::counter64 unknown_frames_total;

    // Heartbeat
    lcr::metrics::atomic::counter32 liveness_warnings_total;

    // Send gating
    lcr::metrics::atomic::counter64 send_rejected_total;

    inline void copy_to(Connection& other) const noexcept {
        connect_calls_total.copy_to(other.connect_calls_total);
        handshakes_completed_total.copy_to(other.handshakes_completed_total);
        handshake_timeouts_total.copy_to(other.handshake_timeouts_total);
        transport_failures_total.copy_to(other.transport_failures_total);
        disconnect_calls_total.copy_to(other.disconnect_calls_total);
        reconnects_scheduled_total.copy_to(other.reconnects_scheduled_total);
        frames_rx_total.copy_to(other.frames_rx_total);
        frames_tx_total.copy_to(other.frames_tx_total);
        unknown_frames_total.copy_to(other.unknown_frames_total);
        liveness_warnings_total.copy_to(other.liveness_warnings_total);
        send_rejected_total.copy_to(other.send_rejected_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Connection Telemetry ===\n";
        os << "Lifecycle\n";
        os << "  Connect calls         : " << connect_calls_total.load() << '\n';
        os << "  Handshakes completed  : " << handshakes_completed_total.load() << '\n';
        os << "  Handshake timeouts    : " << handshake_timeouts_total.load() << '\n';
        os << "  Transport failures    : " << transport_failures_total.load() << '\n';
        os << "  Disconnect calls      : " << disconnect_calls_total.load() << '\n';
        os << "\nRetry\n";
        os << "  Reconnects scheduled  : " << reconnects_scheduled_total.load() << '\n';
        os << "\nFrames\n";
        os << "  Received              : " << frames_rx_total.load() << '\n';
        os << "  Sent                  : " << frames_tx_total.load() << '\n';
        os << "  Unknown               : " << unknown_frames_total.load() << '\n';
        os << "\nHeartbeat\n";
        os << "  Liveness warnings     : " << liveness_warnings_total.load() << '\n';
        os << "\nSend\n";
        os << "  Rejected              : " << send_rejected_total.load() << '\n';
    }
};

static_assert(std::is_standard_layout_v<Connection>, "telemetry::Connection must be standard layout");
static_assert(!std::is_polymorphic_v<Connection>, "telemetry::Connection must not be polymorphic");

} // namespace raidlink::core::transport::telemetry
