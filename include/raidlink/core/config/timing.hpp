/*
================================================================================
raidlink Timing Configuration
================================================================================

Compile-time defaults for every timer in the core. Runtime overrides live in
config::Client; these values are what a default-constructed Client carries.

  Connection
    HANDSHAKE_TIMEOUT        connect() -> Ready must complete within this window
    RECONNECT_DELAY          single-shot delay before a reconnection attempt

  Heartbeat
    HEARTBEAT_GRACE          delay between Ready and the first staleness check
    HEARTBEAT_CHECK_INTERVAL period of the staleness check
    HEARTBEAT_STALE_AFTER    liveness signal age that counts as a failure
    HEARTBEAT_FAILURE_LIMIT  consecutive failures before LivenessThreatened
    CLIENT_PING_INTERVAL     client-initiated ping period (Active liveness only)

  Health / diagnostics
    HEALTH_POLL_INTERVAL     out-of-band health check period
    HEALTH_CHECK_TIMEOUT     deadline for one health request
    DIAG_CONNECTION_TIMEOUT  single-connection test deadline
    DIAG_PORT_TIMEOUT        per-port deadline in a multi-port scan
    DIAG_HTTP_TIMEOUT        HTTP connectivity test deadline
================================================================================
*/
#pragma once

#include <chrono>
#include <cstdint>


namespace raidlink::core::config {

using namespace std::chrono_literals;

// -----------------------------------------------------------------------------
// Connection
// -----------------------------------------------------------------------------
inline constexpr std::chrono::milliseconds HANDSHAKE_TIMEOUT = 30s;
inline constexpr std::chrono::milliseconds RECONNECT_DELAY   = 5s;

// -----------------------------------------------------------------------------
// Heartbeat
// -----------------------------------------------------------------------------
inline constexpr std::chrono::milliseconds HEARTBEAT_GRACE          = 2s;
inline constexpr std::chrono::milliseconds HEARTBEAT_CHECK_INTERVAL = 60s;
inline constexpr std::chrono::milliseconds HEARTBEAT_STALE_AFTER    = 60s;
inline constexpr std::uint32_t             HEARTBEAT_FAILURE_LIMIT  = 3;
inline constexpr std::chrono::milliseconds CLIENT_PING_INTERVAL     = 30s;

// -----------------------------------------------------------------------------
// Health / diagnostics
// -----------------------------------------------------------------------------
inline constexpr std::chrono::milliseconds HEALTH_POLL_INTERVAL    = 10s;
inline constexpr std::chrono::milliseconds HEALTH_CHECK_TIMEOUT    = 5s;
inline constexpr std::chrono::milliseconds DIAG_CONNECTION_TIMEOUT = 5s;
inline constexpr std::chrono::milliseconds DIAG_PORT_TIMEOUT       = 3s;
inline constexpr std::chrono::milliseconds DIAG_HTTP_TIMEOUT       = 10s;

} // namespace raidlink::core::config
