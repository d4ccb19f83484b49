#pragma once

#include <cstdint>
#include <string_view>

namespace raidlink::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

Semantic transport failures, abstracted away from library-specific error codes
(Boost.Asio / Boost.Beast / OpenSSL). The Beast transport maps its
error_code values onto this enum; everything above the transport only ever
sees these values.

to_string() is the stable identifier used in logs.
describe() is the human-readable, cause-specific text carried by
ConnectionState::Error and by diagnostic results.
===============================================================================
*/

enum class Error : uint8_t {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,         // Base URL cannot be turned into a ws:// or wss:// endpoint
    InvalidState,       // Operation not allowed in current state

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,      // Closed intentionally by the local endpoint
    RemoteClosed,       // Remote endpoint closed the connection (CLOSE frame or EOF)

    // --- Transient / recoverable failures -----------------------------------
    HostUnreachable,    // DNS resolution failed or TCP connect refused/unroutable
    Timeout,            // Transport operation timed out
    HandshakeTimeout,   // Transport is up but the Socket.IO handshake never completed
    TlsFailure,         // TLS negotiation failed
    HandshakeFailed,    // WebSocket upgrade rejected by the server

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,      // Invalid frame or protocol violation

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure,   // Unclassified transport failure
};


inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::HostUnreachable:   return "HostUnreachable";
    case Error::Timeout:           return "Timeout";
    case Error::HandshakeTimeout:  return "HandshakeTimeout";
    case Error::TlsFailure:        return "TlsFailure";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

// Human-readable cause, suitable for surfacing to an operator.
// Never empty.
inline constexpr std::string_view describe(Error err) noexcept {
    switch (err) {
    case Error::None:              return "no error";
    case Error::InvalidUrl:        return "invalid server URL (expected http://, https://, ws:// or wss:// with a host)";
    case Error::InvalidState:      return "operation not allowed in the current connection state";
    case Error::LocalShutdown:     return "connection closed locally";
    case Error::RemoteClosed:      return "server closed the connection";
    case Error::HostUnreachable:   return "host unreachable (DNS failure or connection refused; check the server address and that the server is running)";
    case Error::Timeout:           return "timed out waiting for the server (check network and firewall)";
    case Error::HandshakeTimeout:  return "timed out waiting for the Socket.IO handshake (server accepted the socket but never joined the namespace)";
    case Error::TlsFailure:        return "TLS negotiation failed (check certificate and https/wss scheme)";
    case Error::HandshakeFailed:   return "WebSocket upgrade rejected (check the server path and that it speaks Socket.IO)";
    case Error::ProtocolError:     return "protocol violation on the WebSocket stream";
    case Error::TransportFailure:  return "unexpected network failure";
    default:                       return "unknown transport error";
    }
}

} // namespace transport
} // namespace raidlink::core
