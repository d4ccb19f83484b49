#pragma once

#include <string_view>

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/websocket/error.hpp>

#include "raidlink/core/transport/error.hpp"


namespace raidlink::core::transport::beast {

// Maps Boost.Asio / Boost.Beast / OpenSSL error codes onto transport::Error.
// `fallback` names the phase the failure happened in; it is returned for
// codes that carry no more specific meaning.
[[nodiscard]]
inline Error classify(const boost::system::error_code& ec, Error fallback) noexcept {
    namespace net = boost::asio;
    namespace bst = boost::beast;

    if (!ec) {
        return Error::None;
    }
    if (ec == bst::error::timeout || ec == net::error::timed_out) {
        return Error::Timeout;
    }
    if (ec == bst::websocket::error::closed || ec == net::error::eof ||
        ec == net::error::connection_reset || ec == net::error::connection_aborted ||
        ec == net::error::broken_pipe) {
        return Error::RemoteClosed;
    }
    if (ec == net::error::host_not_found || ec == net::error::host_not_found_try_again ||
        ec == net::error::no_data || ec == net::error::no_recovery ||
        ec == net::error::connection_refused || ec == net::error::network_unreachable ||
        ec == net::error::host_unreachable) {
        return Error::HostUnreachable;
    }
    if (ec.category() == net::error::get_ssl_category() || ec == net::ssl::error::stream_truncated) {
        return Error::TlsFailure;
    }
    const std::string_view category = ec.category().name();
    if (category == "beast.http" ||
        ec == bst::websocket::error::upgrade_declined || ec == bst::websocket::error::no_connection_upgrade) {
        return Error::HandshakeFailed;
    }
    if (category == "boost.beast.websocket") {
        return Error::ProtocolError;
    }
    return fallback;
}

} // namespace raidlink::core::transport::beast
