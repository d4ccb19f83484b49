#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "raidlink/core/config/ring_sizes.hpp"
#include "raidlink/core/transport/beast/error.hpp"
#include "raidlink/core/transport/parse_url.hpp"
#include "raidlink/core/transport/websocket/events.hpp"
#include "raidlink/core/transport/websocket_concept.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"


namespace raidlink::core::transport::beast {

/*
===============================================================================
 Boost.Beast WebSocket transport
===============================================================================

Implements transport::WebSocketConcept on top of Boost.Beast (ws:// and, via
OpenSSL, wss://).

 • connect() spawns a private IO thread running its own io_context and
   starts resolve -> TCP connect -> [TLS] -> WebSocket upgrade asynchronously
 • Every outcome is pushed into a lock-free SPSC ring as websocket::Event,
   drained by the owning Connection through poll_event()
 • The receive path is a self-re-arming async_read: the next read is issued
   only after the previous frame was handed to the ring. If the ring is full
   the frame is held back and delivery retried, so frames are never dropped
   and never reordered
 • Writes are queued on the IO thread, one async_write in flight at a time
 • close() is synchronous: it closes the socket (politely when possible),
   stops the io_context and joins the IO thread before returning
 • Close / Error are reported at most once per instance

One instance serves one connection attempt. The Connection creates a fresh
instance for every connect().
===============================================================================
*/

class WebSocket {
    using tcp        = boost::asio::ip::tcp;
    using PlainWs    = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using SecureWs   = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;
    using WorkGuard  = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    // Resolve + TCP connect + TLS + upgrade must finish within this window
    static constexpr std::chrono::seconds OPEN_TIMEOUT{30};
    // Upper bound for a polite close before the socket is torn down
    static constexpr std::chrono::milliseconds CLOSE_TIMEOUT{1000};
    // Retry period while the event ring is full
    static constexpr std::chrono::milliseconds BACKPRESSURE_RETRY{1};

public:
    WebSocket()
        : ssl_ctx_(boost::asio::ssl::context::tls_client)
        , resolver_(ioc_)
        , retry_timer_(ioc_)
        , close_timer_(ioc_)
    {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(boost::asio::ssl::verify_peer);
    }

    ~WebSocket() {
        close();
    }

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // -------------------------------------------------------------------------
    // transport::WebSocketConcept
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error connect(const ParsedUrl& url) noexcept {
        if (io_thread_.joinable()) {
            return Error::InvalidState;
        }
        try {
            url_ = url;
            if (url_.secure) {
                secure_ = std::make_unique<SecureWs>(ioc_, ssl_ctx_);
            } else {
                plain_ = std::make_unique<PlainWs>(ioc_);
            }
            work_.emplace(ioc_.get_executor());
            boost::asio::post(ioc_, [this] { do_resolve_(); });
            io_thread_ = std::thread([this] { run_io_(); });
        } catch (const std::exception& e) {
            RL_ERROR("[WS] Failed to start transport: " << e.what());
            return Error::TransportFailure;
        }
        RL_DEBUG("[WS] Connecting to " << url_.host << ":" << url_.port << url_.target
                 << (url_.secure ? " (TLS)" : ""));
        return Error::None;
    }

    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        if (!open_.load(std::memory_order_acquire) || closing_.load(std::memory_order_acquire)) {
            return false;
        }
        try {
            boost::asio::post(ioc_, [this, msg = std::string(text)]() mutable {
                write_queue_.push_back(std::move(msg));
                if (write_queue_.size() == 1) {
                    do_write_();
                }
            });
        } catch (const std::exception& e) {
            RL_ERROR("[WS] send() failed: " << e.what());
            return false;
        }
        return true;
    }

    inline void close() noexcept {
        if (!io_thread_.joinable()) {
            return;
        }
        closing_.store(true, std::memory_order_release);
        try {
            boost::asio::post(ioc_, [this] { do_close_(); });
        } catch (const std::exception& e) {
            RL_ERROR("[WS] close() could not schedule shutdown: " << e.what());
            ioc_.stop();
        }
        work_.reset();
        io_thread_.join();
        open_.store(false, std::memory_order_release);
        RL_DEBUG("[WS] Closed");
    }

    [[nodiscard]]
    inline bool poll_event(websocket::Event& out) noexcept {
        return events_.pop(out);
    }

private:
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    tcp::resolver resolver_;
    boost::asio::steady_timer retry_timer_;
    boost::asio::steady_timer close_timer_;
    std::optional<WorkGuard> work_;
    std::thread io_thread_;

    std::unique_ptr<PlainWs> plain_;
    std::unique_ptr<SecureWs> secure_;
    ParsedUrl url_;

    boost::beast::flat_buffer read_buffer_;
    std::deque<std::string> write_queue_;        // IO thread only
    std::deque<websocket::Event> pending_;       // IO thread only, held back by a full ring

    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
    bool reported_ = false;                      // Close/Error already emitted (IO thread only)

    lcr::lockfree::spsc_ring<websocket::Event, config::websocket_event_ring> events_;

    // Dispatches to whichever stream flavour this instance owns
    template<class F>
    inline void with_stream_(F&& f) {
        if (secure_) {
            f(*secure_);
        } else if (plain_) {
            f(*plain_);
        }
    }

    inline void run_io_() noexcept {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            RL_ERROR("[WS] IO thread terminated: " << e.what());
        }
    }

    // -------------------------------------------------------------------------
    // Event delivery (IO thread)
    // -------------------------------------------------------------------------

    // Returns true when everything queued so far reached the ring
    inline bool deliver_(websocket::Event&& ev) {
        pending_.push_back(std::move(ev));
        return flush_();
    }

    inline bool flush_() {
        while (!pending_.empty()) {
            if (!events_.push(std::move(pending_.front()))) {
                return false;
            }
            pending_.pop_front();
        }
        return true;
    }

    // Frames stay in order: reading resumes only once the backlog is gone
    inline void wait_for_room_() {
        retry_timer_.expires_after(BACKPRESSURE_RETRY);
        retry_timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec || closing_.load(std::memory_order_acquire)) {
                return;
            }
            if (flush_()) {
                do_read_();
            } else {
                wait_for_room_();
            }
        });
    }

    inline void fail_(const boost::system::error_code& ec, Error fallback, const char* what) {
        if (closing_.load(std::memory_order_acquire) || reported_) {
            return;
        }
        reported_ = true;
        open_.store(false, std::memory_order_release);
        const Error err = classify(ec, fallback);
        RL_DEBUG("[WS] " << what << " failed: " << ec.message() << " -> " << to_string(err));
        if (err == Error::RemoteClosed) {
            deliver_(websocket::Event::make_close());
        } else {
            deliver_(websocket::Event::make_error(err));
        }
        if (!pending_.empty()) {
            wait_for_room_control_();
        }
    }

    // Close/Error must not be lost either
    inline void wait_for_room_control_() {
        retry_timer_.expires_after(BACKPRESSURE_RETRY);
        retry_timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec || closing_.load(std::memory_order_acquire)) {
                return;
            }
            if (!flush_()) {
                wait_for_room_control_();
            }
        });
    }

    // -------------------------------------------------------------------------
    // Open sequence (IO thread)
    // -------------------------------------------------------------------------

    inline void do_resolve_() {
        resolver_.async_resolve(url_.host, url_.port,
            [this](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec) {
                    return fail_(ec, Error::HostUnreachable, "resolve");
                }
                do_connect_(results);
            });
    }

    inline void do_connect_(const tcp::resolver::results_type& results) {
        with_stream_([&](auto& ws) {
            auto& tcp_layer = boost::beast::get_lowest_layer(ws);
            tcp_layer.expires_after(OPEN_TIMEOUT);
            tcp_layer.async_connect(results,
                [this](const boost::system::error_code& ec, const tcp::endpoint&) {
                    if (ec) {
                        return fail_(ec, Error::HostUnreachable, "connect");
                    }
                    if (secure_) {
                        do_tls_handshake_();
                    } else {
                        do_upgrade_(*plain_);
                    }
                });
        });
    }

    inline void do_tls_handshake_() {
        auto& tls = secure_->next_layer();
        if (!SSL_set_tlsext_host_name(tls.native_handle(), url_.host.c_str())) {
            const boost::system::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
            return fail_(ec, Error::TlsFailure, "SNI");
        }
        tls.set_verify_callback(boost::asio::ssl::host_name_verification(url_.host));
        tls.async_handshake(boost::asio::ssl::stream_base::client,
            [this](const boost::system::error_code& ec) {
                if (ec) {
                    return fail_(ec, Error::TlsFailure, "TLS handshake");
                }
                do_upgrade_(*secure_);
            });
    }

    template<class Ws>
    inline void do_upgrade_(Ws& ws) {
        namespace bws = boost::beast::websocket;
        // The upgrade keeps the open timeout; once up, Beast's keepalive rules apply
        ws.set_option(bws::stream_base::decorator([](bws::request_type& req) {
            req.set(boost::beast::http::field::user_agent, "raidlink");
        }));
        ws.read_message_max(config::max_frame_size);
        const bool default_port = (url_.secure && url_.port == "443") || (!url_.secure && url_.port == "80");
        const std::string host = default_port ? url_.host : url_.host + ":" + url_.port;
        ws.async_handshake(host, url_.target,
            [this, &ws](const boost::system::error_code& ec) {
                if (ec) {
                    return fail_(ec, Error::HandshakeFailed, "WebSocket upgrade");
                }
                boost::beast::get_lowest_layer(ws).expires_never();
                ws.set_option(bws::stream_base::timeout::suggested(boost::beast::role_type::client));
                ws.text(true);
                open_.store(true, std::memory_order_release);
                RL_DEBUG("[WS] Upgrade complete");
                deliver_(websocket::Event::make_open());
                do_read_();
            });
    }

    // -------------------------------------------------------------------------
    // Receive loop (IO thread)
    // -------------------------------------------------------------------------

    inline void do_read_() {
        with_stream_([this](auto& ws) {
            ws.async_read(read_buffer_,
                [this](const boost::system::error_code& ec, std::size_t) {
                    if (ec) {
                        return fail_(ec, Error::TransportFailure, "read");
                    }
                    std::string text = boost::beast::buffers_to_string(read_buffer_.data());
                    read_buffer_.consume(read_buffer_.size());
                    if (deliver_(websocket::Event::make_message(std::move(text)))) [[likely]] {
                        do_read_();
                    } else {
                        RL_DEBUG("[WS] Event ring full, holding back reads");
                        wait_for_room_();
                    }
                });
        });
    }

    // -------------------------------------------------------------------------
    // Send path (IO thread)
    // -------------------------------------------------------------------------

    inline void do_write_() {
        with_stream_([this](auto& ws) {
            ws.async_write(boost::asio::buffer(write_queue_.front()),
                [this](const boost::system::error_code& ec, std::size_t) {
                    if (ec) {
                        write_queue_.clear();
                        return fail_(ec, Error::TransportFailure, "write");
                    }
                    write_queue_.pop_front();
                    if (!write_queue_.empty()) {
                        do_write_();
                    }
                });
        });
    }

    // -------------------------------------------------------------------------
    // Shutdown (IO thread)
    // -------------------------------------------------------------------------

    inline void do_close_() {
        retry_timer_.cancel();
        resolver_.cancel();
        close_timer_.expires_after(CLOSE_TIMEOUT);
        close_timer_.async_wait([this](const boost::system::error_code& ec) {
            if (!ec) {
                RL_DEBUG("[WS] Close handshake timed out, dropping socket");
                ioc_.stop();
            }
        });
        if (!open_.load(std::memory_order_acquire)) {
            with_stream_([](auto& ws) {
                boost::system::error_code ignored;
                boost::beast::get_lowest_layer(ws).socket().close(ignored);
            });
            ioc_.stop();
            return;
        }
        with_stream_([this](auto& ws) {
            ws.async_close(boost::beast::websocket::close_code::normal,
                [this](const boost::system::error_code& ec) {
                    if (ec) {
                        RL_DEBUG("[WS] Close handshake ended with: " << ec.message());
                    }
                    ioc_.stop();
                });
        });
    }
};

static_assert(transport::WebSocketConcept<WebSocket>);

} // namespace raidlink::core::transport::beast
