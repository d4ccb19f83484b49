#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "raidlink/core/transport/beast/error.hpp"
#include "raidlink/core/transport/error.hpp"
#include "raidlink/core/transport/http/result.hpp"
#include "raidlink/core/transport/http_get_concept.hpp"
#include "lcr/log/logger.hpp"


namespace raidlink::core::transport::beast {

/*
===============================================================================
 HttpGet: one non-blocking HTTP(S) GET
===============================================================================

start() launches the request on a private IO thread; done() / result() are
polled from the caller's thread. Nothing blocks except cancel() (and the
destructor), which stop the IO thread and join it.

The whole exchange (resolve, connect, TLS, request, response) is bounded by
the timeout given to start().
===============================================================================
*/
class HttpGet {
    using HttpResult = http::Result;
    using tcp = boost::asio::ip::tcp;

public:
    HttpGet() = default;

    ~HttpGet() {
        cancel();
    }

    HttpGet(const HttpGet&) = delete;
    HttpGet& operator=(const HttpGet&) = delete;

    [[nodiscard]]
    inline bool start(const std::string& url, std::chrono::milliseconds timeout) noexcept {
        if (worker_.joinable()) {
            if (!done()) {
                return false;   // previous request still in flight
            }
            cancel();
        }
        done_.store(false, std::memory_order_release);
        result_ = HttpResult{};
        if (!http::parse_url(url, url_)) {
            result_.error = Error::InvalidUrl;
            result_.detail = "not an http(s) URL: " + url;
            done_.store(true, std::memory_order_release);
            return true;
        }
        try {
            ctx_ = std::make_unique<Context>(url_.secure);
            started_at_ = std::chrono::steady_clock::now();
            boost::asio::post(ctx_->ioc, [this, timeout] { run_(timeout); });
            worker_ = std::thread([this] { ctx_->ioc.run(); });
        } catch (const std::exception& e) {
            RL_ERROR("[HTTP] Failed to start request: " << e.what());
            ctx_.reset();
            return false;
        }
        RL_DEBUG("[HTTP] GET " << url);
        return true;
    }

    [[nodiscard]] inline bool done() const noexcept { return done_.load(std::memory_order_acquire); }

    // PRECONDITION: done() == true
    [[nodiscard]] inline const HttpResult& result() const noexcept { return result_; }

    inline void cancel() noexcept {
        if (!worker_.joinable()) {
            return;
        }
        ctx_->ioc.stop();
        worker_.join();
        ctx_.reset();
    }

private:
    // Per-request IO state; rebuilt for every start()
    struct Context {
        explicit Context(bool secure)
            : ssl_ctx(boost::asio::ssl::context::tls_client)
            , resolver(ioc)
            , deadline(ioc)
        {
            if (secure) {
                ssl_ctx.set_default_verify_paths();
                ssl_ctx.set_verify_mode(boost::asio::ssl::verify_peer);
                tls.emplace(ioc, ssl_ctx);
            } else {
                plain.emplace(ioc);
            }
        }

        boost::asio::io_context ioc;
        boost::asio::ssl::context ssl_ctx;
        tcp::resolver resolver;
        boost::asio::steady_timer deadline;
        std::optional<boost::beast::tcp_stream> plain;
        std::optional<boost::beast::ssl_stream<boost::beast::tcp_stream>> tls;
        boost::beast::flat_buffer buffer;
        boost::beast::http::request<boost::beast::http::empty_body> request;
        boost::beast::http::response<boost::beast::http::string_body> response;
    };

    http::Url url_;
    std::unique_ptr<Context> ctx_;
    std::thread worker_;
    std::atomic<bool> done_{false};
    HttpResult result_;
    std::chrono::steady_clock::time_point started_at_{};

    template<class F>
    inline void with_stream_(F&& f) {
        if (ctx_->tls) {
            f(*ctx_->tls);
        } else {
            f(*ctx_->plain);
        }
    }

    inline boost::beast::tcp_stream& tcp_layer_() {
        return ctx_->tls ? boost::beast::get_lowest_layer(*ctx_->tls) : *ctx_->plain;
    }

    inline void finish_(Error err, std::string detail = {}) {
        if (done_.load(std::memory_order_acquire)) {
            return;
        }
        ctx_->deadline.cancel();
        result_.error = err;
        result_.detail = std::move(detail);
        result_.latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at_);
        boost::system::error_code ignored;
        tcp_layer_().socket().shutdown(tcp::socket::shutdown_both, ignored);
        tcp_layer_().socket().close(ignored);
        done_.store(true, std::memory_order_release);
        ctx_->ioc.stop();
    }

    inline void fail_(const boost::system::error_code& ec, Error fallback) {
        finish_(classify(ec, fallback), ec.message());
    }

    inline void run_(std::chrono::milliseconds timeout) {
        ctx_->deadline.expires_after(timeout);
        ctx_->deadline.async_wait([this, timeout](const boost::system::error_code& ec) {
            if (!ec) {
                finish_(Error::Timeout, "no response within " + std::to_string(timeout.count()) + " ms");
            }
        });
        ctx_->resolver.async_resolve(url_.host, url_.port,
            [this](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec) {
                    return fail_(ec, Error::HostUnreachable);
                }
                tcp_layer_().async_connect(results,
                    [this](const boost::system::error_code& ec, const tcp::endpoint&) {
                        if (ec) {
                            return fail_(ec, Error::HostUnreachable);
                        }
                        if (ctx_->tls) {
                            do_tls_();
                        } else {
                            do_request_();
                        }
                    });
            });
    }

    inline void do_tls_() {
        auto& tls = *ctx_->tls;
        if (!SSL_set_tlsext_host_name(tls.native_handle(), url_.host.c_str())) {
            return finish_(Error::TlsFailure, "cannot set SNI host name");
        }
        tls.set_verify_callback(boost::asio::ssl::host_name_verification(url_.host));
        tls.async_handshake(boost::asio::ssl::stream_base::client,
            [this](const boost::system::error_code& ec) {
                if (ec) {
                    return fail_(ec, Error::TlsFailure);
                }
                do_request_();
            });
    }

    inline void do_request_() {
        namespace bhttp = boost::beast::http;
        auto& req = ctx_->request;
        req.version(11);
        req.method(bhttp::verb::get);
        req.target(url_.target);
        const bool default_port = url_.port == (url_.secure ? "443" : "80");
        req.set(bhttp::field::host, default_port ? url_.host : url_.host + ':' + url_.port);
        req.set(bhttp::field::user_agent, "raidlink");
        req.set(bhttp::field::accept, "application/json");
        with_stream_([this](auto& stream) {
            bhttp::async_write(stream, ctx_->request,
                [this, &stream](const boost::system::error_code& ec, std::size_t) {
                    if (ec) {
                        return fail_(ec, Error::TransportFailure);
                    }
                    bhttp::async_read(stream, ctx_->buffer, ctx_->response,
                        [this](const boost::system::error_code& ec, std::size_t) {
                            if (ec) {
                                return fail_(ec, Error::TransportFailure);
                            }
                            result_.status = ctx_->response.result_int();
                            result_.body = std::move(ctx_->response.body());
                            finish_(Error::None);
                        });
                });
        });
    }
};

static_assert(HttpGetConcept<HttpGet>);

} // namespace raidlink::core::transport::beast
