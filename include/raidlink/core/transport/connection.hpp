#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "raidlink/core/config/client.hpp"
#include "raidlink/core/config/ring_sizes.hpp"
#include "raidlink/core/protocol/socketio/codec.hpp"
#include "raidlink/core/protocol/socketio/frame.hpp"
#include "raidlink/core/protocol/socketio/handshake.hpp"
#include "raidlink/core/protocol/socketio/heartbeat.hpp"
#include "raidlink/core/telemetry.hpp"
#include "raidlink/core/timer/deadline.hpp"
#include "raidlink/core/transport/connection/signal.hpp"
#include "raidlink/core/transport/error.hpp"
#include "raidlink/core/transport/parse_url.hpp"
#include "raidlink/core/transport/state.hpp"
#include "raidlink/core/transport/telemetry/connection.hpp"
#include "raidlink/core/transport/websocket/events.hpp"
#include "raidlink/core/transport/websocket_concept.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"


namespace raidlink::core::transport {

/*
===============================================================================
 raidlink::core::transport::Connection
===============================================================================

Socket.IO connection manager, parameterized by a WebSocket transport
conforming to transport::WebSocketConcept and by a clock policy.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Derive the Engine.IO endpoint from the configured base URL
- Own the transport lifecycle (connect, disconnect, reconnect)
- Drive the Socket.IO handshake and answer server pings
- Watch the handshake deadline and the heartbeat ledger
- Hand application events to the owner once the handshake is Ready
- Expose state changes as edge-triggered connection::Signal values

-------------------------------------------------------------------------------
 State model
-------------------------------------------------------------------------------

   Disconnected --connect()--> Connecting --Ready--> Connected
        ^                         |                      |
        |                   failure/timeout         failure/close
        |                         v                      v
        +------disconnect()---- Error <------------------+
                                  |
                         reconnect timer (5 s) --> connect()

- connect() is a no-op while Connecting or Connected.
- disconnect() is a no-op while Disconnected with no pending reconnect.
- ConnectionState and HandshakeState are reset together by disconnect()
  and by every failure.
- Connected implies HandshakeState::Ready.

-------------------------------------------------------------------------------
 Execution model
-------------------------------------------------------------------------------
- No background logic: everything advances inside poll()
- The transport IO thread only produces websocket::Event values; all state
  lives on the poll() thread
- Frames are processed one at a time in arrival order. A server ping is
  answered before the next frame is looked at
- Timers are timer::Deadline / Periodic instances checked from poll()

-------------------------------------------------------------------------------
 Usage
-------------------------------------------------------------------------------
    telemetry::Connection telemetry;
    Connection<beast::WebSocket> conn{cfg, telemetry};
    conn.connect();
    while (running) {
        conn.poll();
        connection::Signal sig;
        while (conn.poll_signal(sig)) { ... }
        protocol::socketio::frame::Event ev;
        while (conn.poll_event(ev)) { ... }
    }
===============================================================================
*/

template <
    transport::WebSocketConcept WS,
    timer::ClockConcept Clock = std::chrono::steady_clock
>
class Connection {
public:
    using clock_type   = Clock;
    using EventFrame   = protocol::socketio::frame::Event;
    using Heartbeat    = protocol::socketio::Heartbeat<Clock>;

    Connection(config::Client cfg, telemetry::Connection& telemetry)
        : cfg_(std::move(cfg))
        , telemetry_(telemetry)
        , heartbeat_(make_heartbeat_config_(cfg_))
    {}

    // Never reconnects after the object is gone
    ~Connection() {
        disconnect();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    inline void connect() noexcept {
        RL_TL1( telemetry_.connect_calls_total.inc() );
        if (state_ == State::Connecting || state_ == State::Connected) {
            RL_DEBUG("[CONN] connect() ignored (state: " << to_string(state_) << ")");
            return;
        }
        reconnect_timer_.cancel();

        // 1) Endpoint derivation must succeed before the FSM starts
        ParsedUrl endpoint;
        Error err = derive_socket_url(cfg_.base_url, socket_url_);
        if (err == Error::None) {
            err = parse_url(socket_url_, endpoint);
        }
        if (err != Error::None) {
            RL_ERROR("[CONN] Cannot derive socket URL from '" << cfg_.base_url << "'");
            enter_error_(err, /*retry=*/false);
            return;
        }
        RL_INFO("[CONN] Connecting to " << socket_url_);

        // 2) Enter FSM
        transition_(Event::ConnectRequested);

        // 3) Fresh transport instance per attempt (TLS context setup may throw)
        try {
            ws_ = std::make_unique<WS>();
        } catch (const std::exception& e) {
            RL_ERROR("[CONN] Transport could not be created: " << e.what());
            transition_(Event::TransportFailed, Error::TransportFailure);
            return;
        }
        err = ws_->connect(endpoint);
        if (err != Error::None) {
            RL_ERROR("[CONN] Transport could not start (" << to_string(err) << ")");
            transition_(Event::TransportFailed, err);
        }
    }

    // Cancels every timer, closes the socket, and resets both state machines.
    // Safe to call repeatedly and from error paths.
    inline void disconnect() noexcept {
        if (state_ == State::Disconnected && !reconnect_timer_.armed() && !ws_) {
            return;
        }
        RL_TL1( telemetry_.disconnect_calls_total.inc() );
        transition_(Event::DisconnectRequested);
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------

    // Application event 42["name",payload]. Rejected unless Connected.
    [[nodiscard]]
    inline bool send_event(std::string_view name, std::string_view payload_json) noexcept {
        if (state_ != State::Connected) {
            RL_WARN("[CONN] send_event('" << name << "') rejected (state: " << to_string(state_) << ")");
            RL_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        return send_raw_(protocol::socketio::Codec::encode_event(name, payload_json));
    }

    // Client-initiated heartbeat probe. Rejected unless Connected.
    [[nodiscard]]
    inline bool send_ping() noexcept {
        if (state_ != State::Connected) {
            RL_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        if (!send_raw_(protocol::socketio::Codec::encode_ping())) {
            return false;
        }
        heartbeat_.on_ping_sent();
        return true;
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    inline void poll() noexcept {
        // === Drain transport events (a failure drops the transport) ===
        websocket::Event ev;
        while (ws_ && ws_->poll_event(ev)) {
            handle_transport_event_(ev);
        }
        // === Handshake deadline ===
        if (handshake_timer_.expired()) {
            RL_WARN("[CONN] Handshake not completed within " << cfg_.handshake_timeout.count()
                    << "ms (handshake: " << protocol::socketio::to_string(handshake_.state()) << ")");
            RL_TL1( telemetry_.handshake_timeouts_total.inc() );
            transition_(Event::HandshakeTimedOut, Error::HandshakeTimeout);
        }
        // === Reconnection ===
        if (reconnect_timer_.expired()) {
            RL_INFO("[CONN] Reconnect timer expired, reconnecting");
            transition_(Event::ReconnectTimerExpired);
        }
        // === Heartbeat ===
        if (state_ == State::Connected) {
            const auto actions = heartbeat_.poll();
            if (actions.send_ping) {
                (void)send_ping();
            }
            if (actions.liveness_threatened) {
                RL_TL1( telemetry_.liveness_warnings_total.inc() );
                emit_(connection::Signal::LivenessThreatened);
            }
        }
    }

    [[nodiscard]]
    inline bool poll_signal(connection::Signal& out) noexcept {
        return signals_.pop(out);
    }

    // Application events received while Connected, in arrival order
    [[nodiscard]]
    inline bool poll_event(EventFrame& out) noexcept {
        if (inbox_.empty()) {
            return false;
        }
        out = std::move(inbox_.front());
        inbox_.pop_front();
        return true;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] inline State state() const noexcept { return state_; }
    [[nodiscard]] inline Error error() const noexcept { return last_error_; }

    // Non-empty exactly when state() == State::Error
    [[nodiscard]] inline const std::string& error_message() const noexcept { return error_message_; }

    [[nodiscard]]
    inline protocol::socketio::HandshakeState handshake_state() const noexcept {
        return handshake_.state();
    }

    [[nodiscard]] inline const protocol::socketio::Handshake& handshake() const noexcept { return handshake_; }
    [[nodiscard]] inline const typename Heartbeat::Ledger& heartbeat_ledger() const noexcept { return heartbeat_.ledger(); }

    // Number of handshakes that reached Ready
    [[nodiscard]] inline std::uint64_t epoch() const noexcept { return epoch_; }

    [[nodiscard]] inline bool reconnect_pending() const noexcept { return reconnect_timer_.armed(); }
    [[nodiscard]] inline const std::string& socket_url() const noexcept { return socket_url_; }
    [[nodiscard]] inline const config::Client& config() const noexcept { return cfg_; }

    [[nodiscard]] inline std::uint64_t rx_frames() const noexcept { return rx_frames_; }
    [[nodiscard]] inline std::uint64_t tx_frames() const noexcept { return tx_frames_; }

    // "Connected", "Connecting...", "Error: <cause>", ...
    [[nodiscard]]
    inline std::string display_status() const {
        switch (state_) {
            case State::Connecting: return "Connecting...";
            case State::Error:      return "Error: " + error_message_;
            default:                return std::string(to_string(state_));
        }
    }

#ifdef RL_UNIT_TEST
public:
    WS* ws() noexcept {
        return ws_.get();
    }
#endif // RL_UNIT_TEST

private:
    config::Client cfg_;
    telemetry::Connection& telemetry_;              // Not owned
    std::unique_ptr<WS> ws_;                        // One instance per attempt
    std::string socket_url_;

    protocol::socketio::Codec codec_;
    protocol::socketio::Handshake handshake_;
    Heartbeat heartbeat_;

    timer::Deadline<Clock> handshake_timer_;
    timer::Deadline<Clock> reconnect_timer_;

    State state_{State::Disconnected};
    Error last_error_{Error::None};
    std::string error_message_;
    std::uint64_t epoch_{0};
    std::uint64_t rx_frames_{0};
    std::uint64_t tx_frames_{0};

    lcr::lockfree::spsc_ring<connection::Signal, config::signal_ring> signals_;
    std::deque<EventFrame> inbox_;

    [[nodiscard]]
    static typename Heartbeat::Config make_heartbeat_config_(const config::Client& cfg) noexcept {
        typename Heartbeat::Config hb;
        hb.liveness       = cfg.liveness;
        hb.grace          = cfg.heartbeat_grace;
        hb.check_interval = cfg.heartbeat_check_interval;
        hb.stale_after    = cfg.heartbeat_stale_after;
        hb.failure_limit  = cfg.heartbeat_failure_limit;
        hb.ping_interval  = cfg.client_ping_interval;
        return hb;
    }

    inline void emit_(connection::Signal sig) noexcept {
        RL_TRACE("[CONN] Emitting signal: " << to_string(sig));
        if (!signals_.push(sig)) [[unlikely]] {
            RL_WARN("[CONN] Signal '" << to_string(sig) << "' dropped (signal ring full, poll_signal() is not being drained)");
        }
    }

    inline void set_state_(State s) noexcept {
        RL_TRACE("[CONN] State: " << to_string(state_) << " -> " << to_string(s));
        state_ = s;
    }

    // -------------------------------------------------------------------------
    // Transport input
    // -------------------------------------------------------------------------

    inline void handle_transport_event_(websocket::Event& ev) {
        switch (ev.type) {
        case websocket::EventType::Open:
            RL_DEBUG("[CONN] WebSocket open, awaiting Engine.IO session");
            break;

        case websocket::EventType::Message:
            ++rx_frames_;
            RL_TL1( telemetry_.frames_rx_total.inc() );
            RL_TRACE("[CONN] <- " << ev.payload);
            handle_frame_(codec_.decode(ev.payload));
            break;

        case websocket::EventType::Close:
            RL_WARN("[CONN] Server closed the connection (state: " << to_string(state_) << ")");
            transition_(Event::TransportClosed, Error::RemoteClosed);
            break;

        case websocket::EventType::Error:
            RL_ERROR("[CONN] Transport error: " << to_string(ev.error));
            transition_(Event::TransportFailed, ev.error);
            break;

        default:
            break;
        }
    }

    inline void handle_frame_(protocol::socketio::Frame&& f) {
        using namespace protocol::socketio;
        switch (type_of(f)) {
        case FrameType::Ping:
            // Answer before anything else is processed
            (void)send_raw_(Codec::encode_pong());
            heartbeat_.on_server_ping();
            return;

        case FrameType::Pong:
            heartbeat_.on_pong();
            return;

        case FrameType::Unknown:
            RL_TL1( telemetry_.unknown_frames_total.inc() );
            RL_DEBUG("[CONN] Ignoring unrecognized frame: " << std::get<frame::Unknown>(f).raw);
            return;

        default:
            break;
        }

        switch (handshake_.on_frame(f)) {
        case Handshake::Step::SendNamespaceConnect:
            (void)send_raw_(Codec::encode_namespace_connect());
            return;

        case Handshake::Step::Ready:
            transition_(Event::HandshakeReady);
            return;

        case Handshake::Step::None:
            break;
        }

        if (auto* ev = std::get_if<frame::Event>(&f)) {
            if (state_ == State::Connected) {
                inbox_.push_back(std::move(*ev));
            } else {
                RL_DEBUG("[CONN] Dropping event '" << ev->name << "' received before namespace join");
            }
            return;
        }
        RL_DEBUG("[CONN] Ignoring out-of-sequence " << to_string(type_of(f)) << " frame (handshake: "
                 << to_string(handshake_.state()) << ")");
    }

    // Protocol-internal frames bypass the Connected gate
    [[nodiscard]]
    inline bool send_raw_(const std::string& text) noexcept {
        if (!ws_) {
            return false;
        }
        if (!ws_->send(text)) {
            RL_WARN("[CONN] Transport refused frame: " << text);
            return false;
        }
        ++tx_frames_;
        RL_TL1( telemetry_.frames_tx_total.inc() );
        RL_TRACE("[CONN] -> " << text);
        return true;
    }

    // -------------------------------------------------------------------------
    // State machine
    // -------------------------------------------------------------------------

    inline void transition_(Event event, Error error = Error::None) noexcept {
        RL_TRACE("[FSM] (" << to_string(state_) << ") --" << to_string(event) << "-->");

        if (event == Event::DisconnectRequested) {
            teardown_();
            reconnect_timer_.cancel();
            last_error_ = Error::None;
            error_message_.clear();
            if (state_ != State::Disconnected) {
                set_state_(State::Disconnected);
                emit_(connection::Signal::Disconnected);
            }
            RL_INFO("[CONN] Disconnected");
            return;
        }

        switch (state_) {

        // ================================================================
        case State::Disconnected:
        case State::Error:
            switch (event) {
            case Event::ConnectRequested:
                last_error_ = Error::None;
                error_message_.clear();
                set_state_(State::Connecting);
                handshake_.start();
                handshake_timer_.arm(cfg_.handshake_timeout);
                break;

            case Event::ReconnectTimerExpired:
                connect();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::HandshakeReady:
                handshake_timer_.cancel();
                reconnect_timer_.cancel();
                ++epoch_;
                set_state_(State::Connected);
                heartbeat_.start();
                RL_TL1( telemetry_.handshakes_completed_total.inc() );
                RL_INFO("[CONN] Connected (sid=" << handshake_.session().sid << ")");
                emit_(connection::Signal::Connected);
                break;

            case Event::HandshakeTimedOut:
            case Event::TransportFailed:
            case Event::TransportClosed:
                enter_error_(error, cfg_.auto_reconnect);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::TransportFailed:
            case Event::TransportClosed:
                enter_error_(error, cfg_.auto_reconnect);
                break;

            default:
                break;
            }
            break;
        }
    }

    inline void enter_error_(Error error, bool retry) noexcept {
        RL_TL1( telemetry_.transport_failures_total.inc() );
        teardown_();
        last_error_ = (error == Error::None) ? Error::TransportFailure : error;
        error_message_ = std::string(describe(last_error_));
        set_state_(State::Error);
        RL_ERROR("[CONN] " << error_message_);
        emit_(connection::Signal::Failed);
        if (retry) {
            reconnect_timer_.arm(cfg_.reconnect_delay);
            RL_TL1( telemetry_.reconnects_scheduled_total.inc() );
            RL_INFO("[CONN] Reconnecting in " << cfg_.reconnect_delay.count() << "ms");
            emit_(connection::Signal::RetryScheduled);
        }
    }

    // Synchronous: no socket open and no handshake/heartbeat timer armed afterwards
    inline void teardown_() noexcept {
        handshake_timer_.cancel();
        heartbeat_.stop();
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
        handshake_.reset();
        inbox_.clear();
    }
};

} // namespace raidlink::core::transport
