/*
===============================================================================
raidlink Session
===============================================================================

The game-facing client. Composes:

  - transport::Connection  socket lifecycle, handshake, heartbeat, reconnect
  - game::Router           event name -> typed schema -> handlers
  - game::HandlerTable     consumer registrations (plain or owner-bound)

and adds the protocol duties that sit above the connection:

  - register_device{device_uuid} once per successful handshake
  - automatic client_diagnostic_pong for every admin_diagnostic_ping,
    sent before consumer handlers see the ping

Everything advances inside poll(): connection first, then its signals, then
the application events it collected. Handlers run on the polling thread.

The Session also satisfies what health::Poller needs (state(), connect(),
disconnect(), config()), so a poller can supervise it directly:

    Session<beast::WebSocket> session{cfg};
    health::Poller<health::HttpHealthCheck> health;
    session.connect();
    health.start();
    while (running) {
        session.poll();
        health.poll(session);
    }
===============================================================================
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "raidlink/core/config/client.hpp"
#include "raidlink/core/protocol/game/dispatcher.hpp"
#include "raidlink/core/protocol/game/event_name.hpp"
#include "raidlink/core/protocol/game/router.hpp"
#include "raidlink/core/protocol/game/schema/diagnostics.hpp"
#include "raidlink/core/timer/deadline.hpp"
#include "raidlink/core/timestamp.hpp"
#include "raidlink/core/transport/connection.hpp"
#include "raidlink/core/transport/telemetry/connection.hpp"
#include "lcr/log/logger.hpp"


namespace raidlink::core {

template<
    transport::WebSocketConcept WS,
    timer::ClockConcept Clock = std::chrono::steady_clock
>
class Session {
public:
    using connection_type = transport::Connection<WS, Clock>;
    using SignalObserver  = std::function<void(transport::connection::Signal)>;

    explicit Session(config::Client cfg)
        : connection_(std::move(cfg), telemetry_)
        , router_(handlers_)
    {
        router_.set_ping_hook([this](const protocol::game::schema::AdminDiagnosticPing& ping) {
            answer_diagnostic_ping_(ping);
        });
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    inline void connect() noexcept { connection_.connect(); }
    inline void disconnect() noexcept { connection_.disconnect(); }

    // -------------------------------------------------------------------------
    // Handler registration
    // -------------------------------------------------------------------------

    template<class EventT>
    inline protocol::game::handler_id_t on(std::function<void(const EventT&)> cb) {
        return handlers_.template add_handler<EventT>(std::move(cb));
    }

    // Handler bound to an owner; never invoked after the owner is destroyed
    template<class EventT, class Owner>
    inline protocol::game::handler_id_t on(const std::shared_ptr<Owner>& owner,
                                           std::type_identity_t<std::function<void(Owner&, const EventT&)>> cb) {
        return handlers_.template add_handler<EventT, Owner>(owner, std::move(cb));
    }

    inline bool remove_handler(protocol::game::handler_id_t id) {
        return handlers_.remove_handler(id);
    }

    // Observer of connection signals (one slot; replaces the previous one)
    inline void on_signal(SignalObserver observer) {
        signal_observer_ = std::move(observer);
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------

    // Arbitrary application event; rejected unless Connected
    [[nodiscard]]
    inline bool send_event(std::string_view name, std::string_view payload_json) noexcept {
        return connection_.send_event(name, payload_json);
    }

    [[nodiscard]]
    inline bool send(const protocol::game::schema::RegisterDevice& msg) {
        return send_event(to_string(protocol::game::EventName::RegisterDevice), msg.to_json());
    }

    [[nodiscard]]
    inline bool send(const protocol::game::schema::ClientDiagnosticPong& msg) {
        return send_event(to_string(protocol::game::EventName::ClientDiagnosticPong), msg.to_json());
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    // Returns the number of application events routed during this call
    inline std::uint64_t poll() {
        connection_.poll();

        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
            handle_connection_signal_(sig);
        }

        std::uint64_t routed = 0;
        typename connection_type::EventFrame ev;
        while (connection_.poll_event(ev)) {
            (void)router_.route(ev);
            ++routed;
        }
        return routed;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] inline transport::State state() const noexcept { return connection_.state(); }
    [[nodiscard]] inline const std::string& error_message() const noexcept { return connection_.error_message(); }
    [[nodiscard]] inline std::string display_status() const { return connection_.display_status(); }
    [[nodiscard]] inline const config::Client& config() const noexcept { return connection_.config(); }

    [[nodiscard]] inline connection_type& connection() noexcept { return connection_; }
    [[nodiscard]] inline const connection_type& connection() const noexcept { return connection_; }
    [[nodiscard]] inline const protocol::game::Router& router() const noexcept { return router_; }
    [[nodiscard]] inline const transport::telemetry::Connection& telemetry() const noexcept { return telemetry_; }

    [[nodiscard]] inline std::uint64_t devices_registered() const noexcept { return devices_registered_; }
    [[nodiscard]] inline std::uint64_t diagnostic_pongs_sent() const noexcept { return diagnostic_pongs_sent_; }

private:
    // Declared first: the connection holds a reference to it
    transport::telemetry::Connection telemetry_;
    connection_type connection_;

    protocol::game::HandlerTable handlers_;
    protocol::game::Router router_;
    SignalObserver signal_observer_;

    std::uint64_t devices_registered_ = 0;
    std::uint64_t diagnostic_pongs_sent_ = 0;

    inline void handle_connection_signal_(transport::connection::Signal sig) {
        switch (sig) {
        case transport::connection::Signal::Connected:
            register_device_();
            break;
        case transport::connection::Signal::LivenessThreatened:
            RL_WARN("[SESSION] Liveness threatened, the connection may be degraded");
            break;
        default:
            break;
        }
        if (signal_observer_) {
            signal_observer_(sig);
        }
    }

    // Once per successful handshake
    inline void register_device_() {
        const auto& cfg = connection_.config();
        if (!cfg.register_device) {
            return;
        }
        if (cfg.device_uuid.empty()) {
            RL_DEBUG("[SESSION] No device UUID configured, skipping register_device");
            return;
        }
        if (send(protocol::game::schema::RegisterDevice{cfg.device_uuid})) {
            ++devices_registered_;
            RL_INFO("[SESSION] Registered device " << cfg.device_uuid);
        } else {
            RL_WARN("[SESSION] register_device could not be sent");
        }
    }

    inline void answer_diagnostic_ping_(const protocol::game::schema::AdminDiagnosticPing& ping) {
        protocol::game::schema::ClientDiagnosticPong pong{
            .ping_id          = ping.ping_id,
            .client_timestamp = to_iso8601(now_utc()),
            .admin_session_id = ping.admin_session_id
        };
        if (send(pong)) {
            ++diagnostic_pongs_sent_;
            RL_DEBUG("[SESSION] Answered admin diagnostic ping " << ping.ping_id);
        } else {
            RL_WARN("[SESSION] Could not answer admin diagnostic ping " << ping.ping_id);
        }
    }
};

} // namespace raidlink::core
