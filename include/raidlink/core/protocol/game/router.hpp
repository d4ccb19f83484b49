#pragma once

#include <cstdint>
#include <functional>
#include <type_traits>
#include <string_view>
#include <utility>

#include "raidlink/core/protocol/game/dispatcher.hpp"
#include "raidlink/core/protocol/game/event_name.hpp"
#include "raidlink/core/protocol/game/parser/diagnostics.hpp"
#include "raidlink/core/protocol/game/parser/npcs.hpp"
#include "raidlink/core/protocol/game/parser/objects.hpp"
#include "raidlink/core/protocol/game/parser/result.hpp"
#include "raidlink/core/protocol/game/parser/settings.hpp"
#include "raidlink/core/protocol/socketio/frame.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace raidlink::core::protocol::game {

/*
================================================================================
Application Event Router
================================================================================

Turns a Socket.IO event frame into a typed schema value and hands it to the
handler table:

    name  --to_event_name-->  EventName  --parser::*-->  schema::*  --> handlers

Required fields are validated once, here. An event that fails validation is
dropped with a DEBUG diagnostic and never reaches a handler; neither other
events nor the connection are affected. Unknown names are Ignored.

admin_diagnostic_ping is first offered to the ping hook (the session uses it
to answer with client_diagnostic_pong), then to the registered handlers.

The router owns one simdjson parser and is not thread-safe.
================================================================================
*/
class Router {
public:
    using PingHook = std::function<void(const schema::AdminDiagnosticPing&)>;

    explicit Router(HandlerTable& handlers) noexcept
        : handlers_(handlers)
    {}

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    inline void set_ping_hook(PingHook hook) {
        ping_hook_ = std::move(hook);
    }

    // Main entry point
    [[nodiscard]]
    inline parser::Result route(const socketio::frame::Event& ev) {
        using parser::Result;

        const EventName name = to_event_name(ev.name);
        if (name == EventName::Unknown || name == EventName::RegisterDevice || name == EventName::ClientDiagnosticPong) {
            RL_DEBUG("[ROUTER] No inbound route for event '" << ev.name << "' -> ignore.");
            return count_(Result::Ignored);
        }

        simdjson::dom::element root;
        auto error = parser_.parse(ev.payload.data(), ev.payload.size()).get(root);
        if (error) {
            RL_WARN("[ROUTER] JSON parse error in '" << ev.name << "' payload: " << error);
            return count_(Result::InvalidJson);
        }

        switch (name) {
            case EventName::ObjectCollected:
                return deliver_<parser::object_collected, schema::ObjectCollected>(root);
            case EventName::ObjectUncollected:
                return deliver_<parser::object_uncollected, schema::ObjectUncollected>(root);
            case EventName::AllFindsReset:
                return deliver_<parser::all_finds_reset, schema::AllFindsReset>(root);
            case EventName::ObjectCreated:
                return deliver_<parser::object_created, schema::ObjectCreated>(root);
            case EventName::ObjectDeleted:
                return deliver_<parser::object_deleted, schema::ObjectDeleted>(root);
            case EventName::NpcCreated:
                return deliver_<parser::npc_created, schema::NpcCreated>(root);
            case EventName::NpcUpdated:
                return deliver_<parser::npc_updated, schema::NpcUpdated>(root);
            case EventName::NpcDeleted:
                return deliver_<parser::npc_deleted, schema::NpcDeleted>(root);
            case EventName::LocationUpdateIntervalChanged:
                return deliver_<parser::location_update_interval_changed, schema::LocationUpdateIntervalChanged>(root);
            case EventName::GameModeChanged:
                return deliver_<parser::game_mode_changed, schema::GameModeChanged>(root);
            case EventName::AdminDiagnosticPing:
                return deliver_<parser::admin_diagnostic_ping, schema::AdminDiagnosticPing>(root);
            default:
                return count_(Result::Ignored);
        }
    }

    // Statistics
    [[nodiscard]] inline std::uint64_t delivered() const noexcept { return delivered_; }
    [[nodiscard]] inline std::uint64_t dropped() const noexcept { return dropped_; }
    [[nodiscard]] inline std::uint64_t ignored() const noexcept { return ignored_; }

private:
    HandlerTable& handlers_;    // Not owned
    PingHook ping_hook_;
    simdjson::dom::parser parser_;

    std::uint64_t delivered_ = 0;
    std::uint64_t dropped_   = 0;
    std::uint64_t ignored_   = 0;

    template<class Parser, class EventT>
    [[nodiscard]]
    inline parser::Result deliver_(const simdjson::dom::element& root) {
        using parser::Result;
        EventT out{};
        const Result r = Parser::parse(root, out);
        if (r != Result::Parsed) {
            return count_(r);
        }
        if constexpr (std::is_same_v<EventT, schema::AdminDiagnosticPing>) {
            if (ping_hook_) {
                ping_hook_(out);
            }
        }
        if (handlers_.dispatch(out) == 0) {
            return count_(Result::Unhandled);
        }
        return count_(Result::Delivered);
    }

    inline parser::Result count_(parser::Result r) noexcept {
        using parser::Result;
        switch (r) {
            case Result::Delivered:
            case Result::Unhandled:
                ++delivered_;
                break;
            case Result::Ignored:
                ++ignored_;
                break;
            default:
                ++dropped_;
                break;
        }
        return r;
    }
};

} // namespace raidlink::core::protocol::game
