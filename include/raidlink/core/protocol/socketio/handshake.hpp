#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "raidlink/core/protocol/socketio/frame.hpp"
#include "lcr/log/logger.hpp"


namespace raidlink::core::protocol::socketio {

/*
===============================================================================
 Socket.IO handshake state machine
===============================================================================

    NotStarted --start()--> AwaitingSession
    AwaitingSession --Open--> AwaitingNamespaceAck   (caller sends "40")
    AwaitingNamespaceAck --NamespaceAck--> Ready
    AwaitingNamespaceAck --Event "connected"--> Ready (legacy servers)
    any --reset()--> NotStarted

Pure state: the machine performs no I/O. on_frame() returns the step the
owner must take, so the owner stays the only place that touches the socket.
Frames that do not advance the current state are left to other consumers.
===============================================================================
*/

enum class HandshakeState : std::uint8_t {
    NotStarted,
    AwaitingSession,
    AwaitingNamespaceAck,
    Ready
};

[[nodiscard]]
inline constexpr std::string_view to_string(HandshakeState s) noexcept {
    switch (s) {
        case HandshakeState::NotStarted:           return "NotStarted";
        case HandshakeState::AwaitingSession:      return "AwaitingSession";
        case HandshakeState::AwaitingNamespaceAck: return "AwaitingNamespaceAck";
        case HandshakeState::Ready:                return "Ready";
        default:                                   return "Unknown";
    }
}

// Event name some older servers emit instead of a namespace ack
inline constexpr std::string_view LEGACY_READY_EVENT = "connected";

class Handshake {
public:
    enum class Step : std::uint8_t {
        None,                  // Frame did not advance the handshake
        SendNamespaceConnect,  // Session opened, owner must send "40"
        Ready                  // Handshake completed by this frame
    };

    inline void start() noexcept {
        reset();
        set_state_(HandshakeState::AwaitingSession);
    }

    inline void reset() noexcept {
        if (state_ != HandshakeState::NotStarted) {
            set_state_(HandshakeState::NotStarted);
        }
        session_ = SessionInfo{};
        namespace_sid_.reset();
    }

    [[nodiscard]]
    inline Step on_frame(const Frame& f) {
        switch (state_) {
        case HandshakeState::AwaitingSession:
            if (const auto* open = std::get_if<frame::Open>(&f)) {
                session_ = open->session;
                RL_DEBUG("[HANDSHAKE] Session opened (sid=" << session_.sid
                         << ", pingInterval=" << session_.ping_interval_ms
                         << "ms, pingTimeout=" << session_.ping_timeout_ms << "ms)");
                set_state_(HandshakeState::AwaitingNamespaceAck);
                return Step::SendNamespaceConnect;
            }
            break;

        case HandshakeState::AwaitingNamespaceAck:
            if (const auto* ack = std::get_if<frame::NamespaceAck>(&f)) {
                namespace_sid_ = ack->sid;
                RL_DEBUG("[HANDSHAKE] Namespace joined (sid=" << ack->sid.value_or("<none>") << ")");
                set_state_(HandshakeState::Ready);
                return Step::Ready;
            }
            if (const auto* ev = std::get_if<frame::Event>(&f); ev && ev->name == LEGACY_READY_EVENT) {
                RL_DEBUG("[HANDSHAKE] Legacy '" << LEGACY_READY_EVENT << "' event accepted as namespace ack");
                set_state_(HandshakeState::Ready);
                return Step::Ready;
            }
            break;

        default:
            break;
        }
        return Step::None;
    }

    [[nodiscard]] inline HandshakeState state() const noexcept { return state_; }
    [[nodiscard]] inline bool ready() const noexcept { return state_ == HandshakeState::Ready; }
    [[nodiscard]] inline const SessionInfo& session() const noexcept { return session_; }
    [[nodiscard]] inline const std::optional<std::string>& namespace_sid() const noexcept { return namespace_sid_; }

private:
    HandshakeState state_{HandshakeState::NotStarted};
    SessionInfo session_{};
    std::optional<std::string> namespace_sid_;

    inline void set_state_(HandshakeState s) noexcept {
        RL_TRACE("[HANDSHAKE] State: " << to_string(state_) << " -> " << to_string(s));
        state_ = s;
    }
};

} // namespace raidlink::core::protocol::socketio
