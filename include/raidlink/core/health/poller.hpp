#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "raidlink/core/config/timing.hpp"
#include "raidlink/core/health/concept.hpp"
#include "raidlink/core/timer/deadline.hpp"
#include "raidlink/core/transport/state.hpp"
#include "lcr/log/logger.hpp"


namespace raidlink::core::health {

// What the poller last decided about the connection it watches
enum class Verdict : std::uint8_t {
    None,           // No check finished during this poll()
    Healthy,        // Server answered; nothing to do
    Reconnect,      // Server answered while Disconnected; connect() requested
    ForceDown,      // Server did not answer; disconnect() forced
};

[[nodiscard]]
constexpr std::string_view to_string(Verdict v) noexcept {
    switch (v) {
        case Verdict::None:      return "None";
        case Verdict::Healthy:   return "Healthy";
        case Verdict::Reconnect: return "Reconnect";
        case Verdict::ForceDown: return "ForceDown";
        default:                 return "Unknown";
    }
}

/*
===============================================================================
 Health poller
===============================================================================

Out-of-band supervisor of one connection. Every interval it starts a health
check against the connection's base URL and, once that check finishes,
acts on the verdict:

  healthy   + Disconnected -> connect()
  unhealthy                -> disconnect(), whatever the socket claims

The second rule covers a socket that still looks open while the server
behind it is gone. Checks never overlap: a tick that finds the previous
check still in flight is skipped.

Conn is any type with state(), connect(), disconnect() and
config().base_url (transport::Connection in practice).
===============================================================================
*/
template<HealthCheckConcept Check, timer::ClockConcept Clock = std::chrono::steady_clock>
class Poller {
public:
    Poller() : Poller(config::HEALTH_POLL_INTERVAL) {}

    // Extra arguments construct the check in place
    template<class... Args>
    explicit Poller(std::chrono::milliseconds interval, Args&&... args)
        : check_(std::forward<Args>(args)...)
        , interval_(interval)
    {}

    ~Poller() {
        stop();
    }

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    // First check runs immediately on the next poll()
    inline void start() noexcept {
        timer_.start(interval_, std::chrono::milliseconds{0});
        RL_DEBUG("[HEALTH] Polling every " << interval_.count() << "ms");
    }

    inline void stop() {
        timer_.stop();
        if (in_flight_) {
            check_.cancel();
            in_flight_ = false;
        }
    }

    [[nodiscard]] inline bool running() const noexcept { return timer_.running(); }
    [[nodiscard]] inline bool in_flight() const noexcept { return in_flight_; }
    [[nodiscard]] inline std::uint64_t checks_completed() const noexcept { return completed_; }

    template<class Conn>
    inline Verdict poll(Conn& conn) {
        Verdict verdict = Verdict::None;
        if (in_flight_) {
            bool healthy = false;
            if (check_.poll(healthy)) {
                in_flight_ = false;
                ++completed_;
                verdict = apply_(conn, healthy);
            }
        }
        if (timer_.tick()) {
            if (in_flight_) {
                RL_DEBUG("[HEALTH] Previous check still running, skipping this round");
            } else if (check_.start(conn.config().base_url)) {
                in_flight_ = true;
            } else {
                RL_WARN("[HEALTH] Health check could not be started");
            }
        }
        return verdict;
    }

#ifdef RL_UNIT_TEST
public:
    Check& check() noexcept {
        return check_;
    }
#endif // RL_UNIT_TEST

private:
    Check check_;
    std::chrono::milliseconds interval_;
    timer::Periodic<Clock> timer_;
    bool in_flight_ = false;
    std::uint64_t completed_ = 0;

    template<class Conn>
    inline Verdict apply_(Conn& conn, bool healthy) {
        if (!healthy) {
            if (conn.state() != transport::State::Disconnected) {
                RL_WARN("[HEALTH] Server unhealthy, forcing disconnect (state: "
                        << transport::to_string(conn.state()) << ")");
            }
            conn.disconnect();
            return Verdict::ForceDown;
        }
        if (conn.state() == transport::State::Disconnected) {
            RL_INFO("[HEALTH] Server healthy while disconnected, connecting");
            conn.connect();
            return Verdict::Reconnect;
        }
        return Verdict::Healthy;
    }
};

} // namespace raidlink::core::health
