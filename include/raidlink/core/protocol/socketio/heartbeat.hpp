#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>

#include "raidlink/core/config/timing.hpp"
#include "raidlink/core/protocol/policy/liveness.hpp"
#include "raidlink/core/timer/deadline.hpp"
#include "lcr/log/logger.hpp"


namespace raidlink::core::protocol::socketio {

/*
===============================================================================
 Heartbeat monitor
===============================================================================

Tracks liveness from two independent inputs, without assuming which one the
server uses:

  - server ping ("2")  -> owner answers with "3", ledger records it
  - pong ("3")         -> answer to a client ping, ledger records it

Either one resets consecutive_failures to 0.

A staleness check runs every check_interval once the monitor is started
(after a grace period). If the latest liveness signal is missing or older
than stale_after, consecutive_failures is incremented. The latest signal is
the newer of the last server ping and the last pong, so a server that only
answers client pings is not reported stale. Reaching
failure_limit yields Action::LivenessThreatened once per crossing. The
verdict is advisory: the monitor never closes anything.

Under the Active liveness policy poll() additionally asks the owner to send
a client ping every client_ping_interval.
===============================================================================
*/

template<timer::ClockConcept Clock>
class Heartbeat {
public:
    using time_point = typename Clock::time_point;

    struct Config {
        policy::Liveness          liveness       = policy::Liveness::Passive;
        std::chrono::milliseconds grace          = config::HEARTBEAT_GRACE;
        std::chrono::milliseconds check_interval = config::HEARTBEAT_CHECK_INTERVAL;
        std::chrono::milliseconds stale_after    = config::HEARTBEAT_STALE_AFTER;
        std::uint32_t             failure_limit  = config::HEARTBEAT_FAILURE_LIMIT;
        std::chrono::milliseconds ping_interval  = config::CLIENT_PING_INTERVAL;
    };

    struct Ledger {
        std::optional<time_point> last_outbound_ping_at;
        std::optional<time_point> last_inbound_pong_at;
        std::optional<time_point> last_inbound_server_ping_at;
        std::uint32_t consecutive_failures = 0;
    };

    struct Actions {
        bool send_ping           = false;
        bool liveness_threatened = false;
    };

    Heartbeat() = default;
    explicit Heartbeat(const Config& cfg) noexcept : cfg_(cfg) {}

    inline void configure(const Config& cfg) noexcept { cfg_ = cfg; }

    // Begin monitoring (connection just became ready)
    inline void start() noexcept {
        ledger_ = Ledger{};
        threatened_ = false;
        check_.start(cfg_.check_interval, cfg_.grace + cfg_.check_interval);
        if (cfg_.liveness == policy::Liveness::Active) {
            client_ping_.start(cfg_.ping_interval, cfg_.grace);
        }
        RL_DEBUG("[HEARTBEAT] Monitoring started (policy=" << policy::to_string(cfg_.liveness) << ")");
    }

    // Stop all timers and forget the ledger
    inline void stop() noexcept {
        check_.stop();
        client_ping_.stop();
        ledger_ = Ledger{};
        threatened_ = false;
    }

    [[nodiscard]] inline bool running() const noexcept { return check_.running(); }

    inline void on_server_ping() noexcept {
        ledger_.last_inbound_server_ping_at = Clock::now();
        reset_failures_();
    }

    inline void on_pong() noexcept {
        ledger_.last_inbound_pong_at = Clock::now();
        reset_failures_();
    }

    inline void on_ping_sent() noexcept {
        ledger_.last_outbound_ping_at = Clock::now();
    }

    [[nodiscard]]
    inline Actions poll() noexcept {
        Actions actions;
        if (client_ping_.tick()) {
            actions.send_ping = true;
        }
        if (check_.tick()) {
            actions.liveness_threatened = check_staleness_();
        }
        return actions;
    }

    [[nodiscard]] inline const Ledger& ledger() const noexcept { return ledger_; }

private:
    Config cfg_{};
    Ledger ledger_{};
    timer::Periodic<Clock> check_;
    timer::Periodic<Clock> client_ping_;
    bool threatened_ = false;

    inline void reset_failures_() noexcept {
        if (ledger_.consecutive_failures != 0) {
            RL_DEBUG("[HEARTBEAT] Liveness restored after " << ledger_.consecutive_failures << " failed check(s)");
        }
        ledger_.consecutive_failures = 0;
        threatened_ = false;
    }

    // Returns true when this check crossed the failure limit
    [[nodiscard]]
    inline bool check_staleness_() noexcept {
        // Newer of server ping and pong
        std::optional<time_point> latest = ledger_.last_inbound_server_ping_at;
        if (ledger_.last_inbound_pong_at) {
            latest = latest ? std::max(*latest, *ledger_.last_inbound_pong_at) : ledger_.last_inbound_pong_at;
        }
        if (latest && Clock::now() - *latest <= cfg_.stale_after) {
            return false;
        }
        ++ledger_.consecutive_failures;
        RL_DEBUG("[HEARTBEAT] No liveness signal within " << cfg_.stale_after.count()
                 << "ms (consecutive failures: " << ledger_.consecutive_failures << ")");
        if (!threatened_ && ledger_.consecutive_failures >= cfg_.failure_limit) {
            threatened_ = true;
            RL_WARN("[HEARTBEAT] Connection degraded: " << ledger_.consecutive_failures
                    << " consecutive heartbeat checks without a ping or pong");
            return true;
        }
        return false;
    }
};

} // namespace raidlink::core::protocol::socketio
