/*
===============================================================================
 Cooperative timers
===============================================================================

Deadline and Periodic are the "schedule after duration, cancelable" primitive
used by every component. They hold no thread and fire nothing on their own:
the owner checks them from its poll() loop, so a timer can never race the
frames it is supposed to guard.

Clock is a policy type with a static now(). Production code uses
std::chrono::steady_clock; tests inject a manually advanced clock.

  Deadline::arm() always replaces the previous due time (never stacks).
  Deadline::expired() reports true exactly once per arm().
  Periodic::tick() reports true once per elapsed period; missed periods
  are coalesced into a single tick.
===============================================================================
*/
#pragma once

#include <chrono>
#include <concepts>


namespace raidlink::core::timer {

template<class C>
concept ClockConcept =
    requires {
        typename C::time_point;
        typename C::duration;
        { C::now() } -> std::same_as<typename C::time_point>;
    };


template<ClockConcept Clock>
class Deadline {
public:
    using time_point = typename Clock::time_point;

    template<class Rep, class Period>
    inline void arm(std::chrono::duration<Rep, Period> after) noexcept {
        due_ = Clock::now() + std::chrono::duration_cast<typename Clock::duration>(after);
        armed_ = true;
    }

    inline void cancel() noexcept { armed_ = false; }

    [[nodiscard]] inline bool armed() const noexcept { return armed_; }

    [[nodiscard]] inline time_point due() const noexcept { return due_; }

    // Disarms itself when it reports expiry
    [[nodiscard]]
    inline bool expired() noexcept {
        if (!armed_ || Clock::now() < due_) [[likely]] {
            return false;
        }
        armed_ = false;
        return true;
    }

private:
    time_point due_{};
    bool armed_ = false;
};


template<ClockConcept Clock>
class Periodic {
public:
    using duration = typename Clock::duration;

    template<class Rep1, class P1, class Rep2, class P2>
    inline void start(std::chrono::duration<Rep1, P1> period, std::chrono::duration<Rep2, P2> first_after) noexcept {
        period_ = std::chrono::duration_cast<duration>(period);
        next_ = Clock::now() + std::chrono::duration_cast<duration>(first_after);
        running_ = true;
    }

    inline void stop() noexcept { running_ = false; }

    [[nodiscard]] inline bool running() const noexcept { return running_; }

    [[nodiscard]]
    inline bool tick() noexcept {
        if (!running_) {
            return false;
        }
        const auto now = Clock::now();
        if (now < next_) [[likely]] {
            return false;
        }
        next_ += period_;
        if (next_ <= now) {
            next_ = now + period_;
        }
        return true;
    }

private:
    typename Clock::time_point next_{};
    duration period_{};
    bool running_ = false;
};

} // namespace raidlink::core::timer
