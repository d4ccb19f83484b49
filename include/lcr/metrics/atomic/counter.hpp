#pragma once

#include <atomic>
#include <cstdint>
#include <type_traits>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - monotonically increasing, relaxed ordering
// Written by one thread, readable from any thread.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) counter {
    counter() = default;
    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
    inline void reset() noexcept { value_.store(0, std::memory_order_relaxed); }

    // Snapshot support
    inline void copy_to(counter& other) const noexcept {
        other.value_.store(load(), std::memory_order_relaxed);
    }

private:
    std::atomic<T> value_{0};
};

using counter32 = counter<uint32_t>;
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");

} // namespace atomic
} // namespace metrics
} // namespace lcr
