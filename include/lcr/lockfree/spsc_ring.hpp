// -----------------------------------------------------------------------------
// Bounded SPSC ring buffer with compile-time capacity
// Lock-free, cacheline-separated producer/consumer indices.
//
// Example:
//     spsc_ring<Event, 256> queue;
//     if (!queue.push(std::move(ev))) { /* full, retry later */ }
//     Event out;
//     while (queue.pop(out)) { ... }
//
// Notes:
//   - Capacity must be a power of two (compile-time check)
//   - One slot is kept free to distinguish full from empty
//   - Single Producer, Single Consumer only
//   - push() never blocks and never overwrites: a full ring rejects the item
// -----------------------------------------------------------------------------
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <utility>


namespace lcr::lockfree {

template <typename T, std::size_t Capacity>
class alignas(64) spsc_ring {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");

public:
    spsc_ring() = default;
    ~spsc_ring() = default;

    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    // Producer side

    [[nodiscard]] inline bool push(const T& item) {
        const std::size_t head = head_.index.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & MASK;
        if (next == tail_.index.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = item;
        head_.index.store(next, std::memory_order_release);
        return true;
    }

    [[nodiscard]] inline bool push(T&& item) {
        const std::size_t head = head_.index.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & MASK;
        if (next == tail_.index.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = std::move(item);
        head_.index.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side

    [[nodiscard]] inline bool pop(T& out) {
        const std::size_t tail = tail_.index.load(std::memory_order_relaxed);
        if (tail == head_.index.load(std::memory_order_acquire))
            return false; // empty
        out = std::move(buffer_[tail]);
        buffer_[tail] = T{};
        tail_.index.store((tail + 1) & MASK, std::memory_order_release);
        return true;
    }

    // Drops every pending item. Consumer side only.
    inline void clear() {
        T discard;
        while (pop(discard)) {}
    }

    [[nodiscard]] inline bool empty() const noexcept {
        return tail_.index.load(std::memory_order_acquire) ==
               head_.index.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline bool full() const noexcept {
        const std::size_t next = (head_.index.load(std::memory_order_relaxed) + 1) & MASK;
        return next == tail_.index.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline constexpr std::size_t capacity() const noexcept { return Capacity; }

    [[nodiscard]] inline std::size_t used() const noexcept {
        const std::size_t h = head_.index.load(std::memory_order_acquire);
        const std::size_t t = tail_.index.load(std::memory_order_acquire);
        return (h - t) & MASK;
    }

private:
    struct alignas(64) PaddedAtomic {
        std::atomic<std::size_t> index{0};
        char pad[64 - sizeof(std::atomic<std::size_t>)]{};
    };

    static constexpr std::size_t MASK = Capacity - 1;
    std::array<T, Capacity> buffer_{};
    PaddedAtomic head_;
    PaddedAtomic tail_;
};

} // namespace lcr::lockfree
