#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <utility>

// Bounded single-producer / single-consumer ring.
// One thread calls try_push, one other thread calls try_pop; nothing else is
// safe to call concurrently except size() and empty(), which are approximate.
// Capacity is CapacityPow2 - 1: one slot stays free to tell full from empty.
template <typename T, std::size_t CapacityPow2>
class SpscRing {
    static_assert(CapacityPow2 >= 2, "Capacity must be at least 2");
    static_assert((CapacityPow2 & (CapacityPow2 - 1)) == 0, "Capacity must be power of two");

public:
    SpscRing() = default;

    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    // Producer: false when full; `v` is left untouched so the caller can
    // decide whether to drop it.
    bool try_push(T&& v) {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & kMask;
        if (next == tail_.load(std::memory_order_acquire)) return false;
        slots_[head] = std::move(v);
        head_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer: false when empty.
    bool try_pop(T& out) {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) return false;
        out = std::move(slots_[tail]);
        tail_.store((tail + 1) & kMask, std::memory_order_release);
        return true;
    }

    bool empty() const noexcept {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    std::size_t size() const noexcept {
        const std::size_t head = head_.load(std::memory_order_acquire);
        const std::size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail) & kMask;
    }

    static constexpr std::size_t capacity() noexcept { return CapacityPow2 - 1; }

private:
    static constexpr std::size_t kMask = CapacityPow2 - 1;

    std::array<T, CapacityPow2> slots_{};
    alignas(64) std::atomic<std::size_t> head_{0}; // producer writes
    alignas(64) std::atomic<std::size_t> tail_{0}; // consumer writes
};
