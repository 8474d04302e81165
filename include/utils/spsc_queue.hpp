#pragma once

#include <atomic>
#include <cstddef>
#include <utility>
#include <vector>

namespace utils {

// Bounded single-producer / single-consumer ring.
// Capacity is rounded up to a power of two; one slot stays empty to tell
// "full" from "empty", so usable capacity is capacity() - 1.
template <typename T>
class SpscQueue {
public:
    explicit SpscQueue(std::size_t capacity)
        : mask_(round_up_pow2(capacity < 2 ? 2 : capacity) - 1),
          buffer_(mask_ + 1)
    {}

    SpscQueue(const SpscQueue&)            = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    // producer thread only
    bool try_push(const T& value) { return emplace(value); }
    bool try_push(T&& value)      { return emplace(std::move(value)); }

    // consumer thread only
    bool try_pop(T& out) {
        auto tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            return false; // empty
        }

        out = std::move(buffer_[tail]);
        tail_.store((tail + 1) & mask_, std::memory_order_release);
        return true;
    }

    bool empty() const {
        return tail_.load(std::memory_order_acquire) == head_.load(std::memory_order_acquire);
    }

    std::size_t size_approx() const {
        auto head = head_.load(std::memory_order_acquire);
        auto tail = tail_.load(std::memory_order_acquire);
        return (head - tail) & mask_;
    }

    std::size_t capacity() const { return mask_ + 1; }

private:
    static std::size_t round_up_pow2(std::size_t n) {
        std::size_t p = 1;
        while (p < n) p <<= 1;
        return p;
    }

    template <typename U>
    bool emplace(U&& value) {
        auto head = head_.load(std::memory_order_relaxed);
        auto next = (head + 1) & mask_;

        if (next == tail_.load(std::memory_order_acquire)) {
            return false; // full
        }

        buffer_[head] = std::forward<U>(value);
        head_.store(next, std::memory_order_release);
        return true;
    }

    const std::size_t mask_;
    std::vector<T>    buffer_;

    // producer and consumer indices on separate cache lines
    alignas(64) std::atomic<std::size_t> head_{0};
    alignas(64) std::atomic<std::size_t> tail_{0};
};

} // namespace utils
