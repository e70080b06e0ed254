#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <utility>

// Single-Producer / Single-Consumer ring buffer.
// - capacity is rounded up to a power of two at construction.
// - SPSC: exactly one producer thread calls try_push,
//         exactly one consumer thread calls try_pop.
//
// Slots are default-constructed once and reused; popped values are moved out.
template <typename T>
class SpscRing {
public:
    explicit SpscRing(std::size_t capacity)
    : size_(round_up(capacity + 1))
    , mask_(size_ - 1)
    , buf_(new T[size_])
    , head_(0)
    , tail_(0) {}

    // Non-copyable
    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    // Producer: attempt to push; returns false if full (caller decides policy).
    // `v` is only moved from on success.
    bool try_push(T&& v) {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & mask_;
        if (next == tail_.load(std::memory_order_acquire)) {
            // full
            return false;
        }
        buf_[head] = std::move(v);
        head_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer: attempt to pop; returns false if empty
    bool try_pop(T& out) {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            // empty
            return false;
        }
        out = std::move(buf_[tail]);
        buf_[tail] = T();
        tail_.store((tail + 1) & mask_, std::memory_order_release);
        return true;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }
    bool full() const {
        const std::size_t next = (head_.load(std::memory_order_acquire) + 1) & mask_;
        return next == tail_.load(std::memory_order_acquire);
    }
    std::size_t size_approx() const {
        const std::size_t head = head_.load(std::memory_order_acquire);
        const std::size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail) & mask_;
    }
    std::size_t capacity() const { return size_ - 1; } // one slot unused to disambiguate full/empty

private:
    static std::size_t round_up(std::size_t n) {
        if (n < 2) throw std::invalid_argument("SpscRing capacity must be positive");
        std::size_t p = 1;
        while (p < n) p <<= 1;
        return p;
    }

    const std::size_t size_;
    const std::size_t mask_;
    std::unique_ptr<T[]> buf_;
    std::atomic<std::size_t> head_; // producer writes
    std::atomic<std::size_t> tail_; // consumer writes
};
