#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>

// Multi-producer / multi-consumer FIFO with a fixed capacity.
// Push variants only move from their argument when the item is accepted.
// close() wakes every waiter: pushes fail from then on, pops drain what is left.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("BoundedQueue capacity must be positive");
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool try_push(T& item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) return false;
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    // Waits up to `timeout` for room. False on timeout or when closed.
    template <typename Rep, typename Period>
    bool push_for(T& item, const std::chrono::duration<Rep, Period>& timeout) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!not_full_.wait_for(lock, timeout, [this] { return closed_ || items_.size() < capacity_; }))
                return false;
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    // Never waits. When full, evicts the oldest queued item for which
    // `evictable` is true; if there is none the incoming item is dropped.
    // Returns the number of items lost (0 or 1). A closed queue drops the item.
    template <typename Pred>
    std::size_t push_evicting(T& item, Pred evictable) {
        std::size_t lost = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return 1;
            if (items_.size() >= capacity_) {
                auto it = items_.begin();
                while (it != items_.end() && !evictable(*it)) ++it;
                if (it == items_.end()) return 1;
                items_.erase(it);
                lost = 1;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return lost;
    }

    bool try_pop(T& out) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty()) return false;
            out = std::move(items_.front());
            items_.pop_front();
        }
        not_full_.notify_one();
        return true;
    }

    // Blocks until an item arrives. False once closed and drained.
    bool wait_pop(T& out) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
            if (items_.empty()) return false;
            out = std::move(items_.front());
            items_.pop_front();
        }
        not_full_.notify_one();
        return true;
    }

    // Waits up to `timeout` for an item.
    template <typename Rep, typename Period>
    bool pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); }))
                return false;
            if (items_.empty()) return false;
            out = std::move(items_.front());
            items_.pop_front();
        }
        not_full_.notify_one();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_{false};
};
