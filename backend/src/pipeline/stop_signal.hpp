#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Cooperative shutdown flag shared by every agent, worker and sleeper.
// request_stop() is sticky and wakes all wait_for() callers.
class StopSignal {
public:
    StopSignal() = default;
    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void request_stop() {
        {
            std::lock_guard<std::mutex> lk(m_);
            stopped_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool stop_requested() const noexcept { return stopped_.load(std::memory_order_acquire); }

    // Sleeps up to `d`; returns true if stop was requested (before or during the wait).
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& d) const {
        std::unique_lock<std::mutex> lk(m_);
        return cv_.wait_for(lk, d, [this] { return stopped_.load(std::memory_order_acquire); });
    }

private:
    std::atomic<bool> stopped_{false};
    mutable std::mutex m_;
    mutable std::condition_variable cv_;
};
