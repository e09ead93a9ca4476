#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shared stop request for the loop and consumer threads. Waiting threads are
// woken as soon as stop is requested instead of sleeping out their tick.
class ShutdownToken {
public:
    // Returns true only for the call that actually flipped the flag.
    bool requestStop() {
        bool expected = false;
        if (!stop_flag_.compare_exchange_strong(expected, true)) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
        }
        cv_.notify_all();
        return true;
    }

    bool stopRequested() const { return stop_flag_.load(); }

    // Sleeps up to `timeout`. Returns true if stop was requested.
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return stop_flag_.load(); });
    }

private:
    std::atomic<bool> stop_flag_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
