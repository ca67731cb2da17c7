#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "lcr/log/logger.hpp"


namespace tickdb::etl {

// ============================================================================
// PollControl
// ----------------------------------------------------------------------------
// Shared pacing and stop signal for every tailing worker of a run.
//
// - wait() sleeps one poll interval and returns false once a stop has been
//   requested (before or during the wait).
// - request_stop() wakes every sleeping worker immediately.
// - signal_stop() only flips the atomic flag and is safe to call from a
//   signal handler; sleeping workers notice it at the end of their interval.
// ============================================================================
class PollControl {
public:
    explicit PollControl(std::chrono::milliseconds interval = std::chrono::milliseconds(1000)) noexcept
        : interval_(interval)
    {
    }

    PollControl(const PollControl&) = delete;
    PollControl& operator=(const PollControl&) = delete;

    [[nodiscard]] static PollControl from_seconds(double seconds) noexcept {
        if (seconds < 0.0) seconds = 0.0;
        return PollControl(std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0)));
    }

    void request_stop() noexcept {
        bool expected = false;
        if (stop_.compare_exchange_strong(expected, true)) {
            TDB_INFO("[ETL] Stop requested, finishing current passes.");
        }
        {
            std::lock_guard<std::mutex> lk(mtx_);
        }
        cv_.notify_all();
    }

    void signal_stop() noexcept {
        stop_.store(true, std::memory_order_relaxed);
    }

    [[nodiscard]] bool stop_requested() const noexcept {
        return stop_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool wait() {
        if (stop_requested()) return false;
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, interval_, [&] { return stop_requested(); });
        return !stop_requested();
    }

    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    std::chrono::milliseconds interval_;
    std::atomic<bool> stop_{false};
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace tickdb::etl
