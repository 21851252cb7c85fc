#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace supervisor {

    // Background check that the poll loop keeps completing cycles. Reports a stall
    // once per episode through `on_stall`; never kills or restarts anything.
    class Watchdog {
    public:
        using Clock = std::chrono::steady_clock;
        using StallHandler = std::function<void(std::chrono::seconds stalled_for)>;

        Watchdog(std::chrono::seconds check_interval, std::chrono::seconds stall_threshold, StallHandler on_stall);
        ~Watchdog();

        Watchdog(const Watchdog&) = delete;
        Watchdog& operator=(const Watchdog&) = delete;

        void start();
        void stop();

        // Called by the loop thread at the end of every completed cycle
        void recordCycleCompleted();
        void recordCycleCompleted(Clock::time_point when);

        // One check against `now`; returns true when a new stall was reported
        bool checkOnce(Clock::time_point now);

        bool isStalled() const { return stalled_.load(); }

    private:
        void run();

        std::chrono::seconds check_interval_;
        std::chrono::seconds stall_threshold_;
        StallHandler on_stall_;

        std::atomic<std::int64_t> last_completion_ns_;
        std::atomic<bool> stalled_{false};

        std::mutex mutex_;
        std::condition_variable wakeup_;
        bool stop_requested_ = false;
        std::thread thread_;
    };

} // namespace supervisor
