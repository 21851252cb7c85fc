#include "watchdog.hpp"
#include "logging.hpp"

namespace supervisor {

    namespace {
        std::int64_t toNanos(Watchdog::Clock::time_point tp) {
            return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
        }
    }

    Watchdog::Watchdog(std::chrono::seconds check_interval, std::chrono::seconds stall_threshold, StallHandler on_stall)
        : check_interval_(check_interval),
          stall_threshold_(stall_threshold),
          on_stall_(std::move(on_stall)),
          last_completion_ns_(toNanos(Clock::now()))
    {}

    Watchdog::~Watchdog() {
        stop();
    }

    void Watchdog::start() {
        if (thread_.joinable()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = false;
        }
        recordCycleCompleted();
        thread_ = std::thread(&Watchdog::run, this);
        core::logging::getLogger()->info("Watchdog started (check every {}s, stall after {}s).",
                                         check_interval_.count(), stall_threshold_.count());
    }

    void Watchdog::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        wakeup_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void Watchdog::recordCycleCompleted() {
        recordCycleCompleted(Clock::now());
    }

    void Watchdog::recordCycleCompleted(Clock::time_point when) {
        last_completion_ns_.store(toNanos(when));
    }

    bool Watchdog::checkOnce(Clock::time_point now) {
        auto elapsed = std::chrono::nanoseconds(toNanos(now) - last_completion_ns_.load());
        auto elapsed_s = std::chrono::duration_cast<std::chrono::seconds>(elapsed);

        if (elapsed <= stall_threshold_) {
            if (stalled_.exchange(false)) {
                core::logging::getLogger()->info("Watchdog: poll loop completing cycles again.");
            }
            return false;
        }

        if (stalled_.exchange(true)) {
            return false; // Already reported for this episode
        }

        core::logging::getLogger()->error("Watchdog: no completed cycle for {}s (threshold {}s).",
                                          elapsed_s.count(), stall_threshold_.count());
        if (on_stall_) {
            on_stall_(elapsed_s);
        }
        return true;
    }

    void Watchdog::run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_requested_) {
            wakeup_.wait_for(lock, check_interval_, [this] { return stop_requested_; });
            if (stop_requested_) {
                break;
            }
            lock.unlock();
            try {
                checkOnce(Clock::now());
            } catch (const std::exception& e) {
                core::logging::getLogger()->error("Watchdog check failed: {}", e.what());
            }
            lock.lock();
        }
    }

} // namespace supervisor
