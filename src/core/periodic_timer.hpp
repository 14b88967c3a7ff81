#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace core {

/**
 * @brief Owned, cancellable fixed-cadence timer
 *
 * Runs the tick callback on its own thread every `interval`. Ticks are
 * scheduled against an absolute deadline so a slow tick does not shift the
 * cadence; missed deadlines are skipped, not replayed.
 *
 * stop() is synchronous: when it returns the callback is not running and
 * will not run again. Called from inside the callback it only cancels; the
 * thread is joined by a later stop() (or the destructor).
 */
class PeriodicTimer {
public:
    using Tick = std::function<void()>;

    explicit PeriodicTimer(std::string name = "timer");
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    /// Start ticking. Returns false if already running or interval <= 0.
    bool start(std::chrono::milliseconds interval, Tick tick);

    /// Cancel the timer and join its thread. Safe to call when not running.
    void stop();

    bool is_running() const;
    const std::string& name() const { return name_; }

private:
    void run(std::chrono::milliseconds interval);

    std::string name_;
    Tick tick_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    bool cancel_ = false;
    std::unique_ptr<std::thread> thread_;
};

} // namespace core
