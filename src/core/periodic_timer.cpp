#include "core/periodic_timer.hpp"
#include "core/logging.hpp"
#include <exception>

namespace core {

PeriodicTimer::PeriodicTimer(std::string name) : name_(std::move(name)) {}

PeriodicTimer::~PeriodicTimer() {
    stop();
}

bool PeriodicTimer::start(std::chrono::milliseconds interval, Tick tick) {
    if (interval.count() <= 0 || !tick) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return false;
    }
    tick_ = std::move(tick);
    cancel_ = false;
    running_ = true;
    thread_ = std::make_unique<std::thread>(&PeriodicTimer::run, this, interval);
    return true;
}

void PeriodicTimer::stop() {
    std::unique_ptr<std::thread> thread;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        cancel_ = true;
        if (thread_ && thread_->get_id() == std::this_thread::get_id()) {
            // Stopped from inside the tick: the loop exits when it returns,
            // the next stop() from another thread joins it
            return;
        }
        thread = std::move(thread_);
    }
    cv_.notify_all();
    if (thread && thread->joinable()) {
        thread->join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    tick_ = nullptr;
}

bool PeriodicTimer::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !cancel_;
}

void PeriodicTimer::run(std::chrono::milliseconds interval) {
    auto next_tick = std::chrono::steady_clock::now() + interval;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_until(lock, next_tick, [this] { return cancel_; })) {
                break;
            }
        }

        try {
            tick_();
        } catch (const std::exception& e) {
            log_error("Timer '" + name_ + "' tick threw: " + e.what());
        }

        next_tick += interval;
        auto now = std::chrono::steady_clock::now();
        while (next_tick <= now) {
            next_tick += interval;
        }
    }
}

} // namespace core
