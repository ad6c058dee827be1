#include "imuskel/timer.hpp"
#include "imuskel/log.hpp"
#include <algorithm>
#include <exception>

namespace imuskel {

OneShotTimer::OneShotTimer()
    : armed_(false), stop_(false) {
    worker_ = std::thread([this] { run(); });
}

OneShotTimer::~OneShotTimer() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        stop_ = true;
        armed_ = false;
    }
    condition_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void OneShotTimer::arm(std::chrono::milliseconds delay, Callback on_fire,
                       std::chrono::milliseconds tick_period, TickCallback on_tick) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        deadline_ = std::chrono::steady_clock::now() + delay;
        on_fire_ = std::move(on_fire);
        tick_period_ = tick_period;
        on_tick_ = std::move(on_tick);
        armed_ = true;
        ++generation_;
    }
    condition_.notify_all();
}

void OneShotTimer::cancel() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        armed_ = false;
        ++generation_;
        on_fire_ = nullptr;
        on_tick_ = nullptr;
    }
    condition_.notify_all();
}

bool OneShotTimer::armed() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return armed_;
}

void OneShotTimer::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        condition_.wait(lock, [this] { return stop_ || armed_; });
        if (stop_) return;

        const auto deadline = deadline_;
        const uint64_t generation = generation_;
        auto now = std::chrono::steady_clock::now();
        auto wake = deadline;
        if (on_tick_ && tick_period_.count() > 0) {
            wake = std::min(deadline, now + tick_period_);
        }

        // Woken early by arm()/cancel()/stop: loop and re-read the state
        bool changed = condition_.wait_until(lock, wake, [this, generation] {
            return stop_ || !armed_ || generation_ != generation;
        });
        if (changed) continue;

        now = std::chrono::steady_clock::now();
        if (now < deadline) {
            TickCallback tick = on_tick_;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            lock.unlock();
            if (tick) {
                try {
                    tick(left);
                } catch (const std::exception& e) {
                    LOG_ERROR("[Timer] Tick callback failed: " << e.what());
                }
            }
            lock.lock();
            continue;
        }

        Callback fire = std::move(on_fire_);
        on_fire_ = nullptr;
        on_tick_ = nullptr;
        armed_ = false;

        // Callbacks run unlocked so they may re-arm the timer. An exception
        // leaving the worker thread would terminate the process.
        lock.unlock();
        if (fire) {
            try {
                fire();
            } catch (const std::exception& e) {
                LOG_ERROR("[Timer] Fire callback failed: " << e.what());
            }
        }
        lock.lock();
    }
}

} // namespace imuskel
