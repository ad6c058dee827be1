#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace imuskel {

/**
 * Single-shot timer with an optional periodic tick.
 *
 * One worker thread waits for the deadline and invokes the fire callback
 * exactly once per arm(). Re-arming or cancel() abandons the pending wait;
 * an abandoned deadline never fires.
 *
 * Usage:
 *   OneShotTimer timer;
 *   timer.arm(std::chrono::seconds(30), [] { finish(); },
 *             std::chrono::seconds(1), [](auto left) { report(left); });
 */
class OneShotTimer {
public:
    using Callback = std::function<void()>;
    using TickCallback = std::function<void(std::chrono::milliseconds remaining)>;

    OneShotTimer();
    ~OneShotTimer();

    OneShotTimer(const OneShotTimer&) = delete;
    OneShotTimer& operator=(const OneShotTimer&) = delete;

    void arm(std::chrono::milliseconds delay, Callback on_fire,
             std::chrono::milliseconds tick_period = std::chrono::milliseconds(0),
             TickCallback on_tick = nullptr);

    void cancel();

    bool armed() const;

private:
    void run();

    std::thread worker_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::chrono::steady_clock::time_point deadline_;
    std::chrono::milliseconds tick_period_{0};
    Callback on_fire_;
    TickCallback on_tick_;
    uint64_t generation_ = 0;
    bool armed_;
    bool stop_;
};

} // namespace imuskel
