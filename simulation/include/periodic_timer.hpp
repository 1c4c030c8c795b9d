#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace simulation {

// A single long-lived thread that invokes `callback` every period while running.
// The period is re-read at the start of every cycle, so changes apply from the
// next tick. start()/stop() never block on the callback and may be called from
// inside it; only shutdown() joins.
class PeriodicTimer {
public:
    using Callback = std::function<void()>;
    using PeriodProvider = std::function<std::chrono::milliseconds()>;

    PeriodicTimer(std::string name, PeriodProvider period, Callback callback);
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    void start();
    void stop();
    bool isRunning() const;

    // Stops and joins the thread. Must not be called while holding a lock the callback takes.
    void shutdown();

private:
    void run();

    std::string name_;
    PeriodProvider period_;
    Callback callback_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    bool shutdown_ = false;
    unsigned long long epoch_ = 0; // Bumped by start() to restart the wait
    std::thread thread_;
};

} // namespace simulation
