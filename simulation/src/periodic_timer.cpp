#include "periodic_timer.hpp"
#include "logging.hpp"
#include <exception>

namespace simulation {

PeriodicTimer::PeriodicTimer(std::string name, PeriodProvider period, Callback callback)
    : name_(std::move(name)), period_(std::move(period)), callback_(std::move(callback))
{
    thread_ = std::thread(&PeriodicTimer::run, this);
}

PeriodicTimer::~PeriodicTimer() {
    shutdown();
}

void PeriodicTimer::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        running_ = true;
        ++epoch_;
    }
    cv_.notify_all();
}

void PeriodicTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
}

bool PeriodicTimer::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void PeriodicTimer::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void PeriodicTimer::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdown_) {
        cv_.wait(lock, [this] { return running_ || shutdown_; });
        if (shutdown_) {
            break;
        }

        const auto period = period_();
        const auto epoch = epoch_;
        const bool interrupted = cv_.wait_for(lock, period, [this, epoch] {
            return shutdown_ || !running_ || epoch_ != epoch;
        });
        if (interrupted) {
            continue;
        }

        lock.unlock();
        try {
            callback_();
        } catch (const std::exception& e) {
            core::logging::getLogger()->error("Timer '{}' callback failed: {}", name_, e.what());
        }
        lock.lock();
    }
}

} // namespace simulation
