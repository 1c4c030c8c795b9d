#pragma once

#include "blocking_queue.hpp"
#include <functional>
#include <thread>

namespace simulation {

using FetchJob = std::function<void()>;

// Runs buffer fetch jobs. Jobs must not be submitted while holding the session mutex.
class IFetchExecutor {
public:
    virtual ~IFetchExecutor() = default;
    virtual void submit(FetchJob job) = 0;
    // Blocks until queued jobs are finished; later submissions are dropped
    virtual void shutdown() = 0;
};

// Runs each job on the caller's thread before submit() returns
class InlineFetchExecutor : public IFetchExecutor {
public:
    void submit(FetchJob job) override;
    void shutdown() override {}
};

// One background worker fed by a blocking queue
class WorkerFetchExecutor : public IFetchExecutor {
public:
    WorkerFetchExecutor();
    ~WorkerFetchExecutor() override;

    WorkerFetchExecutor(const WorkerFetchExecutor&) = delete;
    WorkerFetchExecutor& operator=(const WorkerFetchExecutor&) = delete;

    void submit(FetchJob job) override;
    void shutdown() override;

private:
    void run();

    BlockingQueue<FetchJob> queue_;
    std::thread worker_;
};

} // namespace simulation
