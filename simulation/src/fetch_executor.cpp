#include "fetch_executor.hpp"
#include "logging.hpp"
#include <exception>

namespace simulation {

namespace {
    void runJob(const FetchJob& job) {
        try {
            job();
        } catch (const std::exception& e) {
            core::logging::getLogger()->error("Fetch job failed: {}", e.what());
        }
    }
} // namespace

void InlineFetchExecutor::submit(FetchJob job) {
    if (job) {
        runJob(job);
    }
}

WorkerFetchExecutor::WorkerFetchExecutor()
    : worker_(&WorkerFetchExecutor::run, this)
{
    core::logging::getLogger()->debug("WorkerFetchExecutor started.");
}

WorkerFetchExecutor::~WorkerFetchExecutor() {
    shutdown();
}

void WorkerFetchExecutor::submit(FetchJob job) {
    if (!job) {
        return;
    }
    if (!queue_.push(std::move(job))) {
        core::logging::getLogger()->debug("Fetch job dropped: executor is shut down.");
    }
}

void WorkerFetchExecutor::shutdown() {
    queue_.shutdown();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
        core::logging::getLogger()->debug("WorkerFetchExecutor stopped.");
    }
}

void WorkerFetchExecutor::run() {
    FetchJob job;
    while (queue_.waitAndPop(job)) {
        runJob(job);
        job = nullptr;
    }
}

} // namespace simulation
