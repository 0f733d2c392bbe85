/**
 * @file WorkerPool.cpp
 * @brief WorkerPool implementation: condition-variable job queue and worker lifecycle.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "WorkerPool.h"
#include "Logger.h"

#include <exception>
#include <string>

/** @copydoc WorkerPool::WorkerPool */
WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 1;
    }
    workers.reserve(threads);
    try {
        for (size_t i = 0; i < threads; ++i) workers.emplace_back(&WorkerPool::run, this, i);
    } catch (...) {
        // Thread creation failed part way; stop the ones already running before propagating
        shutdown();
        for (auto& t : workers) if (t.joinable()) t.join();
        throw;
    }
    Logger::info("WorkerPool started with " + std::to_string(workers.size()) + " workers");
}

/** @copydoc WorkerPool::~WorkerPool */
WorkerPool::~WorkerPool() {
    shutdown();
    for (auto& t : workers) if (t.joinable()) t.join();
    Logger::debug("WorkerPool joined");
}

/** @copydoc WorkerPool::submit */
bool WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopping) return false;
        jobs.push_back(std::move(job));
    }
    cv.notify_one();
    return true;
}

/** @copydoc WorkerPool::shutdown */
void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopping) return;
        stopping = true;
    }
    cv.notify_all();
    Logger::debug("WorkerPool shutdown requested");
}

/** @copydoc WorkerPool::queued */
size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mtx);
    return jobs.size();
}

/** @copydoc WorkerPool::stopped */
bool WorkerPool::stopped() const {
    std::lock_guard<std::mutex> lock(mtx);
    return stopping;
}

/** @copydoc WorkerPool::nextJob */
bool WorkerPool::nextJob(Job& out) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return stopping || !jobs.empty(); });
    if (jobs.empty()) return false; // stopping and drained
    out = std::move(jobs.front());
    jobs.pop_front();
    return true;
}

/** @copydoc WorkerPool::run */
void WorkerPool::run(size_t index) {
    Logger::debug("worker " + std::to_string(index) + " starting");
    Job job;
    while (nextJob(job)) {
        try {
            job();
        } catch (const std::exception& e) {
            Logger::logException("WorkerPool job failed (worker " + std::to_string(index) + ")", e);
        } catch (...) {
            Logger::logUnknownException("WorkerPool job failed (worker " + std::to_string(index) + ")");
        }
        job = nullptr;
    }
    Logger::debug("worker " + std::to_string(index) + " exiting");
}
