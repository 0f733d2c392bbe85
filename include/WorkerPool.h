/**
 * @file WorkerPool.h
 * @brief Declares the WorkerPool class: a fixed set of long-lived threads draining a shared FIFO job queue.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @class WorkerPool
 * @brief N worker threads started at construction and running until shutdown.
 *
 * Policy: unbounded queue, strict FIFO, no priorities, no per-job cancellation. A job runs to
 * completion on the worker that dequeued it; the queue lock is never held while a job runs.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    /** @brief Start @p threads workers; 0 means one per hardware thread (at least one). */
    explicit WorkerPool(size_t threads = 0);
    /** @brief Destructor; shuts down, lets queued jobs drain and joins every worker. Must not run on a worker. */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /** @brief Enqueue @p job and wake one idle worker; returns false (job dropped) after shutdown. */
    bool submit(Job job);
    /** @brief Stop accepting jobs and wake all workers; running jobs are not interrupted. Idempotent. */
    void shutdown();

    /** @brief Number of worker threads. */
    size_t size() const { return workers.size(); }
    /** @brief Jobs waiting in the queue (snapshot). */
    size_t queued() const;
    /** @brief Whether shutdown() has been called. */
    bool stopped() const;

private:
    /** @brief Worker loop: wait for a job or stop, run it, repeat; exits when stopped and empty. */
    void run(size_t index);
    /** @brief Block until a job is available; returns false when the pool is stopped and drained. */
    bool nextJob(Job& out);

    std::vector<std::thread> workers; /**< worker threads */
    std::deque<Job> jobs;             /**< pending jobs, FIFO */
    mutable std::mutex mtx;           /**< protects jobs and stopping */
    std::condition_variable cv;       /**< signalled on submit and shutdown */
    bool stopping{false};             /**< set once by shutdown() */
};
