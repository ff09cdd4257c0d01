/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.hpp
 * @brief Thread pool for fanning identifier generation out across workers.
 *
 * @details
 * This header defines the `Scheduler` class, a fixed-size Producer-Consumer
 * worker pool. The command line front-end uses it to generate identifiers
 * from several threads at once, and the test suite uses it to drive the
 * generator's shared state under contention.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace hostuid::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Barrier:** `wait_idle()` blocks until the queue is drained and no task is running.
 */
class Scheduler {
  public:
    /**
     * @brief Initializes the pool and spawns worker threads.
     *
     * @param threads The number of worker threads to spawn. A value of 0
     * (e.g. when `hardware_concurrency()` cannot be determined) spawns one worker.
     *
     * @throws std::system_error If a worker cannot be started. Workers started
     * before the failure are stopped and joined first.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains pending tasks, then stops and joins every worker.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * @param task The unit of work. Exceptions escaping it are logged and discarded
     * so that a failing task cannot take a worker down.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Blocks until every task enqueued so far has finished.
     */
    void wait_idle();

    /// @brief Number of worker threads in the pool.
    size_t size() const { return workers_.size(); }

  private:
    void worker_loop();

    /// @brief Sets `stop_`, wakes every worker and joins them.
    void shutdown();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    /// @brief Protects `tasks_` and `active_`.
    std::mutex queue_mutex_;

    /// @brief Wakes workers when a task arrives or on shutdown.
    std::condition_variable condition_;

    /// @brief Wakes `wait_idle()` callers when the pool becomes idle.
    std::condition_variable idle_;

    /// @brief Tasks currently executing.
    size_t active_ = 0;

    std::atomic<bool> stop_;
};

} // namespace hostuid::infra
