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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool.
 *
 * @details
 * Workers wait on a condition variable for tasks; an `active_` counter guarded
 * by the queue mutex lets callers block until the pool has gone idle.
 */

#include "hostuid/infra/scheduler.hpp"

#include "hostuid/infra/logger.hpp"

#include <exception>
#include <string>

namespace hostuid::infra {

Scheduler::Scheduler(size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }

    try {
        for (size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    } catch (...) {
        // Threads already started must be joined before workers_ is destroyed.
        shutdown();
        throw;
    }
}

Scheduler::~Scheduler()
{
    shutdown();
}

void Scheduler::shutdown()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Worker event loop.
 *
 * Exits only when the scheduler is stopping AND the queue has been drained,
 * so every task accepted before destruction still runs.
 */
void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;

        // --- Critical Section: Task Acquisition ---
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        // Execution happens outside the lock.
        if (task) {
            try {
                task();
            } catch (const std::exception& e) {
                Logger::log(LogLevel::ERROR,
                            "Scheduler: task raised an exception: " + std::string(e.what()));
            }
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            --active_;
            if (active_ == 0 && tasks_.empty()) {
                idle_.notify_all();
            }
        }
    }
}

void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    // notify_one() avoids waking the whole pool for a single task.
    condition_.notify_one();
}

void Scheduler::wait_idle()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_.wait(lock, [this] { return active_ == 0 && tasks_.empty(); });
}

} // namespace hostuid::infra
