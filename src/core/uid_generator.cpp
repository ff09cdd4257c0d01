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
 * @file uid_generator.cpp
 * @brief Implementation of the host-unique identifier generator.
 *
 * @details
 * All reads and writes of `GeneratorState` happen while holding its mutex.
 * The only point at which the mutex is released mid-call is the sleep inside
 * `advance_time`; the state is consistent at that point (the sequence is still
 * marked exhausted), so other callers entering meanwhile simply join the wait.
 */

#include "hostuid/core/uid_generator.hpp"

#include "hostuid/infra/interruption.hpp"
#include "hostuid/infra/logger.hpp"
#include "hostuid/infra/string.hpp"

#include <random>
#include <utility>

namespace hostuid::core {

UidGenerator::UidGenerator(Clock& clock, EntropySource entropy)
    : clock_(clock), entropy_(std::move(entropy))
{
    state_.last_time = clock_.now_millis();
}

int32_t UidGenerator::random_discriminant()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    static thread_local std::uniform_int_distribution<int32_t> dis(std::numeric_limits<int32_t>::min(),
                                                                   std::numeric_limits<int32_t>::max());
    return dis(gen);
}

UidGenerator& UidGenerator::instance()
{
    static UidGenerator generator;
    return generator;
}

Uid UidGenerator::generate()
{
    bool interrupted = false;
    int32_t unique = 0;
    int64_t time = 0;
    int16_t count = 0;

    {
        std::unique_lock<std::mutex> lock(state_.mutex);

        if (!state_.host_unique_set) {
            state_.host_unique = entropy_();
            state_.host_unique_set = true;
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Generator: host discriminant set to " +
                                   infra::String::to_signed_hex(state_.host_unique));
        }

        if (state_.last_count == std::numeric_limits<int16_t>::max()) {
            interrupted = advance_time(lock);
        }

        unique = state_.host_unique;
        time = state_.last_time;
        count = state_.last_count++;
    }

    // Re-assert only after the state update is complete and the lock is released.
    if (interrupted) {
        infra::Interruption::interrupt();
    }

    return Uid(unique, time, count);
}

bool UidGenerator::advance_time(std::unique_lock<std::mutex>& lock)
{
    bool interrupted = infra::Interruption::interrupted();

    // Another caller may have advanced the state while the lock was released.
    while (state_.last_count == std::numeric_limits<int16_t>::max()) {
        int64_t now = clock_.now_millis();

        if (now == state_.last_time) {
            lock.unlock();
            try {
                clock_.sleep_for(kTickWait);
            } catch (const infra::Interrupted&) {
                interrupted = true;
            }
            lock.lock();
            continue;
        }

        if (now < state_.last_time) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Generator: clock moved backwards from " +
                                   std::to_string(state_.last_time) + " to " + std::to_string(now) +
                                   " ms; advancing by one millisecond instead");
            state_.last_time = state_.last_time + 1;
        } else {
            state_.last_time = now;
        }
        state_.last_count = std::numeric_limits<int16_t>::min();
    }

    return interrupted;
}

Uid generate()
{
    return UidGenerator::instance().generate();
}

} // namespace hostuid::core
