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
 * @file clock.hpp
 * @brief Millisecond time source consumed by the identifier generator.
 *
 * @details
 * The generator reads wall-clock milliseconds and, when the sequence space of
 * the current millisecond is exhausted, sleeps briefly until the reading
 * changes. Both operations live behind the abstract `Clock` so that tests can
 * drive clock regression and exhaustion deterministically.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace hostuid::core {

/**
 * @class Clock
 * @brief Abstract millisecond clock with an interruptible sleep.
 */
class Clock {
  public:
    virtual ~Clock() = default;

    /**
     * @brief Current time in milliseconds since the Unix epoch.
     *
     * Implementations are not required to be monotonic.
     */
    virtual int64_t now_millis() = 0;

    /**
     * @brief Blocks the calling thread for roughly `duration`.
     *
     * @throws infra::Interrupted If the calling thread's interruption flag is
     * set before or during the wait. The flag is cleared.
     */
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

/**
 * @class SystemClock
 * @brief `Clock` backed by `std::chrono::system_clock` and `std::this_thread::sleep_for`.
 */
class SystemClock : public Clock {
  public:
    int64_t now_millis() override;
    void sleep_for(std::chrono::milliseconds duration) override;

    /// @brief Shared process-wide instance.
    static SystemClock& instance();
};

} // namespace hostuid::core
