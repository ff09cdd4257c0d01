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
 * @file uid_generator.hpp
 * @brief Thread-safe generator of host-unique identifiers.
 *
 * @details
 * This file declares the `UidGenerator` class and the `GeneratorState` it
 * guards. Each generator owns one state object: a host discriminant drawn
 * lazily from an entropy source, the last millisecond used and the next
 * sequence number. `UidGenerator::instance()` exposes the process-wide
 * generator; tests and embedders may construct their own around a custom
 * `Clock` and entropy source.
 */

#pragma once

#include "hostuid/core/clock.hpp"
#include "hostuid/core/uid.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>

namespace hostuid::core {

/**
 * @struct GeneratorState
 * @brief Mutable generator state. Every field is guarded by `mutex`.
 */
struct GeneratorState {
    std::mutex mutex;

    /// @brief Whether `host_unique` has been drawn yet.
    bool host_unique_set = false;

    /// @brief Host discriminant stamped into every generated identifier.
    int32_t host_unique = 0;

    /// @brief Millisecond value carried by the identifiers currently being issued.
    int64_t last_time = 0;

    /// @brief Next sequence value to issue within `last_time`.
    int16_t last_count = std::numeric_limits<int16_t>::min();
};

/**
 * @class UidGenerator
 * @brief Issues identifiers that never repeat for the lifetime of the generator.
 *
 * @details
 * **Generation Algorithm** (under `GeneratorState::mutex`):
 * 1. Draw the host discriminant on first use.
 * 2. If the sequence for the current millisecond is exhausted, wait for the
 *    clock to move. A clock that moved backwards is not adopted; the stored
 *    millisecond is advanced by one instead.
 * 3. Issue `(host_unique, last_time, last_count)` and post-increment `last_count`.
 *
 * The wait in step 2 releases the mutex around every sleep. An interruption
 * received while waiting does not abort generation: it is recorded, the wait
 * is retried, and the calling thread's interruption flag is set again once
 * the identifier has been produced.
 */
class UidGenerator {
  public:
    /// @brief Supplies the host discriminant. Called at most once per generator.
    using EntropySource = std::function<int32_t()>;

    /// @brief Sleep granularity while waiting for the clock to advance.
    static constexpr std::chrono::milliseconds kTickWait{1};

    /**
     * @brief Creates a generator with fresh state.
     *
     * `last_time` is initialized from `clock`.
     *
     * @param clock Time source. Must outlive the generator.
     * @param entropy Host discriminant source. Defaults to `random_discriminant`.
     */
    explicit UidGenerator(Clock& clock = SystemClock::instance(),
                          EntropySource entropy = &UidGenerator::random_discriminant);

    UidGenerator(const UidGenerator&) = delete;
    UidGenerator& operator=(const UidGenerator&) = delete;

    /**
     * @brief Generates an identifier unique among all identifiers issued by this generator.
     *
     * Safe to call from any number of threads.
     */
    Uid generate();

    /**
     * @brief Creates one of the 2^16 well-known identifiers: `Uid(0, 0, number)`.
     *
     * Touches no shared state. Distinct numbers give distinct identifiers.
     */
    static Uid well_known(int16_t number) { return Uid(0, 0, number); }

    /**
     * @brief Process-wide generator backed by the system clock.
     *
     * Constructed on first use.
     */
    static UidGenerator& instance();

    /**
     * @brief Default entropy source: a non-deterministically seeded Mersenne Twister.
     *
     * Resists accidental collisions between processes; not cryptographically strong.
     */
    static int32_t random_discriminant();

  private:
    /**
     * @brief Waits for a new millisecond and resets the sequence.
     *
     * Requires `lock` to hold `state_.mutex`; releases and reacquires it
     * around each sleep. Returns true if an interruption was consumed.
     */
    bool advance_time(std::unique_lock<std::mutex>& lock);

    Clock& clock_;
    EntropySource entropy_;
    GeneratorState state_;
};

/**
 * @brief Shorthand for `UidGenerator::instance().generate()`.
 */
Uid generate();

} // namespace hostuid::core
