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
 * @file interruption.hpp
 * @brief Cooperative per-thread cancellation flag.
 *
 * @details
 * Each thread owns one interruption flag. A controlling thread obtains a
 * handle to a worker's flag (via `Interruption::flag()` called on the worker)
 * and sets it to request cancellation; blocking primitives such as
 * `core::SystemClock::sleep_for` observe the flag and raise `Interrupted`.
 */

#pragma once

#include <atomic>
#include <stdexcept>

namespace hostuid::infra {

/**
 * @class Interrupted
 * @brief Raised by an interruptible wait when the calling thread's flag is set.
 *
 * The flag is cleared when this exception is thrown.
 */
class Interrupted : public std::runtime_error {
  public:
    Interrupted() : std::runtime_error("Thread interrupted") {}
};

/**
 * @class Interruption
 * @brief Static accessors for the calling thread's interruption flag.
 */
class Interruption {
  public:
    /**
     * @brief Returns the calling thread's flag.
     *
     * The reference stays valid for the lifetime of the thread and may be
     * handed to another thread, which then requests cancellation with
     * `flag.store(true)`.
     */
    static std::atomic<bool>& flag();

    /// @brief Sets the calling thread's flag.
    static void interrupt();

    /**
     * @brief Tests and clears the calling thread's flag.
     * @return true if the flag was set.
     */
    static bool interrupted();

    /// @brief Tests the calling thread's flag without clearing it.
    static bool is_interrupted();

    /**
     * @brief Throws `Interrupted` (clearing the flag) if the flag is set.
     */
    static void check();
};

} // namespace hostuid::infra
