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
 * @file clock.cpp
 * @brief System clock implementation.
 */

#include "hostuid/core/clock.hpp"

#include "hostuid/infra/interruption.hpp"

#include <thread>

namespace hostuid::core {

int64_t SystemClock::now_millis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * The flag is sampled on entry and again on wake-up; a request arriving while
 * the thread sleeps is therefore observed at most one sleep period late.
 */
void SystemClock::sleep_for(std::chrono::milliseconds duration)
{
    infra::Interruption::check();
    std::this_thread::sleep_for(duration);
    infra::Interruption::check();
}

SystemClock& SystemClock::instance()
{
    static SystemClock clock;
    return clock;
}

} // namespace hostuid::core
