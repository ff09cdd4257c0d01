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
 * @file interruption.cpp
 * @brief Thread-local storage for the interruption flag.
 */

#include "hostuid/infra/interruption.hpp"

namespace hostuid::infra {

std::atomic<bool>& Interruption::flag()
{
    static thread_local std::atomic<bool> flag{false};
    return flag;
}

void Interruption::interrupt()
{
    flag().store(true);
}

bool Interruption::interrupted()
{
    return flag().exchange(false);
}

bool Interruption::is_interrupted()
{
    return flag().load();
}

void Interruption::check()
{
    if (interrupted()) {
        throw Interrupted();
    }
}

} // namespace hostuid::infra
