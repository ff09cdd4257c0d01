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
 * @file commands.cpp
 * @brief Implementation of the command line helpers.
 *
 * @details
 * The scheduler discards exceptions that escape a task, so each slice task
 * catches its own failure into an `exception_ptr` and the caller rethrows it
 * once the pool is idle.
 */

#include "hostuid/cli/commands.hpp"

#include "hostuid/infra/logger.hpp"
#include "hostuid/infra/scheduler.hpp"
#include "hostuid/infra/string.hpp"

#include <exception>
#include <limits>
#include <stdexcept>
#include <string>

namespace hostuid::cli {

using core::Uid;
using infra::LogLevel;
using infra::Logger;

void validate_options(long long count, long long threads, const std::string& format)
{
    if (count < 0) {
        throw std::invalid_argument("count must not be negative");
    }
    if (threads < 1 || threads > kMaxThreads) {
        throw std::invalid_argument("threads must be between 1 and " + std::to_string(kMaxThreads) +
                                    ", got " + std::to_string(threads));
    }
    if (format != "text" && format != "hex" && format != "json") {
        throw std::invalid_argument("Unknown output format: '" + format + "'");
    }
}

std::vector<Uid> generate_bulk(long long count, long long threads, const UidSource& source,
                               const std::atomic<bool>& stop)
{
    validate_options(count, threads, "text");

    std::vector<Uid> result;
    if (threads == 1) {
        result.reserve(static_cast<size_t>(count));
        for (long long i = 0; i < count && !stop.load(); ++i) {
            result.push_back(source());
        }
        return result;
    }

    std::vector<std::vector<Uid>> slices(static_cast<size_t>(threads));
    std::vector<std::exception_ptr> errors(static_cast<size_t>(threads));
    std::atomic<bool> failed{false};
    {
        infra::Scheduler scheduler(static_cast<size_t>(threads));
        long long per_slice = count / threads;
        long long remainder = count % threads;

        for (long long t = 0; t < threads; ++t) {
            long long quota = per_slice + (t < remainder ? 1 : 0);
            std::vector<Uid>& slice = slices[static_cast<size_t>(t)];
            std::exception_ptr& error = errors[static_cast<size_t>(t)];
            scheduler.enqueue([quota, &slice, &error, &failed, &source, &stop] {
                try {
                    slice.reserve(static_cast<size_t>(quota));
                    for (long long i = 0; i < quota && !stop.load() && !failed.load(); ++i) {
                        slice.push_back(source());
                    }
                } catch (...) {
                    error = std::current_exception();
                    failed.store(true);
                }
            });
        }
        scheduler.wait_idle();
    }

    for (size_t t = 0; t < errors.size(); ++t) {
        if (errors[t]) {
            Logger::log(LogLevel::DEBUG, "Generator: slice " + std::to_string(t) + " failed");
            std::rethrow_exception(errors[t]);
        }
    }

    for (const auto& slice : slices) {
        result.insert(result.end(), slice.begin(), slice.end());
    }
    return result;
}

Uid parse_hex_uid(const std::string& hex)
{
    auto bytes = infra::String::hex_decode(infra::String::trim(hex));
    if (bytes.size() != Uid::kEncodedSize) {
        throw std::invalid_argument("Expected " + std::to_string(Uid::kEncodedSize * 2) +
                                    " hex digits, got " + std::to_string(bytes.size() * 2));
    }
    return Uid::from_bytes(bytes.data(), bytes.size());
}

int16_t parse_well_known(const std::string& number_text)
{
    const std::string message =
        "Well-known number must be a 16-bit signed integer: '" + number_text + "'";

    size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(number_text, &consumed);
    } catch (const std::logic_error&) {
        // std::stol reports both malformed and out-of-range text this way.
        throw std::invalid_argument(message);
    }

    if (consumed != number_text.size() || value < std::numeric_limits<int16_t>::min() ||
        value > std::numeric_limits<int16_t>::max()) {
        throw std::invalid_argument(message);
    }
    return static_cast<int16_t>(value);
}

std::string to_hex(const Uid& uid)
{
    auto bytes = uid.to_bytes();
    return infra::String::hex_encode(bytes.data(), bytes.size());
}

} // namespace hostuid::cli
