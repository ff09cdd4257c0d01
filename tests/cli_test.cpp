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
 * @file cli_test.cpp
 * @brief Tests for the command line helpers: option checks, bulk generation
 * and the `decode` / `well-known` argument parsers.
 */

#include "hostuid/cli/commands.hpp"
#include "hostuid/core/clock.hpp"
#include "hostuid/core/uid_generator.hpp"
#include "framework.hpp"

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

using hostuid::core::Uid;
using hostuid::core::UidGenerator;
namespace cli = hostuid::cli;

namespace {

std::atomic<int32_t> g_next_worker_tag{1};

/**
 * @brief Stamps each identifier with its thread's tag and a per-thread counter,
 * so the result shows which worker produced what, and in which order.
 */
Uid tagged_uid()
{
    thread_local int32_t tag = g_next_worker_tag.fetch_add(1);
    thread_local int16_t issued = 0;
    return Uid(tag, 0, issued++);
}

} // namespace

void test_cli_validate_options()
{
    cli::validate_options(0, 1, "text");
    cli::validate_options(10, cli::kMaxThreads, "json");
    cli::validate_options(10, 4, "hex");

    ASSERT_THROWS(cli::validate_options(-1, 1, "text"), std::invalid_argument);
    ASSERT_THROWS(cli::validate_options(1, 0, "text"), std::invalid_argument);
    ASSERT_THROWS(cli::validate_options(1, cli::kMaxThreads + 1, "text"), std::invalid_argument);
    ASSERT_THROWS(cli::validate_options(1, 1000000000LL, "text"), std::invalid_argument);
    ASSERT_THROWS(cli::validate_options(1, 1, "xml"), std::invalid_argument);
}

/**
 * @brief Threaded output is the slices laid end to end: every slice is one
 * worker's uninterrupted run.
 */
void test_cli_generate_bulk_keeps_slice_order()
{
    std::atomic<bool> stop{false};
    std::vector<Uid> uids = cli::generate_bulk(10, 3, &tagged_uid, stop);
    ASSERT_EQ(uids.size(), static_cast<size_t>(10));

    // 10 over 3 workers: slices of 4, 3 and 3.
    const size_t bounds[] = {0, 4, 7, 10};
    for (size_t s = 0; s < 3; ++s) {
        for (size_t i = bounds[s] + 1; i < bounds[s + 1]; ++i) {
            ASSERT_EQ(uids[i].unique(), uids[i - 1].unique());
            ASSERT_EQ(static_cast<int>(uids[i].count()), uids[i - 1].count() + 1);
        }
    }

    std::unordered_set<Uid> seen(uids.begin(), uids.end());
    ASSERT_EQ(seen.size(), uids.size());
}

void test_cli_generate_bulk_with_generator()
{
    UidGenerator generator(hostuid::core::SystemClock::instance());
    std::atomic<bool> stop{false};
    auto source = [&generator] { return generator.generate(); };

    std::vector<Uid> single = cli::generate_bulk(500, 1, source, stop);
    std::vector<Uid> threaded = cli::generate_bulk(1001, 8, source, stop);
    ASSERT_EQ(single.size(), static_cast<size_t>(500));
    ASSERT_EQ(threaded.size(), static_cast<size_t>(1001));

    std::unordered_set<Uid> seen(single.begin(), single.end());
    seen.insert(threaded.begin(), threaded.end());
    ASSERT_EQ(seen.size(), static_cast<size_t>(1501));

    ASSERT_EQ(cli::generate_bulk(0, 4, source, stop).size(), static_cast<size_t>(0));
    ASSERT_THROWS(cli::generate_bulk(10, cli::kMaxThreads + 1, source, stop),
                  std::invalid_argument);
}

/**
 * @brief A failure inside any worker reaches the caller instead of yielding a
 * short result.
 */
void test_cli_generate_bulk_propagates_failure()
{
    std::atomic<bool> stop{false};

    std::atomic<int> calls{0};
    auto fails_on_sixth = [&calls]() -> Uid {
        if (calls.fetch_add(1) == 5) {
            throw std::runtime_error("source failed");
        }
        return Uid(1, 0, 0);
    };
    ASSERT_THROWS(cli::generate_bulk(40, 4, fails_on_sixth, stop), std::runtime_error);

    calls.store(0);
    ASSERT_THROWS(cli::generate_bulk(40, 1, fails_on_sixth, stop), std::runtime_error);

    // Same path with a real generator whose host discriminant cannot be drawn.
    UidGenerator broken(hostuid::core::SystemClock::instance(),
                        []() -> int32_t { throw std::runtime_error("no entropy"); });
    auto source = [&broken] { return broken.generate(); };
    ASSERT_THROWS(cli::generate_bulk(12, 3, source, stop), std::runtime_error);
}

void test_cli_generate_bulk_honours_stop()
{
    std::atomic<bool> stop{true};
    std::atomic<int> calls{0};
    auto counting = [&calls] {
        calls.fetch_add(1);
        return Uid(1, 0, 0);
    };

    ASSERT_EQ(cli::generate_bulk(100, 1, counting, stop).size(), static_cast<size_t>(0));
    ASSERT_EQ(cli::generate_bulk(100, 4, counting, stop).size(), static_cast<size_t>(0));
    ASSERT_EQ(calls.load(), 0);
}

void test_cli_parse_hex_uid()
{
    Uid original(0x12345678, 0x0102030405060708LL, -2);
    std::string hex = cli::to_hex(original);
    ASSERT_EQ(hex, std::string("123456780102030405060708fffe"));

    ASSERT_EQ(cli::parse_hex_uid(hex), original);
    ASSERT_EQ(cli::parse_hex_uid("  123456780102030405060708FFFE\n"), original);

    // Length must be exactly 14 bytes.
    ASSERT_THROWS(cli::parse_hex_uid("1234567801020304050607"), std::invalid_argument);
    ASSERT_THROWS(cli::parse_hex_uid(hex + "00"), std::invalid_argument);
    ASSERT_THROWS(cli::parse_hex_uid(""), std::invalid_argument);
    ASSERT_THROWS(cli::parse_hex_uid("123456780102030405060708fffg"), std::invalid_argument);
}

void test_cli_parse_well_known()
{
    ASSERT_EQ(static_cast<int>(cli::parse_well_known("0")), 0);
    ASSERT_EQ(static_cast<int>(cli::parse_well_known("32767")), 32767);
    ASSERT_EQ(static_cast<int>(cli::parse_well_known("-32768")), -32768);

    ASSERT_THROWS(cli::parse_well_known("32768"), std::invalid_argument);
    ASSERT_THROWS(cli::parse_well_known("-32769"), std::invalid_argument);
    ASSERT_THROWS(cli::parse_well_known("12x"), std::invalid_argument);
    ASSERT_THROWS(cli::parse_well_known(""), std::invalid_argument);
    ASSERT_THROWS(cli::parse_well_known("seven"), std::invalid_argument);
    ASSERT_THROWS(cli::parse_well_known("99999999999999999999999"), std::invalid_argument);
}
