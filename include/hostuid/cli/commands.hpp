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
 * @file commands.hpp
 * @brief Argument validation and bulk generation behind the `hostuid` tool.
 *
 * @details
 * Everything here is free of process state (signals, stdout) so that the
 * command line paths can be exercised directly by the test suite.
 */

#pragma once

#include "hostuid/core/uid.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace hostuid::cli {

/// @brief Upper bound accepted for `--threads`.
constexpr long long kMaxThreads = 256;

/// @brief Produces one identifier. Called concurrently when more than one thread is used.
using UidSource = std::function<core::Uid()>;

/**
 * @brief Checks the generation settings before any work starts.
 *
 * @throws std::invalid_argument If `count` is negative, `threads` is outside
 * `[1, kMaxThreads]`, or `format` is not one of `text`, `hex`, `json`.
 */
void validate_options(long long count, long long threads, const std::string& format);

/**
 * @brief Generates `count` identifiers, fanned out over `threads` workers.
 *
 * The work is split into `threads` contiguous slices (the first `count % threads`
 * slices take one extra identifier). Each worker fills its own slice, and the
 * result is the concatenation of the slices in order, so every slice's run is
 * increasing in the result.
 *
 * Generation stops early once `stop` becomes true; the result then holds what
 * each slice had produced.
 *
 * @throws std::invalid_argument If the arguments fail `validate_options`.
 * @throws Whatever `source` throws. With several workers, the failure of the
 * lowest-numbered failing slice is rethrown after every worker has finished.
 */
std::vector<core::Uid> generate_bulk(long long count, long long threads, const UidSource& source,
                                     const std::atomic<bool>& stop);

/**
 * @brief Parses the 28-digit hex form of an identifier's 14-byte encoding.
 *
 * Surrounding whitespace is ignored.
 *
 * @throws std::invalid_argument If the text is not hex or not exactly 14 bytes long.
 */
core::Uid parse_hex_uid(const std::string& hex);

/**
 * @brief Parses a well-known identifier number.
 *
 * @throws std::invalid_argument Unless the whole text is a decimal integer in
 * the signed 16-bit range.
 */
int16_t parse_well_known(const std::string& number_text);

/// @brief Lowercase hex of the identifier's 14-byte encoding.
std::string to_hex(const core::Uid& uid);

} // namespace hostuid::cli
