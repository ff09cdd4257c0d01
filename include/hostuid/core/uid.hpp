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
 * @file uid.hpp
 * @brief Immutable host-unique identifier value and its binary codec.
 *
 * @details
 * A `Uid` is made of three fields:
 * - `unique`: identifies the generator epoch on its host (0 for well-known ids),
 * - `time`: wall-clock milliseconds captured at generation (0 for well-known ids),
 * - `count`: distinguishes identifiers generated within the same millisecond,
 *   or holds the well-known number.
 *
 * Paired with a unique host address (e.g. an IP), a generated `Uid` forms a
 * globally unique identifier, provided host restarts take longer than one
 * millisecond and the system clock is never set backwards across restarts.
 *
 * **Wire format** (14 bytes, big-endian, no framing):
 * | offset | size | field  |
 * |--------|------|--------|
 * | 0      | 4    | unique |
 * | 4      | 8    | time   |
 * | 12     | 2    | count  |
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace hostuid::core {

/**
 * @class IoError
 * @brief Raised when a byte sink or source cannot accept or supply a full identifier.
 */
class IoError : public std::runtime_error {
  public:
    explicit IoError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class Uid
 * @brief Immutable identifier value. Copied and compared by value.
 */
class Uid {
  public:
    /// @brief Size in bytes of the binary representation.
    static constexpr size_t kEncodedSize = 14;

    /**
     * @brief Constructs an identifier from explicit field values.
     *
     * No validation is performed: every bit pattern is a legal identifier.
     */
    constexpr Uid(int32_t unique, int64_t time, int16_t count)
        : unique_(unique), time_(time), count_(count)
    {
    }

    constexpr int32_t unique() const { return unique_; }
    constexpr int64_t time() const { return time_; }
    constexpr int16_t count() const { return count_; }

    /// @brief True for identifiers with a zero host discriminant and zero time.
    constexpr bool is_well_known() const { return unique_ == 0 && time_ == 0; }

    /**
     * @brief 32-bit hash of the identifier.
     *
     * Combines `time` and `count` only (truncated to 32 bits and summed with
     * wrap-around). All identifiers from one process share `unique`, so it
     * adds nothing to the distribution within a process.
     */
    int32_t hash_code() const;

    /**
     * @brief Renders `unique:time:count` in lowercase signed hexadecimal.
     *
     * @code
     * Uid(255, 26, 10).to_string(); // "ff:1a:a"
     * Uid(-1, 0, -5).to_string();   // "-1:0:-5"
     * @endcode
     */
    std::string to_string() const;

    /**
     * @brief Serializes the identifier into its 14-byte big-endian form.
     */
    std::array<uint8_t, kEncodedSize> to_bytes() const;

    /**
     * @brief Rebuilds an identifier from a raw buffer.
     *
     * Reads the first 14 bytes of `data`; trailing bytes are ignored.
     *
     * @throws IoError If `size` is smaller than 14.
     */
    static Uid from_bytes(const uint8_t* data, size_t size);

    /**
     * @brief Writes the 14-byte representation to `out`.
     * @throws IoError If the stream is not writable or the write fails.
     */
    void encode(std::ostream& out) const;

    /**
     * @brief Reads a 14-byte representation from `in`.
     * @throws IoError On short read or stream failure.
     */
    static Uid decode(std::istream& in);

  private:
    int32_t unique_;
    int64_t time_;
    int16_t count_;
};

constexpr bool operator==(const Uid& a, const Uid& b)
{
    return a.unique() == b.unique() && a.count() == b.count() && a.time() == b.time();
}

constexpr bool operator!=(const Uid& a, const Uid& b)
{
    return !(a == b);
}

/// @brief Streams `Uid::to_string()`.
std::ostream& operator<<(std::ostream& os, const Uid& uid);

} // namespace hostuid::core

namespace std {

template <> struct hash<hostuid::core::Uid> {
    size_t operator()(const hostuid::core::Uid& uid) const noexcept
    {
        return static_cast<size_t>(static_cast<uint32_t>(uid.hash_code()));
    }
};

} // namespace std
