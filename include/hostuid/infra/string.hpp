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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` holding the text routines shared by the identifier renderer,
 * the configuration loader and the command line parser.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hostuid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string A new string without surrounding whitespace. Returns an
     * empty string if the input is empty or consists solely of whitespace.
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Renders a signed integer in lowercase radix 16 without padding.
     *
     * Negative values are written as a `-` sign followed by the hexadecimal
     * magnitude, so `-26` renders as `"-1a"` and `INT64_MIN` as
     * `"-8000000000000000"`.
     *
     * @code
     * String::to_signed_hex(255); // "ff"
     * String::to_signed_hex(-1);  // "-1"
     * @endcode
     */
    static std::string to_signed_hex(int64_t value);

    /**
     * @brief Encodes a byte buffer as lowercase hexadecimal (two digits per byte).
     */
    static std::string hex_encode(const uint8_t* data, size_t size);

    /**
     * @brief Decodes a hexadecimal string into bytes.
     *
     * Both upper and lower case digits are accepted.
     *
     * @throws std::invalid_argument If the input has odd length or contains a
     * non-hexadecimal character.
     */
    static std::vector<uint8_t> hex_decode(const std::string& hex);
};

} // namespace hostuid::infra
