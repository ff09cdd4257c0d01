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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "hostuid/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace hostuid::infra {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The `static_cast<unsigned char>` prevents undefined behavior in
 * `std::isspace` for characters with negative values.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

/**
 * @brief Signed radix-16 rendering.
 *
 * The magnitude is computed in unsigned arithmetic so that the most negative
 * value does not overflow on negation.
 */
std::string String::to_signed_hex(int64_t value)
{
    if (value == 0) {
        return "0";
    }

    bool negative = value < 0;
    uint64_t magnitude = negative ? (~static_cast<uint64_t>(value) + 1) : static_cast<uint64_t>(value);

    std::string digits;
    while (magnitude != 0) {
        digits.push_back(kHexDigits[magnitude & 0xF]);
        magnitude >>= 4;
    }
    if (negative) {
        digits.push_back('-');
    }

    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string String::hex_encode(const uint8_t* data, size_t size)
{
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return out;
}

std::vector<uint8_t> String::hex_decode(const std::string& hex)
{
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length: " + std::to_string(hex.size()));
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex digit near offset " + std::to_string(i));
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

} // namespace hostuid::infra
