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
 * @file uid.cpp
 * @brief Hashing, text rendering and the big-endian codec of `Uid`.
 */

#include "hostuid/core/uid.hpp"

#include "hostuid/infra/string.hpp"

#include <istream>
#include <ostream>

namespace hostuid::core {

namespace {

void put_be(uint8_t* out, uint64_t value, size_t width)
{
    for (size_t i = 0; i < width; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * (width - 1 - i)));
    }
}

uint64_t get_be(const uint8_t* in, size_t width)
{
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value = (value << 8) | in[i];
    }
    return value;
}

} // namespace

int32_t Uid::hash_code() const
{
    uint32_t sum = static_cast<uint32_t>(time_) + static_cast<uint32_t>(static_cast<int32_t>(count_));
    return static_cast<int32_t>(sum);
}

std::string Uid::to_string() const
{
    return infra::String::to_signed_hex(unique_) + ":" + infra::String::to_signed_hex(time_) + ":" +
           infra::String::to_signed_hex(count_);
}

std::array<uint8_t, Uid::kEncodedSize> Uid::to_bytes() const
{
    std::array<uint8_t, kEncodedSize> bytes{};
    put_be(bytes.data(), static_cast<uint32_t>(unique_), 4);
    put_be(bytes.data() + 4, static_cast<uint64_t>(time_), 8);
    put_be(bytes.data() + 12, static_cast<uint16_t>(count_), 2);
    return bytes;
}

Uid Uid::from_bytes(const uint8_t* data, size_t size)
{
    if (data == nullptr || size < kEncodedSize) {
        throw IoError("Uid: need " + std::to_string(kEncodedSize) + " bytes, got " +
                      std::to_string(data == nullptr ? 0 : size));
    }

    auto unique = static_cast<int32_t>(static_cast<uint32_t>(get_be(data, 4)));
    auto time = static_cast<int64_t>(get_be(data + 4, 8));
    auto count = static_cast<int16_t>(static_cast<uint16_t>(get_be(data + 12, 2)));
    return Uid(unique, time, count);
}

void Uid::encode(std::ostream& out) const
{
    if (!out) {
        throw IoError("Uid: output stream is not writable");
    }

    auto bytes = to_bytes();
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw IoError("Uid: failed to write " + std::to_string(kEncodedSize) + " bytes");
    }
}

Uid Uid::decode(std::istream& in)
{
    if (!in) {
        throw IoError("Uid: input stream is not readable");
    }

    std::array<uint8_t, kEncodedSize> bytes{};
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    auto got = in.gcount();
    if (got != static_cast<std::streamsize>(kEncodedSize)) {
        throw IoError("Uid: short read, got " + std::to_string(got) + " of " +
                      std::to_string(kEncodedSize) + " bytes");
    }
    return from_bytes(bytes.data(), bytes.size());
}

std::ostream& operator<<(std::ostream& os, const Uid& uid)
{
    return os << uid.to_string();
}

} // namespace hostuid::core
