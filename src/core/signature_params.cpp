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

#include "hostuid/core/signature_params.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace hostuid::core {

SignatureParams::SignatureParams(std::string digest_algorithm, std::string mgf_algorithm,
                                 int salt_length, int trailer_field)
    : digest_algorithm_(std::move(digest_algorithm)), mgf_algorithm_(std::move(mgf_algorithm)),
      salt_length_(salt_length), trailer_field_(trailer_field)
{
    if (digest_algorithm_.empty()) {
        throw std::invalid_argument("SignatureParams: digest algorithm name is empty");
    }
    if (mgf_algorithm_.empty()) {
        throw std::invalid_argument("SignatureParams: mask generation function name is empty");
    }
    if (salt_length_ < 0) {
        throw std::invalid_argument("SignatureParams: negative salt length: " +
                                    std::to_string(salt_length_));
    }
    if (trailer_field_ < 0) {
        throw std::invalid_argument("SignatureParams: negative trailer field: " +
                                    std::to_string(trailer_field_));
    }
}

SignatureParams::SignatureParams(int salt_length)
    : SignatureParams("SHA-1", "MGF1", salt_length, TRAILER_FIELD_BC)
{
}

SignatureParams SignatureParams::defaults()
{
    return SignatureParams("SHA-1", "MGF1", 20, TRAILER_FIELD_BC);
}

std::string SignatureParams::to_string() const
{
    std::ostringstream ss;
    ss << "MD: " << digest_algorithm_ << "\n"
       << "MGF: " << mgf_algorithm_ << "\n"
       << "SaltLength: " << salt_length_ << "\n"
       << "TrailerField: " << trailer_field_ << "\n";
    return ss.str();
}

} // namespace hostuid::core
