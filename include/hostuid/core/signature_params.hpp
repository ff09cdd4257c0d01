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
 * @file signature_params.hpp
 * @brief Validated parameter set for probabilistic signature schemes.
 */

#pragma once

#include <string>

namespace hostuid::core {

/**
 * @class SignatureParams
 * @brief Immutable digest / mask-generation / salt / trailer parameter set.
 *
 * All constraints are checked in the constructor; an instance that exists is
 * always valid.
 */
class SignatureParams {
  public:
    /// @brief Trailer field value `0xBC` as used by RFC 8017.
    static constexpr int TRAILER_FIELD_BC = 1;

    /**
     * @brief Builds a parameter set.
     *
     * @throws std::invalid_argument If either name is empty or either integer is negative.
     */
    SignatureParams(std::string digest_algorithm, std::string mgf_algorithm, int salt_length,
                    int trailer_field);

    /**
     * @brief Builds a parameter set with the default `SHA-1` / `MGF1` names and
     * `TRAILER_FIELD_BC`.
     *
     * @throws std::invalid_argument If `salt_length` is negative.
     */
    explicit SignatureParams(int salt_length);

    /// @brief `SHA-1`, `MGF1`, salt length 20, `TRAILER_FIELD_BC`.
    static SignatureParams defaults();

    const std::string& digest_algorithm() const { return digest_algorithm_; }
    const std::string& mgf_algorithm() const { return mgf_algorithm_; }
    int salt_length() const { return salt_length_; }
    int trailer_field() const { return trailer_field_; }

    /// @brief Multi-line `MD:` / `MGF:` / `SaltLength:` / `TrailerField:` dump.
    std::string to_string() const;

  private:
    std::string digest_algorithm_;
    std::string mgf_algorithm_;
    int salt_length_;
    int trailer_field_;
};

} // namespace hostuid::core
