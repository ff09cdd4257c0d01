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
 * @file params_test.cpp
 * @brief Validation tests for `SignatureParams`.
 */

#include "hostuid/core/signature_params.hpp"
#include "framework.hpp"

#include <stdexcept>
#include <string>

using hostuid::core::SignatureParams;

void test_signature_params_accessors()
{
    SignatureParams params("SHA-256", "MGF1", 32, SignatureParams::TRAILER_FIELD_BC);
    ASSERT_EQ(params.digest_algorithm(), std::string("SHA-256"));
    ASSERT_EQ(params.mgf_algorithm(), std::string("MGF1"));
    ASSERT_EQ(params.salt_length(), 32);
    ASSERT_EQ(params.trailer_field(), 1);
    ASSERT_EQ(params.to_string(),
              std::string("MD: SHA-256\nMGF: MGF1\nSaltLength: 32\nTrailerField: 1\n"));

    // Zero is a legal salt length and trailer field.
    SignatureParams zero("SHA-1", "MGF1", 0, 0);
    ASSERT_EQ(zero.salt_length(), 0);
}

void test_signature_params_defaults()
{
    SignatureParams defaults = SignatureParams::defaults();
    ASSERT_EQ(defaults.digest_algorithm(), std::string("SHA-1"));
    ASSERT_EQ(defaults.mgf_algorithm(), std::string("MGF1"));
    ASSERT_EQ(defaults.salt_length(), 20);
    ASSERT_EQ(defaults.trailer_field(), SignatureParams::TRAILER_FIELD_BC);

    SignatureParams salted(48);
    ASSERT_EQ(salted.salt_length(), 48);
    ASSERT_EQ(salted.digest_algorithm(), std::string("SHA-1"));
}

/**
 * @brief Every constraint is enforced before construction completes.
 */
void test_signature_params_validation()
{
    ASSERT_THROWS(SignatureParams("", "MGF1", 20, 1), std::invalid_argument);
    ASSERT_THROWS(SignatureParams("SHA-1", "", 20, 1), std::invalid_argument);
    ASSERT_THROWS(SignatureParams("SHA-1", "MGF1", -1, 1), std::invalid_argument);
    ASSERT_THROWS(SignatureParams("SHA-1", "MGF1", 20, -1), std::invalid_argument);
    ASSERT_THROWS(SignatureParams(-5), std::invalid_argument);
}
