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
 * @file main_test.cpp
 * @brief Central orchestrator for the HostUID test suite.
 */

#include "hostuid/infra/logger.hpp"
#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Identifier Value & Codec (uid_test.cpp)
void test_uid_equality();
void test_uid_hash_code();
void test_uid_to_string();
void test_uid_to_string_extremes();
void test_uid_encode_layout();
void test_uid_decode_roundtrip();
void test_uid_decode_stream_sequence();
void test_uid_decode_short_read();
void test_uid_encode_failed_stream();
void test_well_known_uids();

// Generator (generator_test.cpp)
void test_generate_same_millisecond();
void test_host_discriminant_drawn_once();
void test_sequence_exhaustion_waits_for_clock();
void test_clock_regression_keeps_time_increasing();
void test_pending_interruption_is_reasserted();
void test_interruption_during_wait_is_retried();
void test_generate_leaves_flag_alone_without_wait();
void test_concurrent_generation_is_unique();
void test_generation_is_ordered_per_thread();
void test_process_generator();

// Signature Parameters (params_test.cpp)
void test_signature_params_accessors();
void test_signature_params_defaults();
void test_signature_params_validation();

// Infrastructure (infra_test.cpp)
void test_string_trim();
void test_string_signed_hex();
void test_string_hex_codec();
void test_config_defaults();
void test_config_change_listener();
void test_config_load_json();
void test_config_rejects_inexact_numbers();
void test_config_load_file();
void test_scheduler_runs_all_tasks();
void test_interruption_flag();
void test_system_clock_sleep_interruptible();
void test_logger_levels();

// Command Line Helpers (cli_test.cpp)
void test_cli_validate_options();
void test_cli_generate_bulk_keeps_slice_order();
void test_cli_generate_bulk_with_generator();
void test_cli_generate_bulk_propagates_failure();
void test_cli_generate_bulk_honours_stop();
void test_cli_parse_hex_uid();
void test_cli_parse_well_known();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return 0 if every test passed, 1 otherwise.
 */
int main()
{
    std::cout << "\033[36mInitiating HostUID Test Suite...\033[0m" << std::endl;

    // Generator warnings (clock regression) are expected in the scripted-clock cases.
    hostuid::infra::Logger::set_level(hostuid::infra::LogLevel::ERROR);

    // --- 1. Identifier Value & Codec ---
    RUN_TEST(test_uid_equality);
    RUN_TEST(test_uid_hash_code);
    RUN_TEST(test_uid_to_string);
    RUN_TEST(test_uid_to_string_extremes);
    RUN_TEST(test_uid_encode_layout);
    RUN_TEST(test_uid_decode_roundtrip);
    RUN_TEST(test_uid_decode_stream_sequence);
    RUN_TEST(test_uid_decode_short_read);
    RUN_TEST(test_uid_encode_failed_stream);
    RUN_TEST(test_well_known_uids);

    // --- 2. Generator ---
    RUN_TEST(test_generate_same_millisecond);
    RUN_TEST(test_host_discriminant_drawn_once);
    RUN_TEST(test_sequence_exhaustion_waits_for_clock);
    RUN_TEST(test_clock_regression_keeps_time_increasing);
    RUN_TEST(test_pending_interruption_is_reasserted);
    RUN_TEST(test_interruption_during_wait_is_retried);
    RUN_TEST(test_generate_leaves_flag_alone_without_wait);
    RUN_TEST(test_concurrent_generation_is_unique);
    RUN_TEST(test_generation_is_ordered_per_thread);
    RUN_TEST(test_process_generator);

    // --- 3. Signature Parameters ---
    RUN_TEST(test_signature_params_accessors);
    RUN_TEST(test_signature_params_defaults);
    RUN_TEST(test_signature_params_validation);

    // --- 4. Infrastructure ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_signed_hex);
    RUN_TEST(test_string_hex_codec);
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_change_listener);
    RUN_TEST(test_config_load_json);
    RUN_TEST(test_config_rejects_inexact_numbers);
    RUN_TEST(test_config_load_file);
    RUN_TEST(test_scheduler_runs_all_tasks);
    RUN_TEST(test_interruption_flag);
    RUN_TEST(test_system_clock_sleep_interruptible);
    RUN_TEST(test_logger_levels);

    // --- 5. Command Line Helpers ---
    RUN_TEST(test_cli_validate_options);
    RUN_TEST(test_cli_generate_bulk_keeps_slice_order);
    RUN_TEST(test_cli_generate_bulk_with_generator);
    RUN_TEST(test_cli_generate_bulk_propagates_failure);
    RUN_TEST(test_cli_generate_bulk_honours_stop);
    RUN_TEST(test_cli_parse_hex_uid);
    RUN_TEST(test_cli_parse_well_known);

    hostuid::test::print_summary();

    return (hostuid::test::failed_count == 0) ? 0 : 1;
}
