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
 * @file main.cpp
 * @brief Command line entry point for the `hostuid` tool.
 *
 * @details
 * Startup sequence:
 * 1. Argument Parsing (command and flags).
 * 2. Signal Handling Registration (SIGINT/SIGTERM stop bulk generation early).
 * 3. Configuration (defaults, optional JSON file, flag overrides).
 * 4. Command Execution: `generate` (default), `decode` or `well-known`.
 */

#include "hostuid/cli/commands.hpp"
#include "hostuid/core/uid.hpp"
#include "hostuid/core/uid_generator.hpp"
#include "hostuid/infra/change_listener.hpp"
#include "hostuid/infra/config.hpp"
#include "hostuid/infra/logger.hpp"

#include <atomic>
#include <cJSON.h>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using hostuid::core::Uid;
using hostuid::core::UidGenerator;
using hostuid::infra::LogLevel;
using hostuid::infra::Logger;

namespace {

/// @brief Set by the signal handler; polled by the generation loops.
std::atomic<bool> g_stop{false};

void signal_handler(int /*signum*/)
{
    g_stop.store(true);
}

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS]\n"
              << "       " << binary_name << " decode HEX\n"
              << "       " << binary_name << " well-known NUMBER\n"
              << "Options:\n"
              << "  --config FILE      Load settings from a JSON object file\n"
              << "  --count N          Number of identifiers to generate (Default: 1)\n"
              << "  --threads N        Worker threads used for generation, 1-256 (Default: 1)\n"
              << "  --format FORMAT    text | hex | json (Default: text)\n"
              << "  --log-level LEVEL  trace | debug | info | warn | error | fatal (Default: info)\n"
              << "  --help             Show this help message\n";
}

/**
 * @brief Applies `log_level` changes to the Logger threshold.
 */
class LogLevelListener : public hostuid::infra::ChangeListener {
  public:
    void on_change(const hostuid::infra::ChangeEvent& event) override
    {
        if (event.key == "log_level") {
            Logger::set_level(Logger::parse_level(event.new_value));
        }
    }
};

void print_uids(const std::vector<Uid>& uids, const std::string& format)
{
    if (format == "text") {
        for (const auto& uid : uids) {
            std::cout << uid << "\n";
        }
    } else if (format == "hex") {
        for (const auto& uid : uids) {
            std::cout << hostuid::cli::to_hex(uid) << "\n";
        }
    } else if (format == "json") {
        cJSON* root = cJSON_CreateArray();
        for (const auto& uid : uids) {
            cJSON* obj = cJSON_CreateObject();
            cJSON_AddNumberToObject(obj, "unique", uid.unique());
            cJSON_AddNumberToObject(obj, "time", static_cast<double>(uid.time()));
            cJSON_AddNumberToObject(obj, "count", uid.count());
            cJSON_AddStringToObject(obj, "text", uid.to_string().c_str());
            cJSON_AddStringToObject(obj, "hex", hostuid::cli::to_hex(uid).c_str());
            cJSON_AddItemToArray(root, obj);
        }

        char* raw_output = cJSON_Print(root);
        std::cout << raw_output << "\n";
        free(raw_output);
        cJSON_Delete(root);
    } else {
        throw std::invalid_argument("Unknown output format: '" + format + "'");
    }
    std::cout << std::flush;
}

int run_decode(const std::string& hex)
{
    Uid uid = hostuid::cli::parse_hex_uid(hex);
    std::cout << "unique: " << uid.unique() << "\n"
              << "time:   " << uid.time() << "\n"
              << "count:  " << uid.count() << "\n"
              << "text:   " << uid << "\n"
              << "well-known: " << (uid.is_well_known() ? "yes" : "no") << std::endl;
    return 0;
}

int run_well_known(const std::string& number_text)
{
    Uid uid = UidGenerator::well_known(hostuid::cli::parse_well_known(number_text));
    std::cout << uid << " " << hostuid::cli::to_hex(uid) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        if (!args.empty() && args[0] == "--help") {
            print_help(argv[0]);
            return 0;
        }

        if (!args.empty() && (args[0] == "decode" || args[0] == "well-known")) {
            if (args.size() != 2) {
                print_help(argv[0]);
                return 1;
            }
            return args[0] == "decode" ? run_decode(args[1]) : run_well_known(args[1]);
        }

        if (!args.empty() && args[0] == "generate") {
            args.erase(args.begin());
        }

        // 1. Collect flag overrides; the config file is applied before them.
        std::string config_path;
        std::vector<std::pair<std::string, std::string>> overrides;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (flag == "--help") {
                print_help(argv[0]);
                return 0;
            }
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for option '" + flag + "'");
            }
            const std::string& value = args[++i];
            if (flag == "--config")
                config_path = value;
            else if (flag == "--count")
                overrides.emplace_back("count", value);
            else if (flag == "--threads")
                overrides.emplace_back("threads", value);
            else if (flag == "--format")
                overrides.emplace_back("format", value);
            else if (flag == "--log-level")
                overrides.emplace_back("log_level", value);
            else
                throw std::invalid_argument("Unknown option '" + flag + "'");
        }

        // 2. Configuration
        hostuid::infra::Config config;
        config.add_listener(std::make_shared<LogLevelListener>());
        if (!config_path.empty()) {
            config.load_file(config_path);
        }
        for (const auto& entry : overrides) {
            config.set(entry.first, entry.second);
        }

        long long count = config.get_int("count");
        long long threads = config.get_int("threads");
        std::string format = config.get("format");
        hostuid::cli::validate_options(count, threads, format);

        Logger::log(LogLevel::DEBUG, "Config: count=" + std::to_string(count) +
                                         " threads=" + std::to_string(threads) +
                                         " format=" + format);

        // 3. Generation
        std::vector<Uid> uids =
            hostuid::cli::generate_bulk(count, threads, &hostuid::core::generate, g_stop);
        if (g_stop.load()) {
            Logger::log(LogLevel::WARN, "System: interrupted after " + std::to_string(uids.size()) +
                                            " of " + std::to_string(count) + " identifiers");
        }
        print_uids(uids, format);

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: " + std::string(e.what()));
        return 1;
    }

    return g_stop.load() ? 130 : 0;
}
