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
 * @file config.cpp
 * @brief Implementation of the configuration store and its JSON loader.
 *
 * @details
 * JSON parsing is delegated to cJSON. The parsed tree is flattened into
 * key/value pairs and released before any value is applied, so listener
 * callbacks never run while a cJSON tree is alive.
 */

#include "hostuid/infra/config.hpp"

#include "hostuid/infra/string.hpp"

#include <algorithm>
#include <cJSON.h>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace hostuid::infra {

namespace {

/// Bounds of `long long` as doubles: -2^63 is representable, 2^63 is the first value past the top.
constexpr double kMinIntegralSetting = -9223372036854775808.0;
constexpr double kIntegralSettingLimit = 9223372036854775808.0;

} // namespace

Config::Config()
{
    values_ = {
        {"log_level", "info"},
        {"count", "1"},
        {"threads", "1"},
        {"format", "text"},
    };
}

void Config::load_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Config: cannot open '" + path + "'");
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    load_json(buffer.str());
}

void Config::load_json(const std::string& text)
{
    cJSON* root = cJSON_Parse(text.c_str());
    if (!root) {
        throw std::runtime_error("Config: invalid JSON syntax");
    }
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        throw std::runtime_error("Config: top-level JSON value must be an object");
    }

    std::vector<std::pair<std::string, std::string>> entries;
    bool failed = false;
    std::string failure;

    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root)
    {
        std::string key = item->string ? item->string : "";
        if (cJSON_IsString(item) && item->valuestring) {
            entries.emplace_back(key, String::trim(item->valuestring));
        } else if (cJSON_IsNumber(item)) {
            // Settings are integers; anything a long long cannot hold exactly is rejected.
            double value = item->valuedouble;
            if (!std::isfinite(value) || std::floor(value) != value ||
                value < kMinIntegralSetting || value >= kIntegralSettingLimit) {
                failed = true;
                failure = "Config: value for key '" + key + "' is not a 64-bit integer";
                break;
            }
            entries.emplace_back(key, std::to_string(static_cast<long long>(value)));
        } else if (cJSON_IsBool(item)) {
            entries.emplace_back(key, cJSON_IsTrue(item) ? "true" : "false");
        } else {
            failed = true;
            failure = "Config: unsupported value type for key '" + key + "'";
            break;
        }
    }

    cJSON_Delete(root);

    if (failed) {
        throw std::invalid_argument(failure);
    }

    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

void Config::set(const std::string& key, const std::string& value)
{
    ChangeEvent event{key, "", value};
    std::vector<std::shared_ptr<ChangeListener>> listeners;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it != values_.end()) {
            if (it->second == value) {
                return;
            }
            event.old_value = it->second;
            it->second = value;
        } else {
            values_.emplace(key, value);
        }
        listeners = listeners_;
    }

    // Listeners run without the lock so they may read the store.
    for (const auto& listener : listeners) {
        listener->on_change(event);
    }
}

bool Config::contains(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.count(key) != 0;
}

std::string Config::get(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        throw std::out_of_range("Config: unknown key '" + key + "'");
    }
    return it->second;
}

long long Config::get_int(const std::string& key) const
{
    std::string raw = get(key);
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(raw, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Config: value of '" + key + "' is not an integer: '" + raw + "'");
    }
    if (consumed != raw.size()) {
        throw std::invalid_argument("Config: value of '" + key + "' is not an integer: '" + raw + "'");
    }
    return value;
}

void Config::add_listener(std::shared_ptr<ChangeListener> listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void Config::remove_listener(const std::shared_ptr<ChangeListener>& listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

} // namespace hostuid::infra
