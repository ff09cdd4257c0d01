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
 * @file config.hpp
 * @brief Key/value configuration store for the command line front-end.
 *
 * @details
 * This header declares the `Config` class. Values are kept as strings, seeded
 * with built-in defaults, optionally overlaid from a JSON object file, and
 * finally overridden by command line flags. Registered `ChangeListener`s are
 * notified whenever a stored value actually changes.
 *
 * **Recognized keys and defaults:**
 * | key         | default | meaning                                  |
 * |-------------|---------|------------------------------------------|
 * | `log_level` | `info`  | Logger threshold                         |
 * | `count`     | `1`     | identifiers to generate                  |
 * | `threads`   | `1`     | worker threads used for generation       |
 * | `format`    | `text`  | output format: `text`, `hex` or `json`   |
 */

#pragma once

#include "hostuid/infra/change_listener.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hostuid::infra {

/**
 * @class Config
 * @brief Thread-safe string key/value store with change notification.
 */
class Config {
  public:
    /**
     * @brief Creates a store populated with the built-in defaults.
     */
    Config();

    /**
     * @brief Overlays values from a JSON object file.
     *
     * String, number and boolean members are accepted. Numbers must be whole
     * and fit a `long long`. Nested objects and arrays are rejected. Nothing is
     * applied unless every member is accepted.
     *
     * @code
     * { "log_level": "debug", "count": 10, "format": "json" }
     * @endcode
     *
     * @throws std::runtime_error If the file cannot be read or is not a JSON object.
     * @throws std::invalid_argument If a member has an unsupported type or is a
     * fractional or out-of-range number.
     */
    void load_file(const std::string& path);

    /**
     * @brief Overlays values from JSON text (same rules as `load_file`).
     */
    void load_json(const std::string& text);

    /**
     * @brief Stores a value and notifies listeners if it differs from the current one.
     */
    void set(const std::string& key, const std::string& value);

    /// @brief Returns true if the key has a value.
    bool contains(const std::string& key) const;

    /**
     * @brief Returns the value for `key`.
     * @throws std::out_of_range If the key is unknown.
     */
    std::string get(const std::string& key) const;

    /**
     * @brief Returns the value for `key` parsed as a decimal integer.
     * @throws std::out_of_range If the key is unknown.
     * @throws std::invalid_argument If the value is not a complete integer.
     */
    long long get_int(const std::string& key) const;

    /**
     * @brief Registers a listener. The store shares ownership of it.
     */
    void add_listener(std::shared_ptr<ChangeListener> listener);

    /// @brief Unregisters a previously added listener.
    void remove_listener(const std::shared_ptr<ChangeListener>& listener);

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
    std::vector<std::shared_ptr<ChangeListener>> listeners_;
};

} // namespace hostuid::infra
