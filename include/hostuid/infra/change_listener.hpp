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
 * @file change_listener.hpp
 * @brief Callback contract for configuration value changes.
 */

#pragma once

#include <string>

namespace hostuid::infra {

/**
 * @struct ChangeEvent
 * @brief Describes one configuration value transition.
 *
 * `old_value` is empty when the key had no previous value.
 */
struct ChangeEvent {
    std::string key;
    std::string old_value;
    std::string new_value;
};

/**
 * @class ChangeListener
 * @brief Single-method capability invoked by `Config` after a value changes.
 */
class ChangeListener {
  public:
    virtual ~ChangeListener() = default;

    /**
     * @brief Called synchronously on the thread that performed the change.
     * @param event The key together with its previous and new value.
     */
    virtual void on_change(const ChangeEvent& event) = 0;
};

} // namespace hostuid::infra
