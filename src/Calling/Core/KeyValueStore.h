/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#pragma once

#include "ErrorCodes.h"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace EntropyEngine::Calling {

/**
 * @brief Host-provided persistent string store
 *
 * Backs the missed-call counters, the last-incoming-peer marker and the known
 * user id. Implementations must be safe to call from the scheduler thread.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> getItem(const std::string& key) const = 0;
    virtual Result<void> setItem(const std::string& key, const std::string& value) = 0;
    virtual Result<void> removeItem(const std::string& key) = 0;
};

/**
 * @brief Process-local KeyValueStore
 *
 * Used by tests and by hosts without persistence. Thread-safe.
 */
class InMemoryKeyValueStore : public KeyValueStore {
public:
    std::optional<std::string> getItem(const std::string& key) const override;
    Result<void> setItem(const std::string& key, const std::string& value) override;
    Result<void> removeItem(const std::string& key) override;

    size_t size() const;

private:
    mutable std::mutex _mutex;
    std::unordered_map<std::string, std::string> _items;
};

} // namespace EntropyEngine::Calling
