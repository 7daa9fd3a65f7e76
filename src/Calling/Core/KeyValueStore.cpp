/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "KeyValueStore.h"

namespace EntropyEngine::Calling
{

std::optional<std::string> InMemoryKeyValueStore::getItem(const std::string& key) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _items.find(key);
    if (it == _items.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> InMemoryKeyValueStore::setItem(const std::string& key, const std::string& value) {
    if (key.empty()) {
        return Result<void>::err(CallError::InvalidParameter, "Empty key");
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _items[key] = value;
    return Result<void>::ok();
}

Result<void> InMemoryKeyValueStore::removeItem(const std::string& key) {
    std::lock_guard<std::mutex> lock(_mutex);
    _items.erase(key);
    return Result<void>::ok();
}

size_t InMemoryKeyValueStore::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _items.size();
}

}  // namespace EntropyEngine::Calling
