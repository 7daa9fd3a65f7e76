/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "RaceGuard.h"

namespace EntropyEngine
{
namespace Calling
{

RaceGuard::RaceGuard(const Scheduler& clock, const Config& config) : _clock(clock), _config(config) {}

void RaceGuard::markCanceled(const CallId& callId) {
    if (callId.empty()) return;
    std::lock_guard<std::mutex> lock(_mutex);
    evictExpired();
    _canceled[callId] = _clock.now();
}

void RaceGuard::markTimedOut(const CallId& callId) {
    if (callId.empty()) return;
    std::lock_guard<std::mutex> lock(_mutex);
    evictExpired();
    _timedOut[callId] = _clock.now();
}

bool RaceGuard::isSuppressed(const CallId& callId) {
    std::lock_guard<std::mutex> lock(_mutex);
    evictExpired();
    return _canceled.count(callId) > 0 || _timedOut.count(callId) > 0;
}

bool RaceGuard::isCanceled(const CallId& callId) {
    std::lock_guard<std::mutex> lock(_mutex);
    evictExpired();
    return _canceled.count(callId) > 0;
}

bool RaceGuard::isTimedOut(const CallId& callId) {
    std::lock_guard<std::mutex> lock(_mutex);
    evictExpired();
    return _timedOut.count(callId) > 0;
}

size_t RaceGuard::size() {
    std::lock_guard<std::mutex> lock(_mutex);
    evictExpired();
    return _canceled.size() + _timedOut.size();
}

void RaceGuard::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _canceled.clear();
    _timedOut.clear();
}

void RaceGuard::evictExpired() {
    auto now = _clock.now();
    auto evict = [&](Entries& entries) {
        for (auto it = entries.begin(); it != entries.end();) {
            if (now - it->second > _config.ttl) {
                it = entries.erase(it);
            } else {
                ++it;
            }
        }
    };
    evict(_canceled);
    evict(_timedOut);
}

}  // namespace Calling
}  // namespace EntropyEngine
