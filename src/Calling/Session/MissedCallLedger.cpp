/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "MissedCallLedger.h"

#include <Logging/Logger.h>

#include <charconv>
#include <format>

namespace EntropyEngine
{
namespace Calling
{

MissedCallLedger::MissedCallLedger(KeyValueStore& store, const Scheduler& clock) : _store(store), _clock(clock) {}

void MissedCallLedger::openOccurrence(const CallId& callId, const PeerId& peerId) {
    if (callId.empty() || peerId.empty()) return;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        pruneResolved();
        // A duplicate invitation keeps the existing occurrence, resolved or not
        _occurrences.try_emplace(callId, Occurrence{peerId});
    }

    auto stored = _store.setItem(LAST_INCOMING_KEY, peerId);
    if (stored.failed()) {
        ENTROPY_LOG_WARNING(std::format("Failed to store last incoming peer: {}", stored.errorMessage));
    }
}

bool MissedCallLedger::resolveMissed(const CallId& callId) {
    PeerId peerId;
    uint32_t updated = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _occurrences.find(callId);
        if (it == _occurrences.end() || it->second.resolved) {
            return false;
        }
        it->second.resolved = true;
        it->second.resolvedAt = _clock.now();
        peerId = it->second.peerId;

        updated = readCount(peerId) + 1;
        writeCount(peerId, updated);
    }

    auto last = _store.getItem(LAST_INCOMING_KEY);
    if (last && *last == peerId) {
        auto removed = _store.removeItem(LAST_INCOMING_KEY);
        if (removed.failed()) {
            ENTROPY_LOG_WARNING(std::format("Failed to clear last incoming peer: {}", removed.errorMessage));
        }
    }

    ENTROPY_LOG_INFO(std::format("Missed call {} from {} (count={})", callId, peerId, updated));
    notify(peerId, updated);
    return true;
}

bool MissedCallLedger::resolveAnswered(const CallId& callId) {
    PeerId peerId;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _occurrences.find(callId);
        if (it == _occurrences.end() || it->second.resolved) {
            return false;
        }
        it->second.resolved = true;
        it->second.resolvedAt = _clock.now();
        peerId = it->second.peerId;
    }

    auto last = _store.getItem(LAST_INCOMING_KEY);
    if (last && *last == peerId) {
        auto removed = _store.removeItem(LAST_INCOMING_KEY);
        if (removed.failed()) {
            ENTROPY_LOG_WARNING(std::format("Failed to clear last incoming peer: {}", removed.errorMessage));
        }
    }
    return true;
}

bool MissedCallLedger::isPending(const CallId& callId) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _occurrences.find(callId);
    return it != _occurrences.end() && !it->second.resolved;
}

uint32_t MissedCallLedger::count(const PeerId& peerId) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return readCount(peerId);
}

void MissedCallLedger::reset(const PeerId& peerId) {
    if (peerId.empty()) return;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (readCount(peerId) == 0) return;
        writeCount(peerId, 0);
    }
    notify(peerId, 0);
}

std::optional<PeerId> MissedCallLedger::lastIncomingPeer() const {
    return _store.getItem(LAST_INCOMING_KEY);
}

void MissedCallLedger::setCountCallback(CountCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _countCallback = std::move(callback);
}

uint32_t MissedCallLedger::readCount(const PeerId& peerId) const {
    auto raw = _store.getItem(MISSED_KEY_PREFIX + peerId);
    if (!raw || raw->empty()) {
        return 0;
    }

    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc() || ptr != raw->data() + raw->size()) {
        ENTROPY_LOG_WARNING(std::format("Ignoring corrupt missed-call counter for {}", peerId));
        return 0;
    }
    return value;
}

void MissedCallLedger::writeCount(const PeerId& peerId, uint32_t count) {
    auto stored = _store.setItem(MISSED_KEY_PREFIX + peerId, std::to_string(count));
    if (stored.failed()) {
        ENTROPY_LOG_WARNING(std::format("Failed to persist missed-call counter for {}: {}", peerId,
                                        stored.errorMessage));
    }
}

void MissedCallLedger::pruneResolved() {
    auto now = _clock.now();
    for (auto it = _occurrences.begin(); it != _occurrences.end();) {
        if (it->second.resolved && now - it->second.resolvedAt > RESOLVED_RETENTION) {
            it = _occurrences.erase(it);
        } else {
            ++it;
        }
    }
}

void MissedCallLedger::notify(const PeerId& peerId, uint32_t count) {
    CountCallback cb;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        cb = _countCallback;
    }
    if (cb) {
        cb(peerId, count);
    }
}

}  // namespace Calling
}  // namespace EntropyEngine
