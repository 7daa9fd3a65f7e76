/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#pragma once

#include "../Core/CallTypes.h"
#include "../Core/KeyValueStore.h"
#include "../Core/Scheduler.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace EntropyEngine {
namespace Calling {

/**
 * @brief Per-peer missed-call counters
 *
 * Every incoming invitation opens one occurrence keyed by its call id. The
 * occurrence is resolved exactly once: either as missed (the peer's counter
 * goes up by one) or as answered (accepted or declined, no count). Later
 * resolution attempts for the same call id are no-ops, so the remote cancel,
 * the remote timeout and the local fallback timer can all race safely.
 *
 * Counters live in the KeyValueStore under MISSED_KEY_PREFIX + peerId; the
 * peer of the latest invitation is kept under LAST_INCOMING_KEY.
 */
class MissedCallLedger {
public:
    using CountCallback = std::function<void(const PeerId& peerId, uint32_t count)>;

    static constexpr const char* MISSED_KEY_PREFIX = "missed_calls_by_user_v1/";
    static constexpr const char* LAST_INCOMING_KEY = "last_incoming_from";

    /**
     * @brief Resolved occurrences are forgotten after this long
     */
    static constexpr std::chrono::seconds RESOLVED_RETENTION{60};

    MissedCallLedger(KeyValueStore& store, const Scheduler& clock);

    /**
     * @brief Opens the occurrence for an invitation that reached RingingIn
     */
    void openOccurrence(const CallId& callId, const PeerId& peerId);

    /**
     * @brief Resolves an occurrence as missed
     * @return true if this call counted; false if already resolved or unknown
     */
    bool resolveMissed(const CallId& callId);

    /**
     * @brief Resolves an occurrence as answered, without counting
     * @return true if the occurrence was open
     */
    bool resolveAnswered(const CallId& callId);

    /**
     * @brief Whether an occurrence is open and unresolved
     */
    bool isPending(const CallId& callId) const;

    uint32_t count(const PeerId& peerId) const;

    /**
     * @brief Sets a peer's counter back to zero
     */
    void reset(const PeerId& peerId);

    std::optional<PeerId> lastIncomingPeer() const;

    /**
     * @brief Sets callback fired after a counter changes
     */
    void setCountCallback(CountCallback callback);

private:
    struct Occurrence {
        PeerId peerId;
        bool resolved = false;
        Scheduler::Clock::time_point resolvedAt{};
    };

    uint32_t readCount(const PeerId& peerId) const;
    void writeCount(const PeerId& peerId, uint32_t count);
    void pruneResolved();
    void notify(const PeerId& peerId, uint32_t count);

    KeyValueStore& _store;
    const Scheduler& _clock;

    mutable std::mutex _mutex;
    std::unordered_map<CallId, Occurrence> _occurrences;
    CountCallback _countCallback;
};

} // namespace Calling
} // namespace EntropyEngine
