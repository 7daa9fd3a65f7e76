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
#include "../Core/Scheduler.h"

#include <chrono>
#include <mutex>
#include <unordered_map>

namespace EntropyEngine {
namespace Calling {

/**
 * @brief Short-lived memory of abandoned call ids
 *
 * A decline or timeout can overtake the matching call:incoming on the relay.
 * Remembering the id for a few seconds lets the late invitation be dropped
 * instead of ringing for a call nobody is placing any more.
 *
 * Entries expire after Config::ttl and are evicted lazily on every call.
 */
class RaceGuard {
public:
    /**
     * @brief Configuration for suppression lifetime
     */
    struct Config {
        std::chrono::milliseconds ttl;      ///< How long a canceled/timed-out id suppresses events

        Config()
            : ttl(10000)
        {
        }
    };

    explicit RaceGuard(const Scheduler& clock, const Config& config = Config());

    void markCanceled(const CallId& callId);
    void markTimedOut(const CallId& callId);

    /**
     * @brief Check whether events for a call id must be ignored
     * @return true if the id was canceled or timed out within the ttl
     */
    bool isSuppressed(const CallId& callId);

    bool isCanceled(const CallId& callId);
    bool isTimedOut(const CallId& callId);

    /**
     * @brief Number of live entries across both sets
     */
    size_t size();

    void clear();

private:
    using Entries = std::unordered_map<CallId, Scheduler::Clock::time_point>;

    void evictExpired();

    const Scheduler& _clock;
    Config _config;
    std::mutex _mutex;
    Entries _canceled;
    Entries _timedOut;
};

} // namespace Calling
} // namespace EntropyEngine
