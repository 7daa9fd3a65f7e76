/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file CallControlRegistry.h
 * @brief Hand-off point between the call screen and the PiP overlay
 */

#pragma once

#include "../Media/PeerSession.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace EntropyEngine::Calling {

/**
 * @brief Publishes the controls of the active call
 *
 * Owned by the composition root and shared by CallSessionManager, which
 * publishes and withdraws, and ContinuityBridge, which looks them up. Holds
 * only a weak reference to the session, so nothing here keeps a call alive.
 *
 * Thread Safety: All methods are thread-safe. Listeners run on the
 * withdrawing thread, outside the lock.
 */
class CallControlRegistry {
public:
    struct Controls {
        std::weak_ptr<PeerSession> session;
        std::function<void()> endCall;          ///< Ends the call through its owner
        std::string roomId;
    };

    using ListenerId = uint64_t;
    using WithdrawnCallback = std::function<void()>;

    /**
     * @brief Makes controls available, replacing any earlier ones
     */
    void publish(Controls controls);

    /**
     * @brief Removes the controls and notifies listeners; no-op when empty
     */
    void withdraw();

    bool hasControls() const;

    /**
     * @brief Published session if it is still alive
     */
    std::shared_ptr<PeerSession> session() const;

    std::optional<std::string> roomId() const;

    /**
     * @brief Ends the published call
     * @return false if nothing is published
     */
    bool endCall();

    ListenerId onWithdrawn(WithdrawnCallback callback);
    void removeListener(ListenerId id);

private:
    struct Listener {
        ListenerId id;
        WithdrawnCallback callback;
    };

    mutable std::mutex _mutex;
    std::optional<Controls> _controls;
    ListenerId _nextListenerId = 1;
    std::vector<Listener> _listeners;
};

} // namespace EntropyEngine::Calling
