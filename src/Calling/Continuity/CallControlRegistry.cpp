/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "CallControlRegistry.h"

#include <Logging/Logger.h>

#include <algorithm>

namespace EntropyEngine::Calling
{

void CallControlRegistry::publish(Controls controls) {
    std::lock_guard<std::mutex> lock(_mutex);
    ENTROPY_LOG_DEBUG("Call controls published for room " + controls.roomId);
    _controls = std::move(controls);
}

void CallControlRegistry::withdraw() {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_controls) {
            return;
        }
        ENTROPY_LOG_DEBUG("Call controls withdrawn for room " + _controls->roomId);
        _controls.reset();
        listeners = _listeners;
    }

    for (const auto& listener : listeners) {
        if (listener.callback) {
            listener.callback();
        }
    }
}

bool CallControlRegistry::hasControls() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _controls.has_value();
}

std::shared_ptr<PeerSession> CallControlRegistry::session() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _controls ? _controls->session.lock() : nullptr;
}

std::optional<std::string> CallControlRegistry::roomId() const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_controls) return std::nullopt;
    return _controls->roomId;
}

bool CallControlRegistry::endCall() {
    std::function<void()> end;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_controls) {
            return false;
        }
        end = _controls->endCall;
    }
    // Invoked unlocked: ending the call withdraws the controls
    if (end) {
        end();
    }
    return true;
}

CallControlRegistry::ListenerId CallControlRegistry::onWithdrawn(WithdrawnCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    ListenerId id = _nextListenerId++;
    _listeners.push_back(Listener{id, std::move(callback)});
    return id;
}

void CallControlRegistry::removeListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(_mutex);
    _listeners.erase(std::remove_if(_listeners.begin(), _listeners.end(),
                                    [id](const Listener& l) { return l.id == id; }),
                     _listeners.end());
}

}  // namespace EntropyEngine::Calling
