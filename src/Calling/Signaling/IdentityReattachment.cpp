/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "IdentityReattachment.h"

#include <Logging/Logger.h>

#include <format>

namespace EntropyEngine::Calling
{

IdentityReattachment::IdentityReattachment(SignalingChannel& channel, KeyValueStore& store)
    : _channel(channel), _store(store) {
    _connectSub = _channel.onConnect([this]() { handleConnect(); });
    _disconnectSub = _channel.onDisconnect([this]() { handleDisconnect(); });
}

IdentityReattachment::~IdentityReattachment() {
    _channel.off(_connectSub);
    _channel.off(_disconnectSub);
    _lifetime.reset();
}

std::optional<std::string> IdentityReattachment::knownUserId() const {
    auto userId = _store.getItem(USER_ID_KEY);
    if (userId && userId->empty()) {
        return std::nullopt;
    }
    return userId;
}

void IdentityReattachment::attach(const std::string& installId, const Profile& profile, AttachCallback callback) {
    if (installId.empty()) {
        if (callback) {
            callback(Result<std::string>::err(CallError::InvalidParameter, "installId must not be empty"));
        }
        return;
    }

    if (callback) {
        _attachWaiters.push_back(std::move(callback));
    }
    if (_attachInFlight) {
        ENTROPY_LOG_DEBUG("identity:attach already in flight, joining it");
        return;
    }

    _attachInFlight = true;
    ++_attachRequests;

    IdentityAttach event{installId, profile.nick, profile.avatarUrl};
    std::weak_ptr<int> alive = _lifetime;
    uint64_t epoch = _sessionEpoch;

    _channel.request(event, [this, alive, epoch](Result<Ack> ack) {
        if (alive.expired()) return;
        _attachInFlight = false;

        Result<std::string> result = Result<std::string>::err(CallError::NotAuthenticated, "identity:attach failed");
        if (ack.failed()) {
            result = Result<std::string>::err(ack.error, ack.errorMessage);
        } else if (!ack.value.ok || !ack.value.userId || ack.value.userId->empty()) {
            result = Result<std::string>::err(CallError::NotAuthenticated,
                                              ack.value.error.value_or("attach_failed"));
        } else {
            result = Result<std::string>::ok(*ack.value.userId);
        }

        if (result.success()) {
            auto stored = _store.setItem(USER_ID_KEY, result.value);
            if (stored.failed()) {
                ENTROPY_LOG_WARNING(std::format("Failed to persist user id: {}", stored.errorMessage));
            }
            if (epoch == _sessionEpoch) {
                ENTROPY_LOG_INFO(std::format("Identity attached as {}", result.value));
                setState(AuthState::Authenticated);
            }
        } else {
            ENTROPY_LOG_WARNING(std::format("identity:attach failed: {}", result.errorMessage));
        }

        auto waiters = std::move(_attachWaiters);
        _attachWaiters.clear();
        for (auto& waiter : waiters) {
            waiter(result);
        }
    });
}

void IdentityReattachment::handleConnect() {
    auto userId = knownUserId();
    if (!userId) {
        ENTROPY_LOG_DEBUG("Connected without a known identity");
        setState(AuthState::Unauthenticated);
        return;
    }
    if (_state == AuthState::Authenticated) {
        return;
    }
    reauthenticate(*userId);
}

void IdentityReattachment::handleDisconnect() {
    ++_sessionEpoch;
    _reauthInFlight = false;
    setState(AuthState::Unauthenticated);
}

void IdentityReattachment::reauthenticate(const std::string& userId) {
    if (_reauthInFlight) {
        return;
    }
    _reauthInFlight = true;
    setState(AuthState::Reauthenticating);

    ENTROPY_LOG_INFO(std::format("Re-announcing identity {}", userId));

    std::weak_ptr<int> alive = _lifetime;
    uint64_t epoch = _sessionEpoch;
    _channel.request(Reauth{userId}, [this, alive, epoch](Result<Ack> ack) {
        if (alive.expired()) return;
        if (epoch != _sessionEpoch) {
            ENTROPY_LOG_DEBUG("Ignoring reauth result from a previous session");
            return;
        }
        _reauthInFlight = false;

        if (ack.success() && ack.value.ok) {
            setState(AuthState::Authenticated);
            return;
        }

        std::string reason = ack.failed() ? ack.errorMessage : ack.value.error.value_or("reauth_rejected");
        ENTROPY_LOG_WARNING(std::format("reauth failed: {}", reason));
        setState(AuthState::Failed);
    });
}

void IdentityReattachment::setState(AuthState state) {
    if (_state == state) return;
    ENTROPY_LOG_DEBUG(std::format("Auth state {} -> {}", authStateToString(_state), authStateToString(state)));
    _state = state;
    if (_stateCallback) {
        auto cb = _stateCallback;
        cb(state);
    }
}

}  // namespace EntropyEngine::Calling
