/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#pragma once

#include "SignalingChannel.h"
#include "../Core/KeyValueStore.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace EntropyEngine::Calling {

/**
 * @brief Identity state of the current relay session
 */
enum class AuthState {
    Unauthenticated,    ///< Session carries no identity
    Reauthenticating,   ///< reauth sent after a (re)connect, ack pending
    Authenticated,      ///< Session carries the known user id
    Failed              ///< Last reauth was rejected or timed out
};

inline const char* authStateToString(AuthState state) {
    switch (state) {
        case AuthState::Unauthenticated: return "Unauthenticated";
        case AuthState::Reauthenticating: return "Reauthenticating";
        case AuthState::Authenticated: return "Authenticated";
        case AuthState::Failed: return "Failed";
    }
    return "?";
}

/**
 * @brief Binds this install's identity to the relay session
 *
 * attach() performs the full identity:attach handshake; concurrent calls
 * share one in-flight request and all receive its result. After every
 * (re)connect, a known user id is re-announced with a lightweight reauth and
 * call-control traffic stays untrusted until it is acknowledged.
 *
 * All methods run on the scheduler thread.
 */
class IdentityReattachment {
public:
    /**
     * @brief Optional profile fields sent with identity:attach
     */
    struct Profile {
        std::optional<std::string> nick;
        std::optional<std::string> avatarUrl;
    };

    using AttachCallback = std::function<void(Result<std::string>)>;   ///< Receives the user id
    using StateCallback = std::function<void(AuthState)>;

    static constexpr const char* USER_ID_KEY = "user_id";

    IdentityReattachment(SignalingChannel& channel, KeyValueStore& store);
    ~IdentityReattachment();

    IdentityReattachment(const IdentityReattachment&) = delete;
    IdentityReattachment& operator=(const IdentityReattachment&) = delete;

    /**
     * @brief Attaches this install to a user on the relay
     * @param installId Stable id of this installation
     * @param profile Profile fields to publish
     * @param callback Receives the user id, or NotAuthenticated/Offline/AckTimeout
     */
    void attach(const std::string& installId, const Profile& profile, AttachCallback callback);

    AuthState state() const { return _state; }
    bool isAuthenticated() const { return _state == AuthState::Authenticated; }

    /**
     * @brief User id persisted from the last successful attach
     */
    std::optional<std::string> knownUserId() const;

    /**
     * @brief Number of identity:attach requests sent so far
     */
    size_t attachRequestsSent() const { return _attachRequests; }

    /**
     * @brief Sets callback for auth state changes
     */
    void setStateCallback(StateCallback callback) { _stateCallback = std::move(callback); }

private:
    void handleConnect();
    void handleDisconnect();
    void reauthenticate(const std::string& userId);
    void setState(AuthState state);

    SignalingChannel& _channel;
    KeyValueStore& _store;

    AuthState _state = AuthState::Unauthenticated;
    bool _attachInFlight = false;
    bool _reauthInFlight = false;
    uint64_t _sessionEpoch = 0;             ///< Bumped on every disconnect; stale acks are ignored
    size_t _attachRequests = 0;
    std::vector<AttachCallback> _attachWaiters;
    StateCallback _stateCallback;

    SignalingChannel::SubscriptionId _connectSub = 0;
    SignalingChannel::SubscriptionId _disconnectSub = 0;
    std::shared_ptr<int> _lifetime = std::make_shared<int>(0);
};

} // namespace EntropyEngine::Calling
