/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file CallTypes.h
 * @brief Call records, states, session types and configuration
 *
 * This file contains the enums and structs shared by the call state machine,
 * the signaling channel and the media layer, including the operational knobs
 * for each of them.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace EntropyEngine::Calling {

using CallId = std::string;   ///< Opaque id issued by the relay on call:initiate
using PeerId = std::string;   ///< Stable user id of a remote participant

/**
 * @brief Connection state of a signaling or media transport
 */
enum class ConnectionState {
    Disconnected,   ///< Initial state or after disconnect
    Connecting,     ///< Connection (or reconnection) in progress
    Connected,      ///< Fully connected and ready
    Disconnecting,  ///< Graceful disconnect in progress
    Failed          ///< Connection failed, no further attempts
};

inline const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Disconnecting: return "Disconnecting";
        case ConnectionState::Failed: return "Failed";
    }
    return "?";
}

/**
 * @brief Call lifecycle states
 *
 * Idle is the only terminal state. Every other state is left either by an
 * explicit event or by a bounded local timer.
 */
enum class CallState {
    Idle,           ///< No call in progress
    Dialing,        ///< call:initiate sent, waiting for the relay ack
    RingingOut,     ///< Relay issued a callId, waiting for the callee
    RingingIn,      ///< Incoming invitation shown to the user
    Negotiating,    ///< Accepted, offer/answer exchange in progress
    Active,         ///< Media negotiated, call screen shown
    Ending          ///< Teardown in progress
};

inline const char* callStateToString(CallState state) {
    switch (state) {
        case CallState::Idle: return "Idle";
        case CallState::Dialing: return "Dialing";
        case CallState::RingingOut: return "RingingOut";
        case CallState::RingingIn: return "RingingIn";
        case CallState::Negotiating: return "Negotiating";
        case CallState::Active: return "Active";
        case CallState::Ending: return "Ending";
    }
    return "?";
}

/**
 * @brief Who started the call
 */
enum class CallDirection {
    Outgoing,
    Incoming
};

/**
 * @brief Concrete session flavors sharing the offer/answer/ICE handlers
 */
enum class SessionType {
    Direct,         ///< Friend call established through call:initiate
    Matchmaking     ///< Anonymous call paired by the relay
};

inline const char* sessionTypeToString(SessionType type) {
    switch (type) {
        case SessionType::Direct: return "Direct";
        case SessionType::Matchmaking: return "Matchmaking";
    }
    return "?";
}

/**
 * @brief The single non-terminal call of this participant
 *
 * Created on initiate (outgoing) or on an incoming invitation, mutated only by
 * CallSessionManager and discarded on the transition back to Idle.
 */
struct CallRecord {
    CallId callId;                                  ///< Empty while Dialing
    PeerId peerId;
    std::optional<std::string> peerNick;
    CallDirection direction = CallDirection::Outgoing;
    CallState state = CallState::Idle;
    std::chrono::steady_clock::time_point createdAt{};
    std::optional<std::string> roomId;
};

/**
 * @brief Call state machine configuration
 */
struct CallConfig {
    std::chrono::milliseconds ringOutTimeout{20000};       ///< Caller gives up after this long in RingingOut
    std::chrono::milliseconds ringInFallback{20500};       ///< Callee closes an unanswered invitation after this long
    std::chrono::milliseconds negotiationTimeout{20000};   ///< Bound on Negotiating before the call is torn down
    std::chrono::milliseconds initiateAckTimeout{20000};   ///< Ack timeout for call:initiate
    std::chrono::milliseconds declinedBlock{12000};        ///< Ignore re-invites from a declined caller for this long
    std::chrono::milliseconds raceGuardTtl{10000};         ///< Lifetime of canceled/timed-out callIds
    bool withVideo = true;                                 ///< Open the camera for new calls
};

/**
 * @brief Signaling channel configuration
 */
struct SignalingConfig {
    std::string url;                                       ///< WebSocket URL of the relay
    std::chrono::milliseconds connectWait{7000};           ///< Budget for waiting on a (re)connect before Offline
    std::chrono::milliseconds ackTimeout{12000};           ///< Default per-attempt acknowledgement timeout
    int retries = 2;                                       ///< Default extra attempts for request()
    std::chrono::milliseconds backoffMin{250};             ///< Lower bound of the jittered retry delay
    std::chrono::milliseconds backoffMax{550};             ///< Upper bound of the jittered retry delay
    std::chrono::milliseconds reconnectDelay{1000};        ///< Delay between transport reconnect attempts
    int reconnectAttempts = 10;                            ///< Transport reconnect attempts before giving up
};

/**
 * @brief Media transport configuration
 */
struct MediaTransportConfig {
    std::vector<std::string> iceServers;                   ///< ICE server URLs (STUN/TURN)
    std::string bindAddress;                               ///< Optional local bind address
    uint16_t portRangeBegin = 0;                           ///< Port range start (0 = OS chooses)
    uint16_t portRangeEnd = 0;                             ///< Port range end (0 = OS chooses)
    bool enableIceTcp = false;                             ///< Enable ICE-TCP candidates
};

} // namespace EntropyEngine::Calling
