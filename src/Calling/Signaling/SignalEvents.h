/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file SignalEvents.h
 * @brief Typed signaling events exchanged with the relay
 *
 * Each relay event is a plain struct carrying its wire name in `Name`. All of
 * them are alternatives of the SignalEvent variant, so subscribing to a type
 * that the relay cannot deliver is a compile error rather than a silent no-op.
 *
 * Negotiation messages (offer, answer, ice-candidate) travel in both
 * directions: `peer` is the destination when sending and the origin when
 * receiving.
 */

#pragma once

#include "../Core/CallTypes.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace EntropyEngine::Calling {

// Call control

struct CallInitiate {
    static constexpr const char* Name = "call:initiate";
    PeerId to;
};

struct CallAccept {
    static constexpr const char* Name = "call:accept";
    CallId callId;
};

struct CallDecline {
    static constexpr const char* Name = "call:decline";
    CallId callId;
};

struct CallCancel {
    static constexpr const char* Name = "call:cancel";
    CallId callId;
    std::optional<PeerId> from;         ///< Set by the relay on inbound cancels
};

struct CallEnd {
    static constexpr const char* Name = "call:end";
    CallId callId;
    std::string roomId;
};

struct CallIncoming {
    static constexpr const char* Name = "call:incoming";
    CallId callId;
    PeerId from;
    std::optional<std::string> fromNick;
};

struct CallAccepted {
    static constexpr const char* Name = "call:accepted";
    CallId callId;
    PeerId from;
    std::optional<std::string> roomId;
};

struct CallDeclined {
    static constexpr const char* Name = "call:declined";
    CallId callId;
    PeerId from;
};

struct CallTimeout {
    static constexpr const char* Name = "call:timeout";
    CallId callId;
};

struct CallBusy {
    static constexpr const char* Name = "call:busy";
    PeerId from;
};

struct CallRoomFull {
    static constexpr const char* Name = "call:room_full";
    std::optional<PeerId> userId;
};

struct CallEnded {
    static constexpr const char* Name = "call:ended";
    CallId callId;
    std::string roomId;
};

// Transport negotiation

struct SdpOffer {
    static constexpr const char* Name = "offer";
    PeerId peer;
    std::string sdp;
    std::optional<std::string> roomId;
};

struct SdpAnswer {
    static constexpr const char* Name = "answer";
    PeerId peer;
    std::string sdp;
    std::optional<std::string> roomId;
};

struct IceCandidateSignal {
    static constexpr const char* Name = "ice-candidate";
    PeerId peer;
    std::string candidate;
    std::string mid;
    std::optional<std::string> roomId;
};

// Out-of-band media state

struct CamToggle {
    static constexpr const char* Name = "cam-toggle";
    std::string roomId;
    bool enabled = true;
    std::optional<PeerId> from;
};

struct PipState {
    static constexpr const char* Name = "pip:state";
    std::string roomId;
    bool inPiP = false;
    std::optional<PeerId> from;
};

// Identity and presence

struct IdentityAttach {
    static constexpr const char* Name = "identity:attach";
    std::string installId;
    std::optional<std::string> nick;
    std::optional<std::string> avatarUrl;
};

struct Reauth {
    static constexpr const char* Name = "reauth";
    std::string userId;
};

struct PresenceUpdate {
    static constexpr const char* Name = "presence:update";
    std::string status;                 ///< "busy" or "online"
    std::optional<std::string> roomId;
};

// Matchmaking

struct MatchStart {
    static constexpr const char* Name = "start";
};

struct MatchNext {
    static constexpr const char* Name = "next";
};

struct MatchStop {
    static constexpr const char* Name = "stop";
};

struct MatchFound {
    static constexpr const char* Name = "match_found";
    std::string roomId;
    PeerId partnerId;                   ///< Relay address of the partner
    std::optional<PeerId> userId;       ///< Partner's user id when known
    bool offerer = false;               ///< Relay-designated offer side
};

struct PeerLeft {
    static constexpr const char* Name = "peer:left";
    std::optional<PeerId> peer;
};

struct PeerStopped {
    static constexpr const char* Name = "peer:stopped";
    std::optional<PeerId> peer;
};

/**
 * @brief Every event the relay understands
 */
using SignalEvent = std::variant<
    CallInitiate, CallAccept, CallDecline, CallCancel, CallEnd,
    CallIncoming, CallAccepted, CallDeclined, CallTimeout, CallBusy, CallRoomFull, CallEnded,
    SdpOffer, SdpAnswer, IceCandidateSignal,
    CamToggle, PipState,
    IdentityAttach, Reauth, PresenceUpdate,
    MatchStart, MatchNext, MatchStop, MatchFound, PeerLeft, PeerStopped>;

/**
 * @brief Acknowledgement of a request
 *
 * Unused fields stay empty: call:initiate fills callId, identity:attach fills
 * userId, any rejection fills error.
 */
struct Ack {
    bool ok = false;
    std::optional<CallId> callId;
    std::optional<std::string> userId;
    std::optional<std::string> error;
};

/**
 * @brief One frame on the signaling wire
 *
 * requestId is zero for fire-and-forget events. An acknowledgement echoes the
 * requestId of the request it answers.
 */
struct SignalEnvelope {
    uint64_t requestId = 0;
    std::variant<SignalEvent, Ack> body;

    bool isAck() const { return std::holds_alternative<Ack>(body); }
};

/**
 * @brief Index of an event type inside SignalEvent
 *
 * Evaluates to std::variant_size_v<SignalEvent> for types that are not events.
 */
template<typename T, typename Variant>
struct VariantIndex;

template<typename T, typename... Ts>
struct VariantIndex<T, std::variant<Ts...>> {
    static constexpr size_t value = [] {
        constexpr bool matches[] = {std::is_same_v<T, Ts>...};
        size_t i = 0;
        for (; i < sizeof...(Ts); ++i) {
            if (matches[i]) break;
        }
        return i;
    }();
};

template<typename E>
inline constexpr bool isSignalEvent = VariantIndex<E, SignalEvent>::value < std::variant_size_v<SignalEvent>;

template<typename E>
inline constexpr size_t signalEventIndex() {
    static_assert(isSignalEvent<E>, "Type is not an alternative of SignalEvent");
    return VariantIndex<E, SignalEvent>::value;
}

/**
 * @brief Wire name of an event, for logs
 */
inline const char* eventName(const SignalEvent& event) {
    return std::visit([](const auto& e) -> const char* { return std::decay_t<decltype(e)>::Name; }, event);
}

} // namespace EntropyEngine::Calling
