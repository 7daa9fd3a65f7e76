/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file CallSessionManager.h
 * @brief Call state machine for direct and matchmaking calls
 */

#pragma once

#include <EntropyCore.h>
#include "MissedCallLedger.h"
#include "RaceGuard.h"
#include "SignalingOwnership.h"
#include "../Continuity/CallControlRegistry.h"
#include "../Media/PeerSession.h"
#include "../Signaling/IdentityReattachment.h"
#include "../Signaling/SignalingChannel.h"

#include <deque>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace EntropyEngine::Calling {

/**
 * @brief Matchmaking progress
 */
enum class MatchState {
    Idle,           ///< Not queued
    Searching,      ///< Queued on the relay
    Connecting,     ///< Paired, negotiating
    Connected       ///< Paired, media negotiated
};

inline const char* matchStateToString(MatchState state) {
    switch (state) {
        case MatchState::Idle: return "Idle";
        case MatchState::Searching: return "Searching";
        case MatchState::Connecting: return "Connecting";
        case MatchState::Connected: return "Connected";
    }
    return "?";
}

/**
 * @brief UI and navigation hooks
 *
 * All methods run on the scheduler thread. Default implementations ignore
 * the notification.
 */
class CallObserver {
public:
    virtual ~CallObserver() = default;

    /**
     * @brief Direct call moved to a new state (Idle included)
     */
    virtual void onCallStateChanged(const CallRecord&) {}

    virtual void onIncomingCall(const CallRecord&) {}

    /**
     * @brief Call ended with a terminal error
     * @param message Relay error text verbatim where there is one
     */
    virtual void onCallFailed(const CallRecord&, CallError, const std::string&) {}

    /**
     * @brief Media transport of an active call dropped without call:ended
     *
     * The host decides when to give up and call hangup().
     */
    virtual void onRemoteDisconnected(const CallRecord&) {}

    virtual void onRemoteTrack(SessionType, std::shared_ptr<MediaTrack>) {}
    virtual void onRemoteCameraChanged(bool) {}
    virtual void onPartnerPipChanged(bool) {}
    virtual void onMatchStateChanged(MatchState, const std::optional<PeerId>&) {}
};

/**
 * @brief Orchestrates call lifecycles on top of the signaling channel
 *
 * Owns at most one PeerSession per SessionType. Only the session type that
 * holds the SignalingOwnershipToken has the shared offer/answer/ICE handlers
 * bound; a second type opened meanwhile runs without them until reopened.
 *
 * Inbound invitations are filtered, in order, by RaceGuard suppression, the
 * declined block of the caller, the current state (only Idle accepts) and a
 * live matchmaking session. While identity is Reauthenticating call-control
 * events are queued. A successful reauth replays them all; a failed one, or a
 * drop back to Unauthenticated, applies only the terminal ones.
 *
 * All methods must be called on the scheduler thread.
 */
class CallSessionManager : public Core::EntropyObject, public SignalingSink {
public:
    using InitiateCallback = std::function<void(Result<CallId>)>;

    CallSessionManager(SignalingChannel& channel,
                       IdentityReattachment& identity,
                       MissedCallLedger& ledger,
                       MediaTransportFactory& transportFactory,
                       MediaCapture& capture,
                       Scheduler& scheduler,
                       CallControlRegistry* controls = nullptr,
                       CallConfig config = {},
                       MediaTransportConfig mediaConfig = {});
    ~CallSessionManager() override;

    CallSessionManager(const CallSessionManager&) = delete;
    CallSessionManager& operator=(const CallSessionManager&) = delete;

    void setObserver(CallObserver* observer) { _observer = observer; }

    // Direct calls

    /**
     * @brief Rings a peer
     *
     * Refusals (NotAuthenticated, InvalidState, InvalidParameter) are returned
     * immediately. Otherwise the outcome of call:initiate is delivered to the
     * callback: the call id, or Offline/AckTimeout/CallInitiateFailed.
     */
    Result<void> initiateCall(const PeerId& peerId, InitiateCallback callback = nullptr);

    /**
     * @brief Abandons an outgoing call while Dialing or RingingOut
     */
    Result<void> cancelCall();

    Result<void> acceptCall();

    /**
     * @brief Rejects the ringing invitation and blocks re-invites from the caller briefly
     */
    Result<void> declineCall();

    /**
     * @brief Ends the current call; safe to call any number of times
     */
    void hangup();

    Result<bool> toggleMic();
    Result<bool> toggleCamera();
    Result<bool> toggleRemoteAudio();
    Result<void> flipCamera(std::shared_ptr<MediaTrack> track);

    // Matchmaking

    Result<void> startMatchmaking();
    Result<void> nextMatch();
    Result<void> stopMatchmaking();

    // Sessions and handler ownership

    /**
     * @brief Opens the PeerSession for a type, binding the negotiation handlers if ownership is free
     * @return The new session; any previous session of the same type is cleaned up first
     */
    std::shared_ptr<PeerSession> openPeerSession(SessionType type, const PeerId& partnerId);

    /**
     * @brief Cleans up a type's session and unbinds the handlers if it held them
     */
    void closePeerSession(SessionType type);

    std::shared_ptr<PeerSession> session(SessionType type) const;

    /**
     * @brief Session type currently holding the negotiation handlers
     */
    std::optional<SessionType> signalingOwner() const { return _ownership.owner(); }

    // State

    CallState state() const { return _record ? _record->state : CallState::Idle; }
    const std::optional<CallRecord>& currentCall() const { return _record; }
    MatchState matchState() const { return _matchState; }
    bool isMatchmakingLive() const { return _matchState != MatchState::Idle; }

    /**
     * @brief Whether invitations from a peer are currently being ignored after a decline
     */
    bool isDeclineBlocked(const PeerId& peerId) const;

    size_t deferredEventCount() const { return _deferred.size(); }
    RaceGuard& raceGuard() { return _raceGuard; }

    // SignalingSink interface
    void sendLocalDescription(const PeerId& to, const SessionDescription& description,
                              const std::optional<std::string>& roomId) override;
    void sendLocalCandidate(const PeerId& to, const IceCandidate& candidate,
                            const std::optional<std::string>& roomId) override;
    void sendCameraState(const std::string& roomId, bool enabled) override;

    // EntropyObject interface
    const char* className() const noexcept override { return "CallSessionManager"; }
    uint64_t classHash() const noexcept override;
    std::string toString() const override;

private:
    void subscribe();

    // Inbound call control
    void handleControlEvent(const SignalEvent& event);
    void applyControlEvent(const SignalEvent& event);
    void handleIdentityState(AuthState state);

    void handleIncoming(const CallIncoming& event);
    void handleAccepted(const CallAccepted& event);
    void handleDeclined(const CallDeclined& event);
    void handleCancel(const CallCancel& event);
    void handleTimeout(const CallTimeout& event);
    void handleBusy(const CallBusy& event);
    void handleRoomFull(const CallRoomFull& event);
    void handleEnded(const CallEnded& event);

    // Negotiation (bound only for the ownership holder)
    void handleOffer(const SdpOffer& event);
    void handleAnswer(const SdpAnswer& event);
    void handleIceCandidate(const IceCandidateSignal& event);
    void negotiationComplete(SessionType type);

    void handleCamToggle(const CamToggle& event);
    void handlePipState(const PipState& event);

    void handleMatchFound(const MatchFound& event);
    void handlePartnerGone(MatchState next);

    // Outgoing call steps
    void handleInitiateAck(uint64_t dialGeneration, Result<Ack> result, const InitiateCallback& callback);
    void handleRingOutTimeout(const CallId& callId);
    void handleRingInFallback(const CallId& callId);
    void handleNegotiationTimeout(const CallId& callId);

    Result<std::shared_ptr<PeerSession>> startDirectSession();
    std::shared_ptr<PeerSession> activeSession() const;
    void handleSessionState(SessionType type, ConnectionState state);
    void enterActive();
    void endCall(bool notifyRemote);
    void finishCall(std::optional<CallError> error, const std::string& message);

    void setCallState(CallState state);
    void setMatchState(MatchState state, const std::optional<PeerId>& partner = std::nullopt);
    void armTimer(Scheduler::TimerId& timer, std::chrono::milliseconds delay, std::function<void()> task);
    void cancelTimer(Scheduler::TimerId& timer);
    void sendEvent(const SignalEvent& event);
    void sendPresence(const std::string& status, const std::optional<std::string>& roomId);
    void bindNegotiationHandlers();
    void unbindNegotiationHandlers();

    bool matchesRecord(const CallId& callId, std::initializer_list<CallState> states) const;
    bool isCurrentRoom(const std::string& roomId) const;

    SignalingChannel& _channel;
    IdentityReattachment& _identity;
    MissedCallLedger& _ledger;
    MediaTransportFactory& _transportFactory;
    MediaCapture& _capture;
    Scheduler& _scheduler;
    CallControlRegistry* _controls;
    CallConfig _config;
    MediaTransportConfig _mediaConfig;

    RaceGuard _raceGuard;
    CallObserver* _observer = nullptr;

    std::optional<CallRecord> _record;
    uint64_t _dialGeneration = 0;               ///< Identifies the dial in flight; acks for older dials are canceled
    Scheduler::TimerId _ringTimer = Scheduler::InvalidTimer;
    Scheduler::TimerId _negotiationTimer = Scheduler::InvalidTimer;
    std::unordered_map<PeerId, Scheduler::Clock::time_point> _declinedUntil;
    bool _presenceBusy = false;

    MatchState _matchState = MatchState::Idle;
    std::optional<std::string> _matchRoomId;

    std::map<SessionType, std::shared_ptr<PeerSession>> _sessions;
    SignalingOwnership _ownership;
    std::optional<SignalingOwnershipToken> _ownershipToken;
    std::vector<SignalingChannel::SubscriptionId> _negotiationSubscriptions;
    std::vector<SignalingChannel::SubscriptionId> _subscriptions;

    std::deque<SignalEvent> _deferred;          ///< Call control held back while reauthenticating

    std::shared_ptr<int> _lifetime = std::make_shared<int>(0);
};

} // namespace EntropyEngine::Calling
