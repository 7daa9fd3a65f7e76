/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "CallSessionManager.h"

#include <Logging/Logger.h>

#include <algorithm>
#include <format>
#include <type_traits>

namespace EntropyEngine::Calling
{

namespace {
    RaceGuard::Config raceGuardConfig(const CallConfig& config) {
        RaceGuard::Config guardConfig;
        guardConfig.ttl = config.raceGuardTtl;
        return guardConfig;
    }

    bool isTerminalControlEvent(const SignalEvent& event) {
        return std::holds_alternative<CallCancel>(event) ||
               std::holds_alternative<CallTimeout>(event) ||
               std::holds_alternative<CallDeclined>(event);
    }
}

CallSessionManager::CallSessionManager(SignalingChannel& channel,
                                       IdentityReattachment& identity,
                                       MissedCallLedger& ledger,
                                       MediaTransportFactory& transportFactory,
                                       MediaCapture& capture,
                                       Scheduler& scheduler,
                                       CallControlRegistry* controls,
                                       CallConfig config,
                                       MediaTransportConfig mediaConfig)
    : _channel(channel)
    , _identity(identity)
    , _ledger(ledger)
    , _transportFactory(transportFactory)
    , _capture(capture)
    , _scheduler(scheduler)
    , _controls(controls)
    , _config(std::move(config))
    , _mediaConfig(std::move(mediaConfig))
    , _raceGuard(scheduler, raceGuardConfig(_config))
{
    subscribe();
}

CallSessionManager::~CallSessionManager() {
    _identity.setStateCallback(nullptr);
    for (auto id : _subscriptions) {
        _channel.off(id);
    }
    _subscriptions.clear();

    cancelTimer(_ringTimer);
    cancelTimer(_negotiationTimer);

    closePeerSession(SessionType::Matchmaking);
    closePeerSession(SessionType::Direct);
    if (_controls && _record) {
        _controls->withdraw();
    }
}

void CallSessionManager::subscribe() {
    auto control = [this](const auto& event) { handleControlEvent(SignalEvent{event}); };

    _subscriptions.push_back(_channel.on<CallIncoming>(control));
    _subscriptions.push_back(_channel.on<CallAccepted>(control));
    _subscriptions.push_back(_channel.on<CallDeclined>(control));
    _subscriptions.push_back(_channel.on<CallCancel>(control));
    _subscriptions.push_back(_channel.on<CallTimeout>(control));
    _subscriptions.push_back(_channel.on<CallBusy>(control));
    _subscriptions.push_back(_channel.on<CallRoomFull>(control));
    _subscriptions.push_back(_channel.on<CallEnded>(control));

    _subscriptions.push_back(_channel.on<CamToggle>([this](const CamToggle& e) { handleCamToggle(e); }));
    _subscriptions.push_back(_channel.on<PipState>([this](const PipState& e) { handlePipState(e); }));

    _subscriptions.push_back(_channel.on<MatchFound>([this](const MatchFound& e) { handleMatchFound(e); }));
    _subscriptions.push_back(_channel.on<PeerLeft>([this](const PeerLeft&) {
        // The relay requeues us when the partner moves on
        handlePartnerGone(MatchState::Searching);
    }));
    _subscriptions.push_back(_channel.on<PeerStopped>([this](const PeerStopped&) {
        handlePartnerGone(MatchState::Idle);
    }));

    _identity.setStateCallback([this](AuthState state) { handleIdentityState(state); });
}

// ---------------------------------------------------------------------------
// Direct calls

Result<void> CallSessionManager::initiateCall(const PeerId& peerId, InitiateCallback callback) {
    if (peerId.empty()) {
        return Result<void>::err(CallError::InvalidParameter, "Peer id is empty");
    }
    if (state() != CallState::Idle) {
        return Result<void>::err(CallError::InvalidState,
                                 std::string("Cannot call while ") + callStateToString(state()));
    }
    if (isMatchmakingLive()) {
        return Result<void>::err(CallError::InvalidState, "Cannot call while matchmaking");
    }
    if (!_identity.isAuthenticated()) {
        return Result<void>::err(CallError::NotAuthenticated,
                                 std::string("Identity is ") + authStateToString(_identity.state()));
    }

    CallRecord record;
    record.peerId = peerId;
    record.direction = CallDirection::Outgoing;
    record.state = CallState::Dialing;
    record.createdAt = _scheduler.now();
    _record = record;
    uint64_t generation = ++_dialGeneration;

    ENTROPY_LOG_INFO("Calling " + peerId);
    setCallState(CallState::Dialing);

    // A repeated call:initiate would ring the peer twice, so no retries
    SignalingChannel::RequestOptions options;
    options.timeout = _config.initiateAckTimeout;
    options.retries = 0;

    std::weak_ptr<int> weak = _lifetime;
    _channel.request(CallInitiate{peerId}, options,
                     [this, weak, generation, callback = std::move(callback)](Result<Ack> result) {
                         if (weak.expired()) return;
                         handleInitiateAck(generation, std::move(result), callback);
                     });
    return Result<void>::ok();
}

void CallSessionManager::handleInitiateAck(uint64_t dialGeneration, Result<Ack> result,
                                           const InitiateCallback& callback) {
    bool current = dialGeneration == _dialGeneration && _record && _record->state == CallState::Dialing;
    if (!current) {
        if (result.success() && result.value.ok && result.value.callId) {
            // Dial was abandoned before the relay answered; stop the peer ringing
            ENTROPY_LOG_DEBUG("Canceling abandoned call " + *result.value.callId);
            _raceGuard.markCanceled(*result.value.callId);
            sendEvent(CallCancel{*result.value.callId, std::nullopt});
        }
        if (callback) {
            callback(Result<CallId>::err(CallError::InvalidState, "Call abandoned before the relay answered"));
        }
        return;
    }

    if (result.failed()) {
        ENTROPY_LOG_WARNING(std::format("call:initiate failed: {} {}", errorToString(result.error),
                                        result.errorMessage));
        finishCall(result.error, result.errorMessage);
        if (callback) callback(Result<CallId>::err(result.error, result.errorMessage));
        return;
    }

    const Ack& ack = result.value;
    if (!ack.ok || !ack.callId || ack.callId->empty()) {
        std::string message = ack.error.value_or(ack.ok ? "missing_call_id" : "unknown");
        ENTROPY_LOG_WARNING("call:initiate rejected: " + message);
        finishCall(CallError::CallInitiateFailed, message);
        if (callback) callback(Result<CallId>::err(CallError::CallInitiateFailed, message));
        return;
    }

    CallId callId = *ack.callId;
    _record->callId = callId;
    setCallState(CallState::RingingOut);
    armTimer(_ringTimer, _config.ringOutTimeout, [this, callId]() { handleRingOutTimeout(callId); });

    if (callback) callback(Result<CallId>::ok(callId));
}

Result<void> CallSessionManager::cancelCall() {
    switch (state()) {
        case CallState::Dialing:
            // The initiate ack, when it arrives, is canceled as stale
            finishCall(std::nullopt, "");
            return Result<void>::ok();
        case CallState::RingingOut: {
            CallId callId = _record->callId;
            _raceGuard.markCanceled(callId);
            sendEvent(CallCancel{callId, std::nullopt});
            finishCall(std::nullopt, "");
            return Result<void>::ok();
        }
        default:
            return Result<void>::err(CallError::InvalidState,
                                     std::string("No outgoing call to cancel in ") + callStateToString(state()));
    }
}

Result<void> CallSessionManager::acceptCall() {
    if (state() != CallState::RingingIn) {
        return Result<void>::err(CallError::InvalidState, "No ringing call to accept");
    }

    cancelTimer(_ringTimer);
    CallId callId = _record->callId;
    PeerId peerId = _record->peerId;

    auto started = startDirectSession();
    if (started.failed()) {
        ENTROPY_LOG_ERROR("Cannot accept call " + callId + ": " + started.errorMessage);
        sendEvent(CallDecline{callId});
        _ledger.resolveAnswered(callId);
        _raceGuard.markCanceled(callId);
        finishCall(started.error, started.errorMessage);
        return Result<void>::err(started.error, started.errorMessage);
    }

    _ledger.resolveAnswered(callId);
    _ledger.reset(peerId);
    sendEvent(CallAccept{callId});

    setCallState(CallState::Negotiating);
    armTimer(_negotiationTimer, _config.negotiationTimeout, [this, callId]() { handleNegotiationTimeout(callId); });
    return Result<void>::ok();
}

Result<void> CallSessionManager::declineCall() {
    if (state() != CallState::RingingIn) {
        return Result<void>::err(CallError::InvalidState, "No ringing call to decline");
    }

    CallId callId = _record->callId;
    PeerId peerId = _record->peerId;

    sendEvent(CallDecline{callId});
    _ledger.resolveAnswered(callId);
    _raceGuard.markCanceled(callId);
    _declinedUntil[peerId] = _scheduler.now() + _config.declinedBlock;

    ENTROPY_LOG_INFO("Declined call " + callId + " from " + peerId);
    finishCall(std::nullopt, "");
    return Result<void>::ok();
}

void CallSessionManager::hangup() {
    switch (state()) {
        case CallState::Dialing:
        case CallState::RingingOut: {
            auto canceled = cancelCall();
            if (canceled.failed()) {
                ENTROPY_LOG_WARNING("hangup: " + canceled.errorMessage);
            }
            break;
        }
        case CallState::RingingIn: {
            auto declined = declineCall();
            if (declined.failed()) {
                ENTROPY_LOG_WARNING("hangup: " + declined.errorMessage);
            }
            break;
        }
        case CallState::Negotiating:
        case CallState::Active:
            endCall(true);
            break;
        case CallState::Idle:
        case CallState::Ending:
            break;
    }
}

Result<bool> CallSessionManager::toggleMic() {
    auto session = activeSession();
    if (!session) {
        return Result<bool>::err(CallError::InvalidState, "No call in progress");
    }
    return Result<bool>::ok(session->toggleMic());
}

Result<bool> CallSessionManager::toggleCamera() {
    auto session = activeSession();
    if (!session) {
        return Result<bool>::err(CallError::InvalidState, "No call in progress");
    }
    return session->toggleCamera();
}

Result<bool> CallSessionManager::toggleRemoteAudio() {
    auto session = activeSession();
    if (!session) {
        return Result<bool>::err(CallError::InvalidState, "No call in progress");
    }
    return Result<bool>::ok(session->toggleRemoteAudio());
}

Result<void> CallSessionManager::flipCamera(std::shared_ptr<MediaTrack> track) {
    auto session = activeSession();
    if (!session) {
        return Result<void>::err(CallError::InvalidState, "No call in progress");
    }
    return session->flipCamera(std::move(track));
}

Result<std::shared_ptr<PeerSession>> CallSessionManager::startDirectSession() {
    auto stream = _capture.openLocalStream(_config.withVideo);
    if (stream.failed()) {
        return Result<std::shared_ptr<PeerSession>>::err(stream.error, stream.errorMessage);
    }

    auto session = openPeerSession(SessionType::Direct, _record->peerId);
    auto attached = session->attachLocalStream(stream.value);
    if (attached.failed()) {
        stream.value->stopAll();
        closePeerSession(SessionType::Direct);
        return Result<std::shared_ptr<PeerSession>>::err(attached.error, attached.errorMessage);
    }
    if (_record->roomId) {
        session->setRoomId(*_record->roomId);
    }
    return Result<std::shared_ptr<PeerSession>>::ok(session);
}

std::shared_ptr<PeerSession> CallSessionManager::activeSession() const {
    if (auto direct = session(SessionType::Direct)) {
        return direct;
    }
    return session(SessionType::Matchmaking);
}

void CallSessionManager::enterActive() {
    cancelTimer(_negotiationTimer);

    if (!_record->roomId) {
        _record->roomId = _record->callId;
    }
    std::string roomId = *_record->roomId;

    _ledger.reset(_record->peerId);
    sendPresence("busy", roomId);

    if (_controls) {
        std::weak_ptr<int> weak = _lifetime;
        CallControlRegistry::Controls controls;
        controls.session = session(SessionType::Direct);
        controls.roomId = roomId;
        controls.endCall = [this, weak]() {
            if (weak.expired()) return;
            hangup();
        };
        _controls->publish(std::move(controls));
    }

    ENTROPY_LOG_INFO("Call " + _record->callId + " active in room " + roomId);
    setCallState(CallState::Active);
}

void CallSessionManager::endCall(bool notifyRemote) {
    if (!_record || (_record->state != CallState::Negotiating && _record->state != CallState::Active)) {
        return;
    }

    setCallState(CallState::Ending);
    if (notifyRemote) {
        sendEvent(CallEnd{_record->callId, _record->roomId.value_or(_record->callId)});
    }
    finishCall(std::nullopt, "");
}

void CallSessionManager::finishCall(std::optional<CallError> error, const std::string& message) {
    cancelTimer(_ringTimer);
    cancelTimer(_negotiationTimer);
    if (!_record) {
        return;
    }

    CallRecord record = *_record;
    _record.reset();

    closePeerSession(SessionType::Direct);
    if (_controls) {
        _controls->withdraw();
    }
    if (_presenceBusy) {
        sendPresence("online", std::nullopt);
    }

    record.state = CallState::Idle;
    ENTROPY_LOG_DEBUG(std::format("Call {} with {} closed{}", record.callId, record.peerId,
                                  error ? std::string(" (") + errorToString(*error) + ")" : std::string()));
    if (_observer) {
        if (error) {
            _observer->onCallFailed(record, *error, message);
        }
        _observer->onCallStateChanged(record);
    }
}

// ---------------------------------------------------------------------------
// Inbound call control

void CallSessionManager::handleControlEvent(const SignalEvent& event) {
    if (_identity.state() == AuthState::Reauthenticating) {
        ENTROPY_LOG_DEBUG(std::string("Deferring ") + eventName(event) + " until reauth completes");
        _deferred.push_back(event);
        return;
    }
    applyControlEvent(event);
}

void CallSessionManager::handleIdentityState(AuthState state) {
    if (state == AuthState::Reauthenticating) {
        return;
    }

    // Failed or Unauthenticated: the session that queued these is gone, and a
    // cancel sent in the gap would never reach us
    std::deque<SignalEvent> deferred;
    deferred.swap(_deferred);
    for (const auto& event : deferred) {
        if (state != AuthState::Authenticated && !isTerminalControlEvent(event)) {
            ENTROPY_LOG_DEBUG(std::format("Dropping deferred {} after reauth ended {}", eventName(event),
                                          authStateToString(state)));
            continue;
        }
        applyControlEvent(event);
    }
}

void CallSessionManager::applyControlEvent(const SignalEvent& event) {
    std::visit([this](const auto& e) {
        using E = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<E, CallIncoming>) handleIncoming(e);
        else if constexpr (std::is_same_v<E, CallAccepted>) handleAccepted(e);
        else if constexpr (std::is_same_v<E, CallDeclined>) handleDeclined(e);
        else if constexpr (std::is_same_v<E, CallCancel>) handleCancel(e);
        else if constexpr (std::is_same_v<E, CallTimeout>) handleTimeout(e);
        else if constexpr (std::is_same_v<E, CallBusy>) handleBusy(e);
        else if constexpr (std::is_same_v<E, CallRoomFull>) handleRoomFull(e);
        else if constexpr (std::is_same_v<E, CallEnded>) handleEnded(e);
        else {
            ENTROPY_LOG_WARNING(std::string("Not a call-control event: ") + E::Name);
        }
    }, event);
}

void CallSessionManager::handleIncoming(const CallIncoming& event) {
    if (event.callId.empty() || event.from.empty()) {
        ENTROPY_LOG_WARNING("call:incoming without call id or caller");
        return;
    }
    if (_raceGuard.isSuppressed(event.callId)) {
        ENTROPY_LOG_DEBUG(std::format("{}: call:incoming {}", errorToString(CallError::SuppressedEvent),
                                      event.callId));
        return;
    }
    if (isDeclineBlocked(event.from)) {
        ENTROPY_LOG_DEBUG("Ignoring call:incoming from recently declined " + event.from);
        return;
    }
    _declinedUntil.erase(event.from);

    if (state() != CallState::Idle) {
        ENTROPY_LOG_DEBUG(std::format("Ignoring call:incoming {} while {}", event.callId, callStateToString(state())));
        return;
    }
    if (isMatchmakingLive()) {
        ENTROPY_LOG_DEBUG("Ignoring call:incoming " + event.callId + " during matchmaking");
        return;
    }

    CallRecord record;
    record.callId = event.callId;
    record.peerId = event.from;
    record.peerNick = event.fromNick;
    record.direction = CallDirection::Incoming;
    record.state = CallState::RingingIn;
    record.createdAt = _scheduler.now();
    _record = record;

    _ledger.openOccurrence(event.callId, event.from);

    CallId callId = event.callId;
    armTimer(_ringTimer, _config.ringInFallback, [this, callId]() { handleRingInFallback(callId); });

    ENTROPY_LOG_INFO("Incoming call " + callId + " from " + event.from);
    if (_observer) {
        _observer->onIncomingCall(*_record);
    }
    setCallState(CallState::RingingIn);
}

void CallSessionManager::handleAccepted(const CallAccepted& event) {
    if (!matchesRecord(event.callId, {CallState::RingingOut})) {
        ENTROPY_LOG_DEBUG("Ignoring call:accepted for " + event.callId);
        return;
    }

    cancelTimer(_ringTimer);
    CallId callId = event.callId;
    _record->roomId = event.roomId.value_or(callId);

    auto started = startDirectSession();
    if (started.failed()) {
        ENTROPY_LOG_ERROR("Cannot start media for call " + callId + ": " + started.errorMessage);
        setCallState(CallState::Ending);
        sendEvent(CallEnd{callId, *_record->roomId});
        finishCall(started.error, started.errorMessage);
        return;
    }

    setCallState(CallState::Negotiating);
    armTimer(_negotiationTimer, _config.negotiationTimeout, [this, callId]() { handleNegotiationTimeout(callId); });

    auto offered = started.value->createOffer();
    if (offered.failed()) {
        ENTROPY_LOG_ERROR("Cannot create offer for call " + callId + ": " + offered.errorMessage);
        endCall(true);
    }
}

void CallSessionManager::handleDeclined(const CallDeclined& event) {
    _raceGuard.markCanceled(event.callId);

    if (matchesRecord(event.callId, {CallState::RingingOut})) {
        ENTROPY_LOG_INFO("Call " + event.callId + " declined by " + event.from);
        finishCall(CallError::Declined, "declined");
    } else if (matchesRecord(event.callId, {CallState::RingingIn})) {
        // Declined on another device: settled by the user, not missed
        _ledger.resolveAnswered(event.callId);
        finishCall(std::nullopt, "");
    }
}

void CallSessionManager::handleCancel(const CallCancel& event) {
    _raceGuard.markCanceled(event.callId);

    if (matchesRecord(event.callId, {CallState::RingingIn})) {
        ENTROPY_LOG_INFO("Call " + event.callId + " canceled by caller");
        _ledger.resolveMissed(event.callId);
        finishCall(std::nullopt, "");
    } else if (matchesRecord(event.callId, {CallState::Negotiating})) {
        // Caller gave up while our accept was in flight
        finishCall(std::nullopt, "");
    }
}

void CallSessionManager::handleTimeout(const CallTimeout& event) {
    _raceGuard.markTimedOut(event.callId);

    if (matchesRecord(event.callId, {CallState::RingingOut})) {
        finishCall(CallError::Timeout, "timeout");
    } else if (matchesRecord(event.callId, {CallState::RingingIn})) {
        _ledger.resolveMissed(event.callId);
        finishCall(std::nullopt, "");
    }
}

void CallSessionManager::handleBusy(const CallBusy& event) {
    CallState current = state();
    if (current != CallState::Dialing && current != CallState::RingingOut && current != CallState::Negotiating) {
        return;
    }
    if (!event.from.empty() && event.from != _record->peerId) {
        ENTROPY_LOG_DEBUG("Ignoring call:busy from unrelated " + event.from);
        return;
    }
    finishCall(CallError::Busy, "busy");
}

void CallSessionManager::handleRoomFull(const CallRoomFull&) {
    CallState current = state();
    if (current != CallState::Dialing && current != CallState::RingingOut && current != CallState::Negotiating) {
        return;
    }
    finishCall(CallError::RoomFull, "room_full");
}

void CallSessionManager::handleEnded(const CallEnded& event) {
    if (!matchesRecord(event.callId, {CallState::Negotiating, CallState::Active})) {
        return;
    }
    ENTROPY_LOG_INFO("Call " + event.callId + " ended by peer");
    endCall(false);
}

// ---------------------------------------------------------------------------
// Timers

void CallSessionManager::handleRingOutTimeout(const CallId& callId) {
    if (!matchesRecord(callId, {CallState::RingingOut})) {
        return;
    }
    ENTROPY_LOG_INFO("No answer for call " + callId);
    _raceGuard.markTimedOut(callId);
    sendEvent(CallCancel{callId, std::nullopt});
    finishCall(CallError::Timeout, "no_answer");
}

void CallSessionManager::handleRingInFallback(const CallId& callId) {
    if (!matchesRecord(callId, {CallState::RingingIn})) {
        return;
    }
    if (_raceGuard.isSuppressed(callId)) {
        finishCall(std::nullopt, "");
        return;
    }
    _raceGuard.markTimedOut(callId);
    _ledger.resolveMissed(callId);
    finishCall(std::nullopt, "");
}

void CallSessionManager::handleNegotiationTimeout(const CallId& callId) {
    if (!matchesRecord(callId, {CallState::Negotiating})) {
        return;
    }
    ENTROPY_LOG_WARNING("Negotiation for call " + callId + " timed out");
    setCallState(CallState::Ending);
    sendEvent(CallEnd{callId, _record->roomId.value_or(callId)});
    finishCall(CallError::Timeout, "negotiation_timeout");
}

// ---------------------------------------------------------------------------
// Sessions and negotiation

std::shared_ptr<PeerSession> CallSessionManager::openPeerSession(SessionType type, const PeerId& partnerId) {
    closePeerSession(type);

    auto peer = std::make_shared<PeerSession>(type, partnerId, _transportFactory, _mediaConfig, *this, _scheduler);

    std::weak_ptr<int> weak = _lifetime;
    peer->onRemoteTrack([this, weak, type](std::shared_ptr<MediaTrack> track) {
        if (weak.expired()) return;
        if (_observer) _observer->onRemoteTrack(type, track);
    });
    peer->onStateChanged([this, weak, type](ConnectionState connection) {
        if (weak.expired()) return;
        handleSessionState(type, connection);
    });
    _sessions[type] = peer;

    if (!_ownershipToken) {
        auto token = _ownership.acquire(type);
        if (token.success()) {
            _ownershipToken = std::move(token.value);
            bindNegotiationHandlers();
        } else {
            ENTROPY_LOG_DEBUG(std::format("{}: {}", errorToString(token.error), token.errorMessage));
        }
    }
    ENTROPY_LOG_DEBUG(std::format("Opened {} session with {} (handlers owned by {})", sessionTypeToString(type),
                                  partnerId,
                                  _ownershipToken ? sessionTypeToString(_ownershipToken->type()) : "nobody"));
    return peer;
}

void CallSessionManager::closePeerSession(SessionType type) {
    std::shared_ptr<PeerSession> peer;
    auto it = _sessions.find(type);
    if (it != _sessions.end()) {
        peer = std::move(it->second);
        _sessions.erase(it);
    }

    if (_ownershipToken && _ownershipToken->type() == type) {
        unbindNegotiationHandlers();
        _ownershipToken.reset();
    }

    if (peer) {
        peer->cleanup();
    }
}

std::shared_ptr<PeerSession> CallSessionManager::session(SessionType type) const {
    auto it = _sessions.find(type);
    return it != _sessions.end() ? it->second : nullptr;
}

void CallSessionManager::bindNegotiationHandlers() {
    _negotiationSubscriptions.push_back(_channel.on<SdpOffer>([this](const SdpOffer& e) { handleOffer(e); }));
    _negotiationSubscriptions.push_back(_channel.on<SdpAnswer>([this](const SdpAnswer& e) { handleAnswer(e); }));
    _negotiationSubscriptions.push_back(
        _channel.on<IceCandidateSignal>([this](const IceCandidateSignal& e) { handleIceCandidate(e); }));
}

void CallSessionManager::unbindNegotiationHandlers() {
    for (auto id : _negotiationSubscriptions) {
        if (!_channel.off(id)) {
            ENTROPY_LOG_WARNING(std::format("Negotiation handler {} was already removed", id));
        }
    }
    _negotiationSubscriptions.clear();
}

void CallSessionManager::handleSessionState(SessionType type, ConnectionState connection) {
    ENTROPY_LOG_DEBUG(std::format("{} media {}", sessionTypeToString(type), connectionStateToString(connection)));
    if (connection != ConnectionState::Disconnected && connection != ConnectionState::Failed) {
        return;
    }
    if (type == SessionType::Direct && state() == CallState::Active && _observer) {
        _observer->onRemoteDisconnected(*_record);
    }
}

void CallSessionManager::handleOffer(const SdpOffer& event) {
    if (!_ownershipToken) return;
    SessionType type = _ownershipToken->type();
    auto peer = session(type);
    if (!peer || event.peer != peer->partnerId()) {
        ENTROPY_LOG_DEBUG("Ignoring offer from " + event.peer);
        return;
    }
    if (type == SessionType::Direct && state() != CallState::Negotiating) {
        ENTROPY_LOG_DEBUG(std::string("Ignoring offer while ") + callStateToString(state()));
        return;
    }

    if (type == SessionType::Direct && !_record->roomId) {
        _record->roomId = event.roomId.value_or(_record->callId);
        peer->setRoomId(*_record->roomId);
    } else if (event.roomId) {
        peer->setRoomId(*event.roomId);
    }

    auto applied = peer->setRemoteDescription(SessionDescription{"offer", event.sdp});
    if (applied.failed()) {
        ENTROPY_LOG_ERROR("Failed to apply offer: " + applied.errorMessage);
        return;
    }
    auto answered = peer->createAnswer();
    if (answered.failed()) {
        ENTROPY_LOG_ERROR("Failed to create answer: " + answered.errorMessage);
        return;
    }
    negotiationComplete(type);
}

void CallSessionManager::handleAnswer(const SdpAnswer& event) {
    if (!_ownershipToken) return;
    SessionType type = _ownershipToken->type();
    auto peer = session(type);
    if (!peer || event.peer != peer->partnerId()) {
        ENTROPY_LOG_DEBUG("Ignoring answer from " + event.peer);
        return;
    }

    auto applied = peer->setRemoteDescription(SessionDescription{"answer", event.sdp});
    if (applied.failed()) {
        ENTROPY_LOG_ERROR("Failed to apply answer: " + applied.errorMessage);
        return;
    }
    negotiationComplete(type);
}

void CallSessionManager::handleIceCandidate(const IceCandidateSignal& event) {
    if (!_ownershipToken) return;
    auto peer = session(_ownershipToken->type());
    if (!peer) return;

    auto added = peer->addRemoteIceCandidate(event.peer, IceCandidate{event.candidate, event.mid});
    if (added.failed()) {
        ENTROPY_LOG_WARNING("Remote candidate rejected: " + added.errorMessage);
    }
}

void CallSessionManager::negotiationComplete(SessionType type) {
    if (type == SessionType::Direct) {
        if (state() == CallState::Negotiating) {
            enterActive();
        }
    } else if (_matchState == MatchState::Connecting) {
        auto peer = session(SessionType::Matchmaking);
        setMatchState(MatchState::Connected, peer ? std::optional<PeerId>(peer->partnerId()) : std::nullopt);
    }
}

// ---------------------------------------------------------------------------
// Out-of-band media state

void CallSessionManager::handleCamToggle(const CamToggle& event) {
    if (!isCurrentRoom(event.roomId)) return;
    if (_observer) _observer->onRemoteCameraChanged(event.enabled);
}

void CallSessionManager::handlePipState(const PipState& event) {
    if (!isCurrentRoom(event.roomId)) return;
    if (_observer) _observer->onPartnerPipChanged(event.inPiP);
}

bool CallSessionManager::isCurrentRoom(const std::string& roomId) const {
    if (_record && _record->roomId && *_record->roomId == roomId) return true;
    return _matchRoomId && *_matchRoomId == roomId;
}

// ---------------------------------------------------------------------------
// Matchmaking

Result<void> CallSessionManager::startMatchmaking() {
    if (isMatchmakingLive()) {
        return Result<void>::err(CallError::InvalidState, "Matchmaking already running");
    }
    if (state() != CallState::Idle) {
        return Result<void>::err(CallError::InvalidState, "Direct call in progress");
    }
    sendEvent(MatchStart{});
    setMatchState(MatchState::Searching);
    return Result<void>::ok();
}

Result<void> CallSessionManager::nextMatch() {
    if (!isMatchmakingLive()) {
        return Result<void>::err(CallError::InvalidState, "Matchmaking not running");
    }
    closePeerSession(SessionType::Matchmaking);
    _matchRoomId.reset();
    sendEvent(MatchNext{});
    setMatchState(MatchState::Searching);
    return Result<void>::ok();
}

Result<void> CallSessionManager::stopMatchmaking() {
    if (!isMatchmakingLive()) {
        return Result<void>::ok();
    }
    closePeerSession(SessionType::Matchmaking);
    _matchRoomId.reset();
    sendEvent(MatchStop{});
    setMatchState(MatchState::Idle);
    return Result<void>::ok();
}

void CallSessionManager::handleMatchFound(const MatchFound& event) {
    if (!isMatchmakingLive()) {
        ENTROPY_LOG_DEBUG("Ignoring match_found while not matchmaking");
        return;
    }

    auto stream = _capture.openLocalStream(_config.withVideo);
    if (stream.failed()) {
        ENTROPY_LOG_ERROR("Cannot open media for match: " + stream.errorMessage);
        closePeerSession(SessionType::Matchmaking);
        sendEvent(MatchStop{});
        setMatchState(MatchState::Idle);
        return;
    }

    auto peer = openPeerSession(SessionType::Matchmaking, event.partnerId);
    auto attached = peer->attachLocalStream(stream.value);
    if (attached.failed()) {
        ENTROPY_LOG_ERROR("Cannot attach media for match: " + attached.errorMessage);
        stream.value->stopAll();
        closePeerSession(SessionType::Matchmaking);
        sendEvent(MatchStop{});
        setMatchState(MatchState::Idle);
        return;
    }

    peer->setRoomId(event.roomId);
    _matchRoomId = event.roomId;
    setMatchState(MatchState::Connecting, event.partnerId);

    if (event.offerer) {
        auto offered = peer->createOffer();
        if (offered.failed()) {
            ENTROPY_LOG_ERROR("Cannot create match offer: " + offered.errorMessage);
        }
    }
}

void CallSessionManager::handlePartnerGone(MatchState next) {
    if (!isMatchmakingLive()) return;
    closePeerSession(SessionType::Matchmaking);
    _matchRoomId.reset();
    setMatchState(next);
}

// ---------------------------------------------------------------------------
// SignalingSink interface

void CallSessionManager::sendLocalDescription(const PeerId& to, const SessionDescription& description,
                                              const std::optional<std::string>& roomId) {
    if (description.type == "offer") {
        sendEvent(SdpOffer{to, description.sdp, roomId});
    } else if (description.type == "answer") {
        sendEvent(SdpAnswer{to, description.sdp, roomId});
    } else {
        ENTROPY_LOG_WARNING("Not sending local description of type " + description.type);
    }
}

void CallSessionManager::sendLocalCandidate(const PeerId& to, const IceCandidate& candidate,
                                            const std::optional<std::string>& roomId) {
    sendEvent(IceCandidateSignal{to, candidate.candidate, candidate.mid, roomId});
}

void CallSessionManager::sendCameraState(const std::string& roomId, bool enabled) {
    sendEvent(CamToggle{roomId, enabled, std::nullopt});
}

// ---------------------------------------------------------------------------
// Helpers

void CallSessionManager::setCallState(CallState state) {
    if (!_record) return;
    _record->state = state;
    ENTROPY_LOG_DEBUG(std::format("Call {} -> {}", _record->callId.empty() ? "(dialing)" : _record->callId,
                                  callStateToString(state)));
    if (_observer) {
        _observer->onCallStateChanged(*_record);
    }
}

void CallSessionManager::setMatchState(MatchState state, const std::optional<PeerId>& partner) {
    _matchState = state;
    ENTROPY_LOG_DEBUG(std::string("Matchmaking -> ") + matchStateToString(state));
    if (_observer) {
        _observer->onMatchStateChanged(state, partner);
    }
}

void CallSessionManager::armTimer(Scheduler::TimerId& timer, std::chrono::milliseconds delay,
                                  std::function<void()> task) {
    cancelTimer(timer);
    std::weak_ptr<int> weak = _lifetime;
    timer = _scheduler.schedule(delay, [weak, task = std::move(task)]() {
        if (weak.expired()) return;
        task();
    });
}

void CallSessionManager::cancelTimer(Scheduler::TimerId& timer) {
    if (timer != Scheduler::InvalidTimer) {
        _scheduler.cancel(timer);
        timer = Scheduler::InvalidTimer;
    }
}

void CallSessionManager::sendEvent(const SignalEvent& event) {
    auto sent = _channel.send(event);
    if (sent.failed()) {
        ENTROPY_LOG_WARNING(std::string("Failed to send ") + eventName(event) + ": " + sent.errorMessage);
    }
}

void CallSessionManager::sendPresence(const std::string& status, const std::optional<std::string>& roomId) {
    _presenceBusy = status == "busy";
    sendEvent(PresenceUpdate{status, roomId});
}

bool CallSessionManager::matchesRecord(const CallId& callId, std::initializer_list<CallState> states) const {
    if (!_record || _record->callId != callId) {
        return false;
    }
    return std::find(states.begin(), states.end(), _record->state) != states.end();
}

bool CallSessionManager::isDeclineBlocked(const PeerId& peerId) const {
    auto it = _declinedUntil.find(peerId);
    return it != _declinedUntil.end() && _scheduler.now() < it->second;
}

uint64_t CallSessionManager::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(Core::TypeSystem::createTypeId<CallSessionManager>().id);
    return hash;
}

std::string CallSessionManager::toString() const {
    return std::format("{}@{}(call={}, state={}, match={}, sessions={})", className(), static_cast<const void*>(this),
                       _record ? _record->callId : std::string("none"), callStateToString(state()),
                       matchStateToString(_matchState), _sessions.size());
}

}  // namespace EntropyEngine::Calling
