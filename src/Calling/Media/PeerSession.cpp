/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "PeerSession.h"

#include <Logging/Logger.h>

#include <format>

namespace EntropyEngine::Calling
{

PeerSession::PeerSession(SessionType type,
                         PeerId partnerId,
                         MediaTransportFactory& factory,
                         MediaTransportConfig config,
                         SignalingSink& sink,
                         Scheduler& scheduler)
    : _type(type)
    , _partnerId(std::move(partnerId))
    , _factory(factory)
    , _config(std::move(config))
    , _sink(sink)
    , _scheduler(scheduler)
    , _remoteStream(std::make_shared<MediaStream>("remote"))
{
}

PeerSession::~PeerSession() {
    cleanup();
}

Result<void> PeerSession::attachLocalStream(std::shared_ptr<MediaStream> stream) {
    if (!stream) {
        return Result<void>::err(CallError::InvalidParameter, "Local stream is null");
    }
    if (isClosed()) {
        return Result<void>::err(CallError::InvalidState, "Session closed");
    }

    std::lock_guard<std::mutex> lock(_mutex);
    if (_transport) {
        return Result<void>::err(CallError::InvalidState, "Local stream must be attached before negotiation");
    }
    _localStream = std::move(stream);
    _cameraEnabled.store(!_localStream->videoTracks().empty(), std::memory_order_release);
    return Result<void>::ok();
}

MediaTransportCallbacks PeerSession::makeTransportCallbacks() {
    // Transport threads only post; the weak reference makes late callbacks harmless
    std::weak_ptr<PeerSession> weak = weak_from_this();
    Scheduler* scheduler = &_scheduler;

    MediaTransportCallbacks callbacks;
    callbacks.onLocalDescription = [weak, scheduler](const SessionDescription& description) {
        scheduler->post([weak, description]() {
            if (auto self = weak.lock()) self->handleLocalDescription(description);
        });
    };
    callbacks.onLocalCandidate = [weak, scheduler](const IceCandidate& candidate) {
        scheduler->post([weak, candidate]() {
            if (auto self = weak.lock()) self->handleLocalCandidate(candidate);
        });
    };
    callbacks.onRemoteTrack = [weak, scheduler](std::shared_ptr<MediaTrack> track) {
        scheduler->post([weak, track]() {
            if (auto self = weak.lock()) self->handleRemoteTrack(track);
        });
    };
    callbacks.onStateChanged = [weak, scheduler](ConnectionState state) {
        scheduler->post([weak, state]() {
            if (auto self = weak.lock()) self->handleStateChanged(state);
        });
    };
    return callbacks;
}

Result<void> PeerSession::ensureTransport() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_transport) {
        return Result<void>::ok();
    }

    auto transport = _factory.create(_config, makeTransportCallbacks());
    if (!transport) {
        return Result<void>::err(CallError::TransportFailed, "Media transport could not be created");
    }

    if (_localStream) {
        for (const auto& track : _localStream->tracks()) {
            if (!track) continue;
            if (track->kind() == TrackKind::Video && !_cameraEnabled.load(std::memory_order_acquire)) continue;
            auto added = transport->addLocalTrack(track);
            if (added.failed()) {
                transport->close();
                return added;
            }
        }
    }

    auto bucket = _bufferedCandidates.find(_partnerId);
    if (bucket != _bufferedCandidates.end()) {
        ENTROPY_LOG_DEBUG(std::format("Flushing {} buffered candidates from {}", bucket->second.size(), _partnerId));
        for (const auto& candidate : bucket->second) {
            auto applied = transport->addRemoteCandidate(candidate);
            if (applied.failed()) {
                ENTROPY_LOG_WARNING("Dropped buffered candidate: " + applied.errorMessage);
            }
        }
        _bufferedCandidates.erase(bucket);
    }

    _transport = std::move(transport);
    ENTROPY_LOG_INFO(std::format("Created {} media transport for partner {}", sessionTypeToString(_type), _partnerId));
    return Result<void>::ok();
}

Result<void> PeerSession::createOffer() {
    if (isClosed()) {
        return Result<void>::err(CallError::InvalidState, "Session closed");
    }
    auto ready = ensureTransport();
    if (ready.failed()) {
        return ready;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    return _transport->createOffer();
}

Result<void> PeerSession::createAnswer() {
    if (isClosed()) {
        return Result<void>::err(CallError::InvalidState, "Session closed");
    }
    auto ready = ensureTransport();
    if (ready.failed()) {
        return ready;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    if (!_transport->hasRemoteDescription()) {
        return Result<void>::err(CallError::InvalidState, "Cannot answer before a remote offer was applied");
    }
    return _transport->createAnswer();
}

Result<void> PeerSession::setRemoteDescription(const SessionDescription& description) {
    if (isClosed()) {
        return Result<void>::err(CallError::InvalidState, "Session closed");
    }
    auto ready = ensureTransport();
    if (ready.failed()) {
        return ready;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    return _transport->setRemoteDescription(description);
}

Result<void> PeerSession::addRemoteIceCandidate(const PeerId& from, const IceCandidate& candidate) {
    if (isClosed()) {
        return Result<void>::err(CallError::InvalidState, "Session closed");
    }
    if (candidate.candidate.empty()) {
        return Result<void>::err(CallError::InvalidParameter, "Empty candidate");
    }

    std::lock_guard<std::mutex> lock(_mutex);
    if (_transport && from == _partnerId) {
        return _transport->addRemoteCandidate(candidate);
    }
    _bufferedCandidates[from].push_back(candidate);
    return Result<void>::ok();
}

void PeerSession::onRemoteTrack(RemoteTrackCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _remoteTrackCallback = std::move(callback);
}

void PeerSession::onStateChanged(StateCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _stateCallback = std::move(callback);
}

bool PeerSession::toggleMic() {
    bool enabled = !_micEnabled.load(std::memory_order_acquire);
    _micEnabled.store(enabled, std::memory_order_release);

    auto stream = localStream();
    if (stream) {
        for (const auto& track : stream->audioTracks()) {
            track->setEnabled(enabled);
        }
    }
    return enabled;
}

Result<bool> PeerSession::toggleCamera() {
    return setCameraEnabled(!isCameraEnabled());
}

Result<bool> PeerSession::setCameraEnabled(bool enabled) {
    if (isClosed()) {
        return Result<bool>::err(CallError::InvalidState, "Session closed");
    }

    auto camera = currentCameraTrack();
    if (!camera) {
        return Result<bool>::err(CallError::InvalidState, "No camera track in the local stream");
    }

    std::optional<std::string> roomId;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_transport) {
            // Same transport, only the outgoing source changes
            auto replaced = _transport->replaceVideoTrack(enabled ? camera : nullptr);
            if (replaced.failed()) {
                return Result<bool>::err(replaced.error, replaced.errorMessage);
            }
        }
        roomId = _roomId;
    }

    camera->setEnabled(enabled);
    _cameraEnabled.store(enabled, std::memory_order_release);

    if (roomId) {
        _sink.sendCameraState(*roomId, enabled);
    }
    return Result<bool>::ok(enabled);
}

bool PeerSession::toggleRemoteAudio() {
    bool enabled = !_remoteAudioEnabled.load(std::memory_order_acquire);
    _remoteAudioEnabled.store(enabled, std::memory_order_release);

    for (const auto& track : _remoteStream->audioTracks()) {
        track->setEnabled(enabled);
    }
    return enabled;
}

Result<void> PeerSession::flipCamera(std::shared_ptr<MediaTrack> track) {
    if (!track || track->kind() != TrackKind::Video) {
        return Result<void>::err(CallError::InvalidParameter, "Camera replacement must be a video track");
    }
    if (isClosed()) {
        return Result<void>::err(CallError::InvalidState, "Session closed");
    }

    auto previous = currentCameraTrack();
    std::shared_ptr<MediaStream> stream;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_localStream) {
            return Result<void>::err(CallError::InvalidState, "No local stream attached");
        }
        if (_transport && isCameraEnabled()) {
            auto replaced = _transport->replaceVideoTrack(track);
            if (replaced.failed()) {
                return replaced;
            }
        }
        stream = _localStream;
    }

    track->setEnabled(isCameraEnabled());
    stream->replaceVideoTrack(track);
    if (previous && previous != track) {
        previous->stop();
    }
    return Result<void>::ok();
}

void PeerSession::cleanup() {
    if (_closed.exchange(true)) {
        return;
    }

    std::unique_ptr<MediaTransport> transport;
    std::shared_ptr<MediaStream> local;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        transport = std::move(_transport);
        local = _localStream;
        _bufferedCandidates.clear();
        _remoteTrackCallback = nullptr;
        _stateCallback = nullptr;
    }

    if (local) {
        local->stopAll();
    }
    _remoteStream->stopAll();
    if (transport) {
        transport->close();
    }
    ENTROPY_LOG_DEBUG(std::format("{} session with {} cleaned up", sessionTypeToString(_type), _partnerId));
}

std::optional<std::string> PeerSession::roomId() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _roomId;
}

void PeerSession::setRoomId(std::string roomId) {
    std::lock_guard<std::mutex> lock(_mutex);
    _roomId = std::move(roomId);
}

std::shared_ptr<MediaStream> PeerSession::localStream() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _localStream;
}

MediaTransport* PeerSession::transport() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _transport.get();
}

size_t PeerSession::bufferedCandidateCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    size_t count = 0;
    for (const auto& [from, candidates] : _bufferedCandidates) {
        count += candidates.size();
    }
    return count;
}

std::shared_ptr<MediaTrack> PeerSession::currentCameraTrack() const {
    auto stream = localStream();
    if (!stream) return nullptr;
    auto video = stream->videoTracks();
    return video.empty() ? nullptr : video.front();
}

void PeerSession::handleLocalDescription(const SessionDescription& description) {
    if (isClosed()) return;
    _sink.sendLocalDescription(_partnerId, description, roomId());
}

void PeerSession::handleLocalCandidate(const IceCandidate& candidate) {
    if (isClosed()) return;
    _sink.sendLocalCandidate(_partnerId, candidate, roomId());
}

void PeerSession::handleRemoteTrack(std::shared_ptr<MediaTrack> track) {
    if (isClosed() || !track) return;

    if (track->kind() == TrackKind::Audio) {
        track->setEnabled(isRemoteAudioEnabled());
    }
    _remoteStream->addTrack(track);

    RemoteTrackCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _remoteTrackCallback;
    }
    if (callback) {
        callback(track);
    }
}

void PeerSession::handleStateChanged(ConnectionState state) {
    if (isClosed()) return;

    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _stateCallback;
    }
    if (callback) {
        callback(state);
    }
}

uint64_t PeerSession::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(Core::TypeSystem::createTypeId<PeerSession>().id);
    return hash;
}

std::string PeerSession::toString() const {
    return std::format("{}@{}(type={}, partner={}, mic={}, camera={}, closed={})", className(),
                       static_cast<const void*>(this), sessionTypeToString(_type), _partnerId, isMicEnabled(),
                       isCameraEnabled(), isClosed());
}

}  // namespace EntropyEngine::Calling
