/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "RtcMediaTransport.h"

#include <Logging/Logger.h>

#include <chrono>
#include <cstring>
#include <format>
#include <optional>
#include <stdexcept>
#include <thread>

namespace EntropyEngine {
namespace Calling {

namespace {
    constexpr int OPUS_PAYLOAD_TYPE = 111;
    constexpr int H264_PAYLOAD_TYPE = 96;
    constexpr uint32_t AUDIO_SSRC = 0x0e47a001;
    constexpr uint32_t VIDEO_SSRC = 0x0e47a002;
    constexpr const char* STREAM_ID = "entropy-stream";

    TrackKind kindFromDescription(int trackId) {
        char buffer[4096];
        int length = rtcGetTrackDescription(trackId, buffer, static_cast<int>(sizeof(buffer)));
        if (length > 0 && std::strstr(buffer, "m=video") != nullptr) {
            return TrackKind::Video;
        }
        return TrackKind::Audio;
    }
}

RtcMediaTransport::RtcMediaTransport(MediaTransportConfig config, MediaTransportCallbacks callbacks)
    : _callbackContext(new CallbackContext{this})
    , _config(std::move(config))
    , _callbacks(std::move(callbacks))
{
    try {
        setupPeerConnection();
        _audio.trackId = addNativeTrack(TrackKind::Audio);
        _video.trackId = addNativeTrack(TrackKind::Video);
    } catch (...) {
        // Constructor failed: the destructor will not run, release what was created
        if (_peerConnectionId >= 0) {
            rtcSetUserPointer(_peerConnectionId, nullptr);
            rtcDeletePeerConnection(_peerConnectionId);
        }
        delete _callbackContext;
        throw;
    }
}

RtcMediaTransport::~RtcMediaTransport() {
    // Order: invalidate context, clear user pointers, delete native objects,
    // wait for in-flight callbacks, then free the context.
    _callbackContext->valid.store(false, std::memory_order_release);

    close();

    std::vector<int> trackIds;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_audio.trackId >= 0) trackIds.push_back(_audio.trackId);
        if (_video.trackId >= 0) trackIds.push_back(_video.trackId);
        trackIds.insert(trackIds.end(), _remoteAnnouncedTracks.begin(), _remoteAnnouncedTracks.end());
        _audio.trackId = -1;
        _video.trackId = -1;
        _remoteAnnouncedTracks.clear();
        _remoteTracks.clear();
    }

    for (int trackId : trackIds) {
        rtcSetUserPointer(trackId, nullptr);
    }
    if (_peerConnectionId >= 0) {
        rtcSetUserPointer(_peerConnectionId, nullptr);
    }

    for (int trackId : trackIds) {
        rtcDeleteTrack(trackId);
    }
    if (_peerConnectionId >= 0) {
        rtcDeletePeerConnection(_peerConnectionId);
        _peerConnectionId = -1;
    }

    // libdatachannel may still be running callbacks on its own threads
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    int waitCount = 0;
    while (_callbackContext->activeCallbacks.load(std::memory_order_acquire) > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
        if (++waitCount % 10000 == 0) {
            ENTROPY_LOG_WARNING("Waiting for " +
                                std::to_string(_callbackContext->activeCallbacks.load(std::memory_order_acquire)) +
                                " active media callbacks to complete");
        }
    }

    delete _callbackContext;
    _callbackContext = nullptr;
}

void RtcMediaTransport::setupPeerConnection() {
    rtcConfiguration config;
    std::memset(&config, 0, sizeof(config));

    std::vector<const char*> iceServerPtrs;
    iceServerPtrs.reserve(_config.iceServers.size());
    for (const auto& server : _config.iceServers) {
        iceServerPtrs.push_back(server.c_str());
    }
    config.iceServers = iceServerPtrs.empty() ? nullptr : iceServerPtrs.data();
    config.iceServersCount = static_cast<int>(iceServerPtrs.size());

    if (!_config.bindAddress.empty()) {
        config.bindAddress = _config.bindAddress.c_str();
    }

    if (_config.portRangeBegin > 0 && _config.portRangeEnd > 0) {
        config.portRangeBegin = _config.portRangeBegin;
        config.portRangeEnd = _config.portRangeEnd;
    }

    config.enableIceTcp = _config.enableIceTcp;
    config.disableAutoNegotiation = true;

    ENTROPY_LOG_INFO("Creating media PeerConnection (ICE-TCP=" + std::string(config.enableIceTcp ? "on" : "off") +
                     ", iceServers=" + std::to_string(iceServerPtrs.size()) + ")");
    _peerConnectionId = rtcCreatePeerConnection(&config);
    if (_peerConnectionId < 0) {
        throw std::runtime_error("Failed to create media peer connection");
    }

    rtcSetUserPointer(_peerConnectionId, _callbackContext);
    rtcSetLocalDescriptionCallback(_peerConnectionId, onLocalDescriptionCallback);
    rtcSetLocalCandidateCallback(_peerConnectionId, onLocalCandidateCallback);
    rtcSetStateChangeCallback(_peerConnectionId, onStateChangeCallback);
    rtcSetTrackCallback(_peerConnectionId, onTrackCallback);
}

int RtcMediaTransport::addNativeTrack(TrackKind kind) {
    const bool video = kind == TrackKind::Video;

    rtcTrackInit init;
    std::memset(&init, 0, sizeof(init));
    init.direction = RTC_DIRECTION_SENDRECV;
    init.codec = video ? RTC_CODEC_H264 : RTC_CODEC_OPUS;
    init.payloadType = video ? H264_PAYLOAD_TYPE : OPUS_PAYLOAD_TYPE;
    init.ssrc = video ? VIDEO_SSRC : AUDIO_SSRC;
    init.mid = video ? "video" : "audio";
    init.name = video ? "video" : "audio";
    init.msid = STREAM_ID;
    init.trackId = video ? "entropy-video" : "entropy-audio";

    int trackId = rtcAddTrackEx(_peerConnectionId, &init);
    if (trackId < 0) {
        throw std::runtime_error(std::string("Failed to add ") + (video ? "video" : "audio") + " track");
    }

    ENTROPY_LOG_DEBUG(std::format("Added {} track id={} to pc={}", video ? "video" : "audio", trackId,
                                  _peerConnectionId));
    setupTrackCallbacks(trackId);
    return trackId;
}

void RtcMediaTransport::setupTrackCallbacks(int trackId) {
    rtcSetUserPointer(trackId, _callbackContext);
    rtcSetOpenCallback(trackId, onTrackOpenCallback);
    rtcSetMessageCallback(trackId, onTrackMessageCallback);
}

void RtcMediaTransport::attachSource(LocalSlot& slot, std::shared_ptr<MediaTrack> source) {
    if (slot.source && slot.source != source) {
        slot.source->setFrameSink(nullptr);
    }
    slot.source = std::move(source);
    if (!slot.source) {
        return;
    }

    int trackId = slot.trackId;
    std::weak_ptr<std::atomic<uint64_t>> dropped = _droppedPackets;
    slot.source->setFrameSink([trackId, dropped](const std::vector<std::byte>& packet, uint64_t) {
        if (rtcSendMessage(trackId, reinterpret_cast<const char*>(packet.data()),
                           static_cast<int>(packet.size())) < 0) {
            if (auto counter = dropped.lock()) {
                counter->fetch_add(1, std::memory_order_relaxed);
            }
        }
    });
}

Result<void> RtcMediaTransport::addLocalTrack(std::shared_ptr<MediaTrack> track) {
    if (!track) {
        return Result<void>::err(CallError::InvalidParameter, "Cannot add a null track");
    }
    if (_closed.load(std::memory_order_acquire)) {
        return Result<void>::err(CallError::InvalidState, "Transport closed");
    }

    std::lock_guard<std::mutex> lock(_mutex);
    attachSource(track->kind() == TrackKind::Video ? _video : _audio, std::move(track));
    return Result<void>::ok();
}

Result<void> RtcMediaTransport::replaceVideoTrack(std::shared_ptr<MediaTrack> track) {
    if (track && track->kind() != TrackKind::Video) {
        return Result<void>::err(CallError::InvalidParameter, "Replacement track is not video");
    }
    if (_closed.load(std::memory_order_acquire)) {
        return Result<void>::err(CallError::InvalidState, "Transport closed");
    }

    std::lock_guard<std::mutex> lock(_mutex);
    attachSource(_video, std::move(track));
    return Result<void>::ok();
}

Result<void> RtcMediaTransport::createOffer() {
    if (_closed.load(std::memory_order_acquire)) {
        return Result<void>::err(CallError::InvalidState, "Transport closed");
    }
    if (rtcSetLocalDescription(_peerConnectionId, "offer") < 0) {
        return Result<void>::err(CallError::TransportFailed, "Failed to create local offer");
    }
    return Result<void>::ok();
}

Result<void> RtcMediaTransport::createAnswer() {
    if (_closed.load(std::memory_order_acquire)) {
        return Result<void>::err(CallError::InvalidState, "Transport closed");
    }
    if (!hasRemoteDescription()) {
        return Result<void>::err(CallError::InvalidState, "Cannot answer without a remote offer");
    }
    if (rtcSetLocalDescription(_peerConnectionId, "answer") < 0) {
        return Result<void>::err(CallError::TransportFailed, "Failed to create local answer");
    }
    return Result<void>::ok();
}

Result<void> RtcMediaTransport::setRemoteDescription(const SessionDescription& description) {
    if (_closed.load(std::memory_order_acquire)) {
        return Result<void>::err(CallError::InvalidState, "Transport closed");
    }
    if (description.sdp.empty()) {
        return Result<void>::err(CallError::InvalidParameter, "Empty remote description");
    }

    if (rtcSetRemoteDescription(_peerConnectionId, description.sdp.c_str(), description.type.c_str()) < 0) {
        return Result<void>::err(CallError::TransportFailed, "Failed to apply remote " + description.type);
    }

    std::vector<IceCandidate> pending;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _haveRemoteDescription.store(true, std::memory_order_release);
        pending.swap(_pendingRemoteCandidates);
    }

    // Flush outside the lock, libdatachannel may call back synchronously
    for (const auto& candidate : pending) {
        const char* mid = candidate.mid.empty() ? nullptr : candidate.mid.c_str();
        if (rtcAddRemoteCandidate(_peerConnectionId, candidate.candidate.c_str(), mid) < 0) {
            ENTROPY_LOG_WARNING("Dropped queued remote candidate: " + candidate.candidate);
        }
    }
    return Result<void>::ok();
}

Result<void> RtcMediaTransport::addRemoteCandidate(const IceCandidate& candidate) {
    if (_closed.load(std::memory_order_acquire)) {
        return Result<void>::err(CallError::InvalidState, "Transport closed");
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_haveRemoteDescription.load(std::memory_order_acquire)) {
            _pendingRemoteCandidates.push_back(candidate);
            return Result<void>::ok();
        }
    }

    const char* mid = candidate.mid.empty() ? nullptr : candidate.mid.c_str();
    if (rtcAddRemoteCandidate(_peerConnectionId, candidate.candidate.c_str(), mid) < 0) {
        return Result<void>::err(CallError::TransportFailed, "Failed to add remote candidate");
    }
    return Result<void>::ok();
}

void RtcMediaTransport::close() {
    if (_closed.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        attachSource(_audio, nullptr);
        attachSource(_video, nullptr);
        _pendingRemoteCandidates.clear();
    }

    if (_peerConnectionId >= 0 && rtcClosePeerConnection(_peerConnectionId) < 0) {
        ENTROPY_LOG_WARNING(std::format("rtcClosePeerConnection failed for pc={}", _peerConnectionId));
    }
    setState(ConnectionState::Disconnected);
}

void RtcMediaTransport::setState(ConnectionState state) {
    ConnectionState previous = _state.exchange(state, std::memory_order_acq_rel);
    if (previous != state && _callbacks.onStateChanged) {
        _callbacks.onStateChanged(state);
    }
}

// C API callback adapters
void RtcMediaTransport::onLocalDescriptionCallback(int, const char* sdp, const char* type, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getTransport();

    ENTROPY_LOG_DEBUG(std::string("Media onLocalDescription: type=") + (type ? type : "(null)"));
    if (self->_callbacks.onLocalDescription && sdp && type) {
        self->_callbacks.onLocalDescription(SessionDescription{type, sdp});
    }
}

void RtcMediaTransport::onLocalCandidateCallback(int, const char* cand, const char* mid, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getTransport();

    if (self->_callbacks.onLocalCandidate && cand) {
        self->_callbacks.onLocalCandidate(IceCandidate{cand, mid ? mid : ""});
    }
}

void RtcMediaTransport::onStateChangeCallback(int, rtcState state, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getTransport();

    switch (state) {
        case RTC_NEW:
        case RTC_CONNECTING:
            self->setState(ConnectionState::Connecting);
            break;
        case RTC_CONNECTED:
            self->setState(ConnectionState::Connected);
            break;
        case RTC_DISCONNECTED:
        case RTC_CLOSED:
            self->setState(ConnectionState::Disconnected);
            break;
        case RTC_FAILED:
            self->setState(ConnectionState::Failed);
            break;
    }
}

void RtcMediaTransport::onTrackCallback(int, int tr, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getTransport();

    // Only m-lines we did not add ourselves land here
    {
        std::lock_guard<std::mutex> lock(self->_mutex);
        self->_remoteAnnouncedTracks.push_back(tr);
    }
    ENTROPY_LOG_DEBUG(std::format("Remote offer announced extra track id={}", tr));
    self->setupTrackCallbacks(tr);
}

void RtcMediaTransport::onTrackOpenCallback(int tr, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getTransport();

    std::optional<TrackKind> known;
    {
        std::lock_guard<std::mutex> lock(self->_mutex);
        if (tr == self->_audio.trackId) {
            known = TrackKind::Audio;
        } else if (tr == self->_video.trackId) {
            known = TrackKind::Video;
        }
    }
    TrackKind kind = known ? *known : kindFromDescription(tr);

    auto remote = std::make_shared<MediaTrack>(std::format("remote-{}", tr), kind);
    bool inserted;
    {
        std::lock_guard<std::mutex> lock(self->_mutex);
        inserted = self->_remoteTracks.emplace(tr, remote).second;
    }

    if (inserted && self->_callbacks.onRemoteTrack) {
        self->_callbacks.onRemoteTrack(remote);
    }
}

void RtcMediaTransport::onTrackMessageCallback(int tr, const char* message, int size, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getTransport();

    // Negative size means a text message, which media tracks never carry
    if (!message || size <= 0) return;

    std::shared_ptr<MediaTrack> remote;
    {
        std::lock_guard<std::mutex> lock(self->_mutex);
        auto it = self->_remoteTracks.find(tr);
        if (it == self->_remoteTracks.end()) return;
        remote = it->second;
    }

    const auto* bytes = reinterpret_cast<const std::byte*>(message);
    remote->deliverFrame(std::vector<std::byte>(bytes, bytes + size), 0);
}

uint64_t RtcMediaTransport::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(Core::TypeSystem::createTypeId<RtcMediaTransport>().id);
    return hash;
}

std::string RtcMediaTransport::toString() const {
    return std::format("{}@{}(pc={}, state={}, remoteDescription={})", className(), static_cast<const void*>(this),
                       _peerConnectionId, connectionStateToString(getState()), hasRemoteDescription());
}

std::unique_ptr<MediaTransport> RtcMediaTransportFactory::create(const MediaTransportConfig& config,
                                                                 MediaTransportCallbacks callbacks) {
    try {
        return std::make_unique<RtcMediaTransport>(config, std::move(callbacks));
    } catch (const std::exception& e) {
        ENTROPY_LOG_ERROR(std::string("Failed to create media transport: ") + e.what());
        return nullptr;
    }
}

} // namespace Calling
} // namespace EntropyEngine
