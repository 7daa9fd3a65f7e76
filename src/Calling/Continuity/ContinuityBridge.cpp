/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "ContinuityBridge.h"

#include <Logging/Logger.h>

namespace EntropyEngine::Calling
{

ContinuityBridge::ContinuityBridge(CallControlRegistry& registry, SignalingChannel& channel)
    : _registry(registry)
    , _channel(channel)
{
    _withdrawListener = _registry.onWithdrawn([this]() { exit(); });
}

ContinuityBridge::~ContinuityBridge() {
    _registry.removeListener(_withdrawListener);
}

Result<void> ContinuityBridge::enter(PartnerMeta partner, std::vector<std::shared_ptr<MediaStream>> streams) {
    auto session = _registry.session();
    auto roomId = _registry.roomId();
    if (!session || !roomId) {
        return Result<void>::err(CallError::InvalidState, "No active call to continue in PiP");
    }
    if (_active) {
        return Result<void>::ok();
    }

    _active = true;
    _roomId = *roomId;
    _partner = std::move(partner);
    _streams = std::move(streams);

    sendPipState(_roomId, true);

    _cameraWasEnabled = session->isCameraEnabled();
    if (_cameraWasEnabled) {
        auto paused = session->setCameraEnabled(false);
        if (paused.failed()) {
            ENTROPY_LOG_WARNING("PiP could not pause camera: " + paused.errorMessage);
            _cameraWasEnabled = false;
        }
    }

    ENTROPY_LOG_INFO("Entered PiP for room " + _roomId);
    return Result<void>::ok();
}

void ContinuityBridge::exit() {
    if (!_active) {
        return;
    }
    _active = false;
    _partner.reset();
    _streams.clear();
    ENTROPY_LOG_DEBUG("Left PiP for room " + _roomId);

    if (_exitCallback) {
        _exitCallback();
    }
}

Result<void> ContinuityBridge::returnToCall() {
    if (!_active) {
        return Result<void>::err(CallError::InvalidState, "Not in PiP");
    }

    auto session = _registry.session();
    if (!session) {
        exit();
        return Result<void>::err(CallError::InvalidState, "Call is no longer active");
    }

    sendPipState(_roomId, false);
    if (_cameraWasEnabled) {
        auto resumed = session->setCameraEnabled(true);
        if (resumed.failed()) {
            ENTROPY_LOG_WARNING("PiP could not resume camera: " + resumed.errorMessage);
        }
    }
    exit();
    return Result<void>::ok();
}

Result<bool> ContinuityBridge::toggleMic() {
    auto session = _registry.session();
    if (!_active || !session) {
        return Result<bool>::err(CallError::InvalidState, "No call behind PiP");
    }
    return Result<bool>::ok(session->toggleMic());
}

Result<bool> ContinuityBridge::toggleRemoteAudio() {
    auto session = _registry.session();
    if (!_active || !session) {
        return Result<bool>::err(CallError::InvalidState, "No call behind PiP");
    }
    return Result<bool>::ok(session->toggleRemoteAudio());
}

Result<void> ContinuityBridge::endCall() {
    if (!_registry.endCall()) {
        exit();
        return Result<void>::err(CallError::InvalidState, "No call behind PiP");
    }
    // Usually already done by the withdraw notification
    exit();
    return Result<void>::ok();
}

void ContinuityBridge::sendPipState(const std::string& roomId, bool inPiP) {
    auto sent = _channel.send(PipState{roomId, inPiP, std::nullopt});
    if (sent.failed()) {
        ENTROPY_LOG_WARNING("Failed to send pip:state: " + sent.errorMessage);
    }
}

}  // namespace EntropyEngine::Calling
