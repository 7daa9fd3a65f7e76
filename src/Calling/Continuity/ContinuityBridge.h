/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file ContinuityBridge.h
 * @brief Keeps an active call controllable after the call screen goes away
 */

#pragma once

#include "CallControlRegistry.h"
#include "../Signaling/SignalingChannel.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace EntropyEngine::Calling {

/**
 * @brief Who the floating window is showing
 */
struct PartnerMeta {
    PeerId peerId;
    std::optional<std::string> nick;
    std::optional<std::string> avatarUrl;
};

/**
 * @brief Picture-in-picture continuity layer
 *
 * enter() is called when the call screen unmounts while a call is Active.
 * The bridge tells the partner (pip:state true), pauses the outgoing camera
 * and from then on drives the call through CallControlRegistry. It keeps no
 * strong reference to the PeerSession, so destroying the bridge never ends
 * a call, and a bridge outliving the call only sees empty lookups.
 *
 * The bridge exits by itself when the registry withdraws the controls.
 *
 * All methods run on the scheduler thread.
 */
class ContinuityBridge {
public:
    using ExitCallback = std::function<void()>;

    ContinuityBridge(CallControlRegistry& registry, SignalingChannel& channel);
    ~ContinuityBridge();

    ContinuityBridge(const ContinuityBridge&) = delete;
    ContinuityBridge& operator=(const ContinuityBridge&) = delete;

    /**
     * @brief Switches the call into PiP
     * @return InvalidState if no call controls are published
     */
    Result<void> enter(PartnerMeta partner, std::vector<std::shared_ptr<MediaStream>> streams);

    /**
     * @brief Leaves PiP without touching the call; idempotent
     */
    void exit();

    /**
     * @brief Tells the partner PiP is over, resumes the camera and exits
     */
    Result<void> returnToCall();

    Result<bool> toggleMic();
    Result<bool> toggleRemoteAudio();

    /**
     * @brief Ends the call through its owner and exits
     */
    Result<void> endCall();

    bool isActive() const { return _active; }
    const std::optional<PartnerMeta>& partner() const { return _partner; }
    const std::vector<std::shared_ptr<MediaStream>>& streams() const { return _streams; }

    /**
     * @brief Called whenever the bridge exits (PiP window should close)
     */
    void setExitCallback(ExitCallback callback) { _exitCallback = std::move(callback); }

private:
    void sendPipState(const std::string& roomId, bool inPiP);

    CallControlRegistry& _registry;
    SignalingChannel& _channel;
    CallControlRegistry::ListenerId _withdrawListener = 0;

    bool _active = false;
    bool _cameraWasEnabled = false;
    std::string _roomId;
    std::optional<PartnerMeta> _partner;
    std::vector<std::shared_ptr<MediaStream>> _streams;
    ExitCallback _exitCallback;
};

} // namespace EntropyEngine::Calling
