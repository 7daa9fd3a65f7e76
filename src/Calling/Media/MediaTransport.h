/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file MediaTransport.h
 * @brief Black-box media transport seen by PeerSession
 */

#pragma once

#include "MediaTypes.h"
#include "../Core/CallTypes.h"
#include "../Core/ErrorCodes.h"

#include <functional>
#include <memory>

namespace EntropyEngine::Calling {

/**
 * @brief Callbacks a transport raises towards its session
 *
 * May fire on transport-owned threads.
 */
struct MediaTransportCallbacks {
    using DescriptionCallback = std::function<void(const SessionDescription&)>;
    using CandidateCallback = std::function<void(const IceCandidate&)>;
    using TrackCallback = std::function<void(std::shared_ptr<MediaTrack>)>;
    using StateCallback = std::function<void(ConnectionState)>;

    DescriptionCallback onLocalDescription;
    CandidateCallback onLocalCandidate;
    TrackCallback onRemoteTrack;
    StateCallback onStateChanged;
};

/**
 * @brief One negotiated media connection to a single remote party
 *
 * Remote candidates received before a remote description are queued by the
 * transport and applied once setRemoteDescription() succeeds.
 */
class MediaTransport {
public:
    virtual ~MediaTransport() = default;

    /**
     * @brief Adds an outgoing track; must precede the first offer or answer
     */
    virtual Result<void> addLocalTrack(std::shared_ptr<MediaTrack> track) = 0;

    /**
     * @brief Swaps the source feeding the outgoing video track
     *
     * Does not touch the SDP. A null track pauses outgoing video.
     */
    virtual Result<void> replaceVideoTrack(std::shared_ptr<MediaTrack> track) = 0;

    /**
     * @brief Starts an offer; the SDP arrives via onLocalDescription
     */
    virtual Result<void> createOffer() = 0;

    /**
     * @brief Answers the applied remote offer; the SDP arrives via onLocalDescription
     */
    virtual Result<void> createAnswer() = 0;

    virtual Result<void> setRemoteDescription(const SessionDescription& description) = 0;
    virtual Result<void> addRemoteCandidate(const IceCandidate& candidate) = 0;
    virtual bool hasRemoteDescription() const = 0;
    virtual ConnectionState getState() const = 0;

    /**
     * @brief Closes the connection; later calls are no-ops
     */
    virtual void close() = 0;
};

/**
 * @brief Host-provided transport constructor
 */
class MediaTransportFactory {
public:
    virtual ~MediaTransportFactory() = default;

    /**
     * @return New transport, or nullptr if one could not be created
     */
    virtual std::unique_ptr<MediaTransport> create(const MediaTransportConfig& config,
                                                   MediaTransportCallbacks callbacks) = 0;
};

/**
 * @brief Host-provided capture devices
 */
class MediaCapture {
public:
    virtual ~MediaCapture() = default;

    /**
     * @brief Opens the local microphone and, if requested, the camera
     */
    virtual Result<std::shared_ptr<MediaStream>> openLocalStream(bool withVideo) = 0;
};

} // namespace EntropyEngine::Calling
