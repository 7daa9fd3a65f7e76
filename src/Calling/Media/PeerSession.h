/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file PeerSession.h
 * @brief One negotiated media connection owned by a single session type
 */

#pragma once

#include <EntropyCore.h>
#include "MediaTransport.h"
#include "../Core/Scheduler.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace EntropyEngine::Calling {

    /**
     * @brief Outbound path for negotiation and media-state messages
     *
     * Implemented by CallSessionManager, which routes them onto the signaling
     * channel. Called on the scheduler thread.
     */
    class SignalingSink {
    public:
        virtual ~SignalingSink() = default;

        virtual void sendLocalDescription(const PeerId& to, const SessionDescription& description,
                                          const std::optional<std::string>& roomId) = 0;
        virtual void sendLocalCandidate(const PeerId& to, const IceCandidate& candidate,
                                        const std::optional<std::string>& roomId) = 0;
        virtual void sendCameraState(const std::string& roomId, bool enabled) = 0;
    };

    /**
     * @brief Media side of one call
     *
     * Owns the local and remote streams and, once created, the transport.
     * The transport is created lazily by the first negotiation step so remote
     * ICE candidates can arrive before anything is set up: those are buffered
     * per sender and the partner's bucket is flushed into the new transport.
     *
     * Camera and mic changes never renegotiate. Muting disables the audio
     * source; camera-off detaches the outgoing video source from the same
     * transport and tells the partner with a cam-toggle.
     *
     * Must be owned by a std::shared_ptr: transport callbacks are posted to
     * the scheduler holding a weak reference.
     *
     * Thread Safety: Public methods are safe from any thread; callbacks run on
     * the scheduler thread.
     */
    class PeerSession : public Core::EntropyObject, public std::enable_shared_from_this<PeerSession> {
    public:
        using RemoteTrackCallback = std::function<void(std::shared_ptr<MediaTrack>)>;
        using StateCallback = std::function<void(ConnectionState)>;

        PeerSession(SessionType type,
                    PeerId partnerId,
                    MediaTransportFactory& factory,
                    MediaTransportConfig config,
                    SignalingSink& sink,
                    Scheduler& scheduler);
        ~PeerSession() override;

        PeerSession(const PeerSession&) = delete;
        PeerSession& operator=(const PeerSession&) = delete;

        /**
         * @brief Sets the local capture stream; must precede negotiation
         */
        Result<void> attachLocalStream(std::shared_ptr<MediaStream> stream);

        Result<void> createOffer();

        /**
         * @brief Answers the previously applied remote offer
         */
        Result<void> createAnswer();

        Result<void> setRemoteDescription(const SessionDescription& description);

        /**
         * @brief Applies or buffers a remote candidate
         * @param from Remote party the candidate came from
         */
        Result<void> addRemoteIceCandidate(const PeerId& from, const IceCandidate& candidate);

        void onRemoteTrack(RemoteTrackCallback callback);
        void onStateChanged(StateCallback callback);

        /**
         * @brief Flips the outgoing audio
         * @return true if the mic is now enabled
         */
        bool toggleMic();

        /**
         * @brief Flips the outgoing camera
         * @return New camera state, or InvalidState without a video track
         */
        Result<bool> toggleCamera();

        /**
         * @brief Pauses or resumes outgoing video and notifies the partner
         */
        Result<bool> setCameraEnabled(bool enabled);

        /**
         * @brief Flips playback of the partner's audio
         * @return true if remote audio is now audible
         */
        bool toggleRemoteAudio();

        /**
         * @brief Switches the outgoing camera source (front/back)
         */
        Result<void> flipCamera(std::shared_ptr<MediaTrack> track);

        /**
         * @brief Stops local tracks and closes the transport; later calls are no-ops
         */
        void cleanup();

        SessionType sessionType() const { return _type; }
        const PeerId& partnerId() const { return _partnerId; }

        std::optional<std::string> roomId() const;
        void setRoomId(std::string roomId);

        std::shared_ptr<MediaStream> localStream() const;
        std::shared_ptr<MediaStream> remoteStream() const { return _remoteStream; }

        /**
         * @brief Current transport, nullptr before first use or after cleanup
         */
        MediaTransport* transport() const;

        size_t bufferedCandidateCount() const;

        bool isMicEnabled() const { return _micEnabled.load(std::memory_order_acquire); }
        bool isCameraEnabled() const { return _cameraEnabled.load(std::memory_order_acquire); }
        bool isRemoteAudioEnabled() const { return _remoteAudioEnabled.load(std::memory_order_acquire); }
        bool isClosed() const { return _closed.load(std::memory_order_acquire); }

        // EntropyObject interface
        const char* className() const noexcept override { return "PeerSession"; }
        uint64_t classHash() const noexcept override;
        std::string toString() const override;

    private:
        Result<void> ensureTransport();
        MediaTransportCallbacks makeTransportCallbacks();

        void handleLocalDescription(const SessionDescription& description);
        void handleLocalCandidate(const IceCandidate& candidate);
        void handleRemoteTrack(std::shared_ptr<MediaTrack> track);
        void handleStateChanged(ConnectionState state);

        std::shared_ptr<MediaTrack> currentCameraTrack() const;

        const SessionType _type;
        const PeerId _partnerId;
        MediaTransportFactory& _factory;
        MediaTransportConfig _config;
        SignalingSink& _sink;
        Scheduler& _scheduler;

        mutable std::mutex _mutex;
        std::unique_ptr<MediaTransport> _transport;
        std::shared_ptr<MediaStream> _localStream;
        std::shared_ptr<MediaStream> _remoteStream;
        std::optional<std::string> _roomId;
        std::unordered_map<PeerId, std::vector<IceCandidate>> _bufferedCandidates;  ///< Keyed by sender

        RemoteTrackCallback _remoteTrackCallback;
        StateCallback _stateCallback;

        std::atomic<bool> _micEnabled{true};
        std::atomic<bool> _cameraEnabled{true};
        std::atomic<bool> _remoteAudioEnabled{true};
        std::atomic<bool> _closed{false};
    };

} // namespace EntropyEngine::Calling
