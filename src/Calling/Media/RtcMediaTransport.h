/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#pragma once

#include <EntropyCore.h>
#include "MediaTransport.h"

#include <rtc/rtc.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace EntropyEngine::Calling {

    /**
     * @brief libdatachannel peer connection carrying one audio and one video track
     *
     * Negotiation is explicit (auto-negotiation disabled): createOffer() and
     * createAnswer() map to rtcSetLocalDescription. Tracks are sendrecv with
     * fixed mids "audio" and "video", so both sides agree on the m-lines and
     * camera changes only swap the packet source feeding the video track.
     *
     * Local tracks carry ready-made RTP packets from the capture pipeline;
     * remote packets are handed to the remote MediaTrack unchanged.
     */
    class RtcMediaTransport : public Core::EntropyObject, public MediaTransport {
    public:
        /**
         * @brief Creates the native peer connection
         * @throws std::runtime_error if libdatachannel rejects the configuration
         */
        RtcMediaTransport(MediaTransportConfig config, MediaTransportCallbacks callbacks);
        ~RtcMediaTransport() override;

        RtcMediaTransport(const RtcMediaTransport&) = delete;
        RtcMediaTransport& operator=(const RtcMediaTransport&) = delete;

        // MediaTransport interface
        Result<void> addLocalTrack(std::shared_ptr<MediaTrack> track) override;
        Result<void> replaceVideoTrack(std::shared_ptr<MediaTrack> track) override;
        Result<void> createOffer() override;
        Result<void> createAnswer() override;
        Result<void> setRemoteDescription(const SessionDescription& description) override;
        Result<void> addRemoteCandidate(const IceCandidate& candidate) override;
        bool hasRemoteDescription() const override { return _haveRemoteDescription.load(std::memory_order_acquire); }
        ConnectionState getState() const override { return _state.load(std::memory_order_acquire); }
        void close() override;

        /**
         * @brief Outgoing packets libdatachannel refused (track not open yet, or closed)
         */
        uint64_t droppedPackets() const { return _droppedPackets->load(std::memory_order_relaxed); }

        // EntropyObject interface
        const char* className() const noexcept override { return "RtcMediaTransport"; }
        uint64_t classHash() const noexcept override;
        std::string toString() const override;

    private:
        // Passed as void* user pointer to libdatachannel; outlives every callback
        struct CallbackContext {
            RtcMediaTransport* transport;
            std::atomic<bool> valid{true};
            std::atomic<int> activeCallbacks{0};
        };

        struct CallbackGuard {
            CallbackContext* ctx;

            explicit CallbackGuard(CallbackContext* c) : ctx(c) {
                if (ctx) ctx->activeCallbacks.fetch_add(1, std::memory_order_acquire);
            }

            ~CallbackGuard() {
                if (ctx) ctx->activeCallbacks.fetch_sub(1, std::memory_order_release);
            }

            CallbackGuard(const CallbackGuard&) = delete;
            CallbackGuard& operator=(const CallbackGuard&) = delete;

            bool isValid() const {
                return ctx && ctx->valid.load(std::memory_order_acquire);
            }

            RtcMediaTransport* getTransport() const {
                return ctx ? ctx->transport : nullptr;
            }
        };

        struct LocalSlot {
            int trackId = -1;
            std::shared_ptr<MediaTrack> source;
        };

        void setupPeerConnection();
        int addNativeTrack(TrackKind kind);
        void setupTrackCallbacks(int trackId);
        void attachSource(LocalSlot& slot, std::shared_ptr<MediaTrack> source);
        void setState(ConnectionState state);

        static void onLocalDescriptionCallback(int pc, const char* sdp, const char* type, void* user);
        static void onLocalCandidateCallback(int pc, const char* cand, const char* mid, void* user);
        static void onStateChangeCallback(int pc, rtcState state, void* user);
        static void onTrackCallback(int pc, int tr, void* user);
        static void onTrackOpenCallback(int tr, void* user);
        static void onTrackMessageCallback(int tr, const char* message, int size, void* user);

        CallbackContext* _callbackContext;

        MediaTransportConfig _config;
        MediaTransportCallbacks _callbacks;

        mutable std::mutex _mutex;
        int _peerConnectionId = -1;
        LocalSlot _audio;
        LocalSlot _video;
        std::vector<int> _remoteAnnouncedTracks;                           ///< Tracks created by remote offers
        std::unordered_map<int, std::shared_ptr<MediaTrack>> _remoteTracks;  ///< Keyed by native track id
        std::vector<IceCandidate> _pendingRemoteCandidates;

        std::atomic<bool> _haveRemoteDescription{false};
        std::atomic<ConnectionState> _state{ConnectionState::Disconnected};
        std::atomic<bool> _closed{false};
        std::shared_ptr<std::atomic<uint64_t>> _droppedPackets = std::make_shared<std::atomic<uint64_t>>(0);
    };

    /**
     * @brief Factory producing RtcMediaTransport instances
     */
    class RtcMediaTransportFactory : public MediaTransportFactory {
    public:
        std::unique_ptr<MediaTransport> create(const MediaTransportConfig& config,
                                               MediaTransportCallbacks callbacks) override;
    };

} // namespace EntropyEngine::Calling
