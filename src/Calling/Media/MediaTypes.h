/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file MediaTypes.h
 * @brief Tracks, streams and negotiation payloads
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace EntropyEngine::Calling {

enum class TrackKind {
    Audio,
    Video
};

/**
 * @brief One audio or video source or sink
 *
 * Capture code pushes RTP packets with deliverFrame(); whoever consumes the
 * track (a transport for local tracks, a renderer for remote ones) installs a
 * frame sink. Disabled or stopped tracks drop packets, which is how mute and
 * camera-off are realised without renegotiation.
 *
 * Thread Safety: All methods are thread-safe.
 */
class MediaTrack {
public:
    using FrameSink = std::function<void(const std::vector<std::byte>& frame, uint64_t timestampMicros)>;

    MediaTrack(std::string id, TrackKind kind)
        : _id(std::move(id)), _kind(kind) {}

    const std::string& id() const { return _id; }
    TrackKind kind() const { return _kind; }

    bool enabled() const { return _enabled.load(std::memory_order_acquire); }
    void setEnabled(bool enabled) { _enabled.store(enabled, std::memory_order_release); }

    bool isLive() const { return !_ended.load(std::memory_order_acquire); }

    /**
     * @brief Ends the track; frames are dropped from now on
     */
    void stop() {
        _ended.store(true, std::memory_order_release);
        setFrameSink(nullptr);
    }

    void setFrameSink(FrameSink sink) {
        std::lock_guard<std::mutex> lock(_sinkMutex);
        _sink = std::move(sink);
    }

    /**
     * @brief Hands one RTP packet to the current sink
     * @return true if a sink consumed the packet
     */
    bool deliverFrame(const std::vector<std::byte>& frame, uint64_t timestampMicros) {
        if (!enabled() || !isLive()) {
            return false;
        }
        FrameSink sink;
        {
            std::lock_guard<std::mutex> lock(_sinkMutex);
            sink = _sink;
        }
        if (!sink) {
            return false;
        }
        sink(frame, timestampMicros);
        return true;
    }

private:
    std::string _id;
    TrackKind _kind;
    std::atomic<bool> _enabled{true};
    std::atomic<bool> _ended{false};
    std::mutex _sinkMutex;
    FrameSink _sink;
};

/**
 * @brief Ordered set of tracks belonging to one participant
 */
class MediaStream {
public:
    explicit MediaStream(std::string id) : _id(std::move(id)) {}

    const std::string& id() const { return _id; }

    void addTrack(std::shared_ptr<MediaTrack> track) {
        std::lock_guard<std::mutex> lock(_mutex);
        _tracks.push_back(std::move(track));
    }

    std::vector<std::shared_ptr<MediaTrack>> tracks() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _tracks;
    }

    std::vector<std::shared_ptr<MediaTrack>> audioTracks() const { return tracksOfKind(TrackKind::Audio); }
    std::vector<std::shared_ptr<MediaTrack>> videoTracks() const { return tracksOfKind(TrackKind::Video); }

    /**
     * @brief Replaces the first video track, or adds one if there is none
     */
    void replaceVideoTrack(std::shared_ptr<MediaTrack> track) {
        std::lock_guard<std::mutex> lock(_mutex);
        for (auto& existing : _tracks) {
            if (existing && existing->kind() == TrackKind::Video) {
                existing = std::move(track);
                return;
            }
        }
        _tracks.push_back(std::move(track));
    }

    void stopAll() {
        for (const auto& track : tracks()) {
            if (track) track->stop();
        }
    }

private:
    std::vector<std::shared_ptr<MediaTrack>> tracksOfKind(TrackKind kind) const {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<std::shared_ptr<MediaTrack>> result;
        for (const auto& track : _tracks) {
            if (track && track->kind() == kind) {
                result.push_back(track);
            }
        }
        return result;
    }

    std::string _id;
    mutable std::mutex _mutex;
    std::vector<std::shared_ptr<MediaTrack>> _tracks;
};

/**
 * @brief SDP blob with its type ("offer" or "answer")
 */
struct SessionDescription {
    std::string type;
    std::string sdp;
};

/**
 * @brief ICE candidate with its media id
 */
struct IceCandidate {
    std::string candidate;
    std::string mid;
};

} // namespace EntropyEngine::Calling
