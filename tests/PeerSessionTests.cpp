/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include <gtest/gtest.h>
#include "../src/Calling/Media/PeerSession.h"
#include "FakeMediaTransport.h"
#include "ManualScheduler.h"

#include <vector>

using namespace EntropyEngine::Calling;
using namespace EntropyEngine::Calling::Tests;

namespace {

struct RecordingSink : SignalingSink {
    struct Description { PeerId to; SessionDescription description; std::optional<std::string> roomId; };
    struct Candidate { PeerId to; IceCandidate candidate; std::optional<std::string> roomId; };
    struct Camera { std::string roomId; bool enabled; };

    void sendLocalDescription(const PeerId& to, const SessionDescription& description,
                              const std::optional<std::string>& roomId) override {
        descriptions.push_back({to, description, roomId});
    }
    void sendLocalCandidate(const PeerId& to, const IceCandidate& candidate,
                            const std::optional<std::string>& roomId) override {
        candidates.push_back({to, candidate, roomId});
    }
    void sendCameraState(const std::string& roomId, bool enabled) override {
        cameras.push_back({roomId, enabled});
    }

    std::vector<Description> descriptions;
    std::vector<Candidate> candidates;
    std::vector<Camera> cameras;
};

class PeerSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        session = std::make_shared<PeerSession>(SessionType::Direct, "alice", factory, MediaTransportConfig{}, sink,
                                                clock);
        auto stream = capture.openLocalStream(true);
        ASSERT_TRUE(stream.success());
        ASSERT_TRUE(session->attachLocalStream(stream.value).success());
    }

    FakeMediaTransport& transport() {
        EXPECT_NE(factory.last, nullptr);
        return *factory.last;
    }

    ManualScheduler clock;
    FakeMediaTransportFactory factory;
    FakeMediaCapture capture;
    RecordingSink sink;
    std::shared_ptr<PeerSession> session;
};

} // namespace

TEST_F(PeerSessionTest, TransportIsCreatedLazily) {
    EXPECT_EQ(factory.created, 0);
    EXPECT_EQ(session->transport(), nullptr);

    ASSERT_TRUE(session->createOffer().success());
    EXPECT_EQ(factory.created, 1);
    EXPECT_EQ(transport().localTracks.size(), 2u);

    ASSERT_TRUE(session->createOffer().success());
    EXPECT_EQ(factory.created, 1);
}

TEST_F(PeerSessionTest, LocalDescriptionIsPostedToSink) {
    session->setRoomId("room-1");
    ASSERT_TRUE(session->createOffer().success());
    EXPECT_TRUE(sink.descriptions.empty());

    clock.runPending();
    ASSERT_EQ(sink.descriptions.size(), 1u);
    EXPECT_EQ(sink.descriptions[0].to, "alice");
    EXPECT_EQ(sink.descriptions[0].description.type, "offer");
    EXPECT_EQ(sink.descriptions[0].roomId, std::optional<std::string>("room-1"));
}

TEST_F(PeerSessionTest, LocalCandidatesAreForwardedToPartner) {
    ASSERT_TRUE(session->createOffer().success());
    transport().emitCandidate("candidate:1");
    clock.runPending();

    ASSERT_EQ(sink.candidates.size(), 1u);
    EXPECT_EQ(sink.candidates[0].to, "alice");
    EXPECT_EQ(sink.candidates[0].candidate.candidate, "candidate:1");
}

TEST_F(PeerSessionTest, EarlyCandidatesAreBufferedAndFlushed) {
    ASSERT_TRUE(session->addRemoteIceCandidate("alice", IceCandidate{"candidate:a", "audio"}).success());
    ASSERT_TRUE(session->addRemoteIceCandidate("alice", IceCandidate{"candidate:b", "video"}).success());
    ASSERT_TRUE(session->addRemoteIceCandidate("mallory", IceCandidate{"candidate:m", "audio"}).success());
    EXPECT_EQ(session->bufferedCandidateCount(), 3u);

    ASSERT_TRUE(session->setRemoteDescription(SessionDescription{"offer", "v=0 remote"}).success());

    // Only the partner's bucket is flushed
    EXPECT_EQ(session->bufferedCandidateCount(), 1u);
    ASSERT_EQ(transport().appliedCandidates.size(), 2u);
    EXPECT_EQ(transport().appliedCandidates[0].candidate, "candidate:a");
    EXPECT_EQ(transport().appliedCandidates[1].candidate, "candidate:b");

    ASSERT_TRUE(session->addRemoteIceCandidate("alice", IceCandidate{"candidate:c", "audio"}).success());
    EXPECT_EQ(transport().appliedCandidates.size(), 3u);
}

TEST_F(PeerSessionTest, EmptyCandidateIsRejected) {
    auto result = session->addRemoteIceCandidate("alice", IceCandidate{"", "audio"});
    EXPECT_EQ(result.error, CallError::InvalidParameter);
}

TEST_F(PeerSessionTest, AnswerRequiresRemoteOffer) {
    auto early = session->createAnswer();
    EXPECT_EQ(early.error, CallError::InvalidState);

    ASSERT_TRUE(session->setRemoteDescription(SessionDescription{"offer", "v=0 remote"}).success());
    ASSERT_TRUE(session->createAnswer().success());
    EXPECT_EQ(transport().answersCreated, 1);
}

TEST_F(PeerSessionTest, CameraToggleKeepsTransportAndNotifiesPartner) {
    session->setRoomId("room-1");
    ASSERT_TRUE(session->createOffer().success());
    clock.runPending();
    MediaTransport* original = session->transport();
    int offers = transport().offersCreated;

    auto off = session->toggleCamera();
    ASSERT_TRUE(off.success());
    EXPECT_FALSE(off.value);
    EXPECT_FALSE(session->isCameraEnabled());
    EXPECT_EQ(transport().videoSource, nullptr);

    auto on = session->toggleCamera();
    ASSERT_TRUE(on.success());
    EXPECT_TRUE(on.value);
    ASSERT_NE(transport().videoSource, nullptr);
    EXPECT_EQ(transport().videoSource->id(), "front-camera");

    EXPECT_EQ(session->transport(), original);
    EXPECT_EQ(transport().offersCreated, offers);
    EXPECT_EQ(transport().replaceVideoCalls, 2);
    EXPECT_EQ(factory.created, 1);

    ASSERT_EQ(sink.cameras.size(), 2u);
    EXPECT_EQ(sink.cameras[0].roomId, "room-1");
    EXPECT_FALSE(sink.cameras[0].enabled);
    EXPECT_TRUE(sink.cameras[1].enabled);
}

TEST_F(PeerSessionTest, CameraOffBeforeNegotiationSkipsVideoTrack) {
    ASSERT_TRUE(session->setCameraEnabled(false).success());
    EXPECT_TRUE(sink.cameras.empty()) << "no room yet, nothing to notify";

    ASSERT_TRUE(session->createOffer().success());
    EXPECT_EQ(transport().localTracks.size(), 1u);
    EXPECT_EQ(transport().videoSource, nullptr);
}

TEST_F(PeerSessionTest, AudioOnlySessionCannotToggleCamera) {
    auto audioOnly = std::make_shared<PeerSession>(SessionType::Direct, "bob", factory, MediaTransportConfig{}, sink,
                                                   clock);
    auto stream = capture.openLocalStream(false);
    ASSERT_TRUE(stream.success());
    ASSERT_TRUE(audioOnly->attachLocalStream(stream.value).success());

    EXPECT_FALSE(audioOnly->isCameraEnabled());
    EXPECT_EQ(audioOnly->toggleCamera().error, CallError::InvalidState);
}

TEST_F(PeerSessionTest, MicToggleFlipsAudioTracks) {
    EXPECT_FALSE(session->toggleMic());
    EXPECT_FALSE(session->isMicEnabled());
    for (const auto& track : session->localStream()->audioTracks()) {
        EXPECT_FALSE(track->enabled());
    }

    EXPECT_TRUE(session->toggleMic());
    EXPECT_TRUE(session->localStream()->audioTracks().front()->enabled());
}

TEST_F(PeerSessionTest, RemoteTracksJoinRemoteStream) {
    std::vector<std::string> seen;
    session->onRemoteTrack([&](std::shared_ptr<MediaTrack> track) { seen.push_back(track->id()); });

    ASSERT_TRUE(session->createOffer().success());
    EXPECT_FALSE(session->toggleRemoteAudio());

    transport().emitRemoteTrack(std::make_shared<MediaTrack>("remote-1", TrackKind::Audio));
    clock.runPending();

    ASSERT_EQ(seen.size(), 1u);
    auto remoteAudio = session->remoteStream()->audioTracks();
    ASSERT_EQ(remoteAudio.size(), 1u);
    EXPECT_FALSE(remoteAudio.front()->enabled()) << "remote audio muted before the track arrived";

    EXPECT_TRUE(session->toggleRemoteAudio());
    EXPECT_TRUE(remoteAudio.front()->enabled());
}

TEST_F(PeerSessionTest, FlipCameraSwapsOutgoingSource) {
    ASSERT_TRUE(session->createOffer().success());
    auto previous = session->localStream()->videoTracks().front();
    auto rear = std::make_shared<MediaTrack>("rear-camera", TrackKind::Video);

    ASSERT_TRUE(session->flipCamera(rear).success());
    EXPECT_EQ(transport().videoSource, rear);
    EXPECT_EQ(session->localStream()->videoTracks().front(), rear);
    EXPECT_FALSE(previous->isLive());

    auto notVideo = std::make_shared<MediaTrack>("mic-2", TrackKind::Audio);
    EXPECT_EQ(session->flipCamera(notVideo).error, CallError::InvalidParameter);
}

TEST_F(PeerSessionTest, StateChangesReachObserver) {
    std::vector<ConnectionState> states;
    session->onStateChanged([&](ConnectionState s) { states.push_back(s); });

    ASSERT_TRUE(session->createOffer().success());
    transport().emitState(ConnectionState::Connected);
    clock.runPending();

    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0], ConnectionState::Connected);
}

TEST_F(PeerSessionTest, CleanupIsIdempotent) {
    ASSERT_TRUE(session->createOffer().success());
    auto local = session->localStream();

    session->cleanup();
    EXPECT_TRUE(session->isClosed());
    EXPECT_EQ(session->transport(), nullptr);
    for (const auto& track : local->tracks()) {
        EXPECT_FALSE(track->isLive());
    }

    session->cleanup();
    EXPECT_TRUE(session->isClosed());
    EXPECT_EQ(session->createOffer().error, CallError::InvalidState);
    EXPECT_EQ(session->addRemoteIceCandidate("alice", IceCandidate{"candidate:x", "audio"}).error,
              CallError::InvalidState);
}

TEST_F(PeerSessionTest, LateTransportCallbacksAfterCleanupAreDropped) {
    session->setRoomId("room-1");
    ASSERT_TRUE(session->createOffer().success());
    session->cleanup();

    // The offer's description was posted before cleanup
    clock.runPending();
    EXPECT_TRUE(sink.descriptions.empty());
}

TEST_F(PeerSessionTest, FailedTransportCreationIsReported) {
    factory.failCreate = true;
    auto result = session->createOffer();
    EXPECT_EQ(result.error, CallError::TransportFailed);
    EXPECT_EQ(session->transport(), nullptr);
}
