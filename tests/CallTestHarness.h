/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/*
 * Wires a CallSessionManager to fake transports on a virtual clock. The
 * local user is "me"; helpers drive the relay side of common call flows.
 */
#pragma once

#include <gtest/gtest.h>
#include "../src/Calling/Session/CallSessionManager.h"
#include "../src/Calling/Core/KeyValueStore.h"
#include "FakeMediaTransport.h"
#include "FakeSignalingTransport.h"
#include "ManualScheduler.h"

#include <memory>
#include <string>
#include <vector>

namespace EntropyEngine::Calling::Tests {

class RecordingObserver : public CallObserver {
public:
    struct Failure {
        CallError error;
        std::string message;
    };

    void onCallStateChanged(const CallRecord& record) override { states.push_back(record.state); }
    void onIncomingCall(const CallRecord& record) override { incoming.push_back(record); }
    void onCallFailed(const CallRecord&, CallError error, const std::string& message) override {
        failures.push_back({error, message});
    }
    void onRemoteDisconnected(const CallRecord&) override { ++remoteDisconnects; }
    void onRemoteTrack(SessionType, std::shared_ptr<MediaTrack> track) override { remoteTracks.push_back(track); }
    void onRemoteCameraChanged(bool enabled) override { cameraChanges.push_back(enabled); }
    void onPartnerPipChanged(bool inPiP) override { pipChanges.push_back(inPiP); }
    void onMatchStateChanged(MatchState state, const std::optional<PeerId>& partner) override {
        matchStates.push_back(state);
        lastMatchPartner = partner;
    }

    std::vector<CallState> states;
    std::vector<CallRecord> incoming;
    std::vector<Failure> failures;
    int remoteDisconnects = 0;
    std::vector<std::shared_ptr<MediaTrack>> remoteTracks;
    std::vector<bool> cameraChanges;
    std::vector<bool> pipChanges;
    std::vector<MatchState> matchStates;
    std::optional<PeerId> lastMatchPartner;
};

class CallHarness : public ::testing::Test {
protected:
    void SetUp() override {
        createManager();
        ASSERT_TRUE(channel.connect().success());
        clock.runPending();
    }

    void TearDown() override {
        manager.reset();
    }

    void createManager(CallConfig config = {}) {
        manager.reset();
        manager = std::make_unique<CallSessionManager>(channel, identity, ledger, factory, capture, clock, &registry,
                                                       config);
        manager->setObserver(&observer);
    }

    void authenticate() {
        identity.attach("install-1", {}, nullptr);
        transport.injectAck(transport.lastRequestId<IdentityAttach>(), Ack{true, {}, std::string("me"), {}});
        clock.runPending();
        ASSERT_TRUE(identity.isAuthenticated());
    }

    // Drop and restore the relay link; leaves identity Reauthenticating
    void reconnect() {
        transport.simulateDrop();
        clock.runPending();
        transport.simulateConnected();
        clock.runPending();
        ASSERT_EQ(identity.state(), AuthState::Reauthenticating);
    }

    void ackReauth(bool ok) {
        Ack ack;
        ack.ok = ok;
        if (!ok) ack.error = std::string("reauth_rejected");
        transport.injectAck(transport.lastRequestId<Reauth>(), ack);
        clock.runPending();
    }

    void relay(const SignalEvent& event) {
        transport.inject(event);
        clock.runPending();
    }

    // Outgoing call up to RingingOut
    void dial(const PeerId& peer, const CallId& callId) {
        ASSERT_TRUE(manager->initiateCall(peer).success());
        ASSERT_EQ(manager->state(), CallState::Dialing);
        transport.injectAck(transport.lastRequestId<CallInitiate>(), Ack{true, callId, {}, {}});
        clock.runPending();
        ASSERT_EQ(manager->state(), CallState::RingingOut);
    }

    // Outgoing call up to Active
    void dialToActive(const PeerId& peer, const CallId& callId, const std::string& roomId) {
        dial(peer, callId);
        relay(CallAccepted{callId, peer, roomId});
        ASSERT_EQ(manager->state(), CallState::Negotiating);
        relay(SdpAnswer{peer, "v=0 answer", roomId});
        ASSERT_EQ(manager->state(), CallState::Active);
    }

    // Incoming call up to Active
    void answerToActive(const PeerId& peer, const CallId& callId, const std::string& roomId) {
        relay(CallIncoming{callId, peer, std::nullopt});
        ASSERT_EQ(manager->state(), CallState::RingingIn);
        ASSERT_TRUE(manager->acceptCall().success());
        relay(SdpOffer{peer, "v=0 offer", roomId});
        ASSERT_EQ(manager->state(), CallState::Active);
    }

    FakeSignalingTransport transport;
    ManualScheduler clock;
    InMemoryKeyValueStore store;
    SignalingChannel channel{transport, clock};
    IdentityReattachment identity{channel, store};
    MissedCallLedger ledger{store, clock};
    FakeMediaTransportFactory factory;
    FakeMediaCapture capture;
    CallControlRegistry registry;
    RecordingObserver observer;
    std::unique_ptr<CallSessionManager> manager;
};

} // namespace EntropyEngine::Calling::Tests
