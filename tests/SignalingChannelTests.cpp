/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include <gtest/gtest.h>
#include "../src/Calling/Signaling/SignalingChannel.h"
#include "FakeSignalingTransport.h"
#include "ManualScheduler.h"
#include "../src/Calling/Core/EventLoop.h"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace EntropyEngine::Calling;
using namespace EntropyEngine::Calling::Tests;
using namespace std::chrono_literals;

namespace {

class SignalingChannelTest : public ::testing::Test {
protected:
    void connectChannel() {
        ASSERT_TRUE(channel.connect().success());
        clock.runPending();
        ASSERT_TRUE(channel.isConnected());
    }

    FakeSignalingTransport transport;
    ManualScheduler clock;
    SignalingChannel channel{transport, clock};
    std::vector<Result<Ack>> results;

    SignalingChannel::AckCallback record() {
        return [this](Result<Ack> r) { results.push_back(std::move(r)); };
    }
};

} // namespace

TEST_F(SignalingChannelTest, DispatchesEventsToTypedHandlers) {
    connectChannel();

    std::vector<CallId> incoming;
    int cancels = 0;
    channel.on<CallIncoming>([&](const CallIncoming& e) { incoming.push_back(e.callId); });
    channel.on<CallCancel>([&](const CallCancel&) { ++cancels; });

    transport.inject(CallIncoming{"call-1", "alice", std::string("Alice")});
    EXPECT_TRUE(incoming.empty()) << "delivery is marshalled onto the scheduler";
    clock.runPending();

    ASSERT_EQ(incoming.size(), 1u);
    EXPECT_EQ(incoming[0], "call-1");
    EXPECT_EQ(cancels, 0);
}

TEST_F(SignalingChannelTest, OffRemovesHandler) {
    connectChannel();

    int calls = 0;
    auto first = channel.on<CallEnded>([&](const CallEnded&) { ++calls; });
    channel.on<CallEnded>([&](const CallEnded&) { ++calls; });
    EXPECT_EQ(channel.listenerCount<CallEnded>(), 2u);

    EXPECT_TRUE(channel.off(first));
    EXPECT_FALSE(channel.off(first));
    EXPECT_EQ(channel.listenerCount<CallEnded>(), 1u);

    transport.inject(CallEnded{"call-1", "room-1"});
    clock.runPending();
    EXPECT_EQ(calls, 1);
}

TEST_F(SignalingChannelTest, MalformedFrameIsDropped) {
    connectChannel();

    int calls = 0;
    channel.on<CallTimeout>([&](const CallTimeout&) { ++calls; });

    transport.injectRaw({0x01, 0x02, 0x03});
    transport.inject(CallTimeout{"call-1"});
    clock.runPending();
    EXPECT_EQ(calls, 1);
}

TEST_F(SignalingChannelTest, AckResolvesRequestExactlyOnce) {
    connectChannel();

    channel.request(CallInitiate{"bob"}, {5000ms, 2}, record());
    ASSERT_EQ(transport.sentCount<CallInitiate>(), 1u);

    transport.injectAck(transport.lastRequestId<CallInitiate>(), Ack{true, std::string("call-1"), {}, {}});
    clock.runPending();

    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].success());
    EXPECT_TRUE(results[0].value.ok);
    EXPECT_EQ(results[0].value.callId, std::optional<CallId>("call-1"));

    // The attempt timer was cancelled with the ack
    clock.advance(30s);
    EXPECT_EQ(results.size(), 1u);
    EXPECT_EQ(transport.sentCount<CallInitiate>(), 1u);
    EXPECT_EQ(channel.pendingRequestCount(), 0u);
}

TEST_F(SignalingChannelTest, RejectedAckIsStillDelivered) {
    connectChannel();

    channel.request(CallInitiate{"bob"}, record());
    transport.injectAck(transport.lastRequestId<CallInitiate>(), Ack{false, {}, {}, std::string("user_offline")});
    clock.runPending();

    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].success());
    EXPECT_FALSE(results[0].value.ok);
    EXPECT_EQ(results[0].value.error, std::optional<std::string>("user_offline"));
}

TEST_F(SignalingChannelTest, RetriesThenFailsWithAckTimeout) {
    connectChannel();

    channel.request(Reauth{"u-1"}, {1000ms, 2}, record());
    EXPECT_EQ(transport.sentCount<Reauth>(), 1u);

    clock.advance(1000ms);
    clock.advance(600ms);   // past the longest jittered backoff
    EXPECT_EQ(transport.sentCount<Reauth>(), 2u);

    clock.advance(1000ms);
    clock.advance(600ms);
    EXPECT_EQ(transport.sentCount<Reauth>(), 3u);
    EXPECT_TRUE(results.empty());

    clock.advance(1000ms);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error, CallError::AckTimeout);

    clock.advance(10s);
    EXPECT_EQ(transport.sentCount<Reauth>(), 3u);
    EXPECT_EQ(results.size(), 1u);
}

TEST_F(SignalingChannelTest, AckForTimedOutAttemptIsIgnored) {
    connectChannel();

    channel.request(Reauth{"u-1"}, {1000ms, 1}, record());
    uint64_t firstAttempt = transport.lastRequestId<Reauth>();

    clock.advance(1000ms);
    transport.injectAck(firstAttempt, Ack{true, {}, std::string("u-1"), {}});
    clock.runPending();
    EXPECT_TRUE(results.empty());

    clock.advance(600ms);
    ASSERT_EQ(transport.sentCount<Reauth>(), 2u);
    uint64_t secondAttempt = transport.lastRequestId<Reauth>();
    EXPECT_NE(firstAttempt, secondAttempt);

    transport.injectAck(secondAttempt, Ack{true, {}, std::string("u-1"), {}});
    clock.runPending();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].success());
}

TEST_F(SignalingChannelTest, ZeroRetriesSendsOnce) {
    connectChannel();

    channel.request(CallInitiate{"bob"}, {2000ms, 0}, record());
    clock.advance(2000ms);
    clock.advance(5s);

    EXPECT_EQ(transport.sentCount<CallInitiate>(), 1u);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error, CallError::AckTimeout);
}

TEST_F(SignalingChannelTest, OfflineAfterConnectWait) {
    transport.autoConnect = false;

    channel.request(CallInitiate{"bob"}, record());
    clock.runPending();
    EXPECT_EQ(transport.connectCalls, 1);

    clock.advance(6999ms);
    EXPECT_TRUE(results.empty());

    clock.advance(1ms);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error, CallError::Offline);
    EXPECT_EQ(transport.sentCount<CallInitiate>(), 0u);
}

TEST_F(SignalingChannelTest, RequestWaitsForLateConnect) {
    transport.autoConnect = false;

    channel.request(CallInitiate{"bob"}, record());
    clock.advance(3s);
    EXPECT_EQ(transport.sentCount<CallInitiate>(), 0u);

    transport.simulateConnected();
    clock.runPending();
    EXPECT_EQ(transport.sentCount<CallInitiate>(), 1u);

    transport.injectAck(transport.lastRequestId<CallInitiate>(), Ack{true, std::string("call-1"), {}, {}});
    clock.advance(10s);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].success());
}

TEST_F(SignalingChannelTest, FailedLinkResolvesWaitersImmediately) {
    transport.autoConnect = false;

    channel.request(CallInitiate{"bob"}, record());
    clock.runPending();

    transport.simulateFailed();
    clock.runPending();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error, CallError::Offline);
}

TEST_F(SignalingChannelTest, RequestDuringReconnectWaitsForLink) {
    connectChannel();

    transport.simulateDrop();
    clock.runPending();
    EXPECT_FALSE(channel.isConnected());
    EXPECT_TRUE(channel.isReconnecting());

    channel.request(Reauth{"u-1"}, record());
    clock.runPending();
    EXPECT_EQ(transport.sentCount<Reauth>(), 0u);

    transport.simulateConnected();
    clock.runPending();
    EXPECT_FALSE(channel.isReconnecting());
    EXPECT_EQ(transport.sentCount<Reauth>(), 1u);
}

TEST_F(SignalingChannelTest, QueuedEventsFlushOnConnect) {
    transport.autoConnect = false;

    ASSERT_TRUE(channel.send(PresenceUpdate{"online", std::nullopt}).success());
    ASSERT_TRUE(channel.send(MatchStop{}).success());
    EXPECT_TRUE(transport.sent().empty());

    transport.simulateConnected();
    clock.runPending();

    ASSERT_EQ(transport.sent().size(), 2u);
    EXPECT_EQ(transport.sentCount<PresenceUpdate>(), 1u);
    EXPECT_EQ(transport.sentCount<MatchStop>(), 1u);
    EXPECT_EQ(transport.sent()[0].requestId, 0u);
}

TEST_F(SignalingChannelTest, OutboxDropsOldestWhenFull) {
    transport.autoConnect = false;

    for (size_t i = 0; i < SignalingChannel::MAX_OUTBOX + 3; ++i) {
        ASSERT_TRUE(channel.send(Reauth{"u-" + std::to_string(i)}).success());
    }

    transport.simulateConnected();
    clock.runPending();

    ASSERT_EQ(transport.sent().size(), SignalingChannel::MAX_OUTBOX);
    const auto& first = std::get<Reauth>(std::get<SignalEvent>(transport.sent().front().body));
    EXPECT_EQ(first.userId, "u-3");
}

TEST_F(SignalingChannelTest, FailedSendsShareTheOutboxBound) {
    connectChannel();
    transport.failSends = true;

    for (size_t i = 0; i < SignalingChannel::MAX_OUTBOX + 5; ++i) {
        ASSERT_TRUE(channel.send(Reauth{"u-" + std::to_string(i)}).success());
    }
    EXPECT_TRUE(transport.sent().empty());

    transport.failSends = false;
    transport.simulateDrop();
    clock.runPending();
    transport.simulateConnected();
    clock.runPending();

    ASSERT_EQ(transport.sent().size(), SignalingChannel::MAX_OUTBOX);
    const auto& first = std::get<Reauth>(std::get<SignalEvent>(transport.sent().front().body));
    EXPECT_EQ(first.userId, "u-5");
}

TEST_F(SignalingChannelTest, ConnectionCallbacksFollowLinkState) {
    int connects = 0;
    int disconnects = 0;
    channel.onConnect([&]() { ++connects; });
    auto dropSub = channel.onDisconnect([&]() { ++disconnects; });

    connectChannel();
    EXPECT_EQ(connects, 1);

    transport.simulateDrop();
    clock.runPending();
    EXPECT_EQ(disconnects, 1);

    transport.simulateConnected();
    clock.runPending();
    EXPECT_EQ(connects, 2);

    EXPECT_TRUE(channel.off(dropSub));
    transport.simulateDrop();
    clock.runPending();
    EXPECT_EQ(disconnects, 1);
}

TEST_F(SignalingChannelTest, DestroyedChannelIgnoresLateTransportCallbacks) {
    ManualScheduler localClock;
    FakeSignalingTransport localTransport;
    int calls = 0;
    {
        SignalingChannel local(localTransport, localClock);
        ASSERT_TRUE(local.connect().success());
        local.on<CallTimeout>([&](const CallTimeout&) { ++calls; });
        localClock.runPending();
        localTransport.inject(CallTimeout{"call-1"});
    }

    localClock.runPending();
    EXPECT_EQ(calls, 0);
}

TEST(SignalingChannelThreadTests, TransportThreadOutlivesChannels) {
    EventLoop loop;
    loop.start();
    FakeSignalingTransport transport;
    std::atomic<int> handled{0};

    std::atomic<bool> stop{false};
    std::thread relay([&]() {
        while (!stop.load()) {
            transport.inject(CallTimeout{"call-1"});
        }
    });

    // Channels live and die on the loop while frames keep arriving from another thread
    for (int i = 0; i < 200; ++i) {
        std::promise<void> done;
        loop.post([&]() {
            SignalingChannel channel(transport, loop);
            channel.on<CallTimeout>([&](const CallTimeout&) { ++handled; });
            done.set_value();
        });
        done.get_future().wait();
    }

    stop = true;
    relay.join();

    std::promise<void> drained;
    loop.post([&]() { drained.set_value(); });
    ASSERT_EQ(drained.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(handled.load(), 0);
    loop.stop();
}
