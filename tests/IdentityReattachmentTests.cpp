/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include <gtest/gtest.h>
#include "../src/Calling/Signaling/IdentityReattachment.h"
#include "../src/Calling/Core/KeyValueStore.h"
#include "FakeSignalingTransport.h"
#include "ManualScheduler.h"

#include <chrono>
#include <vector>

using namespace EntropyEngine::Calling;
using namespace EntropyEngine::Calling::Tests;
using namespace std::chrono_literals;

namespace {

class IdentityReattachmentTest : public ::testing::Test {
protected:
    void connect() {
        ASSERT_TRUE(channel.connect().success());
        clock.runPending();
    }

    void ackAttach(Ack ack) {
        transport.injectAck(transport.lastRequestId<IdentityAttach>(), ack);
        clock.runPending();
    }

    void ackReauth(Ack ack) {
        transport.injectAck(transport.lastRequestId<Reauth>(), ack);
        clock.runPending();
    }

    FakeSignalingTransport transport;
    ManualScheduler clock;
    InMemoryKeyValueStore store;
    SignalingChannel channel{transport, clock};
    IdentityReattachment identity{channel, store};
};

} // namespace

TEST_F(IdentityReattachmentTest, ConcurrentAttachSharesOneRequest) {
    connect();

    std::vector<Result<std::string>> results;
    for (int i = 0; i < 3; ++i) {
        identity.attach("install-1", {std::string("Nick"), std::nullopt},
                        [&](Result<std::string> r) { results.push_back(std::move(r)); });
    }

    EXPECT_EQ(transport.sentCount<IdentityAttach>(), 1u);
    EXPECT_EQ(identity.attachRequestsSent(), 1u);

    auto sent = transport.lastSent<IdentityAttach>();
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(sent->installId, "install-1");
    EXPECT_EQ(sent->nick, std::optional<std::string>("Nick"));

    ackAttach(Ack{true, {}, std::string("u-42"), {}});

    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) {
        ASSERT_TRUE(r.success());
        EXPECT_EQ(r.value, "u-42");
    }
    EXPECT_TRUE(identity.isAuthenticated());
    EXPECT_EQ(identity.knownUserId(), std::optional<std::string>("u-42"));
    EXPECT_EQ(store.getItem(IdentityReattachment::USER_ID_KEY), std::optional<std::string>("u-42"));
}

TEST_F(IdentityReattachmentTest, AttachAfterCompletionSendsNewRequest) {
    connect();

    identity.attach("install-1", {}, nullptr);
    ackAttach(Ack{true, {}, std::string("u-42"), {}});

    identity.attach("install-1", {}, nullptr);
    EXPECT_EQ(transport.sentCount<IdentityAttach>(), 2u);
}

TEST_F(IdentityReattachmentTest, RejectionReportsRelayErrorVerbatim) {
    connect();

    Result<std::string> result = Result<std::string>::ok("");
    identity.attach("install-1", {}, [&](Result<std::string> r) { result = std::move(r); });
    ackAttach(Ack{false, {}, {}, std::string("banned_install")});

    EXPECT_EQ(result.error, CallError::NotAuthenticated);
    EXPECT_EQ(result.errorMessage, "banned_install");
    EXPECT_FALSE(identity.isAuthenticated());
    EXPECT_FALSE(identity.knownUserId().has_value());
}

TEST_F(IdentityReattachmentTest, EmptyInstallIdIsRejected) {
    Result<std::string> result = Result<std::string>::ok("");
    identity.attach("", {}, [&](Result<std::string> r) { result = std::move(r); });

    EXPECT_EQ(result.error, CallError::InvalidParameter);
    EXPECT_EQ(transport.sentCount<IdentityAttach>(), 0u);
}

TEST_F(IdentityReattachmentTest, ReconnectTriggersReauth) {
    connect();
    identity.attach("install-1", {}, nullptr);
    ackAttach(Ack{true, {}, std::string("u-42"), {}});

    std::vector<AuthState> states;
    identity.setStateCallback([&](AuthState s) { states.push_back(s); });

    transport.simulateDrop();
    clock.runPending();
    EXPECT_EQ(identity.state(), AuthState::Unauthenticated);

    transport.simulateConnected();
    clock.runPending();
    EXPECT_EQ(identity.state(), AuthState::Reauthenticating);

    auto reauth = transport.lastSent<Reauth>();
    ASSERT_TRUE(reauth.has_value());
    EXPECT_EQ(reauth->userId, "u-42");
    EXPECT_EQ(transport.sentCount<IdentityAttach>(), 1u);

    ackReauth(Ack{true, {}, {}, {}});
    EXPECT_TRUE(identity.isAuthenticated());

    std::vector<AuthState> expected{AuthState::Unauthenticated, AuthState::Reauthenticating,
                                    AuthState::Authenticated};
    EXPECT_EQ(states, expected);
}

TEST_F(IdentityReattachmentTest, StoredIdentityReauthsOnFirstConnect) {
    ASSERT_TRUE(store.setItem(IdentityReattachment::USER_ID_KEY, "u-7").success());

    connect();
    EXPECT_EQ(identity.state(), AuthState::Reauthenticating);
    ASSERT_EQ(transport.sentCount<Reauth>(), 1u);

    ackReauth(Ack{true, {}, {}, {}});
    EXPECT_TRUE(identity.isAuthenticated());
}

TEST_F(IdentityReattachmentTest, RejectedReauthFails) {
    ASSERT_TRUE(store.setItem(IdentityReattachment::USER_ID_KEY, "u-7").success());

    connect();
    ackReauth(Ack{false, {}, {}, std::string("unknown_user")});
    EXPECT_EQ(identity.state(), AuthState::Failed);
}

TEST_F(IdentityReattachmentTest, UnacknowledgedReauthFailsAfterRetries) {
    ASSERT_TRUE(store.setItem(IdentityReattachment::USER_ID_KEY, "u-7").success());

    connect();
    // Default budget: three attempts of 12 s plus two backoffs
    clock.advance(40s);
    EXPECT_EQ(identity.state(), AuthState::Failed);
    EXPECT_EQ(transport.sentCount<Reauth>(), 3u);
}

TEST_F(IdentityReattachmentTest, ReauthResultFromPreviousSessionIsIgnored) {
    ASSERT_TRUE(store.setItem(IdentityReattachment::USER_ID_KEY, "u-7").success());

    connect();
    uint64_t staleRequest = transport.lastRequestId<Reauth>();

    transport.simulateDrop();
    clock.runPending();
    transport.simulateConnected();
    clock.runPending();
    ASSERT_EQ(transport.sentCount<Reauth>(), 2u);

    transport.injectAck(staleRequest, Ack{false, {}, {}, std::string("stale")});
    clock.runPending();
    EXPECT_EQ(identity.state(), AuthState::Reauthenticating);

    ackReauth(Ack{true, {}, {}, {}});
    EXPECT_TRUE(identity.isAuthenticated());
}
