/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include <gtest/gtest.h>
#include "../src/Calling/Session/MissedCallLedger.h"
#include "../src/Calling/Core/KeyValueStore.h"
#include "ManualScheduler.h"
#include <atomic>
#include <thread>
#include <vector>

using namespace EntropyEngine::Calling;
using namespace EntropyEngine::Calling::Tests;

TEST(MissedCallLedgerTests, ResolveMissedCountsOnce) {
    InMemoryKeyValueStore store;
    ManualScheduler clock;
    MissedCallLedger ledger(store, clock);

    ledger.openOccurrence("call-1", "alice");
    EXPECT_TRUE(ledger.isPending("call-1"));

    EXPECT_TRUE(ledger.resolveMissed("call-1"));
    EXPECT_FALSE(ledger.resolveMissed("call-1"));
    EXPECT_FALSE(ledger.isPending("call-1"));
    EXPECT_EQ(ledger.count("alice"), 1u);
}

TEST(MissedCallLedgerTests, CountIsPersistedUnderPeerKey) {
    InMemoryKeyValueStore store;
    ManualScheduler clock;

    {
        MissedCallLedger ledger(store, clock);
        ledger.openOccurrence("call-1", "alice");
        ledger.openOccurrence("call-2", "alice");
        ledger.resolveMissed("call-1");
        ledger.resolveMissed("call-2");
    }

    EXPECT_EQ(store.getItem("missed_calls_by_user_v1/alice"), std::optional<std::string>("2"));

    MissedCallLedger reloaded(store, clock);
    EXPECT_EQ(reloaded.count("alice"), 2u);
}

TEST(MissedCallLedgerTests, AnsweredOccurrenceNeverCounts) {
    InMemoryKeyValueStore store;
    ManualScheduler clock;
    MissedCallLedger ledger(store, clock);

    ledger.openOccurrence("call-1", "alice");
    EXPECT_TRUE(ledger.resolveAnswered("call-1"));
    EXPECT_FALSE(ledger.resolveMissed("call-1"));
    EXPECT_EQ(ledger.count("alice"), 0u);
}

TEST(MissedCallLedgerTests, UnknownOccurrenceIsNotCounted) {
    InMemoryKeyValueStore store;
    ManualScheduler clock;
    MissedCallLedger ledger(store, clock);

    EXPECT_FALSE(ledger.resolveMissed("never-opened"));
    EXPECT_FALSE(ledger.resolveAnswered("never-opened"));
}

TEST(MissedCallLedgerTests, DuplicateInvitationKeepsOneOccurrence) {
    InMemoryKeyValueStore store;
    ManualScheduler clock;
    MissedCallLedger ledger(store, clock);

    ledger.openOccurrence("call-1", "alice");
    ledger.resolveMissed("call-1");
    ledger.openOccurrence("call-1", "alice");

    EXPECT_FALSE(ledger.resolveMissed("call-1"));
    EXPECT_EQ(ledger.count("alice"), 1u);
}

TEST(MissedCallLedgerTests, LastIncomingMarkerTracksAndClears) {
    InMemoryKeyValueStore store;
    ManualScheduler clock;
    MissedCallLedger ledger(store, clock);

    ledger.openOccurrence("call-1", "alice");
    EXPECT_EQ(ledger.lastIncomingPeer(), std::optional<PeerId>("alice"));

    ledger.openOccurrence("call-2", "bob");
    EXPECT_EQ(ledger.lastIncomingPeer(), std::optional<PeerId>("bob"));

    // Resolving alice's call leaves bob's marker alone
    ledger.resolveMissed("call-1");
    EXPECT_EQ(ledger.lastIncomingPeer(), std::optional<PeerId>("bob"));

    ledger.resolveMissed("call-2");
    EXPECT_FALSE(ledger.lastIncomingPeer().has_value());
}

TEST(MissedCallLedgerTests, ResetNotifiesZero) {
    InMemoryKeyValueStore store;
    ManualScheduler clock;
    MissedCallLedger ledger(store, clock);

    std::vector<std::pair<PeerId, uint32_t>> updates;
    ledger.setCountCallback([&](const PeerId& peer, uint32_t count) { updates.emplace_back(peer, count); });

    ledger.openOccurrence("call-1", "alice");
    ledger.resolveMissed("call-1");
    ledger.reset("alice");
    ledger.reset("alice");

    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0], std::make_pair(PeerId("alice"), 1u));
    EXPECT_EQ(updates[1], std::make_pair(PeerId("alice"), 0u));
    EXPECT_EQ(ledger.count("alice"), 0u);
}

TEST(MissedCallLedgerTests, CorruptCounterReadsAsZero) {
    InMemoryKeyValueStore store;
    ManualScheduler clock;
    ASSERT_TRUE(store.setItem("missed_calls_by_user_v1/alice", "lots").success());

    MissedCallLedger ledger(store, clock);
    EXPECT_EQ(ledger.count("alice"), 0u);

    ledger.openOccurrence("call-1", "alice");
    ledger.resolveMissed("call-1");
    EXPECT_EQ(ledger.count("alice"), 1u);
}

TEST(MissedCallLedgerTests, ConcurrentResolutionCountsExactlyOnce) {
    InMemoryKeyValueStore store;
    ManualScheduler clock;
    MissedCallLedger ledger(store, clock);

    ledger.openOccurrence("call-1", "alice");

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (ledger.resolveMissed("call-1")) winners.fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(ledger.count("alice"), 1u);
}
