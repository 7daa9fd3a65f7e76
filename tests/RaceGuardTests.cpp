/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include <gtest/gtest.h>
#include "../src/Calling/Session/RaceGuard.h"
#include "ManualScheduler.h"

using namespace EntropyEngine::Calling;
using namespace EntropyEngine::Calling::Tests;
using namespace std::chrono_literals;

TEST(RaceGuardTests, UnknownIdIsNotSuppressed) {
    ManualScheduler clock;
    RaceGuard guard(clock);

    EXPECT_FALSE(guard.isSuppressed("call-1"));
    EXPECT_EQ(guard.size(), 0u);
}

TEST(RaceGuardTests, CanceledIdIsSuppressed) {
    ManualScheduler clock;
    RaceGuard guard(clock);

    guard.markCanceled("call-1");

    EXPECT_TRUE(guard.isSuppressed("call-1"));
    EXPECT_TRUE(guard.isCanceled("call-1"));
    EXPECT_FALSE(guard.isTimedOut("call-1"));
    EXPECT_FALSE(guard.isSuppressed("call-2"));
}

TEST(RaceGuardTests, TimedOutIdIsSuppressed) {
    ManualScheduler clock;
    RaceGuard guard(clock);

    guard.markTimedOut("call-1");

    EXPECT_TRUE(guard.isSuppressed("call-1"));
    EXPECT_TRUE(guard.isTimedOut("call-1"));
    EXPECT_FALSE(guard.isCanceled("call-1"));
}

TEST(RaceGuardTests, EntriesExpireAfterTtl) {
    ManualScheduler clock;
    RaceGuard guard(clock);

    guard.markCanceled("call-1");
    clock.advance(9s);
    guard.markTimedOut("call-2");
    EXPECT_TRUE(guard.isSuppressed("call-1"));

    // Exactly at the ttl the entry still counts
    clock.advance(1s);
    EXPECT_TRUE(guard.isSuppressed("call-1"));

    clock.advance(1ms);
    EXPECT_FALSE(guard.isSuppressed("call-1"));
    EXPECT_TRUE(guard.isSuppressed("call-2"));
    EXPECT_EQ(guard.size(), 1u);
}

TEST(RaceGuardTests, CustomTtl) {
    ManualScheduler clock;
    RaceGuard::Config config;
    config.ttl = 500ms;
    RaceGuard guard(clock, config);

    guard.markCanceled("call-1");
    clock.advance(501ms);
    EXPECT_FALSE(guard.isSuppressed("call-1"));
}

TEST(RaceGuardTests, RemarkingRefreshesTimestamp) {
    ManualScheduler clock;
    RaceGuard guard(clock);

    guard.markCanceled("call-1");
    clock.advance(8s);
    guard.markCanceled("call-1");
    clock.advance(8s);

    EXPECT_TRUE(guard.isSuppressed("call-1"));
}

TEST(RaceGuardTests, EmptyIdsAreIgnored) {
    ManualScheduler clock;
    RaceGuard guard(clock);

    guard.markCanceled("");
    guard.markTimedOut("");

    EXPECT_EQ(guard.size(), 0u);
    EXPECT_FALSE(guard.isSuppressed(""));
}

TEST(RaceGuardTests, ClearForgetsEverything) {
    ManualScheduler clock;
    RaceGuard guard(clock);

    guard.markCanceled("a");
    guard.markTimedOut("b");
    guard.clear();

    EXPECT_EQ(guard.size(), 0u);
    EXPECT_FALSE(guard.isSuppressed("a"));
}
