/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include <gtest/gtest.h>
#include "../src/Calling/Session/SignalingOwnership.h"

#include <utility>

using namespace EntropyEngine::Calling;

TEST(SignalingOwnershipTests, SecondAcquireIsRefused) {
    SignalingOwnership ownership;

    auto direct = ownership.acquire(SessionType::Direct);
    ASSERT_TRUE(direct.success());
    EXPECT_TRUE(direct.value.valid());
    EXPECT_EQ(direct.value.type(), SessionType::Direct);
    EXPECT_EQ(ownership.owner(), std::optional<SessionType>(SessionType::Direct));

    auto matchmaking = ownership.acquire(SessionType::Matchmaking);
    EXPECT_EQ(matchmaking.error, CallError::OwnershipConflict);
    EXPECT_FALSE(matchmaking.value.valid());
    EXPECT_EQ(ownership.acquire(SessionType::Direct).error, CallError::OwnershipConflict);
    EXPECT_EQ(ownership.owner(), std::optional<SessionType>(SessionType::Direct));
}

TEST(SignalingOwnershipTests, ReleaseFreesOwnership) {
    SignalingOwnership ownership;

    auto direct = ownership.acquire(SessionType::Direct);
    ASSERT_TRUE(direct.success());
    direct.value.release();
    EXPECT_FALSE(direct.value.valid());
    EXPECT_FALSE(ownership.owner().has_value());

    auto matchmaking = ownership.acquire(SessionType::Matchmaking);
    ASSERT_TRUE(matchmaking.success());

    // A second release of the old token must not drop the new owner
    direct.value.release();
    EXPECT_EQ(ownership.owner(), std::optional<SessionType>(SessionType::Matchmaking));
}

TEST(SignalingOwnershipTests, TokenReleasesOnDestruction) {
    SignalingOwnership ownership;
    {
        auto token = ownership.acquire(SessionType::Matchmaking);
        ASSERT_TRUE(token.success());
        EXPECT_TRUE(ownership.owner().has_value());
    }
    EXPECT_FALSE(ownership.owner().has_value());
}

TEST(SignalingOwnershipTests, MovedTokenKeepsOwnership) {
    SignalingOwnership ownership;

    auto acquired = ownership.acquire(SessionType::Direct);
    ASSERT_TRUE(acquired.success());

    SignalingOwnershipToken held = std::move(acquired.value);
    EXPECT_FALSE(acquired.value.valid());
    EXPECT_TRUE(held.valid());
    EXPECT_EQ(ownership.owner(), std::optional<SessionType>(SessionType::Direct));

    SignalingOwnershipToken other;
    other = std::move(held);
    EXPECT_FALSE(held.valid());
    EXPECT_TRUE(other.valid());

    other.release();
    EXPECT_FALSE(ownership.owner().has_value());
}
