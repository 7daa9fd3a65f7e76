/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#pragma once

#include "../Core/CallTypes.h"
#include "../Core/ErrorCodes.h"

#include <cstdint>
#include <mutex>
#include <optional>

namespace EntropyEngine {
namespace Calling {

class SignalingOwnership;

/**
 * @brief Proof that one session type owns the shared negotiation handlers
 *
 * Move-only. Releases ownership when destroyed or on release(), whichever
 * comes first. Must not outlive the SignalingOwnership that issued it.
 */
class SignalingOwnershipToken {
public:
    SignalingOwnershipToken() = default;
    ~SignalingOwnershipToken();

    SignalingOwnershipToken(SignalingOwnershipToken&& other) noexcept;
    SignalingOwnershipToken& operator=(SignalingOwnershipToken&& other) noexcept;

    SignalingOwnershipToken(const SignalingOwnershipToken&) = delete;
    SignalingOwnershipToken& operator=(const SignalingOwnershipToken&) = delete;

    SessionType type() const { return _type; }
    bool valid() const { return _owner != nullptr; }

    /**
     * @brief Gives ownership back; later calls are no-ops
     */
    void release();

private:
    friend class SignalingOwnership;
    SignalingOwnershipToken(SignalingOwnership* owner, SessionType type, uint64_t generation)
        : _owner(owner), _type(type), _generation(generation) {}

    SignalingOwnership* _owner = nullptr;
    SessionType _type = SessionType::Direct;
    uint64_t _generation = 0;
};

/**
 * @brief Exclusive arbiter of offer/answer/ICE handler ownership
 *
 * At most one session type holds ownership at a time. A second acquire()
 * while ownership is held fails with OwnershipConflict instead of stealing it.
 */
class SignalingOwnership {
public:
    /**
     * @brief Try to take ownership for a session type
     * @return Token on success, CallError::OwnershipConflict if any type already holds it
     */
    Result<SignalingOwnershipToken> acquire(SessionType type);

    /**
     * @brief Current holder, if any
     */
    std::optional<SessionType> owner() const;

private:
    friend class SignalingOwnershipToken;
    void release(uint64_t generation);

    mutable std::mutex _mutex;
    std::optional<SessionType> _owner;
    uint64_t _generation = 0;
};

} // namespace Calling
} // namespace EntropyEngine
