/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "SignalingOwnership.h"

#include <utility>

namespace EntropyEngine {
namespace Calling {

SignalingOwnershipToken::~SignalingOwnershipToken() {
    release();
}

SignalingOwnershipToken::SignalingOwnershipToken(SignalingOwnershipToken&& other) noexcept
    : _owner(std::exchange(other._owner, nullptr))
    , _type(other._type)
    , _generation(other._generation)
{
}

SignalingOwnershipToken& SignalingOwnershipToken::operator=(SignalingOwnershipToken&& other) noexcept {
    if (this != &other) {
        release();
        _owner = std::exchange(other._owner, nullptr);
        _type = other._type;
        _generation = other._generation;
    }
    return *this;
}

void SignalingOwnershipToken::release() {
    if (auto* owner = std::exchange(_owner, nullptr)) {
        owner->release(_generation);
    }
}

Result<SignalingOwnershipToken> SignalingOwnership::acquire(SessionType type) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_owner) {
        return Result<SignalingOwnershipToken>::err(CallError::OwnershipConflict,
            std::string("Signaling handlers already owned by ") + sessionTypeToString(*_owner) + ", " +
                sessionTypeToString(type) + " not bound");
    }
    _owner = type;
    return Result<SignalingOwnershipToken>::ok(SignalingOwnershipToken(this, type, ++_generation));
}

std::optional<SessionType> SignalingOwnership::owner() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _owner;
}

void SignalingOwnership::release(uint64_t generation) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (generation == _generation) {
        _owner.reset();
    }
}

} // namespace Calling
} // namespace EntropyEngine
