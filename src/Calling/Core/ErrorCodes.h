/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file ErrorCodes.h
 * @brief Error handling types for Entropy calling
 *
 * Defines the call error taxonomy and the result types used throughout the
 * signaling, session and media layers.
 */

#pragma once

#include <optional>
#include <string>
#include <stdexcept>

namespace EntropyEngine {
namespace Calling {

/**
 * @brief Error codes for calling operations
 *
 * Channel and transport failures (Offline, AckTimeout, TransportFailed) are
 * surfaced only after local retry budgets are exhausted. State machine failures
 * (RoomFull, Busy, Declined, CallInitiateFailed) are terminal and always surfaced.
 */
enum class CallError {
    None,                       ///< No error
    Offline,                    ///< Signaling channel unreachable within the connect-wait budget
    NotAuthenticated,           ///< Identity not (re)attached on the current channel session
    CallInitiateFailed,         ///< Relay rejected call:initiate (ack ok:false)
    RoomFull,                   ///< Remote room is full, terminal
    Busy,                       ///< Remote party is busy, terminal
    Declined,                   ///< Remote party declined, terminal
    AckTimeout,                 ///< Acknowledgement missing after all retries
    Timeout,                    ///< Local state timer elapsed
    SuppressedEvent,            ///< Stale event dropped on purpose (not surfaced)
    InvalidState,               ///< Operation not valid in the current call state
    InvalidParameter,           ///< Invalid parameter provided
    OwnershipConflict,          ///< Signaling handlers already owned by another session type
    TransportFailed,            ///< Media transport operation failed
    SerializationFailed,        ///< Failed to serialize message
    DeserializationFailed,      ///< Failed to deserialize message
    ConnectionClosed            ///< Channel or session was closed
};

/**
 * @brief Convert error code to human-readable string
 * @param error The error code
 * @return Description of the error
 */
inline const char* errorToString(CallError error) {
    switch (error) {
        case CallError::None: return "No error";
        case CallError::Offline: return "Offline";
        case CallError::NotAuthenticated: return "Not authenticated";
        case CallError::CallInitiateFailed: return "Call initiate failed";
        case CallError::RoomFull: return "Room full";
        case CallError::Busy: return "Busy";
        case CallError::Declined: return "Declined";
        case CallError::AckTimeout: return "Acknowledgement timeout";
        case CallError::Timeout: return "Timeout";
        case CallError::SuppressedEvent: return "Suppressed event";
        case CallError::InvalidState: return "Invalid state";
        case CallError::InvalidParameter: return "Invalid parameter";
        case CallError::OwnershipConflict: return "Ownership conflict";
        case CallError::TransportFailed: return "Transport failed";
        case CallError::SerializationFailed: return "Serialization failed";
        case CallError::DeserializationFailed: return "Deserialization failed";
        case CallError::ConnectionClosed: return "Connection closed";
        default: return "Unknown error";
    }
}

/**
 * @brief Result type for operations that may fail
 *
 * Encapsulates a value and an error code. Check success() before accessing value.
 *
 * @code
 * auto result = manager.acceptCall();
 * if (result.failed()) {
 *     ENTROPY_LOG_WARNING(result.errorMessage);
 * }
 * @endcode
 */
template<typename T>
struct Result {
    T value;                    ///< Result value (valid only if error == None)
    CallError error;            ///< Error code
    std::string errorMessage;   ///< Optional detailed error message

    /**
     * @brief Check if operation succeeded
     * @return true if no error occurred
     */
    bool success() const {
        return error == CallError::None;
    }

    /**
     * @brief Check if operation failed
     * @return true if an error occurred
     */
    bool failed() const {
        return error != CallError::None;
    }

    /**
     * @brief Get the value or throw on error
     * @return The contained value
     * @throws std::runtime_error if operation failed
     */
    T& valueOrThrow() {
        if (failed()) {
            throw std::runtime_error(errorMessage.empty() ?
                errorToString(error) : errorMessage);
        }
        return value;
    }

    static Result<T> ok(T val) {
        return Result<T>{std::move(val), CallError::None, ""};
    }

    static Result<T> err(CallError err, std::string message = "") {
        return Result<T>{T{}, err, std::move(message)};
    }
};

/**
 * @brief Result specialization for void operations
 */
template<>
struct Result<void> {
    CallError error;
    std::string errorMessage;

    bool success() const { return error == CallError::None; }
    bool failed() const { return error != CallError::None; }

    void throwOnError() const {
        if (failed()) {
            throw std::runtime_error(errorMessage.empty() ?
                errorToString(error) : errorMessage);
        }
    }

    static Result<void> ok() {
        return Result<void>{CallError::None, ""};
    }

    static Result<void> err(CallError err, std::string message = "") {
        return Result<void>{err, std::move(message)};
    }
};

} // namespace Calling
} // namespace EntropyEngine
