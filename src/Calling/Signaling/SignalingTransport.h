/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file SignalingTransport.h
 * @brief Base interface for the relay connection
 *
 * This file contains SignalingTransport, the byte-level duplex link to the
 * relay that SignalingChannel builds typed events and acknowledgements on.
 */

#pragma once

#include <EntropyCore.h>
#include "../Core/CallTypes.h"
#include "../Core/ErrorCodes.h"
#include <vector>
#include <functional>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace EntropyEngine::Calling {

/**
 * @brief Abstract byte transport to the signaling relay
 *
 * Implementations own reconnection: after an unexpected drop they report
 * Connecting and then Connected again, or Failed once they give up.
 *
 * Implementations:
 * - WebSocketSignalingTransport (libdatachannel WebSocket)
 *
 * Thread Safety: All methods are thread-safe. Callbacks may fire on transport
 * threads and are invoked with reference-counted guards to prevent use-after-free.
 */
class SignalingTransport : public Core::EntropyObject {
public:
    using MessageCallback = std::function<void(const std::vector<uint8_t>&)>;  ///< Callback for received frames
    using StateCallback = std::function<void(ConnectionState)>;                ///< Callback for state changes

    virtual ~SignalingTransport() = default;

    /**
     * @brief Opens the link to the relay
     *
     * Idempotent: returns success without side effects while connecting or connected.
     * @return Result indicating success or failure
     */
    virtual Result<void> connect() = 0;

    /**
     * @brief Closes the link and stops reconnecting
     * @return Result indicating success or failure
     */
    virtual Result<void> disconnect() = 0;

    /**
     * @brief Checks if the link is established
     * @return true if state is Connected
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Sends one frame
     * @param data Frame bytes
     * @return Result with ConnectionClosed if the link is down
     */
    virtual Result<void> send(const std::vector<uint8_t>& data) = 0;

    /**
     * @brief Gets current link state
     */
    virtual ConnectionState getState() const = 0;

    /**
     * @brief Sets callback for incoming frames
     *
     * Thread-safe: Can be called from any thread.
     * @param callback Function called when frames arrive
     */
    void setMessageCallback(MessageCallback callback) noexcept {
        std::lock_guard<std::mutex> lock(_cbMutex);
        _messageCallback = std::move(callback);
    }

    /**
     * @brief Sets callback for state changes
     *
     * Thread-safe: Can be called from any thread.
     * @param callback Function called when link state changes
     */
    void setStateCallback(StateCallback callback) noexcept {
        std::lock_guard<std::mutex> lock(_cbMutex);
        _stateCallback = std::move(callback);
    }

protected:
    SignalingTransport() = default;

    void onMessageReceived(const std::vector<uint8_t>& data) noexcept {
        dispatch(_messageCallback, data);
    }

    void onStateChanged(ConnectionState state) noexcept {
        dispatch(_stateCallback, state);
    }

    /**
     * @brief Shuts down callbacks and waits for in-flight invocations
     *
     * Call this from the derived class destructor before the base destructor runs.
     */
    void shutdownCallbacks() noexcept {
        _callbacksShutdown.store(true, std::memory_order_release);

        while (_activeCallbacks.load(std::memory_order_acquire) > 0) {
            std::this_thread::yield();
        }
    }

private:
    /**
     * @brief Copies a callback under the lock and runs it unless shutdown began
     *
     * The in-flight count is raised before the second shutdown check, so
     * shutdownCallbacks() either sees this invocation or it never starts.
     */
    template<typename Callback, typename Arg>
    void dispatch(const Callback& slot, const Arg& arg) noexcept {
        if (_callbacksShutdown.load(std::memory_order_acquire)) {
            return;
        }

        _activeCallbacks.fetch_add(1, std::memory_order_relaxed);
        struct InFlight {
            std::atomic<int>& count;
            ~InFlight() { count.fetch_sub(1, std::memory_order_release); }
        } inFlight{_activeCallbacks};

        if (_callbacksShutdown.load(std::memory_order_acquire)) {
            return;
        }

        Callback cb;
        {
            std::lock_guard<std::mutex> lock(_cbMutex);
            cb = slot;
        }
        if (cb) {
            cb(arg);
        }
    }

    mutable std::mutex _cbMutex;                         ///< Protects callback access
    MessageCallback _messageCallback;                    ///< Frame callback
    StateCallback _stateCallback;                        ///< State callback
    std::atomic<int> _activeCallbacks{0};                ///< Count of active callback invocations
    std::atomic<bool> _callbacksShutdown{false};         ///< Shutdown flag for destructor
};

} // namespace EntropyEngine::Calling
