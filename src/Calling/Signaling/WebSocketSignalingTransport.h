/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#pragma once

#include "SignalingTransport.h"
#include "../Core/Scheduler.h"

#include <rtc/rtc.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace EntropyEngine::Calling {

    /**
     * @brief Relay link over a libdatachannel WebSocket
     *
     * Frames are sent as binary WebSocket messages. After an unexpected close the
     * transport reports Connecting and opens a fresh socket every reconnectDelay,
     * up to reconnectAttempts times, then reports Failed. A successful open resets
     * the attempt budget.
     */
    class WebSocketSignalingTransport : public SignalingTransport {
    public:
        /**
         * @brief Construct a WebSocket relay transport
         * @param config Relay URL and reconnect policy
         * @param scheduler Scheduler used to time reconnect attempts
         */
        WebSocketSignalingTransport(SignalingConfig config, Scheduler& scheduler);
        ~WebSocketSignalingTransport() override;

        Result<void> connect() override;
        Result<void> disconnect() override;
        bool isConnected() const override;
        Result<void> send(const std::vector<uint8_t>& data) override;
        ConnectionState getState() const override { return _state.load(std::memory_order_acquire); }

        // EntropyObject interface
        const char* className() const noexcept override { return "WebSocketSignalingTransport"; }
        uint64_t classHash() const noexcept override;
        std::string toString() const override;

    private:
        void openSocket();
        void handleOpen(uint64_t generation);
        void handleClosed(uint64_t generation);
        void scheduleReconnect();
        void setState(ConnectionState state);

        SignalingConfig _config;
        Scheduler& _scheduler;

        mutable std::mutex _mutex;
        std::shared_ptr<rtc::WebSocket> _webSocket;
        uint64_t _generation = 0;                       ///< Bumped per socket; stale callbacks are ignored
        int _attempts = 0;
        Scheduler::TimerId _reconnectTimer = Scheduler::InvalidTimer;

        std::atomic<ConnectionState> _state{ConnectionState::Disconnected};
        std::atomic<bool> _closing{false};
    };

} // namespace EntropyEngine::Calling
