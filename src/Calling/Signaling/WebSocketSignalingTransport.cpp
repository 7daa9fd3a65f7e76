/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "WebSocketSignalingTransport.h"

#include <Logging/Logger.h>

#include <format>
#include <stdexcept>

namespace EntropyEngine::Calling
{

WebSocketSignalingTransport::WebSocketSignalingTransport(SignalingConfig config, Scheduler& scheduler)
    : _config(std::move(config)), _scheduler(scheduler) {
    if (_config.url.empty()) {
        throw std::runtime_error("Signaling URL must not be empty");
    }
}

WebSocketSignalingTransport::~WebSocketSignalingTransport() {
    setMessageCallback(nullptr);
    setStateCallback(nullptr);

    auto closed = disconnect();
    if (closed.failed()) {
        ENTROPY_LOG_WARNING(std::format("Signaling socket close failed: {}", closed.errorMessage));
    }

    shutdownCallbacks();
}

Result<void> WebSocketSignalingTransport::connect() {
    auto state = _state.load(std::memory_order_acquire);
    if (state == ConnectionState::Connected || state == ConnectionState::Connecting) {
        return Result<void>::ok();
    }

    _closing.store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _attempts = 0;
    }
    setState(ConnectionState::Connecting);

    try {
        openSocket();
    } catch (const std::exception& e) {
        setState(ConnectionState::Failed);
        return Result<void>::err(CallError::ConnectionClosed,
                                 std::format("Failed to open signaling socket: {}", e.what()));
    }
    return Result<void>::ok();
}

Result<void> WebSocketSignalingTransport::disconnect() {
    if (_closing.exchange(true)) {
        return Result<void>::ok();
    }

    std::shared_ptr<rtc::WebSocket> socket;
    Scheduler::TimerId timer = Scheduler::InvalidTimer;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_generation;
        socket = std::move(_webSocket);
        timer = _reconnectTimer;
        _reconnectTimer = Scheduler::InvalidTimer;
    }

    if (timer != Scheduler::InvalidTimer) {
        _scheduler.cancel(timer);
    }

    if (socket) {
        setState(ConnectionState::Disconnecting);
        socket->resetCallbacks();
        socket->close();
    }

    setState(ConnectionState::Disconnected);
    return Result<void>::ok();
}

bool WebSocketSignalingTransport::isConnected() const {
    return _state.load(std::memory_order_acquire) == ConnectionState::Connected;
}

Result<void> WebSocketSignalingTransport::send(const std::vector<uint8_t>& data) {
    std::shared_ptr<rtc::WebSocket> socket;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        socket = _webSocket;
    }

    if (!socket || !socket->isOpen()) {
        return Result<void>::err(CallError::ConnectionClosed, "Signaling socket not open");
    }

    try {
        if (!socket->send(reinterpret_cast<const std::byte*>(data.data()), data.size())) {
            return Result<void>::err(CallError::ConnectionClosed, "Signaling frame was not sent");
        }
    } catch (const std::exception& e) {
        return Result<void>::err(CallError::ConnectionClosed, std::format("Signaling send failed: {}", e.what()));
    }
    return Result<void>::ok();
}

void WebSocketSignalingTransport::openSocket() {
    auto socket = std::make_shared<rtc::WebSocket>();
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        generation = ++_generation;
        _webSocket = socket;
    }

    socket->onOpen([this, generation]() { handleOpen(generation); });
    socket->onClosed([this, generation]() { handleClosed(generation); });
    socket->onError([](std::string error) { ENTROPY_LOG_ERROR(std::format("Signaling socket error: {}", error)); });
    socket->onMessage([this, generation](rtc::message_variant data) {
        if (!std::holds_alternative<rtc::binary>(data)) {
            ENTROPY_LOG_DEBUG("Ignoring text frame on signaling socket");
            return;
        }
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (generation != _generation) return;
        }

        const auto& binaryData = std::get<rtc::binary>(data);
        std::vector<uint8_t> frame;
        frame.reserve(binaryData.size());
        for (const auto& byte : binaryData) {
            frame.push_back(static_cast<uint8_t>(byte));
        }
        onMessageReceived(frame);
    });

    ENTROPY_LOG_INFO(std::format("Connecting to signaling relay: {}", _config.url));
    socket->open(_config.url);
}

void WebSocketSignalingTransport::handleOpen(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (generation != _generation) return;
        _attempts = 0;
    }
    ENTROPY_LOG_INFO("Signaling relay connected");
    setState(ConnectionState::Connected);
}

void WebSocketSignalingTransport::handleClosed(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (generation != _generation) return;
        _webSocket.reset();
    }

    if (_closing.load(std::memory_order_acquire)) {
        return;
    }

    ENTROPY_LOG_WARNING("Signaling relay connection lost");
    scheduleReconnect();
}

void WebSocketSignalingTransport::scheduleReconnect() {
    int attempt = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_attempts < _config.reconnectAttempts) {
            attempt = ++_attempts;
        }
    }

    if (attempt == 0) {
        ENTROPY_LOG_ERROR(std::format("Signaling relay unreachable after {} reconnect attempts",
                                      _config.reconnectAttempts));
        setState(ConnectionState::Failed);
        return;
    }

    setState(ConnectionState::Connecting);

    auto timer = _scheduler.schedule(_config.reconnectDelay, [this, attempt]() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _reconnectTimer = Scheduler::InvalidTimer;
        }
        if (_closing.load(std::memory_order_acquire)) return;

        ENTROPY_LOG_INFO(std::format("Signaling reconnect attempt {}/{}", attempt, _config.reconnectAttempts));
        try {
            openSocket();
        } catch (const std::exception& e) {
            ENTROPY_LOG_WARNING(std::format("Signaling reconnect attempt failed: {}", e.what()));
            scheduleReconnect();
        }
    });

    std::lock_guard<std::mutex> lock(_mutex);
    _reconnectTimer = timer;
}

void WebSocketSignalingTransport::setState(ConnectionState state) {
    auto previous = _state.exchange(state, std::memory_order_acq_rel);
    if (previous != state) {
        onStateChanged(state);
    }
}

uint64_t WebSocketSignalingTransport::classHash() const noexcept {
    static const uint64_t hash =
        static_cast<uint64_t>(Core::TypeSystem::createTypeId<WebSocketSignalingTransport>().id);
    return hash;
}

std::string WebSocketSignalingTransport::toString() const {
    return std::format("{}@{}(url={}, state={})", className(), static_cast<const void*>(this), _config.url,
                       connectionStateToString(getState()));
}

}  // namespace EntropyEngine::Calling
