/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "SignalingChannel.h"
#include "../Protocol/SignalingCodec.h"

#include <Logging/Logger.h>

#include <algorithm>
#include <format>

namespace EntropyEngine::Calling
{

SignalingChannel::SignalingChannel(SignalingTransport& transport, Scheduler& scheduler, SignalingConfig config)
    : _transport(transport), _scheduler(scheduler), _config(std::move(config)) {
    std::weak_ptr<int> alive = _lifetime;

    // Transport threads only touch the scheduler; the channel is reached on the loop
    Scheduler* scheduler = &_scheduler;

    _transport.setMessageCallback([this, scheduler, alive](const std::vector<uint8_t>& frame) {
        scheduler->post([this, alive, frame]() {
            if (alive.expired()) return;
            handleFrame(frame);
        });
    });

    _transport.setStateCallback([this, scheduler, alive](ConnectionState state) {
        scheduler->post([this, alive, state]() {
            if (alive.expired()) return;
            handleTransportState(state);
        });
    });
}

SignalingChannel::~SignalingChannel() {
    _transport.setMessageCallback(nullptr);
    _transport.setStateCallback(nullptr);
    _lifetime.reset();

    for (const auto& state : _live) {
        if (state->timer != Scheduler::InvalidTimer) {
            _scheduler.cancel(state->timer);
        }
    }
    for (const auto& [id, waiter] : _connectWaiters) {
        _scheduler.cancel(waiter.timer);
    }

    if (!_live.empty()) {
        ENTROPY_LOG_DEBUG(std::format("SignalingChannel destroyed with {} pending requests", _live.size()));
    }
}

Result<void> SignalingChannel::connect() {
    _closing = false;
    return _transport.connect();
}

void SignalingChannel::disconnect() {
    _closing = true;
    auto result = _transport.disconnect();
    if (result.failed()) {
        ENTROPY_LOG_WARNING(std::format("Signaling disconnect failed: {}", result.errorMessage));
    }
}

Result<void> SignalingChannel::send(const SignalEvent& event) {
    auto frame = encodeEnvelope(SignalEnvelope{0, event});
    if (frame.failed()) {
        ENTROPY_LOG_ERROR(std::format("Failed to encode {}: {}", eventName(event), frame.errorMessage));
        return Result<void>::err(frame.error, frame.errorMessage);
    }

    if (!_connected) {
        ENTROPY_LOG_DEBUG(std::format("Queued {} until the relay reconnects", eventName(event)));
        enqueue(std::move(frame.value));
        return Result<void>::ok();
    }

    auto sent = _transport.send(frame.value);
    if (sent.failed()) {
        // Link dropped under us; keep the frame for the next connect
        ENTROPY_LOG_DEBUG(std::format("Send of {} failed ({}), queued for reconnect", eventName(event),
                                      sent.errorMessage));
        enqueue(std::move(frame.value));
    }
    return Result<void>::ok();
}

void SignalingChannel::enqueue(std::vector<uint8_t> frame) {
    if (_outbox.size() >= MAX_OUTBOX) {
        ENTROPY_LOG_WARNING("Signaling outbox full, dropping oldest queued frame");
        _outbox.pop_front();
    }
    _outbox.push_back(std::move(frame));
}

SignalingChannel::RequestOptions SignalingChannel::defaultRequestOptions() const {
    RequestOptions options;
    options.timeout = _config.ackTimeout;
    options.retries = _config.retries;
    return options;
}

void SignalingChannel::request(const SignalEvent& event, AckCallback callback) {
    request(event, defaultRequestOptions(), std::move(callback));
}

void SignalingChannel::request(const SignalEvent& event, RequestOptions options, AckCallback callback) {
    auto state = std::make_shared<RequestState>();
    state->event = event;
    state->options = options;
    state->callback = std::move(callback);
    _live.push_back(state);

    startAttempt(state);
}

void SignalingChannel::startAttempt(const std::shared_ptr<RequestState>& state) {
    if (_connected && !_reconnecting) {
        sendAttempt(state);
        return;
    }

    ENTROPY_LOG_DEBUG(std::format("{} waiting for relay connection", eventName(state->event)));
    waitForConnect([this, state](bool connected) {
        if (state->done) return;
        if (!connected) {
            finish(state, Result<Ack>::err(CallError::Offline,
                                           std::format("offline: cannot emit {}", eventName(state->event))));
            return;
        }
        sendAttempt(state);
    });
}

void SignalingChannel::sendAttempt(const std::shared_ptr<RequestState>& state) {
    uint64_t requestId = _nextRequestId++;
    state->requestId = requestId;

    auto frame = encodeEnvelope(SignalEnvelope{requestId, state->event});
    if (frame.failed()) {
        finish(state, Result<Ack>::err(frame.error, frame.errorMessage));
        return;
    }

    _requests[requestId] = state;
    state->timer = _scheduler.schedule(state->options.timeout, [this, requestId]() {
        handleAttemptTimeout(requestId);
    });

    auto sent = _transport.send(frame.value);
    if (sent.failed()) {
        _requests.erase(requestId);
        _scheduler.cancel(state->timer);
        state->timer = Scheduler::InvalidTimer;
        retryOrFail(state, CallError::AckTimeout, sent.errorMessage);
    }
}

void SignalingChannel::handleAck(uint64_t requestId, const Ack& ack) {
    auto it = _requests.find(requestId);
    if (it == _requests.end()) {
        ENTROPY_LOG_DEBUG(std::format("Dropping late acknowledgement for request {}", requestId));
        return;
    }

    auto state = it->second;
    _requests.erase(it);
    if (state->timer != Scheduler::InvalidTimer) {
        _scheduler.cancel(state->timer);
        state->timer = Scheduler::InvalidTimer;
    }

    finish(state, Result<Ack>::ok(ack));
}

void SignalingChannel::handleAttemptTimeout(uint64_t requestId) {
    auto it = _requests.find(requestId);
    if (it == _requests.end()) {
        return;
    }

    auto state = it->second;
    _requests.erase(it);
    state->timer = Scheduler::InvalidTimer;

    retryOrFail(state, CallError::AckTimeout,
                std::format("{} not acknowledged within {} ms", eventName(state->event),
                            state->options.timeout.count()));
}

void SignalingChannel::retryOrFail(const std::shared_ptr<RequestState>& state, CallError error,
                                   const std::string& message) {
    if (state->attempt >= state->options.retries) {
        ENTROPY_LOG_WARNING(std::format("{} failed after {} attempts: {}", eventName(state->event),
                                        state->attempt + 1, message));
        finish(state, Result<Ack>::err(error, message));
        return;
    }

    ++state->attempt;

    std::uniform_int_distribution<long long> jitter(_config.backoffMin.count(), _config.backoffMax.count());
    std::chrono::milliseconds delay(jitter(_rng));

    ENTROPY_LOG_DEBUG(std::format("Retrying {} (attempt {}/{}) in {} ms", eventName(state->event),
                                  state->attempt + 1, state->options.retries + 1, delay.count()));

    state->timer = _scheduler.schedule(delay, [this, state]() {
        state->timer = Scheduler::InvalidTimer;
        if (state->done) return;
        startAttempt(state);
    });
}

void SignalingChannel::finish(const std::shared_ptr<RequestState>& state, Result<Ack> result) {
    if (state->done) return;
    state->done = true;

    _live.erase(std::remove(_live.begin(), _live.end(), state), _live.end());

    auto callback = std::move(state->callback);
    state->callback = nullptr;
    if (callback) {
        callback(std::move(result));
    }
}

void SignalingChannel::waitForConnect(std::function<void(bool)> callback) {
    uint64_t waiterId = _nextWaiterId++;
    auto timer = _scheduler.schedule(_config.connectWait, [this, waiterId]() {
        auto it = _connectWaiters.find(waiterId);
        if (it == _connectWaiters.end()) return;
        auto cb = std::move(it->second.callback);
        _connectWaiters.erase(it);
        cb(false);
    });
    _connectWaiters.emplace(waiterId, ConnectWaiter{timer, std::move(callback)});

    if (!_reconnecting && !_closing) {
        auto result = _transport.connect();
        if (result.failed()) {
            ENTROPY_LOG_WARNING(std::format("Relay connect failed: {}", result.errorMessage));
        }
    }
}

void SignalingChannel::resolveConnectWaiters(bool connected) {
    auto waiters = std::move(_connectWaiters);
    _connectWaiters.clear();

    // Ids grow monotonically; resolve in registration order
    std::vector<std::pair<uint64_t, ConnectWaiter>> ordered(waiters.begin(), waiters.end());
    std::sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    for (auto& [id, waiter] : ordered) {
        _scheduler.cancel(waiter.timer);
        waiter.callback(connected);
    }
}

void SignalingChannel::handleFrame(const std::vector<uint8_t>& frame) {
    auto decoded = decodeEnvelope(frame);
    if (decoded.failed()) {
        ENTROPY_LOG_WARNING(std::format("Dropping malformed signaling frame ({} bytes): {}", frame.size(),
                                        decoded.errorMessage));
        return;
    }

    auto& envelope = decoded.value;
    if (const auto* ack = std::get_if<Ack>(&envelope.body)) {
        handleAck(envelope.requestId, *ack);
        return;
    }

    dispatch(std::get<SignalEvent>(envelope.body));
}

void SignalingChannel::dispatch(const SignalEvent& event) {
    std::vector<Subscription> handlers;
    {
        std::lock_guard<std::mutex> lock(_handlerMutex);
        handlers = _handlers[event.index()];
    }

    if (handlers.empty()) {
        ENTROPY_LOG_DEBUG(std::format("No handler for {}", eventName(event)));
        return;
    }

    for (const auto& subscription : handlers) {
        subscription.handler(event);
    }
}

void SignalingChannel::handleTransportState(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connected: {
            bool wasReconnect = _everConnected;
            _connected = true;
            _reconnecting = false;
            _everConnected = true;
            ENTROPY_LOG_INFO(wasReconnect ? "Signaling channel reconnected" : "Signaling channel connected");

            flushOutbox();
            resolveConnectWaiters(true);

            std::vector<ConnectionSubscription> callbacks;
            {
                std::lock_guard<std::mutex> lock(_handlerMutex);
                callbacks = _connectCallbacks;
            }
            fireConnectionCallbacks(callbacks);
            break;
        }
        case ConnectionState::Connecting: {
            bool wasConnected = _connected;
            _connected = false;
            if (_everConnected && !_closing) {
                _reconnecting = true;
            }
            if (wasConnected) {
                ENTROPY_LOG_WARNING("Signaling channel lost, reconnecting");
                std::vector<ConnectionSubscription> callbacks;
                {
                    std::lock_guard<std::mutex> lock(_handlerMutex);
                    callbacks = _disconnectCallbacks;
                }
                fireConnectionCallbacks(callbacks);
            }
            break;
        }
        case ConnectionState::Disconnected:
        case ConnectionState::Failed: {
            bool wasConnected = _connected;
            _connected = false;
            _reconnecting = false;
            if (state == ConnectionState::Failed) {
                ENTROPY_LOG_ERROR("Signaling channel failed");
                resolveConnectWaiters(false);
            }
            if (wasConnected) {
                std::vector<ConnectionSubscription> callbacks;
                {
                    std::lock_guard<std::mutex> lock(_handlerMutex);
                    callbacks = _disconnectCallbacks;
                }
                fireConnectionCallbacks(callbacks);
            }
            break;
        }
        case ConnectionState::Disconnecting:
            break;
    }
}

void SignalingChannel::flushOutbox() {
    if (_outbox.empty()) return;

    ENTROPY_LOG_DEBUG(std::format("Flushing {} queued signaling frames", _outbox.size()));
    auto queued = std::move(_outbox);
    _outbox.clear();
    for (auto& frame : queued) {
        auto sent = _transport.send(frame);
        if (sent.failed()) {
            ENTROPY_LOG_WARNING(std::format("Dropping queued signaling frame: {}", sent.errorMessage));
        }
    }
}

void SignalingChannel::fireConnectionCallbacks(const std::vector<ConnectionSubscription>& subscriptions) {
    for (const auto& subscription : subscriptions) {
        if (subscription.callback) {
            subscription.callback();
        }
    }
}

SignalingChannel::SubscriptionId SignalingChannel::onConnect(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(_handlerMutex);
    SubscriptionId id = _nextSubscriptionId++;
    _connectCallbacks.push_back(ConnectionSubscription{id, std::move(callback)});
    return id;
}

SignalingChannel::SubscriptionId SignalingChannel::onDisconnect(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(_handlerMutex);
    SubscriptionId id = _nextSubscriptionId++;
    _disconnectCallbacks.push_back(ConnectionSubscription{id, std::move(callback)});
    return id;
}

bool SignalingChannel::off(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(_handlerMutex);
    auto removeFrom = [id](auto& list) {
        auto it = std::find_if(list.begin(), list.end(), [id](const auto& s) { return s.id == id; });
        if (it == list.end()) return false;
        list.erase(it);
        return true;
    };

    for (auto& list : _handlers) {
        if (removeFrom(list)) return true;
    }
    return removeFrom(_connectCallbacks) || removeFrom(_disconnectCallbacks);
}

uint64_t SignalingChannel::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(Core::TypeSystem::createTypeId<SignalingChannel>().id);
    return hash;
}

std::string SignalingChannel::toString() const {
    return std::format("{}@{}(connected={}, reconnecting={}, pending={})", className(),
                       static_cast<const void*>(this), _connected, _reconnecting, _live.size());
}

}  // namespace EntropyEngine::Calling
