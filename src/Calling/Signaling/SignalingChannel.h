/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file SignalingChannel.h
 * @brief Typed, acknowledged event channel to the signaling relay
 */

#pragma once

#include <EntropyCore.h>
#include "SignalEvents.h"
#include "SignalingTransport.h"
#include "../Core/CallTypes.h"
#include "../Core/ErrorCodes.h"
#include "../Core/Scheduler.h"

#include <array>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <unordered_map>
#include <vector>

namespace EntropyEngine::Calling {

/**
 * @brief Persistent duplex event channel with acknowledgements
 *
 * Wraps a SignalingTransport and turns raw frames into SignalEvent values.
 * Handlers are registered per event type; registering a type that is not a
 * SignalEvent alternative does not compile.
 *
 * request() semantics:
 * - If the channel is down or mid-reconnect, the request waits for a connect
 *   for at most SignalingConfig::connectWait, then fails with Offline.
 * - Each attempt arms a timer. The acknowledgement and the timer are mutually
 *   exclusive; whichever comes first consumes the attempt.
 * - Failed attempts are retried after a jittered delay in
 *   [backoffMin, backoffMax] until the retry budget is spent, then the request
 *   fails with AckTimeout.
 * - The callback runs exactly once.
 *
 * Threading: connect(), send(), request() and the callbacks run on the
 * scheduler thread. on()/off() may be called from any thread. Transport
 * callbacks are marshalled onto the scheduler.
 *
 * @code
 * SignalingChannel channel(transport, loop, config);
 * auto sub = channel.on<CallIncoming>([](const CallIncoming& e) { showInvite(e.callId); });
 * channel.connect();
 * channel.request(CallInitiate{"peer-7"}, [](Result<Ack> ack) {
 *     if (ack.success() && ack.value.ok) ringOut(*ack.value.callId);
 * });
 * @endcode
 */
class SignalingChannel : public Core::EntropyObject {
public:
    using SubscriptionId = uint64_t;
    using AckCallback = std::function<void(Result<Ack>)>;
    using ConnectionCallback = std::function<void()>;

    /**
     * @brief Per-request timeout and retry budget
     */
    struct RequestOptions {
        std::chrono::milliseconds timeout{12000};   ///< Per-attempt acknowledgement timeout
        int retries = 2;                            ///< Extra attempts after the first
    };

    /**
     * @brief Frames queued while disconnected are capped at this many
     */
    static constexpr size_t MAX_OUTBOX = 64;

    SignalingChannel(SignalingTransport& transport, Scheduler& scheduler, SignalingConfig config = {});
    ~SignalingChannel() override;

    SignalingChannel(const SignalingChannel&) = delete;
    SignalingChannel& operator=(const SignalingChannel&) = delete;

    /**
     * @brief Opens the relay link (idempotent)
     */
    Result<void> connect();

    /**
     * @brief Closes the relay link and stops reconnecting
     */
    void disconnect();

    bool isConnected() const { return _connected; }
    bool isReconnecting() const { return _reconnecting; }

    /**
     * @brief Sends a fire-and-forget event
     *
     * While disconnected the frame is queued and flushed on the next connect.
     * @return SerializationFailed if the event could not be encoded
     */
    Result<void> send(const SignalEvent& event);

    /**
     * @brief Sends an event and waits for its acknowledgement
     *
     * Uses the configured default timeout and retry budget.
     * @param event Event to send
     * @param callback Receives the Ack, or Offline/AckTimeout/SerializationFailed
     */
    void request(const SignalEvent& event, AckCallback callback);

    /**
     * @brief Sends an event and waits for its acknowledgement
     * @param event Event to send
     * @param options Timeout and retry budget for this request
     * @param callback Receives the Ack, or Offline/AckTimeout/SerializationFailed
     */
    void request(const SignalEvent& event, RequestOptions options, AckCallback callback);

    /**
     * @brief Default options derived from SignalingConfig
     */
    RequestOptions defaultRequestOptions() const;

    /**
     * @brief Subscribes to one event type
     * @return Id for off()
     */
    template<typename E>
    SubscriptionId on(std::function<void(const E&)> handler) {
        constexpr size_t index = signalEventIndex<E>();
        std::lock_guard<std::mutex> lock(_handlerMutex);
        SubscriptionId id = _nextSubscriptionId++;
        _handlers[index].push_back(Subscription{id, [h = std::move(handler)](const SignalEvent& event) {
            h(std::get<E>(event));
        }});
        return id;
    }

    /**
     * @brief Removes a subscription registered with on(), onConnect() or onDisconnect()
     * @return true if the subscription existed
     */
    bool off(SubscriptionId id);

    /**
     * @brief Number of live handlers for one event type
     */
    template<typename E>
    size_t listenerCount() const {
        constexpr size_t index = signalEventIndex<E>();
        std::lock_guard<std::mutex> lock(_handlerMutex);
        return _handlers[index].size();
    }

    /**
     * @brief Called on the scheduler thread after every (re)connect
     */
    SubscriptionId onConnect(ConnectionCallback callback);

    /**
     * @brief Called on the scheduler thread when an established link drops
     */
    SubscriptionId onDisconnect(ConnectionCallback callback);

    /**
     * @brief Requests still waiting for an acknowledgement or a retry
     */
    size_t pendingRequestCount() const { return _live.size(); }

    // EntropyObject interface
    const char* className() const noexcept override { return "SignalingChannel"; }
    uint64_t classHash() const noexcept override;
    std::string toString() const override;

private:
    struct Subscription {
        SubscriptionId id;
        std::function<void(const SignalEvent&)> handler;
    };

    struct ConnectionSubscription {
        SubscriptionId id;
        ConnectionCallback callback;
    };

    struct RequestState {
        SignalEvent event;
        RequestOptions options;
        AckCallback callback;
        uint64_t requestId = 0;                         ///< Id of the attempt in flight
        int attempt = 0;
        Scheduler::TimerId timer = Scheduler::InvalidTimer;
        bool done = false;
    };

    struct ConnectWaiter {
        Scheduler::TimerId timer;
        std::function<void(bool)> callback;
    };

    void handleFrame(const std::vector<uint8_t>& frame);
    void handleTransportState(ConnectionState state);
    void dispatch(const SignalEvent& event);

    void startAttempt(const std::shared_ptr<RequestState>& state);
    void sendAttempt(const std::shared_ptr<RequestState>& state);
    void handleAck(uint64_t requestId, const Ack& ack);
    void handleAttemptTimeout(uint64_t requestId);
    void retryOrFail(const std::shared_ptr<RequestState>& state, CallError error, const std::string& message);
    void finish(const std::shared_ptr<RequestState>& state, Result<Ack> result);

    void waitForConnect(std::function<void(bool)> callback);
    void resolveConnectWaiters(bool connected);
    void enqueue(std::vector<uint8_t> frame);
    void flushOutbox();
    void fireConnectionCallbacks(const std::vector<ConnectionSubscription>& subscriptions);

    SignalingTransport& _transport;
    Scheduler& _scheduler;
    SignalingConfig _config;

    std::shared_ptr<int> _lifetime = std::make_shared<int>(0);   ///< Expires with this channel

    bool _connected = false;
    bool _reconnecting = false;
    bool _everConnected = false;
    bool _closing = false;

    uint64_t _nextRequestId = 1;
    std::unordered_map<uint64_t, std::shared_ptr<RequestState>> _requests;    ///< Attempts in flight, keyed by attempt id
    std::vector<std::shared_ptr<RequestState>> _live;                         ///< Every unfinished request
    uint64_t _nextWaiterId = 1;
    std::unordered_map<uint64_t, ConnectWaiter> _connectWaiters;
    std::deque<std::vector<uint8_t>> _outbox;
    std::mt19937 _rng{std::random_device{}()};

    mutable std::mutex _handlerMutex;
    SubscriptionId _nextSubscriptionId = 1;
    std::array<std::vector<Subscription>, std::variant_size_v<SignalEvent>> _handlers;
    std::vector<ConnectionSubscription> _connectCallbacks;
    std::vector<ConnectionSubscription> _disconnectCallbacks;
};

} // namespace EntropyEngine::Calling
