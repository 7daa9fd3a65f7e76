/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#pragma once

#include <EntropyCore.h>
#include "Scheduler.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace EntropyEngine::Calling {

/**
 * @brief Thread-backed Scheduler
 *
 * Owns one worker thread that drains posted tasks and fires due timers in
 * deadline order. Timers with equal deadlines fire in scheduling order.
 *
 * Thread Safety: post(), schedule() and cancel() may be called from any thread.
 * A task that throws is logged and does not stop the loop.
 */
class EventLoop : public Core::EntropyObject, public Scheduler {
public:
    EventLoop() = default;
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Starts the worker thread (idempotent)
     */
    void start();

    /**
     * @brief Stops the worker and drops pending work (idempotent)
     *
     * Must not be called from the loop thread.
     */
    void stop();

    /**
     * @brief Whether the caller is running on the loop thread
     */
    bool isLoopThread() const;

    bool isRunning() const { return _running.load(std::memory_order_acquire); }

    // Scheduler interface
    Clock::time_point now() const override { return Clock::now(); }
    void post(Task task) override;
    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TimerId id) override;

    // EntropyObject interface
    const char* className() const noexcept override { return "EventLoop"; }
    uint64_t classHash() const noexcept override;
    std::string toString() const override;

private:
    struct TimerKey {
        Clock::time_point deadline;
        TimerId id;
        bool operator<(const TimerKey& other) const {
            return deadline != other.deadline ? deadline < other.deadline : id < other.id;
        }
    };

    void run();
    void runTask(Task& task) noexcept;

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<Task> _tasks;
    std::map<TimerKey, Task> _timers;
    std::unordered_map<TimerId, Clock::time_point> _timerDeadlines;
    TimerId _nextTimerId = 1;

    std::thread _worker;
    std::atomic<bool> _running{false};
};

} // namespace EntropyEngine::Calling
