/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/**
 * @file Scheduler.h
 * @brief Single logical thread that runs all call logic
 *
 * Every component of the calling layer mutates its state only from tasks run
 * by one Scheduler. Transport threads hand work over with post(); timeouts are
 * armed with schedule() and are always cancellable.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace EntropyEngine::Calling {

class Scheduler {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    static constexpr TimerId InvalidTimer = 0;

    virtual ~Scheduler() = default;

    /**
     * @brief Current time as seen by this scheduler
     */
    virtual Clock::time_point now() const = 0;

    /**
     * @brief Queues a task to run on the scheduler thread
     *
     * Thread-safe. Tasks posted from the same thread run in posting order.
     */
    virtual void post(Task task) = 0;

    /**
     * @brief Runs a task once after a delay
     * @param delay Delay relative to now()
     * @param task Task to run on the scheduler thread
     * @return Id usable with cancel(), never InvalidTimer
     */
    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;

    /**
     * @brief Cancels a pending timer
     * @return true if the timer was pending and will not fire
     */
    virtual bool cancel(TimerId id) = 0;
};

} // namespace EntropyEngine::Calling
