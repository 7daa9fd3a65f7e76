/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

/*
 * Virtual-time scheduler for deterministic tests. Nothing runs until the test
 * calls runPending() or advance().
 */
#pragma once

#include "../src/Calling/Core/Scheduler.h"

#include <deque>
#include <map>
#include <utility>

namespace EntropyEngine::Calling::Tests {

class ManualScheduler : public Scheduler {
public:
    Clock::time_point now() const override { return _now; }

    void post(Task task) override {
        _posted.push_back(std::move(task));
    }

    TimerId schedule(std::chrono::milliseconds delay, Task task) override {
        TimerId id = _nextTimerId++;
        _timers.emplace(std::make_pair(_now + delay, id), std::move(task));
        return id;
    }

    bool cancel(TimerId id) override {
        for (auto it = _timers.begin(); it != _timers.end(); ++it) {
            if (it->first.second == id) {
                _timers.erase(it);
                return true;
            }
        }
        return false;
    }

    // Run posted tasks (and tasks they post) until the queue is empty
    size_t runPending() {
        size_t ran = 0;
        while (!_posted.empty()) {
            auto task = std::move(_posted.front());
            _posted.pop_front();
            task();
            ++ran;
        }
        return ran;
    }

    // Move virtual time forward, firing due timers in deadline order
    void advance(std::chrono::milliseconds delta) {
        runPending();
        auto target = _now + delta;
        while (!_timers.empty() && _timers.begin()->first.first <= target) {
            auto it = _timers.begin();
            _now = it->first.first;
            auto task = std::move(it->second);
            _timers.erase(it);
            task();
            runPending();
        }
        _now = target;
    }

    size_t pendingTimers() const { return _timers.size(); }
    size_t pendingTasks() const { return _posted.size(); }

private:
    Clock::time_point _now{std::chrono::hours(1)};
    TimerId _nextTimerId = 1;
    std::deque<Task> _posted;
    std::map<std::pair<Clock::time_point, TimerId>, Task> _timers;
};

} // namespace EntropyEngine::Calling::Tests
