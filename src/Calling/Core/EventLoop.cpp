/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "EventLoop.h"

#include <Logging/Logger.h>

#include <format>

namespace EntropyEngine::Calling
{

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::start() {
    if (_running.exchange(true)) return;
    _worker = std::thread([this]() { run(); });
}

void EventLoop::stop() {
    if (!_running.exchange(false)) return;
    {
        // The worker checks _running under the mutex before waiting
        std::lock_guard<std::mutex> lock(_mutex);
    }
    _cv.notify_all();
    if (_worker.joinable()) {
        _worker.join();
    }

    std::lock_guard<std::mutex> lock(_mutex);
    if (!_tasks.empty() || !_timers.empty()) {
        ENTROPY_LOG_DEBUG(std::format("EventLoop stopped with {} tasks and {} timers pending",
                                      _tasks.size(), _timers.size()));
    }
    _tasks.clear();
    _timers.clear();
    _timerDeadlines.clear();
}

bool EventLoop::isLoopThread() const {
    return std::this_thread::get_id() == _worker.get_id();
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _tasks.push_back(std::move(task));
    }
    _cv.notify_one();
}

Scheduler::TimerId EventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        id = _nextTimerId++;
        auto deadline = Clock::now() + delay;
        _timers.emplace(TimerKey{deadline, id}, std::move(task));
        _timerDeadlines.emplace(id, deadline);
    }
    _cv.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _timerDeadlines.find(id);
    if (it == _timerDeadlines.end()) {
        return false;
    }
    _timers.erase(TimerKey{it->second, id});
    _timerDeadlines.erase(it);
    return true;
}

void EventLoop::run() {
    while (_running.load(std::memory_order_acquire)) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            while (_running.load(std::memory_order_acquire) && !task) {
                if (!_tasks.empty()) {
                    task = std::move(_tasks.front());
                    _tasks.pop_front();
                    break;
                }

                if (!_timers.empty()) {
                    auto first = _timers.begin();
                    if (first->first.deadline <= Clock::now()) {
                        task = std::move(first->second);
                        _timerDeadlines.erase(first->first.id);
                        _timers.erase(first);
                        break;
                    }
                    _cv.wait_until(lock, first->first.deadline);
                } else {
                    _cv.wait(lock);
                }
            }
        }

        if (task) {
            runTask(task);
        }
    }
}

void EventLoop::runTask(Task& task) noexcept {
    try {
        task();
    } catch (const std::exception& e) {
        ENTROPY_LOG_ERROR(std::format("EventLoop task threw: {}", e.what()));
    } catch (...) {
        ENTROPY_LOG_ERROR("EventLoop task threw a non-standard exception");
    }
}

uint64_t EventLoop::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(Core::TypeSystem::createTypeId<EventLoop>().id);
    return hash;
}

std::string EventLoop::toString() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return std::format("{}@{}(running={}, tasks={}, timers={})", className(), static_cast<const void*>(this),
                       _running.load(std::memory_order_relaxed), _tasks.size(), _timers.size());
}

}  // namespace EntropyEngine::Calling
