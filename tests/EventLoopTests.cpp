/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include <gtest/gtest.h>
#include "../src/Calling/Core/EventLoop.h"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace EntropyEngine::Calling;

TEST(EventLoopTests, PostedTasksRunInOrderOnLoopThread) {
    EventLoop loop;
    loop.start();

    std::mutex mutex;
    std::vector<int> order;
    std::promise<bool> onLoop;

    for (int i = 0; i < 5; ++i) {
        loop.post([&, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
    }
    loop.post([&]() { onLoop.set_value(loop.isLoopThread()); });

    auto future = onLoop.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(future.get());
    EXPECT_FALSE(loop.isLoopThread());

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(EventLoopTests, TimerFiresAfterDelay) {
    EventLoop loop;
    loop.start();

    std::atomic<bool> fired{false};
    auto start = std::chrono::steady_clock::now();
    std::promise<std::chrono::steady_clock::time_point> firedAt;
    loop.schedule(std::chrono::milliseconds(50), [&]() {
        fired = true;
        firedAt.set_value(std::chrono::steady_clock::now());
    });

    auto future = firedAt.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(fired.load());
    // 5ms slack for clock granularity
    EXPECT_GE(future.get() - start, std::chrono::milliseconds(45));
}

TEST(EventLoopTests, CanceledTimerNeverFires) {
    EventLoop loop;
    loop.start();

    std::atomic<bool> fired{false};
    auto id = loop.schedule(std::chrono::milliseconds(50), [&]() { fired = true; });
    EXPECT_NE(id, Scheduler::InvalidTimer);
    EXPECT_TRUE(loop.cancel(id));
    EXPECT_FALSE(loop.cancel(id));

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    EXPECT_FALSE(fired.load());
}

TEST(EventLoopTests, TimersFireInDeadlineOrder) {
    EventLoop loop;
    loop.start();

    std::mutex mutex;
    std::vector<int> order;
    std::promise<void> done;

    loop.schedule(std::chrono::milliseconds(60), [&]() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(2);
        }
        done.set_value();
    });
    loop.schedule(std::chrono::milliseconds(20), [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(1);
    });

    ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(EventLoopTests, StopIsIdempotentAndDropsPendingTimers) {
    EventLoop loop;
    loop.start();
    EXPECT_TRUE(loop.isRunning());

    std::atomic<bool> fired{false};
    loop.schedule(std::chrono::seconds(10), [&]() { fired = true; });

    loop.stop();
    loop.stop();
    EXPECT_FALSE(loop.isRunning());
    EXPECT_FALSE(fired.load());
}

TEST(EventLoopTests, ThrowingTaskDoesNotKillLoop) {
    EventLoop loop;
    loop.start();

    loop.post([]() { throw std::runtime_error("boom"); });

    std::promise<void> after;
    loop.post([&]() { after.set_value(); });
    EXPECT_EQ(after.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);
}

TEST(EventLoopTests, NonStandardThrowDoesNotKillLoop) {
    EventLoop loop;
    loop.start();

    loop.post([]() { throw 42; });
    loop.schedule(std::chrono::milliseconds(1), []() { throw "timer"; });

    std::promise<void> after;
    loop.schedule(std::chrono::milliseconds(20), [&]() { after.set_value(); });
    EXPECT_EQ(after.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(loop.isRunning());
}
