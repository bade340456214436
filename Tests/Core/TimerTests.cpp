/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <atomic>
#include <memory>
#include <stdexcept>
#include "Core/TimerService.h"

using namespace Palisade::Core;
using namespace std::chrono_literals;

class TimerServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        timerService = std::make_unique<TimerService>();
        timerService->load();
        timerService->start();
    }

    void TearDown() override {
        // stop() joins the scheduler thread, so no callback outlives the fixture
        timerService->stop();
        timerService->unload();
        timerService.reset();
    }

    template <typename Pred>
    static bool waitFor(Pred pred, std::chrono::milliseconds limit = 1000ms) {
        auto start = std::chrono::steady_clock::now();
        while (!pred()) {
            if (std::chrono::steady_clock::now() - start > limit) return false;
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

    std::unique_ptr<TimerService> timerService;
};

TEST_F(TimerServiceTest, ServiceLifecycle) {
    EXPECT_TRUE(timerService->isRunning());
    EXPECT_STREQ(timerService->id(), "com.palisade.core.timers");
    EXPECT_EQ(timerService->getActiveTimerCount(), 0u);
}

TEST(TimerServiceStopped, SchedulingRequiresStart) {
    TimerService timers;
    timers.load();
    EXPECT_THROW(timers.scheduleTimer(10ms, [] {}), std::runtime_error);
}

TEST_F(TimerServiceTest, OneShotTimer_Fires) {
    auto fired = std::make_shared<std::atomic<bool>>(false);

    auto timer = timerService->scheduleTimer(
        50ms,
        [fired]() { fired->store(true, std::memory_order_release); },
        false  // One-shot
    );

    EXPECT_TRUE(timer.isValid());
    EXPECT_FALSE(timer.isRepeating());
    EXPECT_TRUE(waitFor([&] { return fired->load(std::memory_order_acquire); }));
}

// TIMING-SENSITIVE: scheduling variance on loaded CI machines
TEST_F(TimerServiceTest, OneShotTimer_DoesNotRepeat) {
    auto count = std::make_shared<std::atomic<int>>(0);

    auto timer = timerService->scheduleTimer(
        30ms,
        [count]() { count->fetch_add(1, std::memory_order_relaxed); },
        false
    );

    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(count->load(std::memory_order_acquire), 1);
    EXPECT_EQ(timerService->getActiveTimerCount(), 0u);
}

// TIMING-SENSITIVE: scheduling variance on loaded CI machines
TEST_F(TimerServiceTest, RepeatingTimer_FiresMultipleTimes) {
    auto count = std::make_shared<std::atomic<int>>(0);

    auto timer = timerService->scheduleTimer(
        50ms,
        [count]() { count->fetch_add(1, std::memory_order_relaxed); },
        true  // Repeating
    );

    EXPECT_TRUE(timer.isRepeating());
    EXPECT_EQ(timer.getInterval(), 50ms);

    std::this_thread::sleep_for(275ms);

    // Missed intervals are skipped, never replayed in a burst
    int finalCount = count->load(std::memory_order_acquire);
    EXPECT_GE(finalCount, 3);
    EXPECT_LE(finalCount, 6);
}

TEST_F(TimerServiceTest, RepeatingTimerNeedsPositiveInterval) {
    EXPECT_THROW(timerService->scheduleTimer(0ms, [] {}, true), std::invalid_argument);
}

TEST_F(TimerServiceTest, TimerCancellation_PreventsExecution) {
    auto fired = std::make_shared<std::atomic<bool>>(false);

    auto timer = timerService->scheduleTimer(
        100ms,
        [fired]() { fired->store(true, std::memory_order_release); },
        false
    );

    timer.invalidate();
    EXPECT_FALSE(timer.isValid());
    timer.invalidate();  // Idempotent

    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(fired->load(std::memory_order_acquire));
}

TEST_F(TimerServiceTest, MovedTimerKeepsTheScheduleAndReassignmentCancels) {
    auto first = std::make_shared<std::atomic<bool>>(false);
    auto second = std::make_shared<std::atomic<bool>>(false);

    auto original = timerService->scheduleTimer(50ms, [first]() { first->store(true); });
    Timer owner(std::move(original));
    EXPECT_FALSE(original.isValid());
    EXPECT_TRUE(owner.isValid());
    original.invalidate();  // Moved-from handle no longer controls the schedule

    owner = timerService->scheduleTimer(50ms, [second]() { second->store(true); });
    EXPECT_TRUE(owner.isValid());

    EXPECT_TRUE(waitFor([&] { return second->load(); }));
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(first->load());
}

// TIMING-SENSITIVE: scheduling variance on loaded CI machines
TEST_F(TimerServiceTest, RepeatingTimer_CancellationStopsFiring) {
    auto count = std::make_shared<std::atomic<int>>(0);

    auto timer = timerService->scheduleTimer(
        30ms,
        [count]() { count->fetch_add(1, std::memory_order_relaxed); },
        true
    );

    ASSERT_TRUE(waitFor([&] { return count->load() >= 2; }));
    timer.invalidate();
    int countBeforeCancel = count->load(std::memory_order_acquire);

    std::this_thread::sleep_for(150ms);
    EXPECT_LE(count->load(std::memory_order_acquire), countBeforeCancel + 1);  // One in-flight firing
}

TEST_F(TimerServiceTest, TimerCanInvalidateItselfFromItsCallback) {
    auto count = std::make_shared<std::atomic<int>>(0);
    auto holder = std::make_shared<Timer>();

    *holder = timerService->scheduleTimer(
        20ms,
        [count, weak = std::weak_ptr<Timer>(holder)]() {
            count->fetch_add(1);
            if (auto t = weak.lock()) t->invalidate();
        },
        true
    );

    ASSERT_TRUE(waitFor([&] { return count->load() >= 1; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(count->load(), 1);
}

TEST_F(TimerServiceTest, MultipleTimers_ExecuteIndependently) {
    auto count1 = std::make_shared<std::atomic<int>>(0);
    auto count2 = std::make_shared<std::atomic<int>>(0);

    auto timer1 = timerService->scheduleTimer(
        40ms, [count1]() { count1->fetch_add(1, std::memory_order_relaxed); }, true);
    auto timer2 = timerService->scheduleTimer(
        60ms, [count2]() { count2->fetch_add(1, std::memory_order_relaxed); }, true);

    EXPECT_EQ(timerService->getActiveTimerCount(), 2u);
    EXPECT_TRUE(waitFor([&] { return count1->load() >= 3 && count2->load() >= 2; }));

    timer1.invalidate();
    EXPECT_EQ(timerService->getActiveTimerCount(), 1u);
}

TEST_F(TimerServiceTest, TimerMove_TransfersOwnership) {
    auto count = std::make_shared<std::atomic<int>>(0);

    auto timer1 = timerService->scheduleTimer(
        30ms, [count]() { count->fetch_add(1, std::memory_order_relaxed); }, true);

    Timer timer2 = std::move(timer1);
    EXPECT_FALSE(timer1.isValid());
    EXPECT_TRUE(timer2.isValid());

    EXPECT_TRUE(waitFor([&] { return count->load() >= 2; }));

    timer2.invalidate();
    EXPECT_FALSE(timer2.isValid());
}

// TIMING-SENSITIVE: scheduling variance on loaded CI machines
TEST_F(TimerServiceTest, TimerDestruction_CancelsTimer) {
    auto count = std::make_shared<std::atomic<int>>(0);

    {
        auto timer = timerService->scheduleTimer(
            30ms, [count]() { count->fetch_add(1, std::memory_order_relaxed); }, true);
        std::this_thread::sleep_for(100ms);
    }

    int countAtDestruction = count->load(std::memory_order_acquire);
    std::this_thread::sleep_for(150ms);
    EXPECT_LE(count->load(std::memory_order_acquire), countAtDestruction + 1);
}

TEST_F(TimerServiceTest, StopDiscardsPendingTimers) {
    auto fired = std::make_shared<std::atomic<bool>>(false);
    auto timer = timerService->scheduleTimer(50ms, [fired]() { fired->store(true); });

    timerService->stop();
    EXPECT_EQ(timerService->getActiveTimerCount(), 0u);
    std::this_thread::sleep_for(120ms);
    EXPECT_FALSE(fired->load());

    timerService->start();  // TearDown stops it again
}

TEST_F(TimerServiceTest, VeryShortInterval_StillWorks) {
    auto count = std::make_shared<std::atomic<int>>(0);

    auto timer = timerService->scheduleTimer(
        1ms, [count]() { count->fetch_add(1, std::memory_order_relaxed); }, true);

    EXPECT_TRUE(waitFor([&] { return count->load() >= 10; }));
}
