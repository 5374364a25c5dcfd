// ============================================================================
// LibuvExecutor Unit Tests
// ============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "offload/io/libuv_executor.hpp"

using namespace offload;
using namespace std::chrono_literals;

// ============================================================================
// Basic Executor Tests
// ============================================================================

TEST(LibuvExecutorTest, CreateAndDestroy) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    EXPECT_FALSE(executor.IsRunning());
    EXPECT_NE(executor.GetLoop(), nullptr);
}

TEST(LibuvExecutorTest, RunOnceEmpty) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    executor.RunOnce();
    EXPECT_FALSE(executor.IsRunning());
}

TEST(LibuvExecutorTest, PostCallback) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    bool called = false;

    executor.Post([&]() {
        called = true;
        executor.Stop();
    });

    executor.Run();
    EXPECT_TRUE(called);
}

TEST(LibuvExecutorTest, PostPreservesOrder) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    std::vector<int> results;

    executor.Post([&]() { results.push_back(1); });
    executor.Post([&]() { results.push_back(2); });
    executor.Post([&]() {
        results.push_back(3);
        executor.Stop();
    });

    executor.Run();

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0], 1);
    EXPECT_EQ(results[1], 2);
    EXPECT_EQ(results[2], 3);
}

// ============================================================================
// Timer Tests
// ============================================================================

TEST(LibuvExecutorTest, ScheduleAfterWaitsForDelay) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;

    auto start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::duration fired_after{};
    executor.ScheduleAfter(50ms, [&]() {
        fired_after = std::chrono::steady_clock::now() - start;
        executor.Stop();
    });

    executor.Run();
    EXPECT_GE(fired_after, 45ms);
}

TEST(LibuvExecutorTest, TimersFireInDeadlineOrder) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    std::vector<int> order;

    executor.ScheduleAfter(60ms, [&]() {
        order.push_back(3);
        executor.Stop();
    });
    executor.ScheduleAfter(10ms, [&]() { order.push_back(1); });
    executor.ScheduleAfter(30ms, [&]() { order.push_back(2); });

    executor.Run();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(LibuvExecutorTest, TimerIdsAreNonZeroAndDistinct) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;

    TimerId a = executor.ScheduleAfter(1s, [] {});
    TimerId b = executor.ScheduleAfter(1s, [] {});
    EXPECT_NE(a, 0u);
    EXPECT_NE(b, 0u);
    EXPECT_NE(a, b);
}

TEST(LibuvExecutorTest, CancelTimerBeforeItReachesLoop) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    bool fired = false;

    TimerId id = executor.ScheduleAfter(10ms, [&]() { fired = true; });
    EXPECT_TRUE(executor.CancelTimer(id));
    EXPECT_FALSE(executor.CancelTimer(id));

    executor.ScheduleAfter(50ms, [&]() { executor.Stop(); });
    executor.Run();
    EXPECT_FALSE(fired);
}

TEST(LibuvExecutorTest, CancelArmedTimer) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    bool fired = false;

    TimerId id = executor.ScheduleAfter(40ms, [&]() { fired = true; });
    // Let the loop pick the request up and start the uv timer
    executor.ScheduleAfter(5ms, [&]() { EXPECT_TRUE(executor.CancelTimer(id)); });
    executor.ScheduleAfter(80ms, [&]() { executor.Stop(); });

    executor.Run();
    EXPECT_FALSE(fired);
}

TEST(LibuvExecutorTest, CancelFiredTimerReturnsFalse) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;

    TimerId id = executor.ScheduleAfter(1ms, [&]() { executor.Stop(); });
    executor.Run();
    EXPECT_FALSE(executor.CancelTimer(id));
}

TEST(LibuvExecutorTest, RescheduleFromTimerCallback) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    int ticks = 0;

    std::function<void()> tick = [&]() {
        if (++ticks == 5) {
            executor.Stop();
            return;
        }
        executor.ScheduleAfter(5ms, tick);
    };
    executor.ScheduleAfter(5ms, tick);

    executor.Run();
    EXPECT_EQ(ticks, 5);
}

TEST(LibuvExecutorTest, DestroyWithPendingTimers) {
    bool fired = false;
    {
        auto executor_ptr = LibuvExecutor::Create().Value();
        auto& executor = *executor_ptr;
        executor.ScheduleAfter(10s, [&]() { fired = true; });
        executor.RunOnce();
    }
    EXPECT_FALSE(fired);
}

// ============================================================================
// Cross-Thread Use
// ============================================================================

TEST(LibuvExecutorTest, ScheduleAfterFromOtherThread) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    std::atomic<int> fired{0};
    constexpr int kTimerCount = 20;

    std::thread loop_thread([&]() { executor.Run(); });

    std::this_thread::sleep_for(50ms);

    // libuv timers are created on the loop thread, never here
    for (int i = 0; i < kTimerCount; ++i) {
        executor.ScheduleAfter(5ms, [&]() { fired++; });
    }

    auto deadline = std::chrono::steady_clock::now() + 5000ms;
    while (fired.load() < kTimerCount && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    executor.Post([&]() { executor.Stop(); });

    loop_thread.join();

    EXPECT_EQ(fired.load(), kTimerCount);
}

TEST(LibuvExecutorTest, IsRunningFromOtherThread) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;

    EXPECT_FALSE(executor.IsRunning());

    executor.ScheduleAfter(100ms, [&]() { executor.Stop(); });

    std::thread loop_thread([&]() { executor.Run(); });

    bool saw_running = false;
    for (int i = 0; i < 100; ++i) {
        if (executor.IsRunning()) {
            saw_running = true;
            break;
        }
        std::this_thread::sleep_for(1ms);
    }

    EXPECT_TRUE(saw_running);

    loop_thread.join();

    EXPECT_FALSE(executor.IsRunning());
}

TEST(LibuvExecutorTest, StopWithoutRun) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    executor.Stop();
    EXPECT_FALSE(executor.IsRunning());
}
