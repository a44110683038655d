#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "common/timer_scheduler.hpp"

using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 2000ms)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

TEST(TimerScheduler, OneShotFiresOnce) {
    TimerScheduler sched(1);
    std::atomic<int> hits{0};
    sched.registerTimer("once", 20ms, [&] { ++hits; });

    ASSERT_TRUE(wait_until([&] { return hits.load() == 1; }));
    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(hits.load(), 1);
    EXPECT_EQ(sched.pending(), 0u);
}

TEST(TimerScheduler, RepeatingTimerFiresUntilCancelled) {
    TimerScheduler sched(1);
    std::atomic<int> hits{0};
    auto id = sched.registerRepeatingTimer("tick", 10ms, [&] { ++hits; });
    EXPECT_EQ(sched.pending(), 1u);

    ASSERT_TRUE(wait_until([&] { return hits.load() >= 3; }));
    EXPECT_TRUE(sched.cancelTimer(id));
    int after = hits.load();
    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(hits.load(), after);
    EXPECT_FALSE(sched.cancelTimer(id));
    EXPECT_EQ(sched.pending(), 0u);
}

TEST(TimerScheduler, CancelledBeforeDueNeverRuns) {
    TimerScheduler sched(1);
    std::atomic<bool> ran{false};
    auto id = sched.registerTimer("later", 50ms, [&] { ran = true; });
    EXPECT_TRUE(sched.cancelTimer(id));
    std::this_thread::sleep_for(120ms);
    EXPECT_FALSE(ran.load());
}

TEST(TimerScheduler, CancelWaitsForRunningTask) {
    TimerScheduler sched(1);
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    auto id = sched.registerTimer("slow", 1ms, [&] {
        started = true;
        std::this_thread::sleep_for(100ms);
        finished = true;
    });

    ASSERT_TRUE(wait_until([&] { return started.load(); }));
    sched.cancelTimer(id);
    EXPECT_TRUE(finished.load());
}

TEST(TimerScheduler, CancelFromInsideTaskDoesNotDeadlock) {
    TimerScheduler sched(1);
    std::atomic<int> hits{0};
    std::atomic<std::size_t> id{0};
    id = sched.registerRepeatingTimer("self-cancel", 20ms, [&] {
        ++hits;
        sched.cancelTimer(id.load());
    });

    ASSERT_TRUE(wait_until([&] { return hits.load() >= 1; }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(hits.load(), 1);
}

TEST(TimerScheduler, RepeatingRunsNeverOverlap) {
    TimerScheduler sched(4);
    std::atomic<int> running{0};
    std::atomic<int> maxRunning{0};
    std::atomic<int> runs{0};
    auto id = sched.registerRepeatingTimer("sweep", 2ms, [&] {
        int now = ++running;
        int prev = maxRunning.load();
        while (now > prev && !maxRunning.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(20ms);
        --running;
        ++runs;
    });

    ASSERT_TRUE(wait_until([&] { return runs.load() >= 3; }));
    sched.cancelTimer(id);
    EXPECT_EQ(maxRunning.load(), 1);
}

TEST(TimerScheduler, ThrowingTaskDoesNotStopScheduler) {
    TimerScheduler sched(1);
    std::atomic<bool> ran{false};
    sched.registerTimer("boom", 5ms, [] { throw std::runtime_error("boom"); });
    sched.registerTimer("after", 30ms, [&] { ran = true; });
    EXPECT_TRUE(wait_until([&] { return ran.load(); }));
}

TEST(TimerScheduler, ShutdownIsIdempotentAndRejectsNewTimers) {
    TimerScheduler sched(2);
    sched.registerRepeatingTimer("noop", 5ms, [] {});
    sched.shutdown();
    sched.shutdown();
    EXPECT_THROW(sched.registerTimer("late", 1ms, [] {}), std::runtime_error);
    EXPECT_THROW(sched.registerRepeatingTimer("zero", 0ms, [] {}), std::invalid_argument);
}
