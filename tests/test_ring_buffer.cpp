#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "runner/ring_buffer.hpp"

TEST(RingBuffer, ZeroCapacityRejected) {
    EXPECT_THROW(RingBuffer<int>(0), std::invalid_argument);
}

TEST(RingBuffer, KeepsInsertionOrderBelowCapacity) {
    RingBuffer<int> rb(4);
    rb.push(1);
    rb.push(2);
    rb.push(3);
    EXPECT_EQ(rb.length(), 3u);
    EXPECT_EQ(rb.snapshot(), (std::vector<int>{1, 2, 3}));
}

TEST(RingBuffer, OverwritesOldestWhenFull) {
    const std::size_t cap = 5;
    for (std::size_t k : {0u, 1u, 4u, 5u, 12u}) {
        RingBuffer<int> rb(cap);
        const int total = static_cast<int>(cap + k);
        for (int i = 0; i < total; ++i) rb.push(i);

        auto snap = rb.snapshot();
        ASSERT_EQ(snap.size(), cap) << "k=" << k;
        for (std::size_t i = 0; i < cap; ++i) {
            EXPECT_EQ(snap[i], total - static_cast<int>(cap) + static_cast<int>(i)) << "k=" << k;
        }
    }
}

TEST(RingBuffer, ClearEmptiesBuffer) {
    RingBuffer<std::string> rb(3);
    rb.push("a");
    rb.push("b");
    rb.clear();
    EXPECT_EQ(rb.length(), 0u);
    EXPECT_TRUE(rb.snapshot().empty());

    rb.push("c");
    EXPECT_EQ(rb.snapshot(), (std::vector<std::string>{"c"}));
}

TEST(RingBuffer, SnapshotIsConsistentUnderConcurrentPush) {
    RingBuffer<int> rb(64);
    std::atomic<bool> done{false};

    std::thread writer([&] {
        for (int i = 0; i < 20000; ++i) rb.push(i);
        done = true;
    });

    while (!done) {
        auto snap = rb.snapshot();
        // 快照内必须是连续递增的一段
        for (std::size_t i = 1; i < snap.size(); ++i) {
            ASSERT_EQ(snap[i], snap[i - 1] + 1);
        }
    }
    writer.join();
    EXPECT_EQ(rb.length(), 64u);
    EXPECT_EQ(rb.snapshot().back(), 19999);
}
