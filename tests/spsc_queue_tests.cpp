#include <gtest/gtest.h>

#include <cstdint>
#include <thread>

#include "utils/spsc_queue.hpp"

TEST(SpscQueue, CapacityRoundsUpToPowerOfTwo) {
    utils::SpscQueue<int> q(5);
    EXPECT_EQ(q.capacity(), 8u);

    utils::SpscQueue<int> tiny(0);
    EXPECT_EQ(tiny.capacity(), 2u);
}

TEST(SpscQueue, PushPopFifoAndFull) {
    utils::SpscQueue<int> q(4);
    EXPECT_TRUE(q.empty());

    EXPECT_TRUE(q.try_push(1));
    EXPECT_TRUE(q.try_push(2));
    EXPECT_TRUE(q.try_push(3));
    EXPECT_FALSE(q.try_push(4)); // one slot stays free
    EXPECT_EQ(q.size_approx(), 3u);

    int v = 0;
    ASSERT_TRUE(q.try_pop(v));
    EXPECT_EQ(v, 1);
    EXPECT_TRUE(q.try_push(4));

    ASSERT_TRUE(q.try_pop(v));
    EXPECT_EQ(v, 2);
    ASSERT_TRUE(q.try_pop(v));
    EXPECT_EQ(v, 3);
    ASSERT_TRUE(q.try_pop(v));
    EXPECT_EQ(v, 4);
    EXPECT_FALSE(q.try_pop(v));
    EXPECT_TRUE(q.empty());
}

TEST(SpscQueue, ProducerConsumerThreadsKeepOrder) {
    constexpr std::uint64_t N = 200000;
    utils::SpscQueue<std::uint64_t> q(1024);

    std::thread producer([&]() {
        for (std::uint64_t i = 0; i < N; ++i) {
            while (!q.try_push(i)) {
                std::this_thread::yield();
            }
        }
    });

    std::uint64_t expected = 0;
    std::uint64_t v        = 0;
    bool in_order = true;
    while (expected < N) {
        if (!q.try_pop(v)) {
            std::this_thread::yield();
            continue;
        }
        if (v != expected) {
            in_order = false;
        }
        ++expected;
    }
    producer.join();

    EXPECT_TRUE(in_order);
    EXPECT_TRUE(q.empty());
}
