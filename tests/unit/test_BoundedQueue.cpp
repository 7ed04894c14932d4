#include <gtest/gtest.h>
#include "concurrency/BoundedQueue.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace gdfs::concurrency;
using namespace std::chrono_literals;

TEST(BoundedQueueTest, PreservesOrder) {
    BoundedQueue<int> q(4);
    for (int i = 0; i < 4; ++i) EXPECT_TRUE(q.push(i));
    for (int i = 0; i < 4; ++i) EXPECT_EQ(q.pop(), i);
}

TEST(BoundedQueueTest, RejectsZeroCapacity) {
    EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}

TEST(BoundedQueueTest, CloseDrainsThenEnds) {
    BoundedQueue<int> q(2);
    q.push(1);
    q.close();
    EXPECT_FALSE(q.push(2));
    EXPECT_EQ(q.pop(), 1);
    EXPECT_EQ(q.pop(), std::nullopt);
}

TEST(BoundedQueueTest, FullQueueBlocksProducer) {
    BoundedQueue<int> q(1);
    ASSERT_TRUE(q.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        q.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());

    EXPECT_EQ(q.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(q.pop(), 2);
}

TEST(BoundedQueueTest, CloseWakesBlockedProducer) {
    BoundedQueue<int> q(1);
    q.push(1);

    std::atomic<bool> result{true};
    std::thread producer([&] { result = q.push(2); });

    std::this_thread::sleep_for(20ms);
    q.close();
    producer.join();
    EXPECT_FALSE(result.load());
    EXPECT_EQ(q.totalPushed(), 1u);
}
