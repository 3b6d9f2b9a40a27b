#include <gtest/gtest.h>
#include "BTR/BoundedQueue.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace BTR;

TEST(BoundedQueueTest, PreservesFifoOrder) {
    BoundedQueue<int> queue(10);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(queue.tryPush(i));
    }
    for (int i = 0; i < 5; ++i) {
        auto item = queue.tryPop();
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(*item, i);
    }
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(BoundedQueueTest, TryPushDropsWhenFull) {
    BoundedQueue<std::string> queue(2);
    EXPECT_TRUE(queue.tryPush("a"));
    EXPECT_TRUE(queue.tryPush("b"));
    EXPECT_FALSE(queue.tryPush("c"));
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(*queue.tryPop(), "a");
    EXPECT_TRUE(queue.tryPush("c"));
}

TEST(BoundedQueueTest, ZeroCapacityBecomesOne) {
    BoundedQueue<int> queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
    EXPECT_TRUE(queue.tryPush(1));
    EXPECT_FALSE(queue.tryPush(2));
}

TEST(BoundedQueueTest, CloseDrainsThenReturnsNullopt) {
    BoundedQueue<int> queue(4);
    queue.tryPush(1);
    queue.tryPush(2);
    queue.close();

    EXPECT_TRUE(queue.isClosed());
    EXPECT_FALSE(queue.tryPush(3));
    EXPECT_FALSE(queue.push(3));
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedQueueTest, CloseWakesBlockedConsumer) {
    BoundedQueue<int> queue(1);
    std::atomic<bool> returned{false};
    std::thread consumer([&] {
        auto item = queue.pop();
        EXPECT_FALSE(item.has_value());
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(returned.load());
    queue.close();
    consumer.join();
    EXPECT_TRUE(returned.load());
}

TEST(BoundedQueueTest, BlockingPushWaitsForRoom) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        EXPECT_TRUE(queue.push(2));
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.pop(), 2);
}

TEST(BoundedQueueTest, SingleProducerSingleConsumerKeepsOrder) {
    constexpr int kItems = 1000;
    BoundedQueue<int> queue(10);
    std::vector<int> received;

    std::thread consumer([&] {
        while (auto item = queue.pop()) {
            received.push_back(*item);
        }
    });
    for (int i = 0; i < kItems; ++i) {
        ASSERT_TRUE(queue.push(i));
    }
    queue.close();
    consumer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(kItems));
    for (int i = 0; i < kItems; ++i) {
        EXPECT_EQ(received[i], i);
    }
}
