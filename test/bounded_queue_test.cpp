#include "core/bounded_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

namespace {

TEST(BoundedQueue, FifoOrder) {
    BoundedQueue<int> q(4);
    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));
    EXPECT_TRUE(q.tryPush(3));
    int v = 0;
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 1);
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 2);
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 3);
}

TEST(BoundedQueue, TryPushFailsWhenFull) {
    BoundedQueue<std::string> q(2);
    EXPECT_TRUE(q.tryPush("a"));
    EXPECT_TRUE(q.tryPush("b"));
    EXPECT_FALSE(q.tryPush("c"));
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.capacity(), 2u);
}

TEST(BoundedQueue, CloseDrainsThenEnds) {
    BoundedQueue<int> q(4);
    q.push(7);
    q.close();
    EXPECT_FALSE(q.push(8));
    EXPECT_FALSE(q.tryPush(9));

    int v = 0;
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 7);
    EXPECT_FALSE(q.pop(v));
    EXPECT_TRUE(q.closed());
}

TEST(BoundedQueue, PushBlocksUntilSpace) {
    BoundedQueue<int> q(1);
    q.push(1);

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        q.push(2);
        pushed = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(pushed.load());

    int v = 0;
    ASSERT_TRUE(q.pop(v));
    producer.join();
    EXPECT_TRUE(pushed.load());
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 2);
}

TEST(BoundedQueue, CloseWakesBlockedProducer) {
    BoundedQueue<int> q(1);
    q.push(1);
    bool result = true;
    std::thread producer([&] { result = q.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    q.close();
    producer.join();
    EXPECT_FALSE(result);
}

TEST(BoundedQueue, ClearReportsDiscarded) {
    BoundedQueue<int> q(4);
    q.push(1);
    q.push(2);
    EXPECT_EQ(q.clear(), 2u);
    EXPECT_EQ(q.size(), 0u);
}

} // namespace
