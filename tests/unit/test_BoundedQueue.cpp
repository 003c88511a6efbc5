#include <gtest/gtest.h>
#include "concurrency/BoundedQueue.hpp"

#include <atomic>
#include <string>
#include <thread>

using namespace wh::concurrency;
using namespace std::chrono_literals;

TEST(BoundedQueueTest, Items_ComeOutInFifoOrder) {
    BoundedQueue<int> q(4);
    const auto ctx = Context::background();
    for (int i = 1; i <= 4; ++i) q.push(i);

    for (int i = 1; i <= 4; ++i) {
        const auto item = q.pop(*ctx);
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(*item, i);
    }
    EXPECT_EQ(q.size(), 0u);
}

TEST(BoundedQueueTest, ZeroCapacity_BehavesAsOne) {
    BoundedQueue<int> q(0);
    EXPECT_EQ(q.capacity(), 1u);
    EXPECT_TRUE(q.tryPush(1));
    EXPECT_FALSE(q.tryPush(2));
}

TEST(BoundedQueueTest, Push_BlocksWhileFull) {
    BoundedQueue<std::string> q(1);
    q.push("first");

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        q.push("second");
        pushed = true;
    });

    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(pushed);

    EXPECT_EQ(q.tryPop().value(), "first");
    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(q.tryPop().value(), "second");
}

TEST(BoundedQueueTest, Pop_ReturnsEmptyOnCancel) {
    BoundedQueue<int> q(1);
    auto [ctx, cancel] = Context::withCancel(Context::background());

    std::thread canceller([cancel = cancel] {
        std::this_thread::sleep_for(20ms);
        cancel();
    });

    EXPECT_FALSE(q.pop(*ctx).has_value());
    canceller.join();
}

TEST(BoundedQueueTest, Pop_CancellationWinsOverPendingItems) {
    BoundedQueue<int> q(2);
    q.push(1);
    const auto ctx = Context::background();
    ctx->cancel();

    EXPECT_FALSE(q.pop(*ctx).has_value());
    EXPECT_EQ(q.size(), 1u);
}

TEST(BoundedQueueTest, PushWithContext_ReturnsFalseOnCancel) {
    BoundedQueue<int> q(1);
    q.push(1);
    auto [ctx, cancel] = Context::withCancel(Context::background());

    std::thread canceller([cancel = cancel] {
        std::this_thread::sleep_for(20ms);
        cancel();
    });

    EXPECT_FALSE(q.push(2, *ctx));
    canceller.join();
    EXPECT_EQ(q.size(), 1u);
}

TEST(BoundedQueueTest, Close_RejectsProducersAndDrainsConsumers) {
    BoundedQueue<int> q(2);
    q.push(7);
    q.close();

    EXPECT_TRUE(q.closed());
    EXPECT_THROW(q.push(8), QueueClosed);
    EXPECT_FALSE(q.tryPush(8));

    const auto ctx = Context::background();
    EXPECT_EQ(q.pop(*ctx).value(), 7);
    EXPECT_FALSE(q.pop(*ctx).has_value());
}

TEST(BoundedQueueTest, Close_WakesBlockedProducer) {
    BoundedQueue<int> q(1);
    q.push(1);

    std::atomic<bool> threw{false};
    std::thread producer([&] {
        try {
            q.push(2);
        } catch (const QueueClosed&) {
            threw = true;
        }
    });

    std::this_thread::sleep_for(20ms);
    q.close();
    producer.join();
    EXPECT_TRUE(threw);
}
