#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include "infra/work_queue/bounded_queue.hpp"

using mtcopy::infra::BoundedQueue;
using namespace std::chrono_literals;

TEST(BoundedQueueTest, FifoOrder)
{
    BoundedQueue<int> queue(4);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    queue.close();
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), std::nullopt);
}

TEST(BoundedQueueTest, ZeroCapacityRejected)
{
    EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}

TEST(BoundedQueueTest, PushAfterCloseFails)
{
    BoundedQueue<int> queue(2);
    queue.close();
    EXPECT_FALSE(queue.push(1));
    EXPECT_TRUE(queue.is_closed());
}

TEST(BoundedQueueTest, PopBlocksUntilItemArrives)
{
    BoundedQueue<int> queue(1);
    std::atomic<bool> popped{false};
    std::jthread consumer([&] {
        auto item = queue.pop();
        EXPECT_EQ(item, 42);
        popped = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(popped.load());
    EXPECT_TRUE(queue.push(42));
    consumer.join();
    EXPECT_TRUE(popped.load());
}

TEST(BoundedQueueTest, PushBlocksWhileFull)
{
    BoundedQueue<int> queue(2);
    ASSERT_TRUE(queue.push(1));
    ASSERT_TRUE(queue.push(2));

    std::atomic<bool> pushed{false};
    std::jthread producer([&] {
        EXPECT_TRUE(queue.push(3));
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_EQ(queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_LE(queue.size(), queue.capacity());
}

TEST(BoundedQueueTest, CloseWakesBlockedProducer)
{
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> result{true};
    std::jthread producer([&] { result = queue.push(2); });
    std::this_thread::sleep_for(20ms);
    queue.close();
    producer.join();
    EXPECT_FALSE(result.load());
}

TEST(BoundedQueueTest, CloseWakesBlockedConsumers)
{
    BoundedQueue<int> queue(1);
    std::atomic<int> finished{0};
    {
        std::vector<std::jthread> consumers;
        for (int i = 0; i < 4; ++i) {
            consumers.emplace_back([&] {
                EXPECT_EQ(queue.pop(), std::nullopt);
                ++finished;
            });
        }
        std::this_thread::sleep_for(20ms);
        queue.close();
    }
    EXPECT_EQ(finished.load(), 4);
}

TEST(BoundedQueueTest, ConcurrentConsumersNeverShareAnItem)
{
    constexpr int kItems = 10'000;
    BoundedQueue<int> queue(16);
    std::mutex seen_mutex;
    std::vector<int> seen;

    {
        std::vector<std::jthread> consumers;
        for (int i = 0; i < 8; ++i) {
            consumers.emplace_back([&] {
                while (auto item = queue.pop()) {
                    std::lock_guard lock(seen_mutex);
                    seen.push_back(*item);
                }
            });
        }
        for (int i = 0; i < kItems; ++i) {
            ASSERT_TRUE(queue.push(i));
        }
        queue.close();
    }

    ASSERT_EQ(seen.size(), static_cast<std::size_t>(kItems));
    std::set<int> unique(seen.begin(), seen.end());
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kItems));
}
