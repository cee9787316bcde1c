#include "replication/work_queue.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>
#include <vector>

namespace BuildCacheS3::Replication
{

using namespace std::chrono_literals;

TEST(WorkQueueTest, FifoOrder)
{
    WorkQueue<int> queue(4);
    EXPECT_TRUE(queue.Push(1));
    EXPECT_TRUE(queue.Push(2));
    EXPECT_TRUE(queue.Push(3));
    EXPECT_EQ(queue.Size(), 3u);

    EXPECT_EQ(queue.Pop(), 1);
    EXPECT_EQ(queue.Pop(), 2);
    EXPECT_EQ(queue.Pop(), 3);
    EXPECT_EQ(queue.Size(), 0u);
}

TEST(WorkQueueTest, PushBlocksWhileFull)
{
    WorkQueue<int> queue(2);
    ASSERT_TRUE(queue.Push(1));
    ASSERT_TRUE(queue.Push(2));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        pushed = queue.Push(3);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(queue.Size(), 2u);

    EXPECT_EQ(queue.Pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.Size(), 2u);
}

TEST(WorkQueueTest, ZeroCapacityWaitsForConsumer)
{
    WorkQueue<int> queue(0);
    std::atomic<bool> returned{false};
    std::thread producer([&] {
        EXPECT_TRUE(queue.Push(7));
        returned = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(returned.load());

    EXPECT_EQ(queue.Pop(), 7);
    producer.join();
    EXPECT_TRUE(returned.load());
}

TEST(WorkQueueTest, CloseRejectsPushButDrainsRemaining)
{
    WorkQueue<int> queue(4);
    ASSERT_TRUE(queue.Push(1));
    ASSERT_TRUE(queue.Push(2));
    queue.Close();

    EXPECT_TRUE(queue.IsClosed());
    EXPECT_FALSE(queue.Push(3));
    EXPECT_EQ(queue.Pop(), 1);
    EXPECT_EQ(queue.Pop(), 2);
    EXPECT_EQ(queue.Pop(), std::nullopt);
}

TEST(WorkQueueTest, CloseWakesBlockedConsumers)
{
    WorkQueue<int> queue(1);
    std::vector<std::thread> consumers;
    std::atomic<int> finished{0};
    for (int i = 0; i < 3; ++i) {
        consumers.emplace_back([&] {
            EXPECT_EQ(queue.Pop(), std::nullopt);
            finished++;
        });
    }
    std::this_thread::sleep_for(20ms);
    queue.Close();
    for (auto& consumer : consumers) {
        consumer.join();
    }
    EXPECT_EQ(finished.load(), 3);
}

TEST(WorkQueueTest, StopTokenReleasesBlockedProducer)
{
    WorkQueue<int> queue(1);
    ASSERT_TRUE(queue.Push(1));

    std::stop_source stop;
    std::atomic<bool> result{true};
    std::thread producer([&] {
        result = queue.Push(2, stop.get_token());
    });
    std::this_thread::sleep_for(20ms);
    stop.request_stop();
    producer.join();

    EXPECT_FALSE(result.load());
    EXPECT_EQ(queue.Size(), 1u);
}

TEST(WorkQueueTest, StopTokenReleasesBlockedConsumer)
{
    WorkQueue<int> queue(1);
    std::stop_source stop;
    std::thread consumer([&] {
        EXPECT_EQ(queue.Pop(stop.get_token()), std::nullopt);
    });
    std::this_thread::sleep_for(20ms);
    stop.request_stop();
    consumer.join();
}

TEST(WorkQueueTest, ManyProducersManyConsumersDeliverEachItemOnce)
{
    WorkQueue<int> queue(3);
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 250;

    std::atomic<long> sum{0};
    std::atomic<int> count{0};
    std::vector<std::thread> consumers;
    for (int c = 0; c < 3; ++c) {
        consumers.emplace_back([&] {
            while (auto item = queue.Pop()) {
                sum += *item;
                count++;
            }
        });
    }

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                EXPECT_TRUE(queue.Push(p * kPerProducer + i));
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    queue.Close();
    for (auto& consumer : consumers) {
        consumer.join();
    }

    const int n = kProducers * kPerProducer;
    EXPECT_EQ(count.load(), n);
    EXPECT_EQ(sum.load(), static_cast<long>(n) * (n - 1) / 2);
}

}  // namespace BuildCacheS3::Replication
