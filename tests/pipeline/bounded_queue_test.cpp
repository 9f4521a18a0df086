#include "pipeline/BoundedBlockingQueue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using infstore::pipeline::BoundedBlockingQueue;

TEST(BoundedBlockingQueueTest, PreservesFifoOrder) {
    BoundedBlockingQueue<int> queue(3);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_TRUE(queue.push(3));

    EXPECT_EQ(queue.pop().value_or(0), 1);
    EXPECT_EQ(queue.pop().value_or(0), 2);
    EXPECT_EQ(queue.pop().value_or(0), 3);
    EXPECT_EQ(queue.pushedTotal(), 3U);
}

TEST(BoundedBlockingQueueTest, PushBlocksWhileFull) {
    BoundedBlockingQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        queue.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(queue.size(), 1U);

    EXPECT_EQ(queue.pop().value_or(0), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.pop().value_or(0), 2);
}

TEST(BoundedBlockingQueueTest, CloseDrainsThenStops) {
    BoundedBlockingQueue<int> queue(4);
    queue.push(1);
    queue.push(2);
    queue.close();

    EXPECT_FALSE(queue.push(3));
    EXPECT_EQ(queue.pop().value_or(0), 1);
    EXPECT_EQ(queue.pop().value_or(0), 2);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedBlockingQueueTest, CloseWakesBlockedProducer) {
    BoundedBlockingQueue<int> queue(1);
    queue.push(1);

    std::atomic<bool> result{true};
    std::thread producer([&] { result = queue.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    producer.join();

    EXPECT_FALSE(result.load());
}

TEST(BoundedBlockingQueueTest, ManyProducersManyConsumers) {
    BoundedBlockingQueue<int> queue(2);
    constexpr int kPerProducer = 200;

    std::vector<std::thread> producers;
    for (int p = 0; p < 3; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                queue.push(p * kPerProducer + i);
            }
        });
    }

    std::mutex seenMutex;
    std::set<int> seen;
    std::vector<std::thread> consumers;
    for (int c = 0; c < 2; ++c) {
        consumers.emplace_back([&] {
            while (auto value = queue.pop()) {
                std::lock_guard guard(seenMutex);
                seen.insert(*value);
            }
        });
    }

    for (auto &producer : producers) {
        producer.join();
    }
    queue.close();
    for (auto &consumer : consumers) {
        consumer.join();
    }

    EXPECT_EQ(seen.size(), 3U * kPerProducer);
}

TEST(BoundedBlockingQueueTest, RejectsZeroCapacity) {
    EXPECT_THROW(BoundedBlockingQueue<int>(0), std::invalid_argument);
}
