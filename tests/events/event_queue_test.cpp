#include "ingest/events/event_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using ingest::events::ThreadSafeQueue;

namespace {

// Negative values stand in for progress snapshots.
bool is_snapshot(int value) {
    return value < 0;
}

} // namespace

TEST(ThreadSafeQueue, PushAndPop) {
    ThreadSafeQueue<int> queue;

    queue.push(42);
    queue.push(100);

    EXPECT_EQ(queue.pop().value(), 42);
    EXPECT_EQ(queue.pop().value(), 100);
}

TEST(ThreadSafeQueue, TryPopOnEmpty) {
    ThreadSafeQueue<int> queue;
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(ThreadSafeQueue, PopTimeout) {
    ThreadSafeQueue<int> queue;

    const auto start = std::chrono::steady_clock::now();
    auto value = queue.pop_for(std::chrono::milliseconds(100));
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    EXPECT_FALSE(value.has_value());
    EXPECT_GE(elapsed.count(), 90);
}

TEST(ThreadSafeQueue, ConsecutiveSnapshotsCoalesce) {
    ThreadSafeQueue<int> queue;

    EXPECT_EQ(queue.push_coalesced(-1, is_snapshot), 0u);
    EXPECT_EQ(queue.push_coalesced(-2, is_snapshot), 1u);
    EXPECT_EQ(queue.push_coalesced(-3, is_snapshot), 1u);

    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.pop().value(), -3);
}

TEST(ThreadSafeQueue, TerminalItemsAreNeverMerged) {
    ThreadSafeQueue<int> queue;

    queue.push_coalesced(-1, is_snapshot);
    queue.push_coalesced(7, is_snapshot);
    queue.push_coalesced(-2, is_snapshot);
    queue.push_coalesced(8, is_snapshot);

    EXPECT_EQ(queue.size(), 4u);
}

TEST(ThreadSafeQueue, FullQueueEvictsOldestSnapshot) {
    ThreadSafeQueue<int> queue(3);

    queue.push_coalesced(1, is_snapshot);
    queue.push_coalesced(-1, is_snapshot);
    queue.push_coalesced(2, is_snapshot);

    EXPECT_EQ(queue.push_coalesced(3, is_snapshot), 1u);
    ASSERT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.pop().value(), 1);
    EXPECT_EQ(queue.pop().value(), 2);
    EXPECT_EQ(queue.pop().value(), 3);
}

TEST(ThreadSafeQueue, FullQueueWithoutSnapshotsStillAccepts) {
    ThreadSafeQueue<int> queue(2);

    queue.push_coalesced(1, is_snapshot);
    queue.push_coalesced(2, is_snapshot);
    EXPECT_EQ(queue.push_coalesced(3, is_snapshot), 0u);
    EXPECT_EQ(queue.size(), 3u);
}

TEST(ThreadSafeQueue, Shutdown) {
    ThreadSafeQueue<int> queue;
    queue.shutdown();
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueue, ProducerConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.shutdown();
    });

    std::thread consumer([&queue, &sum]() {
        while (auto value = queue.pop()) {
            sum += *value;
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);
}
