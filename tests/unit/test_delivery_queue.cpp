#include <gtest/gtest.h>
#include <opensea_stream/delivery_queue.hpp>
#include <opensea_stream/errors.hpp>
#include <atomic>
#include <thread>
#include <vector>

using namespace opensea_stream;
using namespace std::chrono_literals;

using IntQueue = DeliveryQueue<int>;

TEST(DeliveryQueueTest, FifoOrder) {
    IntQueue queue;
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(queue.push(i), IntQueue::PushResult::Delivered);
    }

    int value = -1;
    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(queue.try_pop(value), IntQueue::PopStatus::Item);
        EXPECT_EQ(value, i);
    }
    EXPECT_EQ(queue.try_pop(value), IntQueue::PopStatus::Empty);
}

TEST(DeliveryQueueTest, BoundedQueueDropsOldest) {
    IntQueue queue(3);
    queue.push(1);
    queue.push(2);
    queue.push(3);
    EXPECT_EQ(queue.push(4), IntQueue::PushResult::DroppedOldest);
    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.dropped(), 1u);

    int value = 0;
    queue.try_pop(value);
    EXPECT_EQ(value, 2);
}

TEST(DeliveryQueueTest, CloseDrainsThenReportsClosed) {
    IntQueue queue;
    queue.push(7);
    queue.close();

    int value = 0;
    EXPECT_EQ(queue.pop(value), IntQueue::PopStatus::Item);
    EXPECT_EQ(value, 7);
    EXPECT_EQ(queue.pop(value), IntQueue::PopStatus::Closed);
    EXPECT_EQ(queue.push(8), IntQueue::PushResult::Closed);
}

TEST(DeliveryQueueTest, FailCarriesError) {
    IntQueue queue;
    queue.push(1);
    queue.fail(std::make_exception_ptr(ChannelError("collection:x", "boom")));

    int value = 0;
    EXPECT_EQ(queue.pop(value), IntQueue::PopStatus::Item);
    EXPECT_EQ(queue.pop(value), IntQueue::PopStatus::Failed);
    EXPECT_THROW(std::rethrow_exception(queue.error()), ChannelError);
}

TEST(DeliveryQueueTest, FirstTerminationWins) {
    IntQueue queue;
    queue.close();
    queue.fail(std::make_exception_ptr(ChannelError("collection:x", "late")));

    int value = 0;
    EXPECT_EQ(queue.try_pop(value), IntQueue::PopStatus::Closed);
    EXPECT_EQ(queue.error(), nullptr);
}

TEST(DeliveryQueueTest, PopForTimesOut) {
    IntQueue queue;
    int value = 0;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(queue.pop_for(value, 20ms), IntQueue::PopStatus::Empty);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(DeliveryQueueTest, CloseWakesBlockedConsumer) {
    IntQueue queue;
    std::atomic<bool> woke{false};
    std::thread consumer([&]() {
        int value = 0;
        EXPECT_EQ(queue.pop(value), IntQueue::PopStatus::Closed);
        woke = true;
    });

    std::this_thread::sleep_for(20ms);
    queue.close();
    consumer.join();
    EXPECT_TRUE(woke);
}

TEST(DeliveryQueueTest, NoConsumerAfterLastDetach) {
    IntQueue queue;
    // Nobody attached yet: items are buffered for the first receiver
    EXPECT_EQ(queue.push(1), IntQueue::PushResult::Delivered);
    EXPECT_TRUE(queue.has_consumer());

    queue.attach();
    queue.attach();
    EXPECT_EQ(queue.receivers(), 2u);
    queue.detach();
    EXPECT_EQ(queue.push(2), IntQueue::PushResult::Delivered);

    queue.detach();
    EXPECT_FALSE(queue.has_consumer());
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_EQ(queue.push(3), IntQueue::PushResult::NoConsumer);
}

TEST(DeliveryQueueTest, ConcurrentConsumersSplitItems) {
    IntQueue queue;
    constexpr int kItems = 1000;
    std::atomic<int> received{0};
    std::atomic<long> sum{0};

    std::vector<std::thread> consumers;
    for (int c = 0; c < 4; ++c) {
        consumers.emplace_back([&]() {
            int value = 0;
            while (queue.pop(value) == IntQueue::PopStatus::Item) {
                ++received;
                sum += value;
            }
        });
    }

    for (int i = 1; i <= kItems; ++i) {
        queue.push(i);
    }
    queue.close();
    for (auto& consumer : consumers) {
        consumer.join();
    }

    EXPECT_EQ(received.load(), kItems);
    EXPECT_EQ(sum.load(), static_cast<long>(kItems) * (kItems + 1) / 2);
}
