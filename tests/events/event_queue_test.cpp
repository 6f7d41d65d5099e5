#include "pushpop/events/event_queue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace pushpop::events;

TEST(ThreadSafeQueue, PushAndPopInOrder) {
    ThreadSafeQueue<int> queue;

    queue.push(42);
    queue.push(100);

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 42);

    auto second = queue.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), 100);
}

TEST(ThreadSafeQueue, CloseWakesBlockedConsumer) {
    ThreadSafeQueue<int> queue;

    std::thread closer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        queue.close();
    });

    auto value = queue.pop();
    closer.join();

    EXPECT_FALSE(value.has_value());
    EXPECT_FALSE(queue.push(5));
}

TEST(ThreadSafeQueue, PushAfterCloseIsDropped) {
    ThreadSafeQueue<int> queue;
    queue.push(1);
    queue.close();

    EXPECT_FALSE(queue.push(2));
    // Items queued before close are still delivered.
    auto value = queue.pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 1);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueue, ManyProducersOneConsumer) {
    ThreadSafeQueue<int> queue;
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 500;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue]() {
            for (int i = 0; i < kPerProducer; ++i) {
                queue.push(1);
            }
        });
    }

    int sum = 0;
    for (int i = 0; i < kProducers * kPerProducer; ++i) {
        auto value = queue.pop();
        ASSERT_TRUE(value.has_value());
        sum += *value;
    }
    for (auto& t : producers) {
        t.join();
    }

    EXPECT_EQ(sum, kProducers * kPerProducer);

    // Nothing left over once every producer is done.
    queue.close();
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueue, CarriesVariantMessages) {
    using Message = std::variant<int, std::string>;
    ThreadSafeQueue<Message> queue;

    queue.push(Message{std::string("chunk")});
    queue.push(Message{3});

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(std::get<std::string>(*first), "chunk");
    auto second = queue.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(std::get<int>(*second), 3);
}
