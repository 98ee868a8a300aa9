#include <gtest/gtest.h>
#include "core/Channel.hpp"
#include <thread>
#include <vector>

using namespace mcp_inspector;

TEST(ChannelTest, DeliversInPushOrder) {
    Channel<int> channel;
    channel.push(1);
    channel.push(2);

    EXPECT_EQ(channel.pop(), 1);
    EXPECT_EQ(channel.pop(), 2);
}

TEST(ChannelTest, CloseDrainsRemainingThenEnds) {
    Channel<int> channel;
    channel.push(7);
    channel.close();

    EXPECT_FALSE(channel.push(8));
    EXPECT_TRUE(channel.is_closed());
    EXPECT_EQ(channel.pop(), 7);
    EXPECT_EQ(channel.pop(), std::nullopt);
}

TEST(ChannelTest, PopBlocksUntilProducerPushes) {
    Channel<int> channel;
    std::thread producer([&channel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        channel.push(42);
    });

    EXPECT_EQ(channel.pop(), 42);
    producer.join();
}

TEST(ChannelTest, CloseWakesBlockedConsumer) {
    Channel<int> channel;
    std::optional<int> received = 1;
    std::thread consumer([&] { received = channel.pop(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    channel.close();
    consumer.join();

    EXPECT_EQ(received, std::nullopt);
}

TEST(ChannelTest, ManyProducersOneConsumer) {
    Channel<int> channel;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&channel] {
            for (int i = 0; i < 250; ++i) {
                channel.push(1);
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    channel.close();

    int total = 0;
    while (auto value = channel.pop()) {
        total += *value;
    }
    EXPECT_EQ(total, 1000);
}
