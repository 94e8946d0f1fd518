#include <gtest/gtest.h>
#include "concurrency/Channel.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <numeric>
#include <thread>
#include <vector>

using cs::concurrency::Channel;

TEST(ChannelTest, FifoOrder) {
    Channel<int> ch(8);
    for (int i = 0; i < 5; ++i) ASSERT_TRUE(ch.send(i));
    EXPECT_EQ(ch.size(), 5u);
    for (int i = 0; i < 5; ++i) EXPECT_EQ(ch.receive(), i);
}

TEST(ChannelTest, ZeroCapacityIsOne) {
    const Channel<int> ch(0);
    EXPECT_EQ(ch.capacity(), 1u);
}

TEST(ChannelTest, CloseDrainsThenEnds) {
    Channel<int> ch(4);
    ASSERT_TRUE(ch.send(1));
    ASSERT_TRUE(ch.send(2));
    ch.close();
    EXPECT_TRUE(ch.closed());
    EXPECT_FALSE(ch.send(3));
    EXPECT_EQ(ch.receive(), 1);
    EXPECT_EQ(ch.receive(), 2);
    EXPECT_EQ(ch.receive(), std::nullopt);
}

TEST(ChannelTest, SenderBlocksWhileFull) {
    Channel<int> ch(2);
    std::atomic<int> sent{0};
    std::thread producer([&] {
        for (int i = 0; i < 3; ++i) {
            if (!ch.send(i)) return;
            ++sent;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(sent.load(), 2);
    EXPECT_EQ(ch.receive(), 0);
    producer.join();
    EXPECT_EQ(sent.load(), 3);
}

TEST(ChannelTest, CloseWakesBlockedSender) {
    Channel<int> ch(1);
    ASSERT_TRUE(ch.send(0));
    std::atomic<bool> result{true};
    std::thread producer([&] { result = ch.send(1); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    producer.join();
    EXPECT_FALSE(result.load());
}

TEST(ChannelTest, CloseWakesBlockedReceiver) {
    Channel<int> ch(1);
    std::optional<int> got = 42;
    std::thread consumer([&] { got = ch.receive(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    consumer.join();
    EXPECT_EQ(got, std::nullopt);
}

TEST(ChannelTest, ManyProducersOneConsumer) {
    Channel<int> ch(16);
    constexpr int PRODUCERS = 4;
    constexpr int PER_PRODUCER = 1000;

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p)
        producers.emplace_back([&, p] {
            for (int i = 0; i < PER_PRODUCER; ++i) ch.send(p * PER_PRODUCER + i);
        });

    std::thread closer([&] {
        for (auto& t : producers) t.join();
        ch.close();
    });

    std::vector<int> seen;
    while (auto v = ch.receive()) seen.push_back(*v);
    closer.join();

    ASSERT_EQ(seen.size(), static_cast<size_t>(PRODUCERS * PER_PRODUCER));
    std::sort(seen.begin(), seen.end());
    std::vector<int> expected(PRODUCERS * PER_PRODUCER);
    std::iota(expected.begin(), expected.end(), 0);
    EXPECT_EQ(seen, expected);
}
