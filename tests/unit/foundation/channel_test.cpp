#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stop_token>
#include <string>
#include <thread>

#include "fwr/foundation/channel.hpp"

using namespace fwr::foundation;
using namespace std::chrono_literals;

TEST(ChannelTest, SendBlocksUntilReceived) {
    Channel<int> ch;
    std::atomic<bool> delivered{false};

    std::thread producer([&] {
        EXPECT_TRUE(ch.send(42));
        delivered.store(true);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(delivered.load());

    auto value = ch.receive();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42);

    producer.join();
    EXPECT_TRUE(delivered.load());
}

TEST(ChannelTest, PreservesOrderAcrossSends) {
    Channel<int> ch;
    std::thread producer([&] {
        for (int i = 0; i < 5; ++i) {
            ch.send(i);
        }
    });

    for (int i = 0; i < 5; ++i) {
        auto value = ch.receive();
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(*value, i);
    }
    producer.join();
}

TEST(ChannelTest, PostDoesNotBlock) {
    Channel<std::string> ch;
    EXPECT_TRUE(ch.post("again"));

    auto value = ch.receiveFor(10ms);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "again");
}

TEST(ChannelTest, PostedValueIsDeliveredFirst) {
    Channel<int> ch;
    std::thread producer([&] { ch.send(1); });

    // Give the producer time to park its value.
    std::this_thread::sleep_for(50ms);
    ch.post(2);

    EXPECT_EQ(ch.receive().value_or(-1), 2);
    EXPECT_EQ(ch.receive().value_or(-1), 1);
    producer.join();
}

TEST(ChannelTest, CloseWakesBlockedReceiver) {
    Channel<int> ch;
    std::thread closer([&] {
        std::this_thread::sleep_for(50ms);
        ch.close();
    });

    auto value = ch.receive();
    EXPECT_FALSE(value.has_value());
    closer.join();
}

TEST(ChannelTest, CloseWakesBlockedSender) {
    Channel<int> ch;
    std::atomic<bool> result{true};

    std::thread producer([&] { result.store(ch.send(7)); });
    std::this_thread::sleep_for(50ms);
    ch.close();
    producer.join();

    EXPECT_FALSE(result.load());
}

TEST(ChannelTest, ClosedChannelRejectsValues) {
    Channel<int> ch;
    ch.close();
    ch.close();

    EXPECT_TRUE(ch.isClosed());
    EXPECT_FALSE(ch.send(1));
    EXPECT_FALSE(ch.post(1));
    EXPECT_FALSE(ch.receive().has_value());
}

TEST(ChannelTest, StopTokenWakesBlockedReceiver) {
    Channel<int> ch;
    std::stop_source stop;

    std::thread stopper([&] {
        std::this_thread::sleep_for(50ms);
        stop.request_stop();
    });

    auto value = ch.receive(stop.get_token());
    EXPECT_FALSE(value.has_value());
    EXPECT_FALSE(ch.isClosed());
    stopper.join();
}

TEST(ChannelTest, ReceiveForTimesOut) {
    Channel<int> ch;
    auto start = std::chrono::steady_clock::now();
    auto value = ch.receiveFor(30ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(value.has_value());
    EXPECT_GE(elapsed, 30ms);
}
