#include <gtest/gtest.h>
#include <thread>

#include "aux/BoundedChannel.hpp"

TEST(BoundedChannelTest, DeliversInOrder)
{
    BoundedChannel<int> channel(4);
    EXPECT_TRUE(channel.tryPush(1));
    EXPECT_TRUE(channel.tryPush(2));

    int value = 0;
    ASSERT_TRUE(channel.tryPop(value));
    EXPECT_EQ(value, 1);
    ASSERT_TRUE(channel.tryPop(value));
    EXPECT_EQ(value, 2);
    EXPECT_FALSE(channel.tryPop(value));
}

TEST(BoundedChannelTest, FullChannelDropsNewest)
{
    BoundedChannel<int> channel(2);
    EXPECT_TRUE(channel.tryPush(1));
    EXPECT_TRUE(channel.tryPush(2));
    EXPECT_FALSE(channel.tryPush(3));
    EXPECT_FALSE(channel.tryPush(4));

    EXPECT_EQ(channel.size(), 2u);
    EXPECT_EQ(channel.droppedCount(), 2u);

    int value = 0;
    ASSERT_TRUE(channel.tryPop(value));
    EXPECT_EQ(value, 1);
    ASSERT_TRUE(channel.tryPop(value));
    EXPECT_EQ(value, 2);
}

TEST(BoundedChannelTest, ZeroCapacityHoldsOneItem)
{
    BoundedChannel<int> channel(0);
    EXPECT_EQ(channel.capacity(), 1u);
    EXPECT_TRUE(channel.tryPush(1));
    EXPECT_FALSE(channel.tryPush(2));
}

TEST(BoundedChannelTest, PopForTimesOutWhenEmpty)
{
    BoundedChannel<int> channel(1);
    int value = 0;

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.popFor(value, std::chrono::milliseconds(50)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(45));
}

TEST(BoundedChannelTest, PopForWakesOnPush)
{
    BoundedChannel<int> channel(1);
    std::thread producer([&channel]
                         {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.tryPush(99); });

    int value = 0;
    EXPECT_TRUE(channel.popFor(value, std::chrono::seconds(5)));
    EXPECT_EQ(value, 99);
    producer.join();
}
