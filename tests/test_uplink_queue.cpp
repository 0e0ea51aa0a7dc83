#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "../UplinkQueue.hpp"

using namespace std::chrono_literals;


TEST(UplinkQueue, KeepsArrivalOrder) {
    UplinkQueue queue;
    ASSERT_TRUE(queue.push("first"));
    ASSERT_TRUE(queue.push("second"));

    std::string payload;
    ASSERT_TRUE(queue.pop(payload, 0ms));
    EXPECT_EQ(payload, "first");
    ASSERT_TRUE(queue.pop(payload, 0ms));
    EXPECT_EQ(payload, "second");
}

TEST(UplinkQueue, PopTimesOutWhenEmpty) {
    UplinkQueue queue;
    std::string payload = "untouched";

    EXPECT_FALSE(queue.pop(payload, 10ms));
    EXPECT_EQ(payload, "untouched");
}

TEST(UplinkQueue, DropsWhenFull) {
    UplinkQueue queue(2);

    EXPECT_TRUE(queue.push("a"));
    EXPECT_TRUE(queue.push("b"));
    EXPECT_FALSE(queue.push("c"));
    EXPECT_FALSE(queue.push("d"));

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.dropped(), 2u);

    // room again after the radio thread took one
    std::string payload;
    ASSERT_TRUE(queue.pop(payload, 0ms));
    EXPECT_EQ(payload, "a");
    EXPECT_TRUE(queue.push("e"));
    EXPECT_EQ(queue.dropped(), 2u);
}

TEST(UplinkQueue, WakesWaitingConsumer) {
    UplinkQueue queue;

    std::thread producer([&queue] {
        std::this_thread::sleep_for(20ms);
        queue.push("late");
    });

    std::string payload;
    EXPECT_TRUE(queue.pop(payload, 5s));
    EXPECT_EQ(payload, "late");

    producer.join();
}
