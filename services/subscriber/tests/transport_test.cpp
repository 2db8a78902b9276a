#include <gtest/gtest.h>
#include "transport.hpp"

TEST(ReconnectBackoffTest, DoublesFromOneSecond) {
    EXPECT_EQ(reconnect_backoff(0), std::chrono::seconds(1));
    EXPECT_EQ(reconnect_backoff(1), std::chrono::seconds(2));
    EXPECT_EQ(reconnect_backoff(3), std::chrono::seconds(8));
    EXPECT_EQ(reconnect_backoff(5), std::chrono::seconds(32));
}

TEST(ReconnectBackoffTest, CappedAtOneMinute) {
    EXPECT_EQ(reconnect_backoff(6), std::chrono::seconds(60));
    EXPECT_EQ(reconnect_backoff(1000), std::chrono::seconds(60));
    EXPECT_EQ(reconnect_backoff(-3), std::chrono::seconds(1));
}
