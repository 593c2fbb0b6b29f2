#include "tradesim/feed/FeedEvent.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace tradesim::feed;

TEST(FeedEventTest, CloseCodeTexts) {
    EXPECT_EQ(closeCodeText(1000), "Normal closure");
    EXPECT_EQ(closeCodeText(1006), "Abnormal closure");
    EXPECT_EQ(closeCodeText(1011), "Internal server error");
    EXPECT_EQ(closeCodeText(4000), "Unknown reason");
}

TEST(FeedEventTest, StateNames) {
    EXPECT_STREQ(toString(FeedState::Disconnected), "disconnected");
    EXPECT_STREQ(toString(FeedState::Reconnecting), "reconnecting");
    EXPECT_STREQ(toString(FeedState::Failed), "failed");
    EXPECT_STREQ(toString(ErrorKind::ExhaustedReconnect), "exhausted_reconnect");
}
