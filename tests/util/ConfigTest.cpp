#include "tradesim/util/Config.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include <fstream>
#include <string>

using namespace tradesim::util;

static std::string writeTemp(const std::string& body) {
    char name[] = "/tmp/tradesim_cfgXXXXXX";
    int fd = ::mkstemp(name);
    if (fd >= 0) ::close(fd);
    std::ofstream out(name);
    out << body;
    return name;
}

TEST(ConfigTest, Defaults) {
    Config c;
    EXPECT_EQ(c.exchange, "OKX");
    EXPECT_EQ(c.asset, "BTC-USDT-SWAP");
    EXPECT_DOUBLE_EQ(c.quantity, 100.0);
    EXPECT_DOUBLE_EQ(c.volatility, 2.0);
    EXPECT_EQ(c.reconnectBaseMs, 1000u);
    EXPECT_EQ(c.reconnectMaxMs, 30000u);
    EXPECT_EQ(c.reconnectMaxAttempts, 10u);
    EXPECT_EQ(c.historyCapacity, 100u);
}

TEST(ConfigTest, LoadFromFileSkipsCommentsAndUnknownKeys) {
    const auto path = writeTemp(
        "# comment\n"
        "; another\n"
        "quantity = 250\n"
        "feeTier=VIP 3\r\n"
        "logJson=yes\n"
        "noSuchKey=1\n"
        "\n"
        "historyCapacity=20\n");
    Config c;
    ASSERT_TRUE(c.loadFromFile(path));
    EXPECT_DOUBLE_EQ(c.quantity, 250.0);
    EXPECT_EQ(c.feeTier, "VIP 3");
    EXPECT_TRUE(c.logJson);
    EXPECT_EQ(c.historyCapacity, 20u);
    std::remove(path.c_str());
}

TEST(ConfigTest, MissingFileReturnsFalse) {
    Config c;
    EXPECT_FALSE(c.loadFromFile("/nonexistent/tradesim.conf"));
}

TEST(ConfigTest, NonPositiveNumbersKeepDefaults) {
    Config c;
    EXPECT_TRUE(c.set("quantity", "-5"));
    EXPECT_TRUE(c.set("reconnectMaxAttempts", "0"));
    EXPECT_TRUE(c.set("volatility", "abc"));
    EXPECT_DOUBLE_EQ(c.quantity, 100.0);
    EXPECT_EQ(c.reconnectMaxAttempts, 10u);
    EXPECT_DOUBLE_EQ(c.volatility, 2.0);
}

TEST(ConfigTest, MakerOffsetMayBeNegative) {
    Config c;
    EXPECT_TRUE(c.set("makerOffset", "-0.75"));
    EXPECT_DOUBLE_EQ(c.makerOffset, -0.75);
}

TEST(ConfigTest, MaxDelayNeverBelowBase) {
    Config c;
    EXPECT_TRUE(c.set("reconnectBaseMs", "5000"));
    EXPECT_TRUE(c.set("reconnectMaxMs", "2000"));
    EXPECT_EQ(c.reconnectMaxMs, 5000u);
}

TEST(ConfigTest, UnknownKeyRejected) {
    Config c;
    EXPECT_FALSE(c.set("bogus", "1"));
}
