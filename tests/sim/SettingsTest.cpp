#include "tradesim/sim/Settings.hpp"
#include <gtest/gtest.h>

using namespace tradesim;
using namespace tradesim::sim;

TEST(SettingsTest, ParametersFromConfig) {
    util::Config cfg;
    cfg.set("quantity", "250");
    cfg.set("feeTier", "vip 4");
    cfg.set("orderType", "limit");
    cfg.set("asset", "ETH-USDT-SWAP");

    const auto p = parametersFromConfig(cfg);
    EXPECT_EQ(p.exchange, "OKX");
    EXPECT_EQ(p.asset, "ETH-USDT-SWAP");
    EXPECT_DOUBLE_EQ(p.quantity, 250.0);
    EXPECT_EQ(p.feeTier, model::FeeTier::Vip4);
    EXPECT_EQ(p.orderType, model::OrderType::Limit);
}

TEST(SettingsTest, UnknownFeeTierFallsBack) {
    util::Config cfg;
    cfg.set("feeTier", "platinum");
    EXPECT_EQ(parametersFromConfig(cfg).feeTier, model::kFallbackFeeTier);
}

TEST(SettingsTest, ConstantsAndBackoffFromConfig) {
    util::Config cfg;
    cfg.set("impactEta", "0.02");
    cfg.set("makerOffset", "-1");
    cfg.set("reconnectBaseMs", "500");
    cfg.set("reconnectMaxMs", "4000");
    cfg.set("reconnectMaxAttempts", "4");

    const auto k = constantsFromConfig(cfg);
    EXPECT_DOUBLE_EQ(k.eta, 0.02);
    EXPECT_DOUBLE_EQ(k.gamma, 0.1);
    EXPECT_DOUBLE_EQ(k.makerOffset, -1.0);

    const auto b = backoffFromConfig(cfg);
    EXPECT_EQ(b.baseDelay, std::chrono::milliseconds(500));
    EXPECT_EQ(b.maxDelay, std::chrono::milliseconds(4000));
    EXPECT_EQ(b.maxAttempts, 4u);
}

TEST(SettingsTest, ApplyParameterLiveKeys) {
    model::SimulationParameters p;
    std::string why;
    EXPECT_TRUE(applyParameter(p, "quantity", "-3", &why));   // range is checked later
    EXPECT_DOUBLE_EQ(p.quantity, -3.0);
    EXPECT_TRUE(applyParameter(p, "volatility", "4.5", &why));
    EXPECT_DOUBLE_EQ(p.volatility, 4.5);
    EXPECT_TRUE(applyParameter(p, "feeTier", "VIP 2", &why));
    EXPECT_EQ(p.feeTier, model::FeeTier::Vip2);
}

TEST(SettingsTest, ApplyParameterRejects) {
    model::SimulationParameters p;
    std::string why;
    EXPECT_FALSE(applyParameter(p, "quantity", "12abc", &why));
    EXPECT_NE(why.find("not a number"), std::string::npos);
    EXPECT_FALSE(applyParameter(p, "feedUrl", "ws://x", &why));
    EXPECT_NE(why.find("not a live simulation parameter"), std::string::npos);
    EXPECT_DOUBLE_EQ(p.quantity, 100.0);
}
