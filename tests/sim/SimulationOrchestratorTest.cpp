#include "tradesim/sim/SimulationOrchestrator.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace tradesim;
using namespace tradesim::sim;

static Level lv(const std::string& px, const std::string& sz) {
    return Level{*parseDecimal(px), *parseDecimal(sz)};
}

static OrderBookSnapshot book(double bestAsk = 100.0) {
    OrderBookSnapshot s;
    s.exchange = "OKX";
    s.symbol = "BTC-USDT-SWAP";
    const std::string a = std::to_string(bestAsk);
    const std::string b = std::to_string(bestAsk - 1.0);
    s.asks = { lv(a, "2"), lv(std::to_string(bestAsk + 1.0), "3") };
    s.bids = { lv(b, "5"), lv(std::to_string(bestAsk - 2.0), "1") };
    return s;
}

TEST(SimulationOrchestratorTest, StartsEmpty) {
    SimulationOrchestrator o;
    const auto v = o.view();
    EXPECT_FALSE(v.result.has_value());
    EXPECT_FALSE(v.metrics.has_value());
    EXPECT_TRUE(v.history.empty());
    EXPECT_FALSE(v.connected);
    EXPECT_TRUE(v.lastUpdated.empty());
    EXPECT_EQ(o.historyCapacity(), kDefaultHistoryCapacity);
}

TEST(SimulationOrchestratorTest, SnapshotProducesResultAndHistory) {
    SimulationOrchestrator o;
    int notified = 0;
    o.setOnResult([&notified](const model::SimulationResult&) { ++notified; });

    EXPECT_TRUE(o.onSnapshot(book()));
    const auto v = o.view();
    ASSERT_TRUE(v.result.has_value());
    ASSERT_TRUE(v.metrics.has_value());
    EXPECT_EQ(v.history.size(), 1u);
    EXPECT_DOUBLE_EQ(v.history.back().bestAsk, 100.0);
    EXPECT_DOUBLE_EQ(v.history.back().bestBid, 99.0);
    EXPECT_FALSE(v.lastUpdated.empty());
    EXPECT_EQ(v.snapshotsApplied, 1u);
    EXPECT_EQ(notified, 1);
    EXPECT_GT(v.result->expectedFeesAbs, 0.0);
}

TEST(SimulationOrchestratorTest, HistoryIsBoundedFifo) {
    SimulationOrchestrator o;
    for (int i = 0; i < 150; ++i) {
        ASSERT_TRUE(o.onSnapshot(book(100.0 + i)));
    }
    const auto v = o.view();
    ASSERT_EQ(v.history.size(), kDefaultHistoryCapacity);
    // oldest 50 evicted
    EXPECT_DOUBLE_EQ(v.history.front().bestAsk, 150.0);
    EXPECT_DOUBLE_EQ(v.history.back().bestAsk, 249.0);
    EXPECT_EQ(v.snapshotsApplied, 150u);
}

TEST(SimulationOrchestratorTest, CustomCapacity) {
    SimulationOrchestrator o(model::CostModelEngine{}, model::SimulationParameters{}, 3);
    for (int i = 0; i < 5; ++i) o.onSnapshot(book(100.0 + i));
    const auto v = o.view();
    ASSERT_EQ(v.history.size(), 3u);
    EXPECT_DOUBLE_EQ(v.history.front().bestAsk, 102.0);
}

TEST(SimulationOrchestratorTest, ParameterChangeRecomputesWithoutHistory) {
    SimulationOrchestrator o;
    o.onSnapshot(book());
    const auto before = o.view();

    model::SimulationParameters p = o.parameters();
    p.feeTier = model::FeeTier::Vip5;
    ASSERT_TRUE(o.setParameters(p));

    const auto after = o.view();
    EXPECT_EQ(after.history.size(), 1u);
    ASSERT_TRUE(after.result.has_value());
    EXPECT_DOUBLE_EQ(after.result->expectedFeesAbs, 0.0);
    EXPECT_GT(before.result->expectedFeesAbs, 0.0);
    EXPECT_EQ(after.parameters.feeTier, model::FeeTier::Vip5);
}

TEST(SimulationOrchestratorTest, ParameterChangeBeforeAnySnapshot) {
    SimulationOrchestrator o;
    model::SimulationParameters p;
    p.quantity = 50.0;
    EXPECT_TRUE(o.setParameters(p));
    EXPECT_FALSE(o.view().result.has_value());
    EXPECT_DOUBLE_EQ(o.parameters().quantity, 50.0);
}

TEST(SimulationOrchestratorTest, InvalidParametersRejected) {
    SimulationOrchestrator o;
    std::string why;

    model::SimulationParameters p;
    p.quantity = 0.0;
    EXPECT_FALSE(o.setParameters(p, &why));
    EXPECT_NE(why.find("quantity"), std::string::npos);

    p.quantity = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(o.setParameters(p, &why));

    p.quantity = 10.0;
    p.exchange = "Binance";
    EXPECT_FALSE(o.setParameters(p, &why));
    EXPECT_NE(why.find("unsupported exchange"), std::string::npos);

    EXPECT_DOUBLE_EQ(o.parameters().quantity, 100.0);
    EXPECT_EQ(o.parameters().exchange, "OKX");
}

TEST(SimulationOrchestratorTest, VolatilityIsClamped) {
    model::SimulationParameters p;
    p.volatility = 50.0;
    ASSERT_TRUE(validateParameters(p));
    EXPECT_DOUBLE_EQ(p.volatility, kMaxVolatilityPct);
    p.volatility = 0.0;
    ASSERT_TRUE(validateParameters(p));
    EXPECT_DOUBLE_EQ(p.volatility, kMinVolatilityPct);
}

TEST(SimulationOrchestratorTest, DegenerateSnapshotIsSkipped) {
    SimulationOrchestrator o;
    o.onSnapshot(book());
    const auto before = o.view();

    OrderBookSnapshot empty;
    empty.asks = { lv("100", "1") };
    EXPECT_FALSE(o.onSnapshot(empty));

    const auto after = o.view();
    EXPECT_EQ(after.history.size(), 1u);
    EXPECT_EQ(after.lastUpdated, before.lastUpdated);
    EXPECT_EQ(after.snapshotsSkipped, 1u);
    ASSERT_TRUE(after.result.has_value());
    EXPECT_DOUBLE_EQ(after.result->netCostAbs, before.result->netCostAbs);
}

TEST(SimulationOrchestratorTest, ConnectionStatusFollowsFeedEvents) {
    SimulationOrchestrator o;
    o.onFeedEvent(feed::Connected{});
    EXPECT_TRUE(o.view().connected);

    o.onFeedEvent(feed::SnapshotReceived{book()});
    EXPECT_TRUE(o.view().result.has_value());

    o.onFeedEvent(feed::FeedError{feed::ErrorKind::Connection, "read: end of stream"});
    auto v = o.view();
    EXPECT_FALSE(v.connected);
    EXPECT_NE(v.lastError.find("end of stream"), std::string::npos);
    // last good result stays visible while disconnected
    EXPECT_TRUE(v.result.has_value());
    EXPECT_EQ(v.history.size(), 1u);

    o.onFeedEvent(feed::Connected{});
    v = o.view();
    EXPECT_TRUE(v.connected);
    EXPECT_TRUE(v.lastError.empty());
}

TEST(SimulationOrchestratorTest, ParseErrorKeepsConnection) {
    SimulationOrchestrator o;
    o.onFeedEvent(feed::Connected{});
    o.onFeedEvent(feed::FeedError{feed::ErrorKind::Parse, "Failed to parse message: offset 3"});
    const auto v = o.view();
    EXPECT_TRUE(v.connected);
    EXPECT_FALSE(v.lastError.empty());
}

TEST(SimulationOrchestratorTest, CloseFlipsStatus) {
    SimulationOrchestrator o;
    o.onFeedEvent(feed::Connected{});
    o.onFeedEvent(feed::Closed{1000, "Code: 1000, Reason: bye"});
    auto v = o.view();
    EXPECT_FALSE(v.connected);
    EXPECT_TRUE(v.lastError.empty());

    o.onFeedEvent(feed::Closed{1006, "Code: 1006, Reason: Abnormal closure"});
    v = o.view();
    EXPECT_NE(v.lastError.find("1006"), std::string::npos);
}

TEST(SimulationOrchestratorTest, ExhaustedReconnectAsksForManualReconnect) {
    SimulationOrchestrator o;
    o.onFeedEvent(feed::FeedError{feed::ErrorKind::ExhaustedReconnect, "Max reconnection attempts (10) reached"});
    const auto v = o.view();
    EXPECT_FALSE(v.connected);
    EXPECT_NE(v.lastError.find("Max reconnection attempts"), std::string::npos);
}

TEST(SimulationOrchestratorTest, RealizedVolatilityFromHistory) {
    SimulationOrchestrator o;
    o.onSnapshot(book(100.0));
    EXPECT_DOUBLE_EQ(o.view().realizedVolatilityPct, 0.0);
    o.onSnapshot(book(101.0));
    o.onSnapshot(book(100.0));
    o.onSnapshot(book(102.0));
    EXPECT_GT(o.view().realizedVolatilityPct, 0.0);
}
