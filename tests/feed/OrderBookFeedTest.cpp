#include "tradesim/feed/OrderBookFeed.hpp"
#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tradesim::feed;
using namespace std::chrono_literals;

// Transport whose outcome the test drives by hand
struct FakeTransport : Transport {
    Sink sink;
    bool failOnOpen = false;
    int closes = 0;

    void open(Sink s) override {
        sink = std::move(s);
        if (failOnOpen) sink(transport::Failed{"connect", "connection refused"});
    }
    void close() override { ++closes; }

    void push(TransportEvent ev) { if (sink) sink(std::move(ev)); }
};

static const char* kFrame = R"({"exchange":"OKX","symbol":"BTC-USDT-SWAP",
                                "asks":[["100","2"],["101","3"]],"bids":[["99","5"]]})";

class OrderBookFeedTest : public ::testing::Test {
protected:
    boost::asio::io_context ioc;
    std::vector<std::shared_ptr<FakeTransport>> transports;
    std::vector<FeedEvent> events;
    std::shared_ptr<OrderBookFeed> feed;

    int failuresLeft = 0;        // transports created while > 0 fail on open
    bool factoryThrows = false;

    void make(unsigned maxAttempts = 3, std::chrono::milliseconds base = 1ms) {
        BackoffPolicy policy;
        policy.baseDelay = base;
        policy.maxDelay = base * 4;
        policy.maxAttempts = maxAttempts;

        feed = OrderBookFeed::create(
            ioc,
            [this]() -> std::shared_ptr<Transport> {
                if (factoryThrows) throw std::runtime_error("no route");
                auto t = std::make_shared<FakeTransport>();
                if (failuresLeft > 0) { --failuresLeft; t->failOnOpen = true; }
                transports.push_back(t);
                return t;
            },
            policy,
            [this](const FeedEvent& ev) { events.push_back(ev); });
    }

    void TearDown() override {
        if (feed) {
            feed->disconnect();
            drain();
        }
    }

    void drain() {
        ioc.restart();
        ioc.poll();
    }

    bool runUntil(const std::function<bool()>& pred, std::chrono::milliseconds limit = 2000ms) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!pred() && std::chrono::steady_clock::now() < deadline) {
            ioc.restart();
            ioc.run_for(5ms);
        }
        return pred();
    }

    void connectAndOpen() {
        feed->connect();
        drain();
        ASSERT_EQ(transports.size(), 1u);
        transports.back()->push(transport::Opened{});
        drain();
        ASSERT_EQ(feed->state(), FeedState::Connected);
    }

    template <typename T>
    int count() const {
        int n = 0;
        for (const auto& e : events) if (std::holds_alternative<T>(e)) ++n;
        return n;
    }

    int errors(ErrorKind kind) const {
        int n = 0;
        for (const auto& e : events) {
            if (auto* fe = std::get_if<FeedError>(&e); fe && fe->kind == kind) ++n;
        }
        return n;
    }
};

TEST_F(OrderBookFeedTest, StartsDisconnected) {
    make();
    EXPECT_EQ(feed->state(), FeedState::Disconnected);
    EXPECT_TRUE(transports.empty());
}

TEST_F(OrderBookFeedTest, ConnectEmitsConnected) {
    make();
    feed->connect();
    drain();
    EXPECT_EQ(feed->state(), FeedState::Connecting);
    ASSERT_EQ(transports.size(), 1u);

    transports[0]->push(transport::Opened{});
    drain();
    EXPECT_TRUE(feed->isConnected());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<Connected>(events[0]));
}

TEST_F(OrderBookFeedTest, ConnectWhileConnectedIsIgnored) {
    make();
    connectAndOpen();
    feed->connect();
    drain();
    EXPECT_EQ(transports.size(), 1u);
    EXPECT_EQ(count<Connected>(), 1);
}

TEST_F(OrderBookFeedTest, FrameDeliversSnapshot) {
    make();
    connectAndOpen();
    transports[0]->push(transport::Frame{kFrame});
    drain();
    ASSERT_EQ(count<SnapshotReceived>(), 1);
    const auto& snap = std::get<SnapshotReceived>(events.back()).snapshot;
    EXPECT_EQ(snap.symbol, "BTC-USDT-SWAP");
    EXPECT_EQ(snap.asks.size(), 2u);
    EXPECT_EQ(snap.bids.size(), 1u);
}

TEST_F(OrderBookFeedTest, BadFrameIsNonFatal) {
    make();
    connectAndOpen();
    transports[0]->push(transport::Frame{"not json"});
    transports[0]->push(transport::Frame{kFrame});
    drain();

    EXPECT_EQ(errors(ErrorKind::Parse), 1);
    EXPECT_EQ(count<SnapshotReceived>(), 1);
    EXPECT_TRUE(feed->isConnected());
    EXPECT_EQ(transports.size(), 1u);
    EXPECT_NE(std::get<FeedError>(events[1]).reason.find("Failed to parse message"), std::string::npos);
}

TEST_F(OrderBookFeedTest, EventsKeepTransportOrder) {
    make();
    connectAndOpen();
    transports[0]->push(transport::Frame{kFrame});
    transports[0]->push(transport::Frame{"{"});
    transports[0]->push(transport::Frame{kFrame});
    drain();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<SnapshotReceived>(events[1]));
    EXPECT_TRUE(std::holds_alternative<FeedError>(events[2]));
    EXPECT_TRUE(std::holds_alternative<SnapshotReceived>(events[3]));
}

TEST_F(OrderBookFeedTest, FailureSchedulesReconnect) {
    make();
    connectAndOpen();
    transports[0]->push(transport::Failed{"read", "end of stream"});
    drain();

    EXPECT_EQ(errors(ErrorKind::Connection), 1);
    EXPECT_EQ(feed->state(), FeedState::Reconnecting);
    EXPECT_EQ(feed->attempts(), 1u);

    ASSERT_TRUE(runUntil([this] { return transports.size() == 2; }));
    EXPECT_EQ(feed->state(), FeedState::Connecting);
}

TEST_F(OrderBookFeedTest, AbnormalCloseEmitsClosedThenError) {
    make();
    connectAndOpen();
    transports[0]->push(transport::Closed{1006, ""});
    drain();

    ASSERT_EQ(events.size(), 3u);
    const auto& closed = std::get<Closed>(events[1]);
    EXPECT_EQ(closed.code, 1006);
    EXPECT_EQ(closed.reason, "Code: 1006, Reason: Abnormal closure");
    const auto& err = std::get<FeedError>(events[2]);
    EXPECT_EQ(err.kind, ErrorKind::Connection);
    EXPECT_EQ(feed->state(), FeedState::Reconnecting);
}

TEST_F(OrderBookFeedTest, NormalServerCloseReconnectsQuietly) {
    make();
    connectAndOpen();
    transports[0]->push(transport::Closed{1000, "maintenance"});
    drain();

    EXPECT_EQ(count<Closed>(), 1);
    EXPECT_EQ(std::get<Closed>(events.back()).reason, "Code: 1000, Reason: maintenance");
    EXPECT_EQ(count<FeedError>(), 0);
    EXPECT_EQ(feed->state(), FeedState::Reconnecting);
}

TEST_F(OrderBookFeedTest, ExhaustedBudgetFails) {
    make(3);
    failuresLeft = 100;
    feed->connect();
    ASSERT_TRUE(runUntil([this] { return feed->state() == FeedState::Failed; }));

    // initial attempt plus three retries
    EXPECT_EQ(transports.size(), 4u);
    EXPECT_EQ(errors(ErrorKind::Connection), 4);
    ASSERT_EQ(errors(ErrorKind::ExhaustedReconnect), 1);
    EXPECT_EQ(std::get<FeedError>(events.back()).reason, "Max reconnection attempts (3) reached");

    // terminal: nothing else fires on its own
    ioc.restart();
    ioc.run_for(30ms);
    EXPECT_EQ(transports.size(), 4u);
    EXPECT_EQ(feed->state(), FeedState::Failed);
}

TEST_F(OrderBookFeedTest, ConnectFromFailedRestoresBudget) {
    make(2);
    failuresLeft = 3;
    feed->connect();
    ASSERT_TRUE(runUntil([this] { return feed->state() == FeedState::Failed; }));
    ASSERT_EQ(transports.size(), 3u);

    feed->connect();
    drain();
    EXPECT_EQ(feed->state(), FeedState::Connecting);
    EXPECT_EQ(feed->attempts(), 0u);
    ASSERT_EQ(transports.size(), 4u);
    transports.back()->push(transport::Opened{});
    drain();
    EXPECT_TRUE(feed->isConnected());
}

TEST_F(OrderBookFeedTest, AttemptsResetOnOpen) {
    make(5);
    failuresLeft = 2;
    feed->connect();
    ASSERT_TRUE(runUntil([this] { return transports.size() == 3; }));
    drain();
    EXPECT_EQ(feed->attempts(), 2u);

    transports.back()->push(transport::Opened{});
    drain();
    EXPECT_TRUE(feed->isConnected());
    EXPECT_EQ(feed->attempts(), 0u);
}

TEST_F(OrderBookFeedTest, DisconnectEmitsNormalClose) {
    make();
    connectAndOpen();
    feed->disconnect();
    drain();

    EXPECT_EQ(feed->state(), FeedState::Disconnected);
    EXPECT_EQ(transports[0]->closes, 1);
    ASSERT_EQ(count<Closed>(), 1);
    EXPECT_EQ(std::get<Closed>(events.back()).code, 1000);
}

TEST_F(OrderBookFeedTest, NoReconnectAfterDisconnectEvenWithDelayedClose) {
    make();
    connectAndOpen();
    feed->disconnect();
    drain();

    // the old transport reports its close after we already let go of it
    transports[0]->push(transport::Closed{1006, "late"});
    transports[0]->push(transport::Failed{"read", "operation aborted"});
    ioc.restart();
    ioc.run_for(30ms);

    EXPECT_EQ(transports.size(), 1u);
    EXPECT_EQ(feed->state(), FeedState::Disconnected);
    EXPECT_EQ(count<FeedError>(), 0);
}

TEST_F(OrderBookFeedTest, DisconnectWinsOverQueuedFailure) {
    make();
    connectAndOpen();
    // failure already on its way to the strand when disconnect() is called
    transports[0]->push(transport::Failed{"read", "reset by peer"});
    feed->disconnect();
    ioc.restart();
    ioc.run_for(30ms);

    EXPECT_EQ(transports.size(), 1u);
    EXPECT_EQ(feed->state(), FeedState::Disconnected);
    EXPECT_EQ(errors(ErrorKind::Connection), 0);
}

TEST_F(OrderBookFeedTest, DisconnectCancelsPendingReconnect) {
    make(3, 20ms);
    connectAndOpen();
    transports[0]->push(transport::Failed{"read", "eof"});
    drain();
    ASSERT_EQ(feed->state(), FeedState::Reconnecting);

    feed->disconnect();
    ioc.restart();
    ioc.run_for(100ms);

    EXPECT_EQ(transports.size(), 1u);
    EXPECT_EQ(feed->state(), FeedState::Disconnected);
}

TEST_F(OrderBookFeedTest, ConnectWhileReconnectingSkipsBackoff) {
    make(3, 1000ms);
    connectAndOpen();
    transports[0]->push(transport::Failed{"read", "eof"});
    drain();
    ASSERT_EQ(feed->state(), FeedState::Reconnecting);

    feed->connect();
    drain();
    EXPECT_EQ(transports.size(), 2u);
    EXPECT_EQ(feed->state(), FeedState::Connecting);
    EXPECT_EQ(feed->attempts(), 1u);
}

TEST_F(OrderBookFeedTest, FactoryFailureIsConnectionError) {
    make(1);
    factoryThrows = true;
    feed->connect();
    ASSERT_TRUE(runUntil([this] { return feed->state() == FeedState::Failed; }));

    EXPECT_EQ(errors(ErrorKind::Connection), 2);
    EXPECT_NE(std::get<FeedError>(events.front()).reason.find("transport setup failed"), std::string::npos);
}

TEST_F(OrderBookFeedTest, HandlerExceptionDoesNotBreakFeed) {
    int calls = 0;
    BackoffPolicy policy;
    policy.baseDelay = 1ms;
    feed = OrderBookFeed::create(
        ioc,
        [this]() -> std::shared_ptr<Transport> {
            auto t = std::make_shared<FakeTransport>();
            transports.push_back(t);
            return t;
        },
        policy,
        [&calls](const FeedEvent&) { ++calls; throw std::runtime_error("ui blew up"); });

    feed->connect();
    drain();
    transports[0]->push(transport::Opened{});
    transports[0]->push(transport::Frame{kFrame});
    drain();
    EXPECT_EQ(calls, 2);
    EXPECT_TRUE(feed->isConnected());
}
