#include "tradesim/feed/OrderBookFeed.hpp"

#include "tradesim/book/SnapshotCodec.hpp"
#include "tradesim/util/Logger.hpp"
#include "tradesim/util/Metrics.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

#include <exception>
#include <type_traits>
#include <utility>

namespace tradesim::feed {

using util::logger;
using util::LogLevel;

OrderBookFeed::OrderBookFeed(boost::asio::io_context& ioc,
                             TransportFactory factory,
                             BackoffPolicy policy,
                             Handler handler)
  : strand_(boost::asio::make_strand(ioc))
  , timer_(strand_)
  , factory_(std::move(factory))
  , policy_(policy)
  , handler_(std::move(handler))
{
}

// ---------------------- public API ----------------------

void OrderBookFeed::connect() {
  boost::asio::post(strand_, [self = shared_from_this()]{ self->doConnect(); });
}

void OrderBookFeed::disconnect() {
  // Set before posting so a timer or close event already queued on the strand
  // sees it and stands down.
  intentionalClose_.store(true, std::memory_order_release);
  boost::asio::post(strand_, [self = shared_from_this()]{ self->doDisconnect(); });
}

// ---------------------- strand-only ----------------------

void OrderBookFeed::doConnect() {
  const FeedState s = state();
  if (s == FeedState::Connecting || s == FeedState::Connected) {
    logger().log(LogLevel::Debug, "feed.connect.ignored", { {"state", toString(s)} });
    return;
  }

  intentionalClose_.store(false, std::memory_order_release);
  if (s == FeedState::Reconnecting) {
    timer_.cancel();
  } else {
    setAttempts(0);
  }
  startAttempt();
}

void OrderBookFeed::doDisconnect() {
  ++generation_;
  timer_.cancel();

  if (transport_) {
    transport_->close();
    transport_.reset();
  }

  const FeedState prev = state();
  setState(FeedState::Disconnected);
  if (prev == FeedState::Connected) {
    emit(Closed{1000, closeCodeText(1000) + " (client disconnect)"});
  }
}

void OrderBookFeed::startAttempt() {
  const uint64_t gen = ++generation_;
  setState(FeedState::Connecting);
  logger().log(LogLevel::Info, "feed.connecting",
               { {"attempt", std::to_string(attempts_)},
                 {"max", std::to_string(policy_.maxAttempts)} });

  try {
    transport_ = factory_ ? factory_() : nullptr;
  } catch (const std::exception& ex) {
    transport_.reset();
    onSessionEnded(std::string("transport setup failed: ") + ex.what(), true, nullptr);
    return;
  }
  if (!transport_) {
    onSessionEnded("transport setup failed: no transport", true, nullptr);
    return;
  }

  std::weak_ptr<OrderBookFeed> weak = shared_from_this();
  transport_->open([weak, gen](TransportEvent ev) {
    if (auto self = weak.lock()) {
      boost::asio::post(self->strand_, [self, gen, ev = std::move(ev)]() mutable {
        self->onTransportEvent(gen, std::move(ev));
      });
    }
  });
}

void OrderBookFeed::onTransportEvent(uint64_t gen, TransportEvent ev) {
  if (gen != generation_) {
    logger().log(LogLevel::Trace, "feed.event.stale",
                 { {"gen", std::to_string(gen)}, {"current", std::to_string(generation_)} });
    return;
  }

  std::visit([this](auto& e) {
    using T = std::decay_t<decltype(e)>;
    if constexpr (std::is_same_v<T, transport::Opened>) {
      setAttempts(0);
      setState(FeedState::Connected);
      logger().log(LogLevel::Info, "feed.connected");
      emit(Connected{});
    } else if constexpr (std::is_same_v<T, transport::Frame>) {
      onFrame(e.text);
    } else if constexpr (std::is_same_v<T, transport::Failed>) {
      onSessionEnded(e.where + ": " + e.message, true, nullptr);
    } else if constexpr (std::is_same_v<T, transport::Closed>) {
      std::string text = "Code: " + std::to_string(e.code) + ", Reason: " +
                         (e.reason.empty() ? closeCodeText(e.code) : e.reason);
      Closed c{e.code, text};
      onSessionEnded(std::move(text), e.code != 1000, &c);
    }
  }, ev);
}

void OrderBookFeed::onFrame(const std::string& text) {
  TRADESIM_METRIC_HIT("feed.frame_in");

  auto parsed = parseSnapshot(text);
  if (!parsed) {
    TRADESIM_METRIC_HIT("feed.parse_error");
    const std::string why = parsed.error().describe();
    logger().log(LogLevel::Warn, "feed.frame.bad",
                 { {"error", why}, {"frame", text.substr(0, 256)} });
    emit(FeedError{ErrorKind::Parse, "Failed to parse message: " + why});
    return;
  }

  TRADESIM_METRIC_HIT("feed.snapshot_ok");
  emit(SnapshotReceived{std::move(parsed.value())});
}

void OrderBookFeed::onSessionEnded(std::string reason, bool abnormal, const Closed* closed) {
  // Anything else this transport reports is stale from here on.
  ++generation_;
  transport_.reset();

  if (intentionalClose_.load(std::memory_order_acquire)) {
    setState(FeedState::Disconnected);
    return;
  }

  logger().log(abnormal ? LogLevel::Warn : LogLevel::Info, "feed.session.ended",
               { {"reason", reason} });

  if (closed) emit(*closed);
  if (abnormal) emit(FeedError{ErrorKind::Connection, std::move(reason)});

  scheduleReconnect();
}

void OrderBookFeed::scheduleReconnect() {
  // The handler may have called disconnect() while we were emitting.
  if (intentionalClose_.load(std::memory_order_acquire)) {
    setState(FeedState::Disconnected);
    return;
  }

  if (policy_.exhausted(attempts_)) {
    TRADESIM_METRIC_HIT("feed.failed");
    setState(FeedState::Failed);
    const std::string msg = "Max reconnection attempts (" + std::to_string(policy_.maxAttempts) + ") reached";
    logger().log(LogLevel::Error, "feed.failed", { {"reason", msg} });
    emit(FeedError{ErrorKind::ExhaustedReconnect, msg});
    return;
  }

  setAttempts(attempts_ + 1);
  const auto delay = policy_.delayFor(attempts_);
  setState(FeedState::Reconnecting);
  TRADESIM_METRIC_HIT("feed.reconnect_scheduled");
  logger().log(LogLevel::Info, "feed.reconnect.scheduled",
               { {"attempt", std::to_string(attempts_)},
                 {"max", std::to_string(policy_.maxAttempts)},
                 {"delayMs", std::to_string(delay.count())} });

  const uint64_t gen = generation_;
  timer_.expires_after(delay);
  timer_.async_wait(
    boost::asio::bind_executor(
      strand_,
      [self = shared_from_this(), gen](const boost::system::error_code& ec) {
        self->onReconnectTimer(gen, ec);
      }
    )
  );
}

void OrderBookFeed::onReconnectTimer(uint64_t gen, const boost::system::error_code& ec) {
  if (ec == boost::asio::error::operation_aborted) return;
  if (intentionalClose_.load(std::memory_order_acquire)) return;
  if (gen != generation_ || state() != FeedState::Reconnecting) return;

  startAttempt();
}

void OrderBookFeed::setState(FeedState s) {
  const FeedState prev = state_.exchange(s, std::memory_order_acq_rel);
  if (prev != s) {
    logger().log(LogLevel::Debug, "feed.state",
                 { {"from", toString(prev)}, {"to", toString(s)} });
  }
}

void OrderBookFeed::setAttempts(unsigned n) {
  attempts_ = n;
  attemptsSeen_.store(n, std::memory_order_release);
}

void OrderBookFeed::emit(const FeedEvent& ev) {
  if (!handler_) return;
  try {
    handler_(ev);
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "feed.handler.threw", { {"what", ex.what()} });
  }
}

} // namespace tradesim::feed
