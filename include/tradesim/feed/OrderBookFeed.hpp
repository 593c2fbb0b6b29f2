#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "tradesim/feed/BackoffPolicy.hpp"
#include "tradesim/feed/FeedEvent.hpp"
#include "tradesim/feed/Transport.hpp"

namespace tradesim::feed {

// Keeps one logical connection to the order-book stream alive.
//
// State machine:
//   Disconnected -> Connecting -> Connected
//   Connecting/Connected -> Reconnecting (error or close not caused by us)
//   Reconnecting -> Connecting (backoff timer) | Failed (budget spent)
//   any -> Disconnected (disconnect())
//
// All state lives on one strand. Transport callbacks are posted to it in the
// order they arrive, so the handler sees events in transport order, one at a
// time, from an io_context thread.
class OrderBookFeed : public std::enable_shared_from_this<OrderBookFeed> {
public:
  using Handler = std::function<void(const FeedEvent&)>;

  static std::shared_ptr<OrderBookFeed> create(boost::asio::io_context& ioc,
                                               TransportFactory factory,
                                               BackoffPolicy policy,
                                               Handler handler)
  {
    return std::shared_ptr<OrderBookFeed>(
      new OrderBookFeed(ioc, std::move(factory), policy, std::move(handler)));
  }

  OrderBookFeed(const OrderBookFeed&)            = delete;
  OrderBookFeed& operator=(const OrderBookFeed&) = delete;

  // Opens the transport. From Failed or Disconnected this starts over with a
  // full retry budget; while Reconnecting it skips the remaining backoff.
  void connect();

  // Intentional close. No reconnect attempt fires after this call, even if a
  // close/error from the old transport or an expired timer is still in flight.
  void disconnect();

  FeedState state() const { return state_.load(std::memory_order_acquire); }
  bool isConnected() const { return state() == FeedState::Connected; }
  unsigned attempts() const { return attemptsSeen_.load(std::memory_order_acquire); }
  const BackoffPolicy& policy() const { return policy_; }

private:
  OrderBookFeed(boost::asio::io_context& ioc,
                TransportFactory factory,
                BackoffPolicy policy,
                Handler handler);

  // Strand-only
  void doConnect();
  void doDisconnect();
  void startAttempt();
  void onTransportEvent(uint64_t gen, TransportEvent ev);
  void onFrame(const std::string& text);
  void onSessionEnded(std::string reason, bool abnormal, const Closed* closed);
  void scheduleReconnect();
  void onReconnectTimer(uint64_t gen, const boost::system::error_code& ec);
  void setState(FeedState s);
  void setAttempts(unsigned n);
  void emit(const FeedEvent& ev);

private:
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;

  TransportFactory factory_;
  BackoffPolicy    policy_;
  Handler          handler_;

  std::shared_ptr<Transport> transport_;
  uint64_t generation_{0};   // bumped per attempt and on disconnect; stale events are dropped
  unsigned attempts_{0};

  std::atomic<bool>      intentionalClose_{false};
  std::atomic<FeedState> state_{FeedState::Disconnected};
  std::atomic<unsigned>  attemptsSeen_{0};
};

} // namespace tradesim::feed
