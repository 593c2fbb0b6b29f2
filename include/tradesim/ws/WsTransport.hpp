#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

#include "tradesim/feed/Transport.hpp"
#include "tradesim/ws/FeedUrl.hpp"

namespace tradesim { namespace ws {

// Websocket client for one connection attempt: resolve, connect, (TLS),
// handshake, then read text frames until the peer closes or an error occurs.
template <bool Secure>
class BasicWsTransport : public feed::Transport,
                         public std::enable_shared_from_this<BasicWsTransport<Secure>> {
public:
  using IoContext = boost::asio::io_context;
  using Tcp       = boost::asio::ip::tcp;
  using ErrorCode = boost::beast::error_code;
  using Layer     = std::conditional_t<Secure,
                                       boost::beast::ssl_stream<boost::beast::tcp_stream>,
                                       boost::beast::tcp_stream>;
  using WsStream  = boost::beast::websocket::stream<Layer>;

  // sslCtx is required (and kept alive) for Secure transports; ignored otherwise.
  BasicWsTransport(IoContext& ioc,
                   FeedUrl url,
                   std::shared_ptr<boost::asio::ssl::context> sslCtx = nullptr);

  void open(Sink sink) override;
  void close() override;

private:
  // Async chain
  void onResolve(ErrorCode ec, Tcp::resolver::results_type results);
  void onConnect(ErrorCode ec, Tcp::resolver::results_type::endpoint_type ep);
  void onTlsHandshake(ErrorCode ec);
  void startWsHandshake();
  void onHandshake(ErrorCode ec);

  // Read loop
  void doRead();
  void onRead(ErrorCode ec, std::size_t bytes);

  void fail(ErrorCode ec, std::string_view where);
  void deliver(feed::TransportEvent ev);

private:
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  Tcp::resolver resolver_;
  std::shared_ptr<boost::asio::ssl::context> sslCtx_;
  std::unique_ptr<WsStream> ws_;
  FeedUrl url_;
  boost::beast::flat_buffer buffer_;

  Sink sink_;
  bool opened_{false};
  bool closing_{false};
  bool finished_{false};   // a terminal event (Failed/Closed) was delivered
};

using WsTransport  = BasicWsTransport<false>;
using WssTransport = BasicWsTransport<true>;

extern template class BasicWsTransport<false>;
extern template class BasicWsTransport<true>;

// Factory handed to the feed: a fresh transport per connection attempt.
feed::TransportFactory makeTransportFactory(boost::asio::io_context& ioc, const FeedUrl& url);

}} // namespace tradesim::ws
