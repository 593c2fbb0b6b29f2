#include "tradesim/ws/WsTransport.hpp"

#include "tradesim/util/Logger.hpp"

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>

namespace tradesim { namespace ws {

using namespace std::chrono_literals;
namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;

template <bool Secure>
BasicWsTransport<Secure>::BasicWsTransport(IoContext& ioc,
                                           FeedUrl url,
                                           std::shared_ptr<boost::asio::ssl::context> sslCtx)
  : strand_(boost::asio::make_strand(ioc))
  , resolver_(strand_)
  , sslCtx_(std::move(sslCtx))
  , url_(std::move(url))
{
  if constexpr (Secure) {
    if (!sslCtx_) {
      sslCtx_ = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
      sslCtx_->set_default_verify_paths();
      sslCtx_->set_verify_mode(boost::asio::ssl::verify_peer);
    }
    ws_ = std::make_unique<WsStream>(strand_, *sslCtx_);
  } else {
    ws_ = std::make_unique<WsStream>(strand_);
  }
}

template <bool Secure>
void BasicWsTransport<Secure>::open(Sink sink) {
  boost::asio::post(
    strand_,
    [self = this->shared_from_this(), sink = std::move(sink)]() mutable {
      self->sink_ = std::move(sink);
      if (self->closing_) return;

      // Resolve host:service
      self->resolver_.async_resolve(self->url_.host, self->url_.port,
        boost::asio::bind_executor(
          self->strand_,
          [self](ErrorCode ec, Tcp::resolver::results_type results) {
            self->onResolve(ec, std::move(results));
          }
        )
      );
    }
  );
}

template <bool Secure>
void BasicWsTransport<Secure>::onResolve(ErrorCode ec, Tcp::resolver::results_type results) {
  if (ec) return fail(ec, "resolve");
  if (closing_) return;

  // Covers TCP connect and the TLS handshake; the websocket layer has its own timeouts.
  beast::get_lowest_layer(*ws_).expires_after(30s);

  beast::get_lowest_layer(*ws_).async_connect(
    results,
    boost::asio::bind_executor(
      strand_,
      [self = this->shared_from_this()](ErrorCode ec2, Tcp::resolver::results_type::endpoint_type ep) {
        self->onConnect(ec2, ep);
      }
    )
  );
}

template <bool Secure>
void BasicWsTransport<Secure>::onConnect(ErrorCode ec, Tcp::resolver::results_type::endpoint_type) {
  if (ec) return fail(ec, "connect");
  if (closing_) return;

  if constexpr (Secure) {
    // SNI: most hosted endpoints refuse the handshake without it
    if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), url_.host.c_str())) {
      ErrorCode sni{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
      return fail(sni, "tls-sni");
    }
    ws_->next_layer().async_handshake(
      boost::asio::ssl::stream_base::client,
      boost::asio::bind_executor(
        strand_,
        [self = this->shared_from_this()](ErrorCode ec2) {
          self->onTlsHandshake(ec2);
        }
      )
    );
  } else {
    startWsHandshake();
  }
}

template <bool Secure>
void BasicWsTransport<Secure>::onTlsHandshake(ErrorCode ec) {
  if (ec) return fail(ec, "tls-handshake");
  if (closing_) return;
  startWsHandshake();
}

template <bool Secure>
void BasicWsTransport<Secure>::startWsHandshake() {
  beast::get_lowest_layer(*ws_).expires_never();

  ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
  ws_->set_option(websocket::stream_base::decorator(
    [](websocket::request_type& req){
      req.set(beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " tradesim-feed");
    }));

  // Order-book frames are JSON text
  ws_->text(true);

  ws_->async_handshake(url_.hostHeader(), url_.target,
    boost::asio::bind_executor(
      strand_,
      [self = this->shared_from_this()](ErrorCode ec2){
        self->onHandshake(ec2);
      }
    )
  );
}

template <bool Secure>
void BasicWsTransport<Secure>::onHandshake(ErrorCode ec) {
  if (ec) return fail(ec, "handshake");
  if (closing_) return;

  opened_ = true;
  deliver(feed::transport::Opened{});
  doRead();
}

template <bool Secure>
void BasicWsTransport<Secure>::doRead() {
  ws_->async_read(
    buffer_,
    boost::asio::bind_executor(
      strand_,
      [self = this->shared_from_this()](ErrorCode ec, std::size_t bytes){
        self->onRead(ec, bytes);
      }
    )
  );
}

template <bool Secure>
void BasicWsTransport<Secure>::onRead(ErrorCode ec, std::size_t) {
  if (ec) {
    if (ec == websocket::error::closed) {
      const auto& cr = ws_->reason();
      finished_ = true;
      deliver(feed::transport::Closed{static_cast<int>(cr.code), std::string(cr.reason.c_str())});
      return;
    }
    return fail(ec, "read");
  }

  deliver(feed::transport::Frame{beast::buffers_to_string(buffer_.cdata())});
  buffer_.consume(buffer_.size());

  doRead();
}

template <bool Secure>
void BasicWsTransport<Secure>::close() {
  boost::asio::post(
    strand_,
    [self = this->shared_from_this()](){
      if (self->closing_) return;
      self->closing_ = true;

      if (!self->opened_ || !self->ws_->is_open()) {
        // Still resolving/connecting: abort the chain.
        self->resolver_.cancel();
        beast::get_lowest_layer(*self->ws_).cancel();
        beast::get_lowest_layer(*self->ws_).close();
        return;
      }

      self->ws_->async_close(
        websocket::close_code::normal,
        boost::asio::bind_executor(
          self->strand_,
          [self](ErrorCode ec){
            if (ec && ec != boost::asio::error::operation_aborted) {
              util::logger().log(util::LogLevel::Debug, "ws.close.error", { {"error", ec.message()} });
            }
          }
        )
      );
    }
  );
}

template <bool Secure>
void BasicWsTransport<Secure>::fail(ErrorCode ec, std::string_view where) {
  // Errors caused by our own close() are expected; the feed already moved on.
  if (closing_) return;
  if (finished_) return;
  finished_ = true;
  deliver(feed::transport::Failed{std::string(where), ec.message()});
}

template <bool Secure>
void BasicWsTransport<Secure>::deliver(feed::TransportEvent ev) {
  if (sink_) sink_(std::move(ev));
}

template class BasicWsTransport<false>;
template class BasicWsTransport<true>;

feed::TransportFactory makeTransportFactory(boost::asio::io_context& ioc, const FeedUrl& url) {
  std::shared_ptr<boost::asio::ssl::context> ssl;
  if (url.secure) {
    ssl = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
    ssl->set_default_verify_paths();
    ssl->set_verify_mode(boost::asio::ssl::verify_peer);
  }

  return [&ioc, url, ssl]() -> std::shared_ptr<feed::Transport> {
    if (url.secure) return std::make_shared<WssTransport>(ioc, url, ssl);
    return std::make_shared<WsTransport>(ioc, url);
  };
}

}} // namespace tradesim::ws
