#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "tradesim/book/OrderBookSnapshot.hpp"

namespace tradesim::feed {

enum class FeedState : uint8_t {
  Disconnected = 0,
  Connecting,
  Connected,
  Reconnecting,
  Failed
};

const char* toString(FeedState s);

enum class ErrorKind : uint8_t {
  Connection = 0,       // transport failure or abnormal close; reconnect follows
  Parse,                // malformed frame; connection stays up
  ExhaustedReconnect    // retry budget spent; feed is Failed until connect()
};

const char* toString(ErrorKind k);

// Closed set of events delivered to the feed's owner, in transport order.
struct Connected {};

struct SnapshotReceived {
  OrderBookSnapshot snapshot;
};

struct FeedError {
  ErrorKind   kind = ErrorKind::Connection;
  std::string reason;
};

struct Closed {
  int         code = 0;
  std::string reason;
};

using FeedEvent = std::variant<Connected, SnapshotReceived, FeedError, Closed>;

// Human-readable text for a websocket close code (RFC 6455 section 7.4.1).
std::string closeCodeText(int code);

} // namespace tradesim::feed
