#pragma once

#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace tradesim::feed {

// Raw events a transport reports back to the feed.
namespace transport {
struct Opened {};
struct Frame  { std::string text; };
struct Failed { std::string where; std::string message; };
struct Closed { int code = 0; std::string reason; };
} // namespace transport

using TransportEvent = std::variant<transport::Opened,
                                    transport::Frame,
                                    transport::Failed,
                                    transport::Closed>;

// One connection attempt. open() starts it asynchronously and every outcome
// is reported through the sink; after Failed or Closed the instance is spent.
// Implementations may invoke the sink from any thread.
class Transport {
public:
  using Sink = std::function<void(TransportEvent)>;

  virtual ~Transport() = default;

  virtual void open(Sink sink) = 0;

  // Graceful close. Safe to call in any state, including before open completes.
  virtual void close() = 0;
};

using TransportFactory = std::function<std::shared_ptr<Transport>()>;

} // namespace tradesim::feed
