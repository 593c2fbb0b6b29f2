#pragma once

#include <string>

#include "tradesim/Result.hpp"

namespace tradesim::ws {

struct FeedUrl {
  bool        secure = false;   // wss://
  std::string host;
  std::string port;             // defaults to 80 / 443
  std::string target = "/";     // path + query

  std::string hostHeader() const;
};

// Accepts ws://host[:port][/path] and wss://host[:port][/path].
Result<FeedUrl> parseFeedUrl(const std::string& url);

} // namespace tradesim::ws
