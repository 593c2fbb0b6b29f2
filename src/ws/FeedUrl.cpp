#include "tradesim/ws/FeedUrl.hpp"

#include <algorithm>
#include <cctype>

namespace tradesim::ws {

std::string FeedUrl::hostHeader() const {
  const bool defaultPort = (secure && port == "443") || (!secure && port == "80");
  return defaultPort ? host : host + ":" + port;
}

Result<FeedUrl> parseFeedUrl(const std::string& url) {
  FeedUrl out;

  auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos) {
    return Error{"missing scheme (expected ws:// or wss://)", url};
  }
  std::string scheme = url.substr(0, schemeEnd);
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (scheme == "ws")       out.secure = false;
  else if (scheme == "wss") out.secure = true;
  else return Error{"unsupported scheme '" + scheme + "'", url};

  const std::string rest = url.substr(schemeEnd + 3);
  const auto slash = rest.find('/');
  const std::string authority = rest.substr(0, slash);
  out.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

  if (authority.empty()) return Error{"missing host", url};

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
    if (out.port.empty() ||
        !std::all_of(out.port.begin(), out.port.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
      return Error{"invalid port '" + out.port + "'", url};
    }
  } else {
    out.host = authority;
    out.port = out.secure ? "443" : "80";
  }
  if (out.host.empty()) return Error{"missing host", url};

  return out;
}

} // namespace tradesim::ws
