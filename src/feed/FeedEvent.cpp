#include "tradesim/feed/FeedEvent.hpp"

namespace tradesim::feed {

const char* toString(FeedState s) {
  switch (s) {
    case FeedState::Disconnected: return "disconnected";
    case FeedState::Connecting:   return "connecting";
    case FeedState::Connected:    return "connected";
    case FeedState::Reconnecting: return "reconnecting";
    case FeedState::Failed:       return "failed";
  }
  return "unknown";
}

const char* toString(ErrorKind k) {
  switch (k) {
    case ErrorKind::Connection:         return "connection";
    case ErrorKind::Parse:              return "parse";
    case ErrorKind::ExhaustedReconnect: return "exhausted_reconnect";
  }
  return "unknown";
}

std::string closeCodeText(int code) {
  switch (code) {
    case 1000: return "Normal closure";
    case 1001: return "Going away";
    case 1002: return "Protocol error";
    case 1003: return "Unsupported data";
    case 1004: return "Reserved";
    case 1005: return "No status received";
    case 1006: return "Abnormal closure";
    case 1007: return "Invalid frame payload data";
    case 1008: return "Policy violation";
    case 1009: return "Message too big";
    case 1010: return "Mandatory extension";
    case 1011: return "Internal server error";
    case 1015: return "TLS handshake";
    default:   return "Unknown reason";
  }
}

} // namespace tradesim::feed
