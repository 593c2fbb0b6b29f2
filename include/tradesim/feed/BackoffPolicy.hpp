#pragma once

#include <algorithm>
#include <chrono>

namespace tradesim::feed {

// delay(attempt) = min(base * 2^(attempt-1), max), attempt is 1-based.
struct BackoffPolicy {
  std::chrono::milliseconds baseDelay{1000};
  std::chrono::milliseconds maxDelay{30000};
  unsigned maxAttempts = 10;

  std::chrono::milliseconds delayFor(unsigned attempt) const {
    if (attempt == 0) attempt = 1;
    auto d = baseDelay;
    for (unsigned i = 1; i < attempt; ++i) {
      if (d >= maxDelay) break;
      d *= 2;
    }
    return (std::min)(d, maxDelay);
  }

  bool exhausted(unsigned attemptsSoFar) const { return attemptsSoFar >= maxAttempts; }
};

} // namespace tradesim::feed
