#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tradesim {
namespace util {

// Local wall-clock time as "YYYY-MM-DDTHH:MM:SS.mmm".
std::string nowIso();

inline int64_t nowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace util
} // namespace tradesim
