#include "tradesim/model/FeeSchedule.hpp"

#include <algorithm>
#include <cctype>

namespace tradesim::model {

namespace {

constexpr std::array<double, kFeeTierCount> kRates = {
  0.0010,  // VIP 0
  0.0008,  // VIP 1
  0.0006,  // VIP 2
  0.0004,  // VIP 3
  0.0002,  // VIP 4
  0.0000,  // VIP 5
};

} // namespace

double feeRate(FeeTier tier) {
  const auto idx = static_cast<std::size_t>(tier);
  if (idx >= kRates.size()) return kRates[static_cast<std::size_t>(kFallbackFeeTier)];
  return kRates[idx];
}

FeeTier parseFeeTier(const std::string& label, bool* recognized) {
  std::string x;
  x.reserve(label.size());
  for (char c : label) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      x.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (x.size() == 4 && x.compare(0, 3, "vip") == 0 && std::isdigit(static_cast<unsigned char>(x[3]))) {
    const std::size_t n = static_cast<std::size_t>(x[3] - '0');
    if (n < kFeeTierCount) {
      if (recognized) *recognized = true;
      return static_cast<FeeTier>(n);
    }
  }
  if (recognized) *recognized = false;
  return kFallbackFeeTier;
}

std::string toString(FeeTier tier) {
  return "VIP " + std::to_string(static_cast<std::size_t>(tier));
}

} // namespace tradesim::model
