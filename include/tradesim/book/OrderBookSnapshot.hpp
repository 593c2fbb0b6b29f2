#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tradesim/book/Decimal.hpp"

namespace tradesim {

enum class Side : uint8_t { Bid = 0, Ask = 1 };

// Direction of the simulated order. A buy consumes asks, a sell consumes bids.
enum class OrderSide : uint8_t { Buy = 0, Sell = 1 };

inline Side passiveSide(OrderSide s) { return s == OrderSide::Buy ? Side::Ask : Side::Bid; }

struct Level {
  Decimal price;
  Decimal size;
};

// One complete book state as delivered by the feed. Levels are kept in wire
// order; nothing here guarantees they are sorted or positive.
struct OrderBookSnapshot {
  std::string timestamp;
  std::string exchange;
  std::string symbol;
  std::vector<Level> asks;
  std::vector<Level> bids;

  const std::vector<Level>& levels(Side s) const { return s == Side::Ask ? asks : bids; }
};

} // namespace tradesim
