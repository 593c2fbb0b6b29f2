#pragma once

#include <cstddef>
#include <vector>

#include "tradesim/book/Decimal.hpp"
#include "tradesim/book/OrderBookSnapshot.hpp"

namespace tradesim::metrics {

// Half-width of the depth band around mid, as a fraction of mid.
inline const Decimal& depthBandFraction() {
  static const Decimal kBand("0.02");
  return kBand;
}

// Returned by priceImpact() when the side can't fill the quantity. A fixed
// finite value keeps slippage and net cost finite downstream.
constexpr int kInsufficientLiquidityImpactPct = 100;

struct MarketMetrics {
  bool    valid = false;   // false: one side had no usable best level
  Decimal bestAsk;
  Decimal bestBid;
  Decimal bestAskSize;
  Decimal bestBidSize;
  Decimal spread;          // may be <= 0 on a crossed book
  Decimal midPrice;
  Decimal bidDepth;
  Decimal askDepth;
  Decimal depth;           // bidDepth + askDepth inside the band
  Decimal imbalance;       // (bid - ask) / (bid + ask), in [-1, 1]

  // spread / mid * 100. A liquidity proxy for very short horizons, not a
  // statistical estimate; see realizedVolatility() for that.
  Decimal volatilityProxy;
};

// Usable levels of one side, best first: non-positive prices and sizes are
// dropped, asks sorted ascending and bids descending.
std::vector<Level> sortedLevels(const OrderBookSnapshot& snap, Side side);

// Neutral (all zero, valid=false) when either side has no usable level.
MarketMetrics computeMetrics(const OrderBookSnapshot& snap);

// Size-weighted average price over one side; 0 if the side is empty.
Decimal vwap(const OrderBookSnapshot& snap, Side side);

// Walks the book from the best level outward until quantityBase is filled and
// returns |avgFill - best| / best * 100. Returns 0 for a non-positive quantity
// or an empty side and kInsufficientLiquidityImpactPct if the side runs dry.
Decimal priceImpact(const OrderBookSnapshot& snap, const Decimal& quantityBase, OrderSide side);

// Annualized (252 periods) sample stddev of log returns over the last
// `window` returns, in percent. 0 with fewer than two returns.
double realizedVolatility(const std::vector<double>& prices, std::size_t window = 20);

} // namespace tradesim::metrics
