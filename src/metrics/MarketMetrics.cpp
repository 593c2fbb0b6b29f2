#include "tradesim/metrics/MarketMetrics.hpp"

#include <algorithm>
#include <cmath>

namespace tradesim::metrics {

std::vector<Level> sortedLevels(const OrderBookSnapshot& snap, Side side) {
  const auto& raw = snap.levels(side);
  std::vector<Level> out;
  out.reserve(raw.size());
  for (const auto& lv : raw) {
    if (lv.price > 0 && lv.size > 0) out.push_back(lv);
  }
  if (side == Side::Ask) {
    std::stable_sort(out.begin(), out.end(),
                     [](const Level& a, const Level& b){ return a.price < b.price; });
  } else {
    std::stable_sort(out.begin(), out.end(),
                     [](const Level& a, const Level& b){ return a.price > b.price; });
  }
  return out;
}

static Decimal bandDepth(const std::vector<Level>& levels, const Decimal& mid, const Decimal& band) {
  Decimal sum = 0;
  for (const auto& lv : levels) {
    if (abs(mid - lv.price) <= band) sum += lv.size;
  }
  return sum;
}

MarketMetrics computeMetrics(const OrderBookSnapshot& snap) {
  const auto asks = sortedLevels(snap, Side::Ask);
  const auto bids = sortedLevels(snap, Side::Bid);
  if (asks.empty() || bids.empty()) {
    return MarketMetrics{};
  }

  MarketMetrics m;
  m.valid       = true;
  m.bestAsk     = asks.front().price;
  m.bestBid     = bids.front().price;
  m.bestAskSize = asks.front().size;
  m.bestBidSize = bids.front().size;
  m.spread      = m.bestAsk - m.bestBid;
  m.midPrice    = (m.bestAsk + m.bestBid) / 2;

  const Decimal band = m.midPrice * depthBandFraction();
  m.bidDepth = bandDepth(bids, m.midPrice, band);
  m.askDepth = bandDepth(asks, m.midPrice, band);
  m.depth    = m.bidDepth + m.askDepth;

  if (m.depth > 0) {
    m.imbalance = (m.bidDepth - m.askDepth) / m.depth;
  } else {
    m.imbalance = 0;
  }

  m.volatilityProxy = m.spread / m.midPrice * 100;
  return m;
}

Decimal vwap(const OrderBookSnapshot& snap, Side side) {
  const auto levels = sortedLevels(snap, side);
  Decimal weighted = 0;
  Decimal volume = 0;
  for (const auto& lv : levels) {
    weighted += lv.price * lv.size;
    volume   += lv.size;
  }
  if (volume == 0) return Decimal(0);
  return weighted / volume;
}

Decimal priceImpact(const OrderBookSnapshot& snap, const Decimal& quantityBase, OrderSide side) {
  if (quantityBase <= 0) return Decimal(0);

  const auto levels = sortedLevels(snap, passiveSide(side));
  if (levels.empty()) return Decimal(0);

  const Decimal& best = levels.front().price;
  Decimal remaining = quantityBase;
  Decimal cost = 0;

  for (const auto& lv : levels) {
    if (remaining <= 0) break;
    const Decimal fill = (std::min)(remaining, lv.size);
    cost      += lv.price * fill;
    remaining -= fill;
  }

  if (remaining > 0) {
    return Decimal(kInsufficientLiquidityImpactPct);
  }

  const Decimal avg = cost / quantityBase;
  return abs(avg - best) / best * 100;
}

double realizedVolatility(const std::vector<double>& prices, std::size_t window) {
  std::vector<double> returns;
  returns.reserve(prices.size());
  for (std::size_t i = 1; i < prices.size(); ++i) {
    if (prices[i - 1] > 0.0 && prices[i] > 0.0) {
      returns.push_back(std::log(prices[i] / prices[i - 1]));
    }
  }

  const std::size_t n = (window == 0) ? returns.size() : (std::min)(window, returns.size());
  if (n < 2) return 0.0;

  const auto first = returns.end() - static_cast<std::ptrdiff_t>(n);
  double mean = 0.0;
  for (auto it = first; it != returns.end(); ++it) mean += *it;
  mean /= static_cast<double>(n);

  double acc = 0.0;
  for (auto it = first; it != returns.end(); ++it) {
    const double d = *it - mean;
    acc += d * d;
  }
  const double variance = acc / static_cast<double>(n - 1);
  return std::sqrt(variance * 252.0) * 100.0;
}

} // namespace tradesim::metrics
