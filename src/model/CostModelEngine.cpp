#include "tradesim/model/CostModelEngine.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>

namespace tradesim::model {

OrderType parseOrderType(const std::string& s, bool* recognized) {
  std::string x = s;
  std::transform(x.begin(), x.end(), x.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  const bool known = (x == "market" || x == "limit");
  if (recognized) *recognized = known;
  return x == "limit" ? OrderType::Limit : OrderType::Market;
}

std::string toString(OrderType t) {
  return t == OrderType::Limit ? "limit" : "market";
}

// ------------------------------------------------------------
// Individual models
// ------------------------------------------------------------

// Divisor form of the band depth: the real value when positive, 1 on an
// empty band. Fractional depths (thin books) are used as-is.
static double flooredDepth(const metrics::MarketMetrics& m) {
  const double depth = toDouble(m.depth);
  return depth > 0.0 ? depth : 1.0;
}

double CostModelEngine::slippagePct(double bookWalkImpactPct, const metrics::MarketMetrics& m) const {
  const double imbalance = std::fabs(toDouble(m.imbalance));
  const double depth     = (std::max)(0.0, toDouble(m.depth));

  const double imbalanceFactor = 1.0 + k_.imbalancePenalty * imbalance;
  const double depthFactor     = 1.0 + k_.depthPenalty / (depth + 1.0);
  return (std::max)(0.0, bookWalkImpactPct * imbalanceFactor * depthFactor);
}

double CostModelEngine::fees(double quantityQuote, FeeTier tier) const {
  return (std::max)(0.0, quantityQuote) * feeRate(tier);
}

double CostModelEngine::marketImpactPct(double quantityBase,
                                        double volatilityPct,
                                        const metrics::MarketMetrics& m) const {
  const double q     = (std::max)(0.0, quantityBase);
  const double sigma = volatilityPct / 100.0;
  const double depth = flooredDepth(m);

  const double permanent = k_.eta * q;
  const double temporary = (k_.gamma / 2.0) * q * q * sigma;
  const double scale     = 1.0 + 1.0 / std::sqrt(depth);

  const double impact = (permanent + temporary) * scale;
  if (std::isnan(impact)) return 0.0;
  return std::clamp(impact, 0.0, kMaxMarketImpactPct);
}

double CostModelEngine::makerTakerProportion(double quantityBase, const metrics::MarketMetrics& m) const {
  const double topSize   = toDouble(m.bestAskSize);
  const double depth     = (std::max)(0.0, toDouble(m.depth));
  const double relSize   = topSize > 0.0 ? quantityBase / topSize : 0.0;
  const double spreadTo  = toDouble(m.spread) / flooredDepth(m);
  const double imbalance = std::fabs(toDouble(m.imbalance));

  const double z = k_.makerOffset
                 + k_.wRelativeSize * relSize
                 + k_.wSpreadDepth  * spreadTo
                 + k_.wLogDepth     * std::log1p(depth) * k_.logDepthScale
                 + k_.wImbalance    * imbalance;

  const double p = 1.0 / (1.0 + std::exp(-z));
  if (std::isnan(p)) return 0.0;
  return std::clamp(p, 0.0, 1.0);
}

double CostModelEngine::netCost(double quantityQuote, double slippagePct, double fees, double impactPct) {
  return quantityQuote * (slippagePct / 100.0) + fees + quantityQuote * (impactPct / 100.0);
}

// ------------------------------------------------------------
// Full pass
// ------------------------------------------------------------

SimulationResult CostModelEngine::estimate(const OrderBookSnapshot& snap,
                                           const metrics::MarketMetrics& m,
                                           const SimulationParameters& p) const {
  const auto t0 = std::chrono::steady_clock::now();

  SimulationResult r;
  if (m.valid && m.bestAsk > 0 && p.quantity > 0.0) {
    // quantity is quote currency; the book walk and impact models need base units
    const Decimal qBase = Decimal(p.quantity) / m.bestAsk;
    const double  qBaseD = toDouble(qBase);

    const double walk = toDouble(metrics::priceImpact(snap, qBase, OrderSide::Buy));

    r.expectedSlippagePct     = slippagePct(walk, m);
    r.expectedFeesAbs         = fees(p.quantity, p.feeTier);
    r.expectedMarketImpactPct = marketImpactPct(qBaseD, p.volatility, m);
    r.makerTakerProportion    = makerTakerProportion(qBaseD, m);
    r.netCostAbs              = netCost(p.quantity, r.expectedSlippagePct,
                                        r.expectedFeesAbs, r.expectedMarketImpactPct);
  }

  const auto t1 = std::chrono::steady_clock::now();
  r.computeLatencyMs = std::chrono::duration<double, std::milli>(t1 - t0).count();
  return r;
}

} // namespace tradesim::model
