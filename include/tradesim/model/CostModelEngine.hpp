#pragma once

#include <cstdint>
#include <string>

#include "tradesim/book/OrderBookSnapshot.hpp"
#include "tradesim/metrics/MarketMetrics.hpp"
#include "tradesim/model/FeeSchedule.hpp"

namespace tradesim::model {

// Upper bound on the reported market impact. Quadratic temporary impact
// overflows for absurd quantities; the result saturates here instead.
constexpr double kMaxMarketImpactPct = 1e6;

enum class OrderType : uint8_t { Market = 0, Limit = 1 };

OrderType parseOrderType(const std::string& s, bool* recognized = nullptr);
std::string toString(OrderType t);

struct SimulationParameters {
  std::string exchange  = "OKX";
  std::string asset     = "BTC-USDT-SWAP";
  OrderType   orderType = OrderType::Market;
  double      quantity   = 100.0;  // quote currency
  double      volatility = 2.0;    // percent
  FeeTier     feeTier    = FeeTier::Vip0;
};

struct SimulationResult {
  double expectedSlippagePct     = 0.0;
  double expectedFeesAbs         = 0.0;
  double expectedMarketImpactPct = 0.0;
  double netCostAbs              = 0.0;
  double makerTakerProportion    = 0.0;   // estimated maker share, [0, 1]
  double computeLatencyMs        = 0.0;   // diagnostic only
};

// Calibration knobs. None of these are derived from data.
struct ModelConstants {
  // Almgren-Chriss style impact
  double eta   = 0.01;   // permanent impact per unit of base quantity
  double gamma = 0.1;    // temporary impact coefficient

  // Slippage adjustments
  double imbalancePenalty = 0.5;
  double depthPenalty     = 100.0;

  // Logistic maker/taker estimator: z = offset + wSize*relSize + wSpread*spread/depth
  //                                     + wDepth*log1p(depth)*depthScale + wImbalance*|imbalance|
  double makerOffset    = 0.0;
  double wRelativeSize  = -3.0;
  double wSpreadDepth   = -2.0;
  double wLogDepth      = 1.5;
  double logDepthScale  = 0.1;
  double wImbalance     = -0.5;
};

class CostModelEngine {
public:
  CostModelEngine() = default;
  explicit CostModelEngine(ModelConstants k) : k_(k) {}

  const ModelConstants& constants() const { return k_; }

  // One synchronous pass over a snapshot and its metrics. An invalid
  // (degenerate) metrics value yields an all-zero result.
  SimulationResult estimate(const OrderBookSnapshot& snap,
                            const metrics::MarketMetrics& m,
                            const SimulationParameters& p) const;

  // Individual models, exposed for tests and diagnostics.
  double slippagePct(double bookWalkImpactPct, const metrics::MarketMetrics& m) const;
  double fees(double quantityQuote, FeeTier tier) const;
  double marketImpactPct(double quantityBase, double volatilityPct, const metrics::MarketMetrics& m) const;
  double makerTakerProportion(double quantityBase, const metrics::MarketMetrics& m) const;
  static double netCost(double quantityQuote, double slippagePct, double fees, double impactPct);

private:
  ModelConstants k_{};
};

} // namespace tradesim::model
