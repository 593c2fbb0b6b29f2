#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "tradesim/book/OrderBookSnapshot.hpp"
#include "tradesim/feed/FeedEvent.hpp"
#include "tradesim/metrics/MarketMetrics.hpp"
#include "tradesim/model/CostModelEngine.hpp"

namespace tradesim::sim {

constexpr std::size_t kDefaultHistoryCapacity = 100;

constexpr double kMinVolatilityPct = 0.1;
constexpr double kMaxVolatilityPct = 10.0;

// The only venue this build prices.
inline const char* supportedExchange() { return "OKX"; }

struct TimeSeriesPoint {
  std::string timestamp;          // local receipt time, ISO-8601
  model::SimulationResult result;
  double bestAsk = 0.0;
  double bestBid = 0.0;
};

// Consistent copy of everything a UI needs, taken under one lock.
struct SimulationView {
  std::optional<model::SimulationResult> result;
  std::optional<metrics::MarketMetrics>  metrics;
  model::SimulationParameters            parameters;
  std::deque<TimeSeriesPoint>            history;
  bool        connected = false;
  std::string lastUpdated;        // empty until the first recomputation
  std::string lastError;          // empty when healthy
  double      realizedVolatilityPct = 0.0;
  uint64_t    snapshotsApplied = 0;
  uint64_t    snapshotsSkipped = 0;
};

// Owns the current snapshot, the current result and the bounded history.
// Feed events and parameter changes are applied one at a time under the
// orchestrator lock, so a reader never sees a result computed from one
// snapshot paired with another's metrics.
class SimulationOrchestrator {
public:
  // Fired after every recomputation, outside the lock.
  using OnResult = std::function<void(const model::SimulationResult&)>;

  explicit SimulationOrchestrator(model::CostModelEngine engine = model::CostModelEngine{},
                                  model::SimulationParameters params = model::SimulationParameters{},
                                  std::size_t historyCapacity = kDefaultHistoryCapacity);

  void setOnResult(OnResult cb);

  // Single entry point for the feed's event channel.
  void onFeedEvent(const feed::FeedEvent& ev);

  // Recompute against a new snapshot and append to history. A snapshot with
  // no usable best bid or ask is skipped; the previous result stays current.
  // Returns true if a recomputation happened.
  bool onSnapshot(const OrderBookSnapshot& snap);

  // Validates and applies new parameters, then recomputes against the stored
  // snapshot without appending to history. Invalid parameters are rejected
  // and the previous ones stay in force.
  bool setParameters(const model::SimulationParameters& params, std::string* whyNot = nullptr);

  model::SimulationParameters parameters() const;
  SimulationView view() const;

  std::size_t historyCapacity() const { return capacity_; }

private:
  // Expect mx_ held
  model::SimulationResult recomputeUnlocked(const metrics::MarketMetrics& m);
  void appendHistoryUnlocked(const model::SimulationResult& r, const metrics::MarketMetrics& m);

  void notify(const model::SimulationResult& r);

private:
  const model::CostModelEngine engine_;
  const std::size_t capacity_;

  mutable std::mutex mx_;
  model::SimulationParameters params_;
  std::optional<OrderBookSnapshot> snapshot_;   // last snapshot with a usable top of book
  std::optional<metrics::MarketMetrics> metrics_;
  std::optional<model::SimulationResult> result_;
  std::deque<TimeSeriesPoint> history_;
  bool connected_ = false;
  std::string lastUpdated_;
  std::string lastError_;
  uint64_t applied_ = 0;
  uint64_t skipped_ = 0;

  std::mutex cbMx_;
  OnResult onResult_;
};

// Checks and normalizes parameters: quantity must be finite and > 0, the
// exchange must be supportedExchange(), volatility is clamped into
// [kMinVolatilityPct, kMaxVolatilityPct].
bool validateParameters(model::SimulationParameters& p, std::string* whyNot = nullptr);

} // namespace tradesim::sim
