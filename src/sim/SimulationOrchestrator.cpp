#include "tradesim/sim/SimulationOrchestrator.hpp"

#include "tradesim/util/Clock.hpp"
#include "tradesim/util/Logger.hpp"
#include "tradesim/util/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <vector>

namespace tradesim::sim {

using util::logger;
using util::LogLevel;

bool validateParameters(model::SimulationParameters& p, std::string* whyNot) {
  if (!std::isfinite(p.quantity) || p.quantity <= 0.0) {
    if (whyNot) *whyNot = "quantity must be a positive number";
    return false;
  }
  if (p.exchange != supportedExchange()) {
    if (whyNot) *whyNot = "unsupported exchange '" + p.exchange + "' (only " + supportedExchange() + ")";
    return false;
  }
  if (!std::isfinite(p.volatility)) {
    if (whyNot) *whyNot = "volatility must be a number";
    return false;
  }
  p.volatility = std::clamp(p.volatility, kMinVolatilityPct, kMaxVolatilityPct);
  return true;
}

SimulationOrchestrator::SimulationOrchestrator(model::CostModelEngine engine,
                                               model::SimulationParameters params,
                                               std::size_t historyCapacity)
  : engine_(std::move(engine))
  , capacity_(historyCapacity == 0 ? kDefaultHistoryCapacity : historyCapacity)
  , params_(std::move(params))
{
  std::string why;
  if (!validateParameters(params_, &why)) {
    logger().log(LogLevel::Warn, "sim.params.initial_invalid", { {"error", why} });
    params_ = model::SimulationParameters{};
  }
}

void SimulationOrchestrator::setOnResult(OnResult cb) {
  std::lock_guard<std::mutex> lk(cbMx_);
  onResult_ = std::move(cb);
}

// ---------------------- feed events ----------------------

void SimulationOrchestrator::onFeedEvent(const feed::FeedEvent& ev) {
  std::visit([this](const auto& e) {
    using T = std::decay_t<decltype(e)>;
    if constexpr (std::is_same_v<T, feed::Connected>) {
      std::lock_guard<std::mutex> lk(mx_);
      connected_ = true;
      lastError_.clear();
    } else if constexpr (std::is_same_v<T, feed::SnapshotReceived>) {
      onSnapshot(e.snapshot);
    } else if constexpr (std::is_same_v<T, feed::FeedError>) {
      std::lock_guard<std::mutex> lk(mx_);
      switch (e.kind) {
        case feed::ErrorKind::Parse:
          // connection is still up; the previous snapshot stays authoritative
          lastError_ = e.reason;
          break;
        case feed::ErrorKind::Connection:
          connected_ = false;
          lastError_ = "Connection to the order-book feed failed: " + e.reason;
          break;
        case feed::ErrorKind::ExhaustedReconnect:
          connected_ = false;
          lastError_ = e.reason + "; reconnect manually to resume";
          break;
      }
    } else if constexpr (std::is_same_v<T, feed::Closed>) {
      std::lock_guard<std::mutex> lk(mx_);
      connected_ = false;
      if (e.code != 1000) lastError_ = e.reason;
    }
  }, ev);
}

// ---------------------- recomputation ----------------------

bool SimulationOrchestrator::onSnapshot(const OrderBookSnapshot& snap) {
  metrics::MarketMetrics m = metrics::computeMetrics(snap);
  if (!m.valid) {
    {
      std::lock_guard<std::mutex> lk(mx_);
      ++skipped_;
    }
    TRADESIM_METRIC_HIT("sim.snapshot_skipped");
    logger().log(LogLevel::Debug, "sim.snapshot.skipped",
                 { {"reason", "missing best bid or ask"}, {"symbol", snap.symbol} });
    return false;
  }

  model::SimulationResult r;
  {
    std::lock_guard<std::mutex> lk(mx_);
    snapshot_ = snap;
    metrics_  = std::move(m);
    r = recomputeUnlocked(*metrics_);
    appendHistoryUnlocked(r, *metrics_);
    lastUpdated_ = util::nowIso();
    ++applied_;
  }

  TRADESIM_METRIC_HIT("sim.snapshot_applied");
  TRADESIM_METRIC_SET("sim.compute_latency_ms", r.computeLatencyMs);
  notify(r);
  return true;
}

bool SimulationOrchestrator::setParameters(const model::SimulationParameters& params, std::string* whyNot) {
  model::SimulationParameters p = params;
  std::string why;
  if (!validateParameters(p, &why)) {
    logger().log(LogLevel::Warn, "sim.params.rejected", { {"error", why} });
    if (whyNot) *whyNot = why;
    return false;
  }

  std::optional<model::SimulationResult> r;
  {
    std::lock_guard<std::mutex> lk(mx_);
    params_ = p;
    // Parameter-only changes replace the current result but never add history.
    if (snapshot_ && metrics_) r = recomputeUnlocked(*metrics_);
  }

  logger().log(LogLevel::Info, "sim.params.applied",
               { {"asset", p.asset},
                 {"orderType", model::toString(p.orderType)},
                 {"quantity", std::to_string(p.quantity)},
                 {"volatility", std::to_string(p.volatility)},
                 {"feeTier", model::toString(p.feeTier)} });
  if (r) notify(*r);
  return true;
}

model::SimulationResult SimulationOrchestrator::recomputeUnlocked(const metrics::MarketMetrics& m) {
  result_ = engine_.estimate(*snapshot_, m, params_);
  return *result_;
}

void SimulationOrchestrator::appendHistoryUnlocked(const model::SimulationResult& r,
                                                   const metrics::MarketMetrics& m) {
  TimeSeriesPoint pt;
  pt.timestamp = util::nowIso();
  pt.result    = r;
  pt.bestAsk   = toDouble(m.bestAsk);
  pt.bestBid   = toDouble(m.bestBid);
  history_.push_back(std::move(pt));
  while (history_.size() > capacity_) history_.pop_front();
}

void SimulationOrchestrator::notify(const model::SimulationResult& r) {
  OnResult cb;
  {
    std::lock_guard<std::mutex> lk(cbMx_);
    cb = onResult_;
  }
  if (cb) cb(r);
}

// ---------------------- readers ----------------------

model::SimulationParameters SimulationOrchestrator::parameters() const {
  std::lock_guard<std::mutex> lk(mx_);
  return params_;
}

SimulationView SimulationOrchestrator::view() const {
  SimulationView v;
  {
    std::lock_guard<std::mutex> lk(mx_);
    v.result           = result_;
    v.metrics          = metrics_;
    v.parameters       = params_;
    v.history          = history_;
    v.connected        = connected_;
    v.lastUpdated      = lastUpdated_;
    v.lastError        = lastError_;
    v.snapshotsApplied = applied_;
    v.snapshotsSkipped = skipped_;
  }

  std::vector<double> mids;
  mids.reserve(v.history.size());
  for (const auto& pt : v.history) mids.push_back((pt.bestAsk + pt.bestBid) / 2.0);
  v.realizedVolatilityPct = metrics::realizedVolatility(mids);
  return v;
}

} // namespace tradesim::sim
