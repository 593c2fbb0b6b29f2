#include "tradesim/sim/Settings.hpp"

#include "tradesim/util/Logger.hpp"

#include <cmath>
#include <cstdlib>

namespace tradesim::sim {

using util::logger;
using util::LogLevel;

namespace {

model::FeeTier feeTierOrFallback(const std::string& label) {
  bool ok = false;
  const auto tier = model::parseFeeTier(label, &ok);
  if (!ok) {
    logger().log(LogLevel::Warn, "sim.fee_tier.fallback",
                 { {"label", label}, {"using", model::toString(tier)} });
  }
  return tier;
}

model::OrderType orderTypeOrFallback(const std::string& label) {
  bool ok = false;
  const auto t = model::parseOrderType(label, &ok);
  if (!ok) {
    logger().log(LogLevel::Warn, "sim.order_type.fallback",
                 { {"label", label}, {"using", model::toString(t)} });
  }
  return t;
}

bool parseNumber(const std::string& v, double& out) {
  if (v.empty()) return false;
  char* end = nullptr;
  const double d = std::strtod(v.c_str(), &end);
  if (end != v.c_str() + v.size()) return false;
  out = d;
  return true;
}

} // namespace

model::SimulationParameters parametersFromConfig(const util::Config& cfg) {
  model::SimulationParameters p;
  p.exchange   = cfg.exchange;
  p.asset      = cfg.asset;
  p.orderType  = orderTypeOrFallback(cfg.orderType);
  p.quantity   = cfg.quantity;
  p.volatility = cfg.volatility;
  p.feeTier    = feeTierOrFallback(cfg.feeTier);
  return p;
}

model::ModelConstants constantsFromConfig(const util::Config& cfg) {
  model::ModelConstants k;
  k.eta         = cfg.impactEta;
  k.gamma       = cfg.impactGamma;
  k.makerOffset = cfg.makerOffset;
  return k;
}

feed::BackoffPolicy backoffFromConfig(const util::Config& cfg) {
  feed::BackoffPolicy b;
  b.baseDelay   = std::chrono::milliseconds(cfg.reconnectBaseMs);
  b.maxDelay    = std::chrono::milliseconds(cfg.reconnectMaxMs);
  b.maxAttempts = cfg.reconnectMaxAttempts;
  return b;
}

bool applyParameter(model::SimulationParameters& p,
                    const std::string& key,
                    const std::string& value,
                    std::string* whyNot)
{
  if (key == "exchange")       { p.exchange = value; return true; }
  if (key == "asset")          { p.asset = value; return true; }
  if (key == "orderType")      { p.orderType = orderTypeOrFallback(value); return true; }
  if (key == "feeTier")        { p.feeTier = feeTierOrFallback(value); return true; }

  if (key == "quantity" || key == "volatility") {
    double d = 0.0;
    if (!parseNumber(value, d)) {
      if (whyNot) *whyNot = key + " is not a number: '" + value + "'";
      return false;
    }
    (key == "quantity" ? p.quantity : p.volatility) = d;
    return true;
  }

  if (whyNot) *whyNot = "'" + key + "' is not a live simulation parameter";
  return false;
}

} // namespace tradesim::sim
