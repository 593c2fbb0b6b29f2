#include "tradesim/sim/ResultJson.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace tradesim::sim {

using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

namespace {

void writeResult(Writer& w, const model::SimulationResult& r) {
  w.StartObject();
  w.Key("expectedSlippagePct");     w.Double(r.expectedSlippagePct);
  w.Key("expectedFees");            w.Double(r.expectedFeesAbs);
  w.Key("expectedMarketImpactPct"); w.Double(r.expectedMarketImpactPct);
  w.Key("netCost");                 w.Double(r.netCostAbs);
  w.Key("makerTakerProportion");    w.Double(r.makerTakerProportion);
  w.Key("computeLatencyMs");        w.Double(r.computeLatencyMs);
  w.EndObject();
}

// Decimals go out as strings so no precision is lost on the way.
void writeDecimal(Writer& w, const char* key, const Decimal& d) {
  const std::string s = toString(d);
  w.Key(key);
  w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

void writeString(Writer& w, const char* key, const std::string& s) {
  w.Key(key);
  w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

void writeMetrics(Writer& w, const metrics::MarketMetrics& m) {
  w.StartObject();
  w.Key("valid"); w.Bool(m.valid);
  writeDecimal(w, "bestAsk",         m.bestAsk);
  writeDecimal(w, "bestBid",         m.bestBid);
  writeDecimal(w, "spread",          m.spread);
  writeDecimal(w, "midPrice",        m.midPrice);
  writeDecimal(w, "bidDepth",        m.bidDepth);
  writeDecimal(w, "askDepth",        m.askDepth);
  writeDecimal(w, "depth",           m.depth);
  writeDecimal(w, "imbalance",       m.imbalance);
  writeDecimal(w, "volatilityProxy", m.volatilityProxy);
  w.EndObject();
}

void writeParameters(Writer& w, const model::SimulationParameters& p) {
  w.StartObject();
  writeString(w, "exchange",  p.exchange);
  writeString(w, "asset",     p.asset);
  writeString(w, "orderType", model::toString(p.orderType));
  w.Key("quantity");   w.Double(p.quantity);
  w.Key("volatility"); w.Double(p.volatility);
  writeString(w, "feeTier", model::toString(p.feeTier));
  w.EndObject();
}

} // namespace

std::string toJson(const model::SimulationResult& r) {
  rapidjson::StringBuffer buf;
  Writer w(buf);
  writeResult(w, r);
  return buf.GetString();
}

std::string toJson(const metrics::MarketMetrics& m) {
  rapidjson::StringBuffer buf;
  Writer w(buf);
  writeMetrics(w, m);
  return buf.GetString();
}

std::string toJson(const SimulationView& v) {
  rapidjson::StringBuffer buf;
  Writer w(buf);

  w.StartObject();
  w.Key("connected"); w.Bool(v.connected);
  writeString(w, "lastUpdated", v.lastUpdated);
  writeString(w, "lastError",   v.lastError);

  w.Key("parameters");
  writeParameters(w, v.parameters);

  w.Key("result");
  if (v.result) writeResult(w, *v.result);
  else          w.Null();

  w.Key("metrics");
  if (v.metrics) writeMetrics(w, *v.metrics);
  else           w.Null();

  w.Key("realizedVolatilityPct"); w.Double(v.realizedVolatilityPct);
  w.Key("snapshotsApplied");      w.Uint64(v.snapshotsApplied);
  w.Key("snapshotsSkipped");      w.Uint64(v.snapshotsSkipped);

  w.Key("history");
  w.StartObject();
  w.Key("size"); w.Uint64(static_cast<uint64_t>(v.history.size()));
  if (!v.history.empty()) {
    const auto& last = v.history.back();
    writeString(w, "lastTimestamp", last.timestamp);
    w.Key("lastBestAsk"); w.Double(last.bestAsk);
    w.Key("lastBestBid"); w.Double(last.bestBid);
  }
  w.EndObject();

  w.EndObject();
  return buf.GetString();
}

} // namespace tradesim::sim
