#pragma once

#include <string>

#include "tradesim/metrics/MarketMetrics.hpp"
#include "tradesim/model/CostModelEngine.hpp"
#include "tradesim/sim/SimulationOrchestrator.hpp"

namespace tradesim::sim {

// Compact JSON renderings used by the CLI and the result log line.
std::string toJson(const model::SimulationResult& r);
std::string toJson(const metrics::MarketMetrics& m);

// Full status document; history is summarized to its length and last point.
std::string toJson(const SimulationView& v);

} // namespace tradesim::sim
