#pragma once

#include <cstddef>
#include <string>

namespace tradesim {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Apply one "key=value" assignment. Returns false for unknown keys.
  bool set(const std::string& key, const std::string& value);

  // --- Feed ---
  std::string feedUrl = "wss://ws.gomarket-cpp.goquant.io/ws/l2-orderbook/okx/BTC-USDT-SWAP";
  unsigned reconnectBaseMs      = 1000;
  unsigned reconnectMaxMs       = 30000;
  unsigned reconnectMaxAttempts = 10;

  // --- Initial simulation parameters ---
  std::string exchange  = "OKX";
  std::string asset     = "BTC-USDT-SWAP";
  std::string orderType = "market";
  double      quantity   = 100.0;   // quote currency
  double      volatility = 2.0;     // percent
  std::string feeTier   = "VIP 0";

  std::size_t historyCapacity = 100;

  // --- Model calibration knobs ---
  double impactEta   = 0.01;
  double impactGamma = 0.1;
  double makerOffset = 0.0;

  // --- Ambient ---
  std::string logLevel = "info";
  bool        logJson  = false;
  std::string logFile;            // empty -> stdout
  unsigned    metricsIntervalSec = 0; // 0 -> reporter off

private:
  void sanitize();

  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace tradesim
