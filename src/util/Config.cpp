#include "tradesim/util/Config.hpp"
#include "tradesim/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace tradesim {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

static bool parseBool(const std::string& v) {
  std::string x = v;
  std::transform(x.begin(), x.end(), x.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return x == "1" || x == "true" || x == "yes" || x == "on";
}

// Non-positive or unparsable values keep the current setting.
static void assignPositive(double& dst, const std::string& v) {
  char* end = nullptr;
  const double d = std::strtod(v.c_str(), &end);
  if (end != v.c_str() && std::isfinite(d) && d > 0.0) dst = d;
}

static void assignPositive(unsigned& dst, const std::string& v) {
  char* end = nullptr;
  const long n = std::strtol(v.c_str(), &end, 10);
  if (end != v.c_str() && n > 0) dst = static_cast<unsigned>(n);
}

bool Config::set(const std::string& key, const std::string& val) {
  if      (key == "feedUrl")              feedUrl = val;
  else if (key == "reconnectBaseMs")      assignPositive(reconnectBaseMs, val);
  else if (key == "reconnectMaxMs")       assignPositive(reconnectMaxMs, val);
  else if (key == "reconnectMaxAttempts") assignPositive(reconnectMaxAttempts, val);
  else if (key == "exchange")             exchange = val;
  else if (key == "asset")                asset = val;
  else if (key == "orderType")            orderType = val;
  else if (key == "quantity")             assignPositive(quantity, val);
  else if (key == "volatility")           assignPositive(volatility, val);
  else if (key == "feeTier")              feeTier = val;
  else if (key == "historyCapacity") {
    unsigned cap = static_cast<unsigned>(historyCapacity);
    assignPositive(cap, val);
    historyCapacity = cap;
  }
  else if (key == "impactEta")            assignPositive(impactEta, val);
  else if (key == "impactGamma")          assignPositive(impactGamma, val);
  else if (key == "makerOffset") {
    // offset may be negative
    char* end = nullptr;
    const double d = std::strtod(val.c_str(), &end);
    if (end != val.c_str() && std::isfinite(d)) makerOffset = d;
  }
  else if (key == "logLevel")             logLevel = val;
  else if (key == "logJson")              logJson = parseBool(val);
  else if (key == "logFile")              logFile = val;
  else if (key == "metricsIntervalSec") {
    char* end = nullptr;
    const long n = std::strtol(val.c_str(), &end, 10);
    if (end != val.c_str() && n >= 0) metricsIntervalSec = static_cast<unsigned>(n);
  }
  else {
    return false;
  }
  sanitize();
  return true;
}

void Config::sanitize() {
  if (reconnectMaxMs < reconnectBaseMs) reconnectMaxMs = reconnectBaseMs;
}

bool Config::loadFromFile(const std::string& path) {
  // Simple INI-ish parser: key=value per line, '#' or ';' start comments.
  // Unknown keys are ignored so you can add new knobs without breaking older builds.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  while (true) {
    char tmp[1024];
    if (!std::fgets(tmp, sizeof(tmp), f)) break;
    line.assign(tmp);

    // Strip CR/LF
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;

    if (!set(key, val)) {
      logger().log(LogLevel::Debug, "config.unknown_key", { {"key", key}, {"file", path} });
    }
  }

  std::fclose(f);
  return true;
}

} // namespace util
} // namespace tradesim
