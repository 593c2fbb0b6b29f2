#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace tradesim {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
// Optional: can run a background reporter thread that emits through the logger.
class MetricRegistry {
public:
  static MetricRegistry& instance() {
    static MetricRegistry inst;
    return inst;
  }

  MetricRegistry() = default;
  ~MetricRegistry();

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;

  // Restarts the reporter if it is already running.
  void startReporter(unsigned int intervalSeconds = 10);
  void stopReporter();

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  double counter(const std::string& name) const;
  double gauge(const std::string& name) const;

  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  void reset();

private:
  void reporterLoop(unsigned int intervalSeconds);

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;

  std::mutex wakeMu_;
  std::condition_variable wake_;
  std::atomic<bool> running_{false};
  std::thread thr_;
};

} // namespace util
} // namespace tradesim

#define TRADESIM_METRIC_INC(name, d) ::tradesim::util::MetricRegistry::instance().increment((name), (d))
#define TRADESIM_METRIC_HIT(name)    ::tradesim::util::MetricRegistry::instance().increment((name), 1.0)
#define TRADESIM_METRIC_SET(name, v) ::tradesim::util::MetricRegistry::instance().setGauge((name), (v))
