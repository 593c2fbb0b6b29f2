#pragma once
#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "tradesim/util/Logger.hpp"

namespace tradesim::util {

// Ordered, run-once teardown. Every source of pending io_context work
// (signal waits, timers, the feed) registers a step so run() can return.
class ShutdownCoordinator {
public:
  // Lower order runs earlier; higher order runs later.
  void registerStep(std::string name, int order, std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mx_);
    steps_.push_back({std::move(name), order, std::move(fn)});
    sorted_ = false;
  }

  // Idempotent: returns false when a stop already ran.
  bool stop() {
    bool expected = false;
    if (!stopping_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      return false;
    }
    std::vector<Step> run;
    {
      std::lock_guard<std::mutex> lk(mx_);
      if (!sorted_) {
        std::stable_sort(steps_.begin(), steps_.end(), [](const Step& a, const Step& b) {
          return a.order < b.order;
        });
        sorted_ = true;
      }
      run = steps_;
    }
    for (auto& s : run) {
      try {
        s.fn();
      } catch (const std::exception& ex) {
        // one failing step must not keep the later ones from running
        logger().log(LogLevel::Error, "shutdown.step_failed", { {"step", s.name}, {"error", ex.what()} });
      }
    }
    return true;
  }

  bool stopping() const noexcept { return stopping_.load(std::memory_order_acquire); }

private:
  struct Step { std::string name; int order; std::function<void()> fn; };
  std::vector<Step> steps_;
  std::atomic<bool> stopping_{false};
  std::mutex mx_;
  bool sorted_{false};
};

} // namespace tradesim::util
