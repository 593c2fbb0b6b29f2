// File: src/main.cpp
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "tradesim/feed/OrderBookFeed.hpp"
#include "tradesim/sim/ResultJson.hpp"
#include "tradesim/sim/Settings.hpp"
#include "tradesim/sim/SimulationOrchestrator.hpp"
#include "tradesim/util/Config.hpp"
#include "tradesim/util/Logger.hpp"
#include "tradesim/util/Metrics.hpp"
#include "tradesim/util/ShutdownCoordinator.hpp"
#include "tradesim/ws/FeedUrl.hpp"
#include "tradesim/ws/WsTransport.hpp"

using tradesim::util::logger;
using tradesim::util::LogLevel;

namespace {

void printHelp() {
  std::cout << "commands:\n"
               "  set <key>=<value>   change a simulation parameter (exchange, asset, orderType,\n"
               "                      quantity, volatility, feeTier)\n"
               "  status              print the current view as JSON\n"
               "  reconnect           reconnect the feed (resets the retry budget)\n"
               "  quit                disconnect and exit\n";
}

void configureLogger(const tradesim::util::Config& cfg) {
  auto& log = logger();
  log.setLevel(tradesim::util::parseLevel(cfg.logLevel));
  log.setFormatJson(cfg.logJson);
  if (!cfg.logFile.empty() && !log.setFile(cfg.logFile)) {
    log.log(LogLevel::Warn, "log.file.open_failed", { {"path", cfg.logFile} });
  }
}

} // namespace

// ---------------------------
// main
// ---------------------------
int main(int argc, char* argv[]) {
  namespace sim  = tradesim::sim;
  namespace feed = tradesim::feed;

  // ---------------------------
  // 1) Config: argv[1] = config file (optional)
  // ---------------------------
  tradesim::util::Config cfg;
  if (argc > 1 && !cfg.loadFromFile(argv[1])) {
    std::cerr << "[config] warning: failed to load file: " << argv[1] << "\n";
  }
  configureLogger(cfg);

  auto url = tradesim::ws::parseFeedUrl(cfg.feedUrl);
  if (!url) {
    logger().log(LogLevel::Error, "boot.bad_feed_url", { {"error", url.error().describe()} });
    return EXIT_FAILURE;
  }

  logger().log(LogLevel::Info, "boot",
               { {"feedUrl", cfg.feedUrl},
                 {"asset", cfg.asset},
                 {"historyCapacity", std::to_string(cfg.historyCapacity)} });

  if (cfg.metricsIntervalSec > 0) {
    tradesim::util::MetricRegistry::instance().startReporter(cfg.metricsIntervalSec);
  }

  // ---------------------------
  // 2) Simulation core
  // ---------------------------
  sim::SimulationOrchestrator orchestrator(
    tradesim::model::CostModelEngine(sim::constantsFromConfig(cfg)),
    sim::parametersFromConfig(cfg),
    cfg.historyCapacity);

  orchestrator.setOnResult([](const tradesim::model::SimulationResult& r) {
    logger().log(LogLevel::Info, "sim.result", { {"result", sim::toJson(r)} });
  });

  // ---------------------------
  // 3) ASIO + feed
  // ---------------------------
  boost::asio::io_context ioc;
  auto work = boost::asio::make_work_guard(ioc);

  auto orderBookFeed = feed::OrderBookFeed::create(
    ioc,
    tradesim::ws::makeTransportFactory(ioc, *url),
    sim::backoffFromConfig(cfg),
    [&orchestrator](const feed::FeedEvent& ev) { orchestrator.onFeedEvent(ev); });

  // ---------------------------
  // 4) Shutdown sequencing
  // ---------------------------
  boost::asio::steady_timer forceStop(ioc);
  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  tradesim::util::ShutdownCoordinator shutdownSteps;

  shutdownSteps.registerStep("feed", 10, [&] { orderBookFeed->disconnect(); });
  shutdownSteps.registerStep("metrics", 20, [] {
    tradesim::util::MetricRegistry::instance().stopReporter();
  });
  // The pending signal wait is io_context work too; without the cancel run()
  // only returns when the force-stop timer fires.
  shutdownSteps.registerStep("signals", 30, [&] {
    boost::system::error_code ec;
    signals.cancel(ec);
    if (ec) logger().log(LogLevel::Warn, "shutdown.signals.cancel_failed", { {"error", ec.message()} });
  });
  shutdownSteps.registerStep("work", 40, [&] { work.reset(); });
  // A peer that never answers our close frame must not hold the process.
  shutdownSteps.registerStep("force-stop", 50, [&] {
    forceStop.expires_after(std::chrono::seconds(2));
    forceStop.async_wait([&ioc](const boost::system::error_code& ec) {
      if (!ec) ioc.stop();
    });
  });

  auto shutdown = [&](const std::string& why) {
    if (shutdownSteps.stopping()) return;
    logger().log(LogLevel::Info, "shutdown", { {"reason", why} });
    shutdownSteps.stop();
  };

  signals.async_wait([&](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    shutdown("signal " + std::to_string(sig));
  });

  // ---------------------------
  // 5) Console commands (stdin thread -> io thread)
  // ---------------------------
  auto handleCommand = [&](const std::string& line) {
    if (line.empty()) return;

    if (line == "quit" || line == "exit") {
      shutdown("quit");
    } else if (line == "status") {
      std::cout << sim::toJson(orchestrator.view()) << "\n"
                << "feed: " << feed::toString(orderBookFeed->state())
                << " (attempt " << orderBookFeed->attempts() << "/"
                << orderBookFeed->policy().maxAttempts << ")" << std::endl;
    } else if (line == "reconnect") {
      orderBookFeed->connect();
    } else if (line.rfind("set ", 0) == 0) {
      const std::string kv = line.substr(4);
      const auto eq = kv.find('=');
      if (eq == std::string::npos) {
        std::cout << "usage: set <key>=<value>" << std::endl;
        return;
      }
      auto params = orchestrator.parameters();
      std::string why;
      if (!sim::applyParameter(params, kv.substr(0, eq), kv.substr(eq + 1), &why) ||
          !orchestrator.setParameters(params, &why)) {
        std::cout << "rejected: " << why << std::endl;
        return;
      }
      std::cout << "ok" << std::endl;
    } else {
      printHelp();
    }
  };

  std::thread console([&ioc, &handleCommand] {
    std::string line;
    while (std::getline(std::cin, line)) {
      boost::asio::post(ioc, [&handleCommand, line] { handleCommand(line); });
      if (line == "quit" || line == "exit") return;
    }
    boost::asio::post(ioc, [&handleCommand] { handleCommand("quit"); });
  });
  // getline() can't be interrupted portably; the process exits around it.
  console.detach();

  // ---------------------------
  // 6) Run
  // ---------------------------
  orderBookFeed->connect();

  try {
    ioc.run();
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, std::string("io_context exception: ") + ex.what(), {});
    tradesim::util::MetricRegistry::instance().stopReporter();
    std::_Exit(EXIT_FAILURE);
  }

  logger().log(LogLevel::Info, "stopped", {});
  // The console thread may still be blocked in getline() and references
  // locals of this frame.
  std::cout.flush();
  std::_Exit(EXIT_SUCCESS);
}
