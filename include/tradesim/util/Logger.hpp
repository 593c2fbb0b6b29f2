#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tradesim {
namespace util {

enum class LogLevel : int {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4
};

struct Field {
  std::string k;
  std::string v;
};

LogLevel parseLevel(const std::string& s);
const char* levelName(LogLevel l);

class Logger {
public:
  Logger();
  ~Logger();

  Logger(const Logger&)            = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel lvl);
  void setFormatJson(bool json);

  // empty -> stdout. Returns false (and stays on stdout) if the file can't be opened.
  bool setFile(const std::string& path);

  LogLevel level() const;
  bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) >= static_cast<int>(level()); }

  void log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields = {});

  void trace(const std::string& msg, const std::vector<Field>& fields = {}) { log(LogLevel::Trace, msg, fields); }
  void debug(const std::string& msg, const std::vector<Field>& fields = {}) { log(LogLevel::Debug, msg, fields); }
  void info (const std::string& msg, const std::vector<Field>& fields = {}) { log(LogLevel::Info,  msg, fields); }
  void warn (const std::string& msg, const std::vector<Field>& fields = {}) { log(LogLevel::Warn,  msg, fields); }
  void error(const std::string& msg, const std::vector<Field>& fields = {}) { log(LogLevel::Error, msg, fields); }

  // Thread-local context fields appended to every line logged from this thread
  // while the guard is alive. Keys that were already present are restored on exit.
  class Scoped {
  public:
    explicit Scoped(const std::vector<Field>& add);
    ~Scoped();

    Scoped(const Scoped&)            = delete;
    Scoped& operator=(const Scoped&) = delete;

  private:
    std::map<std::string, std::string> saved_;
    std::vector<std::string> added_;
  };

private:
  void writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields);

private:
  mutable std::mutex mx_;
  void* file_ = nullptr;            // FILE* stored as void* to avoid <cstdio> in header
  std::atomic<LogLevel> lvl_{LogLevel::Info};
  std::atomic<bool> json_{false};
};

Logger& logger();

} // namespace util
} // namespace tradesim
