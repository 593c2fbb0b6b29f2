#include "tradesim/util/Logger.hpp"
#include "tradesim/util/Clock.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace tradesim::util {

static thread_local std::map<std::string, std::string> t_ctx;

const char* levelName(LogLevel l) {
  switch (l) { case LogLevel::Trace: return "TRACE";
               case LogLevel::Debug: return "DEBUG";
               case LogLevel::Info:  return "INFO";
               case LogLevel::Warn:  return "WARN";
               case LogLevel::Error: return "ERROR"; }
  return "INFO";
}

LogLevel parseLevel(const std::string& s) {
  std::string x = s;
  std::transform(x.begin(), x.end(), x.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (x=="trace") return LogLevel::Trace;
  if (x=="debug") return LogLevel::Debug;
  if (x=="info")  return LogLevel::Info;
  if (x=="warn" || x=="warning") return LogLevel::Warn;
  if (x=="error") return LogLevel::Error;
  return LogLevel::Info;
}

Logger& logger() {
  static Logger L;
  return L;
}

Logger::Logger() : file_(stdout) {}

Logger::~Logger() {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = nullptr;
}

void Logger::setLevel(LogLevel lvl) { lvl_.store(lvl, std::memory_order_relaxed); }
void Logger::setFormatJson(bool json) { json_.store(json, std::memory_order_relaxed); }

bool Logger::setFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = stdout;
  if (path.empty()) return true;
  FILE* f = std::fopen(path.c_str(), "a");
  if (!f) return false;
  file_ = f;
  return true;
}

LogLevel Logger::level() const { return lvl_.load(std::memory_order_relaxed); }

void Logger::log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  if (!enabled(lvl)) return;
  writeLine(lvl, msg, fields);
}

static void appendEscaped(std::ostringstream& oss, const std::string& s) {
  for (char c : s) {
    switch (c) {
      case '"':  oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\n': oss << "\\n";  break;
      case '\r': oss << "\\r";  break;
      case '\t': oss << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          oss << buf;
        } else {
          oss << c;
        }
    }
  }
}

void Logger::writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  std::ostringstream oss;
  if (json_.load(std::memory_order_relaxed)) {
    oss << "{\"ts\":\"" << nowIso() << "\",\"lvl\":\"" << levelName(lvl) << "\",\"msg\":\"";
    appendEscaped(oss, msg);
    oss << "\"";

    // thread ctx
    for (auto& kv : t_ctx) {
      oss << ",\"";
      appendEscaped(oss, kv.first);
      oss << "\":\"";
      appendEscaped(oss, kv.second);
      oss << "\"";
    }
    // ad hoc fields
    for (auto& kv : fields) {
      oss << ",\"";
      appendEscaped(oss, kv.k);
      oss << "\":\"";
      appendEscaped(oss, kv.v);
      oss << "\"";
    }
    oss << "}\n";
  } else {
    oss << '[' << nowIso() << "] ";
    std::string name = levelName(lvl);
    name.resize(5, ' ');
    oss << name << ' ' << msg;
    for (auto& kv : t_ctx) oss << ' ' << kv.first << '=' << kv.second;
    for (auto& kv : fields) oss << ' ' << kv.k << '=' << kv.v;
    oss << '\n';
  }

  const std::string line = oss.str();
  std::lock_guard<std::mutex> lk(mx_);
  FILE* f = static_cast<FILE*>(file_ ? file_ : stdout);
  std::fwrite(line.data(), 1, line.size(), f);
  std::fflush(f);
}

Logger::Scoped::Scoped(const std::vector<Field>& add) {
  for (auto& kv : add) {
    auto it = t_ctx.find(kv.k);
    if (it != t_ctx.end()) {
      saved_.emplace(kv.k, it->second);
      it->second = kv.v;
    } else {
      added_.push_back(kv.k);
      t_ctx.emplace(kv.k, kv.v);
    }
  }
}

Logger::Scoped::~Scoped() {
  for (auto& k : added_) t_ctx.erase(k);
  for (auto& kv : saved_) t_ctx[kv.first] = kv.second;
}

} // namespace tradesim::util
