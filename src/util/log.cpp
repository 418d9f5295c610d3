#include "flowart/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

#include "flowart/util/strings.h"

namespace flowart::log {
namespace {
std::mutex g_mu;
// Batch workers read the level concurrently with the CLI setting it at startup.
std::atomic<Level> g_level{Level::Info};

const char* label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

void emit(Level l, const std::string& msg) {
  const Level cur = g_level.load();
  if (l < cur || cur == Level::Off) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl); }
Level level() { return g_level.load(); }

bool parse_level(const std::string& name, Level& out) {
  const std::string s = to_lower(name);
  if (s == "debug") {
    out = Level::Debug;
  } else if (s == "info") {
    out = Level::Info;
  } else if (s == "warn" || s == "warning") {
    out = Level::Warn;
  } else if (s == "error") {
    out = Level::Error;
  } else if (s == "off" || s == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace flowart::log
