#include "tempo_cache/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace tempo_cache::log {
namespace {
std::atomic<Level> g_level{Level::Info};
std::mutex g_mu;

const char *prefix(Level l) {
  switch (l) {
  case Level::Debug:
    return "[DEBUG] ";
  case Level::Info:
    return "[INFO]  ";
  case Level::Warn:
    return "[WARN]  ";
  case Level::Error:
    return "[ERROR] ";
  }
  return "[?]     ";
}
} // namespace

void set_level(Level l) { g_level.store(l); }
Level level() { return g_level.load(); }

bool parse_level(const std::string &name, Level &out) {
  if (name == "debug")
    out = Level::Debug;
  else if (name == "info")
    out = Level::Info;
  else if (name == "warn")
    out = Level::Warn;
  else if (name == "error")
    out = Level::Error;
  else
    return false;
  return true;
}

void write(Level l, const std::string &msg) {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << ms << "Z " << prefix(l)
            << msg << std::endl;
}

} // namespace tempo_cache::log
