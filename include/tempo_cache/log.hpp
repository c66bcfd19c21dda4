#pragma once

#include <sstream>
#include <string>

namespace tempo_cache::log {

enum class Level { Debug, Info, Warn, Error };

void set_level(Level level);
Level level();
bool parse_level(const std::string &name, Level &out);

// Writes one "<ts> [LEVEL] msg" line to stderr. Thread-safe.
void write(Level level, const std::string &msg);

namespace detail {
template <typename... Args> std::string concat(const Args &...args) {
  std::ostringstream os;
  (os << ... << args);
  return os.str();
}
} // namespace detail

template <typename... Args> void debug(const Args &...args) {
  if (level() <= Level::Debug)
    write(Level::Debug, detail::concat(args...));
}
template <typename... Args> void info(const Args &...args) {
  if (level() <= Level::Info)
    write(Level::Info, detail::concat(args...));
}
template <typename... Args> void warn(const Args &...args) {
  if (level() <= Level::Warn)
    write(Level::Warn, detail::concat(args...));
}
template <typename... Args> void error(const Args &...args) {
  write(Level::Error, detail::concat(args...));
}

} // namespace tempo_cache::log
