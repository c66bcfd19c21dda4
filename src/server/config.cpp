#include "tempo_cache/config.hpp"

#include <charconv>

namespace tempo_cache {
namespace {

bool parse_i64(const std::string &s, std::int64_t &out) {
  if (s.empty())
    return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}

// Applies one setting by its flag name. Shared by env and argv.
bool apply(ServerConfig &cfg, const std::string &name, const std::string &value,
           std::string *err) {
  std::int64_t n = 0;
  if (name == "port") {
    if (!parse_i64(value, n) || n <= 0 || n > 65535) {
      set_err(err, "invalid port: " + value);
      return false;
    }
    cfg.port = static_cast<int>(n);
  } else if (name == "data-dir") {
    cfg.data_dir = value;
  } else if (name == "keys") {
    cfg.keys = split_keys(value);
  } else if (name == "title") {
    cfg.title = value;
  } else if (name == "fsync") {
    if (!parse_fsync_mode(value, cfg.fsync)) {
      set_err(err, "invalid fsync mode: " + value);
      return false;
    }
  } else if (name == "log-level") {
    if (!log::parse_level(value, cfg.log_level)) {
      set_err(err, "invalid log level: " + value);
      return false;
    }
  } else if (name == "sweep-ms" || name == "flush-ms" ||
             name == "batch-size" || name == "max-connections") {
    if (!parse_i64(value, n) || n <= 0) {
      set_err(err, "invalid --" + name + ": " + value);
      return false;
    }
    if (name == "sweep-ms")
      cfg.sweep_ms = n;
    else if (name == "flush-ms")
      cfg.flush_ms = n;
    else if (name == "batch-size")
      cfg.batch_size = static_cast<std::size_t>(n);
    else
      cfg.max_connections = static_cast<std::size_t>(n);
  } else {
    set_err(err, "unknown option --" + name);
    return false;
  }
  return true;
}

} // namespace

std::vector<std::string> split_keys(const std::string &csv) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= csv.size()) {
    auto comma = csv.find(',', start);
    if (comma == std::string::npos)
      comma = csv.size();
    auto token = csv.substr(start, comma - start);
    const auto b = token.find_first_not_of(" \t");
    const auto e = token.find_last_not_of(" \t");
    if (b != std::string::npos)
      out.push_back(token.substr(b, e - b + 1));
    start = comma + 1;
  }
  return out;
}

bool load_server_config(int argc, const char *const *argv,
                        const EnvLookup &env, ServerConfig *out,
                        std::string *err) {
  ServerConfig cfg;
  static const std::pair<const char *, const char *> kEnv[] = {
      {"PORT", "port"},           {"DATA_DIR", "data-dir"},
      {"KEYS", "keys"},           {"PROCESS_TITLE", "title"},
      {"FSYNC", "fsync"},         {"LOG_LEVEL", "log-level"}};
  for (const auto &[var, name] : kEnv) {
    const char *v = env ? env(var) : nullptr;
    if (v == nullptr || *v == '\0')
      continue;
    if (!apply(cfg, name, v, err))
      return false;
  }

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a.rfind("--", 0) != 0 || i + 1 >= argc) {
      set_err(err, "expected --flag value, got " + a);
      return false;
    }
    if (!apply(cfg, a.substr(2), argv[++i], err))
      return false;
  }
  *out = std::move(cfg);
  return true;
}

EngineConfig to_engine_config(const ServerConfig &cfg) {
  EngineConfig ec;
  ec.sweep_interval = std::chrono::milliseconds(cfg.sweep_ms);
  ec.flush_interval = std::chrono::milliseconds(cfg.flush_ms);
  ec.batch_size = cfg.batch_size;
  ec.static_keys = cfg.keys;
  ec.durable.enabled = !cfg.data_dir.empty();
  ec.durable.dir = cfg.data_dir;
  ec.durable.fsync = cfg.fsync;
  return ec;
}

} // namespace tempo_cache
