#pragma once

#include "tempo_cache/engine.hpp"
#include "tempo_cache/log.hpp"
#include "tempo_cache/segment_store.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace tempo_cache {

struct ServerConfig {
  int port{6380};
  std::string data_dir;
  std::vector<std::string> keys;
  std::string title{"tempo_cache"};
  FsyncMode fsync{FsyncMode::EverySec};
  std::int64_t sweep_ms{300000};
  std::int64_t flush_ms{5000};
  std::size_t batch_size{500};
  log::Level log_level{log::Level::Info};
  std::size_t max_connections{512};
  std::size_t max_pending_out{1 << 20};
  std::size_t max_cmds_per_iteration{64};
};

using EnvLookup = std::function<const char *(const char *)>;

// Environment first (PORT, DATA_DIR, KEYS, PROCESS_TITLE, FSYNC, LOG_LEVEL),
// then --flag value pairs from argv.
bool load_server_config(int argc, const char *const *argv,
                        const EnvLookup &env, ServerConfig *out,
                        std::string *err = nullptr);

std::vector<std::string> split_keys(const std::string &csv);

EngineConfig to_engine_config(const ServerConfig &cfg);

} // namespace tempo_cache
