#pragma once

#include "tempo_cache/engine.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tempo_cache {

// Per-connection state.
struct Session {
  std::optional<std::string> token;
};

struct CommandStats {
  std::uint64_t commands{0};
  std::uint64_t rejected{0};
  std::uint64_t internal_errors{0};
  std::uint64_t oversized_payloads{0};
};

// Validates one RESP command, runs it against the engine and renders the
// reply. Never throws: unexpected exceptions become "-INTERNAL internal
// error" and are logged.
class CommandHandler {
public:
  explicit CommandHandler(Engine &engine);

  std::string execute(Session &session, const std::vector<std::string> &argv);

  void set_connected_clients(std::size_t n) { connected_clients_ = n; }
  const CommandStats &stats() const { return stats_; }

  static constexpr std::size_t kLargePayloadBytes = 1024 * 1024;

private:
  std::string dispatch(Session &session, const std::vector<std::string> &argv);
  std::string reject(Code code, const std::string &msg);
  std::string reply(const Status &st);
  // Resolves the session token; on failure *reply_out holds the error.
  bool authenticate(Session &session, AccessSet *access,
                    std::string *reply_out);
  void check_payload_size(const std::string &what, const std::string &raw);

  std::string cmd_set(const AccessSet &a, const std::vector<std::string> &argv);
  std::string cmd_get(const AccessSet &a, const std::vector<std::string> &argv);
  std::string cmd_del(const AccessSet &a, const std::vector<std::string> &argv);
  std::string cmd_list(const AccessSet &a, const std::vector<std::string> &argv);
  std::string cmd_sorted(const AccessSet &a,
                         const std::vector<std::string> &argv);
  std::string cmd_rank(const AccessSet &a, const std::vector<std::string> &argv);
  std::string cmd_batch(const AccessSet &a,
                        const std::vector<std::string> &argv, bool buffered);
  std::string cmd_info();

  Engine &engine_;
  CommandStats stats_;
  std::size_t connected_clients_{0};
};

} // namespace tempo_cache
