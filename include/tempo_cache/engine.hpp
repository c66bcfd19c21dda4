#pragma once

#include "tempo_cache/batcher.hpp"
#include "tempo_cache/namespace_registry.hpp"
#include "tempo_cache/periodic_task.hpp"
#include "tempo_cache/permission_cache.hpp"
#include "tempo_cache/segment_store.hpp"
#include "tempo_cache/sweeper.hpp"
#include "tempo_cache/tier.hpp"
#include "tempo_cache/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tempo_cache {

enum class Code {
  Ok,
  BadRequest,
  Unauthenticated,
  Forbidden,
  NotFound,
  Unavailable,
  Internal
};

// RESP error class for a code ("ERR", "NOAUTH", ...).
const char *code_name(Code code);

struct Status {
  Code code{Code::Ok};
  std::string message;

  bool ok() const { return code == Code::Ok; }
  static Status success() { return {}; }
  static Status error(Code code, std::string message) {
    return {code, std::move(message)};
  }
};

struct EngineConfig {
  std::int64_t default_ttl_seconds{120};
  std::size_t max_page_size{5000};
  std::size_t sweep_chunk_size{1000};
  std::chrono::milliseconds sweep_interval{300000};
  std::chrono::milliseconds flush_interval{5000};
  std::chrono::milliseconds durable_expiry_interval{60000};
  std::size_t durable_expiry_per_run{10000};
  std::size_t batch_size{500};
  std::int64_t permission_ttl_seconds{60};
  // durable.enabled = false runs the engine memory-only; persist requests
  // then fail with Unavailable. Documents live in <dir>/documents, permission
  // records in <dir>/keys.
  SegmentStoreConfig durable;
  std::vector<std::string> static_keys;
};

struct SetRequest {
  std::string ns;
  std::string key;
  Json data;
  std::int64_t ttl_seconds{120};
  bool persist{false};
};

// Owns every piece of one cache instance: both tiers, the batcher, the
// permission cache and the background tasks. Several engines can coexist in
// one process.
class Engine {
public:
  explicit Engine(EngineConfig cfg, NowFn now = [] { return Clock::now(); });
  ~Engine();

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  Status authorize(const std::string &token, AccessSet *out);

  Status set(const AccessSet &access, const SetRequest &req);
  Status get(const AccessSet &access, const std::string &ns,
             const std::string &key, Tier tier, std::optional<Json> *out);
  Status del(const AccessSet &access, const std::string &ns,
             const std::string &key, Tier tier, bool *removed);
  Status list(const AccessSet &access, const std::string &ns,
              const RecencyQuery &q, Tier tier, PageResult *out);
  Status sorted(const AccessSet &access, const std::string &ns,
                const SortedQuery &q, Tier tier, PageResult *out);
  Status rank(const AccessSet &access, const std::string &ns,
              const std::string &key, const RankQuery &q, Tier tier,
              RankResult *out);

  // Multi-namespace writes. Every item's namespace is checked first; one
  // disallowed item rejects the whole batch before anything is written.
  Status batch_set(const AccessSet &access,
                   const std::vector<WriteRequest> &items, bool persist,
                   BulkWriteResult *out);
  // Same check, then queued on the write-behind batcher.
  Status batch_buffered(const AccessSet &access,
                        const std::vector<WriteRequest> &items);

  void start_background();
  void stop_background();

  // Synchronous triggers for the background work.
  SweepReport sweep_now() { return sweeper_.sweep_once(); }
  void flush_now() { batcher_.flush(); }
  std::size_t expire_durable_now();

  bool durable_available() const { return durable_tier_.available(); }
  std::string info();

  const EngineConfig &config() const { return cfg_; }
  NamespaceRegistry &registry() { return registry_; }
  PermissionCache &permissions() { return permissions_; }
  WriteBehindBatcher &batcher() { return batcher_; }
  SegmentDocumentStore &document_store() { return documents_; }

private:
  ITier *tier_for(Tier tier);
  // Reserves count consecutive write cursors and returns the first.
  std::int64_t next_write_cursor(std::size_t count = 1);
  Status check_batch(const AccessSet &access,
                     const std::vector<WriteRequest> &items) const;

  EngineConfig cfg_;
  NowFn now_;
  NamespaceRegistry registry_;
  SegmentDocumentStore documents_;
  SegmentDocumentStore keys_;
  MemoryTier memory_tier_;
  DurableTier durable_tier_;
  WriteBehindBatcher batcher_;
  Sweeper sweeper_;
  PermissionCache permissions_;

  std::mutex cursor_mu_;
  std::int64_t last_write_cursor_{0};

  std::unique_ptr<PeriodicTask> sweep_task_;
  std::unique_ptr<PeriodicTask> flush_task_;
  std::unique_ptr<PeriodicTask> expiry_task_;
};

} // namespace tempo_cache
