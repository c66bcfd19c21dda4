#pragma once

#include "tempo_cache/document_store.hpp"
#include "tempo_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tempo_cache {

enum class FsyncMode { Never, EverySec, Always };

bool parse_fsync_mode(const std::string &text, FsyncMode &out);

struct SegmentStoreConfig {
  bool enabled{false};
  std::string dir{"./data"};
  std::size_t segment_max_bytes{64 * 1024 * 1024};
  std::size_t gc_min_bytes{1024 * 1024};
  double gc_fragmentation_threshold{0.5};
  FsyncMode fsync{FsyncMode::EverySec};
};

struct SegmentStoreStats {
  std::size_t documents{0};
  std::size_t live_bytes{0};
  std::size_t segment_bytes{0};
  std::uint64_t upserts{0};
  std::uint64_t deletes{0};
  std::uint64_t expired_removed{0};
  std::uint64_t gc_runs{0};
  std::uint64_t gc_bytes_reclaimed{0};
  std::size_t index_rebuild_ms{0};
};

// Document store on an append-only segment log. The (ns, key) index lives
// in memory and is rebuilt from the segments on init(); a torn tail record
// is truncated. Readers load payloads from disk on demand.
class SegmentDocumentStore final : public IDocumentStore {
public:
  explicit SegmentDocumentStore(SegmentStoreConfig cfg,
                                NowFn now = [] { return Clock::now(); });
  ~SegmentDocumentStore() override;

  SegmentDocumentStore(const SegmentDocumentStore &) = delete;
  SegmentDocumentStore &operator=(const SegmentDocumentStore &) = delete;

  bool init(std::string *err = nullptr);

  bool connected() const override;
  bool upsert(const Document &doc, std::string *err = nullptr) override;
  BulkWriteResult bulk_upsert(const std::vector<Document> &docs) override;
  std::optional<Document> find_one(const std::string &ns,
                                   const std::string &key) override;
  std::optional<std::size_t> remove(const std::string &ns,
                                    const std::string &key,
                                    std::string *err = nullptr) override;
  std::vector<FoundDocument> find(const DocQuery &q) override;
  std::size_t count(const DocQuery &q) override;
  std::size_t erase_expired(std::size_t max_items) override;

  // Rewrites live documents into a fresh segment once the dead share of the
  // log passes gc_fragmentation_threshold.
  bool maybe_compact();

  SegmentStoreStats stats() const;

private:
  struct IndexEntry {
    std::uint32_t segment_id{0};
    std::uint64_t offset{0};
    std::uint32_t record_len{0};
    std::uint64_t seq{0};
    std::int64_t write_cursor{0};
    std::int64_t expire_at_ms{-1};
    bool tombstone{false};
  };

  struct SegmentMeta {
    std::uint32_t id{0};
    std::size_t bytes{0};
  };

  struct Hit {
    std::string key;
    IndexEntry entry;
  };

  using KeyIndex = std::unordered_map<std::string, IndexEntry>;

  std::string seg_path(std::uint32_t id) const;
  bool expired(const IndexEntry &e, std::int64_t now_ms) const;
  bool upsert_locked(const Document &doc, std::string *err);
  bool append_record(const std::string &ns, const std::string &key,
                     const std::string &payload, std::int64_t write_cursor,
                     std::int64_t expire_at_ms, bool tombstone,
                     IndexEntry *entry, std::string *err);
  bool rotate_locked(std::string *err);
  bool sync_for_policy();
  bool load_manifest(std::vector<std::uint32_t> *segments,
                     std::uint32_t *active);
  bool write_manifest();
  bool scan_segment(std::uint32_t id);
  bool read_document(const std::string &ns, const std::string &key,
                     const IndexEntry &e, Document *out);
  int read_fd(std::uint32_t segment_id);
  void close_read_fds();
  void index_put(const std::string &ns, const std::string &key,
                 const IndexEntry &e);
  void index_drop(const std::string &ns, const std::string &key);
  std::vector<Hit> candidates_locked(const DocQuery &q) const;
  std::vector<FoundDocument> materialize_locked(const DocQuery &q,
                                                const std::vector<Hit> &hits);

  SegmentStoreConfig cfg_;
  NowFn now_;
  mutable std::mutex mu_;
  bool connected_{false};
  SegmentStoreStats stats_;
  std::unordered_map<std::string, KeyIndex> index_;
  std::vector<SegmentMeta> segments_;
  std::unordered_map<std::uint32_t, int> read_fds_;
  std::uint32_t active_segment_{1};
  int active_fd_{-1};
  std::uint64_t seq_{0};
  std::uint64_t last_fsync_epoch_s_{0};
};

} // namespace tempo_cache
