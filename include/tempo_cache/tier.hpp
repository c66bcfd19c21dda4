#pragma once

#include "tempo_cache/document_store.hpp"
#include "tempo_cache/namespace_registry.hpp"
#include "tempo_cache/types.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tempo_cache {

// Raised by the durable tier when the document store rejects an operation
// that has to succeed.
class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct WriteRequest {
  std::string ns;
  std::string key;
  Json payload;
  std::int64_t ttl_seconds{120};
};

// ttl_seconds <= 0, or a ttl whose deadline overflows epoch milliseconds,
// produces a document without expiry.
Document make_document(const WriteRequest &req, std::int64_t write_cursor,
                       TimePoint now);

// The operations every tier offers. The caller picks the tier per call;
// entries are never copied or migrated between tiers.
class ITier {
public:
  virtual ~ITier() = default;

  virtual Tier kind() const = 0;
  virtual bool available() const = 0;

  virtual void write(const WriteRequest &req, std::int64_t write_cursor) = 0;
  // reqs[i] is written with first_cursor + i, so no two items of a batch
  // share a recency position.
  virtual BulkWriteResult write_many(const std::vector<WriteRequest> &reqs,
                                     std::int64_t first_cursor) = 0;
  virtual std::optional<Json> read(const std::string &ns,
                                   const std::string &key) = 0;
  virtual bool remove(const std::string &ns, const std::string &key) = 0;
  virtual PageResult list_by_recency(const std::string &ns,
                                     const RecencyQuery &q) = 0;
  virtual PageResult list_by_field(const std::string &ns,
                                   const SortedQuery &q) = 0;
  virtual RankResult rank(const std::string &ns, const std::string &key,
                          const RankQuery &q) = 0;
};

class MemoryTier final : public ITier {
public:
  explicit MemoryTier(NamespaceRegistry &registry);

  Tier kind() const override { return Tier::Memory; }
  bool available() const override { return true; }

  void write(const WriteRequest &req, std::int64_t write_cursor) override;
  BulkWriteResult write_many(const std::vector<WriteRequest> &reqs,
                             std::int64_t first_cursor) override;
  std::optional<Json> read(const std::string &ns,
                           const std::string &key) override;
  bool remove(const std::string &ns, const std::string &key) override;
  PageResult list_by_recency(const std::string &ns,
                             const RecencyQuery &q) override;
  PageResult list_by_field(const std::string &ns,
                           const SortedQuery &q) override;
  RankResult rank(const std::string &ns, const std::string &key,
                  const RankQuery &q) override;

private:
  NamespaceRegistry &registry_;
};

class DurableTier final : public ITier {
public:
  DurableTier(IDocumentStore &store, NowFn now = [] { return Clock::now(); });

  Tier kind() const override { return Tier::Durable; }
  bool available() const override { return store_.connected(); }

  void write(const WriteRequest &req, std::int64_t write_cursor) override;
  BulkWriteResult write_many(const std::vector<WriteRequest> &reqs,
                             std::int64_t first_cursor) override;
  std::optional<Json> read(const std::string &ns,
                           const std::string &key) override;
  bool remove(const std::string &ns, const std::string &key) override;
  PageResult list_by_recency(const std::string &ns,
                             const RecencyQuery &q) override;
  PageResult list_by_field(const std::string &ns,
                           const SortedQuery &q) override;
  RankResult rank(const std::string &ns, const std::string &key,
                  const RankQuery &q) override;

  // Applies already-built documents as one unordered batch.
  BulkWriteResult bulk_upsert(const std::vector<Document> &docs);

private:
  IDocumentStore &store_;
  NowFn now_;
};

} // namespace tempo_cache
