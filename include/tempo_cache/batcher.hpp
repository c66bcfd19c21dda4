#pragma once

#include "tempo_cache/document_store.hpp"
#include "tempo_cache/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace tempo_cache {

struct BatcherStats {
  std::uint64_t enqueued{0};
  std::uint64_t flushed{0};
  std::uint64_t dropped{0};
  std::uint64_t batches{0};
  std::size_t pending{0};
};

// Buffers durable upserts and applies them as unordered bulk writes, either
// when max_batch items are queued or when flush() is called by the timer.
// Failed writes are logged and dropped; callers were acknowledged at enqueue.
class WriteBehindBatcher {
public:
  explicit WriteBehindBatcher(IDocumentStore &store,
                              std::size_t max_batch = 500);

  void enqueue(Document doc);
  void enqueue_many(std::vector<Document> docs);

  // Takes everything queued so far and writes it. Safe to call from any
  // thread; items enqueued meanwhile go to the next flush.
  void flush();

  std::size_t pending() const;
  BatcherStats stats() const;

private:
  IDocumentStore &store_;
  std::size_t max_batch_;
  mutable std::mutex mu_;
  std::vector<Document> queue_;
  std::atomic<std::uint64_t> enqueued_{0};
  std::atomic<std::uint64_t> flushed_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::uint64_t> batches_{0};
};

} // namespace tempo_cache
