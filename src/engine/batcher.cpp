#include "tempo_cache/batcher.hpp"

#include "tempo_cache/log.hpp"

#include <utility>

namespace tempo_cache {

WriteBehindBatcher::WriteBehindBatcher(IDocumentStore &store,
                                       std::size_t max_batch)
    : store_(store), max_batch_(max_batch == 0 ? 1 : max_batch) {}

void WriteBehindBatcher::enqueue(Document doc) {
  bool full = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.push_back(std::move(doc));
    full = queue_.size() >= max_batch_;
  }
  ++enqueued_;
  if (full)
    flush();
}

void WriteBehindBatcher::enqueue_many(std::vector<Document> docs) {
  if (docs.empty())
    return;
  const auto n = docs.size();
  bool full = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto &d : docs)
      queue_.push_back(std::move(d));
    full = queue_.size() >= max_batch_;
  }
  enqueued_ += n;
  if (full)
    flush();
}

void WriteBehindBatcher::flush() {
  std::vector<Document> batch;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (queue_.empty())
      return;
    batch.swap(queue_);
  }

  ++batches_;
  if (!store_.connected()) {
    dropped_ += batch.size();
    log::error("write-behind flush: durable store unavailable, dropped ",
               batch.size(), " documents");
    return;
  }

  const auto result = store_.bulk_upsert(batch);
  flushed_ += result.applied;
  if (!result.ok()) {
    dropped_ += result.failed;
    log::error("write-behind flush: ", result.failed, " of ", batch.size(),
               " documents failed",
               result.errors.empty() ? "" : ", first error: ",
               result.errors.empty() ? "" : result.errors.front());
    return;
  }
  log::debug("write-behind flush: wrote ", result.applied, " documents");
}

std::size_t WriteBehindBatcher::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

BatcherStats WriteBehindBatcher::stats() const {
  BatcherStats s;
  s.enqueued = enqueued_.load();
  s.flushed = flushed_.load();
  s.dropped = dropped_.load();
  s.batches = batches_.load();
  s.pending = pending();
  return s;
}

} // namespace tempo_cache
