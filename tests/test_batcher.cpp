#include "tempo_cache/batcher.hpp"
#include "tempo_cache/segment_store.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

using namespace tempo_cache;
using tempo_cache::testing::TempDir;

namespace {

SegmentStoreConfig config_for(const TempDir &dir) {
  SegmentStoreConfig cfg;
  cfg.enabled = true;
  cfg.dir = dir.path();
  cfg.fsync = FsyncMode::Never;
  return cfg;
}

Document doc(const std::string &key, int v) {
  Document d;
  d.ns = "ns";
  d.key = key;
  d.payload = v;
  d.write_cursor = v;
  return d;
}

// Connected store that rejects every write.
class RejectingStore final : public IDocumentStore {
public:
  bool connected() const override { return true; }
  bool upsert(const Document &, std::string *err) override {
    if (err)
      *err = "disk full";
    return false;
  }
  BulkWriteResult bulk_upsert(const std::vector<Document> &docs) override {
    ++bulk_calls;
    BulkWriteResult r;
    r.failed = docs.size();
    r.errors.push_back("disk full");
    return r;
  }
  std::optional<Document> find_one(const std::string &,
                                   const std::string &) override {
    return std::nullopt;
  }
  std::optional<std::size_t> remove(const std::string &, const std::string &,
                                    std::string *) override {
    return 0;
  }
  std::vector<FoundDocument> find(const DocQuery &) override { return {}; }
  std::size_t count(const DocQuery &) override { return 0; }
  std::size_t erase_expired(std::size_t) override { return 0; }

  int bulk_calls{0};
};

} // namespace

TEST_CASE("reaching the threshold flushes before any timer",
          "[batcher]") {
  TempDir dir("batch_threshold");
  SegmentDocumentStore store(config_for(dir));
  REQUIRE(store.init());
  WriteBehindBatcher batcher(store, 4);

  batcher.enqueue(doc("a", 1));
  batcher.enqueue(doc("b", 2));
  batcher.enqueue(doc("c", 3));
  CHECK(batcher.pending() == 3);
  CHECK_FALSE(store.find_one("ns", "a").has_value());

  batcher.enqueue(doc("d", 4));
  CHECK(batcher.pending() == 0);
  for (const auto *k : {"a", "b", "c", "d"})
    CHECK(store.find_one("ns", k).has_value());
  CHECK(batcher.stats().batches == 1);
  CHECK(batcher.stats().flushed == 4);
}

TEST_CASE("enqueue_many flushes once the queue passes the threshold",
          "[batcher]") {
  TempDir dir("batch_many");
  SegmentDocumentStore store(config_for(dir));
  REQUIRE(store.init());
  WriteBehindBatcher batcher(store, 3);
  batcher.enqueue_many({doc("a", 1), doc("b", 2), doc("c", 3), doc("d", 4),
                        doc("e", 5)});
  CHECK(batcher.pending() == 0);
  CHECK(store.stats().documents == 5);
}

TEST_CASE("manual flush drains below-threshold items", "[batcher]") {
  TempDir dir("batch_manual");
  SegmentDocumentStore store(config_for(dir));
  REQUIRE(store.init());
  WriteBehindBatcher batcher(store, 500);
  batcher.enqueue(doc("only", 1));
  batcher.flush();
  CHECK(store.find_one("ns", "only").has_value());
  // Empty flushes do not count as batches.
  batcher.flush();
  CHECK(batcher.stats().batches == 1);
}

TEST_CASE("failed batches are dropped without retry", "[batcher][failure]") {
  RejectingStore store;
  WriteBehindBatcher batcher(store, 2);
  batcher.enqueue(doc("a", 1));
  batcher.enqueue(doc("b", 2));
  CHECK(store.bulk_calls == 1);
  CHECK(batcher.pending() == 0);
  CHECK(batcher.stats().dropped == 2);
  batcher.flush();
  CHECK(store.bulk_calls == 1);
}

TEST_CASE("a disconnected store drops the batch", "[batcher][failure]") {
  SegmentDocumentStore store(SegmentStoreConfig{});
  WriteBehindBatcher batcher(store, 10);
  batcher.enqueue(doc("a", 1));
  batcher.flush();
  CHECK(batcher.stats().dropped == 1);
  CHECK(batcher.pending() == 0);
}

TEST_CASE("concurrent enqueue loses nothing and flushes nothing twice",
          "[batcher][concurrency]") {
  TempDir dir("batch_concurrent");
  SegmentDocumentStore store(config_for(dir));
  REQUIRE(store.init());
  WriteBehindBatcher batcher(store, 64);

  constexpr int kThreads = 8;
  constexpr int kPerThread = 250;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i)
        batcher.enqueue(doc("t" + std::to_string(t) + "_" + std::to_string(i),
                            i));
    });
  }
  std::thread flusher([&] {
    for (int i = 0; i < 50; ++i)
      batcher.flush();
  });
  for (auto &th : threads)
    th.join();
  flusher.join();
  batcher.flush();

  const auto s = batcher.stats();
  CHECK(s.enqueued == kThreads * kPerThread);
  CHECK(s.flushed == kThreads * kPerThread);
  CHECK(s.dropped == 0);
  CHECK(store.stats().upserts == kThreads * kPerThread);
  CHECK(store.stats().documents == kThreads * kPerThread);
}
