#include "tempo_cache/query.hpp"
#include "tempo_cache/segment_store.hpp"
#include "tempo_cache/tier.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <random>

using namespace tempo_cache;
using tempo_cache::testing::TempDir;

namespace {

// Both tiers side by side over the same data set.
struct TwoTiers {
  explicit TwoTiers(const std::string &tag) : dir(tag), store(config()) {
    REQUIRE(store.init());
  }

  SegmentStoreConfig config() const {
    SegmentStoreConfig cfg;
    cfg.enabled = true;
    cfg.dir = dir.path();
    cfg.fsync = FsyncMode::Never;
    return cfg;
  }

  void write(const std::string &ns, const std::string &key, Json payload,
             std::int64_t cursor) {
    WriteRequest req{ns, key, std::move(payload), 0};
    memory.write(req, cursor);
    durable.write(req, cursor);
  }

  std::vector<ITier *> tiers() { return {&memory, &durable}; }

  TempDir dir;
  SegmentDocumentStore store;
  NamespaceRegistry registry;
  MemoryTier memory{registry};
  DurableTier durable{store};
};

Json without_source(const PageResult &page) {
  auto j = query::page_to_json(page);
  j["meta"].erase("source");
  return j;
}

std::vector<std::string> keys_of(const PageResult &page) {
  std::vector<std::string> out;
  for (const auto &item : page.items)
    out.push_back(item.key);
  return out;
}

} // namespace

TEST_CASE("comparator orders by type class then value", "[query][compare]") {
  CHECK(query::compare(Json(), Json(1)) < 0);
  CHECK(query::compare(Json(5), Json("a")) < 0);
  CHECK(query::compare(Json("b"), Json::object()) < 0);
  CHECK(query::compare(Json::object(), Json::array()) < 0);
  CHECK(query::compare(Json::array(), Json(false)) < 0);
  CHECK(query::compare(Json(2), Json(10)) < 0);
  CHECK(query::compare(Json(2.5), Json(2)) > 0);
  CHECK(query::compare(Json(-1), Json(3u)) < 0);
  CHECK(query::compare(Json("10"), Json("9")) < 0);
  CHECK(query::compare(Json(false), Json(true)) < 0);
  CHECK(query::compare(Json(7), Json(7.0)) == 0);
  CHECK(query::directed_compare(Json(1), Json(2), SortDirection::Desc) > 0);
}

TEST_CASE("dotted field paths resolve and null counts as missing",
          "[query][field]") {
  const Json doc = {{"stats", {{"score", 12}, {"none", nullptr}}}, {"n", 1}};
  CHECK(query::field_value(doc, "stats.score") == Json(12));
  CHECK_FALSE(query::field_value(doc, "stats.none").has_value());
  CHECK_FALSE(query::field_value(doc, "stats.score.deeper").has_value());
  CHECK_FALSE(query::field_value(doc, "missing").has_value());
  CHECK(query::effective_value(doc, "missing", Json(3)) == Json(3));
  CHECK_FALSE(query::effective_value(doc, "missing", Json()).has_value());
}

TEST_CASE("recency page is newest first with the last cursor",
          "[query][recency]") {
  TwoTiers t("recency_q");
  const int n = 12;
  for (int i = 1; i <= n; ++i)
    t.write("ns", "k" + std::to_string(i), Json{{"i", i}}, 1000 + i);

  for (auto *tier : t.tiers()) {
    RecencyQuery q;
    q.page_size = n;
    auto page = tier->list_by_recency("ns", q);
    REQUIRE(page.items.size() == static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i)
      CHECK(page.items[i].key == "k" + std::to_string(n - i));
    CHECK(page.next_cursor == 1001);
    CHECK_FALSE(page.has_more);
    CHECK(page.total_items == static_cast<std::size_t>(n));
  }
}

TEST_CASE("recency pagination walks every entry exactly once on both tiers",
          "[query][recency]") {
  TwoTiers t("recency_walk");
  for (int i = 0; i < 23; ++i)
    t.write("ns", "k" + std::to_string(i), Json(i), 500 + i * 3);

  std::vector<std::vector<std::string>> walks;
  for (auto *tier : t.tiers()) {
    std::vector<std::string> seen;
    RecencyQuery q;
    q.page_size = 5;
    while (true) {
      auto page = tier->list_by_recency("ns", q);
      CHECK(page.total_items == 23);
      auto ks = keys_of(page);
      seen.insert(seen.end(), ks.begin(), ks.end());
      if (!page.has_more)
        break;
      q.cursor = page.next_cursor.get<std::int64_t>();
    }
    CHECK(seen.size() == 23);
    walks.push_back(seen);
  }
  CHECK(walks[0] == walks[1]);
}

TEST_CASE("a batch written in one call pages like separate writes",
          "[query][recency][batch]") {
  TwoTiers t("recency_batch");
  std::vector<WriteRequest> batch;
  for (int i = 0; i < 6; ++i)
    batch.push_back({"ns", "b" + std::to_string(i), Json(i), 0});

  std::vector<std::vector<std::string>> walks;
  for (auto *tier : t.tiers()) {
    REQUIRE(tier->write_many(batch, 2000).applied == 6);
    std::vector<std::string> seen;
    std::vector<bool> more;
    RecencyQuery q;
    q.page_size = 4;
    while (true) {
      auto page = tier->list_by_recency("ns", q);
      CHECK(page.total_items == 6);
      auto ks = keys_of(page);
      seen.insert(seen.end(), ks.begin(), ks.end());
      more.push_back(page.has_more);
      if (!page.has_more)
        break;
      q.cursor = page.next_cursor.get<std::int64_t>();
    }
    CHECK(more == std::vector<bool>{true, false});
    CHECK(seen == std::vector<std::string>{"b5", "b4", "b3", "b2", "b1",
                                           "b0"});
    walks.push_back(seen);
  }
  CHECK(walks[0] == walks[1]);
}

TEST_CASE("both tiers render identical pages", "[query][equivalence]") {
  TwoTiers t("equiv");
  std::mt19937 rng(7);
  std::uniform_int_distribution<int> score(0, 9);
  for (int i = 0; i < 40; ++i) {
    Json payload = {{"name", "p" + std::to_string(i)}};
    if (i % 5 != 0)
      payload["score"] = score(rng);
    t.write("ns", "p" + std::to_string(i), payload, 100 + i);
  }

  RecencyQuery rq;
  rq.page_size = 7;
  rq.cursor = 120;
  CHECK(without_source(t.memory.list_by_recency("ns", rq)) ==
        without_source(t.durable.list_by_recency("ns", rq)));

  for (auto dir : {SortDirection::Asc, SortDirection::Desc}) {
    for (bool with_default : {false, true}) {
      SortedQuery q;
      q.field = "score";
      q.direction = dir;
      q.page_size = 6;
      if (with_default)
        q.default_value = Json(4);
      std::vector<Json> mem_pages, db_pages;
      for (auto *tier : t.tiers()) {
        SortedQuery cur = q;
        auto &pages = tier == &t.memory ? mem_pages : db_pages;
        while (true) {
          auto page = tier->list_by_field("ns", cur);
          pages.push_back(without_source(page));
          if (!page.has_more)
            break;
          cur.cursor = page.next_cursor;
          cur.cursor_key = page.next_cursor_key;
        }
      }
      CHECK(mem_pages == db_pages);
      std::size_t listed = 0;
      for (const auto &p : mem_pages)
        listed += p["data"].size();
      CHECK(listed == (with_default ? 40u : 32u));
    }
  }
}

TEST_CASE("default value places entries lacking the field", "[query][sorted]") {
  TwoTiers t("default_pos");
  t.write("ns", "low", Json{{"score", 1}}, 1);
  t.write("ns", "high", Json{{"score", 9}}, 2);
  t.write("ns", "none", Json{{"name", "x"}}, 3);

  for (auto *tier : t.tiers()) {
    SortedQuery q;
    q.field = "score";
    q.direction = SortDirection::Desc;
    q.default_value = Json(5);
    auto page = tier->list_by_field("ns", q);
    CHECK(keys_of(page) == std::vector<std::string>{"high", "none", "low"});
    CHECK(page.next_cursor == 1);
    CHECK(page.next_cursor_key == std::optional<std::string>("low"));

    q.default_value.reset();
    CHECK(keys_of(tier->list_by_field("ns", q)) ==
          std::vector<std::string>{"high", "low"});
  }
}

TEST_CASE("cursor without a key skips every tie on the cursor value",
          "[query][sorted]") {
  TwoTiers t("ties");
  t.write("ns", "a", Json{{"s", 5}}, 1);
  t.write("ns", "b", Json{{"s", 5}}, 2);
  t.write("ns", "c", Json{{"s", 3}}, 3);

  for (auto *tier : t.tiers()) {
    SortedQuery q;
    q.field = "s";
    q.direction = SortDirection::Desc;
    q.cursor = Json(5);
    CHECK(keys_of(tier->list_by_field("ns", q)) ==
          std::vector<std::string>{"c"});
    q.cursor_key = "a";
    CHECK(keys_of(tier->list_by_field("ns", q)) ==
          std::vector<std::string>{"b", "c"});
  }
}

TEST_CASE("rank over 10, 20, 30 descending", "[query][rank]") {
  TwoTiers t("rank");
  t.write("ns", "ten", Json{{"score", 10}}, 1);
  t.write("ns", "twenty", Json{{"score", 20}}, 2);
  t.write("ns", "thirty", Json{{"score", 30}}, 3);
  t.write("ns", "blank", Json{{"name", "b"}}, 4);

  for (auto *tier : t.tiers()) {
    RankQuery q;
    q.field = "score";
    q.direction = SortDirection::Desc;
    auto r = tier->rank("ns", "twenty", q);
    REQUIRE(r.outcome == RankResult::Outcome::Found);
    CHECK(r.rank == 2);
    CHECK(r.value == 20);
    CHECK(tier->rank("ns", "thirty", q).rank == 1);
    CHECK(tier->rank("ns", "nope", q).outcome ==
          RankResult::Outcome::NotFound);
    CHECK(tier->rank("ns", "blank", q).outcome ==
          RankResult::Outcome::FieldMissing);

    q.direction = SortDirection::Asc;
    CHECK(tier->rank("ns", "thirty", q).rank == 3);
    q.default_value = Json(20);
    // Ties share a rank.
    CHECK(tier->rank("ns", "blank", q).rank == 2);
    CHECK(tier->rank("ns", "twenty", q).rank == 2);
  }
}

TEST_CASE("page json carries data and meta", "[query][json]") {
  PageResult page;
  page.items.push_back({"k", Json{{"v", 1}}});
  page.page_size = 10;
  page.total_items = 1;
  page.next_cursor = 42;
  page.tier = Tier::Durable;
  auto j = query::page_to_json(page);
  CHECK(j["data"][0]["key"] == "k");
  CHECK(j["meta"]["pageSize"] == 10);
  CHECK(j["meta"]["nextCursor"] == 42);
  CHECK(j["meta"]["hasMore"] == false);
  CHECK(j["meta"]["source"] == "db");
  CHECK_FALSE(j["meta"].contains("nextCursorKey"));

  SortDirection d;
  CHECK(query::parse_direction("DESC", d));
  CHECK(d == SortDirection::Desc);
  CHECK(query::parse_direction("1", d));
  CHECK(d == SortDirection::Asc);
  CHECK_FALSE(query::parse_direction("up", d));
}
