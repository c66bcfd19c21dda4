#include "tempo_cache/permission_cache.hpp"
#include "tempo_cache/segment_store.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace tempo_cache;
using tempo_cache::testing::ManualClock;
using tempo_cache::testing::TempDir;
using namespace std::chrono_literals;

namespace {

SegmentStoreConfig config_for(const TempDir &dir) {
  SegmentStoreConfig cfg;
  cfg.enabled = true;
  cfg.dir = dir.path();
  cfg.fsync = FsyncMode::Never;
  return cfg;
}

AccessSet only(std::initializer_list<std::string> names) {
  AccessSet a;
  a.namespaces.insert(names.begin(), names.end());
  return a;
}

} // namespace

TEST_CASE("wildcard grants everything, otherwise exact membership",
          "[permissions]") {
  CHECK(AccessSet::everything().allows("anything"));
  auto a = only({"users", "teams"});
  CHECK(a.allows("users"));
  CHECK_FALSE(a.allows("user"));
  CHECK(AccessSet::from_json(Json::array({"*"})).wildcard);
  for (const auto &bad : {Json(), Json("ns1"), Json{{"ns1", true}}}) {
    auto none = AccessSet::from_json(bad);
    CHECK_FALSE(none.wildcard);
    CHECK_FALSE(none.allows("ns1"));
  }
  auto parsed = AccessSet::from_json(Json::array({"a", "b"}));
  CHECK_FALSE(parsed.wildcard);
  CHECK(parsed.allows("b"));
}

TEST_CASE("first_denied reports the first disallowed namespace",
          "[permissions]") {
  auto a = only({"a"});
  CHECK_FALSE(PermissionCache::first_denied(a, {"a", "a"}).has_value());
  CHECK(PermissionCache::first_denied(a, {"a", "b", "c"}) ==
        std::optional<std::string>("b"));
}

TEST_CASE("without a reachable store only static tokens pass",
          "[permissions]") {
  SegmentDocumentStore offline(SegmentStoreConfig{});
  PermissionCache cache(&offline, {"static-1"});
  auto ok = cache.resolve("static-1");
  REQUIRE(ok.has_value());
  CHECK(ok->wildcard);
  CHECK_FALSE(cache.resolve("other").has_value());
  CHECK_FALSE(cache.resolve("").has_value());

  PermissionCache no_store(nullptr, {"static-1"});
  CHECK(no_store.resolve("static-1").has_value());
}

TEST_CASE("records come from the store and stay cached until the ttl lapses",
          "[permissions][cache]") {
  TempDir dir("perm");
  ManualClock clock;
  SegmentDocumentStore keys(config_for(dir), clock.fn());
  REQUIRE(keys.init());
  PermissionCache cache(&keys, {}, clock.fn(), 60);

  REQUIRE(cache.put_record("tok", only({"users"}), true));
  auto first = cache.resolve("tok");
  REQUIRE(first.has_value());
  CHECK(first->allows("users"));
  CHECK_FALSE(first->allows("teams"));

  // Revoke directly in the store; the cached grant survives until expiry.
  Document revoked;
  revoked.ns = kKeysNamespace;
  revoked.key = "tok";
  revoked.payload = Json{{"allowed", {"users"}}, {"active", false}};
  REQUIRE(keys.upsert(revoked));
  clock.advance(30s);
  CHECK(cache.resolve("tok").has_value());
  clock.advance(31s);
  CHECK_FALSE(cache.resolve("tok").has_value());
}

TEST_CASE("unknown and inactive tokens are rejected when the store is up",
          "[permissions]") {
  TempDir dir("perm_inactive");
  SegmentDocumentStore keys(config_for(dir));
  REQUIRE(keys.init());
  PermissionCache cache(&keys, {"static-1"});
  REQUIRE(cache.put_record("off", AccessSet::everything(), false));
  CHECK_FALSE(cache.resolve("off").has_value());
  CHECK_FALSE(cache.resolve("ghost").has_value());
  // Static tokens need a record once the store is reachable.
  CHECK_FALSE(cache.resolve("static-1").has_value());
}

TEST_CASE("seeding writes wildcard records for missing static tokens only",
          "[permissions][seed]") {
  TempDir dir("perm_seed");
  SegmentDocumentStore keys(config_for(dir));
  REQUIRE(keys.init());
  PermissionCache cache(&keys, {"s1", "s2"});
  REQUIRE(cache.put_record("s2", only({"limited"}), true));

  CHECK(cache.seed_static_keys() == 1);
  auto s1 = cache.resolve("s1");
  REQUIRE(s1.has_value());
  CHECK(s1->wildcard);
  auto s2 = cache.resolve("s2");
  REQUIRE(s2.has_value());
  CHECK_FALSE(s2->wildcard);
  CHECK(cache.seed_static_keys() == 0);
}

TEST_CASE("a missing allowed list grants everything, a malformed one nothing",
          "[permissions]") {
  TempDir dir("perm_allowed_shape");
  SegmentDocumentStore keys(config_for(dir));
  REQUIRE(keys.init());
  PermissionCache cache(&keys, {});

  Document open;
  open.ns = kKeysNamespace;
  open.key = "no-list";
  open.payload = Json{{"active", true}};
  REQUIRE(keys.upsert(open));
  Document malformed = open;
  malformed.key = "string-list";
  malformed.payload = Json{{"allowed", "ns1"}, {"active", true}};
  REQUIRE(keys.upsert(malformed));

  auto all = cache.resolve("no-list");
  REQUIRE(all.has_value());
  CHECK(all->wildcard);
  auto none = cache.resolve("string-list");
  REQUIRE(none.has_value());
  CHECK_FALSE(none->wildcard);
  CHECK_FALSE(none->allows("ns1"));
}
