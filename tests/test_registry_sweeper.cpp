#include "tempo_cache/namespace_registry.hpp"
#include "tempo_cache/periodic_task.hpp"
#include "tempo_cache/sweeper.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace tempo_cache;
using tempo_cache::testing::ManualClock;
using namespace std::chrono_literals;

TEST_CASE("registry creates a namespace once and returns the same store",
          "[registry]") {
  NamespaceRegistry reg;
  auto a = reg.get_or_create("users");
  auto b = reg.get_or_create("users");
  CHECK(a == b);
  CHECK(reg.find("users") == a);
  CHECK(reg.find("missing") == nullptr);
  CHECK(reg.size() == 1);
}

TEST_CASE("only empty namespaces are removed", "[registry]") {
  NamespaceRegistry reg;
  reg.get_or_create("empty");
  reg.get_or_create("full")->set("k", StoredValue{Json(1), 1}, 0);
  CHECK(reg.remove_if_empty("empty"));
  CHECK_FALSE(reg.remove_if_empty("full"));
  CHECK(reg.find("empty") == nullptr);
  CHECK(reg.find("full") != nullptr);
}

TEST_CASE("a detached store is no longer current", "[registry]") {
  NamespaceRegistry reg;
  auto old = reg.get_or_create("ns");
  REQUIRE(reg.is_current("ns", old));
  REQUIRE(reg.remove_if_empty("ns"));
  CHECK_FALSE(reg.is_current("ns", old));
  auto fresh = reg.get_or_create("ns");
  CHECK(fresh != old);
  CHECK(reg.is_current("ns", fresh));
}

TEST_CASE("sweep prunes expired entries and drops emptied namespaces",
          "[sweeper]") {
  ManualClock clock;
  NamespaceRegistry reg(clock.fn());
  auto gone = reg.get_or_create("gone");
  gone->set("a", StoredValue{Json(1), 1}, 1);
  gone->set("b", StoredValue{Json(2), 2}, 1);
  auto mixed = reg.get_or_create("mixed");
  mixed->set("short", StoredValue{Json(3), 3}, 1);
  mixed->set("forever", StoredValue{Json(4), 4}, 0);
  reg.get_or_create("idle");

  clock.advance(5s);
  Sweeper sweeper(reg, 1);
  auto report = sweeper.sweep_once();
  CHECK(report.namespaces_scanned == 3);
  CHECK(report.entries_pruned == 3);
  CHECK(report.namespaces_removed == 2);
  CHECK(reg.find("gone") == nullptr);
  CHECK(reg.find("idle") == nullptr);
  REQUIRE(reg.find("mixed") != nullptr);
  CHECK(reg.find("mixed")->get("forever").has_value());
  CHECK(sweeper.runs() == 1);
  CHECK(sweeper.entries_pruned() == 3);
}

TEST_CASE("writes racing the sweeper are never lost", "[sweeper][concurrency]") {
  NamespaceRegistry reg;
  Sweeper sweeper(reg, 16);
  std::atomic<bool> stop{false};
  std::thread sweep([&] {
    while (!stop.load())
      sweeper.sweep_once();
  });

  // Mirrors MemoryTier::write: retry until the store is still registered.
  for (int i = 0; i < 2000; ++i) {
    const auto ns = "ns" + std::to_string(i % 4);
    const auto key = "k" + std::to_string(i);
    while (true) {
      auto store = reg.get_or_create(ns);
      store->set(key, StoredValue{Json(i), i}, 0);
      if (reg.is_current(ns, store))
        break;
    }
  }
  stop = true;
  sweep.join();

  std::size_t total = 0;
  for (const auto &ns : reg.names())
    total += reg.find(ns)->keys().size();
  CHECK(total == 2000);
}

TEST_CASE("periodic task runs repeatedly and survives exceptions",
          "[background]") {
  std::atomic<int> calls{0};
  PeriodicTask task("test", 5ms, [&] {
    if (++calls % 2 == 0)
      throw std::runtime_error("boom");
  });
  task.start();
  for (int i = 0; i < 200 && calls.load() < 6; ++i)
    std::this_thread::sleep_for(5ms);
  task.stop();
  CHECK_FALSE(task.running());
  CHECK(calls.load() >= 6);
  CHECK(task.failures() >= 3);
  const auto after_stop = calls.load();
  std::this_thread::sleep_for(20ms);
  CHECK(calls.load() == after_stop);
}
