#include "tempo_cache/engine.hpp"
#include "tempo_cache/log.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <random>

using namespace tempo_cache;

namespace {

void report(const std::string& name, std::vector<double>& lat, double seconds) {
  std::sort(lat.begin(), lat.end());
  auto pct = [&](double p) { return lat[static_cast<std::size_t>(p * (lat.size() - 1))]; };
  std::cout << "op=" << name
            << " ops/s=" << std::fixed << std::setprecision(2) << (lat.size() / seconds)
            << " p50_us=" << pct(0.50)
            << " p95_us=" << pct(0.95)
            << " p99_us=" << pct(0.99)
            << "\n";
}

void run(const std::string& name, int ops, const std::function<void(int)>& fn) {
  std::vector<double> lat;
  lat.reserve(ops);
  auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < ops; ++i) {
    auto t0 = std::chrono::steady_clock::now();
    fn(i);
    auto t1 = std::chrono::steady_clock::now();
    lat.push_back(std::chrono::duration<double, std::micro>(t1 - t0).count());
  }
  auto end = std::chrono::steady_clock::now();
  report(name, lat, std::chrono::duration<double>(end - start).count());
}

} // namespace

int main() {
  tempo_cache::log::set_level(tempo_cache::log::Level::Warn);
  Engine engine(EngineConfig{});
  const auto access = AccessSet::everything();
  std::mt19937_64 rng(42);
  std::uniform_int_distribution<int> score(0, 100000);
  const int keys = 10000;

  for (const std::size_t ns_size : {100, 1000, 10000}) {
    const std::string ns = "bench" + std::to_string(ns_size);
    std::cout << "namespace_size=" << ns_size << "\n";
    run("set", keys, [&](int i) {
      SetRequest req;
      req.ns = ns;
      req.key = "k" + std::to_string(i % ns_size);
      req.data = Json{{"score", score(rng)}, {"name", req.key}};
      engine.set(access, req);
    });
    run("get", keys, [&](int i) {
      std::optional<Json> out;
      engine.get(access, ns, "k" + std::to_string(i % ns_size), Tier::Memory, &out);
    });
    run("list_page100", 200, [&](int) {
      RecencyQuery q;
      q.page_size = 100;
      PageResult page;
      engine.list(access, ns, q, Tier::Memory, &page);
    });
    run("sorted_page100", 200, [&](int) {
      SortedQuery q;
      q.field = "score";
      q.page_size = 100;
      PageResult page;
      engine.sorted(access, ns, q, Tier::Memory, &page);
    });
    run("rank", 200, [&](int i) {
      RankQuery q;
      q.field = "score";
      RankResult r;
      engine.rank(access, ns, "k" + std::to_string(i % ns_size), q, Tier::Memory, &r);
    });
  }
  return 0;
}
