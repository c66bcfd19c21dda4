#pragma once

#include "tempo_cache/types.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tempo_cache {

// Key -> value map where every slot carries an absolute expiry. Expiry is
// enforced lazily: a read that finds an expired slot erases it. All members
// are safe to call from several threads.
template <typename V> class ExpiringStore {
public:
  explicit ExpiringStore(NowFn now = [] { return Clock::now(); })
      : now_(std::move(now)) {}

  ExpiringStore(const ExpiringStore &) = delete;
  ExpiringStore &operator=(const ExpiringStore &) = delete;

  // ttl_seconds <= 0, or one past the clock's range, stores the value
  // without expiry.
  void set(const std::string &key, V value, std::int64_t ttl_seconds) {
    Slot slot{std::move(value), deadline_for(ttl_seconds)};
    std::lock_guard<std::mutex> lock(mu_);
    slots_[key] = std::move(slot);
  }

  std::optional<V> get(const std::string &key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = slots_.find(key);
    if (it == slots_.end())
      return std::nullopt;
    if (expired(it->second, now_())) {
      slots_.erase(it);
      return std::nullopt;
    }
    return it->second.value;
  }

  bool has(const std::string &key) { return get(key).has_value(); }

  bool del(const std::string &key) {
    std::lock_guard<std::mutex> lock(mu_);
    return slots_.erase(key) > 0;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mu_);
    slots_.clear();
  }

  // Snapshot of stored keys, expired-but-unpurged ones included. Callers
  // re-check through get()/has().
  std::vector<std::string> keys() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> out;
    out.reserve(slots_.size());
    for (const auto &[k, _] : slots_)
      out.push_back(k);
    return out;
  }

  // Live (key, value) pairs; expired slots met on the way are purged.
  std::vector<std::pair<std::string, V>> entries() {
    std::lock_guard<std::mutex> lock(mu_);
    const auto now = now_();
    std::vector<std::pair<std::string, V>> out;
    out.reserve(slots_.size());
    for (auto it = slots_.begin(); it != slots_.end();) {
      if (expired(it->second, now)) {
        it = slots_.erase(it);
        continue;
      }
      out.emplace_back(it->first, it->second.value);
      ++it;
    }
    return out;
  }

  std::size_t size() { return entries().size(); }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mu_);
    return slots_.empty();
  }

  // Forces the expiry check on every key. The lock is only held per key and
  // the thread yields every chunk_size keys, so writers are never starved.
  std::size_t prune(std::size_t chunk_size) {
    chunk_size = std::max<std::size_t>(1, chunk_size);
    std::size_t removed = 0;
    std::size_t checked = 0;
    for (const auto &key : keys()) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = slots_.find(key);
        if (it != slots_.end() && expired(it->second, now_())) {
          slots_.erase(it);
          ++removed;
        }
      }
      if (++checked % chunk_size == 0)
        std::this_thread::yield();
    }
    return removed;
  }

  // Returns the live value under key, inserting make() without expiry when
  // there is none. Lookup and insert happen under one lock.
  template <typename Factory>
  V get_or_emplace(const std::string &key, Factory make) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = slots_.find(key);
    if (it != slots_.end() && !expired(it->second, now_()))
      return it->second.value;
    Slot slot{make(), std::nullopt};
    auto &stored = slots_[key];
    stored = std::move(slot);
    return stored.value;
  }

  template <typename Pred> bool erase_if(const std::string &key, Pred pred) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = slots_.find(key);
    if (it == slots_.end() || !pred(it->second.value))
      return false;
    slots_.erase(it);
    return true;
  }

private:
  struct Slot {
    V value;
    std::optional<TimePoint> deadline;
  };

  // ttl beyond the clock's range saturates to no expiry.
  std::optional<TimePoint> deadline_for(std::int64_t ttl_seconds) const {
    if (ttl_seconds <= 0)
      return std::nullopt;
    const auto now = now_();
    const auto headroom =
        std::chrono::duration_cast<std::chrono::seconds>(TimePoint::max() - now);
    if (ttl_seconds >= headroom.count())
      return std::nullopt;
    return now + std::chrono::seconds(ttl_seconds);
  }

  static bool expired(const Slot &s, TimePoint now) {
    return s.deadline.has_value() && *s.deadline < now;
  }

  NowFn now_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Slot> slots_;
};

} // namespace tempo_cache
