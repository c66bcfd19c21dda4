#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tempo_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn = std::function<TimePoint()>;
using Json = nlohmann::json;

inline std::int64_t to_epoch_ms(TimePoint t) {
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          t.time_since_epoch())
          .count());
}

enum class Tier { Memory, Durable };
enum class SortDirection { Asc, Desc };

inline const char *tier_name(Tier t) {
  return t == Tier::Memory ? "memory" : "db";
}

// Value kept per key inside a namespace of the memory tier.
struct StoredValue {
  Json payload;
  std::int64_t write_cursor{0};
};

// Upsert descriptor shared by the durable tier and the write-behind batcher.
// expire_at_ms < 0 means the document never expires.
struct Document {
  std::string ns;
  std::string key;
  Json payload;
  std::int64_t write_cursor{0};
  std::int64_t expire_at_ms{-1};
};

struct PageItem {
  std::string key;
  Json data;
};

struct PageResult {
  std::vector<PageItem> items;
  std::size_t page_size{0};
  std::size_t total_items{0};
  Json next_cursor;
  std::optional<std::string> next_cursor_key;
  bool has_more{false};
  Tier tier{Tier::Memory};
};

struct RecencyQuery {
  std::optional<std::int64_t> cursor;
  std::size_t page_size{5000};
};

struct SortedQuery {
  std::string field;
  SortDirection direction{SortDirection::Desc};
  std::optional<Json> cursor;
  // Key of the last item on the previous page; resolves ties on the cursor
  // value.
  std::optional<std::string> cursor_key;
  std::optional<Json> default_value;
  std::size_t page_size{5000};
};

struct RankQuery {
  std::string field;
  SortDirection direction{SortDirection::Desc};
  std::optional<Json> default_value;
};

struct RankResult {
  enum class Outcome { Found, NotFound, FieldMissing };
  Outcome outcome{Outcome::NotFound};
  std::int64_t rank{0};
  Json value;
};

} // namespace tempo_cache
