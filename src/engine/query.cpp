#include "tempo_cache/query.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace tempo_cache::query {
namespace {
int type_class(const Json &v) {
  if (v.is_null())
    return 0;
  if (v.is_number())
    return 1;
  if (v.is_string())
    return 2;
  if (v.is_object())
    return 3;
  if (v.is_array())
    return 4;
  if (v.is_boolean())
    return 5;
  return 6;
}

template <typename T> int three_way(const T &a, const T &b) {
  if (a < b)
    return -1;
  if (b < a)
    return 1;
  return 0;
}

int compare_numbers(const Json &a, const Json &b) {
  if (a.is_number_float() || b.is_number_float())
    return three_way(a.get<double>(), b.get<double>());
  if (a.is_number_unsigned() && b.is_number_unsigned())
    return three_way(a.get<std::uint64_t>(), b.get<std::uint64_t>());
  constexpr auto kMax =
      static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  if (a.is_number_unsigned() && a.get<std::uint64_t>() > kMax)
    return 1;
  if (b.is_number_unsigned() && b.get<std::uint64_t>() > kMax)
    return -1;
  return three_way(a.get<std::int64_t>(), b.get<std::int64_t>());
}

std::vector<Candidate> take(std::vector<Candidate> &v, std::size_t n) {
  std::vector<Candidate> out;
  const auto count = std::min(n, v.size());
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
    out.push_back(std::move(v[i]));
  return out;
}

void fill_items(PageResult &page, const std::vector<Candidate> &slice) {
  page.items.reserve(slice.size());
  for (const auto &c : slice)
    page.items.push_back({c.key, c.data});
}
} // namespace

int compare(const Json &a, const Json &b) {
  const int ta = type_class(a);
  const int tb = type_class(b);
  if (ta != tb)
    return ta < tb ? -1 : 1;
  switch (ta) {
  case 0:
    return 0;
  case 1:
    return compare_numbers(a, b);
  case 2:
    return three_way(a.get_ref<const std::string &>(),
                     b.get_ref<const std::string &>());
  case 5:
    return three_way(a.get<bool>(), b.get<bool>());
  default:
    return three_way(a.dump(), b.dump());
  }
}

int directed_compare(const Json &a, const Json &b, SortDirection dir) {
  return dir == SortDirection::Asc ? compare(a, b) : compare(b, a);
}

std::optional<Json> field_value(const Json &payload, const std::string &path) {
  const Json *cur = &payload;
  std::size_t start = 0;
  while (start <= path.size()) {
    const auto dot = path.find('.', start);
    const auto part = path.substr(start, dot == std::string::npos
                                             ? std::string::npos
                                             : dot - start);
    if (!cur->is_object())
      return std::nullopt;
    auto it = cur->find(part);
    if (it == cur->end())
      return std::nullopt;
    cur = &*it;
    if (dot == std::string::npos)
      break;
    start = dot + 1;
  }
  if (cur->is_null())
    return std::nullopt;
  return *cur;
}

std::optional<Json> effective_value(const Json &payload, const std::string &path,
                                    const std::optional<Json> &default_value) {
  auto v = field_value(payload, path);
  if (v.has_value())
    return v;
  if (default_value.has_value() && !default_value->is_null())
    return default_value;
  return std::nullopt;
}

bool after_cursor(const Json &value, const std::string &key,
                  const Json &cursor,
                  const std::optional<std::string> &cursor_key,
                  SortDirection dir) {
  const int c = directed_compare(value, cursor, dir);
  if (c != 0)
    return c > 0;
  return cursor_key.has_value() && key > *cursor_key;
}

void sort_by_value(std::vector<Candidate> &candidates, SortDirection dir) {
  std::sort(candidates.begin(), candidates.end(),
            [dir](const Candidate &a, const Candidate &b) {
              const int c = directed_compare(a.sort_value, b.sort_value, dir);
              if (c != 0)
                return c < 0;
              return a.key < b.key;
            });
}

PageResult recency_page(std::vector<Candidate> entries, const RecencyQuery &q,
                        Tier tier) {
  PageResult page;
  page.tier = tier;
  page.page_size = q.page_size;
  page.total_items = entries.size();

  std::sort(entries.begin(), entries.end(),
            [](const Candidate &a, const Candidate &b) {
              if (a.write_cursor != b.write_cursor)
                return a.write_cursor > b.write_cursor;
              return a.key < b.key;
            });
  if (q.cursor.has_value()) {
    const auto cursor = *q.cursor;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [cursor](const Candidate &c) {
                                   return c.write_cursor >= cursor;
                                 }),
                  entries.end());
  }
  const auto remaining = entries.size();
  auto slice = take(entries, q.page_size);
  fill_items(page, slice);
  if (!slice.empty())
    page.next_cursor = slice.back().write_cursor;
  page.has_more = remaining > slice.size();
  return page;
}

PageResult sorted_page(std::vector<Candidate> entries, const SortedQuery &q,
                       Tier tier) {
  PageResult page;
  page.tier = tier;
  page.page_size = q.page_size;
  page.total_items = entries.size();

  if (q.cursor.has_value()) {
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&q](const Candidate &c) {
                                   return !after_cursor(c.sort_value, c.key,
                                                        *q.cursor, q.cursor_key,
                                                        q.direction);
                                 }),
                  entries.end());
  }
  sort_by_value(entries, q.direction);
  const auto remaining = entries.size();
  auto slice = take(entries, q.page_size);
  fill_items(page, slice);
  if (!slice.empty()) {
    page.next_cursor = slice.back().sort_value;
    page.next_cursor_key = slice.back().key;
  }
  page.has_more = remaining > slice.size();
  return page;
}

std::int64_t rank_among(const std::vector<Candidate> &entries,
                        const Json &target_value, SortDirection dir) {
  std::int64_t better = 0;
  for (const auto &c : entries)
    if (directed_compare(c.sort_value, target_value, dir) < 0)
      ++better;
  return better + 1;
}

Json page_to_json(const PageResult &page) {
  Json items = Json::array();
  for (const auto &item : page.items)
    items.push_back({{"key", item.key}, {"data", item.data}});
  Json meta = {{"pageSize", page.page_size},
               {"totalItems", page.total_items},
               {"nextCursor", page.next_cursor},
               {"hasMore", page.has_more},
               {"source", tier_name(page.tier)}};
  if (page.next_cursor_key.has_value())
    meta["nextCursorKey"] = *page.next_cursor_key;
  return {{"data", std::move(items)}, {"meta", std::move(meta)}};
}

Json rank_to_json(const std::string &key, const RankResult &rank, Tier tier) {
  return {{"data", {{"key", key}, {"rank", rank.rank}, {"value", rank.value}}},
          {"meta", {{"source", tier_name(tier)}}}};
}

bool parse_direction(const std::string &text, SortDirection &out) {
  std::string t = text;
  std::transform(t.begin(), t.end(), t.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (t == "asc" || t == "1") {
    out = SortDirection::Asc;
    return true;
  }
  if (t == "desc" || t == "-1") {
    out = SortDirection::Desc;
    return true;
  }
  return false;
}

} // namespace tempo_cache::query
