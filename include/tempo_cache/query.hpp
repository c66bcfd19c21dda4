#pragma once

#include "tempo_cache/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tempo_cache::query {

// Three-way comparison shared by both tiers. Values are ordered by type
// class first (null < number < string < object < array < boolean), then
// numbers numerically, strings lexically, booleans false < true and
// containers by their serialized form.
int compare(const Json &a, const Json &b);

// Comparison oriented so that a negative result means `a` is listed before
// `b` for the given direction.
int directed_compare(const Json &a, const Json &b, SortDirection dir);

// Looks up a dotted path ("stats.score") inside payload. null counts as
// missing.
std::optional<Json> field_value(const Json &payload, const std::string &path);

// field_value with default substitution; nullopt means the document does not
// take part in a sort on this field.
std::optional<Json> effective_value(const Json &payload, const std::string &path,
                                    const std::optional<Json> &default_value);

struct Candidate {
  std::string key;
  Json data;
  Json sort_value;
  std::int64_t write_cursor{0};
};

// Strictly past the (cursor, cursor_key) position for the query direction.
bool after_cursor(const Json &value, const std::string &key,
                  const Json &cursor,
                  const std::optional<std::string> &cursor_key,
                  SortDirection dir);

// Orders by sort_value in the requested direction, then by key ascending.
void sort_by_value(std::vector<Candidate> &candidates, SortDirection dir);

// Page over entries already resident in memory.
PageResult recency_page(std::vector<Candidate> entries,
                        const RecencyQuery &q, Tier tier);
PageResult sorted_page(std::vector<Candidate> entries, const SortedQuery &q,
                       Tier tier);

// 1-based rank of target among entries; ties share a rank.
std::int64_t rank_among(const std::vector<Candidate> &entries,
                        const Json &target_value, SortDirection dir);

Json page_to_json(const PageResult &page);
Json rank_to_json(const std::string &key, const RankResult &rank, Tier tier);

bool parse_direction(const std::string &text, SortDirection &out);

} // namespace tempo_cache::query
