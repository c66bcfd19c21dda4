#include "tempo_cache/tier.hpp"

#include "tempo_cache/query.hpp"

#include <limits>

namespace tempo_cache {

Document make_document(const WriteRequest &req, std::int64_t write_cursor,
                       TimePoint now) {
  Document doc;
  doc.ns = req.ns;
  doc.key = req.key;
  doc.payload = req.payload;
  doc.write_cursor = write_cursor;
  const auto now_ms = to_epoch_ms(now);
  // A deadline past what an epoch-ms int64 can hold never expires.
  if (req.ttl_seconds <= 0 ||
      req.ttl_seconds >
          (std::numeric_limits<std::int64_t>::max() - now_ms) / 1000)
    doc.expire_at_ms = -1;
  else
    doc.expire_at_ms = now_ms + req.ttl_seconds * 1000;
  return doc;
}

MemoryTier::MemoryTier(NamespaceRegistry &registry) : registry_(registry) {}

void MemoryTier::write(const WriteRequest &req, std::int64_t write_cursor) {
  // The sweeper may detach an empty namespace between lookup and set; retry
  // until the write lands in the store the registry still points at.
  while (true) {
    auto store = registry_.get_or_create(req.ns);
    store->set(req.key, StoredValue{req.payload, write_cursor},
               req.ttl_seconds);
    if (registry_.is_current(req.ns, store))
      return;
  }
}

BulkWriteResult MemoryTier::write_many(const std::vector<WriteRequest> &reqs,
                                       std::int64_t first_cursor) {
  BulkWriteResult result;
  for (const auto &req : reqs) {
    write(req, first_cursor + static_cast<std::int64_t>(result.applied));
    ++result.applied;
  }
  return result;
}

std::optional<Json> MemoryTier::read(const std::string &ns,
                                     const std::string &key) {
  auto v = registry_.get_or_create(ns)->get(key);
  if (!v.has_value())
    return std::nullopt;
  return v->payload;
}

bool MemoryTier::remove(const std::string &ns, const std::string &key) {
  return registry_.get_or_create(ns)->del(key);
}

PageResult MemoryTier::list_by_recency(const std::string &ns,
                                       const RecencyQuery &q) {
  std::vector<query::Candidate> entries;
  for (auto &[key, v] : registry_.get_or_create(ns)->entries())
    entries.push_back({key, std::move(v.payload), Json(), v.write_cursor});
  return query::recency_page(std::move(entries), q, Tier::Memory);
}

PageResult MemoryTier::list_by_field(const std::string &ns,
                                     const SortedQuery &q) {
  std::vector<query::Candidate> entries;
  for (auto &[key, v] : registry_.get_or_create(ns)->entries()) {
    auto value = query::effective_value(v.payload, q.field, q.default_value);
    if (!value.has_value())
      continue;
    entries.push_back(
        {key, std::move(v.payload), std::move(*value), v.write_cursor});
  }
  return query::sorted_page(std::move(entries), q, Tier::Memory);
}

RankResult MemoryTier::rank(const std::string &ns, const std::string &key,
                            const RankQuery &q) {
  RankResult result;
  std::optional<Json> target;
  bool found = false;
  std::vector<query::Candidate> entries;
  for (auto &[k, v] : registry_.get_or_create(ns)->entries()) {
    auto value = query::effective_value(v.payload, q.field, q.default_value);
    if (k == key) {
      found = true;
      target = value;
    }
    if (value.has_value())
      entries.push_back({k, Json(), std::move(*value), v.write_cursor});
  }
  if (!found) {
    result.outcome = RankResult::Outcome::NotFound;
    return result;
  }
  if (!target.has_value()) {
    result.outcome = RankResult::Outcome::FieldMissing;
    return result;
  }
  result.outcome = RankResult::Outcome::Found;
  result.rank = query::rank_among(entries, *target, q.direction);
  result.value = std::move(*target);
  return result;
}

} // namespace tempo_cache
