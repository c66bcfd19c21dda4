#include "tempo_cache/tier.hpp"

#include "tempo_cache/query.hpp"

namespace tempo_cache {
namespace {

SortDirection reversed(SortDirection dir) {
  return dir == SortDirection::Asc ? SortDirection::Desc : SortDirection::Asc;
}

PageResult to_page(std::vector<FoundDocument> &docs, std::size_t total,
                   std::size_t page_size) {
  PageResult page;
  page.tier = Tier::Durable;
  page.page_size = page_size;
  page.total_items = total;
  page.items.reserve(docs.size());
  for (auto &found : docs)
    page.items.push_back({found.doc.key, std::move(found.doc.payload)});
  return page;
}

} // namespace

DurableTier::DurableTier(IDocumentStore &store, NowFn now)
    : store_(store), now_(std::move(now)) {}

void DurableTier::write(const WriteRequest &req, std::int64_t write_cursor) {
  std::string err;
  if (!store_.upsert(make_document(req, write_cursor, now_()), &err))
    throw StoreError("upsert " + req.ns + "/" + req.key + ": " + err);
}

BulkWriteResult DurableTier::write_many(const std::vector<WriteRequest> &reqs,
                                        std::int64_t first_cursor) {
  const auto now = now_();
  std::vector<Document> docs;
  docs.reserve(reqs.size());
  for (const auto &req : reqs)
    docs.push_back(make_document(
        req, first_cursor + static_cast<std::int64_t>(docs.size()), now));
  return bulk_upsert(docs);
}

BulkWriteResult DurableTier::bulk_upsert(const std::vector<Document> &docs) {
  if (docs.empty())
    return {};
  return store_.bulk_upsert(docs);
}

std::optional<Json> DurableTier::read(const std::string &ns,
                                      const std::string &key) {
  auto doc = store_.find_one(ns, key);
  if (!doc.has_value())
    return std::nullopt;
  return std::move(doc->payload);
}

bool DurableTier::remove(const std::string &ns, const std::string &key) {
  std::string err;
  auto removed = store_.remove(ns, key, &err);
  if (!removed.has_value())
    throw StoreError("remove " + ns + "/" + key + ": " + err);
  return *removed > 0;
}

PageResult DurableTier::list_by_recency(const std::string &ns,
                                        const RecencyQuery &q) {
  DocQuery find;
  find.ns = ns;
  find.cursor_below = q.cursor;
  find.limit = q.page_size;
  auto docs = store_.find(find);

  DocQuery all;
  all.ns = ns;
  std::int64_t last_cursor = docs.empty() ? 0 : docs.back().doc.write_cursor;
  PageResult page = to_page(docs, store_.count(all), q.page_size);
  if (page.items.empty())
    return page;

  page.next_cursor = last_cursor;
  DocQuery probe;
  probe.ns = ns;
  probe.cursor_below = last_cursor;
  probe.limit = 1;
  page.has_more = !store_.find(probe).empty();
  return page;
}

PageResult DurableTier::list_by_field(const std::string &ns,
                                      const SortedQuery &q) {
  DocQuery base;
  base.ns = ns;
  base.field = q.field;
  base.default_value = q.default_value;

  DocQuery find = base;
  if (q.cursor.has_value())
    find.past = FieldFilter{*q.cursor, q.cursor_key, q.direction};
  find.field_order = q.direction;
  find.limit = q.page_size;
  auto docs = store_.find(find);

  if (docs.empty())
    return to_page(docs, store_.count(base), q.page_size);

  Json last_value = docs.back().sort_value;
  std::string last_key = docs.back().doc.key;
  PageResult page = to_page(docs, store_.count(base), q.page_size);
  page.next_cursor = last_value;
  page.next_cursor_key = last_key;

  DocQuery probe = base;
  probe.past = FieldFilter{std::move(last_value), std::move(last_key),
                           q.direction};
  probe.field_order = q.direction;
  probe.limit = 1;
  page.has_more = !store_.find(probe).empty();
  return page;
}

RankResult DurableTier::rank(const std::string &ns, const std::string &key,
                             const RankQuery &q) {
  RankResult result;
  auto target = store_.find_one(ns, key);
  if (!target.has_value()) {
    result.outcome = RankResult::Outcome::NotFound;
    return result;
  }
  auto value = query::effective_value(target->payload, q.field, q.default_value);
  if (!value.has_value()) {
    result.outcome = RankResult::Outcome::FieldMissing;
    return result;
  }

  // Entries strictly better than the target are those strictly past it when
  // walking the opposite direction.
  DocQuery better;
  better.ns = ns;
  better.field = q.field;
  better.default_value = q.default_value;
  better.past = FieldFilter{*value, std::nullopt, reversed(q.direction)};

  result.outcome = RankResult::Outcome::Found;
  result.rank = static_cast<std::int64_t>(store_.count(better)) + 1;
  result.value = std::move(*value);
  return result;
}

} // namespace tempo_cache
