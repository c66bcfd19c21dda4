#include "tempo_cache/engine.hpp"

#include "tempo_cache/log.hpp"

#include <algorithm>
#include <sstream>

namespace tempo_cache {
namespace {

SegmentStoreConfig sub_store(const SegmentStoreConfig &base,
                             const std::string &name) {
  SegmentStoreConfig cfg = base;
  cfg.dir = base.dir + "/" + name;
  return cfg;
}

Status forbidden(const std::string &ns) {
  return Status::error(Code::Forbidden, "namespace not allowed: " + ns);
}

} // namespace

const char *code_name(Code code) {
  switch (code) {
  case Code::Ok:
    return "OK";
  case Code::BadRequest:
    return "ERR";
  case Code::Unauthenticated:
    return "NOAUTH";
  case Code::Forbidden:
    return "FORBIDDEN";
  case Code::NotFound:
    return "NOTFOUND";
  case Code::Unavailable:
    return "UNAVAILABLE";
  case Code::Internal:
    return "INTERNAL";
  }
  return "INTERNAL";
}

Engine::Engine(EngineConfig cfg, NowFn now)
    : cfg_(std::move(cfg)), now_(std::move(now)), registry_(now_),
      documents_(sub_store(cfg_.durable, "documents"), now_),
      keys_(sub_store(cfg_.durable, "keys"), now_), memory_tier_(registry_),
      durable_tier_(documents_, now_), batcher_(documents_, cfg_.batch_size),
      sweeper_(registry_, cfg_.sweep_chunk_size),
      permissions_(&keys_, cfg_.static_keys, now_,
                   cfg_.permission_ttl_seconds) {
  if (!cfg_.durable.enabled) {
    log::info("durable tier disabled; memory tier only");
    return;
  }
  std::string err;
  if (!documents_.init(&err)) {
    log::error("durable document store unavailable: ", err);
    return;
  }
  if (!keys_.init(&err)) {
    log::error("permission store unavailable: ", err);
    return;
  }
  log::info("durable tier ready at ", cfg_.durable.dir, " (",
            documents_.stats().documents, " documents)");
  permissions_.seed_static_keys();
}

Engine::~Engine() {
  stop_background();
  batcher_.flush();
}

Status Engine::authorize(const std::string &token, AccessSet *out) {
  auto access = permissions_.resolve(token);
  if (!access.has_value())
    return Status::error(Code::Unauthenticated, "invalid or inactive token");
  if (out)
    *out = std::move(*access);
  return Status::success();
}

ITier *Engine::tier_for(Tier tier) {
  if (tier == Tier::Memory)
    return &memory_tier_;
  if (!durable_tier_.available())
    return nullptr;
  return &durable_tier_;
}

std::int64_t Engine::next_write_cursor(std::size_t count) {
  std::lock_guard<std::mutex> lk(cursor_mu_);
  const auto first = std::max(to_epoch_ms(now_()), last_write_cursor_ + 1);
  last_write_cursor_ = first + static_cast<std::int64_t>(count) - 1;
  return first;
}

Status Engine::set(const AccessSet &access, const SetRequest &req) {
  if (!access.allows(req.ns))
    return forbidden(req.ns);
  ITier *tier = tier_for(req.persist ? Tier::Durable : Tier::Memory);
  if (!tier)
    return Status::error(Code::Unavailable, "durable tier not connected");
  tier->write(WriteRequest{req.ns, req.key, req.data, req.ttl_seconds},
              next_write_cursor());
  return Status::success();
}

Status Engine::get(const AccessSet &access, const std::string &ns,
                   const std::string &key, Tier tier,
                   std::optional<Json> *out) {
  if (!access.allows(ns))
    return forbidden(ns);
  ITier *t = tier_for(tier);
  if (!t)
    return Status::error(Code::Unavailable, "durable tier not connected");
  auto v = t->read(ns, key);
  if (out)
    *out = std::move(v);
  return Status::success();
}

Status Engine::del(const AccessSet &access, const std::string &ns,
                   const std::string &key, Tier tier, bool *removed) {
  if (!access.allows(ns))
    return forbidden(ns);
  ITier *t = tier_for(tier);
  if (!t)
    return Status::error(Code::Unavailable, "durable tier not connected");
  const bool r = t->remove(ns, key);
  if (removed)
    *removed = r;
  return Status::success();
}

Status Engine::list(const AccessSet &access, const std::string &ns,
                    const RecencyQuery &q, Tier tier, PageResult *out) {
  if (!access.allows(ns))
    return forbidden(ns);
  if (q.page_size == 0 || q.page_size > cfg_.max_page_size)
    return Status::error(Code::BadRequest, "page size out of range");
  ITier *t = tier_for(tier);
  if (!t)
    return Status::error(Code::Unavailable, "durable tier not connected");
  *out = t->list_by_recency(ns, q);
  return Status::success();
}

Status Engine::sorted(const AccessSet &access, const std::string &ns,
                      const SortedQuery &q, Tier tier, PageResult *out) {
  if (!access.allows(ns))
    return forbidden(ns);
  if (q.field.empty())
    return Status::error(Code::BadRequest, "sort field required");
  if (q.page_size == 0 || q.page_size > cfg_.max_page_size)
    return Status::error(Code::BadRequest, "page size out of range");
  ITier *t = tier_for(tier);
  if (!t)
    return Status::error(Code::Unavailable, "durable tier not connected");
  *out = t->list_by_field(ns, q);
  return Status::success();
}

Status Engine::rank(const AccessSet &access, const std::string &ns,
                    const std::string &key, const RankQuery &q, Tier tier,
                    RankResult *out) {
  if (!access.allows(ns))
    return forbidden(ns);
  if (q.field.empty())
    return Status::error(Code::BadRequest, "rank field required");
  ITier *t = tier_for(tier);
  if (!t)
    return Status::error(Code::Unavailable, "durable tier not connected");
  auto r = t->rank(ns, key, q);
  switch (r.outcome) {
  case RankResult::Outcome::NotFound:
    return Status::error(Code::NotFound, "document not found");
  case RankResult::Outcome::FieldMissing:
    return Status::error(Code::BadRequest,
                         "document has no value for field " + q.field);
  case RankResult::Outcome::Found:
    break;
  }
  *out = std::move(r);
  return Status::success();
}

Status Engine::check_batch(const AccessSet &access,
                           const std::vector<WriteRequest> &items) const {
  if (items.empty())
    return Status::error(Code::BadRequest, "empty batch");
  for (const auto &item : items)
    if (!access.allows(item.ns))
      return forbidden(item.ns);
  return Status::success();
}

Status Engine::batch_set(const AccessSet &access,
                         const std::vector<WriteRequest> &items, bool persist,
                         BulkWriteResult *out) {
  auto st = check_batch(access, items);
  if (!st.ok())
    return st;
  ITier *t = tier_for(persist ? Tier::Durable : Tier::Memory);
  if (!t)
    return Status::error(Code::Unavailable, "durable tier not connected");
  auto result = t->write_many(items, next_write_cursor(items.size()));
  if (!result.ok())
    log::warn("batch write: ", result.failed, " of ", items.size(),
              " documents failed");
  if (out)
    *out = std::move(result);
  return Status::success();
}

Status Engine::batch_buffered(const AccessSet &access,
                              const std::vector<WriteRequest> &items) {
  auto st = check_batch(access, items);
  if (!st.ok())
    return st;
  if (!durable_tier_.available())
    return Status::error(Code::Unavailable, "durable tier not connected");
  const auto first = next_write_cursor(items.size());
  const auto now = now_();
  std::vector<Document> docs;
  docs.reserve(items.size());
  for (const auto &item : items)
    docs.push_back(make_document(
        item, first + static_cast<std::int64_t>(docs.size()), now));
  batcher_.enqueue_many(std::move(docs));
  return Status::success();
}

std::size_t Engine::expire_durable_now() {
  if (!durable_tier_.available())
    return 0;
  const auto removed = documents_.erase_expired(cfg_.durable_expiry_per_run);
  keys_.erase_expired(cfg_.durable_expiry_per_run);
  documents_.maybe_compact();
  keys_.maybe_compact();
  if (removed > 0)
    log::debug("durable expiry removed ", removed, " documents");
  return removed;
}

void Engine::start_background() {
  if (!sweep_task_) {
    sweep_task_ = std::make_unique<PeriodicTask>(
        "sweep", cfg_.sweep_interval, [this] { sweeper_.sweep_once(); });
    flush_task_ = std::make_unique<PeriodicTask>(
        "batch-flush", cfg_.flush_interval, [this] { batcher_.flush(); });
    expiry_task_ = std::make_unique<PeriodicTask>(
        "durable-expiry", cfg_.durable_expiry_interval,
        [this] { expire_durable_now(); });
  }
  sweep_task_->start();
  flush_task_->start();
  expiry_task_->start();
}

void Engine::stop_background() {
  if (sweep_task_)
    sweep_task_->stop();
  if (flush_task_)
    flush_task_->stop();
  if (expiry_task_)
    expiry_task_->stop();
}

std::string Engine::info() {
  std::ostringstream os;
  const auto b = batcher_.stats();
  os << "namespaces:" << registry_.size() << "\n";
  os << "durable_connected:" << (durable_tier_.available() ? 1 : 0) << "\n";
  os << "sweep_runs:" << sweeper_.runs() << "\n";
  os << "sweep_entries_pruned:" << sweeper_.entries_pruned() << "\n";
  os << "sweep_namespaces_removed:" << sweeper_.namespaces_removed() << "\n";
  os << "batch_pending:" << b.pending << "\n";
  os << "batch_enqueued:" << b.enqueued << "\n";
  os << "batch_flushed:" << b.flushed << "\n";
  os << "batch_dropped:" << b.dropped << "\n";
  os << "batch_flushes:" << b.batches << "\n";
  os << "permission_cache_entries:" << permissions_.cached() << "\n";
  if (durable_tier_.available()) {
    const auto s = documents_.stats();
    os << "durable_documents:" << s.documents << "\n";
    os << "durable_live_bytes:" << s.live_bytes << "\n";
    os << "durable_segment_bytes:" << s.segment_bytes << "\n";
    os << "durable_upserts:" << s.upserts << "\n";
    os << "durable_deletes:" << s.deletes << "\n";
    os << "durable_expired_removed:" << s.expired_removed << "\n";
    os << "durable_gc_runs:" << s.gc_runs << "\n";
    os << "durable_gc_bytes_reclaimed:" << s.gc_bytes_reclaimed << "\n";
    os << "durable_index_rebuild_ms:" << s.index_rebuild_ms << "\n";
  }
  return os.str();
}

} // namespace tempo_cache
