#include "tempo_cache/segment_store.hpp"

#include "tempo_cache/log.hpp"
#include "tempo_cache/query.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace tempo_cache {
namespace {
#pragma pack(push, 1)
struct RecordHeader {
  std::uint32_t magic;
  std::uint32_t checksum;
  std::uint64_t seq;
  std::int64_t write_cursor;
  std::int64_t expire_at_ms;
  std::uint32_t ns_len;
  std::uint32_t key_len;
  std::uint32_t value_len;
  std::uint8_t tombstone;
  std::uint8_t reserved[3];
};
#pragma pack(pop)

constexpr std::uint32_t kMagic = 0x54434431; // TCD1
constexpr std::uint64_t kMaxRecordBody = 64ULL * 1024 * 1024;

std::uint32_t checksum32(const RecordHeader &h, const std::string &body) {
  std::uint32_t sum = 2166136261u;
  auto mix = [&](std::uint8_t b) {
    sum ^= b;
    sum *= 16777619u;
  };
  auto *p = reinterpret_cast<const std::uint8_t *>(&h);
  for (std::size_t i = 0; i < sizeof(RecordHeader); ++i) {
    if (i >= offsetof(RecordHeader, checksum) &&
        i < offsetof(RecordHeader, checksum) + sizeof(h.checksum))
      continue;
    mix(p[i]);
  }
  for (unsigned char c : body)
    mix(c);
  return sum;
}

bool write_all(int fd, const char *p, std::size_t n) {
  while (n > 0) {
    const ssize_t w = ::write(fd, p, n);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    p += w;
    n -= static_cast<std::size_t>(w);
  }
  return true;
}

bool pread_all(int fd, char *p, std::size_t n, off_t off) {
  while (n > 0) {
    const ssize_t r = ::pread(fd, p, n, off);
    if (r < 0 && errno == EINTR)
      continue;
    if (r <= 0)
      return false;
    p += r;
    n -= static_cast<std::size_t>(r);
    off += r;
  }
  return true;
}

bool fsync_dir(const std::string &dir) {
  int dfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd < 0)
    return false;
  bool ok = ::fsync(dfd) == 0;
  close(dfd);
  return ok;
}

std::size_t file_size_of(int fd) {
  struct stat st {};
  if (fstat(fd, &st) != 0)
    return 0;
  return static_cast<std::size_t>(st.st_size);
}

void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}
} // namespace

bool parse_fsync_mode(const std::string &text, FsyncMode &out) {
  if (text == "never")
    out = FsyncMode::Never;
  else if (text == "everysec")
    out = FsyncMode::EverySec;
  else if (text == "always")
    out = FsyncMode::Always;
  else
    return false;
  return true;
}

SegmentDocumentStore::SegmentDocumentStore(SegmentStoreConfig cfg, NowFn now)
    : cfg_(std::move(cfg)), now_(std::move(now)) {}

SegmentDocumentStore::~SegmentDocumentStore() {
  std::lock_guard<std::mutex> lock(mu_);
  close_read_fds();
  if (active_fd_ >= 0) {
    ::fsync(active_fd_);
    close(active_fd_);
    active_fd_ = -1;
  }
}

bool SegmentDocumentStore::init(std::string *err) {
  std::lock_guard<std::mutex> lock(mu_);
  connected_ = false;
  if (!cfg_.enabled)
    return true;
  std::error_code ec;
  std::filesystem::create_directories(cfg_.dir, ec);
  if (ec) {
    set_err(err, "cannot create " + cfg_.dir + ": " + ec.message());
    return false;
  }
  std::vector<std::uint32_t> segs;
  std::uint32_t active = 1;
  if (!load_manifest(&segs, &active)) {
    segs = {1};
    active = 1;
  }

  const auto start = std::chrono::steady_clock::now();
  close_read_fds();
  index_.clear();
  segments_.clear();
  stats_ = {};
  seq_ = 0;
  for (auto s : segs) {
    if (!scan_segment(s)) {
      set_err(err, "segment scan failed: " + seg_path(s));
      return false;
    }
  }
  if (segments_.empty())
    segments_.push_back({1, 0});

  // Tombstones and expired documents only mattered for ordering the scan.
  const auto now_ms = to_epoch_ms(now_());
  for (auto ns_it = index_.begin(); ns_it != index_.end();) {
    auto &keys = ns_it->second;
    for (auto it = keys.begin(); it != keys.end();) {
      if (it->second.tombstone || expired(it->second, now_ms))
        it = keys.erase(it);
      else
        ++it;
    }
    if (keys.empty())
      ns_it = index_.erase(ns_it);
    else
      ++ns_it;
  }

  active_segment_ = active;
  if (std::none_of(segments_.begin(), segments_.end(),
                   [&](const SegmentMeta &s) { return s.id == active; }))
    active_segment_ = segments_.back().id;
  const auto p = seg_path(active_segment_);
  active_fd_ = open(p.c_str(), O_CREAT | O_RDWR | O_APPEND, 0644);
  if (active_fd_ < 0) {
    set_err(err, "failed to open active segment " + p);
    return false;
  }
  stats_.index_rebuild_ms = static_cast<std::size_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count());
  if (!write_manifest()) {
    set_err(err, "failed to write manifest");
    return false;
  }
  connected_ = true;
  return true;
}

bool SegmentDocumentStore::connected() const {
  std::lock_guard<std::mutex> lock(mu_);
  return connected_;
}

bool SegmentDocumentStore::upsert(const Document &doc, std::string *err) {
  std::lock_guard<std::mutex> lock(mu_);
  return upsert_locked(doc, err);
}

BulkWriteResult
SegmentDocumentStore::bulk_upsert(const std::vector<Document> &docs) {
  BulkWriteResult result;
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto &doc : docs) {
    std::string err;
    if (upsert_locked(doc, &err)) {
      ++result.applied;
    } else {
      ++result.failed;
      result.errors.push_back(doc.ns + "/" + doc.key + ": " + err);
    }
  }
  return result;
}

std::optional<Document> SegmentDocumentStore::find_one(const std::string &ns,
                                                       const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!connected_)
    return std::nullopt;
  auto ns_it = index_.find(ns);
  if (ns_it == index_.end())
    return std::nullopt;
  auto it = ns_it->second.find(key);
  if (it == ns_it->second.end() || it->second.tombstone)
    return std::nullopt;
  if (expired(it->second, to_epoch_ms(now_())))
    return std::nullopt;
  Document doc;
  if (!read_document(ns, key, it->second, &doc))
    return std::nullopt;
  return doc;
}

std::optional<std::size_t>
SegmentDocumentStore::remove(const std::string &ns, const std::string &key,
                             std::string *err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!connected_) {
    set_err(err, "document store not connected");
    return std::nullopt;
  }
  auto ns_it = index_.find(ns);
  if (ns_it == index_.end())
    return 0;
  auto it = ns_it->second.find(key);
  if (it == ns_it->second.end())
    return 0;
  const bool was_live = !expired(it->second, to_epoch_ms(now_()));
  IndexEntry tomb;
  if (!append_record(ns, key, std::string(), 0, -1, true, &tomb, err))
    return std::nullopt;
  index_drop(ns, key);
  ++stats_.deletes;
  return was_live ? 1 : 0;
}

std::vector<SegmentDocumentStore::Hit>
SegmentDocumentStore::candidates_locked(const DocQuery &q) const {
  std::vector<Hit> hits;
  if (!connected_)
    return hits;
  auto ns_it = index_.find(q.ns);
  if (ns_it == index_.end())
    return hits;
  const auto now_ms = to_epoch_ms(now_());
  hits.reserve(ns_it->second.size());
  for (const auto &[key, e] : ns_it->second) {
    if (e.tombstone || expired(e, now_ms))
      continue;
    if (q.cursor_below.has_value() && e.write_cursor >= *q.cursor_below)
      continue;
    hits.push_back({key, e});
  }
  return hits;
}

std::vector<FoundDocument>
SegmentDocumentStore::materialize_locked(const DocQuery &q,
                                         const std::vector<Hit> &hits) {
  std::vector<FoundDocument> out;
  out.reserve(hits.size());
  for (const auto &hit : hits) {
    FoundDocument found;
    if (!read_document(q.ns, hit.key, hit.entry, &found.doc)) {
      log::warn("document store: unreadable record ", q.ns, "/", hit.key);
      continue;
    }
    auto value =
        query::effective_value(found.doc.payload, *q.field, q.default_value);
    if (!value.has_value())
      continue;
    if (q.past.has_value() &&
        !query::after_cursor(*value, hit.key, q.past->value, q.past->key,
                             q.past->direction))
      continue;
    found.sort_value = std::move(*value);
    out.push_back(std::move(found));
  }
  return out;
}

std::vector<FoundDocument> SegmentDocumentStore::find(const DocQuery &q) {
  std::lock_guard<std::mutex> lock(mu_);
  auto hits = candidates_locked(q);
  std::vector<FoundDocument> out;

  if (!q.field.has_value()) {
    // Ordering needs only the index; payloads are read for the returned
    // slice.
    std::sort(hits.begin(), hits.end(), [](const Hit &a, const Hit &b) {
      if (a.entry.write_cursor != b.entry.write_cursor)
        return a.entry.write_cursor > b.entry.write_cursor;
      return a.key < b.key;
    });
    if (q.limit > 0 && hits.size() > q.limit)
      hits.resize(q.limit);
    out.reserve(hits.size());
    for (const auto &hit : hits) {
      FoundDocument found;
      if (!read_document(q.ns, hit.key, hit.entry, &found.doc)) {
        log::warn("document store: unreadable record ", q.ns, "/", hit.key);
        continue;
      }
      found.sort_value = found.doc.write_cursor;
      out.push_back(std::move(found));
    }
    return out;
  }

  out = materialize_locked(q, hits);
  if (q.field_order.has_value()) {
    const auto dir = *q.field_order;
    std::sort(out.begin(), out.end(),
              [dir](const FoundDocument &a, const FoundDocument &b) {
                const int c =
                    query::directed_compare(a.sort_value, b.sort_value, dir);
                if (c != 0)
                  return c < 0;
                return a.doc.key < b.doc.key;
              });
  } else {
    std::sort(out.begin(), out.end(),
              [](const FoundDocument &a, const FoundDocument &b) {
                return a.doc.write_cursor > b.doc.write_cursor;
              });
  }
  if (q.limit > 0 && out.size() > q.limit)
    out.resize(q.limit);
  return out;
}

std::size_t SegmentDocumentStore::count(const DocQuery &q) {
  std::lock_guard<std::mutex> lock(mu_);
  auto hits = candidates_locked(q);
  if (!q.field.has_value())
    return hits.size();
  return materialize_locked(q, hits).size();
}

std::size_t SegmentDocumentStore::erase_expired(std::size_t max_items) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now_ms = to_epoch_ms(now_());
  std::size_t removed = 0;
  for (auto ns_it = index_.begin(); ns_it != index_.end();) {
    auto &keys = ns_it->second;
    for (auto it = keys.begin(); it != keys.end();) {
      if (max_items > 0 && removed >= max_items)
        break;
      if (!it->second.tombstone && expired(it->second, now_ms)) {
        it = keys.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    if (keys.empty())
      ns_it = index_.erase(ns_it);
    else
      ++ns_it;
  }
  stats_.expired_removed += removed;
  return removed;
}

bool SegmentDocumentStore::maybe_compact() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!connected_)
    return false;
  std::size_t total = 0;
  for (const auto &s : segments_)
    total += s.bytes;
  std::size_t live = 0;
  for (const auto &[_, keys] : index_)
    for (const auto &[__, e] : keys)
      live += e.record_len;
  if (total < cfg_.gc_min_bytes || total == 0)
    return false;
  const double fragmentation =
      1.0 - static_cast<double>(live) / static_cast<double>(total);
  if (fragmentation < cfg_.gc_fragmentation_threshold)
    return false;

  const auto start = std::chrono::steady_clock::now();
  std::uint32_t compact_id = 0;
  for (const auto &s : segments_)
    compact_id = std::max(compact_id, s.id);
  ++compact_id;
  const std::string compact_path = seg_path(compact_id);
  int fd = open(compact_path.c_str(), O_CREAT | O_RDWR | O_TRUNC | O_APPEND,
                0644);
  if (fd < 0) {
    log::warn("compaction: cannot open ", compact_path);
    return false;
  }

  const auto now_ms = to_epoch_ms(now_());
  std::unordered_map<std::string, KeyIndex> next_index;
  std::uint64_t offset = 0;
  bool ok = true;
  for (const auto &[ns, keys] : index_) {
    for (const auto &[key, e] : keys) {
      if (e.tombstone || expired(e, now_ms))
        continue;
      const int src = read_fd(e.segment_id);
      std::string raw(e.record_len, '\0');
      if (src < 0 ||
          !pread_all(src, raw.data(), raw.size(), static_cast<off_t>(e.offset)) ||
          !write_all(fd, raw.data(), raw.size())) {
        ok = false;
        break;
      }
      IndexEntry ne = e;
      ne.segment_id = compact_id;
      ne.offset = offset;
      next_index[ns][key] = ne;
      offset += e.record_len;
    }
    if (!ok)
      break;
  }
  if (!ok || ::fsync(fd) != 0) {
    close(fd);
    std::filesystem::remove(compact_path);
    log::warn("compaction: copy into ", compact_path, " failed");
    return false;
  }

  const auto old_segments = segments_;
  close_read_fds();
  if (active_fd_ >= 0)
    close(active_fd_);
  active_fd_ = fd;
  active_segment_ = compact_id;
  segments_ = {{compact_id, static_cast<std::size_t>(offset)}};
  index_ = std::move(next_index);
  if (!write_manifest())
    log::warn("compaction: manifest write failed");
  for (const auto &s : old_segments) {
    std::error_code ec;
    std::filesystem::remove(seg_path(s.id), ec);
  }

  ++stats_.gc_runs;
  if (total > offset)
    stats_.gc_bytes_reclaimed += total - static_cast<std::size_t>(offset);
  log::info("compaction: ", total, " -> ", offset, " bytes in ",
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start)
                .count(),
            "ms");
  return true;
}

SegmentStoreStats SegmentDocumentStore::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  SegmentStoreStats out = stats_;
  out.documents = 0;
  out.live_bytes = 0;
  for (const auto &[_, keys] : index_) {
    out.documents += keys.size();
    for (const auto &[__, e] : keys)
      out.live_bytes += e.record_len;
  }
  out.segment_bytes = 0;
  for (const auto &s : segments_)
    out.segment_bytes += s.bytes;
  return out;
}

std::string SegmentDocumentStore::seg_path(std::uint32_t id) const {
  return cfg_.dir + "/segment_" + std::to_string(id) + ".log";
}

bool SegmentDocumentStore::expired(const IndexEntry &e,
                                   std::int64_t now_ms) const {
  return e.expire_at_ms >= 0 && e.expire_at_ms < now_ms;
}

bool SegmentDocumentStore::upsert_locked(const Document &doc,
                                         std::string *err) {
  if (!connected_) {
    set_err(err, "document store not connected");
    return false;
  }
  if (doc.ns.empty() || doc.key.empty()) {
    set_err(err, "namespace and key are required");
    return false;
  }
  IndexEntry e;
  if (!append_record(doc.ns, doc.key, doc.payload.dump(), doc.write_cursor,
                     doc.expire_at_ms, false, &e, err))
    return false;
  index_put(doc.ns, doc.key, e);
  ++stats_.upserts;
  return true;
}

bool SegmentDocumentStore::append_record(const std::string &ns,
                                         const std::string &key,
                                         const std::string &payload,
                                         std::int64_t write_cursor,
                                         std::int64_t expire_at_ms,
                                         bool tombstone, IndexEntry *entry,
                                         std::string *err) {
  for (const auto &s : segments_) {
    if (s.id == active_segment_ && s.bytes >= cfg_.segment_max_bytes) {
      if (!rotate_locked(err))
        return false;
      break;
    }
  }

  RecordHeader h{};
  h.magic = kMagic;
  h.seq = ++seq_;
  h.write_cursor = write_cursor;
  h.expire_at_ms = expire_at_ms;
  h.ns_len = static_cast<std::uint32_t>(ns.size());
  h.key_len = static_cast<std::uint32_t>(key.size());
  h.value_len = static_cast<std::uint32_t>(payload.size());
  h.tombstone = tombstone ? 1 : 0;
  const std::string body = ns + key + payload;
  h.checksum = checksum32(h, body);

  std::string record(sizeof(h) + body.size(), '\0');
  std::memcpy(record.data(), &h, sizeof(h));
  std::memcpy(record.data() + sizeof(h), body.data(), body.size());

  const off_t off = lseek(active_fd_, 0, SEEK_END);
  if (off < 0 || !write_all(active_fd_, record.data(), record.size())) {
    set_err(err, "segment write failed");
    return false;
  }
  if (!sync_for_policy()) {
    set_err(err, "segment fsync failed");
    return false;
  }

  if (entry) {
    entry->segment_id = active_segment_;
    entry->offset = static_cast<std::uint64_t>(off);
    entry->record_len = static_cast<std::uint32_t>(record.size());
    entry->seq = h.seq;
    entry->write_cursor = write_cursor;
    entry->expire_at_ms = expire_at_ms;
    entry->tombstone = tombstone;
  }
  for (auto &s : segments_) {
    if (s.id == active_segment_) {
      s.bytes += record.size();
      break;
    }
  }
  return true;
}

bool SegmentDocumentStore::rotate_locked(std::string *err) {
  std::uint32_t next = 0;
  for (const auto &s : segments_)
    next = std::max(next, s.id);
  ++next;
  const auto p = seg_path(next);
  int fd = open(p.c_str(), O_CREAT | O_RDWR | O_TRUNC | O_APPEND, 0644);
  if (fd < 0) {
    set_err(err, "failed to open segment " + p);
    return false;
  }
  if (active_fd_ >= 0) {
    ::fsync(active_fd_);
    close(active_fd_);
  }
  active_fd_ = fd;
  active_segment_ = next;
  segments_.push_back({next, 0});
  if (!write_manifest()) {
    set_err(err, "failed to write manifest");
    return false;
  }
  return true;
}

bool SegmentDocumentStore::sync_for_policy() {
  if (cfg_.fsync == FsyncMode::Never)
    return true;
  if (cfg_.fsync == FsyncMode::Always)
    return ::fsync(active_fd_) == 0;
  const auto now_s = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  if (now_s != last_fsync_epoch_s_) {
    last_fsync_epoch_s_ = now_s;
    return ::fsync(active_fd_) == 0;
  }
  return true;
}

bool SegmentDocumentStore::load_manifest(std::vector<std::uint32_t> *segments,
                                         std::uint32_t *active) {
  std::ifstream in(cfg_.dir + "/manifest.txt");
  if (!in.is_open())
    return false;
  std::string line;
  try {
    while (std::getline(in, line)) {
      if (line.rfind("active=", 0) == 0)
        *active = static_cast<std::uint32_t>(std::stoul(line.substr(7)));
      if (line.rfind("segment=", 0) == 0)
        segments->push_back(
            static_cast<std::uint32_t>(std::stoul(line.substr(8))));
    }
  } catch (const std::exception &e) {
    log::warn("manifest in ", cfg_.dir, " unreadable: ", e.what());
    segments->clear();
    return false;
  }
  if (segments->empty())
    segments->push_back(*active);
  return true;
}

bool SegmentDocumentStore::write_manifest() {
  const std::string tmp = cfg_.dir + "/manifest.tmp";
  const std::string final = cfg_.dir + "/manifest.txt";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open())
      return false;
    out << "active=" << active_segment_ << "\n";
    for (const auto &s : segments_)
      out << "segment=" << s.id << "\n";
    out.flush();
  }
  int fd = open(tmp.c_str(), O_RDONLY);
  if (fd < 0)
    return false;
  bool ok = ::fsync(fd) == 0;
  close(fd);
  if (!ok)
    return false;
  if (std::rename(tmp.c_str(), final.c_str()) != 0)
    return false;
  return fsync_dir(cfg_.dir);
}

bool SegmentDocumentStore::scan_segment(std::uint32_t id) {
  const std::string path = seg_path(id);
  int fd = open(path.c_str(), O_CREAT | O_RDWR, 0644);
  if (fd < 0)
    return false;
  off_t off = 0;
  while (true) {
    RecordHeader h{};
    const ssize_t r = pread(fd, &h, sizeof(h), off);
    if (r == 0)
      break;
    bool torn = r != static_cast<ssize_t>(sizeof(h)) || h.magic != kMagic ||
                static_cast<std::uint64_t>(h.ns_len) + h.key_len +
                        h.value_len >
                    kMaxRecordBody;
    std::string body;
    if (!torn) {
      body.assign(static_cast<std::size_t>(h.ns_len) + h.key_len + h.value_len,
                  '\0');
      torn = (!body.empty() && !pread_all(fd, body.data(), body.size(),
                                          off + static_cast<off_t>(sizeof(h)))) ||
             checksum32(h, body) != h.checksum;
    }
    if (torn) {
      log::warn("segment ", path, ": truncating torn tail at offset ", off);
      if (ftruncate(fd, off) != 0)
        log::error("segment ", path, ": truncate failed");
      break;
    }
    IndexEntry e;
    e.segment_id = id;
    e.offset = static_cast<std::uint64_t>(off);
    e.record_len = static_cast<std::uint32_t>(sizeof(h) + body.size());
    e.seq = h.seq;
    e.write_cursor = h.write_cursor;
    e.expire_at_ms = h.expire_at_ms;
    e.tombstone = h.tombstone != 0;
    const std::string ns = body.substr(0, h.ns_len);
    const std::string key = body.substr(h.ns_len, h.key_len);
    auto &keys = index_[ns];
    auto it = keys.find(key);
    if (it == keys.end() || it->second.seq <= e.seq)
      keys[key] = e;
    seq_ = std::max(seq_, h.seq);
    off += static_cast<off_t>(e.record_len);
  }
  segments_.push_back({id, file_size_of(fd)});
  close(fd);
  return true;
}

bool SegmentDocumentStore::read_document(const std::string &ns,
                                         const std::string &key,
                                         const IndexEntry &e, Document *out) {
  const int fd = read_fd(e.segment_id);
  if (fd < 0)
    return false;
  RecordHeader h{};
  if (!pread_all(fd, reinterpret_cast<char *>(&h), sizeof(h),
                 static_cast<off_t>(e.offset)) ||
      h.magic != kMagic)
    return false;
  std::string body(static_cast<std::size_t>(h.ns_len) + h.key_len + h.value_len,
                   '\0');
  if (!body.empty() &&
      !pread_all(fd, body.data(), body.size(),
                 static_cast<off_t>(e.offset + sizeof(h))))
    return false;
  if (checksum32(h, body) != h.checksum)
    return false;
  auto payload = Json::parse(body.substr(h.ns_len + h.key_len), nullptr,
                             /*allow_exceptions=*/false);
  if (payload.is_discarded())
    return false;
  out->ns = ns;
  out->key = key;
  out->payload = std::move(payload);
  out->write_cursor = h.write_cursor;
  out->expire_at_ms = h.expire_at_ms;
  return true;
}

int SegmentDocumentStore::read_fd(std::uint32_t segment_id) {
  auto it = read_fds_.find(segment_id);
  if (it != read_fds_.end())
    return it->second;
  const auto p = seg_path(segment_id);
  int fd = open(p.c_str(), O_RDONLY);
  if (fd >= 0)
    read_fds_[segment_id] = fd;
  return fd;
}

void SegmentDocumentStore::close_read_fds() {
  for (const auto &[_, fd] : read_fds_)
    close(fd);
  read_fds_.clear();
}

void SegmentDocumentStore::index_put(const std::string &ns,
                                     const std::string &key,
                                     const IndexEntry &e) {
  index_[ns][key] = e;
}

void SegmentDocumentStore::index_drop(const std::string &ns,
                                      const std::string &key) {
  auto ns_it = index_.find(ns);
  if (ns_it == index_.end())
    return;
  ns_it->second.erase(key);
  if (ns_it->second.empty())
    index_.erase(ns_it);
}

} // namespace tempo_cache
