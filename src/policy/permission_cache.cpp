#include "tempo_cache/permission_cache.hpp"

#include "tempo_cache/log.hpp"

#include <algorithm>

namespace tempo_cache {

AccessSet AccessSet::everything() {
  AccessSet a;
  a.wildcard = true;
  return a;
}

AccessSet AccessSet::from_json(const Json &allowed) {
  AccessSet a;
  if (!allowed.is_array())
    return a;
  for (const auto &item : allowed) {
    if (!item.is_string())
      continue;
    const auto name = item.get<std::string>();
    if (name == "*")
      a.wildcard = true;
    else
      a.namespaces.insert(name);
  }
  return a;
}

Json AccessSet::to_json() const {
  Json out = Json::array();
  if (wildcard)
    out.push_back("*");
  for (const auto &ns : namespaces)
    out.push_back(ns);
  return out;
}

PermissionCache::PermissionCache(IDocumentStore *keys_store,
                                 std::vector<std::string> static_tokens,
                                 NowFn now, std::int64_t cache_ttl_seconds)
    : keys_store_(keys_store), static_tokens_(std::move(static_tokens)),
      now_(now), cache_ttl_seconds_(cache_ttl_seconds), cache_(now) {}

bool PermissionCache::is_static(const std::string &token) const {
  return std::find(static_tokens_.begin(), static_tokens_.end(), token) !=
         static_tokens_.end();
}

std::optional<AccessSet> PermissionCache::resolve(const std::string &token) {
  if (token.empty())
    return std::nullopt;
  if (auto hit = cache_.get(token))
    return hit;

  if (keys_store_ == nullptr || !keys_store_->connected()) {
    if (is_static(token))
      return AccessSet::everything();
    return std::nullopt;
  }

  auto record = keys_store_->find_one(kKeysNamespace, token);
  if (!record.has_value())
    return std::nullopt;
  const auto &p = record->payload;
  if (!p.is_object() || !p.value("active", false))
    return std::nullopt;

  // A record without "allowed" grants every namespace.
  auto allowed = p.find("allowed");
  auto access = allowed == p.end() ? AccessSet::everything()
                                   : AccessSet::from_json(*allowed);
  cache_.set(token, access, cache_ttl_seconds_);
  return access;
}

std::optional<std::string>
PermissionCache::first_denied(const AccessSet &access,
                              const std::vector<std::string> &nss) {
  for (const auto &ns : nss)
    if (!access.allows(ns))
      return ns;
  return std::nullopt;
}

bool PermissionCache::put_record(const std::string &token,
                                 const AccessSet &access, bool active,
                                 std::string *err) {
  if (keys_store_ == nullptr || !keys_store_->connected()) {
    if (err)
      *err = "keys store not connected";
    return false;
  }
  Document doc;
  doc.ns = kKeysNamespace;
  doc.key = token;
  doc.payload = Json{{"allowed", access.to_json()}, {"active", active}};
  doc.write_cursor = to_epoch_ms(now_());
  if (!keys_store_->upsert(doc, err))
    return false;
  cache_.del(token);
  return true;
}

std::size_t PermissionCache::seed_static_keys(std::string *err) {
  if (keys_store_ == nullptr || !keys_store_->connected())
    return 0;
  std::size_t created = 0;
  for (const auto &token : static_tokens_) {
    if (token.empty() || keys_store_->find_one(kKeysNamespace, token))
      continue;
    std::string e;
    if (!put_record(token, AccessSet::everything(), true, &e)) {
      log::error("seeding static key failed: ", e);
      if (err)
        *err = e;
      continue;
    }
    ++created;
  }
  if (created > 0)
    log::info("seeded ", created, " static API keys");
  return created;
}

} // namespace tempo_cache
