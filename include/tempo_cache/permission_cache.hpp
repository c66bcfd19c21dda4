#pragma once

#include "tempo_cache/document_store.hpp"
#include "tempo_cache/expiring_store.hpp"
#include "tempo_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tempo_cache {

inline constexpr const char *kKeysNamespace = "api_keys";

// Namespaces a token may touch. "*" grants every namespace.
struct AccessSet {
  bool wildcard{false};
  std::set<std::string> namespaces;

  bool allows(const std::string &ns) const {
    return wildcard || namespaces.contains(ns);
  }

  static AccessSet everything();
  // Builds from a JSON array of names; any other value grants nothing.
  static AccessSet from_json(const Json &allowed);
  Json to_json() const;
};

// Resolves bearer tokens to their AccessSet. Records come from the keys
// store ({"allowed": [...], "active": bool} under kKeysNamespace) and are
// cached locally for cache_ttl_seconds; a revoked token keeps working until
// its cache entry lapses. When the keys store is unreachable, only the
// static tokens are accepted, each with the wildcard set.
class PermissionCache {
public:
  PermissionCache(IDocumentStore *keys_store,
                  std::vector<std::string> static_tokens,
                  NowFn now = [] { return Clock::now(); },
                  std::int64_t cache_ttl_seconds = 60);

  std::optional<AccessSet> resolve(const std::string &token);

  // First namespace in the list the access set does not grant.
  static std::optional<std::string>
  first_denied(const AccessSet &access, const std::vector<std::string> &nss);

  // Writes an active wildcard record for every static token that has none.
  // Returns the number of records created.
  std::size_t seed_static_keys(std::string *err = nullptr);

  bool put_record(const std::string &token, const AccessSet &access,
                  bool active, std::string *err = nullptr);

  void invalidate(const std::string &token) { cache_.del(token); }
  std::size_t cached() { return cache_.size(); }

private:
  bool is_static(const std::string &token) const;

  IDocumentStore *keys_store_;
  std::vector<std::string> static_tokens_;
  NowFn now_;
  std::int64_t cache_ttl_seconds_;
  ExpiringStore<AccessSet> cache_;
};

} // namespace tempo_cache
