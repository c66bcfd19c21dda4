#pragma once

#include "tempo_cache/expiring_store.hpp"
#include "tempo_cache/types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tempo_cache {

using NamespaceStore = ExpiringStore<StoredValue>;

// Top-level map of namespace name -> per-namespace entry store. Namespaces
// never expire at this level; only the sweeper removes them, and only once
// they hold nothing.
class NamespaceRegistry {
public:
  explicit NamespaceRegistry(NowFn now = [] { return Clock::now(); });

  std::shared_ptr<NamespaceStore> get_or_create(const std::string &ns);
  std::shared_ptr<NamespaceStore> find(const std::string &ns);

  // True while ns still maps to store. A writer that raced a sweeper removal
  // uses this to detect that its store was detached.
  bool is_current(const std::string &ns,
                  const std::shared_ptr<NamespaceStore> &store);
  bool remove_if_empty(const std::string &ns);

  std::vector<std::string> names() const { return namespaces_.keys(); }
  std::size_t size() const { return namespaces_.keys().size(); }

private:
  NowFn now_;
  ExpiringStore<std::shared_ptr<NamespaceStore>> namespaces_;
};

} // namespace tempo_cache
