#include "tempo_cache/namespace_registry.hpp"

namespace tempo_cache {

NamespaceRegistry::NamespaceRegistry(NowFn now)
    : now_(now), namespaces_(std::move(now)) {}

std::shared_ptr<NamespaceStore>
NamespaceRegistry::get_or_create(const std::string &ns) {
  return namespaces_.get_or_emplace(
      ns, [this] { return std::make_shared<NamespaceStore>(now_); });
}

std::shared_ptr<NamespaceStore> NamespaceRegistry::find(const std::string &ns) {
  auto found = namespaces_.get(ns);
  if (!found.has_value())
    return nullptr;
  return *found;
}

bool NamespaceRegistry::is_current(
    const std::string &ns, const std::shared_ptr<NamespaceStore> &store) {
  auto found = namespaces_.get(ns);
  return found.has_value() && *found == store;
}

bool NamespaceRegistry::remove_if_empty(const std::string &ns) {
  return namespaces_.erase_if(
      ns, [](const std::shared_ptr<NamespaceStore> &s) {
        return !s || s->empty();
      });
}

} // namespace tempo_cache
