#include "tempo_cache/sweeper.hpp"

#include "tempo_cache/log.hpp"

#include <thread>

namespace tempo_cache {

Sweeper::Sweeper(NamespaceRegistry &registry, std::size_t chunk_size)
    : registry_(registry), chunk_size_(chunk_size) {}

SweepReport Sweeper::sweep_once() {
  SweepReport report;
  for (const auto &ns : registry_.names()) {
    auto store = registry_.find(ns);
    ++report.namespaces_scanned;
    if (store && !store->empty())
      report.entries_pruned += store->prune(chunk_size_);
    if (registry_.remove_if_empty(ns))
      ++report.namespaces_removed;
    std::this_thread::yield();
  }
  ++runs_;
  entries_pruned_ += report.entries_pruned;
  namespaces_removed_ += report.namespaces_removed;
  log::debug("sweep: namespaces=", report.namespaces_scanned,
             " pruned=", report.entries_pruned,
             " removed=", report.namespaces_removed);
  return report;
}

} // namespace tempo_cache
