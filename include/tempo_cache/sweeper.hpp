#pragma once

#include "tempo_cache/namespace_registry.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace tempo_cache {

struct SweepReport {
  std::size_t namespaces_scanned{0};
  std::size_t entries_pruned{0};
  std::size_t namespaces_removed{0};
};

// One pass over every namespace of the memory tier: prunes expired entries
// and drops namespaces left empty. Reclaims memory only; reads never depend
// on it.
class Sweeper {
public:
  explicit Sweeper(NamespaceRegistry &registry, std::size_t chunk_size = 1000);

  SweepReport sweep_once();

  std::uint64_t runs() const { return runs_.load(); }
  std::uint64_t entries_pruned() const { return entries_pruned_.load(); }
  std::uint64_t namespaces_removed() const {
    return namespaces_removed_.load();
  }

private:
  NamespaceRegistry &registry_;
  std::size_t chunk_size_;
  std::atomic<std::uint64_t> runs_{0};
  std::atomic<std::uint64_t> entries_pruned_{0};
  std::atomic<std::uint64_t> namespaces_removed_{0};
};

} // namespace tempo_cache
