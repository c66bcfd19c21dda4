#pragma once

#include "tempo_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tempo_cache {

// Keeps documents whose effective field value is strictly past `value` in
// `direction`; with `key` set, documents equal to `value` whose key sorts
// after it are kept as well.
struct FieldFilter {
  Json value;
  std::optional<std::string> key;
  SortDirection direction{SortDirection::Asc};
};

struct DocQuery {
  std::string ns;
  // write_cursor < cursor_below
  std::optional<std::int64_t> cursor_below;
  // When set, every matched document gets a computed sort value: the payload
  // field, or default_value when the field is missing. Documents with
  // neither are not matched.
  std::optional<std::string> field;
  std::optional<Json> default_value;
  std::optional<FieldFilter> past;
  // Ordering: by computed value (then key) when field_order is set,
  // otherwise newest write_cursor first.
  std::optional<SortDirection> field_order;
  std::size_t limit{0}; // 0 = unlimited
};

struct FoundDocument {
  Document doc;
  Json sort_value;
};

struct BulkWriteResult {
  std::size_t applied{0};
  std::size_t failed{0};
  std::vector<std::string> errors;
  bool ok() const { return failed == 0; }
};

// Document collection with a unique (ns, key) index and TTL removal on
// expire_at_ms. Expired documents are never returned.
class IDocumentStore {
public:
  virtual ~IDocumentStore() = default;

  virtual bool connected() const = 0;

  virtual bool upsert(const Document &doc, std::string *err = nullptr) = 0;
  // Unordered: a failing document does not stop the others.
  virtual BulkWriteResult bulk_upsert(const std::vector<Document> &docs) = 0;
  virtual std::optional<Document> find_one(const std::string &ns,
                                           const std::string &key) = 0;
  // Number of documents removed (0 or 1), nullopt on storage failure.
  virtual std::optional<std::size_t> remove(const std::string &ns,
                                            const std::string &key,
                                            std::string *err = nullptr) = 0;
  virtual std::vector<FoundDocument> find(const DocQuery &q) = 0;
  // Same matching as find(); ordering and limit are ignored.
  virtual std::size_t count(const DocQuery &q) = 0;
  virtual std::size_t erase_expired(std::size_t max_items) = 0;
};

} // namespace tempo_cache
