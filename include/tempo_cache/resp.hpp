#pragma once

#include "tempo_cache/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tempo_cache {

inline constexpr const char *kMalformed = "__MALFORMED__";

class RespParser {
public:
  void feed(const std::string& data);
  // A complete command, nullopt while more bytes are needed, or a single
  // kMalformed element when the input cannot be parsed.
  std::optional<std::vector<std::string>> next_command();

  std::size_t buffered() const { return buffer_.size(); }

private:
  enum class Bulk { Ok, Incomplete, Invalid };
  Bulk parse_bulk_string(std::size_t& pos, std::string& out) const;
  std::vector<std::string> malformed(std::size_t consumed);
  std::string buffer_;
};

std::string resp_simple(const std::string& s);
// "-<CLASS> <message>"
std::string resp_error(const std::string& error_class, const std::string& s);
std::string resp_error(const std::string& s);
std::string resp_integer(long long v);
std::string resp_bulk(const std::string& s);
std::string resp_json(const Json& j);
std::string resp_null();
std::string resp_array(const std::vector<std::string>& items);

} // namespace tempo_cache
