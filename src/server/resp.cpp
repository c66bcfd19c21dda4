#include "tempo_cache/resp.hpp"

#include <charconv>

namespace tempo_cache {
namespace {

constexpr long kMaxArgs = 1024;
constexpr long kMaxBulk = 8 * 1024 * 1024;

bool parse_len(const std::string& s, std::size_t begin, std::size_t end, long& out) {
  if (begin >= end) return false;
  auto [ptr, ec] = std::from_chars(s.data() + begin, s.data() + end, out);
  return ec == std::errc() && ptr == s.data() + end;
}

} // namespace

void RespParser::feed(const std::string& data) { buffer_ += data; }

std::vector<std::string> RespParser::malformed(std::size_t consumed) {
  buffer_.erase(0, consumed);
  return {kMalformed};
}

std::optional<std::vector<std::string>> RespParser::next_command() {
  if (buffer_.empty()) return std::nullopt;
  auto crlf = buffer_.find("\r\n");
  if (crlf == std::string::npos) return std::nullopt;
  if (buffer_[0] != '*') return malformed(crlf + 2);

  long argc = 0;
  if (!parse_len(buffer_, 1, crlf, argc) || argc < 0 || argc > kMaxArgs)
    return malformed(crlf + 2);

  std::size_t pos = crlf + 2;
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (long i = 0; i < argc; ++i) {
    std::string token;
    switch (parse_bulk_string(pos, token)) {
    case Bulk::Incomplete:
      return std::nullopt;
    case Bulk::Invalid:
      // Drop everything buffered; the stream cannot be resynchronized.
      return malformed(buffer_.size());
    case Bulk::Ok:
      out.push_back(std::move(token));
      break;
    }
  }
  buffer_.erase(0, pos);
  return out;
}

RespParser::Bulk RespParser::parse_bulk_string(std::size_t& pos, std::string& out) const {
  if (pos >= buffer_.size()) return Bulk::Incomplete;
  if (buffer_[pos] != '$') return Bulk::Invalid;
  auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos) return Bulk::Incomplete;
  long len = 0;
  if (!parse_len(buffer_, pos + 1, crlf, len) || len < 0 || len > kMaxBulk)
    return Bulk::Invalid;
  std::size_t data_start = crlf + 2;
  std::size_t data_end = data_start + static_cast<std::size_t>(len);
  if (data_end + 2 > buffer_.size()) return Bulk::Incomplete;
  if (buffer_.compare(data_end, 2, "\r\n") != 0) return Bulk::Invalid;
  out = buffer_.substr(data_start, static_cast<std::size_t>(len));
  pos = data_end + 2;
  return Bulk::Ok;
}

std::string resp_simple(const std::string& s) { return "+" + s + "\r\n"; }
std::string resp_error(const std::string& error_class, const std::string& s) {
  return "-" + error_class + " " + s + "\r\n";
}
std::string resp_error(const std::string& s) { return resp_error("ERR", s); }
std::string resp_integer(long long v) { return ":" + std::to_string(v) + "\r\n"; }
std::string resp_bulk(const std::string& s) { return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n"; }
std::string resp_json(const Json& j) { return resp_bulk(j.dump()); }
std::string resp_null() { return "$-1\r\n"; }
std::string resp_array(const std::vector<std::string>& items) {
  std::string out = "*" + std::to_string(items.size()) + "\r\n";
  for (const auto& i : items) out += i;
  return out;
}

} // namespace tempo_cache
