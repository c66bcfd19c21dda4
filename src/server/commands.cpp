#include "tempo_cache/commands.hpp"

#include "tempo_cache/log.hpp"
#include "tempo_cache/query.hpp"
#include "tempo_cache/resp.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace tempo_cache {
namespace {

constexpr std::size_t kPreviewBytes = 200;

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool parse_i64(const std::string &s, std::int64_t &out) {
  if (s.empty())
    return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

bool parse_json(const std::string &text, Json &out) {
  out = Json::parse(text, nullptr, false);
  return !out.is_discarded();
}

// Cursor and default values are JSON when they parse, bare strings otherwise.
Json loose_json(const std::string &text) {
  Json j = Json::parse(text, nullptr, false);
  if (j.is_discarded())
    return Json(text);
  return j;
}

bool parse_count(const std::string &s, std::size_t max, std::size_t &out) {
  std::int64_t n = 0;
  if (!parse_i64(s, n) || n < 1 || static_cast<std::size_t>(n) > max)
    return false;
  out = static_cast<std::size_t>(n);
  return true;
}

bool valid_name(const std::string &s) { return !s.empty(); }

} // namespace

CommandHandler::CommandHandler(Engine &engine) : engine_(engine) {}

std::string CommandHandler::execute(Session &session,
                                    const std::vector<std::string> &argv) {
  ++stats_.commands;
  try {
    return dispatch(session, argv);
  } catch (const std::exception &e) {
    ++stats_.internal_errors;
    log::error("command ", argv.empty() ? std::string("?") : upper(argv[0]),
               " failed: ", e.what());
    return resp_error(code_name(Code::Internal), "internal error");
  }
}

std::string CommandHandler::reject(Code code, const std::string &msg) {
  ++stats_.rejected;
  return resp_error(code_name(code), msg);
}

std::string CommandHandler::reply(const Status &st) {
  if (st.ok())
    return resp_simple("OK");
  return reject(st.code, st.message);
}

bool CommandHandler::authenticate(Session &session, AccessSet *access,
                                  std::string *reply_out) {
  if (!session.token.has_value()) {
    *reply_out = reject(Code::Unauthenticated, "authentication required");
    return false;
  }
  auto st = engine_.authorize(*session.token, access);
  if (!st.ok()) {
    session.token.reset();
    *reply_out = reply(st);
    return false;
  }
  return true;
}

void CommandHandler::check_payload_size(const std::string &what,
                                        const std::string &raw) {
  if (raw.size() <= kLargePayloadBytes)
    return;
  ++stats_.oversized_payloads;
  log::warn("large payload for ", what, ": ", raw.size(), " bytes, preview: ",
            raw.substr(0, kPreviewBytes));
}

std::string CommandHandler::dispatch(Session &session,
                                     const std::vector<std::string> &argv) {
  if (argv.size() == 1 && argv[0] == kMalformed)
    return reject(Code::BadRequest, "malformed RESP");
  if (argv.empty())
    return reject(Code::BadRequest, "empty command");

  const auto op = upper(argv[0]);
  if (op == "PING")
    return resp_simple("PONG");
  if (op == "AUTH") {
    if (argv.size() != 2)
      return reject(Code::BadRequest, "AUTH token");
    auto st = engine_.authorize(argv[1], nullptr);
    if (!st.ok())
      return reply(st);
    session.token = argv[1];
    return resp_simple("OK");
  }

  static const char *const kAuthed[] = {"SET",    "GET",       "DEL",
                                        "LIST",   "SORTED",    "RANK",
                                        "BATCH.SET", "BATCH.BUFFERED", "INFO"};
  if (std::find(std::begin(kAuthed), std::end(kAuthed), op) ==
      std::end(kAuthed))
    return reject(Code::BadRequest, "unknown command '" + argv[0] + "'");

  AccessSet access;
  std::string denied;
  if (!authenticate(session, &access, &denied))
    return denied;

  if (op == "SET")
    return cmd_set(access, argv);
  if (op == "GET")
    return cmd_get(access, argv);
  if (op == "DEL")
    return cmd_del(access, argv);
  if (op == "LIST")
    return cmd_list(access, argv);
  if (op == "SORTED")
    return cmd_sorted(access, argv);
  if (op == "RANK")
    return cmd_rank(access, argv);
  if (op == "BATCH.SET")
    return cmd_batch(access, argv, false);
  if (op == "BATCH.BUFFERED")
    return cmd_batch(access, argv, true);
  return cmd_info();
}

std::string CommandHandler::cmd_set(const AccessSet &a,
                                    const std::vector<std::string> &argv) {
  if (argv.size() < 4)
    return reject(Code::BadRequest, "SET ns key json [TTL sec] [PERSIST]");
  SetRequest req;
  req.ns = argv[1];
  req.key = argv[2];
  req.ttl_seconds = engine_.config().default_ttl_seconds;
  if (!valid_name(req.ns) || !valid_name(req.key))
    return reject(Code::BadRequest, "namespace and key must be non-empty");
  check_payload_size("SET " + req.ns + "/" + req.key, argv[3]);
  if (!parse_json(argv[3], req.data))
    return reject(Code::BadRequest, "data must be valid JSON");

  for (std::size_t i = 4; i < argv.size(); ++i) {
    const auto opt = upper(argv[i]);
    if (opt == "TTL" && i + 1 < argv.size()) {
      if (!parse_i64(argv[++i], req.ttl_seconds))
        return reject(Code::BadRequest, "TTL must be an integer");
    } else if (opt == "PERSIST") {
      req.persist = true;
    } else {
      return reject(Code::BadRequest, "syntax error near '" + argv[i] + "'");
    }
  }
  return reply(engine_.set(a, req));
}

std::string CommandHandler::cmd_get(const AccessSet &a,
                                    const std::vector<std::string> &argv) {
  if (argv.size() < 3 || argv.size() > 4 ||
      (argv.size() == 4 && upper(argv[3]) != "DB"))
    return reject(Code::BadRequest, "GET ns key [DB]");
  const Tier tier = argv.size() == 4 ? Tier::Durable : Tier::Memory;
  std::optional<Json> value;
  auto st = engine_.get(a, argv[1], argv[2], tier, &value);
  if (!st.ok())
    return reply(st);
  return resp_json(Json{{"data", value.has_value() ? *value : Json()}});
}

std::string CommandHandler::cmd_del(const AccessSet &a,
                                    const std::vector<std::string> &argv) {
  if (argv.size() < 3 || argv.size() > 4 ||
      (argv.size() == 4 && upper(argv[3]) != "DB"))
    return reject(Code::BadRequest, "DEL ns key [DB]");
  const Tier tier = argv.size() == 4 ? Tier::Durable : Tier::Memory;
  bool removed = false;
  auto st = engine_.del(a, argv[1], argv[2], tier, &removed);
  if (!st.ok())
    return reply(st);
  return resp_integer(removed ? 1 : 0);
}

std::string CommandHandler::cmd_list(const AccessSet &a,
                                     const std::vector<std::string> &argv) {
  if (argv.size() < 2)
    return reject(Code::BadRequest, "LIST ns [CURSOR ms] [COUNT n] [DB]");
  RecencyQuery q;
  q.page_size = engine_.config().max_page_size;
  Tier tier = Tier::Memory;
  for (std::size_t i = 2; i < argv.size(); ++i) {
    const auto opt = upper(argv[i]);
    if (opt == "CURSOR" && i + 1 < argv.size()) {
      std::int64_t c = 0;
      if (!parse_i64(argv[++i], c))
        return reject(Code::BadRequest, "CURSOR must be an integer");
      q.cursor = c;
    } else if (opt == "COUNT" && i + 1 < argv.size()) {
      if (!parse_count(argv[++i], engine_.config().max_page_size, q.page_size))
        return reject(Code::BadRequest,
                      "COUNT must be between 1 and " +
                          std::to_string(engine_.config().max_page_size));
    } else if (opt == "DB") {
      tier = Tier::Durable;
    } else {
      return reject(Code::BadRequest, "syntax error near '" + argv[i] + "'");
    }
  }
  PageResult page;
  auto st = engine_.list(a, argv[1], q, tier, &page);
  if (!st.ok())
    return reply(st);
  return resp_json(query::page_to_json(page));
}

std::string CommandHandler::cmd_sorted(const AccessSet &a,
                                       const std::vector<std::string> &argv) {
  if (argv.size() < 4)
    return reject(Code::BadRequest,
                  "SORTED ns field ASC|DESC [CURSOR json] [AFTER key] "
                  "[DEFAULT json] [COUNT n] [DB]");
  SortedQuery q;
  q.field = argv[2];
  q.page_size = engine_.config().max_page_size;
  if (!query::parse_direction(argv[3], q.direction))
    return reject(Code::BadRequest, "direction must be ASC or DESC");
  Tier tier = Tier::Memory;
  for (std::size_t i = 4; i < argv.size(); ++i) {
    const auto opt = upper(argv[i]);
    if (opt == "CURSOR" && i + 1 < argv.size()) {
      q.cursor = loose_json(argv[++i]);
    } else if (opt == "AFTER" && i + 1 < argv.size()) {
      q.cursor_key = argv[++i];
    } else if (opt == "DEFAULT" && i + 1 < argv.size()) {
      q.default_value = loose_json(argv[++i]);
    } else if (opt == "COUNT" && i + 1 < argv.size()) {
      if (!parse_count(argv[++i], engine_.config().max_page_size, q.page_size))
        return reject(Code::BadRequest,
                      "COUNT must be between 1 and " +
                          std::to_string(engine_.config().max_page_size));
    } else if (opt == "DB") {
      tier = Tier::Durable;
    } else {
      return reject(Code::BadRequest, "syntax error near '" + argv[i] + "'");
    }
  }
  if (q.cursor_key.has_value() && !q.cursor.has_value())
    return reject(Code::BadRequest, "AFTER requires CURSOR");
  PageResult page;
  auto st = engine_.sorted(a, argv[1], q, tier, &page);
  if (!st.ok())
    return reply(st);
  return resp_json(query::page_to_json(page));
}

std::string CommandHandler::cmd_rank(const AccessSet &a,
                                     const std::vector<std::string> &argv) {
  if (argv.size() < 5)
    return reject(Code::BadRequest,
                  "RANK ns key field ASC|DESC [DEFAULT json] [DB]");
  RankQuery q;
  q.field = argv[3];
  if (!query::parse_direction(argv[4], q.direction))
    return reject(Code::BadRequest, "direction must be ASC or DESC");
  Tier tier = Tier::Memory;
  for (std::size_t i = 5; i < argv.size(); ++i) {
    const auto opt = upper(argv[i]);
    if (opt == "DEFAULT" && i + 1 < argv.size())
      q.default_value = loose_json(argv[++i]);
    else if (opt == "DB")
      tier = Tier::Durable;
    else
      return reject(Code::BadRequest, "syntax error near '" + argv[i] + "'");
  }
  RankResult r;
  auto st = engine_.rank(a, argv[1], argv[2], q, tier, &r);
  if (!st.ok())
    return reply(st);
  return resp_json(query::rank_to_json(argv[2], r, tier));
}

std::string CommandHandler::cmd_batch(const AccessSet &a,
                                      const std::vector<std::string> &argv,
                                      bool buffered) {
  const char *usage =
      buffered ? "BATCH.BUFFERED json-array" : "BATCH.SET json-array [PERSIST]";
  if (argv.size() < 2)
    return reject(Code::BadRequest, usage);
  bool persist = false;
  for (std::size_t i = 2; i < argv.size(); ++i) {
    if (!buffered && upper(argv[i]) == "PERSIST")
      persist = true;
    else
      return reject(Code::BadRequest, usage);
  }

  check_payload_size(upper(argv[0]), argv[1]);
  Json body;
  if (!parse_json(argv[1], body) || !body.is_array() || body.empty())
    return reject(Code::BadRequest, "batch must be a non-empty JSON array");

  std::vector<WriteRequest> items;
  items.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    const auto &item = body[i];
    const auto where = "batch item " + std::to_string(i) + ": ";
    if (!item.is_object())
      return reject(Code::BadRequest, where + "must be an object");
    auto ns = item.find("namespace");
    auto key = item.find("key");
    auto data = item.find("data");
    if (ns == item.end() || !ns->is_string() ||
        ns->get<std::string>().empty())
      return reject(Code::BadRequest, where + "namespace required");
    if (key == item.end() || !key->is_string() ||
        key->get<std::string>().empty())
      return reject(Code::BadRequest, where + "key required");
    if (data == item.end())
      return reject(Code::BadRequest, where + "data required");
    WriteRequest w;
    w.ns = ns->get<std::string>();
    w.key = key->get<std::string>();
    w.payload = *data;
    w.ttl_seconds = engine_.config().default_ttl_seconds;
    auto ttl = item.find("ttl");
    if (ttl != item.end()) {
      if (!ttl->is_number_integer())
        return reject(Code::BadRequest, where + "ttl must be an integer");
      w.ttl_seconds = ttl->get<std::int64_t>();
    }
    items.push_back(std::move(w));
  }

  if (buffered) {
    auto st = engine_.batch_buffered(a, items);
    if (!st.ok())
      return reply(st);
    return resp_integer(static_cast<long long>(items.size()));
  }
  BulkWriteResult result;
  auto st = engine_.batch_set(a, items, persist, &result);
  if (!st.ok())
    return reply(st);
  return resp_json(Json{{"applied", result.applied}, {"failed", result.failed}});
}

std::string CommandHandler::cmd_info() {
  std::ostringstream os;
  os << engine_.info();
  os << "connected_clients:" << connected_clients_ << "\n";
  os << "commands:" << stats_.commands << "\n";
  os << "rejected_requests:" << stats_.rejected << "\n";
  os << "internal_errors:" << stats_.internal_errors << "\n";
  os << "oversized_payloads:" << stats_.oversized_payloads << "\n";
  return resp_bulk(os.str());
}

} // namespace tempo_cache
