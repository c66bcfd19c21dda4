#include "tempo_cache/resp.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace tempo_cache;

TEST_CASE("RESP parser handles partial feeds", "[resp]") {
  RespParser p;
  p.feed("*2\r\n$3\r\nGET\r\n$2\r\nn");
  CHECK_FALSE(p.next_command().has_value());
  p.feed("s\r\n");
  auto c = p.next_command();
  REQUIRE(c.has_value());
  REQUIRE(c->size() == 2);
  CHECK((*c)[0] == "GET");
  CHECK((*c)[1] == "ns");
  CHECK(p.buffered() == 0);
}

TEST_CASE("RESP parser returns pipelined commands in order", "[resp]") {
  RespParser p;
  p.feed("*1\r\n$4\r\nPING\r\n*1\r\n$4\r\nINFO\r\n");
  CHECK(p.next_command()->at(0) == "PING");
  CHECK(p.next_command()->at(0) == "INFO");
  CHECK_FALSE(p.next_command().has_value());
}

TEST_CASE("RESP parser flags malformed input", "[resp]") {
  RespParser negative;
  negative.feed("*1\r\n$-99\r\nBAD\r\n");
  auto n = negative.next_command();
  REQUIRE(n.has_value());
  CHECK(n->at(0) == kMalformed);
  CHECK(negative.buffered() == 0);

  RespParser inline_cmd;
  inline_cmd.feed("$3\r\nBAD\r\n");
  auto m = inline_cmd.next_command();
  REQUIRE(m.has_value());
  CHECK(m->at(0) == kMalformed);

  RespParser bad_count;
  bad_count.feed("*x\r\n");
  CHECK(bad_count.next_command()->at(0) == kMalformed);
}

TEST_CASE("RESP parser keeps JSON arguments intact", "[resp]") {
  const std::string json = "{\"score\": 10, \"tags\": [\"a\", \"b\"]}";
  RespParser p;
  p.feed("*4\r\n$3\r\nSET\r\n$2\r\nns\r\n$1\r\nk\r\n$" +
         std::to_string(json.size()) + "\r\n" + json + "\r\n");
  auto cmd = p.next_command();
  REQUIRE(cmd.has_value());
  CHECK(cmd->at(3) == json);
}

TEST_CASE("RESP parser supports large bulk string within cap", "[resp]") {
  const std::string payload(1024 * 1024, 'a');
  RespParser p;
  p.feed("*1\r\n$" + std::to_string(payload.size()) + "\r\n" + payload +
         "\r\n");
  auto cmd = p.next_command();
  REQUIRE(cmd.has_value());
  REQUIRE(cmd->size() == 1);
  CHECK((*cmd)[0].size() == payload.size());
}

TEST_CASE("RESP encoders", "[resp]") {
  CHECK(resp_simple("OK") == "+OK\r\n");
  CHECK(resp_error("bad") == "-ERR bad\r\n");
  CHECK(resp_error("FORBIDDEN", "namespace not allowed: x") ==
        "-FORBIDDEN namespace not allowed: x\r\n");
  CHECK(resp_integer(-2) == ":-2\r\n");
  CHECK(resp_bulk("abc") == "$3\r\nabc\r\n");
  CHECK(resp_json(Json{{"a", 1}}) == "$7\r\n{\"a\":1}\r\n");
  CHECK(resp_null() == "$-1\r\n");
  CHECK(resp_array({resp_integer(1), resp_null()}) == "*2\r\n:1\r\n$-1\r\n");
}
