#include <catch2/catch_test_macros.hpp>
#include "quicgate/utils.hpp"

using namespace quicgate;

TEST_CASE("HTTP date - RFC 1123 format", "[utils]") {
  // Example date from RFC 7231
  REQUIRE(format_http_date(784111777) == "Sun, 06 Nov 1994 08:49:37 GMT");
  REQUIRE(format_http_date(0) == "Thu, 01 Jan 1970 00:00:00 GMT");
}

TEST_CASE("HTTP date - now has the fixed width", "[utils]") {
  std::string now = http_date_now();
  REQUIRE(now.size() == 29);
  REQUIRE(now.substr(now.size() - 4) == " GMT");
}

TEST_CASE("trim - spaces and tabs", "[utils]") {
  REQUIRE(trim("  chat\t") == "chat");
  REQUIRE(trim("chat") == "chat");
  REQUIRE(trim(" \t ").empty());
  REQUIRE(trim("a b") == "a b");
}

TEST_CASE("split_comma_list - items are trimmed", "[utils]") {
  REQUIRE(split_comma_list("chat, superchat") == std::vector<std::string>{"chat", "superchat"});
  REQUIRE(split_comma_list("single") == std::vector<std::string>{"single"});
}

TEST_CASE("split_comma_list - empty items dropped", "[utils]") {
  REQUIRE(split_comma_list("").empty());
  REQUIRE(split_comma_list(" , ,").empty());
  REQUIRE(split_comma_list(",a,,b,") == std::vector<std::string>{"a", "b"});
}

TEST_CASE("UTF-8 - valid input", "[utils]") {
  REQUIRE(is_valid_utf8(""));
  REQUIRE(is_valid_utf8("plain ascii"));
  REQUIRE(is_valid_utf8("caf\xc3\xa9"));              // 2 bytes
  REQUIRE(is_valid_utf8("\xe2\x82\xac"));             // euro sign
  REQUIRE(is_valid_utf8("\xf0\x9f\x98\x80"));         // emoji
}

TEST_CASE("UTF-8 - invalid input", "[utils]") {
  REQUIRE_FALSE(is_valid_utf8("\xc3"));               // truncated
  REQUIRE_FALSE(is_valid_utf8("\x80"));               // lone continuation
  REQUIRE_FALSE(is_valid_utf8("\xc0\xaf"));           // overlong
  REQUIRE_FALSE(is_valid_utf8("\xed\xa0\x80"));       // surrogate
  REQUIRE_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));   // above U+10FFFF
  REQUIRE_FALSE(is_valid_utf8("\xff"));
}
