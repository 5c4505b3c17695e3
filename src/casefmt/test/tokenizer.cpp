// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "justfmt/casefmt/tokenizer.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <string>

using namespace justfmt::casefmt;

TEST_CASE("Explicit separators" * doctest::test_suite("tokenizer"))
{
  REQUIRE(tokenize("brew_coffee") == WordSequence{"brew", "coffee"});
  REQUIRE(tokenize("brew-coffee") == WordSequence{"brew", "coffee"});
  REQUIRE(tokenize("brew.coffee") == WordSequence{"brew", "coffee"});
  REQUIRE(tokenize("brew/coffee") == WordSequence{"brew", "coffee"});
  REQUIRE(tokenize("brew coffee") == WordSequence{"brew", "coffee"});
  REQUIRE(tokenize("brew, coffee") == WordSequence{"brew", "coffee"});

  {
    INFO("Runs of separators never produce empty words");
    REQUIRE(
      tokenize("__brew--_.coffee  ") == WordSequence{"brew", "coffee"});
  }
}

TEST_CASE("Case transitions" * doctest::test_suite("tokenizer"))
{
  REQUIRE(tokenize("fooBar") == WordSequence{"foo", "Bar"});
  REQUIRE(tokenize("FooBar") == WordSequence{"Foo", "Bar"});
  REQUIRE(tokenize("bRewCofFee") == WordSequence{"b", "Rew", "Cof", "Fee"});

  {
    INFO("Original casing is preserved");
    REQUIRE(tokenize("BREW COFFEE") == WordSequence{"BREW", "COFFEE"});
    REQUIRE(tokenize("Brew_Coffee") == WordSequence{"Brew", "Coffee"});
  }
}

TEST_CASE("Digit transitions" * doctest::test_suite("tokenizer"))
{
  REQUIRE(tokenize("v2Server") == WordSequence{"v", "2", "Server"});
  REQUIRE(tokenize("v2_release") == WordSequence{"v", "2", "release"});
  REQUIRE(tokenize("utf8") == WordSequence{"utf", "8"});
  REQUIRE(tokenize("2ndPlace") == WordSequence{"2", "nd", "Place"});
  REQUIRE(tokenize("123") == WordSequence{"123"});
  REQUIRE(tokenize("HTTP2") == WordSequence{"HTTP", "2"});
}

TEST_CASE("Acronyms" * doctest::test_suite("tokenizer"))
{
  REQUIRE(tokenize("HTTPServer") == WordSequence{"HTTP", "Server"});
  REQUIRE(
    tokenize("HTTPServerError") == WordSequence{"HTTP", "Server", "Error"});
  REQUIRE(tokenize("parseXMLFile") == WordSequence{"parse", "XML", "File"});
  REQUIRE(tokenize("ABc") == WordSequence{"A", "Bc"});
  REQUIRE(tokenize("IO") == WordSequence{"IO"});

  {
    INFO("An acronym at the end of the input stays whole");
    REQUIRE(tokenize("getHTTP") == WordSequence{"get", "HTTP"});
  }
}

TEST_CASE("Edge cases" * doctest::test_suite("tokenizer"))
{
  REQUIRE(tokenize("").empty());
  REQUIRE(tokenize("  ").empty());
  REQUIRE(tokenize("-_./, ").empty());
  REQUIRE(tokenize("identifier") == WordSequence{"identifier"});
  REQUIRE(tokenize("x") == WordSequence{"x"});

  {
    INFO("Symbols stay inside words and do not start new ones");
    REQUIRE(tokenize("b&rewCoffee") == WordSequence{"b&rew", "Coffee"});
    REQUIRE(tokenize("a+b") == WordSequence{"a+b"});
  }

  {
    INFO("Malformed UTF-8 is kept verbatim");
    const std::string input = "ab\xFF" "cd_ef";
    const auto words = tokenize(input);
    REQUIRE(words == WordSequence{"ab\xFF" "cd", "ef"});
  }

  {
    INFO("No word is ever empty");
    for (const auto input :
         {"a", "A_", "_a_", "aB", "AB", "a1", "1a", "A1B", "HTTPServer", "x-y"})
    {
      for (const auto& word : tokenize(input))
      {
        REQUIRE_FALSE(word.empty());
      }
    }
  }
}

TEST_CASE("Unicode input" * doctest::test_suite("tokenizer"))
{
  // "caféLatte"
  REQUIRE(
    tokenize("caf\xC3\xA9Latte") == WordSequence{"caf\xC3\xA9", "Latte"});

  // "ÉtéChaud": an uppercase non-ASCII letter starts a word
  REQUIRE(
    tokenize("\xC3\x89t\xC3\xA9" "Chaud") ==
    WordSequence{"\xC3\x89t\xC3\xA9", "Chaud"});

  // "привет_мир"
  REQUIRE(
    tokenize("\xD0\xBF\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82_\xD0\xBC\xD0"
             "\xB8\xD1\x80") ==
    WordSequence{
      "\xD0\xBF\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82",
      "\xD0\xBC\xD0\xB8\xD1\x80"});

  // "10µs": the micro sign is a lowercase letter
  REQUIRE(tokenize("10\xC2\xB5s") == WordSequence{"10", "\xC2\xB5s"});

  // "中文2": uncased letters still split from digits
  REQUIRE(
    tokenize("\xE4\xB8\xAD\xE6\x96\x87" "2") ==
    WordSequence{"\xE4\xB8\xAD\xE6\x96\x87", "2"});
}

TEST_CASE("Tokenize options" * doctest::test_suite("tokenizer"))
{
  {
    INFO("Custom separators replace the defaults");
    TokenizeOptions options;
    options.separators = ":";
    REQUIRE(
      tokenize("a:b_c", options) == WordSequence{"a", "b_c"});
  }

  {
    INFO("Multi-byte separators");
    TokenizeOptions options;
    options.separators = "\xC2\xB7"; // middle dot
    REQUIRE(
      tokenize("brew\xC2\xB7" "coffee", options) ==
      WordSequence{"brew", "coffee"});
  }

  {
    INFO("Dropping symbols joins the surrounding characters");
    TokenizeOptions options;
    options.drop_symbols = true;
    REQUIRE(
      tokenize("b&rewCoffee", options) == WordSequence{"brew", "Coffee"});
    REQUIRE(tokenize("&&&", options).empty());
  }

  {
    INFO("Options round-trip through JSON");
    TokenizeOptions options;
    options.separators = "-";
    options.drop_symbols = true;

    const nlohmann::json j = options;
    REQUIRE(j["separators"] == "-");
    REQUIRE(j["drop_symbols"] == true);
    REQUIRE(j.get<TokenizeOptions>() == options);
  }

  {
    INFO("Missing fields keep their defaults");
    const auto options =
      nlohmann::json::parse(R"({"drop_symbols": true})").get<TokenizeOptions>();
    REQUIRE(options.separators == default_separators);
    REQUIRE(options.drop_symbols);
  }

  {
    INFO("Invalid option JSON is rejected");
    REQUIRE_THROWS_AS(
      nlohmann::json::parse("[]").get<TokenizeOptions>(), JsonParseError);

    try
    {
      nlohmann::json::parse(R"({"drop_symbols": "yes"})").get<TokenizeOptions>();
      FAIL("Expected a parse error");
    }
    catch (const JsonParseError& e)
    {
      REQUIRE(e.pointer() == "#/drop_symbols");
    }
  }
}
