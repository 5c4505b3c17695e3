// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "justfmt/casefmt/convert.h"

#include "justfmt/ds/unicode.h"

#include <doctest/doctest.h>
#include <string>
#include <vector>

#define FMT_HEADER_ONLY
#include <fmt/format.h>

using namespace justfmt::casefmt;

namespace
{
  WordSequence lowered(const WordSequence& words)
  {
    WordSequence result;
    for (const auto& word : words)
    {
      result.push_back(justfmt::unicode::to_lower(word));
    }
    return result;
  }

  const std::vector<WordSequence> sample_sequences = {
    {"http", "server", "error"},
    {"HTTP", "Server"},
    {"brew", "Coffee"},
    {"v", "2", "release"},
    {"parse", "XML", "File"},
    {"utf", "8", "decoder"},
    {"max", "retries"},
    {"single"},
    {"caf\xC3\xA9", "Latte"}};
}

TEST_CASE("Conversion examples" * doctest::test_suite("convert"))
{
  REQUIRE(convert("HTTPServerError", CaseStyle::snake) == "http_server_error");
  REQUIRE(convert("http_server_error", CaseStyle::pascal) == "HttpServerError");
  REQUIRE(convert("some-kebab-case", CaseStyle::camel) == "someKebabCase");
  REQUIRE(convert("v2_release", CaseStyle::screaming_snake) == "V2_RELEASE");
  REQUIRE(convert("already.Flat.case", CaseStyle::flat) == "alreadyflatcase");
  REQUIRE(convert("  ", CaseStyle::snake) == "");
  REQUIRE(convert("userID", CaseStyle::train) == "User-Id");
}

TEST_CASE("Empty input" * doctest::test_suite("convert"))
{
  for (const auto style : all_case_styles)
  {
    INFO(style);
    REQUIRE(convert("", style).empty());
    REQUIRE(convert("__--..", style).empty());
  }
}

TEST_CASE("Inputs in any style reach camel case" * doctest::test_suite("convert"))
{
  const std::vector<std::pair<std::string, std::string>> test_cases = {
    {"brew_coffee", "brewCoffee"},
    {"brew, coffee", "brewCoffee"},
    {"brew-coffee", "brewCoffee"},
    {"Brew.Coffee", "brewCoffee"},
    {"bRewCofFee", "bRewCofFee"},
    {"brewCoffee", "brewCoffee"},
    {"BrewCoffee", "brewCoffee"},
    {"brew.coffee", "brewCoffee"},
    {"Brew_Coffee", "brewCoffee"},
    {"BREW COFFEE", "brewCoffee"},
    {"BREW_COFFEE", "brewCoffee"},
    {"Brew-Coffee", "brewCoffee"}};

  for (const auto& test_case : test_cases)
  {
    INFO("Input: " << test_case.first);
    REQUIRE(camel_case(test_case.first) == test_case.second);
  }

  {
    INFO("Symbols can be dropped while tokenizing");
    TokenizeOptions options;
    options.drop_symbols = true;
    REQUIRE(convert("b&rewCoffee", CaseStyle::camel, options) == "brewCoffee");
  }
}

TEST_CASE("CaseFormatter" * doctest::test_suite("convert"))
{
  const CaseFormatter formatter("brewCoffee");

  REQUIRE(formatter.words() == WordSequence{"brew", "Coffee"});
  REQUIRE(formatter.to_upper_case() == "BREW COFFEE");
  REQUIRE(formatter.to_lower_case() == "brew coffee");
  REQUIRE(formatter.to_title_case() == "Brew Coffee");
  REQUIRE(formatter.to_dot_case() == "brew.coffee");
  REQUIRE(formatter.to_snake_case() == "brew_coffee");
  REQUIRE(formatter.to_kebab_case() == "brew-coffee");
  REQUIRE(formatter.to_pascal_case() == "BrewCoffee");
  REQUIRE(formatter.to_camel_case() == "brewCoffee");
  REQUIRE(formatter.to_screaming_snake_case() == "BREW_COFFEE");
  REQUIRE(formatter.to_train_case() == "Brew-Coffee");
  REQUIRE(formatter.to_flat_case() == "brewcoffee");

  {
    INFO("Built from words directly");
    const CaseFormatter from_words(WordSequence{"max", "Retries"});
    REQUIRE(from_words.to(CaseStyle::screaming_snake) == "MAX_RETRIES");
  }
}

TEST_CASE("One-shot helpers" * doctest::test_suite("convert"))
{
  REQUIRE(snake_case("brewCoffee") == "brew_coffee");
  REQUIRE(kebab_case("brew_coffee") == "brew-coffee");
  REQUIRE(camel_case("brew coffee") == "brewCoffee");
  REQUIRE(pascal_case("brewCoffee") == "BrewCoffee");
  REQUIRE(screaming_snake_case("brew.coffee") == "BREW_COFFEE");
  REQUIRE(train_case("brew_coffee") == "Brew-Coffee");
  REQUIRE(flat_case("Brew-Coffee") == "brewcoffee");
  REQUIRE(dot_case("brew_coffee") == "brew.coffee");
  REQUIRE(title_case("brew_coffee") == "Brew Coffee");
  REQUIRE(lower_case("BREW COFFEE") == "brew coffee");
  REQUIRE(upper_case("brew coffee") == "BREW COFFEE");
}

TEST_CASE("Rendering is idempotent" * doctest::test_suite("convert"))
{
  for (const auto& words : sample_sequences)
  {
    for (const auto style : all_case_styles)
    {
      if (!preserves_boundaries(style))
      {
        continue;
      }

      const auto rendered = render(words, style);
      INFO(fmt::format("{} as {}", rendered, style));
      REQUIRE(render(tokenize(rendered), style) == rendered);
    }
  }
}

TEST_CASE("Boundaries survive every style" * doctest::test_suite("convert"))
{
  for (const auto& words : sample_sequences)
  {
    const auto expected = lowered(words);

    for (const auto style : all_case_styles)
    {
      if (!preserves_boundaries(style))
      {
        continue;
      }

      const auto rendered = render(words, style);
      INFO(fmt::format("{} as {}", rendered, style));
      REQUIRE(lowered(tokenize(rendered)) == expected);
    }
  }

  {
    INFO("Flat case erases boundaries");
    REQUIRE(
      tokenize(render({"brew", "coffee"}, CaseStyle::flat)) ==
      WordSequence{"brewcoffee"});
  }
}

TEST_CASE("Case style names" * doctest::test_suite("convert"))
{
  for (const auto style : all_case_styles)
  {
    const auto name = to_string(style);
    REQUIRE(parse_case_style(name) == style);

    const nlohmann::json j = style;
    REQUIRE(j.get<std::string>() == name);
    REQUIRE(j.get<CaseStyle>() == style);
    REQUIRE(fmt::format("{}", style) == name);
  }

  REQUIRE(to_string(CaseStyle::screaming_snake) == "screaming_snake");
  REQUIRE_FALSE(parse_case_style("Snake").has_value());
  REQUIRE_FALSE(parse_case_style("").has_value());
  REQUIRE_THROWS_AS(
    nlohmann::json("sponge").get<CaseStyle>(), JsonParseError);
}
