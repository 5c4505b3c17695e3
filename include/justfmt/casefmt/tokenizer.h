// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "justfmt/ds/json.h"

#include <string>
#include <string_view>
#include <vector>

namespace justfmt::casefmt
{
  // One token of an identifier, in its original casing (UTF-8)
  using Word = std::string;
  using WordSequence = std::vector<Word>;

  static constexpr auto default_separators = " \t-_./,";

  struct TokenizeOptions
  {
    // Every code point of this UTF-8 string splits words and is consumed
    std::string separators = default_separators;
    // Remove characters which are neither letters, digits nor separators
    // instead of keeping them inside the surrounding word
    bool drop_symbols = false;

    bool operator==(const TokenizeOptions&) const = default;
  };

  // Throws JsonParseError if separators is not valid UTF-8
  void check_separators(const TokenizeOptions& t);

  DECLARE_JSON_TYPE_WITH_VALIDATION(TokenizeOptions, check_separators);
  DECLARE_JSON_OPTIONAL_FIELDS(TokenizeOptions, separators, drop_symbols);

  /** Split input into words. Boundaries are, in order of precedence:
   * - any separator character (never part of a word)
   * - lowercase followed by uppercase: "fooBar" -> "foo", "Bar"
   * - letter followed by digit or digit followed by letter:
   *   "v2Server" -> "v", "2", "Server"
   * - the last uppercase letter of an uppercase run followed by lowercase:
   *   "HTTPServer" -> "HTTP", "Server"
   *
   * Never produces empty words. Total over all inputs, including malformed
   * UTF-8, whose bytes are kept as non-letter characters.
   */
  WordSequence tokenize(
    std::string_view input, const TokenizeOptions& options = {});
}
