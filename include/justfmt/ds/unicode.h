// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

/**
 * Minimal UTF-8 and code point utilities. Case mapping is the simple
 * (one-to-one) mapping for Basic Latin, Latin-1, Latin Extended-A, Greek,
 * Cyrillic and fullwidth Latin. Letters outside those blocks are uncased.
 */
namespace justfmt::unicode
{
  static constexpr char32_t replacement_character = 0xFFFD;
  static constexpr char32_t max_code_point = 0x10FFFF;

  enum class CharClass
  {
    Upper,
    Lower,
    UncasedLetter,
    Digit,
    Other
  };

  struct DecodedChar
  {
    char32_t code_point;
    // Number of input bytes consumed. Always at least 1.
    size_t length;
    // False when the input was not well-formed UTF-8. The single offending
    // byte is consumed and code_point is the replacement character.
    bool valid;
  };

  DecodedChar decode_next(std::string_view s, size_t pos);
  void append_utf8(std::string& out, char32_t cp);
  bool is_valid_utf8(std::string_view s);

  char32_t to_lower(char32_t cp);
  char32_t to_upper(char32_t cp);

  bool is_upper(char32_t cp);
  bool is_lower(char32_t cp);
  bool is_digit(char32_t cp);
  bool is_letter(char32_t cp);
  CharClass classify(char32_t cp);

  /// Map every well-formed character of s; malformed bytes are copied as-is
  std::string to_lower(std::string_view s);
  std::string to_upper(std::string_view s);
}
