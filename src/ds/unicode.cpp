// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "justfmt/ds/unicode.h"

namespace justfmt::unicode
{
  namespace
  {
    bool is_continuation(unsigned char c)
    {
      return (c & 0xC0) == 0x80;
    }

    bool in_range(char32_t cp, char32_t lo, char32_t hi)
    {
      return cp >= lo && cp <= hi;
    }

    bool is_even(char32_t cp)
    {
      return (cp & 1) == 0;
    }

    template <typename F>
    std::string map_chars(std::string_view s, F&& f)
    {
      std::string out;
      out.reserve(s.size());

      size_t pos = 0;
      while (pos < s.size())
      {
        const auto dc = decode_next(s, pos);
        if (dc.valid)
        {
          append_utf8(out, f(dc.code_point));
        }
        else
        {
          out.append(s.substr(pos, dc.length));
        }
        pos += dc.length;
      }

      return out;
    }
  }

  DecodedChar decode_next(std::string_view s, size_t pos)
  {
    const DecodedChar invalid{replacement_character, 1, false};

    const auto lead = static_cast<unsigned char>(s[pos]);
    if (lead < 0x80)
    {
      return {lead, 1, true};
    }

    size_t length = 0;
    char32_t cp = 0;
    char32_t min_cp = 0;
    if ((lead & 0xE0) == 0xC0)
    {
      length = 2;
      cp = lead & 0x1F;
      min_cp = 0x80;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
      length = 3;
      cp = lead & 0x0F;
      min_cp = 0x800;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
      length = 4;
      cp = lead & 0x07;
      min_cp = 0x10000;
    }
    else
    {
      return invalid;
    }

    if (pos + length > s.size())
    {
      return invalid;
    }

    for (size_t i = 1; i < length; ++i)
    {
      const auto c = static_cast<unsigned char>(s[pos + i]);
      if (!is_continuation(c))
      {
        return invalid;
      }
      cp = (cp << 6) | (c & 0x3F);
    }

    // Reject overlong encodings, surrogates and out-of-range values
    if (cp < min_cp || cp > max_code_point || in_range(cp, 0xD800, 0xDFFF))
    {
      return invalid;
    }

    return {cp, length, true};
  }

  void append_utf8(std::string& out, char32_t cp)
  {
    if (cp > max_code_point || in_range(cp, 0xD800, 0xDFFF))
    {
      cp = replacement_character;
    }

    if (cp < 0x80)
    {
      out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool is_valid_utf8(std::string_view s)
  {
    size_t pos = 0;
    while (pos < s.size())
    {
      const auto dc = decode_next(s, pos);
      if (!dc.valid)
      {
        return false;
      }
      pos += dc.length;
    }
    return true;
  }

  char32_t to_lower(char32_t cp)
  {
    if (in_range(cp, 'A', 'Z'))
    {
      return cp + 0x20;
    }

    if (cp < 0xC0)
    {
      return cp;
    }

    // Latin-1 Supplement, skipping the multiplication sign
    if (in_range(cp, 0xC0, 0xDE) && cp != 0xD7)
    {
      return cp + 0x20;
    }

    // Latin Extended-A: mostly alternating upper/lower pairs
    if (
      (in_range(cp, 0x100, 0x12F) || in_range(cp, 0x132, 0x137) ||
       in_range(cp, 0x14A, 0x177)) &&
      is_even(cp))
    {
      return cp + 1;
    }
    if (
      (in_range(cp, 0x139, 0x148) || in_range(cp, 0x179, 0x17E)) &&
      !is_even(cp))
    {
      return cp + 1;
    }
    if (cp == 0x130)
    {
      return 'i';
    }
    if (cp == 0x178)
    {
      return 0xFF;
    }

    // Greek
    if (cp == 0x386)
    {
      return 0x3AC;
    }
    if (in_range(cp, 0x388, 0x38A))
    {
      return cp + 37;
    }
    if (cp == 0x38C)
    {
      return 0x3CC;
    }
    if (in_range(cp, 0x38E, 0x38F))
    {
      return cp + 63;
    }
    if (in_range(cp, 0x391, 0x3AB) && cp != 0x3A2)
    {
      return cp + 0x20;
    }

    // Cyrillic
    if (in_range(cp, 0x400, 0x40F))
    {
      return cp + 0x50;
    }
    if (in_range(cp, 0x410, 0x42F))
    {
      return cp + 0x20;
    }

    // Fullwidth Latin
    if (in_range(cp, 0xFF21, 0xFF3A))
    {
      return cp + 0x20;
    }

    return cp;
  }

  char32_t to_upper(char32_t cp)
  {
    if (in_range(cp, 'a', 'z'))
    {
      return cp - 0x20;
    }

    if (cp < 0xE0)
    {
      return cp;
    }

    // Latin-1 Supplement, skipping the division sign. Sharp s has no single
    // code point uppercase form and is left alone.
    if (in_range(cp, 0xE0, 0xFE) && cp != 0xF7)
    {
      return cp - 0x20;
    }
    if (cp == 0xFF)
    {
      return 0x178;
    }

    // Latin Extended-A
    if (
      (in_range(cp, 0x101, 0x12F) || in_range(cp, 0x133, 0x137) ||
       in_range(cp, 0x14B, 0x177)) &&
      !is_even(cp))
    {
      return cp - 1;
    }
    if (
      (in_range(cp, 0x13A, 0x148) || in_range(cp, 0x17A, 0x17E)) &&
      is_even(cp))
    {
      return cp - 1;
    }
    if (cp == 0x131)
    {
      return 'I';
    }
    if (cp == 0x17F)
    {
      return 'S';
    }

    // Greek
    if (cp == 0x3AC)
    {
      return 0x386;
    }
    if (in_range(cp, 0x3AD, 0x3AF))
    {
      return cp - 37;
    }
    if (cp == 0x3CC)
    {
      return 0x38C;
    }
    if (in_range(cp, 0x3CD, 0x3CE))
    {
      return cp - 63;
    }
    if (cp == 0x3C2)
    {
      return 0x3A3;
    }
    if (in_range(cp, 0x3B1, 0x3CB))
    {
      return cp - 0x20;
    }

    // Cyrillic
    if (in_range(cp, 0x430, 0x44F))
    {
      return cp - 0x20;
    }
    if (in_range(cp, 0x450, 0x45F))
    {
      return cp - 0x50;
    }

    // Fullwidth Latin
    if (in_range(cp, 0xFF41, 0xFF5A))
    {
      return cp - 0x20;
    }

    return cp;
  }

  bool is_upper(char32_t cp)
  {
    return to_lower(cp) != cp;
  }

  bool is_lower(char32_t cp)
  {
    // Lowercase letters without a simple uppercase mapping in these tables:
    // micro sign, sharp s, kra, n preceded by apostrophe, and the Greek iota
    // and upsilon with dialytika and tonos
    if (
      cp == 0xB5 || cp == 0xDF || cp == 0x138 || cp == 0x149 || cp == 0x390 ||
      cp == 0x3B0)
    {
      return true;
    }
    return to_upper(cp) != cp;
  }

  bool is_digit(char32_t cp)
  {
    return in_range(cp, '0', '9') ||
      in_range(cp, 0x660, 0x669) || // Arabic-Indic
      in_range(cp, 0x6F0, 0x6F9) || // Extended Arabic-Indic
      in_range(cp, 0x966, 0x96F) || // Devanagari
      in_range(cp, 0xFF10, 0xFF19); // Fullwidth
  }

  bool is_letter(char32_t cp)
  {
    if (is_upper(cp) || is_lower(cp))
    {
      return true;
    }

    return cp == 0xAA || cp == 0xBA || // Ordinal indicators
      in_range(cp, 0x5D0, 0x5EA) || // Hebrew
      in_range(cp, 0x620, 0x64A) || // Arabic
      in_range(cp, 0x904, 0x939) || // Devanagari
      in_range(cp, 0xE01, 0xE30) || // Thai
      in_range(cp, 0x3041, 0x3096) || // Hiragana
      in_range(cp, 0x30A1, 0x30FA) || // Katakana
      in_range(cp, 0x3400, 0x4DBF) || // CJK Extension A
      in_range(cp, 0x4E00, 0x9FFF) || // CJK Unified Ideographs
      in_range(cp, 0xAC00, 0xD7A3); // Hangul syllables
  }

  CharClass classify(char32_t cp)
  {
    if (is_digit(cp))
    {
      return CharClass::Digit;
    }
    if (is_upper(cp))
    {
      return CharClass::Upper;
    }
    if (is_lower(cp))
    {
      return CharClass::Lower;
    }
    if (is_letter(cp))
    {
      return CharClass::UncasedLetter;
    }
    return CharClass::Other;
  }

  std::string to_lower(std::string_view s)
  {
    return map_chars(s, [](char32_t cp) { return to_lower(cp); });
  }

  std::string to_upper(std::string_view s)
  {
    return map_chars(s, [](char32_t cp) { return to_upper(cp); });
  }
}
