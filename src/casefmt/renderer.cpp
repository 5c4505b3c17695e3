// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "justfmt/casefmt/renderer.h"

#include "justfmt/ds/unicode.h"

#include <optional>

namespace justfmt::casefmt
{
  namespace
  {
    enum class WordCasing
    {
      Lower,
      Upper,
      Capitalized,
      // Lowercase first word, capitalized afterwards
      Camel
    };

    struct StyleRule
    {
      WordCasing casing;
      std::string_view separator;
    };

    StyleRule rule_for(CaseStyle style)
    {
      switch (style)
      {
        case CaseStyle::snake:
          return {WordCasing::Lower, "_"};
        case CaseStyle::kebab:
          return {WordCasing::Lower, "-"};
        case CaseStyle::camel:
          return {WordCasing::Camel, ""};
        case CaseStyle::pascal:
          return {WordCasing::Capitalized, ""};
        case CaseStyle::screaming_snake:
          return {WordCasing::Upper, "_"};
        case CaseStyle::train:
          return {WordCasing::Capitalized, "-"};
        case CaseStyle::flat:
          return {WordCasing::Lower, ""};
        case CaseStyle::dot:
          return {WordCasing::Lower, "."};
        case CaseStyle::title:
          return {WordCasing::Capitalized, " "};
        case CaseStyle::lower:
          return {WordCasing::Lower, " "};
        case CaseStyle::upper:
          return {WordCasing::Upper, " "};
      }

      // Unreachable for valid enumerators
      return {WordCasing::Lower, "_"};
    }

    std::string apply_casing(
      const std::string& word, WordCasing casing, bool first_word)
    {
      switch (casing)
      {
        case WordCasing::Lower:
          return unicode::to_lower(word);
        case WordCasing::Upper:
          return unicode::to_upper(word);
        case WordCasing::Capitalized:
          return capitalize(word);
        case WordCasing::Camel:
          return first_word ? unicode::to_lower(word) : capitalize(word);
      }

      return word;
    }

    bool is_number(const std::string& word)
    {
      size_t pos = 0;
      while (pos < word.size())
      {
        const auto dc = unicode::decode_next(word, pos);
        if (!dc.valid || !unicode::is_digit(dc.code_point))
        {
          return false;
        }
        pos += dc.length;
      }
      return !word.empty();
    }

    bool ends_with_letter(const std::string& word)
    {
      std::optional<char32_t> last;
      size_t pos = 0;
      while (pos < word.size())
      {
        const auto dc = unicode::decode_next(word, pos);
        last = dc.valid ? std::optional<char32_t>(dc.code_point) : std::nullopt;
        pos += dc.length;
      }
      return last.has_value() && unicode::is_letter(last.value());
    }
  }

  std::string capitalize(std::string_view word)
  {
    if (word.empty())
    {
      return {};
    }

    std::string result;
    result.reserve(word.size());

    const auto first = unicode::decode_next(word, 0);
    if (first.valid)
    {
      unicode::append_utf8(result, unicode::to_upper(first.code_point));
    }
    else
    {
      result.append(word.substr(0, first.length));
    }

    result.append(unicode::to_lower(word.substr(first.length)));
    return result;
  }

  std::string render(const WordSequence& words, CaseStyle style)
  {
    const auto rule = rule_for(style);

    std::string result;
    bool first_word = true;
    const std::string* previous = nullptr;
    for (const auto& word : words)
    {
      if (word.empty())
      {
        continue;
      }

      // A number directly after a letter is written as "v2", never "v_2".
      // Tokenizing splits it off again, so no boundary is lost.
      const bool attach_number =
        previous != nullptr && ends_with_letter(*previous) && is_number(word);
      if (!first_word && !attach_number)
      {
        result.append(rule.separator);
      }

      result.append(apply_casing(word, rule.casing, first_word));
      first_word = false;
      previous = &word;
    }

    return result;
  }
}
