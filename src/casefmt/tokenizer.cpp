// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "justfmt/casefmt/tokenizer.h"

#include "justfmt/ds/unicode.h"

#include <algorithm>
#include <optional>

namespace justfmt::casefmt
{
  using unicode::CharClass;

  void check_separators(const TokenizeOptions& t)
  {
    if (!unicode::is_valid_utf8(t.separators))
    {
      JsonParseError jpe("Separators must be valid UTF-8");
      jpe.pointer_elements.push_back("separators");
      throw jpe;
    }
  }

  namespace
  {
    std::u32string decode_separators(std::string_view separators)
    {
      std::u32string result;
      size_t pos = 0;
      while (pos < separators.size())
      {
        const auto dc = unicode::decode_next(separators, pos);
        if (dc.valid)
        {
          result.push_back(dc.code_point);
        }
        pos += dc.length;
      }
      return result;
    }

    bool is_alphabetic(CharClass c)
    {
      return c == CharClass::Upper || c == CharClass::Lower ||
        c == CharClass::UncasedLetter;
    }

    class WordBuilder
    {
    public:
      explicit WordBuilder(WordSequence& out_) : out(out_) {}

      void push(std::string_view bytes, CharClass cls)
      {
        before_last = last;
        last = cls;
        last_length = bytes.size();
        ++char_count;
        current.append(bytes);
      }

      void flush()
      {
        if (!current.empty())
        {
          out.push_back(std::move(current));
        }
        current.clear();
        last.reset();
        before_last.reset();
        last_length = 0;
        char_count = 0;
      }

      // Split off the final character as the start of a new word
      void split_last()
      {
        const auto cls = last.value();
        const auto len = last_length;

        std::string tail = current.substr(current.size() - len);
        current.resize(current.size() - len);

        flush();
        push(tail, cls);
      }

      std::optional<CharClass> previous() const
      {
        return last;
      }

      std::optional<CharClass> before_previous() const
      {
        return before_last;
      }

      size_t size() const
      {
        return char_count;
      }

    private:
      WordSequence& out;
      std::string current;
      std::optional<CharClass> last;
      std::optional<CharClass> before_last;
      size_t last_length = 0;
      size_t char_count = 0;
    };

    bool starts_new_word(CharClass prev, CharClass next)
    {
      // "fooBar"
      if (prev == CharClass::Lower && next == CharClass::Upper)
      {
        return true;
      }

      // "v2", "2nd"
      if (prev == CharClass::Digit && is_alphabetic(next))
      {
        return true;
      }
      if (is_alphabetic(prev) && next == CharClass::Digit)
      {
        return true;
      }

      return false;
    }
  }

  WordSequence tokenize(std::string_view input, const TokenizeOptions& options)
  {
    WordSequence words;
    if (input.empty())
    {
      return words;
    }

    const auto separators = decode_separators(options.separators);
    WordBuilder builder(words);

    size_t pos = 0;
    while (pos < input.size())
    {
      const auto dc = unicode::decode_next(input, pos);
      const auto bytes = input.substr(pos, dc.length);
      pos += dc.length;

      if (
        dc.valid &&
        std::find(separators.begin(), separators.end(), dc.code_point) !=
          separators.end())
      {
        builder.flush();
        continue;
      }

      const auto cls =
        dc.valid ? unicode::classify(dc.code_point) : CharClass::Other;

      if (cls == CharClass::Other && options.drop_symbols)
      {
        continue;
      }

      const auto prev = builder.previous();
      if (prev.has_value())
      {
        if (starts_new_word(prev.value(), cls))
        {
          builder.flush();
        }
        else if (
          prev.value() == CharClass::Upper && cls == CharClass::Lower &&
          builder.size() >= 2 &&
          builder.before_previous() == CharClass::Upper)
        {
          // "HTTPServer": the 'S' belongs to the next word
          builder.split_last();
        }
      }

      builder.push(bytes, cls);
    }

    builder.flush();

    return words;
  }
}
