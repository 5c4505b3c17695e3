// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "justfmt/casefmt/case_style.h"
#include "justfmt/casefmt/renderer.h"
#include "justfmt/casefmt/tokenizer.h"

#include <string>
#include <string_view>

namespace justfmt::casefmt
{
  /// render(tokenize(input, options), target)
  std::string convert(
    std::string_view input,
    CaseStyle target,
    const TokenizeOptions& options = {});

  /** Tokenizes once, then renders to any number of styles.
   *
   *   CaseFormatter f("brew_coffee");
   *   f.to_camel_case(); // "brewCoffee"
   *   f.to_kebab_case(); // "brew-coffee"
   */
  class CaseFormatter
  {
  public:
    explicit CaseFormatter(
      std::string_view input, const TokenizeOptions& options = {}) :
      content(tokenize(input, options))
    {}

    explicit CaseFormatter(WordSequence words) : content(std::move(words)) {}

    const WordSequence& words() const
    {
      return content;
    }

    std::string to(CaseStyle style) const
    {
      return render(content, style);
    }

    std::string to_snake_case() const
    {
      return to(CaseStyle::snake);
    }

    std::string to_kebab_case() const
    {
      return to(CaseStyle::kebab);
    }

    std::string to_camel_case() const
    {
      return to(CaseStyle::camel);
    }

    std::string to_pascal_case() const
    {
      return to(CaseStyle::pascal);
    }

    std::string to_screaming_snake_case() const
    {
      return to(CaseStyle::screaming_snake);
    }

    std::string to_train_case() const
    {
      return to(CaseStyle::train);
    }

    std::string to_flat_case() const
    {
      return to(CaseStyle::flat);
    }

    std::string to_dot_case() const
    {
      return to(CaseStyle::dot);
    }

    std::string to_title_case() const
    {
      return to(CaseStyle::title);
    }

    std::string to_lower_case() const
    {
      return to(CaseStyle::lower);
    }

    std::string to_upper_case() const
    {
      return to(CaseStyle::upper);
    }

  private:
    WordSequence content;
  };

  // One-shot helpers, with the default tokenizer options
  std::string snake_case(std::string_view input);
  std::string kebab_case(std::string_view input);
  std::string camel_case(std::string_view input);
  std::string pascal_case(std::string_view input);
  std::string screaming_snake_case(std::string_view input);
  std::string train_case(std::string_view input);
  std::string flat_case(std::string_view input);
  std::string dot_case(std::string_view input);
  std::string title_case(std::string_view input);
  std::string lower_case(std::string_view input);
  std::string upper_case(std::string_view input);
}
