// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "justfmt/ds/json.h"

#define FMT_HEADER_ONLY
#include <array>
#include <fmt/format.h>
#include <optional>
#include <ostream>
#include <string_view>

namespace justfmt::casefmt
{
  enum class CaseStyle
  {
    snake, // brew_coffee
    kebab, // brew-coffee
    camel, // brewCoffee
    pascal, // BrewCoffee
    screaming_snake, // BREW_COFFEE
    train, // Brew-Coffee
    flat, // brewcoffee
    dot, // brew.coffee
    title, // Brew Coffee
    lower, // brew coffee
    upper // BREW COFFEE
  };

  DECLARE_JSON_ENUM(
    CaseStyle,
    {{CaseStyle::snake, "snake"},
     {CaseStyle::kebab, "kebab"},
     {CaseStyle::camel, "camel"},
     {CaseStyle::pascal, "pascal"},
     {CaseStyle::screaming_snake, "screaming_snake"},
     {CaseStyle::train, "train"},
     {CaseStyle::flat, "flat"},
     {CaseStyle::dot, "dot"},
     {CaseStyle::title, "title"},
     {CaseStyle::lower, "lower"},
     {CaseStyle::upper, "upper"}});

  static constexpr std::array<CaseStyle, 11> all_case_styles = {
    CaseStyle::snake,
    CaseStyle::kebab,
    CaseStyle::camel,
    CaseStyle::pascal,
    CaseStyle::screaming_snake,
    CaseStyle::train,
    CaseStyle::flat,
    CaseStyle::dot,
    CaseStyle::title,
    CaseStyle::lower,
    CaseStyle::upper};

  std::string_view to_string(CaseStyle style);

  /// Inverse of to_string. Names are matched exactly.
  std::optional<CaseStyle> parse_case_style(std::string_view name);

  /** Whether rendered output keeps enough information to recover the word
   * boundaries by tokenizing it again. Only flat erases them.
   */
  bool preserves_boundaries(CaseStyle style);
}

namespace std
{
  inline std::ostream& operator<<(
    std::ostream& os, justfmt::casefmt::CaseStyle s)
  {
    return os << justfmt::casefmt::to_string(s);
  }
}

FMT_BEGIN_NAMESPACE
template <>
struct formatter<justfmt::casefmt::CaseStyle>
{
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const justfmt::casefmt::CaseStyle& s, FormatContext& ctx) const
  {
    return format_to(ctx.out(), "{}", justfmt::casefmt::to_string(s));
  }
};
FMT_END_NAMESPACE
