// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "justfmt/casefmt/case_style.h"

namespace justfmt::casefmt
{
  std::string_view to_string(CaseStyle style)
  {
    switch (style)
    {
      case CaseStyle::snake:
        return "snake";
      case CaseStyle::kebab:
        return "kebab";
      case CaseStyle::camel:
        return "camel";
      case CaseStyle::pascal:
        return "pascal";
      case CaseStyle::screaming_snake:
        return "screaming_snake";
      case CaseStyle::train:
        return "train";
      case CaseStyle::flat:
        return "flat";
      case CaseStyle::dot:
        return "dot";
      case CaseStyle::title:
        return "title";
      case CaseStyle::lower:
        return "lower";
      case CaseStyle::upper:
        return "upper";
    }

    return "unknown";
  }

  std::optional<CaseStyle> parse_case_style(std::string_view name)
  {
    for (const auto style : all_case_styles)
    {
      if (to_string(style) == name)
      {
        return style;
      }
    }

    return std::nullopt;
  }

  bool preserves_boundaries(CaseStyle style)
  {
    return style != CaseStyle::flat;
  }
}
