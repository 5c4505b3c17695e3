// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "justfmt/casefmt/convert.h"

namespace justfmt::casefmt
{
  std::string convert(
    std::string_view input, CaseStyle target, const TokenizeOptions& options)
  {
    return render(tokenize(input, options), target);
  }

  std::string snake_case(std::string_view input)
  {
    return convert(input, CaseStyle::snake);
  }

  std::string kebab_case(std::string_view input)
  {
    return convert(input, CaseStyle::kebab);
  }

  std::string camel_case(std::string_view input)
  {
    return convert(input, CaseStyle::camel);
  }

  std::string pascal_case(std::string_view input)
  {
    return convert(input, CaseStyle::pascal);
  }

  std::string screaming_snake_case(std::string_view input)
  {
    return convert(input, CaseStyle::screaming_snake);
  }

  std::string train_case(std::string_view input)
  {
    return convert(input, CaseStyle::train);
  }

  std::string flat_case(std::string_view input)
  {
    return convert(input, CaseStyle::flat);
  }

  std::string dot_case(std::string_view input)
  {
    return convert(input, CaseStyle::dot);
  }

  std::string title_case(std::string_view input)
  {
    return convert(input, CaseStyle::title);
  }

  std::string lower_case(std::string_view input)
  {
    return convert(input, CaseStyle::lower);
  }

  std::string upper_case(std::string_view input)
  {
    return convert(input, CaseStyle::upper);
  }
}
