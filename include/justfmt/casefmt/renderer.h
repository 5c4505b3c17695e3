// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "justfmt/casefmt/case_style.h"
#include "justfmt/casefmt/tokenizer.h"

#include <string>
#include <string_view>

namespace justfmt::casefmt
{
  /** First character uppercased, the rest lowercased. A leading character
   * with no uppercase form (e.g. a digit) is left unchanged.
   */
  std::string capitalize(std::string_view word);

  std::string render(const WordSequence& words, CaseStyle style);
}
