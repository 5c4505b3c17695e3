// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include <exception>
#include <string>

namespace justfmt
{
  class justfmt_logic_error : public std::exception
  {
  public:
    justfmt_logic_error(const std::string& what_arg)
    {
      if (!what_arg.empty())
      {
        result.append(what_arg.c_str());
        result.append("\n");
      }
    }

    justfmt_logic_error() : justfmt_logic_error("") {}

    const char* what() const throw() override
    {
      return result.c_str();
    }

  private:
    std::string result;
  };
};
