// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include <cstdint>
namespace justfmt
{
  enum class LoggerLevel : uint8_t
  {
    TRACE,
    DEBUG, // decisions made while normalising input
    INFO, // events a host application should see by default
    FAIL, // rejected input, e.g. malformed option JSON
    FATAL, // unrecoverable errors
    MAX_LOG_LEVEL
  };
}
