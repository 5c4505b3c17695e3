// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#define FMT_HEADER_ONLY
#include <atomic>
#include <fmt/format.h>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace justfmt::threading
{
  // Assign monotonic thread IDs for display in log lines
  using ThreadID = uint16_t;

  static constexpr ThreadID MAIN_THREAD_ID = 0;

  static inline std::atomic<ThreadID>& get_next_thread_id()
  {
    static std::atomic<ThreadID> next_thread_id = MAIN_THREAD_ID;
    return next_thread_id;
  }

  static inline ThreadID get_current_thread_id()
  {
    thread_local ThreadID this_thread_id = get_next_thread_id().fetch_add(1);
    return this_thread_id;
  }

  static inline std::optional<std::string>& current_thread_name()
  {
    thread_local std::optional<std::string> this_thread_name = std::nullopt;
    return this_thread_name;
  }

  static inline std::string get_current_thread_name()
  {
    auto& name = current_thread_name();
    if (!name.has_value())
    {
      name = fmt::format("{}", get_current_thread_id());
    }

    return name.value();
  }

  static inline void set_current_thread_name(std::string_view sv)
  {
    current_thread_name() = std::string(sv);
  }
}
