// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "justfmt/ds/json.h"
#include "justfmt/ds/justfmt_exception.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace justfmt::path
{
  struct PathFormatConfig
  {
    // Remove ANSI escape sequences such as "\x1b[31m"
    bool strip_ansi = true;
    // Remove characters Windows does not allow in file names: * ? " < > |
    bool strip_unfriendly_chars = true;
    // Lexically resolve "." and ".." components, without touching the disk
    bool resolve_parent_dirs = true;
    // "/home//user" -> "/home/user"
    bool collapse_consecutive_slashes = true;
    // "C:\Users" -> "C:/Users"
    bool escape_backslashes = true;

    bool operator==(const PathFormatConfig&) const = default;
  };

  DECLARE_JSON_TYPE_WITH_OPTIONAL_FIELDS(PathFormatConfig);
  DECLARE_JSON_OPTIONAL_FIELDS(
    PathFormatConfig,
    strip_ansi,
    strip_unfriendly_chars,
    resolve_parent_dirs,
    collapse_consecutive_slashes,
    escape_backslashes);

  class PathFormatError : public justfmt::justfmt_logic_error
  {
  public:
    PathFormatError(const std::string& what_arg) :
      justfmt_logic_error(what_arg)
    {}
  };

  /** Normalise a path string into a platform-agnostic form using the default
   * config: separators become '/', duplicate slashes collapse, unfriendly
   * characters and ANSI escapes are removed, "." and ".." are resolved and a
   * trailing slash is preserved.
   *
   *   format_path_str("C:\\Users\\\\test") == "C:/Users/test"
   *   format_path_str("./home/file.txt") == "home/file.txt"
   *   format_path_str("./") == ""
   *
   * Throws PathFormatError if the cleaned result is not valid UTF-8.
   */
  std::string format_path_str(std::string_view path);

  std::string format_path_str_custom(
    std::string_view path, const PathFormatConfig& config);

  std::filesystem::path format_path(const std::filesystem::path& path);

  std::filesystem::path format_path_custom(
    const std::filesystem::path& path, const PathFormatConfig& config);
}
