// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "justfmt/path/path_format.h"

#include "justfmt/ds/logger.h"
#include "justfmt/ds/unicode.h"

#include <algorithm>
#include <iterator>
#include <vector>

namespace justfmt::path
{
  namespace
  {
    static constexpr std::string_view unfriendly_chars = "*?\"<>|";

    static constexpr char esc = '\x1b';
    static constexpr char bel = '\x07';

    bool in_range(char c, unsigned char lo, unsigned char hi)
    {
      const auto u = static_cast<unsigned char>(c);
      return u >= lo && u <= hi;
    }

    // Returns the index one past the escape sequence starting at s[pos]. An
    // unterminated sequence runs to the end of s.
    size_t skip_escape(std::string_view s, size_t pos)
    {
      ++pos;
      if (pos == s.size())
      {
        return pos;
      }

      if (s[pos] == '[')
      {
        // CSI: parameter bytes, intermediate bytes, then one final byte
        ++pos;
        while (pos < s.size() && in_range(s[pos], 0x30, 0x3F))
        {
          ++pos;
        }
        while (pos < s.size() && in_range(s[pos], 0x20, 0x2F))
        {
          ++pos;
        }
        if (pos < s.size() && in_range(s[pos], 0x40, 0x7E))
        {
          ++pos;
        }
        return pos;
      }

      if (s[pos] == ']')
      {
        // OSC: terminated by BEL or ST ("\x1b\\")
        ++pos;
        while (pos < s.size())
        {
          if (s[pos] == bel)
          {
            return pos + 1;
          }
          if (s[pos] == esc && pos + 1 < s.size() && s[pos + 1] == '\\')
          {
            return pos + 2;
          }
          ++pos;
        }
        return pos;
      }

      // Other escapes: intermediate bytes then one final byte, e.g. "\x1b(B"
      while (pos < s.size() && in_range(s[pos], 0x20, 0x2F))
      {
        ++pos;
      }
      if (pos < s.size() && in_range(s[pos], 0x30, 0x7E))
      {
        ++pos;
      }
      return pos;
    }

    std::string strip_ansi_escapes(std::string_view s)
    {
      std::string result;
      result.reserve(s.size());

      size_t pos = 0;
      while (pos < s.size())
      {
        if (s[pos] == esc)
        {
          pos = skip_escape(s, pos);
          continue;
        }
        result.push_back(s[pos]);
        ++pos;
      }
      return result;
    }

    std::string collapse_slashes(const std::string& s)
    {
      std::string result;
      result.reserve(s.size());

      char prev = '\0';
      for (const auto c : s)
      {
        if (c == '/' && prev == '/')
        {
          continue;
        }
        result.push_back(c);
        prev = c;
      }
      return result;
    }

    std::string resolve_dots(const std::string& s)
    {
      const std::filesystem::path original(s);

      // Root name and root directory can never be popped by ".."
      const auto root = original.root_path();
      const auto anchored =
        static_cast<size_t>(std::distance(root.begin(), root.end()));

      std::vector<std::filesystem::path> components;
      for (const auto& component : original)
      {
        if (components.size() < anchored)
        {
          components.push_back(component);
          continue;
        }

        const auto& native = component.native();
        if (native.empty() || native == ".")
        {
          continue;
        }

        if (native == "..")
        {
          if (components.size() > anchored)
          {
            components.pop_back();
          }
          else
          {
            LOG_DEBUG_FMT("Dropping unresolvable '..' in path {}", s);
          }
          continue;
        }

        components.push_back(component);
      }

      if (components.empty())
      {
        return ".";
      }

      std::filesystem::path result;
      for (const auto& component : components)
      {
        result /= component;
      }
      return result.generic_string();
    }
  }

  std::string format_path_str(std::string_view path)
  {
    return format_path_str_custom(path, PathFormatConfig{});
  }

  std::string format_path_str_custom(
    std::string_view path, const PathFormatConfig& config)
  {
    std::string result(path);
    const bool ends_with_slash = !result.empty() && result.back() == '/';

    if (config.strip_ansi)
    {
      result = strip_ansi_escapes(result);
    }

    if (!unicode::is_valid_utf8(result))
    {
      throw PathFormatError(
        fmt::format("Path is not valid UTF-8 after cleanup: {}", result));
    }

    if (config.escape_backslashes)
    {
      std::replace(result.begin(), result.end(), '\\', '/');
    }

    if (config.collapse_consecutive_slashes)
    {
      result = collapse_slashes(result);
    }

    if (config.strip_unfriendly_chars)
    {
      result.erase(
        std::remove_if(
          result.begin(),
          result.end(),
          [](char c) {
            return unfriendly_chars.find(c) != std::string_view::npos;
          }),
        result.end());
    }

    if (config.resolve_parent_dirs)
    {
      result = resolve_dots(result);
    }

    if (ends_with_slash && (result.empty() || result.back() != '/'))
    {
      result.push_back('/');
    }

    if (result == "./")
    {
      return {};
    }

    return result;
  }

  std::filesystem::path format_path(const std::filesystem::path& path)
  {
    return format_path_custom(path, PathFormatConfig{});
  }

  std::filesystem::path format_path_custom(
    const std::filesystem::path& path, const PathFormatConfig& config)
  {
    return std::filesystem::path(
      format_path_str_custom(path.string(), config));
  }
}
