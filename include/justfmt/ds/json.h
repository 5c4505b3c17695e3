// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "justfmt/ds/logger.h"

#define FMT_HEADER_ONLY
#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

class JsonParseError : public std::invalid_argument
{
public:
  std::vector<std::string> pointer_elements = {};

  using std::invalid_argument::invalid_argument;

  std::string pointer() const
  {
    return fmt::format(
      "#/{}",
      fmt::join(pointer_elements.crbegin(), pointer_elements.crend(), "/"));
  }

  std::string describe() const
  {
    return fmt::format("At {}: {}", pointer(), what());
  }
};

// FOREACH macro machinery for counting args

// -Wpedantic flags token pasting of __VA_ARGS__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"

#define __FOR_JSON_COUNT_NN(_0, _1, _2, _3, _4, _5, _6, _7, _8, _9, _10, N, ...) \
  _FOR_JSON_##N
#define _FOR_JSON_COUNT_NN_WITH_0(...) \
  __FOR_JSON_COUNT_NN(__VA_ARGS__, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1, 0)

#define _FOR_JSON_1(POP_N) _FOR_JSON_1_##POP_N
#define _FOR_JSON_2(POP_N) _FOR_JSON_2_##POP_N
#define _FOR_JSON_3(POP_N) _FOR_JSON_3_##POP_N
#define _FOR_JSON_4(POP_N) _FOR_JSON_4_##POP_N
#define _FOR_JSON_5(POP_N) _FOR_JSON_5_##POP_N
#define _FOR_JSON_6(POP_N) _FOR_JSON_6_##POP_N
#define _FOR_JSON_7(POP_N) _FOR_JSON_7_##POP_N
#define _FOR_JSON_8(POP_N) _FOR_JSON_8_##POP_N
#define _FOR_JSON_9(POP_N) _FOR_JSON_9_##POP_N
#define _FOR_JSON_10(POP_N) _FOR_JSON_10_##POP_N

// FOREACH macro machinery for forwarding to single arg macros
#define _FOR_JSON_1_POP1(FUNC, TYPE, ARG1) _FOR_JSON_FINAL(FUNC, TYPE, ARG1)
#define _FOR_JSON_2_POP1(FUNC, TYPE, ARG1, ...) \
  _FOR_JSON_NEXT(FUNC, TYPE, ARG1) \
  _FOR_JSON_1_POP1(FUNC, TYPE, ##__VA_ARGS__)
#define _FOR_JSON_3_POP1(FUNC, TYPE, ARG1, ...) \
  _FOR_JSON_NEXT(FUNC, TYPE, ARG1) \
  _FOR_JSON_2_POP1(FUNC, TYPE, ##__VA_ARGS__)
#define _FOR_JSON_4_POP1(FUNC, TYPE, ARG1, ...) \
  _FOR_JSON_NEXT(FUNC, TYPE, ARG1) \
  _FOR_JSON_3_POP1(FUNC, TYPE, ##__VA_ARGS__)
#define _FOR_JSON_5_POP1(FUNC, TYPE, ARG1, ...) \
  _FOR_JSON_NEXT(FUNC, TYPE, ARG1) \
  _FOR_JSON_4_POP1(FUNC, TYPE, ##__VA_ARGS__)
#define _FOR_JSON_6_POP1(FUNC, TYPE, ARG1, ...) \
  _FOR_JSON_NEXT(FUNC, TYPE, ARG1) \
  _FOR_JSON_5_POP1(FUNC, TYPE, ##__VA_ARGS__)
#define _FOR_JSON_7_POP1(FUNC, TYPE, ARG1, ...) \
  _FOR_JSON_NEXT(FUNC, TYPE, ARG1) \
  _FOR_JSON_6_POP1(FUNC, TYPE, ##__VA_ARGS__)
#define _FOR_JSON_8_POP1(FUNC, TYPE, ARG1, ...) \
  _FOR_JSON_NEXT(FUNC, TYPE, ARG1) \
  _FOR_JSON_7_POP1(FUNC, TYPE, ##__VA_ARGS__)
#define _FOR_JSON_9_POP1(FUNC, TYPE, ARG1, ...) \
  _FOR_JSON_NEXT(FUNC, TYPE, ARG1) \
  _FOR_JSON_8_POP1(FUNC, TYPE, ##__VA_ARGS__)
#define _FOR_JSON_10_POP1(FUNC, TYPE, ARG1, ...) \
  _FOR_JSON_NEXT(FUNC, TYPE, ARG1) \
  _FOR_JSON_9_POP1(FUNC, TYPE, ##__VA_ARGS__)

// Forwarders for macros produced by the machinery above
#define _FOR_JSON_NEXT(FUNC, ...) FUNC##_FOR_JSON_NEXT(__VA_ARGS__)
#define _FOR_JSON_FINAL(FUNC, ...) FUNC##_FOR_JSON_FINAL(__VA_ARGS__)

#define WRITE_OPTIONAL_FOR_JSON_NEXT(TYPE, FIELD) \
  { \
    if (t.FIELD != t_default.FIELD) \
    { \
      j[#FIELD] = t.FIELD; \
    } \
  }
#define WRITE_OPTIONAL_FOR_JSON_FINAL(TYPE, FIELD) \
  WRITE_OPTIONAL_FOR_JSON_NEXT(TYPE, FIELD)

#define READ_OPTIONAL_FOR_JSON_NEXT(TYPE, FIELD) \
  { \
    const auto it = j.find(#FIELD); \
    if (it != j.end()) \
    { \
      try \
      { \
        t.FIELD = it->template get<decltype(TYPE::FIELD)>(); \
      } \
      catch (JsonParseError & jpe) \
      { \
        jpe.pointer_elements.push_back(#FIELD); \
        throw; \
      } \
      catch (const nlohmann::json::exception& e) \
      { \
        JsonParseError jpe(fmt::format( \
          "Field '" #FIELD "' could not be read from {}: {}", \
          it->dump(), \
          e.what())); \
        jpe.pointer_elements.push_back(#FIELD); \
        throw jpe; \
      } \
    } \
  }
#define READ_OPTIONAL_FOR_JSON_FINAL(TYPE, FIELD) \
  READ_OPTIONAL_FOR_JSON_NEXT(TYPE, FIELD)

/** Declares to_json and from_json for option structs. Every field is
 * optional: to_json writes only the fields which differ from a
 * default-constructed instance, and from_json leaves fields which are absent
 * from the JSON object untouched. Rejected JSON is logged at FAIL before the
 * JsonParseError is rethrown.
 *
 * To use, call DECLARE_JSON_TYPE_WITH_OPTIONAL_FIELDS and
 * DECLARE_JSON_OPTIONAL_FIELDS in the namespace of the struct:
 *
 *   struct X
 *   {
 *     int a = 1;
 *     std::string b;
 *   };
 *   DECLARE_JSON_TYPE_WITH_OPTIONAL_FIELDS(X);
 *   DECLARE_JSON_OPTIONAL_FIELDS(X, a, b);
 *
 * DECLARE_JSON_TYPE_WITH_VALIDATION(X, check) additionally calls check(t)
 * once every field has been read. check should throw JsonParseError.
 */
#define DECLARE_JSON_TYPE_IMPL(TYPE, POST_FROM_JSON) \
  void to_json_optional_fields(nlohmann::json& j, const TYPE& t); \
  void from_json_optional_fields(const nlohmann::json& j, TYPE& t); \
  inline void to_json(nlohmann::json& j, const TYPE& t) \
  { \
    j = nlohmann::json::object(); \
    to_json_optional_fields(j, t); \
  } \
  inline void from_json(const nlohmann::json& j, TYPE& t) \
  { \
    try \
    { \
      if (!j.is_object()) \
      { \
        throw JsonParseError( \
          fmt::format(#TYPE " must be a JSON object, got {}", j.dump())); \
      } \
      from_json_optional_fields(j, t); \
      POST_FROM_JSON; \
    } \
    catch (const JsonParseError& jpe) \
    { \
      LOG_FAIL_FMT("Rejected " #TYPE " JSON. {}", jpe.describe()); \
      throw; \
    } \
  }

#define DECLARE_JSON_TYPE_WITH_OPTIONAL_FIELDS(TYPE) \
  DECLARE_JSON_TYPE_IMPL(TYPE, )

#define DECLARE_JSON_TYPE_WITH_VALIDATION(TYPE, VALIDATE) \
  DECLARE_JSON_TYPE_IMPL(TYPE, VALIDATE(t))

#define DECLARE_JSON_OPTIONAL_FIELDS(TYPE, ...) \
  inline void to_json_optional_fields(nlohmann::json& j, const TYPE& t) \
  { \
    const TYPE t_default{}; \
    _FOR_JSON_COUNT_NN_WITH_0(DUMMY, ##__VA_ARGS__) \
    (POP1)(WRITE_OPTIONAL, TYPE, ##__VA_ARGS__) \
  } \
  inline void from_json_optional_fields(const nlohmann::json& j, TYPE& t) \
  { \
    _FOR_JSON_COUNT_NN_WITH_0(DUMMY, ##__VA_ARGS__) \
    (POP1)(READ_OPTIONAL, TYPE, ##__VA_ARGS__) \
  }

#pragma clang diagnostic pop

// Enum conversion, based on NLOHMANN_JSON_SERIALIZE_ENUM, but less permissive
// (throws on unknown JSON values)
#define DECLARE_JSON_ENUM(TYPE, ...) \
  template <typename BasicJsonType> \
  inline void to_json(BasicJsonType& j, const TYPE& e) \
  { \
    static_assert(std::is_enum<TYPE>::value, #TYPE " must be an enum!"); \
    static const std::pair<TYPE, BasicJsonType> m[] = __VA_ARGS__; \
    auto it = std::find_if( \
      std::begin(m), \
      std::end(m), \
      [e](const std::pair<TYPE, BasicJsonType>& ej_pair) -> bool { \
        return ej_pair.first == e; \
      }); \
    if (it == std::end(m)) \
    { \
      throw JsonParseError(fmt::format( \
        "Value {} in enum " #TYPE " has no specified JSON conversion", \
        (size_t)e)); \
    } \
    j = it->second; \
  } \
  template <typename BasicJsonType> \
  inline void from_json(const BasicJsonType& j, TYPE& e) \
  { \
    static_assert(std::is_enum<TYPE>::value, #TYPE " must be an enum!"); \
    static const std::pair<TYPE, BasicJsonType> m[] = __VA_ARGS__; \
    auto it = std::find_if( \
      std::begin(m), \
      std::end(m), \
      [&j](const std::pair<TYPE, BasicJsonType>& ej_pair) -> bool { \
        return ej_pair.second == j; \
      }); \
    if (it == std::end(m)) \
    { \
      throw JsonParseError( \
        fmt::format("{} is not convertible to " #TYPE, j.dump())); \
    } \
    e = it->first; \
  }
