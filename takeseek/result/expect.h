//
// Copyright (C) 2026 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <optional>
#include <type_traits>
#include <utility>

#include <android-base/format.h>  // IWYU pragma: export
#include <android-base/result.h>  // IWYU pragma: export

#include "takeseek/result/error_type.h"
#include "takeseek/result/result_type.h"  // IWYU pragma: export

namespace takeseek {

/**
 * Error return macros that include the location in the file in the error
 * message.
 *
 * Example usage:
 *
 *     if (offset > limit) {
 *       return TS_ERR("offset " << offset << " is past " << limit);
 *     }
 *
 * TS_ERR_KIND additionally classifies the error, so callers can tell it apart
 * from errors of the streams underneath.
 */
#define TS_ERR(MSG) (TS_STACK_TRACE_ENTRY("") << MSG)
#define TS_ERR_KIND(KIND, MSG)             \
  (::takeseek::StackTraceError(KIND).PushEntry( \
      TS_STACK_TRACE_ENTRY("") << MSG))

template <typename T>
T OutcomeDereference(std::optional<T>&& value) {
  return std::move(*value);
}

inline void OutcomeDereference(Result<void>&&) {}

template <typename T>
T OutcomeDereference(Result<T>&& result) {
  return std::move(*result);
}

template <typename T>
typename std::enable_if<std::is_convertible_v<T, bool>, T>::type
OutcomeDereference(T&& value) {
  return std::forward<T>(value);
}

inline bool TypeIsSuccess(bool value) { return value; }

template <typename T>
bool TypeIsSuccess(std::optional<T>& value) {
  return value.has_value();
}

template <typename T>
bool TypeIsSuccess(Result<T>& value) {
  return value.ok();
}

inline auto ErrorFromType(bool) { return StackTraceError(); }

template <typename T>
inline auto ErrorFromType(std::optional<T>) {
  return StackTraceError();
}

template <typename T>
auto ErrorFromType(Result<T>& value) {
  return value.error();
}

#define TS_EXPECT_OVERLOAD(_1, _2, NAME, ...) NAME

#define TS_EXPECT2(RESULT, MSG)                                           \
  ({                                                                      \
    decltype(RESULT)&& macro_intermediate_result = RESULT;                \
    if (!::takeseek::TypeIsSuccess(macro_intermediate_result)) {          \
      auto current_entry = TS_STACK_TRACE_ENTRY(#RESULT);                 \
      current_entry << MSG;                                               \
      auto error = ::takeseek::ErrorFromType(macro_intermediate_result);  \
      error.PushEntry(std::move(current_entry));                          \
      return std::move(error);                                            \
    };                                                                    \
    ::takeseek::OutcomeDereference(std::move(macro_intermediate_result)); \
  })

#define TS_EXPECT1(RESULT) TS_EXPECT2(RESULT, "")

/**
 * Error propagation macro that can be used as an expression.
 *
 * The first argument can be either a Result, an optional or a type that is
 * convertible to a boolean. A successful result evaluates to the value inside
 * the result. In the failure case the containing function returns the failing
 * Result with one more entry describing this call site, and the optional
 * second argument as its message. The kind of the original error is kept.
 *
 * This macro must be invoked only in functions that return a Result.
 *
 * Example usage:
 *
 *     Result<uint64_t> Position(Seeker& seeker) {
 *       return TS_EXPECT(seeker.SeekCur(0), "Could not query position");
 *     }
 */
#define TS_EXPECT(...) \
  TS_EXPECT_OVERLOAD(__VA_ARGS__, TS_EXPECT2, TS_EXPECT1)(__VA_ARGS__)

#define TS_EXPECTF(RESULT, MSG, ...) \
  TS_EXPECT(RESULT, fmt::format(FMT_STRING(MSG), __VA_ARGS__))

#define TS_COMPARE_EXPECT4(COMPARE_OP, LHS_RESULT, RHS_RESULT, MSG)         \
  ({                                                                        \
    auto&& lhs_macro_intermediate_result = LHS_RESULT;                      \
    auto&& rhs_macro_intermediate_result = RHS_RESULT;                      \
    bool comparison_result = lhs_macro_intermediate_result COMPARE_OP       \
        rhs_macro_intermediate_result;                                      \
    if (!comparison_result) {                                               \
      auto current_entry = TS_STACK_TRACE_ENTRY("");                        \
      current_entry << "Expected \"" << #LHS_RESULT << "\" " << #COMPARE_OP \
                    << " \"" << #RHS_RESULT << "\" but was "                \
                    << lhs_macro_intermediate_result << " vs "              \
                    << rhs_macro_intermediate_result << ". ";               \
      current_entry << MSG;                                                 \
      auto error = ::takeseek::ErrorFromType(false);                        \
      error.PushEntry(std::move(current_entry));                            \
      return std::move(error);                                              \
    };                                                                      \
    comparison_result;                                                      \
  })

#define TS_COMPARE_EXPECT3(COMPARE_OP, LHS_RESULT, RHS_RESULT) \
  TS_COMPARE_EXPECT4(COMPARE_OP, LHS_RESULT, RHS_RESULT, "")

#define TS_COMPARE_EXPECT_OVERLOAD(_1, _2, _3, _4, NAME, ...) NAME

#define TS_COMPARE_EXPECT(...)                                \
  TS_COMPARE_EXPECT_OVERLOAD(__VA_ARGS__, TS_COMPARE_EXPECT4, \
                             TS_COMPARE_EXPECT3)              \
  (__VA_ARGS__)

#define TS_EXPECT_LE(LHS_RESULT, RHS_RESULT, ...) \
  TS_COMPARE_EXPECT(<=, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define TS_EXPECT_LT(LHS_RESULT, RHS_RESULT, ...) \
  TS_COMPARE_EXPECT(<, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define TS_EXPECT_GE(LHS_RESULT, RHS_RESULT, ...) \
  TS_COMPARE_EXPECT(>=, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define TS_EXPECT_GT(LHS_RESULT, RHS_RESULT, ...) \
  TS_COMPARE_EXPECT(>, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)

}  // namespace takeseek
