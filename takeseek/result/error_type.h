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

#include <stddef.h>

#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <android-base/format.h>  // IWYU pragma: export
#include <android-base/result.h>  // IWYU pragma: export

namespace takeseek {

class StackTraceError;

enum class ErrorKind {
  kUnknown,
  /** The request lies outside of the range a stream is allowed to expose. */
  kUnexpectedEof,
};

std::ostream& operator<<(std::ostream&, ErrorKind);

class StackTraceEntry {
 public:
  StackTraceEntry(std::string file, size_t line, std::string function,
                  std::string expression);

  StackTraceEntry(const StackTraceEntry& other);

  StackTraceEntry(StackTraceEntry&&) = default;
  StackTraceEntry& operator=(const StackTraceEntry& other);
  StackTraceEntry& operator=(StackTraceEntry&&) = default;

  template <typename T>
  StackTraceEntry& operator<<(T&& message_ext) & {
    message_ << std::forward<T>(message_ext);
    return *this;
  }
  template <typename T>
  StackTraceEntry operator<<(T&& message_ext) && {
    message_ << std::forward<T>(message_ext);
    return std::move(*this);
  }

  operator StackTraceError() &&;
  template <typename T>
  operator android::base::expected<T, StackTraceError>() &&;

  bool HasMessage() const;
  std::string Message() const;

  /** `file.cc:12 | Function | message` */
  std::string ShortFormat() const;
  /** The short format followed by the checked expression, if any. */
  std::string LongFormat() const;

 private:
  std::string file_;
  size_t line_;
  std::string function_;
  std::string expression_;
  std::stringstream message_;
};

#define TS_STACK_TRACE_ENTRY(expression) \
  ::takeseek::StackTraceEntry(__FILE__, __LINE__, __func__, expression)

/**
 * A failure together with every call site it passed through on its way up.
 *
 * Entries are stored innermost first. The kind is decided where the error is
 * created and survives propagation through `TS_EXPECT`.
 */
class StackTraceError {
 public:
  StackTraceError() = default;
  explicit StackTraceError(ErrorKind kind) : kind_(kind) {}

  StackTraceError& PushEntry(StackTraceEntry entry) & {
    stack_.emplace_back(std::move(entry));
    return *this;
  }
  StackTraceError PushEntry(StackTraceEntry entry) && {
    stack_.emplace_back(std::move(entry));
    return std::move(*this);
  }
  const std::vector<StackTraceEntry>& Stack() const { return stack_; }
  ErrorKind Kind() const { return kind_; }

  // Messages attached to the entries, outermost first, one per line.
  std::string Message() const;
  // Every entry in the short format, outermost first.
  std::string Trace() const;
  // Rendered according to the TAKESEEK_ERROR_FORMAT environment variable.
  std::string FormatForEnv() const;

  template <typename T>
  operator android::base::expected<T, StackTraceError>() && {
    return android::base::unexpected(std::move(*this));
  }

 private:
  ErrorKind kind_ = ErrorKind::kUnknown;
  std::vector<StackTraceEntry> stack_;
};

inline StackTraceEntry::operator StackTraceError() && {
  return StackTraceError().PushEntry(std::move(*this));
}

template <typename T>
inline StackTraceEntry::operator android::base::expected<T,
                                                         StackTraceError>() && {
  return android::base::unexpected(
      StackTraceError().PushEntry(std::move(*this)));
}

std::ostream& operator<<(std::ostream&, const StackTraceError&);

}  // namespace takeseek

/**
 * `{:m}` renders only the messages, `{:v}` (the default) the full trace.
 */
template <>
struct fmt::formatter<takeseek::StackTraceError> {
 public:
  constexpr auto parse(format_parse_context& ctx)
      -> format_parse_context::iterator {
    auto it = ctx.begin();
    while (it != ctx.end() && *it != '}') {
      if (*it == 'm') {
        messages_only_ = true;
      } else if (*it == 'v') {
        messages_only_ = false;
      }
      it++;
    }
    return it;
  }

  auto format(const takeseek::StackTraceError& error,
              format_context& ctx) const -> format_context::iterator {
    return fmt::format_to(ctx.out(), "{}",
                          messages_only_ ? error.Message() : error.Trace());
  }

 private:
  bool messages_only_ = false;
};
