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

#include "takeseek/result/error_type.h"

#include <stddef.h>
#include <stdlib.h>

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <android-base/format.h>
#include <fmt/ranges.h>

namespace takeseek {

std::ostream& operator<<(std::ostream& out, const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnknown:
      return out << "Unknown";
    case ErrorKind::kUnexpectedEof:
      return out << "UnexpectedEof";
  }
  return out << "ErrorKind(" << static_cast<int>(kind) << ")";
}

StackTraceEntry::StackTraceEntry(std::string file, size_t line,
                                 std::string function, std::string expression)
    : file_(std::move(file)),
      line_(line),
      function_(std::move(function)),
      expression_(std::move(expression)) {}

StackTraceEntry::StackTraceEntry(const StackTraceEntry& other)
    : file_(other.file_),
      line_(other.line_),
      function_(other.function_),
      expression_(other.expression_),
      message_(other.message_.str()) {}

StackTraceEntry& StackTraceEntry::operator=(const StackTraceEntry& other) {
  file_ = other.file_;
  line_ = other.line_;
  function_ = other.function_;
  expression_ = other.expression_;
  message_.str(other.message_.str());
  return *this;
}

bool StackTraceEntry::HasMessage() const { return !message_.str().empty(); }

std::string StackTraceEntry::Message() const { return message_.str(); }

std::string StackTraceEntry::ShortFormat() const {
  auto last_slash = file_.rfind('/');
  auto short_file =
      file_.substr(last_slash == std::string::npos ? 0 : last_slash + 1);
  return fmt::format("{}:{} | {} | {}", short_file, line_, function_,
                     message_.str());
}

std::string StackTraceEntry::LongFormat() const {
  if (expression_.empty()) {
    return ShortFormat();
  }
  return fmt::format("{}\n  for TS_EXPECT({})", ShortFormat(), expression_);
}

std::string StackTraceError::Message() const {
  std::vector<std::string> messages;
  for (auto it = stack_.rbegin(); it != stack_.rend(); it++) {
    if (it->HasMessage()) {
      messages.emplace_back(it->Message());
    }
  }
  return fmt::format("{}", fmt::join(messages, "\n"));
}

std::string StackTraceError::Trace() const {
  std::vector<std::string> lines;
  size_t index = stack_.size();
  for (auto it = stack_.rbegin(); it != stack_.rend(); it++) {
    lines.emplace_back(fmt::format("{}. {}", --index, it->LongFormat()));
  }
  return fmt::format("{}", fmt::join(lines, "\n"));
}

std::string StackTraceError::FormatForEnv() const {
  const char* error_format = getenv("TAKESEEK_ERROR_FORMAT");
  std::string fmt_str = error_format == nullptr ? "v" : error_format;
  if (fmt_str != "m" && fmt_str != "v") {
    fmt_str = "v";
  }
  return fmt::format(fmt::runtime("{:" + fmt_str + "}"), *this);
}

std::ostream& operator<<(std::ostream& out, const StackTraceError& error) {
  return out << error.Trace();
}

}  // namespace takeseek
