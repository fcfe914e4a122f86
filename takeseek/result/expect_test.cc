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

#include "takeseek/result/expect.h"

#include <stdlib.h>

#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <android-base/format.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "takeseek/result/error_type.h"
#include "takeseek/result/result_matchers.h"
#include "takeseek/result/result_type.h"

namespace takeseek {
namespace {

using ::testing::AllOf;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StrEq;

Result<int> Fails() { return TS_ERR("inner failure"); }

Result<int> FailsOutOfRange() {
  return TS_ERR_KIND(ErrorKind::kUnexpectedEof, "outside of " << 42);
}

Result<int> Succeeds() { return 5; }

Result<int> Propagates() { return TS_EXPECT(Fails(), "outer context"); }

Result<int> PropagatesOutOfRange() { return TS_EXPECT(FailsOutOfRange()); }

Result<int> Doubles() { return 2 * TS_EXPECT(Succeeds()); }

Result<int> ChecksPositive(int value) {
  TS_EXPECT(value > 0, "value was not positive");
  return value;
}

Result<int> ChecksOptional(std::optional<int> value) {
  return TS_EXPECT(std::move(value), "no value");
}

Result<int> ComparesLess(int lhs, int rhs) {
  TS_EXPECT_LT(lhs, rhs, "ordering");
  return lhs;
}

Result<int> Formats(int value) {
  TS_EXPECTF(value > 0, "{} is not positive", value);
  return value;
}

TEST(ExpectTest, SuccessUnwrapsValue) {
  EXPECT_THAT(Doubles(), IsOkAndValue(10));
}

TEST(ExpectTest, ErrorMessage) {
  EXPECT_THAT(Fails(), IsErrorAndMessage(StrEq("inner failure")));
}

TEST(ExpectTest, PropagationAddsContext) {
  Result<int> result = Propagates();

  ASSERT_THAT(result, IsError());
  EXPECT_EQ(result.error().Stack().size(), 2);
  EXPECT_EQ(result.error().Message(), "outer context\ninner failure");
}

TEST(ExpectTest, DefaultKindIsUnknown) {
  EXPECT_THAT(Fails(), IsErrorOfKind(ErrorKind::kUnknown));
}

TEST(ExpectTest, KindSurvivesPropagation) {
  Result<int> result = PropagatesOutOfRange();

  EXPECT_THAT(result, IsErrorOfKind(ErrorKind::kUnexpectedEof));
  EXPECT_THAT(result, IsErrorAndMessage(StrEq("outside of 42")));
}

TEST(ExpectTest, Bool) {
  EXPECT_THAT(ChecksPositive(1), IsOkAndValue(1));
  EXPECT_THAT(ChecksPositive(0),
              IsErrorAndMessage(StrEq("value was not positive")));
}

TEST(ExpectTest, Optional) {
  EXPECT_THAT(ChecksOptional(3), IsOkAndValue(3));
  EXPECT_THAT(ChecksOptional(std::nullopt), IsError());
}

TEST(ExpectTest, Comparison) {
  EXPECT_THAT(ComparesLess(1, 2), IsOkAndValue(1));
  EXPECT_THAT(ComparesLess(3, 2),
              IsErrorAndMessage(AllOf(HasSubstr("but was 3 vs 2"),
                                      HasSubstr("ordering"))));
}

TEST(ExpectTest, FormattedMessage) {
  EXPECT_THAT(Formats(-4), IsErrorAndMessage(StrEq("-4 is not positive")));
}

TEST(ErrorFormatTest, TraceNamesLocations) {
  Result<int> result = Propagates();
  ASSERT_THAT(result, IsError());

  std::string trace = result.error().Trace();
  EXPECT_THAT(trace, HasSubstr("expect_test.cc"));
  EXPECT_THAT(trace, HasSubstr("Propagates"));
  EXPECT_THAT(trace, HasSubstr("TS_EXPECT(Fails())"));
}

TEST(ErrorFormatTest, FmtSpecifiers) {
  Result<int> result = Propagates();
  ASSERT_THAT(result, IsError());

  EXPECT_EQ(fmt::format("{:m}", result.error()), result.error().Message());
  EXPECT_EQ(fmt::format("{:v}", result.error()), result.error().Trace());
  EXPECT_EQ(fmt::format("{}", result.error()), result.error().Trace());
}

TEST(ErrorFormatTest, EnvironmentSelectsFormat) {
  Result<int> result = Propagates();
  ASSERT_THAT(result, IsError());

  ASSERT_EQ(setenv("TAKESEEK_ERROR_FORMAT", "m", 1), 0);
  EXPECT_EQ(result.error().FormatForEnv(), result.error().Message());
  ASSERT_EQ(setenv("TAKESEEK_ERROR_FORMAT", "}", 1), 0);
  EXPECT_EQ(result.error().FormatForEnv(), result.error().Trace());
  ASSERT_EQ(unsetenv("TAKESEEK_ERROR_FORMAT"), 0);
  EXPECT_THAT(result.error().FormatForEnv(), Not(StrEq("")));
}

TEST(ErrorKindTest, Printable) {
  std::stringstream out;
  out << ErrorKind::kUnexpectedEof;

  EXPECT_EQ(out.str(), "UnexpectedEof");
}

}  // namespace
}  // namespace takeseek
