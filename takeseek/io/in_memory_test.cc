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

#include "takeseek/io/in_memory.h"

#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "takeseek/io/io.h"
#include "takeseek/io/string.h"
#include "takeseek/result/result_matchers.h"

namespace takeseek {
namespace {

TEST(InMemoryIoTest, ReadAll) {
  std::unique_ptr<ReaderSeeker> instance = InMemoryIo("hello");

  EXPECT_THAT(ReadToString(*instance), IsOkAndValue("hello"));
}

TEST(InMemoryIoTest, ReadIsPartialAtEnd) {
  std::unique_ptr<ReaderSeeker> instance = InMemoryIo("hello");

  std::string data_read(8, '\0');
  ASSERT_THAT(instance->Read(data_read.data(), data_read.size()),
              IsOkAndValue(5));
  EXPECT_THAT(instance->Read(data_read.data(), data_read.size()),
              IsOkAndValue(0));
}

TEST(InMemoryIoTest, Seek) {
  std::unique_ptr<ReaderSeeker> instance = InMemoryIo("hello");

  ASSERT_THAT(instance->SeekEnd(-2), IsOkAndValue(3));
  ASSERT_THAT(instance->SeekCur(-2), IsOkAndValue(1));
  ASSERT_THAT(instance->SeekSet(4), IsOkAndValue(4));
  EXPECT_THAT(ReadToString(*instance), IsOkAndValue("o"));
}

TEST(InMemoryIoTest, SeekPastEnd) {
  std::unique_ptr<ReaderSeeker> instance = InMemoryIo("hello");

  ASSERT_THAT(instance->SeekSet(10), IsOkAndValue(10));

  char buf[4];
  EXPECT_THAT(instance->Read(buf, sizeof(buf)), IsOkAndValue(0));
  EXPECT_THAT(instance->SeekCur(0), IsOkAndValue(10));
}

TEST(InMemoryIoTest, SeekBeforeBeginningFails) {
  std::unique_ptr<ReaderSeeker> instance = InMemoryIo("hello");

  EXPECT_THAT(instance->SeekCur(-1), IsError());
  EXPECT_THAT(instance->SeekEnd(-6), IsError());
  EXPECT_THAT(instance->SeekCur(std::numeric_limits<int64_t>::min()),
              IsError());
  EXPECT_THAT(instance->SeekCur(0), IsOkAndValue(0));
}

TEST(InMemoryIoTest, PReadDoesNotMoveCursor) {
  std::unique_ptr<ReaderSeeker> instance = InMemoryIo("hello");

  std::string data_read(3, '\0');
  ASSERT_THAT(instance->PRead(data_read.data(), data_read.size(), 1),
              IsOkAndValue(3));
  EXPECT_EQ(data_read, "ell");
  EXPECT_THAT(instance->SeekCur(0), IsOkAndValue(0));
  EXPECT_THAT(instance->PRead(data_read.data(), data_read.size(), 5),
              IsOkAndValue(0));
}

TEST(InMemoryIoTest, Empty) {
  std::unique_ptr<ReaderSeeker> instance = InMemoryIo(std::vector<char>());

  EXPECT_THAT(ReadToString(*instance), IsOkAndValue(""));
  EXPECT_THAT(instance->SeekEnd(0), IsOkAndValue(0));
}

TEST(ReadToStringTest, SmallBuffer) {
  std::unique_ptr<ReaderSeeker> instance = InMemoryIo("a longer message");

  EXPECT_THAT(ReadToString(*instance, 3), IsOkAndValue("a longer message"));
}

TEST(ReadToStringTest, EmptyBufferFails) {
  std::unique_ptr<ReaderSeeker> instance = InMemoryIo("hello");

  EXPECT_THAT(ReadToString(*instance, 0), IsError());
}

}  // namespace
}  // namespace takeseek
