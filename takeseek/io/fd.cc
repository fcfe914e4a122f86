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

#include "takeseek/io/fd.h"

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <string.h>
#include <sys/types.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <android-base/macros.h>
#include <android-base/unique_fd.h>

#include "takeseek/result/expect.h"
#include "takeseek/result/result_type.h"

namespace takeseek {

FdIo::FdIo(android::base::unique_fd fd) : fd_(std::move(fd)) {}

Result<uint64_t> FdIo::Read(void* buf, uint64_t count) {
  ssize_t data_read = TEMP_FAILURE_RETRY(read(fd_.get(), buf, count));
  int error_num = errno;
  TS_EXPECT_GE(data_read, 0, strerror(error_num));
  return data_read;
}

Result<uint64_t> FdIo::SeekSet(uint64_t offset) {
  off_t new_offset = TEMP_FAILURE_RETRY(lseek(fd_.get(), offset, SEEK_SET));
  int error_num = errno;
  TS_EXPECT_GE(new_offset, 0, strerror(error_num));
  return new_offset;
}

Result<uint64_t> FdIo::SeekCur(int64_t offset) {
  off_t new_offset = TEMP_FAILURE_RETRY(lseek(fd_.get(), offset, SEEK_CUR));
  int error_num = errno;
  TS_EXPECT_GE(new_offset, 0, strerror(error_num));
  return new_offset;
}

Result<uint64_t> FdIo::SeekEnd(int64_t offset) {
  off_t new_offset = TEMP_FAILURE_RETRY(lseek(fd_.get(), offset, SEEK_END));
  int error_num = errno;
  TS_EXPECT_GE(new_offset, 0, strerror(error_num));
  return new_offset;
}

Result<uint64_t> FdIo::PRead(void* buf, uint64_t count,
                             uint64_t offset) const {
  ssize_t data_read = TEMP_FAILURE_RETRY(pread(fd_.get(), buf, count, offset));
  int error_num = errno;
  TS_EXPECT_GE(data_read, 0, strerror(error_num));
  return data_read;
}

Result<std::unique_ptr<FdIo>> OpenReadOnly(std::string_view path) {
  std::string path_str(path);
  android::base::unique_fd fd(
      TEMP_FAILURE_RETRY(open(path_str.c_str(), O_RDONLY | O_CLOEXEC)));
  int error_num = errno;
  TS_EXPECTF(fd.ok(), "Failed to open '{}': {}", path, strerror(error_num));
  return std::make_unique<FdIo>(std::move(fd));
}

}  // namespace takeseek
