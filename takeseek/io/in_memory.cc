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

#include <stdint.h>
#include <string.h>

#include <algorithm>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "takeseek/io/io.h"
#include "takeseek/result/expect.h"
#include "takeseek/result/result_type.h"

namespace takeseek {
namespace {

class InMemoryReader : public ReaderSeeker {
 public:
  explicit InMemoryReader(std::vector<char> data) : data_(std::move(data)) {}

  Result<uint64_t> Read(void* buf, uint64_t count) override {
    uint64_t to_read = ClampRange(cursor_, count);
    if (to_read > 0) {
      memcpy(buf, &data_[cursor_], to_read);
    }
    cursor_ += to_read;
    return to_read;
  }

  Result<uint64_t> SeekSet(uint64_t offset) override {
    return cursor_ = offset;
  }

  Result<uint64_t> SeekCur(int64_t offset) override {
    return cursor_ = TS_EXPECT(Displace(cursor_, offset));
  }

  Result<uint64_t> SeekEnd(int64_t offset) override {
    return cursor_ = TS_EXPECT(Displace(data_.size(), offset));
  }

  Result<uint64_t> PRead(void* buf, uint64_t count,
                         uint64_t offset) const override {
    uint64_t to_read = ClampRange(offset, count);
    if (to_read > 0) {
      memcpy(buf, &data_[offset], to_read);
    }
    return to_read;
  }

 private:
  uint64_t ClampRange(uint64_t begin, uint64_t length) const {
    if (begin >= data_.size()) {
      return 0;
    }
    return std::min<uint64_t>(length, data_.size() - begin);
  }

  static Result<uint64_t> Displace(uint64_t base, int64_t offset) {
    if (offset >= 0) {
      return base + static_cast<uint64_t>(offset);
    }
    // Negated in two steps so INT64_MIN does not overflow
    uint64_t distance = static_cast<uint64_t>(-(offset + 1)) + 1;
    TS_EXPECT_LE(distance, base, "Cannot seek before the beginning");
    return base - distance;
  }

  std::vector<char> data_;
  uint64_t cursor_ = 0;
};

}  // namespace

std::unique_ptr<ReaderSeeker> InMemoryIo(std::vector<char> data) {
  return std::make_unique<InMemoryReader>(std::move(data));
}

std::unique_ptr<ReaderSeeker> InMemoryIo(std::string_view data) {
  return InMemoryIo(std::vector<char>(data.begin(), data.end()));
}

}  // namespace takeseek
