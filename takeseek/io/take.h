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

#include <stdint.h>

#include <algorithm>
#include <memory>
#include <type_traits>
#include <utility>

#include <android-base/logging.h>

#include "takeseek/io/io.h"
#include "takeseek/result/expect.h"
#include "takeseek/result/result_type.h"

namespace takeseek {

/**
 * Owns another stream and limits reads to the `limit` bytes that follow the
 * position the stream was at when the window was created.
 *
 * Seek offsets are *identical* to those of the wrapped stream, so the window
 * does not start at offset zero: `SeekSet(0)` fails unless the window was
 * created at the beginning of the stream. Absolute seeks may only return to
 * data that has already been consumed, relative seeks may move anywhere in
 * `[start, start + limit]`. Seeking relative to the end is not supported,
 * since the end of the window depends on how much data the wrapped stream
 * really has.
 *
 * Requests that fall outside of the window fail with
 * `ErrorKind::kUnexpectedEof` without reaching the wrapped stream. Errors of
 * the wrapped stream are passed up with their original kind.
 *
 * Create instances with `Takes`.
 */
template <typename R>
class SeekableTake : public Reader, public Seeker {
  static_assert(std::is_base_of_v<Reader, R> && std::is_base_of_v<Seeker, R>,
                "SeekableTake needs a stream that can both read and seek");

 public:
  Result<uint64_t> Read(void* buf, uint64_t count) override;
  Result<uint64_t> SeekSet(uint64_t offset) override;
  Result<uint64_t> SeekCur(int64_t offset) override;
  Result<uint64_t> SeekEnd(int64_t offset) override;

  // Offset of the window in the wrapped stream
  uint64_t Start() const { return start_; }
  uint64_t Limit() const { return limit_; }
  // Bytes between `Start()` and the current position
  uint64_t Consumed() const { return current_; }
  uint64_t Remaining() const { return limit_ - current_; }

  R& Inner() { return *inner_; }
  const R& Inner() const { return *inner_; }
  std::unique_ptr<R> IntoInner() && { return std::move(inner_); }

 private:
  template <typename T>
  friend Result<SeekableTake<T>> Takes(std::unique_ptr<T>, uint64_t);

  SeekableTake(std::unique_ptr<R> inner, uint64_t start, uint64_t limit)
      : inner_(std::move(inner)), start_(start), limit_(limit) {}

  std::unique_ptr<R> inner_;
  uint64_t start_;
  uint64_t limit_;
  uint64_t current_ = 0;
};

/**
 * Bounds `inner` to the next `limit` bytes from its current position.
 *
 * Only queries the current position of `inner`; whether `limit` bytes are
 * actually available is discovered by reading.
 */
template <typename R>
Result<SeekableTake<R>> Takes(std::unique_ptr<R> inner, const uint64_t limit) {
  TS_EXPECT(inner.get() != nullptr, "Cannot limit a null stream");
  uint64_t start =
      TS_EXPECT(inner->SeekCur(0), "Could not query the current position");
  LOG(VERBOSE) << "Limiting stream to " << limit << " bytes from offset "
               << start;
  return SeekableTake<R>(std::move(inner), start, limit);
}

template <typename R>
Result<uint64_t> SeekableTake<R>::Read(void* buf, uint64_t count) {
  uint64_t remaining = limit_ - current_;
  // The wrapped stream may block at end of data, so it is not touched once
  // the window is exhausted.
  if (remaining == 0) {
    return 0;
  }
  count = std::min(count, remaining);
  uint64_t data_read = TS_EXPECT(inner_->Read(buf, count));
  TS_EXPECT_LE(data_read, count, "Wrapped stream read more than requested");
  current_ += data_read;
  return data_read;
}

template <typename R>
Result<uint64_t> SeekableTake<R>::SeekSet(const uint64_t offset) {
  if (offset < start_ || offset - start_ > current_) {
    return TS_ERR_KIND(ErrorKind::kUnexpectedEof,
                       "Cannot seek to " << offset << ", window starts at "
                                         << start_ << " and " << current_
                                         << " bytes have been consumed");
  }
  uint64_t position = TS_EXPECT(inner_->SeekSet(offset));
  current_ = offset - start_;
  return position;
}

template <typename R>
Result<uint64_t> SeekableTake<R>::SeekCur(const int64_t offset) {
  uint64_t destination;
  if (offset >= 0) {
    if (static_cast<uint64_t>(offset) > limit_ - current_) {
      return TS_ERR_KIND(ErrorKind::kUnexpectedEof,
                         "Cannot seek " << offset << " bytes forward, only "
                                        << limit_ - current_
                                        << " bytes are left in the window");
    }
    destination = current_ + static_cast<uint64_t>(offset);
  } else {
    // Negated in two steps so INT64_MIN does not overflow
    uint64_t distance = static_cast<uint64_t>(-(offset + 1)) + 1;
    if (distance > current_) {
      return TS_ERR_KIND(ErrorKind::kUnexpectedEof,
                         "Cannot seek " << distance << " bytes back, only "
                                        << current_
                                        << " bytes have been consumed");
    }
    destination = current_ - distance;
  }
  uint64_t position = TS_EXPECT(inner_->SeekCur(offset));
  current_ = destination;
  return position;
}

template <typename R>
Result<uint64_t> SeekableTake<R>::SeekEnd(int64_t) {
  return TS_ERR_KIND(ErrorKind::kUnexpectedEof,
                     "Seeking from the end of a limited stream is ambiguous");
}

}  // namespace takeseek
