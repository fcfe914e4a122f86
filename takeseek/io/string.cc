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

#include "takeseek/io/string.h"

#include <stddef.h>
#include <stdint.h>

#include <sstream>
#include <string>
#include <vector>

#include "takeseek/io/io.h"
#include "takeseek/result/expect.h"
#include "takeseek/result/result_type.h"

namespace takeseek {

Result<std::string> ReadToString(Reader& reader, const size_t buffer_size) {
  TS_EXPECT_GT(buffer_size, 0u, "Cannot read with an empty buffer");
  std::stringstream out;

  std::vector<char> buf(buffer_size);
  uint64_t data_read;
  while ((data_read = TS_EXPECT(reader.Read(buf.data(), buf.size()))) > 0) {
    out.write(buf.data(), data_read);
  }
  return out.str();
}

}  // namespace takeseek
