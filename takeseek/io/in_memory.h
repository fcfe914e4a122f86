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

#include <memory>
#include <string_view>
#include <vector>

#include "takeseek/io/io.h"

namespace takeseek {

/**
 * Read-only stream over a private copy of `data`.
 *
 * The seek pointer may be moved past the end of the data, where reads return
 * 0 like they would for a regular file. Seeking before the beginning fails.
 */
std::unique_ptr<ReaderSeeker> InMemoryIo(std::vector<char> data);
std::unique_ptr<ReaderSeeker> InMemoryIo(std::string_view data);

}  // namespace takeseek
