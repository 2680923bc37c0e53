/**
 * Copyright 2023 KUMAZAKI Hiroki
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef STRUCTSY_OPTIONS_HPP
#define STRUCTSY_OPTIONS_HPP

#include <cstddef>

#include "common/constants.hpp"
#include "common/log_message.hpp"

namespace structsy {

struct Options {
  // Committed page versions kept in memory.
  size_t page_cache_capacity = 1024;

  // Records a query may buffer for an in-memory sort.
  size_t max_sort_buffer = 100000;

  // fdatasync the log and the file on every commit.
  bool sync_on_commit = true;

  bool create_if_missing = true;

  // Threshold for LOG(); see common/log_message.hpp.
  int log_level = WARN;
};

}  // namespace structsy

#endif  // STRUCTSY_OPTIONS_HPP
