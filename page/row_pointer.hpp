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

#ifndef STRUCTSY_ROW_POINTER_HPP
#define STRUCTSY_ROW_POINTER_HPP

#include <ostream>

#include "common/constants.hpp"

namespace structsy {

// Locates one cell inside a slotted B+tree page.
struct RowPointer {
  // Cell start position from the beginning of the row pointer array.
  bin_size_t offset = 0;

  // Physical cell size in bytes.
  bin_size_t size = 0;

  bool operator==(const RowPointer&) const = default;
  friend std::ostream& operator<<(std::ostream& o, const RowPointer& rp) {
    o << "{" << rp.offset << ", " << rp.size << "}";
    return o;
  }
};

}  // namespace structsy

#endif  // STRUCTSY_ROW_POINTER_HPP
