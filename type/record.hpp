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

#ifndef STRUCTSY_RECORD_HPP
#define STRUCTSY_RECORD_HPP

#include <ostream>
#include <utility>
#include <vector>

#include "type/value.hpp"

namespace structsy {

// Field values of one record, in declaration order.
struct Record {
  Record() = default;
  explicit Record(std::vector<Value> vals) : values(std::move(vals)) {}

  [[nodiscard]] size_t Size() const { return values.size(); }
  [[nodiscard]] const Value& Get(size_t idx) const { return values[idx]; }

  bool operator==(const Record& rhs) const { return values == rhs.values; }
  bool operator!=(const Record& rhs) const { return !operator==(rhs); }

  friend std::ostream& operator<<(std::ostream& o, const Record& r) {
    o << "{";
    for (size_t i = 0; i < r.values.size(); ++i) {
      if (0 < i) {
        o << ", ";
      }
      o << r.values[i];
    }
    o << "}";
    return o;
  }

  std::vector<Value> values;
};

}  // namespace structsy

#endif  // STRUCTSY_RECORD_HPP
