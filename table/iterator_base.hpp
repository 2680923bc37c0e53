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

#ifndef STRUCTSY_ITERATOR_BASE_HPP
#define STRUCTSY_ITERATOR_BASE_HPP

#include <ostream>

#include "common/constants.hpp"
#include "type/record.hpp"
#include "type/rid.hpp"

namespace structsy {

class IteratorBase {
 public:
  IteratorBase() = default;
  virtual ~IteratorBase() = default;
  IteratorBase(const IteratorBase&) = delete;
  IteratorBase(IteratorBase&&) = delete;
  IteratorBase& operator=(const IteratorBase&) = delete;
  IteratorBase& operator=(IteratorBase&&) = delete;
  [[nodiscard]] virtual bool IsValid() const = 0;
  // Why the iteration ended; kSuccess when it simply ran out of records.
  [[nodiscard]] virtual Status GetStatus() const = 0;
  [[nodiscard]] virtual Rid Position() const = 0;
  virtual const Record& operator*() const = 0;
  virtual Record& operator*() = 0;
  const Record* operator->() const { return &operator*(); }
  Record* operator->() { return &operator*(); }
  virtual IteratorBase& operator++() = 0;
  virtual void Dump(std::ostream& o, int indent) const = 0;
  friend std::ostream& operator<<(std::ostream& o, const IteratorBase& it) {
    it.Dump(o, 0);
    return o;
  }
};

}  // namespace structsy

#endif  // STRUCTSY_ITERATOR_BASE_HPP
