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

#ifndef STRUCTSY_FULL_SCAN_ITERATOR_HPP
#define STRUCTSY_FULL_SCAN_ITERATOR_HPP

#include <vector>

#include "page/page_ref.hpp"
#include "table/iterator_base.hpp"
#include "type/record.hpp"

namespace structsy {
class PageSource;
class Table;

class FullScanIterator : public IteratorBase {
 public:
  FullScanIterator(const Table* table, const PageSource* src);
  ~FullScanIterator() override = default;

  [[nodiscard]] bool IsValid() const override { return valid_; }
  [[nodiscard]] Status GetStatus() const override { return status_; }
  [[nodiscard]] Rid Position() const override { return pos_; }
  IteratorBase& operator++() override;
  const Record& operator*() const override { return current_; }
  Record& operator*() override { return current_; }
  void Dump(std::ostream& o, int indent) const override;

 private:
  // Moves to the first live record at or after (page_idx_, next_slot_).
  void Advance();
  void Fail(Status s);

  const Table* table_;
  const PageSource* src_;
  std::vector<page_id_t> pages_;
  size_t page_idx_ = 0;
  slot_t next_slot_ = 0;
  PageRef page_;
  Rid pos_;
  Record current_;
  bool valid_ = false;
  Status status_ = Status::kSuccess;
};

}  // namespace structsy

#endif  // STRUCTSY_FULL_SCAN_ITERATOR_HPP
