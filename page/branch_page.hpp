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

#ifndef STRUCTSY_BRANCH_PAGE_HPP
#define STRUCTSY_BRANCH_PAGE_HPP

#include <iosfwd>
#include <string>
#include <string_view>

#include "common/constants.hpp"
#include "common/status_or.hpp"
#include "page/row_pointer.hpp"

namespace structsy {

class Page;

// Separator keys and children of a B+tree branch. Keys below the first
// separator go to the lowest page.
class BranchPage final {
  char* Payload() { return reinterpret_cast<char*>(rows_); }
  [[nodiscard]] const char* Payload() const {
    return reinterpret_cast<const char*>(rows_);
  }

 public:
  void Initialize();
  [[nodiscard]] slot_t RowCount() const { return row_count_; }

  [[nodiscard]] page_id_t LowestPage() const { return lowest_page_; }
  void SetLowestPage(page_id_t pid) { lowest_page_ = pid; }

  Status Insert(std::string_view key, page_id_t value);
  [[nodiscard]] bool HasRoomFor(std::string_view key) const;

  // The child which may contain |key|.
  [[nodiscard]] page_id_t GetPageForKey(std::string_view key) const;

  // Moves the upper half into |right|. The middle key is removed from both
  // and returned through |middle|; its child becomes right's lowest page.
  void Split(Page* right, std::string* middle);

  [[nodiscard]] std::string_view GetKey(size_t idx) const;
  [[nodiscard]] page_id_t GetValue(size_t idx) const;

  void Dump(std::ostream& o, int indent) const;

 private:
  // Index of the last key not greater than |key|, or -1.
  [[nodiscard]] int Search(std::string_view key) const;
  void InsertAt(size_t pos, std::string_view key, page_id_t value);
  void DeFragment();

  page_id_t lowest_page_;
  slot_t row_count_;
  bin_size_t free_ptr_;
  bin_size_t free_size_;
  RowPointer rows_[0];
};

}  // namespace structsy

#endif  // STRUCTSY_BRANCH_PAGE_HPP
