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

#ifndef STRUCTSY_LEAF_PAGE_HPP
#define STRUCTSY_LEAF_PAGE_HPP

#include <cstddef>
#include <iosfwd>
#include <string_view>

#include "common/constants.hpp"
#include "common/status_or.hpp"
#include "page/row_pointer.hpp"

namespace structsy {

class Page;

// Sorted {key => value} cells of a B+tree leaf. Leaves are chained in both
// directions so range scans never climb back to the parents.
class LeafPage final {
  char* Payload() { return reinterpret_cast<char*>(rows_); }
  [[nodiscard]] const char* Payload() const {
    return reinterpret_cast<const char*>(rows_);
  }

 public:
  // A single cell never takes more than this, so a split always makes room.
  static constexpr size_t kMaxCellSize = kPageBodySize / 6;

  void Initialize();

  Status Insert(std::string_view key, std::string_view value);
  Status Update(std::string_view key, std::string_view value);
  Status Delete(std::string_view key);
  [[nodiscard]] StatusOr<std::string_view> Read(std::string_view key) const;

  [[nodiscard]] std::string_view GetKey(size_t idx) const;
  [[nodiscard]] std::string_view GetValue(size_t idx) const;
  [[nodiscard]] slot_t RowCount() const { return row_count_; }
  // Index of the first key not less than |key|.
  [[nodiscard]] size_t Find(std::string_view key) const;
  [[nodiscard]] bool HasRoomFor(std::string_view key,
                                std::string_view value) const;

  // Moves the upper half of the cells into |right|, an empty leaf.
  void Split(Page* right);

  [[nodiscard]] page_id_t PrevPID() const { return prev_pid_; }
  [[nodiscard]] page_id_t NextPID() const { return next_pid_; }
  void SetPrevPID(page_id_t pid) { prev_pid_ = pid; }
  void SetNextPID(page_id_t pid) { next_pid_ = pid; }

  void Dump(std::ostream& o, int indent) const;

 private:
  void InsertAt(size_t pos, std::string_view key, std::string_view value);
  void DeleteAt(size_t pos);
  void DeFragment();

  page_id_t prev_pid_;
  page_id_t next_pid_;
  slot_t row_count_;
  bin_size_t free_ptr_;
  bin_size_t free_size_;
  RowPointer rows_[0];
};

}  // namespace structsy

#endif  // STRUCTSY_LEAF_PAGE_HPP
