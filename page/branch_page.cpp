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

#include "page/branch_page.hpp"

#include <cstring>
#include <ostream>
#include <vector>

#include "common/debug.hpp"
#include "common/serdes.hpp"
#include "page/leaf_page.hpp"
#include "page/page.hpp"

namespace structsy {

void BranchPage::Initialize() {
  lowest_page_ = 0;
  row_count_ = 0;
  free_ptr_ = kPageBodySize - offsetof(BranchPage, rows_);
  free_size_ = kPageBodySize - offsetof(BranchPage, rows_);
}

std::string_view BranchPage::GetKey(size_t idx) const {
  std::string_view ret;
  DeserializeStringView(Payload() + rows_[idx].offset + sizeof(page_id_t),
                        &ret);
  return ret;
}

page_id_t BranchPage::GetValue(size_t idx) const {
  page_id_t ret = 0;
  DeserializePID(Payload() + rows_[idx].offset, &ret);
  return ret;
}

bool BranchPage::HasRoomFor(std::string_view key) const {
  return SerializeSize(key) + sizeof(page_id_t) + sizeof(RowPointer) <=
         free_size_;
}

Status BranchPage::Insert(std::string_view key, page_id_t value) {
  const size_t physical_size = SerializeSize(key) + sizeof(page_id_t);
  if (LeafPage::kMaxCellSize < physical_size + sizeof(RowPointer)) {
    return Status::kTooBigData;
  }
  if (free_size_ < physical_size + sizeof(RowPointer)) {
    return Status::kNoSpace;
  }
  const int pos = Search(key);
  if (0 <= pos && GetKey(pos) == key) {
    return Status::kDuplicates;
  }
  InsertAt(pos + 1, key, value);
  return Status::kSuccess;
}

void BranchPage::InsertAt(size_t pos, std::string_view key, page_id_t value) {
  const auto physical_size =
      static_cast<bin_size_t>(SerializeSize(key) + sizeof(page_id_t));
  if (free_ptr_ < sizeof(RowPointer) * (row_count_ + 1) + physical_size) {
    DeFragment();
  }
  free_size_ -= physical_size + sizeof(RowPointer);
  free_ptr_ -= physical_size;
  SerializePID(Payload() + free_ptr_, value);
  SerializeStringView(Payload() + free_ptr_ + sizeof(page_id_t), key);
  memmove(rows_ + pos + 1, rows_ + pos,
          sizeof(RowPointer) * (row_count_ - pos));
  rows_[pos] = {free_ptr_, physical_size};
  ++row_count_;
}

page_id_t BranchPage::GetPageForKey(std::string_view key) const {
  const int pos = Search(key);
  if (pos < 0) {
    return lowest_page_;
  }
  return GetValue(pos);
}

int BranchPage::Search(std::string_view key) const {
  int left = -1;
  int right = row_count_;
  while (1 < right - left) {
    const int cur = (left + right) / 2;
    if (GetKey(cur) <= key) {
      left = cur;
    } else {
      right = cur;
    }
  }
  return left;
}

void BranchPage::Split(Page* right, std::string* middle) {
  BranchPage& dst = right->body.branch_page;
  const size_t mid = row_count_ / 2;
  *middle = std::string(GetKey(mid));
  dst.SetLowestPage(GetValue(mid));
  for (size_t i = mid + 1; i < row_count_; ++i) {
    dst.InsertAt(dst.row_count_, GetKey(i), GetValue(i));
  }
  for (size_t i = mid; i < row_count_; ++i) {
    free_size_ += rows_[i].size + sizeof(RowPointer);
  }
  row_count_ = mid;
  DeFragment();
}

void BranchPage::DeFragment() {
  std::vector<std::string> payloads;
  payloads.reserve(row_count_);
  for (size_t i = 0; i < row_count_; ++i) {
    payloads.emplace_back(Payload() + rows_[i].offset, rows_[i].size);
  }
  free_ptr_ = kPageBodySize - offsetof(BranchPage, rows_);
  for (size_t i = 0; i < row_count_; ++i) {
    free_ptr_ -= payloads[i].size();
    rows_[i].offset = free_ptr_;
    memcpy(Payload() + free_ptr_, payloads[i].data(), payloads[i].size());
  }
}

void BranchPage::Dump(std::ostream& o, int indent) const {
  o << "Rows: " << row_count_ << " FreeSize: " << free_size_
    << " Lowest: " << lowest_page_;
  for (size_t i = 0; i < row_count_; ++i) {
    o << "\n"
      << Indent(indent + 2) << OmittedString(GetKey(i), 20) << ": "
      << GetValue(i);
  }
}

}  // namespace structsy
