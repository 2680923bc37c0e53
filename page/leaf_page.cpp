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

#include "page/leaf_page.hpp"

#include <cstring>
#include <ostream>
#include <string>
#include <vector>

#include "common/debug.hpp"
#include "common/serdes.hpp"
#include "page/page.hpp"

namespace structsy {

void LeafPage::Initialize() {
  prev_pid_ = 0;
  next_pid_ = 0;
  row_count_ = 0;
  free_ptr_ = kPageBodySize - offsetof(LeafPage, rows_);
  free_size_ = kPageBodySize - offsetof(LeafPage, rows_);
}

std::string_view LeafPage::GetKey(size_t idx) const {
  std::string_view ret;
  DeserializeStringView(Payload() + rows_[idx].offset, &ret);
  return ret;
}

std::string_view LeafPage::GetValue(size_t idx) const {
  std::string_view ret;
  DeserializeStringView(
      Payload() + rows_[idx].offset + SerializeSize(GetKey(idx)), &ret);
  return ret;
}

bool LeafPage::HasRoomFor(std::string_view key, std::string_view value) const {
  return SerializeSize(key) + SerializeSize(value) + sizeof(RowPointer) <=
         free_size_;
}

Status LeafPage::Insert(std::string_view key, std::string_view value) {
  const size_t physical_size = SerializeSize(key) + SerializeSize(value);
  if (kMaxCellSize < physical_size + sizeof(RowPointer)) {
    return Status::kTooBigData;
  }
  if (free_size_ < physical_size + sizeof(RowPointer)) {
    return Status::kNoSpace;
  }
  const size_t pos = Find(key);
  if (pos != row_count_ && GetKey(pos) == key) {
    return Status::kDuplicates;
  }
  InsertAt(pos, key, value);
  return Status::kSuccess;
}

void LeafPage::InsertAt(size_t pos, std::string_view key,
                        std::string_view value) {
  const auto physical_size =
      static_cast<bin_size_t>(SerializeSize(key) + SerializeSize(value));
  if (free_ptr_ < sizeof(RowPointer) * (row_count_ + 1) + physical_size) {
    DeFragment();
  }
  free_size_ -= physical_size + sizeof(RowPointer);
  free_ptr_ -= physical_size;
  const size_t key_size = SerializeStringView(Payload() + free_ptr_, key);
  SerializeStringView(Payload() + free_ptr_ + key_size, value);
  memmove(rows_ + pos + 1, rows_ + pos,
          sizeof(RowPointer) * (row_count_ - pos));
  rows_[pos] = {free_ptr_, physical_size};
  ++row_count_;
}

Status LeafPage::Update(std::string_view key, std::string_view value) {
  const size_t physical_size = SerializeSize(key) + SerializeSize(value);
  if (kMaxCellSize < physical_size + sizeof(RowPointer)) {
    return Status::kTooBigData;
  }
  const size_t pos = Find(key);
  if (pos == row_count_ || GetKey(pos) != key) {
    return Status::kNotExists;
  }
  if (free_size_ + rows_[pos].size < physical_size) {
    return Status::kNoSpace;
  }
  // The key outlives the cell it points into.
  const std::string saved_key(key);
  DeleteAt(pos);
  InsertAt(pos, saved_key, value);
  return Status::kSuccess;
}

Status LeafPage::Delete(std::string_view key) {
  const size_t pos = Find(key);
  if (pos == row_count_ || GetKey(pos) != key) {
    return Status::kNotExists;
  }
  DeleteAt(pos);
  return Status::kSuccess;
}

void LeafPage::DeleteAt(size_t pos) {
  free_size_ += rows_[pos].size + sizeof(RowPointer);
  memmove(rows_ + pos, rows_ + pos + 1,
          sizeof(RowPointer) * (row_count_ - pos - 1));
  --row_count_;
}

StatusOr<std::string_view> LeafPage::Read(std::string_view key) const {
  const size_t pos = Find(key);
  if (pos < row_count_ && GetKey(pos) == key) {
    return GetValue(pos);
  }
  return Status::kNotExists;
}

size_t LeafPage::Find(std::string_view key) const {
  int left = -1;
  int right = row_count_;
  while (1 < right - left) {
    const int cur = (left + right) / 2;
    if (GetKey(cur) < key) {
      left = cur;
    } else {
      right = cur;
    }
  }
  return right;
}

void LeafPage::Split(Page* right) {
  LeafPage& dst = right->body.leaf_page;
  const size_t kThreshold = (kPageBodySize - offsetof(LeafPage, rows_)) / 2;
  size_t consumed = 0;
  size_t pivot = 0;
  while (pivot + 1 < row_count_ && consumed < kThreshold) {
    consumed += rows_[pivot].size + sizeof(RowPointer);
    ++pivot;
  }
  if (pivot == 0) {
    pivot = 1;
  }
  for (size_t i = pivot; i < row_count_; ++i) {
    dst.InsertAt(dst.row_count_, GetKey(i), GetValue(i));
  }
  while (pivot < row_count_) {
    DeleteAt(row_count_ - 1);
  }
  DeFragment();
}

void LeafPage::DeFragment() {
  std::vector<std::string> payloads;
  payloads.reserve(row_count_);
  for (size_t i = 0; i < row_count_; ++i) {
    payloads.emplace_back(Payload() + rows_[i].offset, rows_[i].size);
  }
  free_ptr_ = kPageBodySize - offsetof(LeafPage, rows_);
  for (size_t i = 0; i < row_count_; ++i) {
    free_ptr_ -= payloads[i].size();
    rows_[i].offset = free_ptr_;
    memcpy(Payload() + free_ptr_, payloads[i].data(), payloads[i].size());
  }
}

void LeafPage::Dump(std::ostream& o, int indent) const {
  o << "Rows: " << row_count_ << " FreeSize: " << free_size_
    << " Prev: " << prev_pid_ << " Next: " << next_pid_;
  for (size_t i = 0; i < row_count_; ++i) {
    o << "\n"
      << Indent(indent + 2) << OmittedString(GetKey(i), 20) << ": "
      << OmittedString(GetValue(i), 20);
  }
}

}  // namespace structsy
