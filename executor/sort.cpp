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

#include "executor/sort.hpp"

#include <algorithm>
#include <ostream>

#include "common/log_message.hpp"

namespace structsy {

Status Sort::Fill() {
  for (;;) {
    Entry entry;
    ASSIGN_OR_RETURN(bool, found, src_->Next(&entry.record, &entry.rid));
    if (!found) {
      break;
    }
    if (max_buffer_ <= buffer_.size()) {
      LOG(WARN) << "sort needs more than " << max_buffer_ << " records";
      return Status::kSortBufferExceeded;
    }
    entry.keys.reserve(keys_.size());
    for (const auto& k : keys_) {
      entry.keys.push_back(k.path.Extract(entry.record));
    }
    buffer_.push_back(std::move(entry));
  }
  std::stable_sort(buffer_.begin(), buffer_.end(),
                   [&](const Entry& a, const Entry& b) {
                     for (size_t i = 0; i < keys_.size(); ++i) {
                       int cmp = a.keys[i].Compare(b.keys[i]);
                       if (cmp != 0) {
                         return keys_[i].ascending ? cmp < 0 : 0 < cmp;
                       }
                     }
                     return false;
                   });
  return Status::kSuccess;
}

StatusOr<bool> Sort::Next(Record* dst, Rid* rid) {
  if (!filled_) {
    filled_ = true;
    RETURN_IF_FAIL(Fill());
  }
  if (buffer_.size() <= pos_) {
    return false;
  }
  Entry& entry = buffer_[pos_++];
  *dst = std::move(entry.record);
  if (rid != nullptr) {
    *rid = entry.rid;
  }
  return true;
}

void Sort::Dump(std::ostream& o, int indent) const {
  o << "Sort: [";
  for (size_t i = 0; i < keys_.size(); ++i) {
    if (0 < i) {
      o << ", ";
    }
    o << keys_[i].path.path << (keys_[i].ascending ? " ASC" : " DESC");
  }
  o << "]\n" << Indent(indent + 2);
  src_->Dump(o, indent + 2);
}

}  // namespace structsy
