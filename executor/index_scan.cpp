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

#include "executor/index_scan.hpp"

#include <ostream>
#include <utility>

#include "common/log_message.hpp"
#include "index/index.hpp"
#include "table/table.hpp"

namespace structsy {

IndexScan::IndexScan(const PageSource& src, const Table& table,
                     const Index& index, std::vector<KeyRange> ranges,
                     bool ascending, bool deduplicate)
    : src_(&src),
      table_(&table),
      index_(&index),
      ranges_(std::move(ranges)),
      ascending_(ascending),
      deduplicate_(deduplicate) {}

StatusOr<bool> IndexScan::Next(Record* dst, Rid* rid) {
  for (;;) {
    if (!iter_.has_value() || !iter_->IsValid()) {
      if (iter_.has_value()) {
        RETURN_IF_FAIL(iter_->GetStatus());
      }
      if (ranges_.size() <= next_range_) {
        return false;
      }
      iter_.emplace(index_->Scan(*src_, ranges_[next_range_++], ascending_));
      continue;
    }
    StatusOr<Rid> found = iter_->GetRid();
    ++*iter_;
    RETURN_IF_FAIL(found.GetStatus());
    if (deduplicate_ && !seen_.insert(found.Value()).second) {
      continue;
    }
    StatusOr<Record> record = table_->Read(*src_, found.Value());
    if (!record.HasValue()) {
      LOG(ERROR) << "index " << index_->Name() << " lists unreadable "
                 << found.Value() << ": " << record.GetStatus();
      return record.GetStatus() == Status::kNotExists
                 ? Status::kBackingStoreError
                 : record.GetStatus();
    }
    *dst = record.MoveValue();
    if (rid != nullptr) {
      *rid = found.Value();
    }
    return true;
  }
}

void IndexScan::Dump(std::ostream& o, int /*indent*/) const {
  o << "IndexScan: " << index_->Name() << " "
    << (ascending_ ? "ASC" : "DESC") << " over";
  for (const auto& r : ranges_) {
    o << " " << r;
  }
}

}  // namespace structsy
