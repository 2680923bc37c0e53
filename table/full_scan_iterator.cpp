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

#include "table/full_scan_iterator.hpp"

#include "common/log_message.hpp"
#include "page/page.hpp"
#include "page/page_source.hpp"
#include "table/table.hpp"

namespace structsy {

FullScanIterator::FullScanIterator(const Table* table, const PageSource* src)
    : table_(table),
      src_(src),
      pages_(table->segments_->SegmentsOf(table->TypeID())) {
  Advance();
}

void FullScanIterator::Fail(Status s) {
  LOG(ERROR) << "scan of " << table_->Descriptor().Name()
             << " stopped at " << pos_ << ": " << s;
  status_ = s;
  valid_ = false;
  page_ = PageRef();
}

void FullScanIterator::Advance() {
  valid_ = false;
  while (page_idx_ < pages_.size()) {
    if (page_.IsNull()) {
      StatusOr<PageRef> page = src_->GetPage(pages_[page_idx_]);
      if (!page.HasValue() && page.GetStatus() != Status::kNotExists) {
        return Fail(page.GetStatus());
      }
      // The directory may list pages which were not our segments in
      // this view.
      if (!page.HasValue() ||
          page.Value()->Type() != PageType::kSegmentPage ||
          page.Value().GetSegmentPage().TypeID() != table_->TypeID()) {
        ++page_idx_;
        continue;
      }
      page_ = page.MoveValue();
      next_slot_ = 0;
    }
    const SegmentPage& seg = page_.GetSegmentPage();
    while (next_slot_ < seg.SlotCount()) {
      const slot_t slot = next_slot_++;
      if (!seg.IsUsed(slot) ||
          (seg.Flags(slot) & SegmentPage::kMovedFlag) != 0) {
        continue;
      }
      pos_ = Rid(table_->TypeID(), page_->PageID(), slot,
                 seg.Generation(slot));
      StatusOr<Record> record = table_->Read(*src_, pos_);
      if (!record.HasValue()) {
        return Fail(record.GetStatus());
      }
      current_ = record.MoveValue();
      valid_ = true;
      return;
    }
    page_ = PageRef();
    ++page_idx_;
  }
}

IteratorBase& FullScanIterator::operator++() {
  if (valid_) {
    Advance();
  }
  return *this;
}

void FullScanIterator::Dump(std::ostream& o, int /*indent*/) const {
  o << "FullScan: " << table_->Descriptor().Name();
}

}  // namespace structsy
