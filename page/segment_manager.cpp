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

#include "page/segment_manager.hpp"

#include "common/log_message.hpp"
#include "page/page.hpp"
#include "page/page_source.hpp"
#include "transaction/transaction.hpp"

namespace structsy {

Status SegmentManager::Load(const PageSource& source) {
  ASSIGN_OR_RETURN(PageRef, header, source.GetPage(0));
  const page_id_t page_count = header.GetHeaderPage().PageCount();
  std::scoped_lock lk(directory_latch_);
  segments_.clear();
  available_.clear();
  size_t found = 0;
  for (page_id_t pid = 1; pid < page_count; ++pid) {
    StatusOr<PageRef> page = source.GetPage(pid);
    if (page.GetStatus() == Status::kNotExists) {
      continue;
    }
    if (!page.HasValue()) {
      return page.GetStatus();
    }
    if (page.Value()->Type() != PageType::kSegmentPage) {
      continue;
    }
    const SegmentPage& seg = page.Value().GetSegmentPage();
    segments_[seg.TypeID()].insert(pid);
    if (!seg.IsFull()) {
      available_[{seg.TypeID(), seg.SlotSize()}].insert(pid);
    }
    ++found;
  }
  LOG(DEBUG) << "found " << found << " segments in " << page_count
             << " pages";
  return Status::kSuccess;
}

Status SegmentManager::Verify(const PageRef& page, const Rid& rid) {
  if (page->Type() == PageType::kFreePage) {
    return Status::kNotExists;
  }
  if (page->Type() != PageType::kSegmentPage) {
    return Status::kInvalidId;
  }
  const SegmentPage& seg = page.GetSegmentPage();
  if (seg.TypeID() != rid.type_id || seg.SlotCount() <= rid.slot) {
    return Status::kInvalidId;
  }
  if (!seg.IsUsed(rid.slot) || seg.Generation(rid.slot) != rid.generation) {
    return Status::kNotExists;
  }
  return Status::kSuccess;
}

StatusOr<SlotView> SegmentManager::ReadSlot(const PageSource& source,
                                            const Rid& rid) const {
  if (!rid.IsValid()) {
    return Status::kInvalidId;
  }
  StatusOr<PageRef> page = source.GetPage(rid.page_id);
  if (page.GetStatus() == Status::kNotExists) {
    return Status::kInvalidId;
  }
  if (!page.HasValue()) {
    return page.GetStatus();
  }
  RETURN_IF_FAIL(Verify(page.Value(), rid));
  SlotView view;
  view.page = page.MoveValue();
  const SegmentPage& seg = view.page.GetSegmentPage();
  view.payload = seg.Read(rid.slot);
  view.flags = seg.Flags(rid.slot);
  return view;
}

StatusOr<Rid> SegmentManager::AllocateSlot(Transaction& txn,
                                           type_id_t type_id,
                                           size_t payload_size) {
  const uint32_t bucket = SegmentPage::BucketFor(payload_size);
  if (bucket == 0) {
    LOG(WARN) << "record of " << payload_size << " bytes exceeds "
              << SegmentPage::MaxPayloadSize();
    return Status::kTooBigData;
  }
  std::vector<page_id_t> candidates;
  {
    std::scoped_lock lk(directory_latch_);
    const auto& hint = available_[{type_id, bucket}];
    candidates.assign(hint.begin(), hint.end());
  }
  for (page_id_t pid : candidates) {
    StatusOr<PageRef> page = txn.GetPage(pid);
    bool usable = false;
    if (page.HasValue() && page.Value()->Type() == PageType::kSegmentPage) {
      const SegmentPage& seg = page.Value().GetSegmentPage();
      usable = seg.TypeID() == type_id && seg.SlotSize() == bucket &&
               !seg.IsFull();
    } else if (!page.HasValue() && page.GetStatus() != Status::kNotExists) {
      return page.GetStatus();
    }
    if (!usable) {
      Withdraw(txn, type_id, bucket, pid);
      continue;
    }
    ASSIGN_OR_RETURN(Page*, target, txn.GetPageForWrite(pid));
    SegmentPage& seg = target->body.segment_page;
    ASSIGN_OR_RETURN(slot_t, slot, seg.Allocate());
    if (seg.IsFull()) {
      Withdraw(txn, type_id, bucket, pid);
    }
    return Rid(type_id, pid, slot, seg.Generation(slot));
  }

  generation_t floor = 0;
  ASSIGN_OR_RETURN(Page*, fresh,
                   txn.AllocatePage(PageType::kSegmentPage, &floor));
  SegmentPage& seg = fresh->body.segment_page;
  seg.Initialize(type_id, bucket, floor);
  Register(type_id, bucket, fresh->PageID());
  ASSIGN_OR_RETURN(slot_t, slot, seg.Allocate());
  LOG(TRACE) << "new segment " << fresh->PageID() << " for type " << type_id
             << " with " << bucket << " byte slots";
  return Rid(type_id, fresh->PageID(), slot, seg.Generation(slot));
}

Status SegmentManager::WriteSlot(Transaction& txn, const Rid& rid,
                                 std::string_view payload, uint32_t flags) {
  {
    StatusOr<PageRef> page = txn.GetPage(rid.page_id);
    if (page.GetStatus() == Status::kNotExists) {
      return Status::kInvalidId;
    }
    if (!page.HasValue()) {
      return page.GetStatus();
    }
    Status s = Verify(page.Value(), rid);
    if (s != Status::kSuccess) {
      return Status::kInvalidId;
    }
  }
  ASSIGN_OR_RETURN(Page*, target, txn.GetPageForWrite(rid.page_id));
  return target->body.segment_page.Write(rid.slot, payload, flags);
}

Status SegmentManager::FreeSlot(Transaction& txn, const Rid& rid) {
  {
    StatusOr<PageRef> page = txn.GetPage(rid.page_id);
    if (page.GetStatus() == Status::kNotExists) {
      return Status::kInvalidId;
    }
    if (!page.HasValue()) {
      return page.GetStatus();
    }
    Status s = Verify(page.Value(), rid);
    if (s != Status::kSuccess) {
      return Status::kInvalidId;
    }
  }
  ASSIGN_OR_RETURN(Page*, target, txn.GetPageForWrite(rid.page_id));
  SegmentPage& seg = target->body.segment_page;
  seg.Free(rid.slot);
  if (seg.IsEmpty()) {
    LOG(TRACE) << "segment " << rid.page_id << " is empty, freeing it";
    return txn.FreePage(rid.page_id, seg.NextGenerationFloor());
  }
  std::scoped_lock lk(directory_latch_);
  available_[{seg.TypeID(), seg.SlotSize()}].insert(rid.page_id);
  return Status::kSuccess;
}

bool SegmentManager::FitsSlotOf(const SlotView& view, size_t payload_size) {
  return payload_size <= view.page.GetSegmentPage().Capacity();
}

std::vector<page_id_t> SegmentManager::SegmentsOf(type_id_t type_id) const {
  std::scoped_lock lk(directory_latch_);
  auto it = segments_.find(type_id);
  if (it == segments_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

void SegmentManager::Withdraw(Transaction& txn, type_id_t type_id,
                              uint32_t slot_size, page_id_t pid) {
  {
    std::scoped_lock lk(directory_latch_);
    available_[{type_id, slot_size}].erase(pid);
  }
  // The committed page may still have room.
  txn.OnAbort([this, type_id, slot_size, pid] {
    std::scoped_lock lk(directory_latch_);
    available_[{type_id, slot_size}].insert(pid);
  });
}

void SegmentManager::Register(type_id_t type_id, uint32_t slot_size,
                              page_id_t pid) {
  std::scoped_lock lk(directory_latch_);
  segments_[type_id].insert(pid);
  available_[{type_id, slot_size}].insert(pid);
}

}  // namespace structsy
