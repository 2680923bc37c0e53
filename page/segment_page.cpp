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

#include "page/segment_page.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <ostream>

#include "common/debug.hpp"

namespace structsy {

size_t SegmentPage::SlotAreaSize() {
  return kPageBodySize - offsetof(SegmentPage, slots_);
}

void SegmentPage::Initialize(type_id_t type_id, uint32_t slot_size,
                             generation_t generation_floor) {
  type_id_ = type_id;
  slot_size_ = slot_size;
  slot_count_ = static_cast<slot_t>(
      std::min<size_t>(kMaxSlots, SlotAreaSize() / slot_size));
  live_count_ = 0;
  generation_floor_ = generation_floor;
  memset(bitmap_, 0, sizeof(bitmap_));
  for (slot_t i = 0; i < slot_count_; ++i) {
    Header(i)->generation = generation_floor;
    Header(i)->size = 0;
  }
}

uint32_t SegmentPage::BucketFor(size_t payload_size) {
  const size_t needed =
      std::max(kMinSlotSize, std::bit_ceil(payload_size + kSlotHeaderSize));
  if (std::bit_floor(SlotAreaSize()) < needed) {
    return 0;
  }
  return static_cast<uint32_t>(needed);
}

size_t SegmentPage::MaxPayloadSize() {
  return std::bit_floor(SlotAreaSize()) - kSlotHeaderSize;
}

bool SegmentPage::IsUsed(slot_t slot) const {
  if (slot_count_ <= slot) {
    return false;
  }
  return (bitmap_[slot / 64] >> (slot % 64)) & 1;
}

generation_t SegmentPage::Generation(slot_t slot) const {
  return Header(slot)->generation;
}

uint32_t SegmentPage::Flags(slot_t slot) const {
  return Header(slot)->size & ~kSizeMask;
}

std::string_view SegmentPage::Read(slot_t slot) const {
  const SlotHeader* header = Header(slot);
  return {reinterpret_cast<const char*>(header) + kSlotHeaderSize,
          header->size & kSizeMask};
}

StatusOr<slot_t> SegmentPage::Allocate() {
  if (IsFull()) {
    return Status::kNoSpace;
  }
  for (size_t word = 0; word * 64 < slot_count_; ++word) {
    if (bitmap_[word] == ~0ULL) {
      continue;
    }
    const auto bit = static_cast<size_t>(std::countr_one(bitmap_[word]));
    const auto slot = static_cast<slot_t>(word * 64 + bit);
    if (slot_count_ <= slot) {
      break;
    }
    bitmap_[word] |= 1ULL << bit;
    ++live_count_;
    Header(slot)->size = 0;
    return slot;
  }
  return Status::kNoSpace;
}

Status SegmentPage::Write(slot_t slot, std::string_view payload,
                          uint32_t flags) {
  if (!IsUsed(slot)) {
    return Status::kInvalidId;
  }
  if (Capacity() < payload.size()) {
    return Status::kTooBigData;
  }
  SlotHeader* header = Header(slot);
  header->size = static_cast<uint32_t>(payload.size()) | flags;
  memcpy(reinterpret_cast<char*>(header) + kSlotHeaderSize, payload.data(),
         payload.size());
  return Status::kSuccess;
}

void SegmentPage::Free(slot_t slot) {
  if (!IsUsed(slot)) {
    return;
  }
  bitmap_[slot / 64] &= ~(1ULL << (slot % 64));
  --live_count_;
  SlotHeader* header = Header(slot);
  header->generation++;
  header->size = 0;
}

generation_t SegmentPage::NextGenerationFloor() const {
  generation_t max_generation = generation_floor_;
  for (slot_t i = 0; i < slot_count_; ++i) {
    max_generation = std::max(max_generation, Header(i)->generation);
  }
  return max_generation + 1;
}

void SegmentPage::Dump(std::ostream& o, int indent) const {
  o << "[Type: " << type_id_ << " SlotSize: " << slot_size_
    << " Live: " << live_count_ << "/" << slot_count_ << "]";
  for (slot_t i = 0; i < slot_count_; ++i) {
    if (!IsUsed(i)) {
      continue;
    }
    o << "\n" << Indent(indent + 2) << i << "@" << Generation(i);
    if (Flags(i) & kForwardFlag) {
      o << " ->";
    } else if (Flags(i) & kMovedFlag) {
      o << " <-";
    }
    o << " " << OmittedString(Read(i), 32);
  }
}

}  // namespace structsy
