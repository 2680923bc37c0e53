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

#ifndef STRUCTSY_SEGMENT_PAGE_HPP
#define STRUCTSY_SEGMENT_PAGE_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>

#include "common/constants.hpp"
#include "common/status_or.hpp"

namespace structsy {

// A page of fixed-size slots, all holding records of one type.
// Each slot starts with {generation u32, size u32}; the two high bits of the
// size word mark forwarding stubs and relocated records.
class SegmentPage final {
  struct SlotHeader {
    generation_t generation;
    uint32_t size;
  };

 public:
  static constexpr size_t kMinSlotSize = 32;
  static constexpr size_t kMaxSlots = 1024;
  static constexpr size_t kSlotHeaderSize = sizeof(SlotHeader);
  // The slot holds the Rid of the slot that really stores the record.
  static constexpr uint32_t kForwardFlag = 1U << 31;
  // The slot stores a record whose Rid points at a forwarding stub.
  static constexpr uint32_t kMovedFlag = 1U << 30;
  static constexpr uint32_t kSizeMask = kMovedFlag - 1;

  void Initialize(type_id_t type_id, uint32_t slot_size,
                  generation_t generation_floor);

  // The smallest slot size able to hold |payload_size| bytes, or 0 when no
  // bucket is large enough.
  static uint32_t BucketFor(size_t payload_size);
  static size_t MaxPayloadSize();

  [[nodiscard]] type_id_t TypeID() const { return type_id_; }
  [[nodiscard]] uint32_t SlotSize() const { return slot_size_; }
  [[nodiscard]] size_t Capacity() const { return slot_size_ - kSlotHeaderSize; }
  [[nodiscard]] slot_t SlotCount() const { return slot_count_; }
  [[nodiscard]] slot_t LiveCount() const { return live_count_; }
  [[nodiscard]] bool IsFull() const { return live_count_ == slot_count_; }
  [[nodiscard]] bool IsEmpty() const { return live_count_ == 0; }

  [[nodiscard]] bool IsUsed(slot_t slot) const;
  [[nodiscard]] generation_t Generation(slot_t slot) const;
  [[nodiscard]] uint32_t Flags(slot_t slot) const;
  [[nodiscard]] std::string_view Read(slot_t slot) const;

  // Marks the first free slot used. kNoSpace when the segment is full.
  StatusOr<slot_t> Allocate();
  Status Write(slot_t slot, std::string_view payload, uint32_t flags = 0);
  // Marks |slot| free and advances its generation.
  void Free(slot_t slot);
  // One past the largest generation any slot has handed out.
  [[nodiscard]] generation_t NextGenerationFloor() const;

  void Dump(std::ostream& o, int indent) const;

 private:
  [[nodiscard]] static size_t SlotAreaSize();
  SlotHeader* Header(slot_t slot) {
    return reinterpret_cast<SlotHeader*>(slots_ + slot * slot_size_);
  }
  [[nodiscard]] const SlotHeader* Header(slot_t slot) const {
    return reinterpret_cast<const SlotHeader*>(slots_ + slot * slot_size_);
  }

  type_id_t type_id_;
  uint32_t slot_size_;
  slot_t slot_count_;
  slot_t live_count_;
  generation_t generation_floor_;
  uint64_t bitmap_[kMaxSlots / 64];
  char slots_[0];
};

}  // namespace structsy

#endif  // STRUCTSY_SEGMENT_PAGE_HPP
