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

#ifndef STRUCTSY_SEGMENT_MANAGER_HPP
#define STRUCTSY_SEGMENT_MANAGER_HPP

#include <map>
#include <mutex>
#include <set>
#include <string_view>
#include <utility>
#include <vector>

#include "common/constants.hpp"
#include "common/status_or.hpp"
#include "page/page_ref.hpp"
#include "type/rid.hpp"

namespace structsy {

class PageSource;
class Transaction;

// Bytes of one slot. Holding it keeps the page version alive.
struct SlotView {
  PageRef page;
  std::string_view payload;
  uint32_t flags = 0;
};

// Keeps track of which pages hold segments of which type, and hands out
// slots in them.
// The directory may list pages that are no longer segments of the type
// (freed, reused, or allocated by a rolled back transaction). Every reader
// checks the page itself, so the list only has to be a superset.
class SegmentManager {
 public:
  SegmentManager() = default;
  SegmentManager(const SegmentManager&) = delete;
  SegmentManager& operator=(const SegmentManager&) = delete;

  // Rebuilds the directory from every page of |source|.
  Status Load(const PageSource& source);

  // kNotExists for a free slot or a stale generation, kInvalidId when |rid|
  // does not address a slot of a segment of its type.
  StatusOr<SlotView> ReadSlot(const PageSource& source, const Rid& rid) const;

  // Finds room for |payload_size| bytes in a segment of |type_id|, creating
  // a segment if needed. The slot is reserved but empty.
  StatusOr<Rid> AllocateSlot(Transaction& txn, type_id_t type_id,
                             size_t payload_size);
  Status WriteSlot(Transaction& txn, const Rid& rid, std::string_view payload,
                   uint32_t flags = 0);
  // Frees the slot. An emptied segment goes back to the free list.
  Status FreeSlot(Transaction& txn, const Rid& rid);

  // Whether |payload_size| bytes fit the slot |rid| lives in.
  [[nodiscard]] static bool FitsSlotOf(const SlotView& view,
                                       size_t payload_size);

  // Candidate segment pages of |type_id|, in page order.
  [[nodiscard]] std::vector<page_id_t> SegmentsOf(type_id_t type_id) const;

 private:
  void Register(type_id_t type_id, uint32_t slot_size, page_id_t pid);
  // Stops offering |pid| for new slots until this transaction aborts.
  void Withdraw(Transaction& txn, type_id_t type_id, uint32_t slot_size,
                page_id_t pid);
  static Status Verify(const PageRef& page, const Rid& rid);

  mutable std::mutex directory_latch_;
  std::map<type_id_t, std::set<page_id_t>> segments_;
  // Segments that had a free slot when last seen, by (type, slot size).
  std::map<std::pair<type_id_t, uint32_t>, std::set<page_id_t>> available_;
};

}  // namespace structsy

#endif  // STRUCTSY_SEGMENT_MANAGER_HPP
