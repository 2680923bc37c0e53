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

#ifndef STRUCTSY_TABLE_HPP
#define STRUCTSY_TABLE_HPP

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/status_or.hpp"
#include "index/index.hpp"
#include "page/segment_manager.hpp"
#include "table/iterator.hpp"
#include "type/record.hpp"
#include "type/rid.hpp"
#include "type/struct_descriptor.hpp"

namespace structsy {

class PageSource;
class Transaction;

// The records of one struct type, and the indexes over them.
//
// Validation and the exclusive key check happen before anything is
// written, so their failures leave the transaction usable. A failure after
// the first write marks the transaction as failed.
class Table {
 public:
  Table(std::shared_ptr<const StructDescriptor> desc, std::vector<Index> indexes,
        SegmentManager* segments, const SchemaResolver* resolver)
      : desc_(std::move(desc)),
        indexes_(std::move(indexes)),
        segments_(segments),
        resolver_(resolver) {}
  Table(const Table&) = delete;
  Table& operator=(const Table&) = delete;

  StatusOr<Rid> Insert(Transaction& txn, const Record& record);
  // kInvalidId when |rid| is not a live record of this type.
  Status Update(Transaction& txn, const Rid& rid, const Record& record);
  Status Delete(Transaction& txn, const Rid& rid);
  // Rewrites |rid|, stored as a record of |previous|, as |record| of this
  // table. Both tables share one type id. Keys move from the indexes of
  // |previous| to ours.
  Status Adopt(Transaction& txn, const Table& previous, const Rid& rid,
               const Record& record);
  [[nodiscard]] StatusOr<Record> Read(const PageSource& src,
                                      const Rid& rid) const;

  // Every live record, in segment order.
  [[nodiscard]] Iterator BeginFullScan(const PageSource& src) const;

  [[nodiscard]] const StructDescriptor& Descriptor() const { return *desc_; }
  [[nodiscard]] const std::shared_ptr<const StructDescriptor>& DescriptorPtr()
      const {
    return desc_;
  }
  [[nodiscard]] type_id_t TypeID() const { return desc_->TypeID(); }
  [[nodiscard]] const std::vector<Index>& Indexes() const { return indexes_; }
  // nullptr when |field| has no index.
  [[nodiscard]] const Index* IndexOnField(slot_t field) const;
  [[nodiscard]] const Index* IndexByName(std::string_view name) const;
  [[nodiscard]] const SchemaResolver& Resolver() const { return *resolver_; }

 private:
  friend class FullScanIterator;

  // Encoded index keys of |record|, one list per entry of indexes_.
  typedef std::vector<std::vector<std::string>> KeySets;

  // A record as found through its Rid: the home slot and, for relocated
  // records, the slot really holding the bytes.
  struct Location {
    SlotView home;
    bool relocated = false;
    Rid target;
    SlotView data;
  };

  StatusOr<Location> Locate(const PageSource& src, const Rid& rid) const;
  StatusOr<KeySets> KeysOf(const Record& record) const;
  Status CheckExclusive(const Transaction& txn, const KeySets& keys,
                        const Rid& self) const;
  Status StoreRelocated(Transaction& txn, const Rid& home,
                        std::string_view payload);
  Status WritePayload(Transaction& txn, const Rid& rid, const Location& loc,
                      std::string_view payload);
  Status ApplyKeyDiff(Transaction& txn, const Rid& rid, const KeySets& before,
                      const KeySets& after) const;

  std::shared_ptr<const StructDescriptor> desc_;
  std::vector<Index> indexes_;
  // Not owned by this class.
  SegmentManager* const segments_;
  const SchemaResolver* const resolver_;
};

}  // namespace structsy

#endif  // STRUCTSY_TABLE_HPP
