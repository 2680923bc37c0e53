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

#include "table/table.hpp"

#include <algorithm>
#include <iterator>

#include "common/log_message.hpp"
#include "page/page.hpp"
#include "page/page_source.hpp"
#include "table/full_scan_iterator.hpp"
#include "transaction/transaction.hpp"
#include "type/key_codec.hpp"
#include "type/record_codec.hpp"

namespace structsy {

const Index* Table::IndexOnField(slot_t field) const {
  for (const auto& idx : indexes_) {
    if (idx.Field() == field) {
      return &idx;
    }
  }
  return nullptr;
}

const Index* Table::IndexByName(std::string_view name) const {
  for (const auto& idx : indexes_) {
    if (idx.Name() == name) {
      return &idx;
    }
  }
  return nullptr;
}

StatusOr<Table::Location> Table::Locate(const PageSource& src,
                                        const Rid& rid) const {
  if (rid.type_id != TypeID()) {
    return Status::kInvalidId;
  }
  Location loc;
  ASSIGN_OR_RETURN(SlotView, home, segments_->ReadSlot(src, rid));
  loc.home = std::move(home);
  if ((loc.home.flags & SegmentPage::kMovedFlag) != 0) {
    // Only reachable through its forwarding stub.
    return Status::kNotExists;
  }
  if ((loc.home.flags & SegmentPage::kForwardFlag) == 0) {
    loc.data = loc.home;
    return loc;
  }
  ASSIGN_OR_RETURN(Rid, target, Rid::Deserialize(loc.home.payload));
  StatusOr<SlotView> data = segments_->ReadSlot(src, target);
  if (!data.HasValue() ||
      (data.Value().flags & SegmentPage::kMovedFlag) == 0) {
    LOG(ERROR) << "forwarding stub " << rid << " points at missing " << target;
    return Status::kBackingStoreError;
  }
  loc.relocated = true;
  loc.target = target;
  loc.data = data.MoveValue();
  return loc;
}

StatusOr<Table::KeySets> Table::KeysOf(const Record& record) const {
  KeySets ret;
  ret.reserve(indexes_.size());
  for (const auto& idx : indexes_) {
    const FieldDescriptor& field = desc_->GetField(idx.Field());
    ASSIGN_OR_RETURN(std::vector<std::string>, keys,
                     IndexKeysOf(field.type, record.Get(idx.Field())));
    ret.push_back(std::move(keys));
  }
  return ret;
}

Status Table::CheckExclusive(const Transaction& txn, const KeySets& keys,
                             const Rid& self) const {
  for (size_t i = 0; i < indexes_.size(); ++i) {
    if (!indexes_[i].IsExclusive()) {
      continue;
    }
    for (const auto& key : keys[i]) {
      Status s = indexes_[i].CheckUnique(txn, key, self);
      if (s == Status::kDuplicates) {
        LOG(INFO) << desc_->Name() << "."
                  << desc_->GetField(indexes_[i].Field()).name
                  << " already holds the key";
      }
      RETURN_IF_FAIL(s);
    }
  }
  return Status::kSuccess;
}

Status Table::ApplyKeyDiff(Transaction& txn, const Rid& rid,
                           const KeySets& before, const KeySets& after) const {
  for (size_t i = 0; i < indexes_.size(); ++i) {
    std::vector<std::string> removed;
    std::vector<std::string> added;
    std::set_difference(before[i].begin(), before[i].end(), after[i].begin(),
                        after[i].end(), std::back_inserter(removed));
    std::set_difference(after[i].begin(), after[i].end(), before[i].begin(),
                        before[i].end(), std::back_inserter(added));
    for (const auto& key : removed) {
      RETURN_IF_FAIL(indexes_[i].Remove(txn, key, rid));
    }
    for (const auto& key : added) {
      RETURN_IF_FAIL(indexes_[i].Put(txn, key, rid));
    }
  }
  return Status::kSuccess;
}

StatusOr<Rid> Table::Insert(Transaction& txn, const Record& record) {
  RETURN_IF_FAIL(txn.CheckUsable());
  ASSIGN_OR_RETURN(std::string, payload,
                   EncodeRecord(*desc_, record, *resolver_));
  if (SegmentPage::BucketFor(payload.size()) == 0) {
    LOG(WARN) << desc_->Name() << " record of " << payload.size()
              << " bytes is too big";
    return Status::kTooBigData;
  }
  ASSIGN_OR_RETURN(KeySets, keys, KeysOf(record));
  RETURN_IF_FAIL(CheckExclusive(txn, keys, Rid()));

  StatusOr<Rid> rid = segments_->AllocateSlot(txn, TypeID(), payload.size());
  if (!rid.HasValue()) {
    return txn.Fail(rid.GetStatus());
  }
  Status s = segments_->WriteSlot(txn, rid.Value(), payload);
  if (s == Status::kSuccess) {
    s = ApplyKeyDiff(txn, rid.Value(), KeySets(indexes_.size()), keys);
  }
  if (s != Status::kSuccess) {
    return txn.Fail(s);
  }
  return rid;
}

Status Table::StoreRelocated(Transaction& txn, const Rid& home,
                             std::string_view payload) {
  ASSIGN_OR_RETURN(Rid, moved,
                   segments_->AllocateSlot(txn, TypeID(), payload.size()));
  RETURN_IF_FAIL(
      segments_->WriteSlot(txn, moved, payload, SegmentPage::kMovedFlag));
  return segments_->WriteSlot(txn, home, moved.Serialize(),
                              SegmentPage::kForwardFlag);
}

Status Table::WritePayload(Transaction& txn, const Rid& rid,
                           const Location& loc, std::string_view payload) {
  if (!loc.relocated) {
    if (SegmentManager::FitsSlotOf(loc.home, payload.size())) {
      return segments_->WriteSlot(txn, rid, payload);
    }
    LOG(TRACE) << rid << " outgrows its slot";
    return StoreRelocated(txn, rid, payload);
  }
  if (SegmentManager::FitsSlotOf(loc.data, payload.size())) {
    return segments_->WriteSlot(txn, loc.target, payload,
                                SegmentPage::kMovedFlag);
  }
  if (SegmentManager::FitsSlotOf(loc.home, payload.size())) {
    RETURN_IF_FAIL(segments_->WriteSlot(txn, rid, payload));
  } else {
    RETURN_IF_FAIL(StoreRelocated(txn, rid, payload));
  }
  return segments_->FreeSlot(txn, loc.target);
}

Status Table::Update(Transaction& txn, const Rid& rid, const Record& record) {
  RETURN_IF_FAIL(txn.CheckUsable());
  StatusOr<Location> loc = Locate(txn, rid);
  if (loc.GetStatus() == Status::kNotExists) {
    return Status::kInvalidId;
  }
  RETURN_IF_FAIL(loc.GetStatus());
  ASSIGN_OR_RETURN(Record, before,
                   DecodeRecord(*desc_, loc.Value().data.payload, *resolver_));
  ASSIGN_OR_RETURN(std::string, payload,
                   EncodeRecord(*desc_, record, *resolver_));
  if (SegmentPage::BucketFor(payload.size()) == 0) {
    return Status::kTooBigData;
  }
  ASSIGN_OR_RETURN(KeySets, old_keys, KeysOf(before));
  ASSIGN_OR_RETURN(KeySets, new_keys, KeysOf(record));
  RETURN_IF_FAIL(CheckExclusive(txn, new_keys, rid));

  Status s = WritePayload(txn, rid, loc.Value(), payload);
  if (s == Status::kSuccess) {
    s = ApplyKeyDiff(txn, rid, old_keys, new_keys);
  }
  if (s != Status::kSuccess) {
    return txn.Fail(s);
  }
  return Status::kSuccess;
}

Status Table::Delete(Transaction& txn, const Rid& rid) {
  RETURN_IF_FAIL(txn.CheckUsable());
  StatusOr<Location> loc = Locate(txn, rid);
  if (loc.GetStatus() == Status::kNotExists) {
    return Status::kInvalidId;
  }
  RETURN_IF_FAIL(loc.GetStatus());
  ASSIGN_OR_RETURN(Record, before,
                   DecodeRecord(*desc_, loc.Value().data.payload, *resolver_));
  ASSIGN_OR_RETURN(KeySets, old_keys, KeysOf(before));
  const bool relocated = loc.Value().relocated;
  const Rid target = loc.Value().target;

  Status s = ApplyKeyDiff(txn, rid, old_keys, KeySets(indexes_.size()));
  if (s == Status::kSuccess && relocated) {
    s = segments_->FreeSlot(txn, target);
  }
  if (s == Status::kSuccess) {
    s = segments_->FreeSlot(txn, rid);
  }
  if (s != Status::kSuccess) {
    return txn.Fail(s);
  }
  return Status::kSuccess;
}

Status Table::Adopt(Transaction& txn, const Table& previous, const Rid& rid,
                    const Record& record) {
  RETURN_IF_FAIL(txn.CheckUsable());
  if (previous.TypeID() != TypeID()) {
    return Status::kInvalidArgument;
  }
  StatusOr<Location> loc = Locate(txn, rid);
  if (loc.GetStatus() == Status::kNotExists) {
    return Status::kInvalidId;
  }
  RETURN_IF_FAIL(loc.GetStatus());
  ASSIGN_OR_RETURN(Record, before,
                   DecodeRecord(previous.Descriptor(),
                                loc.Value().data.payload, previous.Resolver()));
  ASSIGN_OR_RETURN(std::string, payload,
                   EncodeRecord(*desc_, record, *resolver_));
  if (SegmentPage::BucketFor(payload.size()) == 0) {
    return Status::kTooBigData;
  }
  ASSIGN_OR_RETURN(KeySets, old_keys, previous.KeysOf(before));
  ASSIGN_OR_RETURN(KeySets, new_keys, KeysOf(record));
  RETURN_IF_FAIL(CheckExclusive(txn, new_keys, rid));

  Status s = previous.ApplyKeyDiff(txn, rid, old_keys,
                                   KeySets(previous.indexes_.size()));
  if (s == Status::kSuccess) {
    s = WritePayload(txn, rid, loc.Value(), payload);
  }
  if (s == Status::kSuccess) {
    s = ApplyKeyDiff(txn, rid, KeySets(indexes_.size()), new_keys);
  }
  if (s != Status::kSuccess) {
    return txn.Fail(s);
  }
  return Status::kSuccess;
}

StatusOr<Record> Table::Read(const PageSource& src, const Rid& rid) const {
  ASSIGN_OR_RETURN(Location, loc, Locate(src, rid));
  return DecodeRecord(*desc_, loc.data.payload, *resolver_);
}

Iterator Table::BeginFullScan(const PageSource& src) const {
  return Iterator(new FullScanIterator(this, &src));
}

}  // namespace structsy
