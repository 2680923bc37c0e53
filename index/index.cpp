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

#include "index/index.hpp"

#include <ostream>
#include <utility>

#include "common/decoder.hpp"
#include "common/encoder.hpp"
#include "common/log_message.hpp"
#include "common/serdes.hpp"
#include "transaction/transaction.hpp"
#include "type/key_codec.hpp"

namespace structsy {

StatusOr<Index> Index::Create(Transaction& txn, std::string_view name,
                              IndexMode mode, slot_t field) {
  if (mode == IndexMode::kNone) {
    return Status::kInvalidArgument;
  }
  ASSIGN_OR_RETURN(BPlusTree, tree, BPlusTree::Create(txn));
  return Index(name, mode, field, tree.Root());
}

Status Index::Put(Transaction& txn, std::string_view key,
                  const Rid& rid) const {
  BPlusTree tree = Tree();
  if (IsExclusive()) {
    StatusOr<std::string> existing = tree.Read(txn, key);
    if (existing.HasValue()) {
      ASSIGN_OR_RETURN(Rid, owner, Rid::Deserialize(existing.Value()));
      if (owner == rid) {
        return Status::kSuccess;
      }
      LOG(DEBUG) << "index " << name_ << " already maps key to " << owner;
      return Status::kDuplicates;
    }
    if (existing.GetStatus() != Status::kNotExists) {
      return existing.GetStatus();
    }
    return tree.Insert(txn, key, rid.Serialize());
  }
  std::string tree_key(key);
  AppendBigEndian64(&tree_key, txn.CommitLSN());
  AppendBigEndian32(&tree_key, txn.NextSequence());
  return tree.Insert(txn, tree_key, rid.Serialize());
}

Status Index::Remove(Transaction& txn, std::string_view key,
                     const Rid& rid) const {
  BPlusTree tree = Tree();
  const std::string serialized = rid.Serialize();
  if (IsExclusive()) {
    ASSIGN_OR_RETURN(std::string, existing, tree.Read(txn, key));
    if (existing != serialized) {
      return Status::kNotExists;
    }
    return tree.Delete(txn, key);
  }
  const KeyRange bucket = KeyRange::Prefix(key);
  std::string victim;
  bool found = false;
  for (BPlusTreeIterator it = tree.Begin(txn, bucket); it.IsValid(); ++it) {
    if (it.Key().size() == key.size() + kClusterSuffixSize &&
        it.Value() == serialized) {
      victim = std::string(it.Key());
      found = true;
      break;
    }
  }
  if (!found) {
    return Status::kNotExists;
  }
  return tree.Delete(txn, victim);
}

Status Index::CheckUnique(const PageSource& src, std::string_view key,
                          const Rid& self) const {
  if (!IsExclusive()) {
    return Status::kSuccess;
  }
  StatusOr<std::string> existing = Tree().Read(src, key);
  if (!existing.HasValue()) {
    return existing.GetStatus() == Status::kNotExists ? Status::kSuccess
                                                      : existing.GetStatus();
  }
  ASSIGN_OR_RETURN(Rid, owner, Rid::Deserialize(existing.Value()));
  return owner == self ? Status::kSuccess : Status::kDuplicates;
}

KeyRange Index::TreeRange(const KeyRange& range) const {
  if (IsExclusive()) {
    return range;
  }
  KeyRange ret;
  if (range.lower.has_value()) {
    if (range.lower->inclusive) {
      ret.lower = KeyBound{range.lower->key, true};
    } else {
      std::string successor = PrefixSuccessor(range.lower->key);
      if (successor.empty()) {
        return KeyRange::None();
      }
      ret.lower = KeyBound{std::move(successor), true};
    }
  }
  if (range.upper.has_value()) {
    if (range.upper->inclusive) {
      std::string successor = PrefixSuccessor(range.upper->key);
      if (!successor.empty()) {
        ret.upper = KeyBound{std::move(successor), false};
      }
    } else {
      ret.upper = KeyBound{range.upper->key, false};
    }
  }
  return ret;
}

IndexScanIterator Index::Scan(const PageSource& src, const KeyRange& range,
                              bool ascending) const {
  BPlusTree tree = Tree();
  return {tree.Begin(src, TreeRange(range), ascending), !IsExclusive()};
}

StatusOr<std::vector<Rid>> Index::Point(const PageSource& src,
                                        std::string_view key) const {
  std::vector<Rid> ret;
  IndexScanIterator it = Scan(src, KeyRange::Point(key));
  for (; it.IsValid(); ++it) {
    ASSIGN_OR_RETURN(Rid, rid, it.GetRid());
    ret.push_back(rid);
  }
  RETURN_IF_FAIL(it.GetStatus());
  return ret;
}

Encoder& operator<<(Encoder& a, const Index& idx) {
  a << idx.name_ << static_cast<uint8_t>(idx.mode_) << idx.field_
    << idx.root_;
  return a;
}

Decoder& operator>>(Decoder& e, Index& idx) {
  uint8_t mode = 0;
  e >> idx.name_ >> mode >> idx.field_ >> idx.root_;
  if (mode != static_cast<uint8_t>(IndexMode::kCluster) &&
      mode != static_cast<uint8_t>(IndexMode::kExclusive)) {
    e.Fail();
  }
  idx.mode_ = static_cast<IndexMode>(mode);
  return e;
}

void Index::Dump(std::ostream& o) const {
  o << "Index: " << name_ << " (" << ToString(mode_) << ") Field: " << field_
    << " Root: " << root_;
}

std::ostream& operator<<(std::ostream& o, const Index& rhs) {
  rhs.Dump(o);
  return o;
}

}  // namespace structsy
