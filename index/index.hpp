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

#ifndef STRUCTSY_INDEX_HPP
#define STRUCTSY_INDEX_HPP

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "common/constants.hpp"
#include "common/status_or.hpp"
#include "index/b_plus_tree.hpp"
#include "index/index_scan_iterator.hpp"
#include "index/key_range.hpp"
#include "type/rid.hpp"
#include "type/struct_descriptor.hpp"

namespace structsy {

class Encoder;
class Decoder;
class PageSource;
class Transaction;

// A secondary index over one field of a struct.
//
// Exclusive indexes map each encoded key to exactly one Rid. Cluster
// indexes keep every record for a key: the tree key is the encoded key
// followed by the committing LSN and a per-commit sequence, so entries of
// one key come back in insertion order.
class Index {
 public:
  // Bytes appended to each cluster entry key.
  static constexpr size_t kClusterSuffixSize =
      sizeof(uint64_t) + sizeof(uint32_t);

  Index() = default;
  Index(std::string_view name, IndexMode mode, slot_t field, page_id_t root)
      : name_(name), mode_(mode), field_(field), root_(root) {}

  static StatusOr<Index> Create(Transaction& txn, std::string_view name,
                                IndexMode mode, slot_t field);

  [[nodiscard]] const std::string& Name() const { return name_; }
  [[nodiscard]] IndexMode Mode() const { return mode_; }
  [[nodiscard]] bool IsExclusive() const {
    return mode_ == IndexMode::kExclusive;
  }
  [[nodiscard]] slot_t Field() const { return field_; }
  [[nodiscard]] page_id_t Root() const { return root_; }

  // Exclusive mode fails with kDuplicates when another record has |key|.
  Status Put(Transaction& txn, std::string_view key, const Rid& rid) const;
  Status Remove(Transaction& txn, std::string_view key, const Rid& rid) const;
  // kDuplicates if some record other than |self| owns |key|.
  [[nodiscard]] Status CheckUnique(const PageSource& src, std::string_view key,
                                   const Rid& self) const;

  // |range| is over encoded user keys in both modes.
  [[nodiscard]] IndexScanIterator Scan(const PageSource& src,
                                       const KeyRange& range,
                                       bool ascending = true) const;
  [[nodiscard]] StatusOr<std::vector<Rid>> Point(const PageSource& src,
                                                 std::string_view key) const;

  bool operator==(const Index& rhs) const = default;
  friend Encoder& operator<<(Encoder& a, const Index& idx);
  friend Decoder& operator>>(Decoder& e, Index& idx);
  void Dump(std::ostream& o) const;
  friend std::ostream& operator<<(std::ostream& o, const Index& rhs);

 private:
  [[nodiscard]] BPlusTree Tree() const { return BPlusTree(root_); }
  // Translates a range of user keys into a range of cluster tree keys.
  [[nodiscard]] KeyRange TreeRange(const KeyRange& range) const;

  std::string name_;
  IndexMode mode_ = IndexMode::kNone;
  slot_t field_ = 0;
  page_id_t root_ = 0;
};

}  // namespace structsy

#endif  // STRUCTSY_INDEX_HPP
