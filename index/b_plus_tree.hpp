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

#ifndef STRUCTSY_B_PLUS_TREE_HPP
#define STRUCTSY_B_PLUS_TREE_HPP

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "common/constants.hpp"
#include "common/status_or.hpp"
#include "index/key_range.hpp"
#include "page/page_ref.hpp"

namespace structsy {

class BPlusTreeIterator;
class PageSource;
class Transaction;

/*
 * A persistent { string => string } map. The root page never moves: when
 * the root splits its content goes to a new child and the root becomes the
 * branch above it. Deletes never merge pages.
 */
class BPlusTree {
 public:
  explicit BPlusTree(page_id_t root) : root_(root) {}

  // Allocates an empty tree inside |txn|.
  static StatusOr<BPlusTree> Create(Transaction& txn);

  // kDuplicates when |key| exists.
  Status Insert(Transaction& txn, std::string_view key, std::string_view value);
  // kNotExists when |key| does not exist.
  Status Update(Transaction& txn, std::string_view key, std::string_view value);
  Status Delete(Transaction& txn, std::string_view key);
  [[nodiscard]] StatusOr<std::string> Read(const PageSource& src,
                                           std::string_view key) const;

  [[nodiscard]] BPlusTreeIterator Begin(const PageSource& src,
                                        const KeyRange& range = KeyRange(),
                                        bool ascending = true) const;

  [[nodiscard]] page_id_t Root() const { return root_; }
  void Dump(const PageSource& src, std::ostream& o, int indent = 0) const;
  bool operator==(const BPlusTree& rhs) const = default;

  // Checks key order, separators and sibling links.
  [[nodiscard]] bool SanityCheckForTest(const PageSource& src) const;

 private:
  friend class BPlusTreeIterator;

  // Pages from the root down to the leaf which may hold |key|.
  Status FindLeaf(const PageSource& src, std::string_view key,
                  std::vector<page_id_t>* path) const;
  StatusOr<PageRef> LeftmostPage(const PageSource& src) const;
  StatusOr<PageRef> RightmostPage(const PageSource& src) const;

  // Splits the full leaf at the end of |path| and inserts |key| on the
  // proper side.
  Status SplitLeafAndInsert(Transaction& txn, std::vector<page_id_t>& path,
                            std::string_view key, std::string_view value);
  // Adds separator |key| for |child| to the branch at path[level].
  Status InsertSeparator(Transaction& txn, std::vector<page_id_t>& path,
                         size_t level, std::string_view key, page_id_t child);
  // Moves the root content into a fresh page and returns it.
  StatusOr<Page*> GrowTreeHeight(Transaction& txn);

  void DumpPage(const PageSource& src, std::ostream& o, page_id_t pid,
                int indent) const;
  bool SanityCheck(const PageSource& src, page_id_t pid,
                   std::string_view lower, std::string_view upper,
                   bool has_upper) const;

  page_id_t root_;
};

}  // namespace structsy

#endif  // STRUCTSY_B_PLUS_TREE_HPP
