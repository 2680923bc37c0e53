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

#ifndef STRUCTSY_B_PLUS_TREE_ITERATOR_HPP
#define STRUCTSY_B_PLUS_TREE_ITERATOR_HPP

#include <string_view>

#include "common/constants.hpp"
#include "index/key_range.hpp"
#include "page/page_ref.hpp"

namespace structsy {

class BPlusTree;
class PageSource;

// Walks the leaves of a tree inside |range|, in either direction. The
// current leaf stays pinned so the source may change underneath without
// invalidating Key() and Value().
class BPlusTreeIterator {
 public:
  BPlusTreeIterator(const BPlusTree* tree, const PageSource* src,
                    KeyRange range, bool ascending);

  [[nodiscard]] bool IsValid() const { return valid_; }
  // Non-success when the walk stopped on an error instead of the range end.
  [[nodiscard]] Status GetStatus() const { return status_; }
  [[nodiscard]] std::string_view Key() const;
  [[nodiscard]] std::string_view Value() const;

  // Moves one entry in the scan direction.
  BPlusTreeIterator& operator++();

 private:
  void Fail(Status s);
  void SeekFirst();
  void SeekLast();
  // Leaves |page_| on an existing entry, stepping over empty leaves.
  void Normalize();
  void CheckBound();

  const BPlusTree* tree_;
  const PageSource* src_;
  KeyRange range_;
  bool ascending_;
  PageRef page_;
  int idx_ = 0;
  bool valid_ = false;
  Status status_ = Status::kSuccess;
};

}  // namespace structsy

#endif  // STRUCTSY_B_PLUS_TREE_ITERATOR_HPP
