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

#ifndef STRUCTSY_INDEX_SCAN_ITERATOR_HPP
#define STRUCTSY_INDEX_SCAN_ITERATOR_HPP

#include <string_view>
#include <utility>

#include "common/constants.hpp"
#include "common/status_or.hpp"
#include "index/b_plus_tree_iterator.hpp"
#include "type/rid.hpp"

namespace structsy {

// Yields (encoded key, Rid) pairs of an index in key order.
class IndexScanIterator {
 public:
  IndexScanIterator(BPlusTreeIterator&& iter, bool clustered)
      : iter_(std::move(iter)), clustered_(clustered) {}

  [[nodiscard]] bool IsValid() const { return iter_.IsValid(); }
  [[nodiscard]] Status GetStatus() const { return iter_.GetStatus(); }
  // The user key without the cluster suffix.
  [[nodiscard]] std::string_view Key() const;
  [[nodiscard]] StatusOr<Rid> GetRid() const {
    return Rid::Deserialize(iter_.Value());
  }
  IndexScanIterator& operator++() {
    ++iter_;
    return *this;
  }

 private:
  BPlusTreeIterator iter_;
  bool clustered_;
};

}  // namespace structsy

#endif  // STRUCTSY_INDEX_SCAN_ITERATOR_HPP
