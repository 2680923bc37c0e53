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

#include "index/b_plus_tree_iterator.hpp"

#include <utility>
#include <vector>

#include "common/log_message.hpp"
#include "index/b_plus_tree.hpp"
#include "page/page.hpp"
#include "page/page_source.hpp"

namespace structsy {

BPlusTreeIterator::BPlusTreeIterator(const BPlusTree* tree,
                                     const PageSource* src, KeyRange range,
                                     bool ascending)
    : tree_(tree), src_(src), range_(std::move(range)), ascending_(ascending) {
  if (range_.IsEmpty()) {
    return;
  }
  if (ascending_) {
    SeekFirst();
  } else {
    SeekLast();
  }
}

void BPlusTreeIterator::Fail(Status s) {
  LOG(ERROR) << "tree scan on " << tree_->Root() << " stopped: " << s;
  status_ = s;
  valid_ = false;
  page_ = PageRef();
}

void BPlusTreeIterator::SeekFirst() {
  if (range_.lower.has_value()) {
    const KeyBound& lower = *range_.lower;
    std::vector<page_id_t> path;
    Status s = tree_->FindLeaf(*src_, lower.key, &path);
    if (s != Status::kSuccess) {
      return Fail(s);
    }
    StatusOr<PageRef> leaf = src_->GetPage(path.back());
    if (!leaf.HasValue()) {
      return Fail(leaf.GetStatus());
    }
    page_ = leaf.MoveValue();
    const LeafPage& lp = page_.GetLeafPage();
    idx_ = static_cast<int>(lp.Find(lower.key));
    if (!lower.inclusive && idx_ < lp.RowCount() &&
        lp.GetKey(idx_) == lower.key) {
      ++idx_;
    }
  } else {
    StatusOr<PageRef> leaf = tree_->LeftmostPage(*src_);
    if (!leaf.HasValue()) {
      return Fail(leaf.GetStatus());
    }
    page_ = leaf.MoveValue();
    idx_ = 0;
  }
  valid_ = true;
  Normalize();
}

void BPlusTreeIterator::SeekLast() {
  if (range_.upper.has_value()) {
    const KeyBound& upper = *range_.upper;
    std::vector<page_id_t> path;
    Status s = tree_->FindLeaf(*src_, upper.key, &path);
    if (s != Status::kSuccess) {
      return Fail(s);
    }
    StatusOr<PageRef> leaf = src_->GetPage(path.back());
    if (!leaf.HasValue()) {
      return Fail(leaf.GetStatus());
    }
    page_ = leaf.MoveValue();
    const LeafPage& lp = page_.GetLeafPage();
    idx_ = static_cast<int>(lp.Find(upper.key));
    if (!(upper.inclusive && idx_ < lp.RowCount() &&
          lp.GetKey(idx_) == upper.key)) {
      --idx_;
    }
  } else {
    StatusOr<PageRef> leaf = tree_->RightmostPage(*src_);
    if (!leaf.HasValue()) {
      return Fail(leaf.GetStatus());
    }
    page_ = leaf.MoveValue();
    idx_ = static_cast<int>(page_.GetLeafPage().RowCount()) - 1;
  }
  valid_ = true;
  Normalize();
}

void BPlusTreeIterator::Normalize() {
  for (;;) {
    const LeafPage& lp = page_.GetLeafPage();
    if (0 <= idx_ && idx_ < lp.RowCount()) {
      break;
    }
    const page_id_t next = ascending_ ? lp.NextPID() : lp.PrevPID();
    if (next == 0) {
      valid_ = false;
      page_ = PageRef();
      return;
    }
    StatusOr<PageRef> leaf = src_->GetPage(next);
    if (!leaf.HasValue()) {
      return Fail(leaf.GetStatus());
    }
    if (leaf.Value()->Type() != PageType::kLeafPage) {
      return Fail(Status::kBackingStoreError);
    }
    page_ = leaf.MoveValue();
    idx_ = ascending_
               ? 0
               : static_cast<int>(page_.GetLeafPage().RowCount()) - 1;
  }
  CheckBound();
}

void BPlusTreeIterator::CheckBound() {
  const std::string_view key = Key();
  if (ascending_ ? !range_.BelowUpper(key) : !range_.AboveLower(key)) {
    valid_ = false;
    page_ = PageRef();
  }
}

std::string_view BPlusTreeIterator::Key() const {
  return page_.GetLeafPage().GetKey(idx_);
}

std::string_view BPlusTreeIterator::Value() const {
  return page_.GetLeafPage().GetValue(idx_);
}

BPlusTreeIterator& BPlusTreeIterator::operator++() {
  if (!valid_) {
    return *this;
  }
  if (ascending_) {
    ++idx_;
  } else {
    --idx_;
  }
  Normalize();
  return *this;
}

}  // namespace structsy
