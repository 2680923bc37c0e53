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

#include "index/b_plus_tree.hpp"

#include <cstring>
#include <ostream>

#include "common/debug.hpp"
#include "common/log_message.hpp"
#include "index/b_plus_tree_iterator.hpp"
#include "page/page.hpp"
#include "transaction/transaction.hpp"

namespace structsy {

StatusOr<BPlusTree> BPlusTree::Create(Transaction& txn) {
  ASSIGN_OR_RETURN(Page*, root, txn.AllocatePage(PageType::kLeafPage, nullptr));
  return BPlusTree(root->PageID());
}

Status BPlusTree::FindLeaf(const PageSource& src, std::string_view key,
                           std::vector<page_id_t>* path) const {
  page_id_t pid = root_;
  for (;;) {
    path->push_back(pid);
    ASSIGN_OR_RETURN(PageRef, page, src.GetPage(pid));
    if (page->Type() == PageType::kLeafPage) {
      return Status::kSuccess;
    }
    if (page->Type() != PageType::kBranchPage) {
      LOG(ERROR) << "tree " << root_ << " reaches " << page->Type()
                 << " page " << pid;
      return Status::kBackingStoreError;
    }
    pid = page.GetBranchPage().GetPageForKey(key);
  }
}

StatusOr<PageRef> BPlusTree::LeftmostPage(const PageSource& src) const {
  ASSIGN_OR_RETURN(PageRef, page, src.GetPage(root_));
  while (page->Type() == PageType::kBranchPage) {
    const page_id_t next = page.GetBranchPage().LowestPage();
    ASSIGN_OR_RETURN(PageRef, child, src.GetPage(next));
    page = std::move(child);
  }
  if (page->Type() != PageType::kLeafPage) {
    return Status::kBackingStoreError;
  }
  return page;
}

StatusOr<PageRef> BPlusTree::RightmostPage(const PageSource& src) const {
  ASSIGN_OR_RETURN(PageRef, page, src.GetPage(root_));
  while (page->Type() == PageType::kBranchPage) {
    const BranchPage& branch = page.GetBranchPage();
    const page_id_t next = branch.RowCount() == 0
                               ? branch.LowestPage()
                               : branch.GetValue(branch.RowCount() - 1);
    ASSIGN_OR_RETURN(PageRef, child, src.GetPage(next));
    page = std::move(child);
  }
  if (page->Type() != PageType::kLeafPage) {
    return Status::kBackingStoreError;
  }
  return page;
}

Status BPlusTree::Insert(Transaction& txn, std::string_view key,
                         std::string_view value) {
  if (LeafPage::kMaxCellSize < key.size() + value.size()) {
    return Status::kTooBigData;
  }
  std::vector<page_id_t> path;
  RETURN_IF_FAIL(FindLeaf(txn, key, &path));
  ASSIGN_OR_RETURN(Page*, leaf, txn.GetPageForWrite(path.back()));
  LeafPage& leaf_page = leaf->body.leaf_page;
  if (leaf_page.Read(key).HasValue()) {
    return Status::kDuplicates;
  }
  const Status rs = leaf_page.Insert(key, value);
  if (rs != Status::kNoSpace) {
    return rs;
  }
  return SplitLeafAndInsert(txn, path, key, value);
}

StatusOr<Page*> BPlusTree::GrowTreeHeight(Transaction& txn) {
  ASSIGN_OR_RETURN(Page*, root, txn.GetPageForWrite(root_));
  ASSIGN_OR_RETURN(Page*, child, txn.AllocatePage(root->Type(), nullptr));
  memcpy(&child->body, &root->body, sizeof(Page::PageBody));
  root->PageInit(root_, PageType::kBranchPage);
  root->body.branch_page.SetLowestPage(child->PageID());
  LOG(DEBUG) << "tree " << root_ << " grows into " << child->PageID();
  return child;
}

Status BPlusTree::SplitLeafAndInsert(Transaction& txn,
                                     std::vector<page_id_t>& path,
                                     std::string_view key,
                                     std::string_view value) {
  if (path.size() == 1) {
    ASSIGN_OR_RETURN(Page*, moved, GrowTreeHeight(txn));
    path.push_back(moved->PageID());
  }
  ASSIGN_OR_RETURN(Page*, leaf, txn.GetPageForWrite(path.back()));
  ASSIGN_OR_RETURN(Page*, right,
                   txn.AllocatePage(PageType::kLeafPage, nullptr));
  LeafPage& left_leaf = leaf->body.leaf_page;
  LeafPage& right_leaf = right->body.leaf_page;
  left_leaf.Split(right);

  right_leaf.SetNextPID(left_leaf.NextPID());
  right_leaf.SetPrevPID(leaf->PageID());
  if (left_leaf.NextPID() != 0) {
    ASSIGN_OR_RETURN(Page*, next, txn.GetPageForWrite(left_leaf.NextPID()));
    next->body.leaf_page.SetPrevPID(right->PageID());
  }
  left_leaf.SetNextPID(right->PageID());

  const std::string separator(right_leaf.GetKey(0));
  if (key < separator) {
    RETURN_IF_FAIL(left_leaf.Insert(key, value));
  } else {
    RETURN_IF_FAIL(right_leaf.Insert(key, value));
  }
  return InsertSeparator(txn, path, path.size() - 2, separator,
                         right->PageID());
}

Status BPlusTree::InsertSeparator(Transaction& txn,
                                  std::vector<page_id_t>& path, size_t level,
                                  std::string_view key, page_id_t child) {
  ASSIGN_OR_RETURN(Page*, node, txn.GetPageForWrite(path[level]));
  const Status rs = node->body.branch_page.Insert(key, child);
  if (rs != Status::kNoSpace) {
    return rs;
  }
  if (level == 0) {
    ASSIGN_OR_RETURN(Page*, moved, GrowTreeHeight(txn));
    path.insert(path.begin() + 1, moved->PageID());
    level = 1;
    node = moved;
  }
  ASSIGN_OR_RETURN(Page*, right,
                   txn.AllocatePage(PageType::kBranchPage, nullptr));
  std::string middle;
  node->body.branch_page.Split(right, &middle);
  BranchPage& target =
      key < middle ? node->body.branch_page : right->body.branch_page;
  RETURN_IF_FAIL(target.Insert(key, child));
  return InsertSeparator(txn, path, level - 1, middle, right->PageID());
}

Status BPlusTree::Update(Transaction& txn, std::string_view key,
                         std::string_view value) {
  if (LeafPage::kMaxCellSize < key.size() + value.size()) {
    return Status::kTooBigData;
  }
  std::vector<page_id_t> path;
  RETURN_IF_FAIL(FindLeaf(txn, key, &path));
  ASSIGN_OR_RETURN(Page*, leaf, txn.GetPageForWrite(path.back()));
  const Status rs = leaf->body.leaf_page.Update(key, value);
  if (rs != Status::kNoSpace) {
    return rs;
  }
  RETURN_IF_FAIL(leaf->body.leaf_page.Delete(key));
  return Insert(txn, key, value);
}

Status BPlusTree::Delete(Transaction& txn, std::string_view key) {
  std::vector<page_id_t> path;
  RETURN_IF_FAIL(FindLeaf(txn, key, &path));
  ASSIGN_OR_RETURN(PageRef, current, txn.GetPage(path.back()));
  if (!current.GetLeafPage().Read(key).HasValue()) {
    return Status::kNotExists;
  }
  ASSIGN_OR_RETURN(Page*, leaf, txn.GetPageForWrite(path.back()));
  return leaf->body.leaf_page.Delete(key);
}

StatusOr<std::string> BPlusTree::Read(const PageSource& src,
                                      std::string_view key) const {
  std::vector<page_id_t> path;
  RETURN_IF_FAIL(FindLeaf(src, key, &path));
  ASSIGN_OR_RETURN(PageRef, leaf, src.GetPage(path.back()));
  ASSIGN_OR_RETURN(std::string_view, value, leaf.GetLeafPage().Read(key));
  return std::string(value);
}

BPlusTreeIterator BPlusTree::Begin(const PageSource& src,
                                   const KeyRange& range,
                                   bool ascending) const {
  return {this, &src, range, ascending};
}

void BPlusTree::DumpPage(const PageSource& src, std::ostream& o, page_id_t pid,
                         int indent) const {
  StatusOr<PageRef> page = src.GetPage(pid);
  if (!page.HasValue()) {
    o << Indent(indent) << "page " << pid << ": " << page.GetStatus() << "\n";
    return;
  }
  const PageRef& ref = page.Value();
  if (ref->Type() == PageType::kLeafPage) {
    const LeafPage& leaf = ref.GetLeafPage();
    o << Indent(indent) << "Leaf[" << pid << "] prev: " << leaf.PrevPID()
      << " next: " << leaf.NextPID() << "\n";
    for (size_t i = 0; i < leaf.RowCount(); ++i) {
      o << Indent(indent + 2) << OmittedString(Hex(leaf.GetKey(i)), 32)
        << ": " << OmittedString(Hex(leaf.GetValue(i)), 32) << "\n";
    }
    return;
  }
  const BranchPage& branch = ref.GetBranchPage();
  o << Indent(indent) << "Branch[" << pid << "]\n";
  DumpPage(src, o, branch.LowestPage(), indent + 4);
  for (size_t i = 0; i < branch.RowCount(); ++i) {
    o << Indent(indent + 2) << OmittedString(Hex(branch.GetKey(i)), 32)
      << "\n";
    DumpPage(src, o, branch.GetValue(i), indent + 4);
  }
}

void BPlusTree::Dump(const PageSource& src, std::ostream& o,
                     int indent) const {
  DumpPage(src, o, root_, indent);
}

bool BPlusTree::SanityCheck(const PageSource& src, page_id_t pid,
                            std::string_view lower, std::string_view upper,
                            bool has_upper) const {
  StatusOr<PageRef> page = src.GetPage(pid);
  if (!page.HasValue()) {
    LOG(ERROR) << "missing page " << pid;
    return false;
  }
  const PageRef& ref = page.Value();
  auto in_bounds = [&](std::string_view key) {
    return lower <= key && (!has_upper || key < upper);
  };
  if (ref->Type() == PageType::kLeafPage) {
    const LeafPage& leaf = ref.GetLeafPage();
    for (size_t i = 0; i < leaf.RowCount(); ++i) {
      if (!in_bounds(leaf.GetKey(i)) ||
          (0 < i && leaf.GetKey(i) <= leaf.GetKey(i - 1))) {
        LOG(ERROR) << "leaf " << pid << " key " << i << " out of order";
        return false;
      }
    }
    return true;
  }
  if (ref->Type() != PageType::kBranchPage) {
    LOG(ERROR) << "unexpected " << ref->Type() << " page " << pid;
    return false;
  }
  const BranchPage& branch = ref.GetBranchPage();
  std::string_view child_lower = lower;
  page_id_t child = branch.LowestPage();
  for (size_t i = 0; i < branch.RowCount(); ++i) {
    const std::string_view key = branch.GetKey(i);
    if (!in_bounds(key) || (0 < i && key <= branch.GetKey(i - 1))) {
      LOG(ERROR) << "branch " << pid << " key " << i << " out of order";
      return false;
    }
    if (!SanityCheck(src, child, child_lower, key, true)) {
      return false;
    }
    child_lower = key;
    child = branch.GetValue(i);
  }
  return SanityCheck(src, child, child_lower, upper, has_upper);
}

bool BPlusTree::SanityCheckForTest(const PageSource& src) const {
  if (!SanityCheck(src, root_, "", "", false)) {
    return false;
  }
  StatusOr<PageRef> leftmost = LeftmostPage(src);
  if (!leftmost.HasValue()) {
    return false;
  }
  PageRef page = leftmost.MoveValue();
  page_id_t prev = 0;
  for (;;) {
    const LeafPage& leaf = page.GetLeafPage();
    if (leaf.PrevPID() != prev) {
      LOG(ERROR) << "leaf " << page->PageID() << " links back to "
                 << leaf.PrevPID() << " instead of " << prev;
      return false;
    }
    if (leaf.NextPID() == 0) {
      return true;
    }
    prev = page->PageID();
    StatusOr<PageRef> next = src.GetPage(leaf.NextPID());
    if (!next.HasValue()) {
      return false;
    }
    page = next.MoveValue();
  }
}

}  // namespace structsy
