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

#include "transaction/transaction.hpp"

#include <cstring>
#include <exception>

#include "common/log_message.hpp"
#include "page/page.hpp"
#include "page/page_manager.hpp"
#include "transaction/transaction_manager.hpp"

namespace structsy {

std::ostream& operator<<(std::ostream& o, const TransactionStatus& t) {
  switch (t) {
    case TransactionStatus::kUnknown:
      o << "Unknown";
      break;
    case TransactionStatus::kRunning:
      o << "Running";
      break;
    case TransactionStatus::kCommitted:
      o << "Committed";
      break;
    case TransactionStatus::kAborted:
      o << "Aborted";
      break;
  }
  return o;
}

Transaction::Transaction(TransactionManager* tm, PageManager* pm,
                         lsn_t base_lsn)
    : transaction_manager_(tm),
      page_manager_(pm),
      base_lsn_(base_lsn),
      uncaught_at_begin_(std::uncaught_exceptions()) {}

Transaction::~Transaction() { Release(); }

void Transaction::Release() {
  if (IsFinished()) {
    return;
  }
  if (uncaught_at_begin_ < std::uncaught_exceptions()) {
    LOG(ERROR) << "exception escaped while writing; poisoning the writer lock";
    transaction_manager_->Poison();
  }
  Abort();
}

StatusOr<PageRef> Transaction::GetPage(page_id_t pid) const {
  auto it = dirty_pages_.find(pid);
  if (it != dirty_pages_.end()) {
    return PageRef(it->second);
  }
  return page_manager_->GetPage(pid, base_lsn_);
}

StatusOr<Page*> Transaction::GetPageForWrite(page_id_t pid) {
  auto it = dirty_pages_.find(pid);
  if (it != dirty_pages_.end()) {
    if (1 < it->second.use_count()) {
      // A reader still pins this image; it keeps the old one.
      auto copy = std::make_shared<Page>(pid, PageType::kUnknown);
      memcpy(static_cast<void*>(copy.get()), it->second.get(), kPageSize);
      it->second = std::move(copy);
    }
    return it->second.get();
  }
  ASSIGN_OR_RETURN(PageRef, committed, page_manager_->GetPage(pid, base_lsn_));
  auto copy = std::make_shared<Page>(pid, PageType::kUnknown);
  memcpy(static_cast<void*>(copy.get()), committed.get(), kPageSize);
  Page* ret = copy.get();
  dirty_pages_.emplace(pid, std::move(copy));
  return ret;
}

Page* Transaction::CreatePage(page_id_t pid) {
  auto page = std::make_shared<Page>(pid, PageType::kUnknown);
  Page* ret = page.get();
  dirty_pages_[pid] = std::move(page);
  return ret;
}

StatusOr<Page*> Transaction::AllocatePage(PageType type,
                                          generation_t* generation_floor) {
  ASSIGN_OR_RETURN(Page*, header, GetPageForWrite(0));
  return header->body.header_page.AllocateNewPage(*this, type,
                                                  generation_floor);
}

Status Transaction::FreePage(page_id_t pid, generation_t generation_floor) {
  ASSIGN_OR_RETURN(Page*, header, GetPageForWrite(0));
  ASSIGN_OR_RETURN(Page*, target, GetPageForWrite(pid));
  header->body.header_page.DestroyPage(target, generation_floor);
  return Status::kSuccess;
}

Status Transaction::CheckUsable() const {
  if (IsFinished()) {
    return Status::kTransactionClosed;
  }
  if (failed_) {
    return Status::kAborted;
  }
  return Status::kSuccess;
}

Status Transaction::Fail(Status cause) {
  if (!failed_) {
    LOG(WARN) << "statement failed with " << cause
              << "; transaction must be rolled back";
  }
  failed_ = true;
  return cause;
}

void Transaction::OnCommit(std::function<void()>&& hook) {
  commit_hooks_.push_back(std::move(hook));
}

void Transaction::OnAbort(std::function<void()>&& hook) {
  abort_hooks_.push_back(std::move(hook));
}

Status Transaction::PreCommit() {
  RETURN_IF_FAIL(CheckUsable());
  Status s = transaction_manager_->PreCommit(*this);
  if (s != Status::kSuccess) {
    return s;
  }
  for (auto& hook : commit_hooks_) {
    hook();
  }
  commit_hooks_.clear();
  return Status::kSuccess;
}

void Transaction::Abort() {
  if (IsFinished()) {
    return;
  }
  transaction_manager_->Abort(*this);
}

}  // namespace structsy
