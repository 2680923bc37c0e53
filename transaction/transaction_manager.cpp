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

#include "transaction/transaction_manager.hpp"

#include <vector>

#include "common/log_message.hpp"
#include "page/page.hpp"
#include "page/page_manager.hpp"
#include "transaction/snapshot.hpp"
#include "transaction/transaction.hpp"

namespace structsy {

StatusOr<std::shared_ptr<Transaction>> TransactionManager::Begin() {
  std::unique_lock lk(writer_latch_);
  writer_cv_.wait(lk, [&] {
    return !writer_active_ || poisoned_ || page_manager_->NeedsRecovery();
  });
  if (poisoned_) {
    return Status::kLockPoisoned;
  }
  if (page_manager_->NeedsRecovery()) {
    return Status::kNeedsRecovery;
  }
  writer_active_ = true;
  return std::make_shared<Transaction>(this, page_manager_,
                                       committed_lsn_.load());
}

std::shared_ptr<Snapshot> TransactionManager::TakeSnapshot() {
  std::scoped_lock lk(snapshot_latch_);
  const lsn_t lsn = committed_lsn_.load();
  snapshots_.insert(lsn);
  return std::make_shared<Snapshot>(this, page_manager_, lsn);
}

Status TransactionManager::PreCommit(Transaction& txn) {
  if (txn.dirty_pages_.empty()) {
    txn.abort_hooks_.clear();
    txn.status_ = TransactionStatus::kCommitted;
    ReleaseWriter();
    return Status::kSuccess;
  }
  const lsn_t lsn = txn.CommitLSN();
  Status s = Status::kSuccess;
  {
    ASSIGN_OR_RETURN(Page*, header, txn.GetPageForWrite(0));
    header->body.header_page.SetLastLSN(lsn);
  }
  std::vector<std::shared_ptr<Page>> pages;
  pages.reserve(txn.dirty_pages_.size());
  for (auto& [pid, page] : txn.dirty_pages_) {
    pages.push_back(page);
  }
  {
    std::scoped_lock lk(snapshot_latch_);
    s = page_manager_->Commit(lsn, pages, !snapshots_.empty());
    if (s == Status::kSuccess) {
      committed_lsn_ = lsn;
    }
  }
  txn.dirty_pages_.clear();
  if (s != Status::kSuccess) {
    txn.commit_hooks_.clear();
    RunAbortHooks(txn);
    txn.status_ = TransactionStatus::kAborted;
    ReleaseWriter();
    return s;
  }
  txn.abort_hooks_.clear();
  LOG(TRACE) << "committed " << pages.size() << " pages at LSN " << lsn;
  txn.status_ = TransactionStatus::kCommitted;
  ReleaseWriter();
  return Status::kSuccess;
}

void TransactionManager::Abort(Transaction& txn) {
  LOG(TRACE) << "rolled back " << txn.dirty_pages_.size() << " dirty pages";
  txn.dirty_pages_.clear();
  txn.commit_hooks_.clear();
  RunAbortHooks(txn);
  txn.status_ = TransactionStatus::kAborted;
  ReleaseWriter();
}

void TransactionManager::RunAbortHooks(Transaction& txn) {
  for (auto& hook : txn.abort_hooks_) {
    hook();
  }
  txn.abort_hooks_.clear();
}

size_t TransactionManager::ActiveSnapshots() const {
  std::scoped_lock lk(snapshot_latch_);
  return snapshots_.size();
}

void TransactionManager::Poison() {
  poisoned_ = true;
  writer_cv_.notify_all();
}

void TransactionManager::ReleaseSnapshot(lsn_t lsn) {
  std::scoped_lock lk(snapshot_latch_);
  auto it = snapshots_.find(lsn);
  if (it != snapshots_.end()) {
    snapshots_.erase(it);
  }
  const lsn_t oldest =
      snapshots_.empty() ? committed_lsn_.load() : *snapshots_.begin();
  page_manager_->DropVersionsBefore(oldest);
}

void TransactionManager::ReleaseWriter() {
  {
    std::scoped_lock lk(writer_latch_);
    writer_active_ = false;
  }
  writer_cv_.notify_all();
}

}  // namespace structsy
