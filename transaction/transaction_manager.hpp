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

#ifndef STRUCTSY_TRANSACTION_MANAGER_HPP
#define STRUCTSY_TRANSACTION_MANAGER_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>

#include "common/constants.hpp"
#include "common/status_or.hpp"

namespace structsy {

class PageManager;
class Snapshot;
class Transaction;

// Hands out the writer and read snapshots, and orders commits.
// The writer gate is a flag guarded by a condition variable rather than a
// held mutex, so a transaction may finish on another thread than it began.
class TransactionManager {
 public:
  TransactionManager(PageManager* pm, lsn_t committed_lsn)
      : page_manager_(pm), committed_lsn_(committed_lsn) {}

  // Waits until no other writer is active.
  StatusOr<std::shared_ptr<Transaction>> Begin();

  // Pins the last committed state.
  std::shared_ptr<Snapshot> TakeSnapshot();

  Status PreCommit(Transaction& txn);

  void Abort(Transaction& txn);

  [[nodiscard]] lsn_t CommittedLSN() const { return committed_lsn_.load(); }
  [[nodiscard]] size_t ActiveSnapshots() const;

  void Poison();
  [[nodiscard]] bool IsPoisoned() const { return poisoned_.load(); }

  PageManager* GetPageManager() { return page_manager_; }

 private:
  friend class Snapshot;

  void ReleaseSnapshot(lsn_t lsn);
  void ReleaseWriter();
  static void RunAbortHooks(Transaction& txn);

  PageManager* const page_manager_;

  std::mutex writer_latch_;
  std::condition_variable writer_cv_;
  bool writer_active_ = false;
  std::atomic<bool> poisoned_{false};

  // Guards committed_lsn_ updates against snapshot registration, so a new
  // snapshot never sees a half-published commit.
  mutable std::mutex snapshot_latch_;
  std::multiset<lsn_t> snapshots_;
  std::atomic<lsn_t> committed_lsn_;
};

}  // namespace structsy

#endif  // STRUCTSY_TRANSACTION_MANAGER_HPP
