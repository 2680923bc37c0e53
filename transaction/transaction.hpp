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

#ifndef STRUCTSY_TRANSACTION_HPP
#define STRUCTSY_TRANSACTION_HPP

#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <vector>

#include "common/constants.hpp"
#include "common/status_or.hpp"
#include "page/page_source.hpp"
#include "page/page_type.hpp"

namespace structsy {

class Page;
class PageManager;
class TransactionManager;

enum class TransactionStatus : uint_fast8_t {
  kUnknown,
  kRunning,
  kCommitted,
  kAborted,
};

std::ostream& operator<<(std::ostream& o, const TransactionStatus& t);

// The single writer. Pages it touches are copied on first write and kept
// private until commit, so a rollback simply forgets them.
class Transaction final : public PageSource {
 public:
  Transaction(TransactionManager* tm, PageManager* pm, lsn_t base_lsn);
  Transaction(const Transaction& o) = delete;
  Transaction& operator=(const Transaction& o) = delete;
  ~Transaction() override;

  // Dirty pages first, then the committed state at begin.
  [[nodiscard]] StatusOr<PageRef> GetPage(page_id_t pid) const override;
  [[nodiscard]] lsn_t SnapshotLSN() const override { return base_lsn_; }

  // Pages pinned by a reader are copied again before being handed out, so
  // the pointer is only good until the next call for the same page.
  StatusOr<Page*> GetPageForWrite(page_id_t pid);
  // A fresh page past the end of the file.
  Page* CreatePage(page_id_t pid);
  StatusOr<Page*> AllocatePage(PageType type, generation_t* generation_floor);
  Status FreePage(page_id_t pid, generation_t generation_floor);

  // LSN this transaction commits with.
  [[nodiscard]] lsn_t CommitLSN() const { return base_lsn_ + 1; }
  // Increments for every call; orders entries inside one commit.
  uint32_t NextSequence() { return sequence_++; }

  [[nodiscard]] TransactionStatus GetStatus() const { return status_; }
  [[nodiscard]] bool IsFinished() const {
    return status_ == TransactionStatus::kCommitted ||
           status_ == TransactionStatus::kAborted;
  }
  // kTransactionClosed once finished, kAborted after a failed statement.
  [[nodiscard]] Status CheckUsable() const;
  // Records a failed statement: the transaction can only be rolled back.
  Status Fail(Status cause);

  // Runs after a successful commit, in registration order.
  void OnCommit(std::function<void()>&& hook);
  // Runs when the transaction ends without committing.
  void OnAbort(std::function<void()>&& hook);

  Status PreCommit();
  void Abort();
  // Rolls back an unfinished transaction. An exception unwinding past it
  // poisons the writer lock.
  void Release();

  [[nodiscard]] size_t DirtyPageCount() const { return dirty_pages_.size(); }

  // Transaction is not a value object. Never try to compare by its attributes.
  bool operator==(const Transaction& rhs) const = delete;

 private:
  friend class TransactionManager;

  // Not owned by this class.
  TransactionManager* const transaction_manager_;
  PageManager* const page_manager_;

  const lsn_t base_lsn_;
  uint32_t sequence_ = 0;
  TransactionStatus status_ = TransactionStatus::kRunning;
  bool failed_ = false;
  int uncaught_at_begin_;
  std::map<page_id_t, std::shared_ptr<Page>> dirty_pages_;
  std::vector<std::function<void()>> commit_hooks_;
  std::vector<std::function<void()>> abort_hooks_;
};

}  // namespace structsy

#endif  // STRUCTSY_TRANSACTION_HPP
