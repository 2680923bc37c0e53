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

#ifndef STRUCTSY_PAGE_STORAGE_HPP
#define STRUCTSY_PAGE_STORAGE_HPP

#include <memory>
#include <string>
#include <string_view>

#include "common/options.hpp"
#include "common/status_or.hpp"
#include "page/page_manager.hpp"
#include "page/segment_manager.hpp"
#include "transaction/snapshot.hpp"
#include "transaction/transaction.hpp"
#include "transaction/transaction_manager.hpp"

namespace structsy {

// The file, its segment directory and the transactions over them.
class PageStorage {
 public:
  PageStorage(std::string_view path, const Options& options);
  PageStorage(const PageStorage&) = delete;
  PageStorage& operator=(const PageStorage&) = delete;

  // Opens or creates the file, replays its log and rebuilds the segment
  // directory.
  Status Open();

  StatusOr<std::shared_ptr<Transaction>> Begin() { return tm_->Begin(); }
  std::shared_ptr<Snapshot> TakeSnapshot() { return tm_->TakeSnapshot(); }

  [[nodiscard]] const std::string& Path() const { return pm_.Path(); }
  PageManager& Pages() { return pm_; }
  TransactionManager& Transactions() { return *tm_; }
  SegmentManager& Segments() { return segments_; }

 private:
  PageManager pm_;
  std::unique_ptr<TransactionManager> tm_;
  SegmentManager segments_;
};

}  // namespace structsy

#endif  // STRUCTSY_PAGE_STORAGE_HPP
