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

#ifndef STRUCTSY_SNAPSHOT_HPP
#define STRUCTSY_SNAPSHOT_HPP

#include "common/constants.hpp"
#include "page/page_source.hpp"

namespace structsy {

class PageManager;
class TransactionManager;

// Read-only view of the store as of one commit. Pages replaced by later
// commits stay cached for as long as this object lives.
class Snapshot final : public PageSource {
 public:
  Snapshot(TransactionManager* tm, PageManager* pm, lsn_t lsn)
      : transaction_manager_(tm), page_manager_(pm), lsn_(lsn) {}
  Snapshot(const Snapshot&) = delete;
  Snapshot& operator=(const Snapshot&) = delete;
  ~Snapshot() override;

  [[nodiscard]] StatusOr<PageRef> GetPage(page_id_t pid) const override;
  [[nodiscard]] lsn_t SnapshotLSN() const override { return lsn_; }

 private:
  TransactionManager* const transaction_manager_;
  PageManager* const page_manager_;
  const lsn_t lsn_;
};

}  // namespace structsy

#endif  // STRUCTSY_SNAPSHOT_HPP
