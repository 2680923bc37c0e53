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

#ifndef STRUCTSY_HEADER_PAGE_HPP
#define STRUCTSY_HEADER_PAGE_HPP

#include <cstdint>
#include <iosfwd>

#include "common/constants.hpp"
#include "common/status_or.hpp"
#include "page/page_type.hpp"

namespace structsy {

class Transaction;
class Page;

static constexpr char kMagic[10] = {'S', 'T', 'R', 'U', 'C',
                                    'T', 'S', 'Y', 'v', '1'};
static constexpr uint16_t kFormatVersion = 1;

// Page 0. Its body sits at file offset 0 so the magic opens the file.
class HeaderPage {
 public:
  void Initialize();
  [[nodiscard]] Status Validate() const;

  [[nodiscard]] page_id_t PageCount() const { return page_count_; }
  [[nodiscard]] page_id_t FirstFreePage() const { return first_free_page_; }
  [[nodiscard]] page_id_t SchemaRoot() const { return schema_root_; }
  void SetSchemaRoot(page_id_t pid) { schema_root_ = pid; }
  [[nodiscard]] lsn_t LastLSN() const { return wal_head_; }
  void SetLastLSN(lsn_t lsn) { wal_head_ = lsn; }
  type_id_t IssueTypeID() { return next_type_id_++; }
  [[nodiscard]] type_id_t NextTypeID() const { return next_type_id_; }

 private:
  friend class Page;
  friend class Transaction;

  // Pops the free list or extends the file. The returned page is
  // initialized to |new_page_type|.
  StatusOr<Page*> AllocateNewPage(Transaction& txn, PageType new_page_type,
                                  generation_t* generation_floor);
  // Precondition: |target| is writable in |txn|.
  void DestroyPage(Page* target, generation_t generation_floor);
  void Dump(std::ostream& o, int indent) const;

  char magic_[10];
  uint16_t format_version_;
  uint16_t page_size_;
  uint16_t reserved_;
  page_id_t schema_root_;
  page_id_t first_free_page_;
  // LSN of the last batch applied to the file.
  lsn_t wal_head_;
  page_id_t page_count_;
  type_id_t next_type_id_;
};

}  // namespace structsy

#endif  // STRUCTSY_HEADER_PAGE_HPP
