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

#include "page/header_page.hpp"

#include <cstring>
#include <ostream>

#include "common/log_message.hpp"
#include "page/free_page.hpp"
#include "page/page.hpp"
#include "transaction/transaction.hpp"

namespace structsy {

void HeaderPage::Initialize() {
  memcpy(magic_, kMagic, sizeof(magic_));
  format_version_ = kFormatVersion;
  page_size_ = static_cast<uint16_t>(kPageSize);
  reserved_ = 0;
  schema_root_ = 0;
  first_free_page_ = 0;
  wal_head_ = 0;
  page_count_ = 1;
  next_type_id_ = kSystemTypeId + 1;
}

Status HeaderPage::Validate() const {
  if (memcmp(magic_, kMagic, sizeof(magic_)) != 0) {
    LOG(ERROR) << "not a structsy file";
    return Status::kBackingStoreError;
  }
  if (format_version_ != kFormatVersion || page_size_ != kPageSize) {
    LOG(ERROR) << "unsupported format version " << format_version_
               << " or page size " << page_size_;
    return Status::kBackingStoreError;
  }
  return Status::kSuccess;
}

StatusOr<Page*> HeaderPage::AllocateNewPage(Transaction& txn,
                                            PageType new_page_type,
                                            generation_t* generation_floor) {
  generation_t floor = 0;
  Page* ret = nullptr;
  if (first_free_page_ == 0) {
    const page_id_t new_page_id = page_count_++;
    ret = txn.CreatePage(new_page_id);
  } else {
    const page_id_t new_page_id = first_free_page_;
    ASSIGN_OR_RETURN(Page*, page, txn.GetPageForWrite(new_page_id));
    if (page->Type() != PageType::kFreePage) {
      LOG(ERROR) << "free list points at " << page->Type() << " page "
                 << new_page_id;
      return Status::kBackingStoreError;
    }
    first_free_page_ = page->body.free_page.next_free_page;
    floor = page->body.free_page.generation_floor;
    ret = page;
  }
  ret->PageInit(ret->PageID(), new_page_type);
  if (generation_floor != nullptr) {
    *generation_floor = floor;
  }
  return ret;
}

void HeaderPage::DestroyPage(Page* target, generation_t generation_floor) {
  const page_id_t free_page_id = target->PageID();
  target->PageInit(free_page_id, PageType::kFreePage);
  FreePage& free_page = target->body.free_page;
  free_page.next_free_page = first_free_page_;
  free_page.generation_floor = generation_floor;
  first_free_page_ = free_page_id;
}

void HeaderPage::Dump(std::ostream& o, int) const {
  o << "[Version: " << format_version_ << " Pages: " << page_count_
    << " FirstFree: " << first_free_page_ << " SchemaRoot: " << schema_root_
    << " LastLSN: " << wal_head_ << " NextType: " << next_type_id_ << "]";
}

}  // namespace structsy
