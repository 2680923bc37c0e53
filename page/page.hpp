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

#ifndef STRUCTSY_PAGE_HPP
#define STRUCTSY_PAGE_HPP

#include <array>
#include <cstdint>
#include <iosfwd>
#include <type_traits>

#include "common/constants.hpp"
#include "page/branch_page.hpp"
#include "page/free_page.hpp"
#include "page/header_page.hpp"
#include "page/leaf_page.hpp"
#include "page/page_type.hpp"
#include "page/segment_page.hpp"

namespace structsy {

// One 32 KiB unit of the file. The body comes first and a fixed trailer
// closes the page, so the header page's magic sits at file offset 0.
class Page {
 public:
  Page(page_id_t page_id, PageType type);
  void PageInit(page_id_t page_id, PageType type);

  [[nodiscard]] page_id_t PageID() const { return page_id; }
  [[nodiscard]] PageType Type() const { return type; }
  [[nodiscard]] lsn_t PageLSN() const { return page_lsn; }
  void SetPageLSN(lsn_t lsn) { page_lsn = lsn; }

  void SetChecksum();
  [[nodiscard]] uint64_t ComputeChecksum() const;
  [[nodiscard]] bool IsValid() const;

  void* operator new(size_t size);
  void operator delete(void* page) noexcept;

  void Dump(std::ostream& o, int indent) const;

  friend std::ostream& operator<<(std::ostream& o, const Page& p) {
    p.Dump(o, 0);
    return o;
  }

  union PageBody {
    std::array<char, kPageBodySize> dummy_;
    HeaderPage header_page;
    FreePage free_page;
    SegmentPage segment_page;
    LeafPage leaf_page;
    BranchPage branch_page;
    PageBody() : dummy_() {}
  };
  PageBody body;

  // The ID for this page. This ID is also an offset of this page in file.
  page_id_t page_id = 0;

  // The LSN of the commit which wrote this version of the page.
  lsn_t page_lsn = 0;

  enum PageType type = PageType::kUnknown;

  // FNV-1a over everything above.
  uint64_t checksum = 0;
};

static_assert(std::is_trivially_destructible<Page>::value == true,
              "Page must be trivially destructible");
static_assert(sizeof(Page) == kPageSize,
              "Page size must be equal to kPageSize");

}  // namespace structsy

#endif  // STRUCTSY_PAGE_HPP
