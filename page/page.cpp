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

#include "page/page.hpp"

#include <cstring>
#include <ostream>

#include "common/checksum.hpp"

namespace structsy {

Page::Page(page_id_t pid, PageType type) : body() { PageInit(pid, type); }

void Page::PageInit(page_id_t pid, PageType page_type) {
  memset(static_cast<void*>(this), 0, kPageSize);
  page_id = pid;
  page_lsn = 0;
  type = page_type;
  switch (type) {
    case PageType::kUnknown:
      break;
    case PageType::kFreePage:
      body.free_page.Initialize();
      break;
    case PageType::kHeaderPage:
      body.header_page.Initialize();
      break;
    case PageType::kSegmentPage:
      // The owner of the segment initializes it with its type and size.
      break;
    case PageType::kLeafPage:
      body.leaf_page.Initialize();
      break;
    case PageType::kBranchPage:
      body.branch_page.Initialize();
      break;
  }
}

uint64_t Page::ComputeChecksum() const {
  return Fnv1a(this, offsetof(Page, checksum));
}

void Page::SetChecksum() { checksum = ComputeChecksum(); }

bool Page::IsValid() const { return checksum == ComputeChecksum(); }

void* Page::operator new(size_t) {
  void* ret = new char[kPageSize];
  memset(ret, 0, kPageSize);
  return ret;
}

void Page::operator delete(void* page) noexcept {
  delete[] reinterpret_cast<char*>(page);
}

void Page::Dump(std::ostream& o, int indent) const {
  o << "PID: " << page_id << " PageLSN: " << page_lsn << " Type: " << type
    << " ";
  switch (type) {
    case PageType::kFreePage:
      body.free_page.Dump(o, indent);
      break;
    case PageType::kHeaderPage:
      body.header_page.Dump(o, indent);
      break;
    case PageType::kSegmentPage:
      body.segment_page.Dump(o, indent);
      break;
    case PageType::kLeafPage:
      body.leaf_page.Dump(o, indent);
      break;
    case PageType::kBranchPage:
      body.branch_page.Dump(o, indent);
      break;
    default:
      break;
  }
}

}  // namespace structsy
