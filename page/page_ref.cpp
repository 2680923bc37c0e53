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

#include "page/page_ref.hpp"

#include <cassert>
#include <ostream>

#include "page/page.hpp"

namespace structsy {

const SegmentPage& PageRef::GetSegmentPage() const {
  assert(page_->type == PageType::kSegmentPage);
  return page_->body.segment_page;
}

const LeafPage& PageRef::GetLeafPage() const {
  assert(page_->type == PageType::kLeafPage);
  return page_->body.leaf_page;
}

const BranchPage& PageRef::GetBranchPage() const {
  assert(page_->type == PageType::kBranchPage);
  return page_->body.branch_page;
}

const HeaderPage& PageRef::GetHeaderPage() const {
  assert(page_->type == PageType::kHeaderPage);
  return page_->body.header_page;
}

std::ostream& operator<<(std::ostream& o, const PageRef& p) {
  if (p.IsNull()) {
    o << "{Ref: null}";
  } else {
    o << "{Ref: " << p->PageID() << "@" << p->PageLSN() << "}";
  }
  return o;
}

}  // namespace structsy
