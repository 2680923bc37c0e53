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

#ifndef STRUCTSY_PAGE_REF_HPP
#define STRUCTSY_PAGE_REF_HPP

#include <iosfwd>
#include <memory>
#include <utility>

namespace structsy {

class Page;
class SegmentPage;
class LeafPage;
class BranchPage;
class HeaderPage;

// A pinned, immutable version of a page. Committed versions are never
// modified in place, so holding a PageRef needs no latch.
class PageRef final {
 public:
  PageRef() = default;
  explicit PageRef(std::shared_ptr<const Page> page) : page_(std::move(page)) {}

  const Page& operator*() const { return *page_; }
  const Page* operator->() const { return page_.get(); }
  [[nodiscard]] const Page* get() const { return page_.get(); }
  [[nodiscard]] bool IsNull() const { return page_ == nullptr; }

  [[nodiscard]] const SegmentPage& GetSegmentPage() const;
  [[nodiscard]] const LeafPage& GetLeafPage() const;
  [[nodiscard]] const BranchPage& GetBranchPage() const;
  [[nodiscard]] const HeaderPage& GetHeaderPage() const;

  bool operator==(const PageRef& r) const { return page_ == r.page_; }
  bool operator!=(const PageRef& r) const { return !operator==(r); }
  friend std::ostream& operator<<(std::ostream& o, const PageRef& p);

 private:
  std::shared_ptr<const Page> page_;
};

}  // namespace structsy

#endif  // STRUCTSY_PAGE_REF_HPP
