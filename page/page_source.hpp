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

#ifndef STRUCTSY_PAGE_SOURCE_HPP
#define STRUCTSY_PAGE_SOURCE_HPP

#include "common/constants.hpp"
#include "common/status_or.hpp"
#include "page/page_ref.hpp"

namespace structsy {

// Anything pages can be read through: a read snapshot, or the writer
// transaction which also sees its own dirty pages.
class PageSource {
 public:
  virtual ~PageSource() = default;
  // kNotExists when the page did not exist in this view.
  [[nodiscard]] virtual StatusOr<PageRef> GetPage(page_id_t pid) const = 0;
  [[nodiscard]] virtual lsn_t SnapshotLSN() const = 0;
};

}  // namespace structsy

#endif  // STRUCTSY_PAGE_SOURCE_HPP
