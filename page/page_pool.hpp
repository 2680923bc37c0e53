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

#ifndef STRUCTSY_PAGE_POOL_HPP
#define STRUCTSY_PAGE_POOL_HPP

#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "common/constants.hpp"
#include "common/status_or.hpp"
#include "page/page.hpp"
#include "page/page_ref.hpp"

namespace structsy {

// Caches committed page versions read from or written to the file.
// A page normally has one version: the latest committed one, which is also
// what the file holds. While snapshots older than a commit are alive, the
// versions they need stay here next to the new one.
class PagePool {
 private:
  struct Version {
    lsn_t lsn;
    // Null when the page did not exist yet at |lsn|.
    std::shared_ptr<const Page> page;
  };
  struct Entry {
    std::vector<Version> versions;
    std::list<page_id_t>::iterator lru;
  };

 public:
  PagePool(int fd, size_t capacity);

  // The newest version of |page_id| committed at or before |snapshot|.
  StatusOr<PageRef> GetPage(page_id_t page_id, lsn_t snapshot);

  // Writes |pages| into the file and installs them as committed at |lsn|.
  // With |keep_old| the replaced versions stay visible to older snapshots.
  Status Publish(lsn_t lsn, const std::vector<std::shared_ptr<Page>>& pages,
                 bool keep_old);

  // Forgets versions no snapshot at or after |oldest_snapshot| can see.
  void DropVersionsBefore(lsn_t oldest_snapshot);

  // Direct file access, bypassing the cache.
  Status ReadFrom(page_id_t pid, Page* target) const;
  Status WriteBack(const Page& target) const;

  [[nodiscard]] size_t Size() const;
  [[nodiscard]] size_t VersionCount(page_id_t pid) const;

 private:
  void Touch(Entry& entry);
  void EvictIfNeeded();

  int fd_;

  // Rows of allowed max pages entry in memory.
  size_t capacity_;

  // Front is the most recently used.
  std::list<page_id_t> lru_;

  std::unordered_map<page_id_t, Entry> pool_;

  // Pages holding more than one version.
  std::unordered_set<page_id_t> versioned_;

  mutable std::mutex pool_latch_;
};

}  // namespace structsy

#endif  // STRUCTSY_PAGE_POOL_HPP
