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

#include "page/page_pool.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "common/log_message.hpp"

namespace structsy {

PagePool::PagePool(int fd, size_t capacity)
    : fd_(fd), capacity_(capacity == 0 ? 1 : capacity) {}

StatusOr<PageRef> PagePool::GetPage(page_id_t page_id, lsn_t snapshot) {
  std::scoped_lock latch(pool_latch_);
  auto it = pool_.find(page_id);
  if (it != pool_.end()) {
    Entry& entry = it->second;
    Touch(entry);
    for (auto v = entry.versions.rbegin(); v != entry.versions.rend(); ++v) {
      if (v->lsn <= snapshot) {
        if (v->page == nullptr) {
          return Status::kNotExists;
        }
        return PageRef(v->page);
      }
    }
    return Status::kNotExists;
  }

  std::shared_ptr<Page> page = std::make_shared<Page>(page_id, PageType::kUnknown);
  RETURN_IF_FAIL(ReadFrom(page_id, page.get()));
  if (snapshot < page->PageLSN()) {
    LOG(ERROR) << "page " << page_id << " written at " << page->PageLSN()
               << " is newer than snapshot " << snapshot;
    return Status::kBackingStoreError;
  }
  lru_.push_front(page_id);
  Entry entry;
  entry.versions.push_back({page->PageLSN(), page});
  entry.lru = lru_.begin();
  pool_.emplace(page_id, std::move(entry));
  EvictIfNeeded();
  return PageRef(std::move(page));
}

Status PagePool::Publish(lsn_t lsn,
                         const std::vector<std::shared_ptr<Page>>& pages,
                         bool keep_old) {
  std::scoped_lock latch(pool_latch_);
  if (keep_old) {
    for (const auto& page : pages) {
      auto it = pool_.find(page->PageID());
      if (it != pool_.end()) {
        continue;
      }
      Version old{0, nullptr};
      auto loaded = std::make_shared<Page>(page->PageID(), PageType::kUnknown);
      Status s = ReadFrom(page->PageID(), loaded.get());
      if (s == Status::kSuccess) {
        old = {loaded->PageLSN(), std::move(loaded)};
      } else if (s != Status::kNotExists) {
        return s;
      }
      lru_.push_front(page->PageID());
      Entry entry;
      entry.versions.push_back(std::move(old));
      entry.lru = lru_.begin();
      pool_.emplace(page->PageID(), std::move(entry));
    }
  }

  for (const auto& page : pages) {
    RETURN_IF_FAIL(WriteBack(*page));
  }

  for (const auto& page : pages) {
    const page_id_t pid = page->PageID();
    auto it = pool_.find(pid);
    if (it == pool_.end()) {
      lru_.push_front(pid);
      Entry entry;
      entry.lru = lru_.begin();
      it = pool_.emplace(pid, std::move(entry)).first;
    } else {
      Touch(it->second);
    }
    Entry& entry = it->second;
    if (!keep_old) {
      entry.versions.clear();
    }
    entry.versions.push_back({lsn, page});
    if (1 < entry.versions.size()) {
      versioned_.insert(pid);
    }
  }
  EvictIfNeeded();
  return Status::kSuccess;
}

void PagePool::DropVersionsBefore(lsn_t oldest_snapshot) {
  std::scoped_lock latch(pool_latch_);
  for (auto it = versioned_.begin(); it != versioned_.end();) {
    std::vector<Version>& versions = pool_[*it].versions;
    size_t keep_from = 0;
    for (size_t i = 0; i < versions.size(); ++i) {
      if (versions[i].lsn <= oldest_snapshot) {
        keep_from = i;
      }
    }
    versions.erase(versions.begin(), versions.begin() + keep_from);
    if (versions.size() <= 1) {
      it = versioned_.erase(it);
    } else {
      ++it;
    }
  }
  EvictIfNeeded();
}

Status PagePool::ReadFrom(page_id_t pid, Page* target) const {
  const off_t offset = static_cast<off_t>(pid * kPageSize);
  size_t done = 0;
  char* dst = reinterpret_cast<char*>(target);
  while (done < kPageSize) {
    ssize_t got = pread(fd_, dst + done, kPageSize - done,
                        offset + static_cast<off_t>(done));
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG(ERROR) << "failed to read page " << pid << ": " << strerror(errno);
      return Status::kBackingStoreError;
    }
    if (got == 0) {
      break;
    }
    done += static_cast<size_t>(got);
  }
  if (done == 0) {
    return Status::kNotExists;
  }
  if (done != kPageSize || !target->IsValid() || target->PageID() != pid) {
    LOG(ERROR) << "torn page " << pid;
    return Status::kBackingStoreError;
  }
  return Status::kSuccess;
}

Status PagePool::WriteBack(const Page& target) const {
  const off_t offset = static_cast<off_t>(target.PageID() * kPageSize);
  size_t done = 0;
  const char* src = reinterpret_cast<const char*>(&target);
  while (done < kPageSize) {
    ssize_t wrote = pwrite(fd_, src + done, kPageSize - done,
                           offset + static_cast<off_t>(done));
    if (wrote < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG(ERROR) << "failed to write page " << target.PageID() << ": "
                 << strerror(errno);
      return Status::kBackingStoreError;
    }
    done += static_cast<size_t>(wrote);
  }
  return Status::kSuccess;
}

size_t PagePool::Size() const {
  std::scoped_lock latch(pool_latch_);
  return pool_.size();
}

size_t PagePool::VersionCount(page_id_t pid) const {
  std::scoped_lock latch(pool_latch_);
  auto it = pool_.find(pid);
  return it == pool_.end() ? 0 : it->second.versions.size();
}

void PagePool::Touch(Entry& entry) {
  lru_.splice(lru_.begin(), lru_, entry.lru);
}

void PagePool::EvictIfNeeded() {
  auto victim = lru_.end();
  while (capacity_ < pool_.size() && victim != lru_.begin()) {
    --victim;
    auto it = pool_.find(*victim);
    if (1 < it->second.versions.size()) {
      continue;
    }
    auto next = victim;
    ++next;
    pool_.erase(it);
    lru_.erase(victim);
    victim = next;
  }
}

}  // namespace structsy
