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

#include "page/page_manager.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "common/log_message.hpp"
#include "page/page.hpp"

namespace structsy {

PageManager::PageManager(std::string path, const Options& options)
    : path_(std::move(path)), options_(options), wal_(path_ + ".wal") {}

PageManager::~PageManager() {
  if (0 <= fd_) {
    flock(fd_, LOCK_UN);
    close(fd_);
  }
}

Status PageManager::Open() {
  int flags = O_RDWR;
  if (options_.create_if_missing) {
    flags |= O_CREAT;
  }
  fd_ = open(path_.c_str(), flags, 0666);
  if (fd_ < 0) {
    LOG(ERROR) << "failed to open " << path_ << ": " << strerror(errno);
    return Status::kIOError;
  }
  if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
    LOG(ERROR) << path_ << " is locked by another process";
    close(fd_);
    fd_ = -1;
    return Status::kIOError;
  }
  pool_ = std::make_unique<PagePool>(fd_, options_.page_cache_capacity);

  RETURN_IF_FAIL(wal_.Open(true));
  lsn_t replayed = 0;
  RETURN_IF_FAIL(wal_.Replay(
      [&](const Page& image) { return pool_->WriteBack(image); }, &replayed));
  if (0 < replayed) {
    RETURN_IF_FAIL(Sync());
  }
  RETURN_IF_FAIL(wal_.Truncate());

  struct stat st {};
  if (fstat(fd_, &st) != 0) {
    LOG(ERROR) << "failed to stat " << path_ << ": " << strerror(errno);
    return Status::kIOError;
  }
  if (st.st_size == 0) {
    auto header = std::make_unique<Page>(0, PageType::kHeaderPage);
    header->SetChecksum();
    RETURN_IF_FAIL(pool_->WriteBack(*header));
    RETURN_IF_FAIL(Sync());
    LOG(INFO) << "created " << path_;
  }

  ASSIGN_OR_RETURN(PageRef, header, pool_->GetPage(0, ~0ULL));
  if (header->Type() != PageType::kHeaderPage) {
    LOG(ERROR) << path_ << " does not start with a header page";
    return Status::kBackingStoreError;
  }
  RETURN_IF_FAIL(header.GetHeaderPage().Validate());
  recovered_lsn_ = header.GetHeaderPage().LastLSN();
  LOG(INFO) << "opened " << path_ << " at LSN " << recovered_lsn_;
  return Status::kSuccess;
}

StatusOr<PageRef> PageManager::GetPage(page_id_t pid, lsn_t snapshot) {
  return pool_->GetPage(pid, snapshot);
}

Status PageManager::Commit(lsn_t lsn,
                           const std::vector<std::shared_ptr<Page>>& pages,
                           bool keep_old) {
  if (needs_recovery_) {
    return Status::kNeedsRecovery;
  }
  for (const auto& page : pages) {
    page->SetPageLSN(lsn);
    page->SetChecksum();
  }
  const CrashPoint crash = crash_point_;
  crash_point_ = CrashPoint::kNone;
  Status s = wal_.Append(lsn, pages, options_.sync_on_commit, crash);
  if (s == Status::kSuccess) {
    s = pool_->Publish(lsn, pages, keep_old);
  }
  if (s == Status::kSuccess && options_.sync_on_commit) {
    s = Sync();
  }
  if (s == Status::kSuccess) {
    s = wal_.Truncate();
  }
  if (s != Status::kSuccess) {
    LOG(ERROR) << "commit " << lsn << " failed with " << s
               << "; store needs recovery";
    needs_recovery_ = true;
    return Status::kNeedsRecovery;
  }
  return Status::kSuccess;
}

void PageManager::DropVersionsBefore(lsn_t oldest_snapshot) {
  pool_->DropVersionsBefore(oldest_snapshot);
}

Status PageManager::Sync() {
  if (fdatasync(fd_) != 0) {
    LOG(ERROR) << "fdatasync on " << path_ << ": " << strerror(errno);
    return Status::kIOError;
  }
  return Status::kSuccess;
}

}  // namespace structsy
