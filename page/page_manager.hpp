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

#ifndef STRUCTSY_PAGE_MANAGER_HPP
#define STRUCTSY_PAGE_MANAGER_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "common/constants.hpp"
#include "common/options.hpp"
#include "common/status_or.hpp"
#include "page/page_pool.hpp"
#include "page/page_ref.hpp"
#include "recovery/write_ahead_log.hpp"

namespace structsy {

class Page;

// Owns the data file, its lock and its log. Every change reaches the file
// through Commit(), which logs the batch before writing any page in place.
class PageManager {
 public:
  PageManager(std::string path, const Options& options);
  PageManager(const PageManager&) = delete;
  PageManager& operator=(const PageManager&) = delete;
  ~PageManager();

  // Opens the file, takes its exclusive lock and replays the log.
  Status Open();

  StatusOr<PageRef> GetPage(page_id_t pid, lsn_t snapshot);

  // Makes |pages| durable as of |lsn|. Older versions stay cached when
  // |keep_old| is set.
  Status Commit(lsn_t lsn, const std::vector<std::shared_ptr<Page>>& pages,
                bool keep_old);

  void DropVersionsBefore(lsn_t oldest_snapshot);

  // LSN of the last commit found in the file at open.
  [[nodiscard]] lsn_t RecoveredLSN() const { return recovered_lsn_; }
  [[nodiscard]] bool NeedsRecovery() const { return needs_recovery_.load(); }
  [[nodiscard]] const std::string& Path() const { return path_; }
  [[nodiscard]] PagePool* Pool() { return pool_.get(); }

  // The next commit stops at |point| and leaves the store unusable.
  void SetCrashPointForTest(CrashPoint point) { crash_point_ = point; }

 private:
  Status Sync();

  std::string path_;
  Options options_;
  int fd_ = -1;
  lsn_t recovered_lsn_ = 0;
  std::atomic<bool> needs_recovery_{false};
  CrashPoint crash_point_ = CrashPoint::kNone;
  WriteAheadLog wal_;
  std::unique_ptr<PagePool> pool_;
};

}  // namespace structsy

#endif  // STRUCTSY_PAGE_MANAGER_HPP
