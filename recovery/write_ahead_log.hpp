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

#ifndef STRUCTSY_WRITE_AHEAD_LOG_HPP
#define STRUCTSY_WRITE_AHEAD_LOG_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "common/constants.hpp"
#include "common/status_or.hpp"

namespace structsy {

class Page;

// Where a commit stops when a crash is simulated.
enum class CrashPoint : uint8_t {
  kNone,
  // Some page images reached the log, the commit marker did not.
  kDuringWalAppend,
  // The whole batch is durable in the log, the data file is untouched.
  kAfterWalFlush,
};

// Redo-only log of full page images, one batch per commit.
// A batch is a run of page records closed by a commit marker carrying the
// number of pages and the XOR of their checksums. Replay applies complete
// batches only, so a torn tail is ignored.
class WriteAheadLog final {
 public:
  static constexpr uint8_t kPageRecord = 1;
  static constexpr uint8_t kCommitRecord = 2;

  explicit WriteAheadLog(std::string path);
  WriteAheadLog(const WriteAheadLog&) = delete;
  WriteAheadLog& operator=(const WriteAheadLog&) = delete;
  ~WriteAheadLog();

  Status Open(bool create);

  Status Append(lsn_t lsn, const std::vector<std::shared_ptr<Page>>& pages,
                bool sync, CrashPoint crash = CrashPoint::kNone);

  // Calls |apply| for every page of each complete batch, in log order.
  // |last_lsn| receives the LSN of the last complete batch, or 0.
  Status Replay(const std::function<Status(const Page&)>& apply,
                lsn_t* last_lsn) const;

  Status Truncate();

  [[nodiscard]] const std::string& Path() const { return path_; }
  [[nodiscard]] size_t FileSize() const;

 private:
  Status WriteAll(const std::string& bytes);

  std::string path_;
  int fd_ = -1;
};

}  // namespace structsy

#endif  // STRUCTSY_WRITE_AHEAD_LOG_HPP
