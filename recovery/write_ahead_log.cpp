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

#include "recovery/write_ahead_log.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include "common/checksum.hpp"
#include "common/decoder.hpp"
#include "common/encoder.hpp"
#include "common/log_message.hpp"
#include "page/page.hpp"

namespace structsy {

namespace {

uint64_t RecordChecksum(lsn_t lsn, page_id_t pid, const Page& image) {
  uint64_t sum = Fnv1a(&lsn, sizeof(lsn));
  sum = Fnv1a(&pid, sizeof(pid), sum);
  return Fnv1a(&image, kPageSize, sum);
}

}  // namespace

WriteAheadLog::WriteAheadLog(std::string path) : path_(std::move(path)) {}

WriteAheadLog::~WriteAheadLog() {
  if (0 <= fd_) {
    close(fd_);
  }
}

Status WriteAheadLog::Open(bool create) {
  int flags = O_RDWR | O_APPEND;
  if (create) {
    flags |= O_CREAT;
  }
  fd_ = open(path_.c_str(), flags, 0666);
  if (fd_ < 0) {
    if (errno == ENOENT && !create) {
      // No log means nothing to replay.
      fd_ = open(path_.c_str(), flags | O_CREAT, 0666);
    }
    if (fd_ < 0) {
      LOG(ERROR) << "failed to open " << path_ << ": " << strerror(errno);
      return Status::kIOError;
    }
  }
  return Status::kSuccess;
}

Status WriteAheadLog::Append(lsn_t lsn,
                             const std::vector<std::shared_ptr<Page>>& pages,
                             bool sync, CrashPoint crash) {
  std::stringstream ss;
  Encoder enc(ss);
  uint64_t folded = 0;
  for (const auto& page : pages) {
    const uint64_t sum = RecordChecksum(lsn, page->PageID(), *page);
    enc << kPageRecord << lsn << page->PageID();
    enc.WriteRaw(std::string_view(reinterpret_cast<const char*>(page.get()),
                                  kPageSize));
    enc << sum;
    folded ^= sum;
  }
  std::string body = ss.str();
  if (crash == CrashPoint::kDuringWalAppend) {
    // Leave a torn batch behind: half the page records, no marker.
    body.resize(body.size() / 2);
    RETURN_IF_FAIL(WriteAll(body));
    LOG(WARN) << "simulated crash while appending batch " << lsn;
    return Status::kNeedsRecovery;
  }
  enc << kCommitRecord << lsn << static_cast<uint32_t>(pages.size())
      << folded;
  RETURN_IF_FAIL(WriteAll(ss.str()));
  if (sync || crash == CrashPoint::kAfterWalFlush) {
    if (fdatasync(fd_) != 0) {
      LOG(ERROR) << "fdatasync on " << path_ << ": " << strerror(errno);
      return Status::kIOError;
    }
  }
  if (crash == CrashPoint::kAfterWalFlush) {
    LOG(WARN) << "simulated crash after logging batch " << lsn;
    return Status::kNeedsRecovery;
  }
  return Status::kSuccess;
}

Status WriteAheadLog::Replay(const std::function<Status(const Page&)>& apply,
                             lsn_t* last_lsn) const {
  *last_lsn = 0;
  std::string content(FileSize(), '\0');
  size_t done = 0;
  while (done < content.size()) {
    ssize_t got = pread(fd_, content.data() + done, content.size() - done,
                        static_cast<off_t>(done));
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG(ERROR) << "failed to read " << path_ << ": " << strerror(errno);
      return Status::kIOError;
    }
    if (got == 0) {
      break;
    }
    done += static_cast<size_t>(got);
  }
  content.resize(done);

  std::stringstream ss(content);
  Decoder dec(ss);
  std::vector<std::unique_ptr<Page>> batch;
  uint64_t folded = 0;
  size_t applied = 0;
  while (!dec.AtEnd()) {
    uint8_t kind = 0;
    lsn_t lsn = 0;
    dec >> kind >> lsn;
    if (!dec.IsValid()) {
      break;
    }
    if (kind == kPageRecord) {
      page_id_t pid = 0;
      std::string image;
      uint64_t sum = 0;
      dec >> pid;
      dec.ReadRaw(kPageSize, &image);
      dec >> sum;
      if (!dec.IsValid()) {
        break;
      }
      auto page = std::make_unique<Page>(pid, PageType::kUnknown);
      memcpy(reinterpret_cast<char*>(page.get()), image.data(), kPageSize);
      if (RecordChecksum(lsn, pid, *page) != sum || page->PageID() != pid) {
        LOG(WARN) << "corrupt page record for " << pid << " in batch " << lsn;
        break;
      }
      folded ^= sum;
      batch.push_back(std::move(page));
    } else if (kind == kCommitRecord) {
      uint32_t page_count = 0;
      uint64_t expected = 0;
      dec >> page_count >> expected;
      if (!dec.IsValid() || page_count != batch.size() || expected != folded) {
        LOG(WARN) << "batch " << lsn << " does not match its commit marker";
        break;
      }
      for (const auto& page : batch) {
        RETURN_IF_FAIL(apply(*page));
      }
      *last_lsn = lsn;
      applied += batch.size();
      batch.clear();
      folded = 0;
    } else {
      LOG(WARN) << "unknown record kind " << static_cast<int>(kind);
      break;
    }
  }
  if (!batch.empty()) {
    LOG(NOTICE) << "discarding " << batch.size()
                << " page records of an incomplete batch";
  }
  if (0 < applied) {
    LOG(NOTICE) << "replayed " << applied << " pages up to LSN " << *last_lsn;
  }
  return Status::kSuccess;
}

Status WriteAheadLog::Truncate() {
  if (ftruncate(fd_, 0) != 0) {
    LOG(ERROR) << "failed to truncate " << path_ << ": " << strerror(errno);
    return Status::kIOError;
  }
  return Status::kSuccess;
}

size_t WriteAheadLog::FileSize() const {
  struct stat st {};
  if (fstat(fd_, &st) != 0) {
    return 0;
  }
  return static_cast<size_t>(st.st_size);
}

Status WriteAheadLog::WriteAll(const std::string& bytes) {
  size_t done = 0;
  while (done < bytes.size()) {
    ssize_t wrote = write(fd_, bytes.data() + done, bytes.size() - done);
    if (wrote < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG(ERROR) << "failed to append to " << path_ << ": " << strerror(errno);
      return Status::kIOError;
    }
    done += static_cast<size_t>(wrote);
  }
  return Status::kSuccess;
}

}  // namespace structsy
