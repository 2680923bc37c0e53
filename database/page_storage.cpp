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

#include "database/page_storage.hpp"

#include "common/log_message.hpp"

namespace structsy {

PageStorage::PageStorage(std::string_view path, const Options& options)
    : pm_(std::string(path), options) {}

Status PageStorage::Open() {
  RETURN_IF_FAIL(pm_.Open());
  tm_ = std::make_unique<TransactionManager>(&pm_, pm_.RecoveredLSN());
  std::shared_ptr<Snapshot> snapshot = tm_->TakeSnapshot();
  Status s = segments_.Load(*snapshot);
  if (s != Status::kSuccess) {
    LOG(ERROR) << "failed to scan segments of " << pm_.Path() << ": " << s;
  }
  return s;
}

}  // namespace structsy
