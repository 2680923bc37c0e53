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

#include "database/result_set.hpp"

#include "transaction/transaction.hpp"

namespace structsy {

StatusOr<bool> ResultSet::Next(Record* dst, Rid* rid) {
  if (txn_ && txn_->IsFinished()) {
    return Status::kTransactionClosed;
  }
  if (done_) {
    return false;
  }
  StatusOr<bool> found = exec_->Next(dst, rid);
  if (!found.HasValue() || !found.Value()) {
    done_ = true;
  }
  return found;
}

StatusOr<std::vector<Record>> ResultSet::ToVector() {
  std::vector<Record> ret;
  Record rec;
  for (;;) {
    ASSIGN_OR_RETURN(bool, found, Next(&rec));
    if (!found) {
      break;
    }
    ret.push_back(std::move(rec));
  }
  return ret;
}

StatusOr<std::vector<std::pair<Rid, Record>>> ResultSet::ToVectorWithRid() {
  std::vector<std::pair<Rid, Record>> ret;
  for (;;) {
    Rid rid;
    Record rec;
    ASSIGN_OR_RETURN(bool, found, Next(&rec, &rid));
    if (!found) {
      break;
    }
    ret.emplace_back(rid, std::move(rec));
  }
  return ret;
}

}  // namespace structsy
