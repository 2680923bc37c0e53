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

#include "executor/full_scan.hpp"

#include <ostream>
#include <utility>

#include "table/table.hpp"

namespace structsy {

FullScan::FullScan(const PageSource& src, const Table& table)
    : table_(&table), iter_(table_->BeginFullScan(src)) {}

StatusOr<bool> FullScan::Next(Record* dst, Rid* rid) {
  if (!iter_.IsValid()) {
    RETURN_IF_FAIL(iter_.GetStatus());
    return false;
  }
  *dst = std::move(*iter_);
  if (rid != nullptr) {
    *rid = iter_.Position();
  }
  ++iter_;
  return true;
}

void FullScan::Dump(std::ostream& o, int /*indent*/) const {
  o << "FullScan: " << table_->Descriptor().Name();
}

}  // namespace structsy
