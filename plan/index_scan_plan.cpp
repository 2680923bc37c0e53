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

#include "plan/index_scan_plan.hpp"

#include <memory>
#include <ostream>
#include <utility>

#include "executor/index_scan.hpp"
#include "index/index.hpp"
#include "table/table.hpp"

namespace structsy {

IndexScanPlan::IndexScanPlan(const Table& table, const Index& index,
                             std::vector<KeyRange> ranges, bool ascending,
                             bool deduplicate)
    : table_(table),
      index_(index),
      ranges_(std::move(ranges)),
      ascending_(ascending),
      deduplicate_(deduplicate) {}

Executor IndexScanPlan::EmitExecutor(const ExecContext& ctx) const {
  return std::make_shared<IndexScan>(*ctx.src, table_, index_, ranges_,
                                     ascending_, deduplicate_);
}

void IndexScanPlan::Dump(std::ostream& o, int /*indent*/) const {
  o << "IndexScan: " << table_.Descriptor().Name() << "." << index_.Name()
    << (index_.IsExclusive() ? " (exclusive) " : " (cluster) ")
    << (ascending_ ? "ASC" : "DESC");
  for (const auto& r : ranges_) {
    o << " " << r;
  }
}

}  // namespace structsy
