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

#ifndef STRUCTSY_INDEX_SCAN_HPP
#define STRUCTSY_INDEX_SCAN_HPP

#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>

#include "executor/executor_base.hpp"
#include "index/index_scan_iterator.hpp"
#include "index/key_range.hpp"
#include "type/rid.hpp"

namespace structsy {
class Index;
class PageSource;
class Table;

// Fetches the records an index lists for each of |ranges|, one range after
// the other.
class IndexScan : public ExecutorBase {
 public:
  IndexScan(const PageSource& src, const Table& table, const Index& index,
            std::vector<KeyRange> ranges, bool ascending, bool deduplicate);
  ~IndexScan() override = default;
  StatusOr<bool> Next(Record* dst, Rid* rid) override;
  void Dump(std::ostream& o, int indent) const override;

 private:
  const PageSource* src_;
  const Table* table_;
  const Index* index_;
  std::vector<KeyRange> ranges_;
  bool ascending_;
  bool deduplicate_;
  size_t next_range_ = 0;
  std::optional<IndexScanIterator> iter_;
  std::unordered_set<Rid> seen_;
};

}  // namespace structsy

#endif  // STRUCTSY_INDEX_SCAN_HPP
