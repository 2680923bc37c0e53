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

#ifndef STRUCTSY_FULL_SCAN_HPP
#define STRUCTSY_FULL_SCAN_HPP

#include "executor/executor_base.hpp"
#include "table/iterator.hpp"

namespace structsy {
class PageSource;
class Table;

class FullScan : public ExecutorBase {
 public:
  FullScan(const PageSource& src, const Table& table);
  ~FullScan() override = default;
  StatusOr<bool> Next(Record* dst, Rid* rid) override;
  void Dump(std::ostream& o, int indent) const override;

 private:
  const Table* table_;
  Iterator iter_;
};

}  // namespace structsy

#endif  // STRUCTSY_FULL_SCAN_HPP
