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

#ifndef STRUCTSY_SORT_HPP
#define STRUCTSY_SORT_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "executor/executor_base.hpp"
#include "query/field_path.hpp"
#include "type/record.hpp"
#include "type/rid.hpp"

namespace structsy {

struct SortKey {
  FieldPath path;
  bool ascending = true;
};

// Buffers the whole input and emits it ordered by |keys|. Records that tie
// keep their input order.
class Sort : public ExecutorBase {
 public:
  Sort(std::vector<SortKey> keys, size_t max_buffer, Executor src)
      : keys_(std::move(keys)), max_buffer_(max_buffer), src_(std::move(src)) {}
  ~Sort() override = default;

  StatusOr<bool> Next(Record* dst, Rid* rid) override;
  void Dump(std::ostream& o, int indent) const override;

 private:
  struct Entry {
    std::vector<Value> keys;
    Record record;
    Rid rid;
  };

  Status Fill();

  std::vector<SortKey> keys_;
  size_t max_buffer_;
  Executor src_;
  bool filled_ = false;
  std::vector<Entry> buffer_;
  size_t pos_ = 0;
};

}  // namespace structsy

#endif  // STRUCTSY_SORT_HPP
