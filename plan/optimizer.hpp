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

#ifndef STRUCTSY_OPTIMIZER_HPP
#define STRUCTSY_OPTIMIZER_HPP

#include <cstddef>

#include "common/status_or.hpp"
#include "plan/plan.hpp"
#include "query/query.hpp"

namespace structsy {
class Table;

// Turns a query over |table| into a plan. The choice depends only on the
// query and the declared indexes, never on the data.
class Optimizer {
 public:
  Optimizer() = delete;

  // kInvalidArgument when a condition, ordering or projected field does
  // not fit the type.
  static StatusOr<Plan> Optimize(const Query& query, const Table& table,
                                 size_t max_sort_buffer);
};

}  // namespace structsy

#endif  // STRUCTSY_OPTIMIZER_HPP
