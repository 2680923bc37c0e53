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

#ifndef STRUCTSY_SELECTION_HPP
#define STRUCTSY_SELECTION_HPP

#include <memory>

#include "executor/executor_base.hpp"
#include "query/filter.hpp"
#include "type/struct_descriptor.hpp"

namespace structsy {

class Selection : public ExecutorBase {
 public:
  Selection(Filter filter, std::shared_ptr<const StructDescriptor> desc,
            FilterContext ctx, Executor src);
  ~Selection() override = default;

  StatusOr<bool> Next(Record* dst, Rid* rid) override;

  void Dump(std::ostream& o, int indent) const override;

 private:
  Filter filter_;
  std::shared_ptr<const StructDescriptor> desc_;
  FilterContext ctx_;
  Executor src_;
};

}  // namespace structsy

#endif  // STRUCTSY_SELECTION_HPP
