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

#ifndef STRUCTSY_PROJECTION_HPP
#define STRUCTSY_PROJECTION_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "executor/executor_base.hpp"

namespace structsy {

// Narrows every record to the fields at |indices|, in that order.
class FieldProjection : public ExecutorBase {
 public:
  FieldProjection(std::vector<size_t> indices, std::vector<std::string> names,
             Executor src)
      : indices_(std::move(indices)),
        names_(std::move(names)),
        src_(std::move(src)) {}
  ~FieldProjection() override = default;

  StatusOr<bool> Next(Record* dst, Rid* rid) override;
  void Dump(std::ostream& o, int indent) const override;

 private:
  std::vector<size_t> indices_;
  std::vector<std::string> names_;
  Executor src_;
};

}  // namespace structsy

#endif  // STRUCTSY_PROJECTION_HPP
