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

#ifndef STRUCTSY_SELECTION_PLAN_HPP
#define STRUCTSY_SELECTION_PLAN_HPP

#include <utility>

#include "plan/plan.hpp"

namespace structsy {

class SelectionPlan : public PlanBase {
 public:
  SelectionPlan(Plan src, Filter filter)
      : src_(std::move(src)), filter_(std::move(filter)) {}
  ~SelectionPlan() override = default;

  [[nodiscard]] Executor EmitExecutor(const ExecContext& ctx) const override;
  [[nodiscard]] const Table& ScanSource() const override {
    return src_->ScanSource();
  }
  void Dump(std::ostream& o, int indent) const override;

 private:
  Plan src_;
  Filter filter_;
};

}  // namespace structsy

#endif  // STRUCTSY_SELECTION_PLAN_HPP
