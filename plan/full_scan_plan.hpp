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

#ifndef STRUCTSY_FULL_SCAN_PLAN_HPP
#define STRUCTSY_FULL_SCAN_PLAN_HPP

#include "plan/plan.hpp"

namespace structsy {

class FullScanPlan : public PlanBase {
 public:
  explicit FullScanPlan(const Table& table) : table_(table) {}
  ~FullScanPlan() override = default;

  [[nodiscard]] Executor EmitExecutor(const ExecContext& ctx) const override;
  [[nodiscard]] const Table& ScanSource() const override { return table_; }
  void Dump(std::ostream& o, int indent) const override;

 private:
  const Table& table_;
};

}  // namespace structsy

#endif  // STRUCTSY_FULL_SCAN_PLAN_HPP
