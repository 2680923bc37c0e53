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

#ifndef STRUCTSY_SORT_PLAN_HPP
#define STRUCTSY_SORT_PLAN_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "executor/sort.hpp"
#include "plan/plan.hpp"

namespace structsy {

class SortPlan : public PlanBase {
 public:
  SortPlan(Plan src, std::vector<SortKey> keys, size_t max_buffer)
      : src_(std::move(src)), keys_(std::move(keys)), max_buffer_(max_buffer) {}
  ~SortPlan() override = default;

  [[nodiscard]] Executor EmitExecutor(const ExecContext& ctx) const override;
  [[nodiscard]] const Table& ScanSource() const override {
    return src_->ScanSource();
  }
  void Dump(std::ostream& o, int indent) const override;

 private:
  Plan src_;
  std::vector<SortKey> keys_;
  size_t max_buffer_;
};

class LimitPlan : public PlanBase {
 public:
  LimitPlan(Plan src, size_t limit) : src_(std::move(src)), limit_(limit) {}
  ~LimitPlan() override = default;

  [[nodiscard]] Executor EmitExecutor(const ExecContext& ctx) const override;
  [[nodiscard]] const Table& ScanSource() const override {
    return src_->ScanSource();
  }
  void Dump(std::ostream& o, int indent) const override;

 private:
  Plan src_;
  size_t limit_;
};

}  // namespace structsy

#endif  // STRUCTSY_SORT_PLAN_HPP
