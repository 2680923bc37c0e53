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

#include "plan/sort_plan.hpp"

#include <memory>
#include <ostream>

#include "executor/limit.hpp"

namespace structsy {

Executor SortPlan::EmitExecutor(const ExecContext& ctx) const {
  return std::make_shared<Sort>(keys_, max_buffer_, src_->EmitExecutor(ctx));
}

void SortPlan::Dump(std::ostream& o, int indent) const {
  o << "Sort: [";
  for (size_t i = 0; i < keys_.size(); ++i) {
    if (0 < i) {
      o << ", ";
    }
    o << keys_[i].path.path << (keys_[i].ascending ? " ASC" : " DESC");
  }
  o << "] (buffer up to " << max_buffer_ << ")\n" << Indent(indent + 2);
  src_->Dump(o, indent + 2);
}

Executor LimitPlan::EmitExecutor(const ExecContext& ctx) const {
  return std::make_shared<Limit>(limit_, src_->EmitExecutor(ctx));
}

void LimitPlan::Dump(std::ostream& o, int indent) const {
  o << "Limit: " << limit_ << "\n" << Indent(indent + 2);
  src_->Dump(o, indent + 2);
}

}  // namespace structsy
