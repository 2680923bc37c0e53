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

#include "plan/selection_plan.hpp"

#include <memory>
#include <ostream>

#include "executor/selection.hpp"
#include "table/table.hpp"

namespace structsy {

Executor SelectionPlan::EmitExecutor(const ExecContext& ctx) const {
  return std::make_shared<Selection>(filter_, ScanSource().DescriptorPtr(),
                                     ctx.filter_ctx, src_->EmitExecutor(ctx));
}

void SelectionPlan::Dump(std::ostream& o, int indent) const {
  o << "Select: [" << *filter_ << "]\n" << Indent(indent + 2);
  src_->Dump(o, indent + 2);
}

}  // namespace structsy
