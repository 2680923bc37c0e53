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

#include "executor/selection.hpp"

#include <ostream>
#include <utility>

#include "type/rid.hpp"

namespace structsy {

Selection::Selection(Filter filter,
                     std::shared_ptr<const StructDescriptor> desc,
                     FilterContext ctx, Executor src)
    : filter_(std::move(filter)),
      desc_(std::move(desc)),
      ctx_(std::move(ctx)),
      src_(std::move(src)) {}

StatusOr<bool> Selection::Next(Record* dst, Rid* rid) {
  Record orig;
  for (;;) {
    ASSIGN_OR_RETURN(bool, found, src_->Next(&orig, rid));
    if (!found) {
      return false;
    }
    ASSIGN_OR_RETURN(bool, match, filter_->Evaluate(*desc_, orig, ctx_));
    if (match) {
      *dst = std::move(orig);
      return true;
    }
  }
}

void Selection::Dump(std::ostream& o, int indent) const {
  o << "Selection: " << *filter_ << "\n" << Indent(indent + 2);
  src_->Dump(o, indent + 2);
}

}  // namespace structsy
