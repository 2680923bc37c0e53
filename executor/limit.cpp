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

#include "executor/limit.hpp"

#include <ostream>

namespace structsy {

StatusOr<bool> Limit::Next(Record* dst, Rid* rid) {
  if (limit_ <= emitted_) {
    return false;
  }
  ASSIGN_OR_RETURN(bool, found, src_->Next(dst, rid));
  if (found) {
    ++emitted_;
  }
  return found;
}

void Limit::Dump(std::ostream& o, int indent) const {
  o << "Limit: " << limit_ << "\n" << Indent(indent + 2);
  src_->Dump(o, indent + 2);
}

}  // namespace structsy
