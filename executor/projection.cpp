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

#include "executor/projection.hpp"

#include <ostream>

#include "type/record.hpp"

namespace structsy {

StatusOr<bool> FieldProjection::Next(Record* dst, Rid* rid) {
  Record orig;
  ASSIGN_OR_RETURN(bool, found, src_->Next(&orig, rid));
  if (!found) {
    return false;
  }
  std::vector<Value> result;
  result.reserve(indices_.size());
  for (size_t idx : indices_) {
    result.push_back(std::move(orig.values[idx]));
  }
  *dst = Record(std::move(result));
  return true;
}

void FieldProjection::Dump(std::ostream& o, int indent) const {
  o << "Projection: [";
  for (size_t i = 0; i < names_.size(); ++i) {
    if (0 < i) {
      o << ", ";
    }
    o << names_[i];
  }
  o << "]\n" << Indent(indent + 2);
  src_->Dump(o, indent + 2);
}

}  // namespace structsy
