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

#include "query/query.hpp"

namespace structsy {

namespace {

void Flatten(const Filter& filter, std::vector<Filter>* out) {
  if (filter->Kind() == FilterKind::kAnd) {
    for (const auto& child : filter->AsGroup().Children()) {
      Flatten(child, out);
    }
    return;
  }
  out->push_back(filter);
}

}  // namespace

std::vector<Filter> Query::TopLevelConditions() const {
  std::vector<Filter> ret;
  for (const auto& c : conditions_) {
    Flatten(c, &ret);
  }
  return ret;
}

std::ostream& operator<<(std::ostream& o, const Query& q) {
  o << "FROM " << q.type_name_;
  if (!q.conditions_.empty()) {
    o << " WHERE ";
    for (size_t i = 0; i < q.conditions_.size(); ++i) {
      o << (i == 0 ? "" : " AND ") << *q.conditions_[i];
    }
  }
  if (!q.orderings_.empty()) {
    o << " ORDER BY ";
    for (size_t i = 0; i < q.orderings_.size(); ++i) {
      o << (i == 0 ? "" : ", ") << q.orderings_[i].path
        << (q.orderings_[i].ascending ? " ASC" : " DESC");
    }
  }
  if (q.limit_.has_value()) {
    o << " LIMIT " << *q.limit_;
  }
  if (q.projection_.has_value()) {
    o << " PROJECT {";
    for (size_t i = 0; i < q.projection_->size(); ++i) {
      o << (i == 0 ? "" : ", ") << (*q.projection_)[i];
    }
    o << "}";
  }
  return o;
}

}  // namespace structsy
